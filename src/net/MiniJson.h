#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace net {

// Small JSON document tree. Numbers keep their source text, objects keep
// insertion order.
class JsonValue {
public:
    enum class Type { Null, Bool, Number, String, Array, Object };
    using Array = std::vector<JsonValue>;
    using Member = std::pair<std::string, JsonValue>;
    using Object = std::vector<Member>;

    JsonValue() = default;
    static JsonValue null() { return JsonValue(); }
    static JsonValue boolean(bool b);
    static JsonValue number(std::string text);
    static JsonValue string(std::string s);
    static JsonValue array();
    static JsonValue object();

    Type type() const noexcept { return type_; }
    bool is_null() const noexcept { return type_ == Type::Null; }
    bool is_bool() const noexcept { return type_ == Type::Bool; }
    bool is_number() const noexcept { return type_ == Type::Number; }
    bool is_string() const noexcept { return type_ == Type::String; }
    bool is_array() const noexcept { return type_ == Type::Array; }
    bool is_object() const noexcept { return type_ == Type::Object; }

    // Accessors throw std::runtime_error on a type mismatch.
    bool as_bool() const;
    const std::string& as_string() const;
    const std::string& number_text() const;
    const Array& as_array() const;
    const Object& as_object() const;

    // Object helpers. find() returns nullptr when the key is absent or this is not an object.
    const JsonValue* find(const std::string& key) const;
    bool contains(const std::string& key) const { return find(key) != nullptr; }
    // Replaces an existing member with the same key.
    JsonValue& set(const std::string& key, JsonValue v);
    JsonValue& push_back(JsonValue v);

    std::size_t size() const noexcept;

private:
    Type type_ = Type::Null;
    bool bool_ = false;
    std::string text_;
    Array array_;
    Object object_;
};

const char* json_type_name(JsonValue::Type t);

// Throws std::runtime_error("... at offset N") on invalid input.
JsonValue json_parse(const std::string& js);

// indent == 0 gives compact output.
std::string json_dump(const JsonValue& v, int indent = 0);

std::string json_escape(const std::string& s);

// Convenience for error envelopes: string member or nullopt.
std::optional<std::string> json_get_string(const JsonValue& obj, const std::string& key);

}
