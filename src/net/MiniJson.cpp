#include "MiniJson.h"
#include <cctype>
#include <cstdint>
#include <stdexcept>

namespace net {

JsonValue JsonValue::boolean(bool b) { JsonValue v; v.type_ = Type::Bool; v.bool_ = b; return v; }
JsonValue JsonValue::number(std::string text) { JsonValue v; v.type_ = Type::Number; v.text_ = std::move(text); return v; }
JsonValue JsonValue::string(std::string s) { JsonValue v; v.type_ = Type::String; v.text_ = std::move(s); return v; }
JsonValue JsonValue::array() { JsonValue v; v.type_ = Type::Array; return v; }
JsonValue JsonValue::object() { JsonValue v; v.type_ = Type::Object; return v; }

const char* json_type_name(JsonValue::Type t) {
    switch (t) {
        case JsonValue::Type::Null: return "null";
        case JsonValue::Type::Bool: return "boolean";
        case JsonValue::Type::Number: return "number";
        case JsonValue::Type::String: return "string";
        case JsonValue::Type::Array: return "array";
        case JsonValue::Type::Object: return "object";
    }
    return "unknown";
}

static void expect_type(const JsonValue& v, JsonValue::Type t) {
    if (v.type() != t) {
        throw std::runtime_error(std::string("expected json ") + json_type_name(t) + ", got " + json_type_name(v.type()));
    }
}

bool JsonValue::as_bool() const { expect_type(*this, Type::Bool); return bool_; }
const std::string& JsonValue::as_string() const { expect_type(*this, Type::String); return text_; }
const std::string& JsonValue::number_text() const { expect_type(*this, Type::Number); return text_; }
const JsonValue::Array& JsonValue::as_array() const { expect_type(*this, Type::Array); return array_; }
const JsonValue::Object& JsonValue::as_object() const { expect_type(*this, Type::Object); return object_; }

const JsonValue* JsonValue::find(const std::string& key) const {
    if (type_ != Type::Object) return nullptr;
    for (const auto& m : object_) {
        if (m.first == key) return &m.second;
    }
    return nullptr;
}

JsonValue& JsonValue::set(const std::string& key, JsonValue v) {
    expect_type(*this, Type::Object);
    for (auto& m : object_) {
        if (m.first == key) { m.second = std::move(v); return m.second; }
    }
    object_.emplace_back(key, std::move(v));
    return object_.back().second;
}

JsonValue& JsonValue::push_back(JsonValue v) {
    expect_type(*this, Type::Array);
    array_.push_back(std::move(v));
    return array_.back();
}

std::size_t JsonValue::size() const noexcept {
    if (type_ == Type::Array) return array_.size();
    if (type_ == Type::Object) return object_.size();
    return 0;
}

namespace {

constexpr int MAX_DEPTH = 256;

class Parser {
public:
    explicit Parser(const std::string& js) : js_(js), n_(js.size()) {}

    JsonValue parse_document() {
        skip_ws();
        JsonValue v = parse_value(0);
        skip_ws();
        if (i_ != n_) fail("trailing characters after json value");
        return v;
    }

private:
    [[noreturn]] void fail(const std::string& what) const {
        throw std::runtime_error(what + " at offset " + std::to_string(i_));
    }

    void skip_ws() {
        while (i_ < n_ && (js_[i_] == ' ' || js_[i_] == '\t' || js_[i_] == '\n' || js_[i_] == '\r')) ++i_;
    }

    bool consume_literal(const char* lit) {
        std::size_t len = 0;
        while (lit[len]) ++len;
        if (js_.compare(i_, len, lit) != 0) return false;
        i_ += len;
        return true;
    }

    JsonValue parse_value(int depth) {
        if (depth > MAX_DEPTH) fail("json nesting too deep");
        if (i_ >= n_) fail("unexpected end of json");
        char c = js_[i_];
        if (c == '{') return parse_object(depth);
        if (c == '[') return parse_array(depth);
        if (c == '"') { ++i_; return JsonValue::string(decode_string()); }
        if (c == 't') { if (consume_literal("true")) return JsonValue::boolean(true); fail("invalid literal"); }
        if (c == 'f') { if (consume_literal("false")) return JsonValue::boolean(false); fail("invalid literal"); }
        if (c == 'n') { if (consume_literal("null")) return JsonValue::null(); fail("invalid literal"); }
        if (c == '-' || (c >= '0' && c <= '9')) return parse_number();
        fail(std::string("unexpected character '") + c + "'");
    }

    JsonValue parse_object(int depth) {
        ++i_; // '{'
        JsonValue obj = JsonValue::object();
        skip_ws();
        if (i_ < n_ && js_[i_] == '}') { ++i_; return obj; }
        for (;;) {
            skip_ws();
            if (i_ >= n_ || js_[i_] != '"') fail("expected string key in json object");
            ++i_;
            std::string key = decode_string();
            skip_ws();
            if (i_ >= n_ || js_[i_] != ':') fail("missing ':' after object key");
            ++i_;
            skip_ws();
            obj.set(key, parse_value(depth + 1));
            skip_ws();
            if (i_ >= n_) fail("unterminated json object");
            if (js_[i_] == ',') { ++i_; continue; }
            if (js_[i_] == '}') { ++i_; return obj; }
            fail("expected ',' or '}' in json object");
        }
    }

    JsonValue parse_array(int depth) {
        ++i_; // '['
        JsonValue arr = JsonValue::array();
        skip_ws();
        if (i_ < n_ && js_[i_] == ']') { ++i_; return arr; }
        for (;;) {
            skip_ws();
            arr.push_back(parse_value(depth + 1));
            skip_ws();
            if (i_ >= n_) fail("unterminated json array");
            if (js_[i_] == ',') { ++i_; continue; }
            if (js_[i_] == ']') { ++i_; return arr; }
            fail("expected ',' or ']' in json array");
        }
    }

    JsonValue parse_number() {
        std::size_t start = i_;
        if (js_[i_] == '-') ++i_;
        if (i_ >= n_) fail("invalid number");
        if (js_[i_] == '0') {
            ++i_;
        } else if (js_[i_] >= '1' && js_[i_] <= '9') {
            while (i_ < n_ && std::isdigit(static_cast<unsigned char>(js_[i_]))) ++i_;
        } else {
            fail("invalid number");
        }
        if (i_ < n_ && js_[i_] == '.') {
            ++i_;
            if (i_ >= n_ || !std::isdigit(static_cast<unsigned char>(js_[i_]))) fail("invalid number fraction");
            while (i_ < n_ && std::isdigit(static_cast<unsigned char>(js_[i_]))) ++i_;
        }
        if (i_ < n_ && (js_[i_] == 'e' || js_[i_] == 'E')) {
            ++i_;
            if (i_ < n_ && (js_[i_] == '+' || js_[i_] == '-')) ++i_;
            if (i_ >= n_ || !std::isdigit(static_cast<unsigned char>(js_[i_]))) fail("invalid number exponent");
            while (i_ < n_ && std::isdigit(static_cast<unsigned char>(js_[i_]))) ++i_;
        }
        return JsonValue::number(js_.substr(start, i_ - start));
    }

    uint32_t read_hex4() {
        if (i_ + 4 > n_) fail("invalid unicode escape in json string");
        uint32_t code = 0;
        for (std::size_t k = 0; k < 4; ++k) {
            char ch = js_[i_ + k];
            code <<= 4;
            if (ch >= '0' && ch <= '9') code += ch - '0';
            else if (ch >= 'a' && ch <= 'f') code += 10 + (ch - 'a');
            else if (ch >= 'A' && ch <= 'F') code += 10 + (ch - 'A');
            else fail("invalid hex in unicode escape");
        }
        i_ += 4;
        return code;
    }

    static void append_utf8(std::string& out, uint32_t code) {
        if (code <= 0x7f) {
            out.push_back(static_cast<char>(code));
        } else if (code <= 0x7ff) {
            out.push_back(static_cast<char>(0xc0 | ((code >> 6) & 0x1f)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3f)));
        } else if (code <= 0xffff) {
            out.push_back(static_cast<char>(0xe0 | ((code >> 12) & 0x0f)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3f)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3f)));
        } else {
            out.push_back(static_cast<char>(0xf0 | ((code >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3f)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3f)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3f)));
        }
    }

    // i_ points to the first character after the opening '"'; leaves i_ after the closing one.
    std::string decode_string() {
        std::string out;
        for (;;) {
            if (i_ >= n_) fail("unterminated json string");
            char c = js_[i_];
            if (c == '"') { ++i_; return out; }
            if (static_cast<unsigned char>(c) < 0x20) fail("unescaped control character in json string");
            if (c != '\\') { out.push_back(c); ++i_; continue; }
            if (i_ + 1 >= n_) fail("unterminated escape in json string");
            char e = js_[i_ + 1];
            i_ += 2;
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'u': {
                    uint32_t code = read_hex4();
                    if (code >= 0xd800 && code <= 0xdbff) {
                        if (i_ + 2 > n_ || js_[i_] != '\\' || js_[i_ + 1] != 'u') fail("unpaired surrogate in json string");
                        i_ += 2;
                        uint32_t low = read_hex4();
                        if (low < 0xdc00 || low > 0xdfff) fail("invalid low surrogate in json string");
                        code = 0x10000 + ((code - 0xd800) << 10) + (low - 0xdc00);
                    } else if (code >= 0xdc00 && code <= 0xdfff) {
                        fail("unpaired surrogate in json string");
                    }
                    append_utf8(out, code);
                    break;
                }
                default: fail("unsupported escape in json string");
            }
        }
    }

    const std::string& js_;
    const std::size_t n_;
    std::size_t i_ = 0;
};

void dump_into(std::string& out, const JsonValue& v, int indent, int level) {
    auto newline = [&](int lvl) {
        if (indent <= 0) return;
        out.push_back('\n');
        out.append(static_cast<std::size_t>(indent * lvl), ' ');
    };
    switch (v.type()) {
        case JsonValue::Type::Null: out += "null"; break;
        case JsonValue::Type::Bool: out += v.as_bool() ? "true" : "false"; break;
        case JsonValue::Type::Number: out += v.number_text(); break;
        case JsonValue::Type::String: out += '"'; out += json_escape(v.as_string()); out += '"'; break;
        case JsonValue::Type::Array: {
            const auto& arr = v.as_array();
            if (arr.empty()) { out += "[]"; break; }
            out += '[';
            for (std::size_t k = 0; k < arr.size(); ++k) {
                if (k) out += ',';
                newline(level + 1);
                dump_into(out, arr[k], indent, level + 1);
            }
            newline(level);
            out += ']';
            break;
        }
        case JsonValue::Type::Object: {
            const auto& obj = v.as_object();
            if (obj.empty()) { out += "{}"; break; }
            out += '{';
            for (std::size_t k = 0; k < obj.size(); ++k) {
                if (k) out += ',';
                newline(level + 1);
                out += '"'; out += json_escape(obj[k].first); out += '"';
                out += indent > 0 ? ": " : ":";
                dump_into(out, obj[k].second, indent, level + 1);
            }
            newline(level);
            out += '}';
            break;
        }
    }
}

}

JsonValue json_parse(const std::string& js) {
    Parser p(js);
    return p.parse_document();
}

std::string json_dump(const JsonValue& v, int indent) {
    std::string out;
    dump_into(out, v, indent, 0);
    return out;
}

std::string json_escape(const std::string& s) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += "\\u00";
                    out.push_back(hex[(c >> 4) & 0xf]);
                    out.push_back(hex[c & 0xf]);
                } else {
                    out.push_back(c);
                }
        }
    }
    return out;
}

std::optional<std::string> json_get_string(const JsonValue& obj, const std::string& key) {
    const JsonValue* v = obj.find(key);
    if (!v || !v->is_string()) return std::nullopt;
    return v->as_string();
}

}
