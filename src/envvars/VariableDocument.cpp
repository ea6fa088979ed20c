#include "VariableDocument.h"
#include <stdexcept>
#include "errors/Errors.h"
#include "observability/Logging.h"

namespace envvars {

const char* environment_name(Environment env) {
    switch (env) {
        case Environment::Production: return "production";
        case Environment::Preview: return "preview";
    }
    return "production";
}

std::optional<Environment> parse_environment(const std::string& s) {
    if (s == "production") return Environment::Production;
    if (s == "preview") return Environment::Preview;
    return std::nullopt;
}

bool is_valid_variable_name(const std::string& name) {
    if (name.empty()) return false;
    for (std::size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        bool alpha = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
        bool digit = c >= '0' && c <= '9';
        if (!alpha && !(digit && i > 0)) return false;
    }
    return true;
}

const std::optional<VariableMap>& VariableDocument::get(Environment env) const {
    return env == Environment::Production ? production : preview;
}

std::optional<VariableMap>& VariableDocument::get(Environment env) {
    return env == Environment::Production ? production : preview;
}

static net::JsonValue map_to_json(const std::optional<VariableMap>& m) {
    if (!m.has_value()) return net::JsonValue::null();
    auto obj = net::JsonValue::object();
    for (const auto& kv : *m) obj.set(kv.first, net::JsonValue::string(kv.second));
    return obj;
}

net::JsonValue document_to_json(const VariableDocument& doc) {
    auto root = net::JsonValue::object();
    root.set("production", map_to_json(doc.production));
    root.set("preview", map_to_json(doc.preview));
    return root;
}

std::string serialize_document(const VariableDocument& doc) {
    return net::json_dump(document_to_json(doc), 2);
}

static std::optional<VariableMap> map_from_json(const net::JsonValue& root, const char* field) {
    const net::JsonValue* v = root.find(field);
    // an absent field reads the same as an explicit null
    if (!v || v->is_null()) return std::nullopt;
    if (!v->is_object()) {
        throw errors::MalformedDocument(std::string("field '") + field + "' must be an object or null, got " + net::json_type_name(v->type()));
    }
    VariableMap out;
    for (const auto& m : v->as_object()) {
        if (!is_valid_variable_name(m.first)) {
            throw errors::MalformedDocument(std::string("invalid variable name \"") + net::json_escape(m.first) + "\" in '" + field + "'");
        }
        if (!m.second.is_string()) {
            throw errors::MalformedDocument(std::string("value of '") + field + "." + m.first + "' must be a string, got " + net::json_type_name(m.second.type()));
        }
        out[m.first] = m.second.as_string();
    }
    return out;
}

VariableDocument document_from_json(const net::JsonValue& v) {
    if (!v.is_object()) {
        throw errors::MalformedDocument(std::string("top-level value must be an object, got ") + net::json_type_name(v.type()));
    }
    for (const auto& m : v.as_object()) {
        if (m.first != "production" && m.first != "preview") {
            observability::log_warn("document_unknown_field", {{"field", m.first}});
        }
    }
    VariableDocument doc;
    doc.production = map_from_json(v, "production");
    doc.preview = map_from_json(v, "preview");
    return doc;
}

VariableDocument parse_document(const std::string& text) {
    net::JsonValue v;
    try {
        v = net::json_parse(text);
    } catch (const std::runtime_error& e) {
        throw errors::MalformedDocument(e.what());
    }
    return document_from_json(v);
}

}
