#pragma once

#include <map>
#include <optional>
#include <string>
#include "net/MiniJson.h"

namespace envvars {

enum class Environment { Production, Preview };

const char* environment_name(Environment env);
std::optional<Environment> parse_environment(const std::string& s);

// Names usable as a .env key: [A-Za-z_][A-Za-z0-9_]*
bool is_valid_variable_name(const std::string& name);

// Sorted by key so every serialization is deterministic.
using VariableMap = std::map<std::string, std::string>;

// A null environment means "no data for it" (e.g. a single-deployment
// snapshot), which is different from an empty map.
struct VariableDocument {
    std::optional<VariableMap> production;
    std::optional<VariableMap> preview;

    const std::optional<VariableMap>& get(Environment env) const;
    std::optional<VariableMap>& get(Environment env);

    bool operator==(const VariableDocument& o) const { return production == o.production && preview == o.preview; }
    bool operator!=(const VariableDocument& o) const { return !(*this == o); }
};

net::JsonValue document_to_json(const VariableDocument& doc);
// Pretty printed (two-space indent), no trailing newline.
std::string serialize_document(const VariableDocument& doc);

// Both throw errors::MalformedDocument.
VariableDocument document_from_json(const net::JsonValue& v);
VariableDocument parse_document(const std::string& text);

}
