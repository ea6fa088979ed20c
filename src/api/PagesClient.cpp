#include "PagesClient.h"
#include <stdexcept>
#include <utility>
#include "errors/Errors.h"
#include "observability/Logging.h"
#include "version.h"

namespace api {

using envvars::Environment;
using envvars::VariableDocument;
using envvars::VariableMap;
using net::JsonValue;

namespace {

void diff_env(const std::optional<VariableMap>& current, const std::optional<VariableMap>& desired,
              std::map<std::string, std::optional<std::string>>& out) {
    if (!desired.has_value()) return;
    static const VariableMap none;
    const VariableMap& old_vars = current.has_value() ? *current : none;
    for (const auto& kv : *desired) {
        auto it = old_vars.find(kv.first);
        if (it == old_vars.end() || it->second != kv.second) out[kv.first] = kv.second;
    }
    for (const auto& kv : old_vars) {
        if (!desired->count(kv.first)) out[kv.first] = std::nullopt;
    }
}

JsonValue env_changes_to_json(const std::map<std::string, std::optional<std::string>>& changes) {
    auto env_vars = JsonValue::object();
    for (const auto& kv : changes) {
        if (!kv.second.has_value()) {
            env_vars.set(kv.first, JsonValue::null());
            continue;
        }
        auto entry = JsonValue::object();
        entry.set("type", JsonValue::string("plain_text"));
        entry.set("value", JsonValue::string(*kv.second));
        env_vars.set(kv.first, std::move(entry));
    }
    auto env = JsonValue::object();
    env.set("env_vars", std::move(env_vars));
    return env;
}

// env_vars: null | { NAME: null | { "type": ..., "value": ... } }
VariableMap decode_env_vars(const JsonValue* env_vars, const std::string& where) {
    VariableMap out;
    if (!env_vars || env_vars->is_null()) return out;
    if (!env_vars->is_object()) throw errors::DecodeError(where + " must be an object");
    for (const auto& m : env_vars->as_object()) {
        const JsonValue& entry = m.second;
        if (entry.is_null()) { out[m.first] = ""; continue; }
        if (!entry.is_object()) throw errors::DecodeError(where + "." + m.first + " must be an object or null");
        const JsonValue* value = entry.find("value");
        if (!value || value->is_null()) {
            // secret_text values are not returned by the API
            out[m.first] = "";
            continue;
        }
        if (!value->is_string()) throw errors::DecodeError(where + "." + m.first + ".value must be a string");
        out[m.first] = value->as_string();
    }
    return out;
}

std::optional<std::string> first_error_message(const JsonValue& body) {
    if (const JsonValue* errs = body.find("errors")) {
        if (errs->is_array()) {
            for (const auto& e : errs->as_array()) {
                if (auto msg = net::json_get_string(e, "message")) {
                    if (!msg->empty()) return msg;
                }
            }
        }
    }
    if (auto msg = net::json_get_string(body, "message")) {
        if (!msg->empty()) return msg;
    }
    return std::nullopt;
}

}

EnvPatch make_patch(const VariableDocument& current, const VariableDocument& desired) {
    EnvPatch patch;
    diff_env(current.production, desired.production, patch.production);
    diff_env(current.preview, desired.preview, patch.preview);
    return patch;
}

JsonValue patch_to_json(const EnvPatch& patch) {
    auto configs = JsonValue::object();
    configs.set("preview", env_changes_to_json(patch.preview));
    configs.set("production", env_changes_to_json(patch.production));
    auto root = JsonValue::object();
    root.set("deployment_configs", std::move(configs));
    return root;
}

std::string url_encode_segment(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        unsigned char uc = static_cast<unsigned char>(c);
        if ((uc >= 'A' && uc <= 'Z') || (uc >= 'a' && uc <= 'z') || (uc >= '0' && uc <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(c);
        } else {
            out.push_back('%');
            out.push_back(hex[uc >> 4]);
            out.push_back(hex[uc & 0xf]);
        }
    }
    return out;
}

PagesClient::PagesClient(net::HttpTransport& transport, std::string host, std::string base_path)
    : transport_(transport), host_(std::move(host)), base_path_(std::move(base_path)) {}

std::string PagesClient::project_path(const config::Credentials& creds, const std::string& project) const {
    return "/accounts/" + url_encode_segment(creds.account) + "/pages/projects/" + url_encode_segment(project);
}

net::HttpRequest PagesClient::make_request(const std::string& method, const config::Credentials& creds, const std::string& path) const {
    net::HttpRequest req;
    req.method = method;
    req.host = host_;
    req.port = "443";
    req.target = base_path_ + path;
    req.headers.emplace_back("Authorization", "Bearer " + creds.token);
    req.headers.emplace_back("Accept", "application/json");
    req.headers.emplace_back("User-Agent", std::string("pagesenv/") + PAGESENV_VERSION);
    return req;
}

JsonValue PagesClient::call(const net::HttpRequest& req) {
    net::HttpResponse res = transport_.send(req);
    observability::log_info("api_call", {{"method", req.method}, {"target", req.target}, {"status", int64_t(res.status)}});

    std::optional<JsonValue> body;
    std::string parse_error;
    try {
        body = net::json_parse(res.body);
    } catch (const std::runtime_error& e) {
        parse_error = e.what();
    }

    if (res.status < 200 || res.status > 299) {
        std::optional<std::string> msg;
        if (body.has_value()) msg = first_error_message(*body);
        if (!msg.has_value()) msg = res.reason.empty() ? "HTTP " + std::to_string(res.status) : res.reason;
        observability::log_warn("api_error", {{"status", int64_t(res.status)}, {"message", *msg}});
        throw errors::ApiError(res.status, *msg);
    }

    if (!body.has_value()) throw errors::DecodeError(parse_error);
    if (!body->is_object()) throw errors::DecodeError("response body is not a json object");

    const JsonValue* success = body->find("success");
    if (!success || !success->is_bool()) throw errors::DecodeError("missing 'success' flag");
    if (!success->as_bool()) {
        throw errors::ApiError(res.status, first_error_message(*body).value_or("unsuccessful Cloudflare request"));
    }

    const JsonValue* result = body->find("result");
    if (!result) throw errors::DecodeError("missing 'result'");
    return *result;
}

VariableDocument PagesClient::fetch_variables(const config::Credentials& creds, const config::ProjectReference& project) {
    VariableDocument doc;
    if (project.deployment.has_value()) {
        auto req = make_request("GET", creds, project_path(creds, project.project) + "/deployments/" + url_encode_segment(*project.deployment));
        JsonValue result = call(req);
        if (!result.is_object()) throw errors::DecodeError("deployment result is not an object");
        auto env_name = net::json_get_string(result, "environment");
        if (!env_name.has_value()) throw errors::DecodeError("deployment has no 'environment'");
        auto env = envvars::parse_environment(*env_name);
        if (!env.has_value()) throw errors::DecodeError("unknown deployment environment '" + *env_name + "'");
        doc.get(*env) = decode_env_vars(result.find("env_vars"), "env_vars");
        observability::log_info("fetched_deployment_variables", {
            {"environment", *env_name}, {"count", int64_t(doc.get(*env)->size())}});
        return doc;
    }

    auto req = make_request("GET", creds, project_path(creds, project.project));
    JsonValue result = call(req);
    const JsonValue* configs = result.find("deployment_configs");
    if (!configs || !configs->is_object()) throw errors::DecodeError("project has no 'deployment_configs' object");
    for (Environment env : {Environment::Production, Environment::Preview}) {
        const char* name = envvars::environment_name(env);
        const JsonValue* section = configs->find(name);
        const JsonValue* env_vars = nullptr;
        if (section && !section->is_null()) {
            if (!section->is_object()) throw errors::DecodeError(std::string("deployment_configs.") + name + " must be an object");
            env_vars = section->find("env_vars");
        }
        doc.get(env) = decode_env_vars(env_vars, std::string("deployment_configs.") + name + ".env_vars");
    }
    observability::log_info("fetched_project_variables", {
        {"production", int64_t(doc.production->size())}, {"preview", int64_t(doc.preview->size())}});
    return doc;
}

void PagesClient::update_variables(const config::Credentials& creds, const config::ProjectReference& project, const EnvPatch& patch) {
    auto req = make_request("PATCH", creds, project_path(creds, project.project));
    req.headers.emplace_back("Content-Type", "application/json");
    req.body = net::json_dump(patch_to_json(patch));
    call(req);
    observability::log_info("updated_project_variables", {
        {"production_changes", int64_t(patch.production.size())}, {"preview_changes", int64_t(patch.preview.size())}});
}

}
