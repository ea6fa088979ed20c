#pragma once

#include <map>
#include <optional>
#include <string>
#include "config/Config.h"
#include "envvars/VariableDocument.h"
#include "net/HttpTransport.h"
#include "net/MiniJson.h"

namespace api {

// Per-environment change set for the project PATCH endpoint. A value of
// nullopt deletes the variable remotely.
struct EnvPatch {
    std::map<std::string, std::optional<std::string>> production;
    std::map<std::string, std::optional<std::string>> preview;

    bool empty() const { return production.empty() && preview.empty(); }
};

// Minimal diff turning `current` into `desired`. A null environment in
// `desired` produces no changes for it.
EnvPatch make_patch(const envvars::VariableDocument& current, const envvars::VariableDocument& desired);

net::JsonValue patch_to_json(const EnvPatch& patch);

std::string url_encode_segment(const std::string& s);

class PagesClient {
public:
    static constexpr const char* DEFAULT_HOST = "api.cloudflare.com";
    static constexpr const char* DEFAULT_BASE_PATH = "/client/v4";

    explicit PagesClient(net::HttpTransport& transport,
                         std::string host = DEFAULT_HOST,
                         std::string base_path = DEFAULT_BASE_PATH);

    // Deployment-scoped when project.deployment is set: only the deployment's
    // environment is populated, the other stays null. Project-scoped otherwise,
    // with both environments populated.
    envvars::VariableDocument fetch_variables(const config::Credentials& creds, const config::ProjectReference& project);

    // Exactly one PATCH request.
    void update_variables(const config::Credentials& creds, const config::ProjectReference& project, const EnvPatch& patch);

private:
    net::HttpRequest make_request(const std::string& method, const config::Credentials& creds, const std::string& path) const;
    std::string project_path(const config::Credentials& creds, const std::string& project) const;
    // Checks status and envelope; returns the "result" member.
    net::JsonValue call(const net::HttpRequest& req);

    net::HttpTransport& transport_;
    std::string host_;
    std::string base_path_;
};

}
