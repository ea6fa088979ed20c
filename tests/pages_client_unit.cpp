#include <iostream>
#include <string>
#include "api/PagesClient.h"
#include "errors/Errors.h"
#include "fake_transport.h"
#include "observability/Logging.h"

using api::PagesClient;
using config::Credentials;
using config::ProjectReference;
using envvars::VariableDocument;
using envvars::VariableMap;

static const Credentials kCreds{"acc123", "tok456"};

int main() {
    observability::set_log_level(4);

    // project scope: both environments populated, null env_vars becomes {}
    {
        FakeTransport t;
        t.queue_response(200, project_body(
            "{\"API\":{\"type\":\"plain_text\",\"value\":\"https://api\"},\"SECRET\":{\"type\":\"secret_text\"},\"GONE\":null}",
            "null"));
        PagesClient client(t);
        VariableDocument doc = client.fetch_variables(kCreds, ProjectReference{"my site", std::nullopt});
        if (!doc.production.has_value() || !doc.preview.has_value()) { std::cerr << "project fetch left an environment null\n"; return 1; }
        if (!doc.preview->empty()) { std::cerr << "preview should be empty\n"; return 1; }
        if (doc.production->size() != 3 || doc.production->at("API") != "https://api" ||
            doc.production->at("SECRET") != "" || doc.production->at("GONE") != "") {
            std::cerr << "production variables decoded wrong\n"; return 1;
        }
        if (t.requests.size() != 1) { std::cerr << "expected exactly one request\n"; return 1; }
        const auto& r = t.requests[0];
        if (r.method != "GET" || r.host != "api.cloudflare.com" || r.target != "/client/v4/accounts/acc123/pages/projects/my%20site") {
            std::cerr << "project request wrong: " << r.method << " " << r.host << r.target << "\n"; return 1;
        }
        if (FakeTransport::header(r, "Authorization") != "Bearer tok456") { std::cerr << "bearer header missing\n"; return 1; }
    }

    // deployment configs missing entirely for one environment
    {
        FakeTransport t;
        t.queue_response(200, "{\"success\":true,\"result\":{\"deployment_configs\":{\"production\":{}}}}");
        PagesClient client(t);
        VariableDocument doc = client.fetch_variables(kCreds, ProjectReference{"site", std::nullopt});
        if (!doc.production.has_value() || !doc.preview.has_value() || !doc.production->empty() || !doc.preview->empty()) {
            std::cerr << "absent environments should read as empty maps\n"; return 1;
        }
    }

    // deployment scope: exactly one environment populated
    {
        FakeTransport t;
        t.queue_response(200, deployment_body("preview", "{\"A\":{\"type\":\"plain_text\",\"value\":\"1\"}}"));
        PagesClient client(t);
        VariableDocument doc = client.fetch_variables(kCreds, ProjectReference{"site", std::string("dep-1")});
        if (doc.production.has_value()) { std::cerr << "deployment fetch populated production\n"; return 1; }
        if (!doc.preview.has_value() || doc.preview->at("A") != "1") { std::cerr << "deployment fetch lost preview\n"; return 1; }
        if (t.requests[0].target != "/client/v4/accounts/acc123/pages/projects/site/deployments/dep-1") {
            std::cerr << "deployment target wrong: " << t.requests[0].target << "\n"; return 1;
        }
    }
    {
        FakeTransport t;
        t.queue_response(200, deployment_body("production", "null"));
        PagesClient client(t);
        VariableDocument doc = client.fetch_variables(kCreds, ProjectReference{"site", std::string("dep-2")});
        if (!doc.production.has_value() || !doc.production->empty() || doc.preview.has_value()) {
            std::cerr << "production deployment with no vars decoded wrong\n"; return 1;
        }
    }

    // API errors
    {
        FakeTransport t;
        t.queue_response(403, "{\"message\":\"Unauthorized\"}", "Forbidden");
        PagesClient client(t);
        bool ok = false;
        try {
            client.fetch_variables(kCreds, ProjectReference{"site", std::nullopt});
        } catch (const errors::ApiError& e) {
            ok = e.status() == 403 && e.message() == "Unauthorized";
        }
        if (!ok) { std::cerr << "403 not surfaced as ApiError{403, Unauthorized}\n"; return 1; }
    }
    {
        FakeTransport t;
        t.queue_response(404, "{\"success\":false,\"errors\":[{\"code\":8000007,\"message\":\"Project not found.\"}],\"result\":null}");
        PagesClient client(t);
        bool ok = false;
        try {
            client.fetch_variables(kCreds, ProjectReference{"nope", std::nullopt});
        } catch (const errors::ApiError& e) {
            ok = e.status() == 404 && e.message() == "Project not found.";
        }
        if (!ok) { std::cerr << "errors[].message not used\n"; return 1; }
    }
    {
        FakeTransport t;
        t.queue_response(502, "<html>bad gateway</html>", "Bad Gateway");
        PagesClient client(t);
        bool ok = false;
        try {
            client.fetch_variables(kCreds, ProjectReference{"site", std::nullopt});
        } catch (const errors::ApiError& e) {
            ok = e.status() == 502 && e.message() == "Bad Gateway";
        }
        if (!ok) { std::cerr << "non-json error body not mapped to reason\n"; return 1; }
    }
    {
        FakeTransport t;
        t.queue_response(200, "{\"success\":false,\"errors\":[],\"result\":null}");
        PagesClient client(t);
        bool ok = false;
        try {
            client.fetch_variables(kCreds, ProjectReference{"site", std::nullopt});
        } catch (const errors::ApiError& e) {
            ok = e.status() == 200 && e.message() == "unsuccessful Cloudflare request";
        }
        if (!ok) { std::cerr << "success=false not surfaced as ApiError\n"; return 1; }
    }

    // decode errors
    const char* bad_bodies[] = {
        "not json",
        "[]",
        "{\"result\":{}}",
        "{\"success\":true}",
        "{\"success\":true,\"result\":{\"name\":\"x\"}}",
        "{\"success\":true,\"result\":{\"deployment_configs\":{\"production\":{\"env_vars\":[]}}}}",
        "{\"success\":true,\"result\":{\"deployment_configs\":{\"production\":{\"env_vars\":{\"A\":{\"value\":1}}}}}}",
    };
    for (const char* body : bad_bodies) {
        FakeTransport t;
        t.queue_response(200, body);
        PagesClient client(t);
        bool decode = false;
        try { client.fetch_variables(kCreds, ProjectReference{"site", std::nullopt}); } catch (const errors::DecodeError&) { decode = true; }
        if (!decode) { std::cerr << "expected DecodeError for body: " << body << "\n"; return 1; }
    }
    {
        FakeTransport t;
        t.queue_response(200, deployment_body("staging", "{}"));
        PagesClient client(t);
        bool decode = false;
        try { client.fetch_variables(kCreds, ProjectReference{"site", std::string("d")}); } catch (const errors::DecodeError&) { decode = true; }
        if (!decode) { std::cerr << "unknown deployment environment accepted\n"; return 1; }
    }

    // transport failures propagate
    {
        FakeTransport t;
        t.queue_transport_failure("connect failed api.cloudflare.com:443 -> refused");
        PagesClient client(t);
        bool transport = false;
        try { client.fetch_variables(kCreds, ProjectReference{"site", std::nullopt}); } catch (const errors::TransportError&) { transport = true; }
        if (!transport) { std::cerr << "transport failure not propagated\n"; return 1; }
    }

    // patch computation
    {
        VariableDocument current;
        current.production = VariableMap{{"KEEP", "1"}, {"CHANGE", "old"}, {"DROP", "x"}};
        current.preview = VariableMap{{"P", "1"}};
        VariableDocument desired;
        desired.production = VariableMap{{"KEEP", "1"}, {"CHANGE", "new"}, {"ADD", "y"}};
        desired.preview = std::nullopt;

        auto patch = api::make_patch(current, desired);
        if (patch.production.size() != 3) { std::cerr << "production patch size wrong\n"; return 1; }
        if (patch.production.count("KEEP")) { std::cerr << "unchanged key included in patch\n"; return 1; }
        if (patch.production.at("CHANGE").value_or("") != "new" || patch.production.at("ADD").value_or("") != "y") {
            std::cerr << "changed/added keys wrong\n"; return 1;
        }
        if (patch.production.at("DROP").has_value()) { std::cerr << "removed key should be null\n"; return 1; }
        if (!patch.preview.empty()) { std::cerr << "null preview must not touch remote preview\n"; return 1; }

        auto body = net::json_dump(api::patch_to_json(patch));
        const std::string expected =
            "{\"deployment_configs\":{\"preview\":{\"env_vars\":{}},\"production\":{\"env_vars\":{"
            "\"ADD\":{\"type\":\"plain_text\",\"value\":\"y\"},"
            "\"CHANGE\":{\"type\":\"plain_text\",\"value\":\"new\"},"
            "\"DROP\":null}}}}";
        if (body != expected) { std::cerr << "patch body wrong:\n" << body << "\n"; return 1; }

        if (!api::make_patch(current, current).empty()) { std::cerr << "identical documents produced a patch\n"; return 1; }
        VariableDocument empty_desired;
        empty_desired.preview = VariableMap{};
        auto clear_preview = api::make_patch(current, empty_desired);
        if (clear_preview.preview.size() != 1 || clear_preview.preview.at("P").has_value() || !clear_preview.production.empty()) {
            std::cerr << "explicit empty preview should delete remote preview keys only\n"; return 1;
        }
    }

    // update issues exactly one PATCH
    {
        FakeTransport t;
        t.queue_response(200, project_body("{}", "{}"));
        PagesClient client(t);
        api::EnvPatch patch;
        patch.production["A"] = std::string("1");
        client.update_variables(kCreds, ProjectReference{"site", std::nullopt}, patch);
        if (t.requests.size() != 1) { std::cerr << "update should send exactly one request\n"; return 1; }
        const auto& r = t.requests[0];
        if (r.method != "PATCH" || r.target != "/client/v4/accounts/acc123/pages/projects/site") { std::cerr << "update request wrong\n"; return 1; }
        if (FakeTransport::header(r, "Content-Type") != "application/json") { std::cerr << "update missing content type\n"; return 1; }
        auto sent = net::json_parse(r.body);
        const auto* preview = sent.find("deployment_configs")->find("preview")->find("env_vars");
        if (!preview || !preview->is_object() || preview->size() != 0) { std::cerr << "untouched preview must be sent as {}\n"; return 1; }
    }

    if (api::url_encode_segment("a/b c~") != "a%2Fb%20c~") { std::cerr << "url_encode_segment wrong\n"; return 1; }

    std::cout << "pages_client_unit ok\n";
    return 0;
}
