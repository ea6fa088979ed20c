#include "Commands.h"
#include <exception>
#include "FileIO.h"
#include "envvars/EnvFile.h"
#include "envvars/VariableDocument.h"
#include "errors/Errors.h"
#include "observability/Logging.h"
#include "version.h"

using config::Config;
using observability::log_info;

namespace commands {

namespace {

void emit(const std::optional<std::string>& output, const std::string& payload, std::ostream& out) {
    if (output.has_value()) {
        write_file_atomic(*output, payload);
        out << "Environment variables written to: " << *output << "\n";
    } else {
        out << payload;
    }
    out.flush();
}

}

void get_env_vars(const Config::GetEnvVars& cfg, api::PagesClient& client, std::ostream& out) {
    log_info("get_env_vars", {{"project", cfg.project.project}, {"deployment", cfg.project.deployment.value_or("")}});
    auto doc = client.fetch_variables(cfg.credentials, cfg.project);
    emit(cfg.output, envvars::serialize_document(doc) + "\n", out);
}

void set_env_vars(const Config::SetEnvVars& cfg, api::PagesClient& client, std::ostream& out) {
    log_info("set_env_vars", {{"project", cfg.project.project}, {"file", cfg.file}});
    auto desired = envvars::parse_document(read_file(cfg.file));

    config::ProjectReference project_scope{cfg.project.project, std::nullopt};
    auto current = client.fetch_variables(cfg.credentials, project_scope);

    auto patch = api::make_patch(current, desired);
    if (patch.empty()) {
        out << "No changes detected. Not submitting patch.\n";
        return;
    }
    client.update_variables(cfg.credentials, project_scope, patch);
    out << "Environment variables successfully updated\n";
}

void to_env_file(const Config::ToEnvFile& cfg, std::ostream& out) {
    log_info("to_env_file", {{"file", cfg.file}, {"environment", std::string(envvars::environment_name(cfg.environment))}});
    auto doc = envvars::parse_document(read_file(cfg.file));
    auto lines = envvars::to_env_lines(doc, cfg.environment, cfg.empty);
    emit(cfg.output, envvars::join_env_lines(lines), out);
}

void print_usage(std::ostream& out) {
    out << "pagesenv " << PAGESENV_VERSION << "\n"
        << "Synchronize Cloudflare Pages environment variables with local files.\n"
        << "\n"
        << "Usage:\n"
        << "  pagesenv get-env-vars --project NAME [--deployment ID] [--output PATH] [--account ID] [--token TOKEN]\n"
        << "  pagesenv set-env-vars --project NAME --file PATH [--account ID] [--token TOKEN]\n"
        << "  pagesenv to-env-file [--environment production|preview] [--empty] [--output PATH] FILE\n"
        << "\n"
        << "Environment:\n"
        << "  CLOUDFLARE_ACCOUNT, CLOUDFLARE_TOKEN, CF_PAGES_PROJECT, CF_PAGES_DEPLOYMENT,\n"
        << "  CF_PAGES_OUTPUT, CF_PAGES_FILE, CF_PAGES_ENVIRONMENT, CF_PAGES_EMPTY, LOG_LEVEL\n"
        << "\n"
        << "Options:\n"
        << "  --log-level LEVEL  DEBUG, INFO, WARN or ERROR (logs go to stderr)\n"
        << "  -h, --help         Show this message\n"
        << "  --version          Show version\n";
}

int run(const std::vector<std::string>& args, const config::EnvLookup& env, net::HttpTransport& transport,
        std::ostream& out, std::ostream& err) {
    try {
        auto cl = config::parse_command_line(args);
        if (cl.version) {
            out << "pagesenv " << PAGESENV_VERSION << "\n";
            return 0;
        }
        if (cl.help) {
            print_usage(out);
            return 0;
        }
        if (cl.command.empty()) {
            print_usage(err);
            return 2;
        }
        observability::set_log_level(config::log_level_value(Config::resolve_log_level(cl, env)));

        if (cl.command == "get-env-vars") {
            auto cfg = Config::resolve_get_env_vars(cl, env);
            api::PagesClient client(transport);
            get_env_vars(cfg, client, out);
        } else if (cl.command == "set-env-vars") {
            auto cfg = Config::resolve_set_env_vars(cl, env);
            api::PagesClient client(transport);
            set_env_vars(cfg, client, out);
        } else {
            auto cfg = Config::resolve_to_env_file(cl, env);
            to_env_file(cfg, out);
        }
        return 0;
    } catch (const errors::Error& e) {
        observability::log_debug("command_failed", {{"kind", std::string(errors::kind_name(e.kind()))}});
        err << "error: " << e.what() << "\n";
        return e.exit_code();
    } catch (const std::exception& e) {
        err << "error: " << e.what() << "\n";
        return 1;
    }
}

}
