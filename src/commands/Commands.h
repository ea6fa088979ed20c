#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "api/PagesClient.h"
#include "config/Config.h"
#include "net/HttpTransport.h"

namespace commands {

void get_env_vars(const config::Config::GetEnvVars& cfg, api::PagesClient& client, std::ostream& out);
void set_env_vars(const config::Config::SetEnvVars& cfg, api::PagesClient& client, std::ostream& out);
void to_env_file(const config::Config::ToEnvFile& cfg, std::ostream& out);

void print_usage(std::ostream& out);

// Full invocation: args excludes argv[0]. Errors are rendered as a single
// "error: ..." line on `err`; the return value is the process exit code.
int run(const std::vector<std::string>& args, const config::EnvLookup& env, net::HttpTransport& transport,
        std::ostream& out, std::ostream& err);

}
