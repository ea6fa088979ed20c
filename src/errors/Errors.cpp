#include "Errors.h"
#include <utility>

namespace errors {

int Error::exit_code() const noexcept {
    switch (kind_) {
        case Kind::Usage:
        case Kind::MissingConfiguration:
        case Kind::InvalidConfiguration:
            return 2;
        default:
            return 1;
    }
}

MissingConfiguration::MissingConfiguration(std::string field, const std::string& hint)
    : Error(Kind::MissingConfiguration, "missing required configuration: " + field + (hint.empty() ? "" : " (" + hint + ")")),
      field_(std::move(field)) {}

InvalidConfiguration::InvalidConfiguration(std::string field, const std::string& reason)
    : Error(Kind::InvalidConfiguration, "invalid configuration for " + field + ": " + reason),
      field_(std::move(field)) {}

ApiError::ApiError(int status, std::string message)
    : Error(Kind::Api, "Cloudflare API error (HTTP " + std::to_string(status) + "): " + message),
      status_(status), message_(std::move(message)) {}

EnvironmentUnavailable::EnvironmentUnavailable(std::string environment)
    : Error(Kind::EnvironmentUnavailable, "environment '" + environment + "' is not available in the document (null)"),
      environment_(std::move(environment)) {}

FileIOError::FileIOError(std::string path, const std::string& what)
    : Error(Kind::FileIO, what + ": " + path), path_(std::move(path)) {}

const char* kind_name(Error::Kind kind) {
    switch (kind) {
        case Error::Kind::Usage: return "usage";
        case Error::Kind::MissingConfiguration: return "missing_configuration";
        case Error::Kind::InvalidConfiguration: return "invalid_configuration";
        case Error::Kind::Transport: return "transport";
        case Error::Kind::Api: return "api";
        case Error::Kind::Decode: return "decode";
        case Error::Kind::MalformedDocument: return "malformed_document";
        case Error::Kind::EnvironmentUnavailable: return "environment_unavailable";
        case Error::Kind::FileIO: return "file_io";
    }
    return "unknown";
}

}
