#pragma once

#include <stdexcept>
#include <string>

namespace errors {

class Error : public std::runtime_error {
public:
    enum class Kind {
        Usage,
        MissingConfiguration,
        InvalidConfiguration,
        Transport,
        Api,
        Decode,
        MalformedDocument,
        EnvironmentUnavailable,
        FileIO
    };

    Error(Kind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}

    Kind kind() const noexcept { return kind_; }
    // 2 for usage/configuration problems, 1 for everything else
    int exit_code() const noexcept;

private:
    Kind kind_;
};

class UsageError : public Error {
public:
    explicit UsageError(const std::string& msg) : Error(Kind::Usage, msg) {}
};

class MissingConfiguration : public Error {
public:
    MissingConfiguration(std::string field, const std::string& hint);
    const std::string& field() const noexcept { return field_; }
private:
    std::string field_;
};

class InvalidConfiguration : public Error {
public:
    InvalidConfiguration(std::string field, const std::string& reason);
    const std::string& field() const noexcept { return field_; }
private:
    std::string field_;
};

class TransportError : public Error {
public:
    explicit TransportError(const std::string& msg) : Error(Kind::Transport, msg) {}
};

class ApiError : public Error {
public:
    ApiError(int status, std::string message);
    int status() const noexcept { return status_; }
    const std::string& message() const noexcept { return message_; }
private:
    int status_;
    std::string message_;
};

class DecodeError : public Error {
public:
    explicit DecodeError(const std::string& msg) : Error(Kind::Decode, "invalid API response: " + msg) {}
};

class MalformedDocument : public Error {
public:
    explicit MalformedDocument(const std::string& msg) : Error(Kind::MalformedDocument, "malformed variables document: " + msg) {}
};

class EnvironmentUnavailable : public Error {
public:
    explicit EnvironmentUnavailable(std::string environment);
    const std::string& environment() const noexcept { return environment_; }
private:
    std::string environment_;
};

class FileIOError : public Error {
public:
    FileIOError(std::string path, const std::string& what);
    const std::string& path() const noexcept { return path_; }
private:
    std::string path_;
};

const char* kind_name(Error::Kind kind);

}
