#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace droidpack {

enum class ErrorKind {
    UnsupportedAbi,
    InvalidInstallation,
    ApiLevelOutOfRange,
    ToolMissing,
    InvalidManifest,
    DuplicateComponent,
    DuplicateLibrary,
    ProcessFailed,
    SigningError,
    IoError,
    ConfigError,
};

const char *errorKindName(ErrorKind kind);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class UnsupportedAbi : public Error {
public:
    explicit UnsupportedAbi(const std::string &abi)
        : Error(ErrorKind::UnsupportedAbi, "Unsupported ABI: " + abi), abi_(abi) {}

    const std::string &abi() const { return abi_; }

private:
    std::string abi_;
};

class InvalidInstallation : public Error {
public:
    InvalidInstallation(const std::filesystem::path &root, const std::string &reason)
        : Error(ErrorKind::InvalidInstallation, "Invalid installation at " + root.string() + ": " + reason),
          reason_(reason) {}

    const std::string &reason() const { return reason_; }

private:
    std::string reason_;
};

class ApiLevelOutOfRange : public Error {
public:
    ApiLevelOutOfRange(int requested, int minimum, int maximum)
        : Error(ErrorKind::ApiLevelOutOfRange,
                "API level " + std::to_string(requested) + " outside [" + std::to_string(minimum) + ", " +
                    std::to_string(maximum) + "]"),
          requested_(requested) {}

    int requested() const { return requested_; }

private:
    int requested_;
};

class ToolMissing : public Error {
public:
    explicit ToolMissing(const std::filesystem::path &path)
        : Error(ErrorKind::ToolMissing, "Missing tool or toolchain file: " + path.string()), path_(path) {}

    const std::filesystem::path &path() const { return path_; }

private:
    std::filesystem::path path_;
};

class InvalidManifest : public Error {
public:
    explicit InvalidManifest(const std::string &reason)
        : Error(ErrorKind::InvalidManifest, "Invalid manifest: " + reason) {}
};

class DuplicateComponent : public Error {
public:
    DuplicateComponent(const std::string &tag, const std::string &name)
        : Error(ErrorKind::DuplicateComponent, "Duplicate <" + tag + "> component: " + name),
          tag_(tag), name_(name) {}

    const std::string &tag() const { return tag_; }
    const std::string &name() const { return name_; }

private:
    std::string tag_;
    std::string name_;
};

class DuplicateLibrary : public Error {
public:
    DuplicateLibrary(const std::string &abiDir, const std::string &fileName)
        : Error(ErrorKind::DuplicateLibrary, "Duplicate library lib/" + abiDir + "/" + fileName) {}
};

class ProcessFailed : public Error {
public:
    ProcessFailed(const std::string &commandLine, int code, const std::string &output)
        : Error(ErrorKind::ProcessFailed,
                "Command failed (exit " + std::to_string(code) + "): " + commandLine +
                    (output.empty() ? std::string() : "\n" + output)),
          commandLine_(commandLine), code_(code), output_(output) {}

    const std::string &commandLine() const { return commandLine_; }
    int code() const { return code_; }
    const std::string &output() const { return output_; }

private:
    std::string commandLine_;
    int code_;
    std::string output_;
};

class SigningError : public Error {
public:
    explicit SigningError(const std::string &reason)
        : Error(ErrorKind::SigningError, "Signing failed: " + reason) {}
};

class IoError : public Error {
public:
    IoError(const std::filesystem::path &path, const std::string &what)
        : Error(ErrorKind::IoError, what + ": " + path.string()) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string &reason)
        : Error(ErrorKind::ConfigError, "Invalid configuration: " + reason) {}
};

} // namespace droidpack
