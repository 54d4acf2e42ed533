#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "io/process.hpp"

namespace droidpack::package {

// Seam over external processes so the pipeline can run against fakes.
class ToolRunner {
public:
    virtual ~ToolRunner() = default;

    virtual io::ProcessResult run(
        const std::string &command,
        const std::vector<std::string> &args,
        const std::filesystem::path &cwd
    ) = 0;
};

class ProcessToolRunner : public ToolRunner {
public:
    explicit ProcessToolRunner(const droidpack::Context &ctx) : ctx_(ctx) {}

    io::ProcessResult run(
        const std::string &command,
        const std::vector<std::string> &args,
        const std::filesystem::path &cwd
    ) override;

private:
    const droidpack::Context &ctx_;
};

// Turns a manifest plus res/ and assets/ into a compiled resource archive.
class ResourceCompiler {
public:
    virtual ~ResourceCompiler() = default;

    virtual void compile(
        const std::filesystem::path &manifest,
        const std::optional<std::filesystem::path> &resDir,
        const std::optional<std::filesystem::path> &assetsDir,
        const std::filesystem::path &outArchive
    ) = 0;
};

class AaptResourceCompiler : public ResourceCompiler {
public:
    AaptResourceCompiler(
        ToolRunner &runner,
        std::filesystem::path aapt,
        std::filesystem::path androidJar,
        bool disableCompression = false
    );

    // Throws ProcessFailed on a non-zero exit.
    void compile(
        const std::filesystem::path &manifest,
        const std::optional<std::filesystem::path> &resDir,
        const std::optional<std::filesystem::path> &assetsDir,
        const std::filesystem::path &outArchive
    ) override;

    std::vector<std::string> arguments(
        const std::filesystem::path &manifest,
        const std::optional<std::filesystem::path> &resDir,
        const std::optional<std::filesystem::path> &assetsDir,
        const std::filesystem::path &outArchive
    ) const;

private:
    ToolRunner &runner_;
    std::filesystem::path aapt_;
    std::filesystem::path androidJar_;
    bool disableCompression_;
};

// Throws ProcessFailed when result.code != 0.
void requireSuccess(const io::ProcessResult &result);

} // namespace droidpack::package
