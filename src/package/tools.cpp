#include "package/tools.hpp"

#include "core/error.hpp"

namespace fs = std::filesystem;

namespace droidpack::package
{

    io::ProcessResult ProcessToolRunner::run(
        const std::string &command,
        const std::vector<std::string> &args,
        const fs::path &cwd)
    {
        return io::runCommand(command, args, cwd, ctx_);
    }

    void requireSuccess(const io::ProcessResult &result)
    {
        if (result.code != 0)
        {
            throw ProcessFailed(result.commandLine, result.code, result.output);
        }
    }

    AaptResourceCompiler::AaptResourceCompiler(
        ToolRunner &runner,
        fs::path aapt,
        fs::path androidJar,
        bool disableCompression)
        : runner_(runner),
          aapt_(std::move(aapt)),
          androidJar_(std::move(androidJar)),
          disableCompression_(disableCompression)
    {
    }

    std::vector<std::string> AaptResourceCompiler::arguments(
        const fs::path &manifest,
        const std::optional<fs::path> &resDir,
        const std::optional<fs::path> &assetsDir,
        const fs::path &outArchive) const
    {
        std::vector<std::string> args = {
            "package",
            "-f",
            "-F", outArchive.string(),
            "-M", manifest.string(),
            "-I", androidJar_.string(),
        };
        if (disableCompression_)
        {
            // Empty extension list: store everything.
            args.push_back("-0");
            args.push_back("");
        }
        if (resDir.has_value())
        {
            args.push_back("-S");
            args.push_back(resDir->string());
        }
        if (assetsDir.has_value())
        {
            args.push_back("-A");
            args.push_back(assetsDir->string());
        }
        return args;
    }

    void AaptResourceCompiler::compile(
        const fs::path &manifest,
        const std::optional<fs::path> &resDir,
        const std::optional<fs::path> &assetsDir,
        const fs::path &outArchive)
    {
        const auto args = arguments(manifest, resDir, assetsDir, outArchive);
        requireSuccess(runner_.run(aapt_.string(), args, {}));
    }

} // namespace droidpack::package
