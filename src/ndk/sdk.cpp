#include "ndk/sdk.hpp"

#include <cstdlib>
#include <system_error>
#include <vector>

#include "core/error.hpp"
#include "io/fs_utils.hpp"

namespace fs = std::filesystem;

namespace droidpack::ndk
{
    namespace
    {

        constexpr const char *kPlatformPrefix = "android-";

        fs::path pickPath(const std::vector<fs::path> &candidates)
        {
            std::error_code ec;
            for (const auto &path : candidates)
            {
                if (!path.empty() && fs::exists(path, ec))
                {
                    return path;
                }
            }
            return {};
        }

    } // namespace

    fs::path SdkInstallation::buildTool(const std::string &name) const
    {
        const fs::path dir = root_ / "build-tools" / buildToolsVersion_;
#ifdef _WIN32
        const fs::path found = pickPath({dir / (name + ".exe"), dir / (name + ".bat"), dir / name});
#else
        const fs::path found = pickPath({dir / name});
#endif
        if (found.empty())
        {
            throw ToolMissing(dir / name);
        }
        return found;
    }

    fs::path SdkInstallation::androidJar(int api) const
    {
        const fs::path jar = root_ / "platforms" / (kPlatformPrefix + std::to_string(api)) / "android.jar";
        std::error_code ec;
        if (!fs::is_regular_file(jar, ec))
        {
            throw ToolMissing(jar);
        }
        return jar;
    }

    std::optional<int> SdkInstallation::highestPlatform() const
    {
        const fs::path platforms = root_ / "platforms";
        std::optional<int> best;
        std::error_code ec;
        for (const auto &entry : fs::directory_iterator(platforms, ec))
        {
            if (ec || !entry.is_directory(ec))
            {
                continue;
            }
            const std::string name = entry.path().filename().string();
            if (name.rfind(kPlatformPrefix, 0) != 0 || !fs::exists(entry.path() / "android.jar", ec))
            {
                continue;
            }
            const std::vector<int> key = io::numericKey(name);
            if (!best.has_value() || key.front() > best.value())
            {
                best = key.front();
            }
        }
        return best;
    }

    SdkInstallation validateSdk(const fs::path &path, const std::string &preferredBuildTools)
    {
        std::error_code ec;
        if (path.empty() || !fs::is_directory(path, ec))
        {
            throw InvalidInstallation(path, "not a directory");
        }
        if (!fs::is_directory(path / "platforms", ec))
        {
            throw InvalidInstallation(path, "missing platforms/");
        }

        const fs::path buildTools = path / "build-tools";
        if (!preferredBuildTools.empty() && fs::is_directory(buildTools / preferredBuildTools, ec))
        {
            return SdkInstallation(path, preferredBuildTools);
        }

        const auto latest = io::latestSubdirName(buildTools);
        if (!latest.has_value())
        {
            throw InvalidInstallation(path, "no build-tools installed");
        }
        return SdkInstallation(path, latest.value());
    }

    std::optional<fs::path> locateSdk(const droidpack::Context &ctx)
    {
        for (const char *name : {"ANDROID_SDK_ROOT", "ANDROID_HOME"})
        {
            const char *value = std::getenv(name);
            if (value != nullptr && value[0] != '\0')
            {
                ctx.log("Use Android SDK from ", name, ": ", value);
                return fs::path(value);
            }
        }
        return std::nullopt;
    }

} // namespace droidpack::ndk
