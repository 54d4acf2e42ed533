#include "ndk/ndk.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <future>
#include <limits>
#include <regex>
#include <sstream>
#include <system_error>
#include <tuple>

#include "core/error.hpp"
#include "io/fs_utils.hpp"

namespace fs = std::filesystem;

namespace droidpack::ndk
{
    namespace
    {

        // Clang/lld speak llvm-ar and friends from this release on; older kits
        // still ship triple-prefixed GNU binutils.
        constexpr int kFirstLlvmBinutilsMajor = 23;

        std::string trim(const std::string &value)
        {
            std::size_t begin = 0;
            std::size_t end = value.size();
            while (begin < end && std::isspace(static_cast<unsigned char>(value[begin])) != 0)
            {
                ++begin;
            }
            while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0)
            {
                --end;
            }
            return value.substr(begin, end - begin);
        }

        std::map<std::string, std::string> parseProperties(const std::string &text)
        {
            std::map<std::string, std::string> out;
            std::istringstream input(text);
            std::string line;
            while (std::getline(input, line))
            {
                const std::string item = trim(line);
                if (item.empty() || item[0] == '#')
                {
                    continue;
                }
                const std::size_t eq = item.find('=');
                if (eq == std::string::npos)
                {
                    continue;
                }
                out[trim(item.substr(0, eq))] = trim(item.substr(eq + 1));
            }
            return out;
        }

        std::string envValue(const char *name)
        {
            const char *value = std::getenv(name);
            if (!value)
            {
                return "";
            }
            return std::string(value);
        }

        std::string exeSuffix()
        {
#ifdef _WIN32
            return ".exe";
#else
            return "";
#endif
        }

        std::string scriptSuffix()
        {
#ifdef _WIN32
            return ".cmd";
#else
            return "";
#endif
        }

        std::string envTripleKey(const std::string &prefix, Abi abi)
        {
            std::string triple = tripleFor(abi);
            std::replace(triple.begin(), triple.end(), '-', '_');
            return prefix + "_" + triple;
        }

        void requirePath(const fs::path &path)
        {
            std::error_code ec;
            if (!fs::exists(path, ec))
            {
                throw ToolMissing(path);
            }
        }

        int clampApi(int requested, ClampPolicy policy, bool &clamped)
        {
            clamped = false;
            if (requested >= kMinSupportedApi && requested <= kMaxKnownApi)
            {
                return requested;
            }
            if (policy == ClampPolicy::Reject)
            {
                throw ApiLevelOutOfRange(requested, kMinSupportedApi, kMaxKnownApi);
            }
            clamped = true;
            return std::clamp(requested, kMinSupportedApi, kMaxKnownApi);
        }

    } // namespace

    std::string NdkVersion::toString() const
    {
        std::string out = std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
        if (beta.has_value())
        {
            out += "-beta" + std::to_string(beta.value());
        }
        return out;
    }

    bool operator==(const NdkVersion &a, const NdkVersion &b)
    {
        return a.major == b.major && a.minor == b.minor && a.patch == b.patch && a.beta == b.beta;
    }

    bool operator<(const NdkVersion &a, const NdkVersion &b)
    {
        // A beta sorts before the final release of the same revision.
        const int betaA = a.beta.value_or(std::numeric_limits<int>::max());
        const int betaB = b.beta.value_or(std::numeric_limits<int>::max());
        return std::tie(a.major, a.minor, a.patch, betaA) < std::tie(b.major, b.minor, b.patch, betaB);
    }

    std::optional<NdkVersion> parseNdkVersion(const std::string &revision)
    {
        static const std::regex pattern(R"(^(\d+)\.(\d+)\.(\d+)(?:-beta(\d+))?$)");
        std::smatch match;
        const std::string text = trim(revision);
        if (!std::regex_match(text, match, pattern))
        {
            return std::nullopt;
        }

        try
        {
            NdkVersion out;
            out.major = std::stoi(match[1].str());
            out.minor = std::stoi(match[2].str());
            out.patch = std::stoi(match[3].str());
            if (match[4].matched)
            {
                out.beta = std::stoi(match[4].str());
            }
            return out;
        }
        catch (const std::out_of_range &)
        {
            return std::nullopt;
        }
    }

    fs::path NdkInstallation::prebuiltRoot() const
    {
        return root_ / "toolchains" / "llvm" / "prebuilt" / hostTag();
    }

    fs::path NdkInstallation::binDir() const
    {
        return prebuiltRoot() / "bin";
    }

    fs::path NdkInstallation::sysroot() const
    {
        return prebuiltRoot() / "sysroot";
    }

    fs::path NdkInstallation::platformLibDir(Abi abi, int api) const
    {
        return sysroot() / "usr" / "lib" / tripleFor(abi) / std::to_string(api);
    }

    NdkInstallation validateNdk(const fs::path &path)
    {
        std::error_code ec;
        if (path.empty() || !fs::is_directory(path, ec))
        {
            throw InvalidInstallation(path, "not a directory");
        }

        const fs::path properties = path / "source.properties";
        if (!fs::is_regular_file(properties, ec))
        {
            throw InvalidInstallation(path, "missing source.properties");
        }

        const fs::path prebuilt = path / "toolchains" / "llvm" / "prebuilt";
        if (!fs::is_directory(prebuilt, ec))
        {
            throw InvalidInstallation(path, "missing toolchains/llvm/prebuilt");
        }
        if (!fs::is_directory(prebuilt / hostTag(), ec))
        {
            throw InvalidInstallation(path, "no prebuilt toolchain for host " + hostTag());
        }
        if (!fs::is_directory(prebuilt / hostTag() / "sysroot", ec))
        {
            throw InvalidInstallation(path, "missing sysroot for host " + hostTag());
        }

        const auto props = parseProperties(io::readTextFile(properties));
        const auto it = props.find("Pkg.Revision");
        if (it == props.end())
        {
            throw InvalidInstallation(path, "source.properties has no Pkg.Revision");
        }

        const auto version = parseNdkVersion(it->second);
        if (!version.has_value())
        {
            throw InvalidInstallation(path, "malformed Pkg.Revision '" + it->second + "'");
        }

        return NdkInstallation(fs::absolute(path).lexically_normal(), version.value());
    }

    std::optional<fs::path> locateNdk(const droidpack::Context &ctx)
    {
        for (const char *name : {"ANDROID_NDK_ROOT", "ANDROID_NDK_HOME", "ANDROID_NDK_PATH"})
        {
            const std::string value = envValue(name);
            if (!value.empty())
            {
                ctx.log("Use NDK from ", name, ": ", value);
                return fs::path(value);
            }
        }

        std::string sdk = envValue("ANDROID_SDK_ROOT");
        if (sdk.empty())
        {
            sdk = envValue("ANDROID_HOME");
        }
        if (sdk.empty())
        {
            return std::nullopt;
        }

        const fs::path ndkRoot = fs::path(sdk) / "ndk";
        const auto latest = io::latestSubdirName(ndkRoot);
        if (latest.has_value())
        {
            ctx.log("Use newest side-by-side NDK: ", (ndkRoot / latest.value()).string());
            return ndkRoot / latest.value();
        }

        std::error_code ec;
        const fs::path bundle = fs::path(sdk) / "ndk-bundle";
        if (fs::is_directory(bundle, ec))
        {
            return bundle;
        }
        return std::nullopt;
    }

    bool operator==(const ToolchainPaths &a, const ToolchainPaths &b)
    {
        return a.clang == b.clang && a.clangxx == b.clangxx && a.ar == b.ar && a.linker == b.linker &&
               a.ranlib == b.ranlib && a.strip == b.strip && a.objcopy == b.objcopy && a.sysroot == b.sysroot &&
               a.env == b.env;
    }

    ToolchainResolution resolveToolchain(const NdkInstallation &ndk, Abi abi, int requestedApi, ClampPolicy policy)
    {
        ToolchainResolution out;
        out.abi = abi;
        out.requestedApi = requestedApi;
        out.resolvedApi = clampApi(requestedApi, policy, out.clamped);

        const std::string triple = tripleFor(abi);
        const std::string clangTarget = clangTargetFor(abi) + std::to_string(out.resolvedApi);
        const fs::path bin = ndk.binDir();
        const bool llvmBinutils = ndk.version().major >= kFirstLlvmBinutilsMajor;

        ToolchainPaths &paths = out.paths;
        paths.clang = bin / (clangTarget + "-clang" + scriptSuffix());
        paths.clangxx = bin / (clangTarget + "-clang++" + scriptSuffix());
        paths.sysroot = ndk.sysroot();
        if (llvmBinutils)
        {
            paths.ar = bin / ("llvm-ar" + exeSuffix());
            paths.linker = bin / ("ld.lld" + exeSuffix());
            paths.ranlib = bin / ("llvm-ranlib" + exeSuffix());
            paths.strip = bin / ("llvm-strip" + exeSuffix());
            paths.objcopy = bin / ("llvm-objcopy" + exeSuffix());
        }
        else
        {
            paths.ar = bin / (triple + "-ar" + exeSuffix());
            paths.linker = bin / (triple + "-ld" + exeSuffix());
            paths.ranlib = bin / (triple + "-ranlib" + exeSuffix());
            paths.strip = bin / (triple + "-strip" + exeSuffix());
            paths.objcopy = bin / (triple + "-objcopy" + exeSuffix());
        }

        // Only what a compile of this ABI needs; strip/objcopy are checked by
        // whoever asks for them.
        requirePath(paths.clang);
        requirePath(paths.clangxx);
        requirePath(paths.ar);
        requirePath(paths.linker);
        requirePath(paths.sysroot);

        const std::string sysrootFlag = "--sysroot=" + paths.sysroot.string();
        paths.env["ANDROID_NDK_ROOT"] = ndk.root().string();
        paths.env["CC"] = paths.clang.string();
        paths.env["CXX"] = paths.clangxx.string();
        paths.env["AR"] = paths.ar.string();
        paths.env["LD"] = paths.linker.string();
        paths.env["STRIP"] = paths.strip.string();
        paths.env["CFLAGS"] = sysrootFlag;
        paths.env["CXXFLAGS"] = sysrootFlag;
        paths.env["LDFLAGS"] = llvmBinutils ? "-fuse-ld=lld" : "";
        paths.env[envTripleKey("CC", abi)] = paths.clang.string();
        paths.env[envTripleKey("CXX", abi)] = paths.clangxx.string();
        paths.env[envTripleKey("AR", abi)] = paths.ar.string();

        std::error_code ec;
        if (fs::exists(paths.ranlib, ec))
        {
            paths.env["RANLIB"] = paths.ranlib.string();
        }
        else
        {
            paths.ranlib.clear();
        }

        return out;
    }

    std::vector<ToolchainResolution> resolveToolchains(
        const NdkInstallation &ndk,
        const std::vector<Abi> &abis,
        int requestedApi,
        ClampPolicy policy)
    {
        std::vector<std::future<ToolchainResolution>> pending;
        pending.reserve(abis.size());
        for (Abi abi : abis)
        {
            pending.push_back(std::async(std::launch::async, [&ndk, abi, requestedApi, policy]()
                                         { return resolveToolchain(ndk, abi, requestedApi, policy); }));
        }

        // Join everything before rethrowing so no task outlives the call.
        std::vector<ToolchainResolution> out;
        std::exception_ptr failure;
        for (auto &item : pending)
        {
            try
            {
                out.push_back(item.get());
            }
            catch (...)
            {
                if (!failure)
                {
                    failure = std::current_exception();
                }
            }
        }
        if (failure)
        {
            std::rethrow_exception(failure);
        }
        return out;
    }

} // namespace droidpack::ndk
