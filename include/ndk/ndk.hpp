#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "ndk/abi.hpp"

namespace droidpack::ndk {

struct NdkVersion {
    int major = 0;
    int minor = 0;
    int patch = 0;
    std::optional<int> beta;

    std::string toString() const;
};

bool operator==(const NdkVersion &a, const NdkVersion &b);
bool operator<(const NdkVersion &a, const NdkVersion &b);

// Parses a Pkg.Revision value such as "25.1.8937393" or "26.0.10404224-beta1".
std::optional<NdkVersion> parseNdkVersion(const std::string &revision);

// A validated NDK. Only validateNdk() can produce one.
class NdkInstallation {
public:
    const std::filesystem::path &root() const { return root_; }
    const NdkVersion &version() const { return version_; }

    std::filesystem::path prebuiltRoot() const;
    std::filesystem::path binDir() const;
    std::filesystem::path sysroot() const;
    // Per-API system libraries of the sysroot: usr/lib/<triple>/<api>.
    std::filesystem::path platformLibDir(Abi abi, int api) const;

private:
    NdkInstallation(std::filesystem::path root, NdkVersion version)
        : root_(std::move(root)), version_(version) {}

    friend NdkInstallation validateNdk(const std::filesystem::path &path);

    std::filesystem::path root_;
    NdkVersion version_;
};

// Throws InvalidInstallation when the marker files are missing or
// source.properties does not carry a well-formed Pkg.Revision.
NdkInstallation validateNdk(const std::filesystem::path &path);

// Looks at ANDROID_NDK_ROOT, ANDROID_NDK_HOME, ANDROID_NDK_PATH and then the
// ndk/ folder of the SDK. Returns the first candidate, validated or not.
std::optional<std::filesystem::path> locateNdk(const droidpack::Context &ctx);

enum class ClampPolicy {
    Clamp,
    Reject,
};

struct ToolchainPaths {
    std::filesystem::path clang;
    std::filesystem::path clangxx;
    std::filesystem::path ar;
    std::filesystem::path linker;
    std::filesystem::path ranlib;
    std::filesystem::path strip;
    std::filesystem::path objcopy;
    std::filesystem::path sysroot;
    std::map<std::string, std::string> env;
};

bool operator==(const ToolchainPaths &a, const ToolchainPaths &b);

struct ToolchainResolution {
    Abi abi = Abi::Arm64V8a;
    int requestedApi = 0;
    int resolvedApi = 0;
    bool clamped = false;
    ToolchainPaths paths;
};

// Pure: safe to call concurrently for different ABIs on one installation.
// Throws ApiLevelOutOfRange (Reject policy) or ToolMissing.
ToolchainResolution resolveToolchain(
    const NdkInstallation &ndk,
    Abi abi,
    int requestedApi,
    ClampPolicy policy = ClampPolicy::Clamp
);

std::vector<ToolchainResolution> resolveToolchains(
    const NdkInstallation &ndk,
    const std::vector<Abi> &abis,
    int requestedApi,
    ClampPolicy policy = ClampPolicy::Clamp
);

} // namespace droidpack::ndk
