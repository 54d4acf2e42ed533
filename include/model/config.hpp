#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "model/manifest.hpp"
#include "ndk/abi.hpp"
#include "ndk/ndk.hpp"

#include <nlohmann/json.hpp>

namespace droidpack::model {

enum class StripConfig {
    // Copy libraries untouched.
    Default,
    // objcopy --strip-debug before packaging.
    Strip,
    // Strip, keep the DWARF beside the staging tree and link it back with a debuglink.
    Split,
};

StripConfig parseStripConfig(const std::string &text);

struct LibrarySpec {
    ndk::Abi abi = ndk::Abi::Arm64V8a;
    std::filesystem::path path;
};

struct KeystoreCredential {
    std::filesystem::path keystore;
    std::string password;
    std::string alias;
};

struct PemCredential {
    std::filesystem::path privateKey;
    std::filesystem::path certificate;
    std::string password;
};

struct SigningConfig {
    std::optional<KeystoreCredential> keystore;
    std::optional<PemCredential> pem;
};

struct ToolchainConfig {
    std::filesystem::path androidSdk;
    std::filesystem::path androidNdk;
    std::string buildTools;
    std::optional<int> platform;
};

struct PackageConfig {
    std::string name;
    ManifestOverrides manifest;
    ToolchainConfig toolchain;
    std::vector<LibrarySpec> libraries;
    std::filesystem::path resources;
    std::filesystem::path assets;
    std::filesystem::path output;
    std::filesystem::path buildDir;
    SigningConfig signing;
    StripConfig strip = StripConfig::Default;
    bool disableCompression = false;
    bool compressNativeLibraries = false;
    std::uint32_t nativeLibraryAlignment = 4;
    ndk::ClampPolicy apiClamp = ndk::ClampPolicy::Clamp;
};

// Reads the "Package" block of a package config. Throws ConfigError on a
// wrong-typed field and InvalidManifest on an unknown component kind.
ManifestOverrides parseManifestOverrides(const nlohmann::json &node);

// Relative paths are resolved against the directory holding the file.
PackageConfig loadPackageConfig(const std::filesystem::path &configFile);
PackageConfig parsePackageConfig(const nlohmann::json &root, const std::filesystem::path &baseDir);

} // namespace droidpack::model
