#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "model/config.hpp"
#include "model/manifest.hpp"
#include "ndk/abi.hpp"
#include "ndk/ndk.hpp"
#include "package/signer.hpp"
#include "package/tools.hpp"
#include "package/zip.hpp"

namespace droidpack::package {

struct LibraryArtifact {
    ndk::Abi abi = ndk::Abi::Arm64V8a;
    std::filesystem::path source;
};

struct PackageOptions {
    // Base name of intermediate files.
    std::string name = "app";
    std::filesystem::path resources;
    std::filesystem::path assets;
    std::filesystem::path output;
    std::filesystem::path stagingDir;
    model::StripConfig strip = model::StripConfig::Default;
    bool disableCompression = false;
    bool compressNativeLibraries = false;
    std::uint32_t nativeLibraryAlignment = 4;
};

enum class BuildState {
    Configured,
    Assembled,
    Signed,
};

const char *buildStateName(BuildState state);

class PackageBuild {
public:
    PackageBuild(model::Manifest manifest, PackageOptions options, const droidpack::Context &ctx);

    // Throws DuplicateLibrary when lib/<abi>/<file name> is already taken and
    // IoError when path does not exist.
    void addLibrary(const std::filesystem::path &path, ndk::Abi abi);

    // Adds path and every DT_NEEDED dependency found in searchPaths that is
    // not a platform library, transitively.
    void addLibraryRecursively(
        const std::filesystem::path &path,
        ndk::Abi abi,
        const std::vector<std::filesystem::path> &searchPaths
    );

    // Every *.so in dir/<abi package dir>, with its dependencies.
    void addRuntimeLibraries(
        const std::filesystem::path &dir,
        ndk::Abi abi,
        const std::vector<std::filesystem::path> &searchPaths
    );

    // objcopy of each ABI's toolchain; needed for the Strip and Split policies.
    void useToolchain(const ndk::ToolchainResolution &toolchain);

    // Manifest, resources, libraries and the unsigned archive. Returns the
    // unsigned archive path. Any package left at the output by an earlier run
    // is removed first, so a failed rebuild leaves no output at all.
    std::filesystem::path assemble(ResourceCompiler &compiler, ToolRunner &runner);

    // Signs into <output>.partial and renames it over the output. The partial
    // file is removed on failure.
    std::filesystem::path sign(Signer &signer);

    std::filesystem::path build(ResourceCompiler &compiler, ToolRunner &runner, Signer &signer);

    BuildState state() const { return state_; }
    const model::Manifest &manifest() const { return manifest_; }
    const PackageOptions &options() const { return options_; }
    const std::vector<LibraryArtifact> &libraries() const { return libraries_; }

    std::filesystem::path apkDir() const;
    std::filesystem::path manifestPath() const;
    std::filesystem::path resourceArchivePath() const;
    std::filesystem::path unsignedApkPath() const;
    std::filesystem::path debugInfoDir() const;
    std::filesystem::path partialOutputPath() const;

private:
    bool hasLibrary(ndk::Abi abi, const std::string &fileName) const;
    void requireState(BuildState expected, const char *operation) const;

    void placeLibraries(ToolRunner &runner) const;
    void placeAbi(ndk::Abi abi, const std::vector<LibraryArtifact> &artifacts, ToolRunner &runner) const;
    void placeLibrary(const LibraryArtifact &artifact, const std::filesystem::path &target, ToolRunner &runner) const;

    model::Manifest manifest_;
    PackageOptions options_;
    const droidpack::Context &ctx_;
    std::vector<LibraryArtifact> libraries_;
    std::map<ndk::Abi, std::filesystem::path> objcopy_;
    BuildState state_ = BuildState::Configured;
};

// Entries kept uncompressed: native libraries (unless asked otherwise),
// resources.arsc, media that is already compressed, or all of them.
bool storesUncompressed(const std::string &entryName, const PackageOptions &options);
std::uint32_t alignmentFor(const std::string &entryName, const PackageOptions &options);

// Archive of every file under apkDir, in byte order of the entry names.
Bytes buildArchive(const std::filesystem::path &apkDir, const PackageOptions &options);

// Resolves SDK, NDK and signer from config and runs the whole pipeline.
// Logs the error and returns false on failure.
bool buildPackage(const droidpack::Context &ctx, const model::PackageConfig &config);

} // namespace droidpack::package
