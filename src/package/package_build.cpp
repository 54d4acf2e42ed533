#include "package/package_build.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <memory>
#include <set>
#include <stdexcept>
#include <system_error>

#include "core/error.hpp"
#include "core/worker_group.hpp"
#include "io/fs_utils.hpp"
#include "ndk/sdk.hpp"
#include "package/elf_deps.hpp"

namespace fs = std::filesystem;

namespace droidpack::package
{
    namespace
    {

        const std::set<std::string> &alreadyCompressedExtensions()
        {
            static const std::set<std::string> extensions = {
                ".jpg", ".jpeg", ".png", ".gif", ".webp",
                ".wav", ".mp2", ".mp3", ".ogg", ".aac", ".flac", ".opus",
                ".mpg", ".mpeg", ".mid", ".midi", ".smf", ".jet", ".rtttl", ".imy", ".xmf",
                ".mp4", ".m4a", ".m4v", ".3gp", ".3gpp", ".3g2", ".3gpp2",
                ".amr", ".awb", ".wma", ".wmv", ".webm", ".mkv",
                ".zip", ".jar", ".apk", ".gz", ".xz", ".bz2",
            };
            return extensions;
        }

        std::string lowerExtension(const std::string &entryName)
        {
            std::string ext = fs::path(entryName).extension().string();
            std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return ext;
        }

        bool isNativeLibraryEntry(const std::string &entryName)
        {
            return entryName.rfind("lib/", 0) == 0 && lowerExtension(entryName) == ".so";
        }

        void requireTool(const fs::path &path)
        {
            std::error_code ec;
            if (path.empty() || !fs::exists(path, ec))
            {
                throw ToolMissing(path);
            }
        }

        void ensureDirOrThrow(const fs::path &path)
        {
            if (!io::ensureDir(path))
            {
                throw IoError(path, "Failed create directory");
            }
        }

        void removeStaleFile(const fs::path &path)
        {
            std::error_code ec;
            if (fs::is_directory(path, ec))
            {
                throw IoError(path, "Package output is a directory");
            }
            fs::remove(path, ec);
            if (ec)
            {
                throw IoError(path, "Failed remove previous package (" + ec.message() + ")");
            }
        }

        fs::path homeDir()
        {
#ifdef _WIN32
            const char *home = std::getenv("USERPROFILE");
#else
            const char *home = std::getenv("HOME");
#endif
            return home != nullptr ? fs::path(home) : fs::path();
        }

    } // namespace

    const char *buildStateName(BuildState state)
    {
        switch (state)
        {
        case BuildState::Configured:
            return "configured";
        case BuildState::Assembled:
            return "assembled";
        case BuildState::Signed:
            return "signed";
        }
        return "unknown";
    }

    bool storesUncompressed(const std::string &entryName, const PackageOptions &options)
    {
        if (options.disableCompression)
        {
            return true;
        }
        if (isNativeLibraryEntry(entryName))
        {
            return !options.compressNativeLibraries;
        }
        if (entryName == "resources.arsc")
        {
            return true;
        }
        return alreadyCompressedExtensions().count(lowerExtension(entryName)) != 0;
    }

    std::uint32_t alignmentFor(const std::string &entryName, const PackageOptions &options)
    {
        if (!storesUncompressed(entryName, options))
        {
            return 0;
        }
        if (isNativeLibraryEntry(entryName))
        {
            return std::max<std::uint32_t>(4, options.nativeLibraryAlignment);
        }
        return 4;
    }

    Bytes buildArchive(const fs::path &apkDir, const PackageOptions &options)
    {
        ZipWriter writer;
        for (const auto &name : io::listFilesSorted(apkDir))
        {
            const Bytes data = io::readBinaryFile(apkDir / fs::path(name));
            if (storesUncompressed(name, options))
            {
                writer.addStored(name, data, alignmentFor(name, options));
            }
            else
            {
                writer.addDeflated(name, data);
            }
        }
        return writer.finish();
    }

    PackageBuild::PackageBuild(model::Manifest manifest, PackageOptions options, const droidpack::Context &ctx)
        : manifest_(std::move(manifest)), options_(std::move(options)), ctx_(ctx)
    {
        if (options_.stagingDir.empty())
        {
            throw ConfigError("package staging directory is empty");
        }
        if (options_.output.empty())
        {
            throw ConfigError("package output path is empty");
        }
        if (options_.nativeLibraryAlignment == 0 || (options_.nativeLibraryAlignment & (options_.nativeLibraryAlignment - 1)) != 0 ||
            options_.nativeLibraryAlignment > kMaxEntryAlignment)
        {
            throw ConfigError("native library alignment must be a power of two up to " +
                              std::to_string(kMaxEntryAlignment));
        }

        // Tools run with their own working directory; hand them absolute paths.
        options_.stagingDir = fs::absolute(options_.stagingDir);
        options_.output = fs::absolute(options_.output);
        if (!options_.resources.empty())
        {
            options_.resources = fs::absolute(options_.resources);
        }
        if (!options_.assets.empty())
        {
            options_.assets = fs::absolute(options_.assets);
        }
    }

    fs::path PackageBuild::apkDir() const
    {
        return options_.stagingDir / "apk";
    }

    fs::path PackageBuild::manifestPath() const
    {
        return options_.stagingDir / "AndroidManifest.xml";
    }

    fs::path PackageBuild::resourceArchivePath() const
    {
        return options_.stagingDir / (options_.name + ".ap_");
    }

    fs::path PackageBuild::unsignedApkPath() const
    {
        return options_.stagingDir / (options_.name + "-unsigned.apk");
    }

    fs::path PackageBuild::debugInfoDir() const
    {
        return options_.stagingDir / "dwarf";
    }

    fs::path PackageBuild::partialOutputPath() const
    {
        fs::path partial = options_.output;
        partial += ".partial";
        return partial;
    }

    void PackageBuild::requireState(BuildState expected, const char *operation) const
    {
        if (state_ != expected)
        {
            throw std::logic_error(std::string(operation) + " needs a " + buildStateName(expected) +
                                   " package, this one is " + buildStateName(state_));
        }
    }

    bool PackageBuild::hasLibrary(ndk::Abi abi, const std::string &fileName) const
    {
        return std::any_of(libraries_.begin(), libraries_.end(), [&](const LibraryArtifact &item)
                           { return item.abi == abi && item.source.filename().string() == fileName; });
    }

    void PackageBuild::addLibrary(const fs::path &path, ndk::Abi abi)
    {
        requireState(BuildState::Configured, "addLibrary");

        const std::string fileName = path.filename().string();
        if (hasLibrary(abi, fileName))
        {
            throw DuplicateLibrary(ndk::packageDirFor(abi), fileName);
        }

        std::error_code ec;
        if (!fs::is_regular_file(path, ec))
        {
            throw IoError(path, "Library not found");
        }

        ctx_.log("Add lib/", ndk::packageDirFor(abi), "/", fileName, " <- ", path.string());
        libraries_.push_back({abi, path});
    }

    void PackageBuild::addLibraryRecursively(const fs::path &path, ndk::Abi abi, const std::vector<fs::path> &searchPaths)
    {
        addLibrary(path, abi);

        for (const auto &needed : readNeededLibraries(path))
        {
            if (ndk::isSystemLibrary(needed) || hasLibrary(abi, needed))
            {
                continue;
            }

            bool found = false;
            for (const auto &dir : searchPaths)
            {
                const fs::path candidate = dir / needed;
                std::error_code ec;
                if (fs::is_regular_file(candidate, ec))
                {
                    addLibraryRecursively(candidate, abi, searchPaths);
                    found = true;
                    break;
                }
            }
            if (!found)
            {
                ctx_.warn("Library ", needed, " needed by ", path.filename().string(),
                          " not found in search paths, expecting it on the device");
            }
        }
    }

    void PackageBuild::addRuntimeLibraries(const fs::path &dir, ndk::Abi abi, const std::vector<fs::path> &searchPaths)
    {
        const fs::path abiDir = dir / ndk::packageDirFor(abi);
        std::error_code ec;
        if (!fs::is_directory(abiDir, ec))
        {
            throw IoError(abiDir, "Runtime library directory not found");
        }

        std::vector<fs::path> found;
        for (const auto &entry : fs::directory_iterator(abiDir, ec))
        {
            if (entry.is_regular_file(ec) && entry.path().extension() == ".so")
            {
                found.push_back(entry.path());
            }
        }
        if (ec)
        {
            throw IoError(abiDir, "Failed list runtime libraries");
        }

        std::sort(found.begin(), found.end());
        for (const auto &path : found)
        {
            if (!hasLibrary(abi, path.filename().string()))
            {
                addLibraryRecursively(path, abi, searchPaths);
            }
        }
    }

    void PackageBuild::useToolchain(const ndk::ToolchainResolution &toolchain)
    {
        objcopy_[toolchain.abi] = toolchain.paths.objcopy;
    }

    void PackageBuild::placeLibrary(const LibraryArtifact &artifact, const fs::path &target, ToolRunner &runner) const
    {
        if (options_.strip == model::StripConfig::Default)
        {
            std::error_code ec;
            fs::copy_file(artifact.source, target, fs::copy_options::overwrite_existing, ec);
            if (ec)
            {
                throw IoError(artifact.source, "Failed copy library (" + ec.message() + ")");
            }
            return;
        }

        const auto it = objcopy_.find(artifact.abi);
        const fs::path objcopy = it == objcopy_.end() ? fs::path() : it->second;
        requireTool(objcopy);

        requireSuccess(runner.run(objcopy.string(), {"--strip-debug", artifact.source.string(), target.string()}, {}));

        if (options_.strip == model::StripConfig::Split)
        {
            const fs::path dwarfDir = debugInfoDir() / ndk::packageDirFor(artifact.abi);
            ensureDirOrThrow(dwarfDir);
            fs::path dwarf = dwarfDir / artifact.source.filename();
            dwarf.replace_extension(".dwarf");

            requireSuccess(runner.run(objcopy.string(), {"--only-keep-debug", artifact.source.string(), dwarf.string()}, {}));
            requireSuccess(runner.run(objcopy.string(), {"--add-gnu-debuglink=" + dwarf.string(), target.string()}, {}));
        }
    }

    void PackageBuild::placeAbi(ndk::Abi abi, const std::vector<LibraryArtifact> &artifacts, ToolRunner &runner) const
    {
        const fs::path libDir = apkDir() / "lib" / ndk::packageDirFor(abi);
        ensureDirOrThrow(libDir);

        for (const auto &artifact : artifacts)
        {
            const fs::path target = libDir / artifact.source.filename();
            std::error_code ec;
            if (fs::exists(target, ec))
            {
                throw DuplicateLibrary(ndk::packageDirFor(abi), artifact.source.filename().string());
            }
            placeLibrary(artifact, target, runner);
        }
    }

    void PackageBuild::placeLibraries(ToolRunner &runner) const
    {
        std::map<ndk::Abi, std::vector<LibraryArtifact>> byAbi;
        for (const auto &artifact : libraries_)
        {
            byAbi[artifact.abi].push_back(artifact);
        }

        std::vector<std::exception_ptr> failures(byAbi.size());
        WorkerGroup workers;
        std::size_t slot = 0;
        for (const auto &group : byAbi)
        {
            const ndk::Abi abi = group.first;
            const std::vector<LibraryArtifact> *artifacts = &group.second;
            std::exception_ptr *failure = &failures[slot++];
            workers.spawn([this, abi, artifacts, failure, &runner]()
                          {
                              try
                              {
                                  placeAbi(abi, *artifacts, runner);
                              }
                              catch (...)
                              {
                                  *failure = std::current_exception();
                              } });
        }

        workers.joinAll();
        for (const auto &failure : failures)
        {
            if (failure)
            {
                std::rethrow_exception(failure);
            }
        }
    }

    fs::path PackageBuild::assemble(ResourceCompiler &compiler, ToolRunner &runner)
    {
        requireState(BuildState::Configured, "assemble");

        ensureDirOrThrow(options_.stagingDir);
        // A package from an earlier run must not outlive a failed rebuild.
        removeStaleFile(options_.output);
        removeStaleFile(partialOutputPath());
        // Stale files from an earlier run would end up in the archive.
        io::removePath(apkDir(), ctx_);
        io::removePath(debugInfoDir(), ctx_);
        io::removePath(resourceArchivePath(), ctx_);
        ensureDirOrThrow(apkDir());

        ctx_.log("Write ", manifestPath().string());
        io::writeTextFile(manifestPath(), model::toXml(manifest_));

        std::optional<fs::path> resDir;
        std::optional<fs::path> assetsDir;
        std::error_code ec;
        if (!options_.resources.empty())
        {
            if (!fs::is_directory(options_.resources, ec))
            {
                throw IoError(options_.resources, "Resource directory not found");
            }
            resDir = options_.resources;
        }
        if (!options_.assets.empty())
        {
            if (!fs::is_directory(options_.assets, ec))
            {
                throw IoError(options_.assets, "Assets directory not found");
            }
            assetsDir = options_.assets;
        }

        compiler.compile(manifestPath(), resDir, assetsDir, resourceArchivePath());
        ZipReader::open(resourceArchivePath()).extractTo(apkDir());

        placeLibraries(runner);

        ctx_.log("Write ", unsignedApkPath().string());
        io::writeBinaryFile(unsignedApkPath(), buildArchive(apkDir(), options_));

        state_ = BuildState::Assembled;
        return unsignedApkPath();
    }

    fs::path PackageBuild::sign(Signer &signer)
    {
        requireState(BuildState::Assembled, "sign");

        const fs::path partial = partialOutputPath();
        if (!options_.output.parent_path().empty())
        {
            ensureDirOrThrow(options_.output.parent_path());
        }

        try
        {
            signer.sign(unsignedApkPath(), partial);

            std::error_code ec;
            if (!fs::is_regular_file(partial, ec))
            {
                throw SigningError("signer produced no output at " + partial.string());
            }
            fs::rename(partial, options_.output, ec);
            if (ec)
            {
                throw IoError(options_.output, "Failed move signed package into place (" + ec.message() + ")");
            }
        }
        catch (...)
        {
            io::removePath(partial, ctx_);
            throw;
        }

        state_ = BuildState::Signed;
        ctx_.log("Package ready: ", options_.output.string());
        return options_.output;
    }

    fs::path PackageBuild::build(ResourceCompiler &compiler, ToolRunner &runner, Signer &signer)
    {
        assemble(compiler, runner);
        return sign(signer);
    }

    namespace
    {

        struct ResolvedSdk
        {
            ndk::SdkInstallation sdk;
            fs::path androidJar;
        };

        ResolvedSdk resolveSdk(const droidpack::Context &ctx, const model::PackageConfig &config, int targetSdk)
        {
            fs::path root = config.toolchain.androidSdk;
            if (root.empty())
            {
                const auto located = ndk::locateSdk(ctx);
                if (!located.has_value())
                {
                    throw InvalidInstallation(root, "no Android SDK configured (set ANDROID_SDK_ROOT or Toolchain.AndroidSdk)");
                }
                root = located.value();
            }
            ndk::SdkInstallation sdk = ndk::validateSdk(root, config.toolchain.buildTools);

            if (config.toolchain.platform.has_value())
            {
                const fs::path jar = sdk.androidJar(config.toolchain.platform.value());
                return {sdk, jar};
            }

            try
            {
                const fs::path jar = sdk.androidJar(targetSdk);
                return {sdk, jar};
            }
            catch (const ToolMissing &)
            {
                const auto highest = sdk.highestPlatform();
                if (!highest.has_value())
                {
                    throw;
                }
                ctx.warn("Platform android-", targetSdk, " is not installed, compiling against android-", highest.value());
                const fs::path jar = sdk.androidJar(highest.value());
                return {sdk, jar};
            }
        }

        std::optional<ndk::NdkInstallation> resolveNdk(const droidpack::Context &ctx, const model::PackageConfig &config)
        {
            if (config.libraries.empty())
            {
                return std::nullopt;
            }

            fs::path root = config.toolchain.androidNdk;
            if (root.empty())
            {
                const auto located = ndk::locateNdk(ctx);
                if (!located.has_value())
                {
                    throw InvalidInstallation(root, "no Android NDK configured (set ANDROID_NDK_ROOT or Toolchain.AndroidNdk)");
                }
                root = located.value();
            }
            ndk::NdkInstallation installation = ndk::validateNdk(root);
            ctx.log("NDK ", installation.version().toString(), " at ", installation.root().string());
            return installation;
        }

        std::unique_ptr<Signer> makeSigner(
            const droidpack::Context &ctx,
            const model::PackageConfig &config,
            const ndk::SdkInstallation &sdk,
            const model::Manifest &manifest,
            ToolRunner &runner)
        {
            if (config.signing.pem.has_value())
            {
                return std::make_unique<ApkSchemeSigner>(config.signing.pem.value(), manifest.minSdk(), ctx);
            }
            if (config.signing.keystore.has_value())
            {
                return std::make_unique<ApkSignerTool>(runner, sdk.buildTool("apksigner"), config.signing.keystore.value());
            }

            // Per-user debug keystore, as the SDK build plugins use.
            const fs::path debugKeystore = homeDir() / ".android" / "debug.keystore";
            std::error_code ec;
            if (!fs::is_regular_file(debugKeystore, ec))
            {
                throw SigningError("no signing credential configured and no " + debugKeystore.string());
            }
            ctx.warn("No signing credential configured, using debug keystore ", debugKeystore.string());
            model::KeystoreCredential debug;
            debug.keystore = debugKeystore;
            debug.password = "android";
            debug.alias = "androiddebugkey";
            return std::make_unique<ApkSignerTool>(runner, sdk.buildTool("apksigner"), debug);
        }

        std::vector<fs::path> librarySearchPaths(
            const fs::path &library,
            const std::optional<ndk::NdkInstallation> &installation,
            ndk::Abi abi)
        {
            std::vector<fs::path> paths = {library.parent_path()};
            if (installation.has_value())
            {
                // libc++_shared.so and friends.
                paths.push_back(installation->sysroot() / "usr" / "lib" / ndk::tripleFor(abi));
            }
            return paths;
        }

        fs::path runPipeline(const droidpack::Context &ctx, const model::PackageConfig &config)
        {
            if (!config.manifest.package.has_value())
            {
                throw ConfigError("Package.Id is required");
            }
            const model::Manifest manifest = model::merge(model::defaultFor(config.manifest.package.value()), config.manifest);

            const std::optional<ndk::NdkInstallation> installation = resolveNdk(ctx, config);
            std::vector<ndk::ToolchainResolution> toolchains;
            if (installation.has_value())
            {
                std::vector<ndk::Abi> abis;
                for (const auto &lib : config.libraries)
                {
                    if (std::find(abis.begin(), abis.end(), lib.abi) == abis.end())
                    {
                        abis.push_back(lib.abi);
                    }
                }
                toolchains = ndk::resolveToolchains(installation.value(), abis, manifest.minSdk(), config.apiClamp);
                for (const auto &tc : toolchains)
                {
                    if (tc.clamped)
                    {
                        ctx.warn("API level ", tc.requestedApi, " clamped to ", tc.resolvedApi, " for ",
                                 ndk::packageDirFor(tc.abi));
                    }
                }
            }

            const ResolvedSdk sdk = resolveSdk(ctx, config, manifest.targetSdk());

            PackageOptions options;
            options.name = config.name;
            options.resources = config.resources;
            options.assets = config.assets;
            options.output = config.output;
            options.stagingDir = config.buildDir / "apk-staging";
            options.strip = config.strip;
            options.disableCompression = config.disableCompression;
            options.compressNativeLibraries = config.compressNativeLibraries;
            options.nativeLibraryAlignment = config.nativeLibraryAlignment;

            PackageBuild build(manifest, options, ctx);
            for (const auto &tc : toolchains)
            {
                build.useToolchain(tc);
            }
            for (const auto &lib : config.libraries)
            {
                if (build.libraries().end() !=
                    std::find_if(build.libraries().begin(), build.libraries().end(), [&](const LibraryArtifact &item)
                                 { return item.abi == lib.abi && item.source == lib.path; }))
                {
                    // Already pulled in as a dependency of an earlier entry.
                    continue;
                }
                build.addLibraryRecursively(lib.path, lib.abi, librarySearchPaths(lib.path, installation, lib.abi));
            }

            ProcessToolRunner runner(ctx);
            AaptResourceCompiler compiler(runner, sdk.sdk.buildTool("aapt"), sdk.androidJar, config.disableCompression);
            std::unique_ptr<Signer> signer = makeSigner(ctx, config, sdk.sdk, manifest, runner);
            return build.build(compiler, runner, *signer);
        }

    } // namespace

    bool buildPackage(const droidpack::Context &ctx, const model::PackageConfig &config)
    {
        try
        {
            runPipeline(ctx, config);
            return true;
        }
        catch (const Error &e)
        {
            ctx.error(errorKindName(e.kind()), ": ", e.what());
        }
        catch (const std::exception &e)
        {
            ctx.error(e.what());
        }
        return false;
    }

} // namespace droidpack::package
