#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "core/context.hpp"
#include "core/error.hpp"
#include "core/worker_group.hpp"
#include "elf_fixture.hpp"
#include "model/manifest.hpp"
#include "package/package_build.hpp"
#include "package/zip.hpp"

namespace fs = std::filesystem;
using droidpack::model::StripConfig;
using droidpack::ndk::Abi;
using droidpack::package::Bytes;
using droidpack::package::PackageBuild;
using droidpack::package::PackageOptions;

namespace
{

    droidpack::Context makeContext()
    {
        return droidpack::Context(false);
    }

    fs::path makeTempRoot(const std::string &name)
    {
        const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        return fs::temp_directory_path() / ("droidpack_package_test_" + name + "_" + std::to_string(now));
    }

    void cleanupTemp(const fs::path &root)
    {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void writeText(const fs::path &path, const std::string &text)
    {
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << text;
    }

    std::string readText(const fs::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    Bytes textBytes(const std::string &text)
    {
        return Bytes(text.begin(), text.end());
    }

    struct RecordedCall
    {
        std::string command;
        std::vector<std::string> args;
        fs::path cwd;
    };

    // Placement runs one worker per ABI, so calls arrive concurrently.
    class FakeToolRunner : public droidpack::package::ToolRunner
    {
    public:
        droidpack::io::ProcessResult run(
            const std::string &command,
            const std::vector<std::string> &args,
            const fs::path &cwd) override
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                calls_.push_back({command, args, cwd});
            }

            droidpack::io::ProcessResult result;
            result.commandLine = droidpack::io::displayCommand(command, args);
            if (failCode != 0)
            {
                result.code = failCode;
                result.output = failOutput;
                return result;
            }
            result.code = 0;
            // objcopy <flag> <in> <out>: produce the output file.
            if (args.size() == 3)
            {
                std::error_code ec;
                fs::copy_file(args[1], args[2], fs::copy_options::overwrite_existing, ec);
                result.code = ec ? 1 : 0;
            }
            return result;
        }

        std::vector<RecordedCall> calls() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return calls_;
        }

        int failCode = 0;
        std::string failOutput;

    private:
        mutable std::mutex mutex_;
        std::vector<RecordedCall> calls_;
    };

    class FakeResourceCompiler : public droidpack::package::ResourceCompiler
    {
    public:
        void compile(
            const fs::path &manifest,
            const std::optional<fs::path> &,
            const std::optional<fs::path> &,
            const fs::path &outArchive) override
        {
            ++calls;
            droidpack::package::ZipWriter writer;
            writer.addDeflated("AndroidManifest.xml", textBytes(readText(manifest)));
            writer.addStored("resources.arsc", textBytes("arsc-table"));
            writer.addDeflated("res/layout/main.xml", textBytes("<LinearLayout/>"));
            std::ofstream out(outArchive, std::ios::binary | std::ios::trunc);
            const Bytes archive = writer.finish();
            out.write(reinterpret_cast<const char *>(archive.data()), static_cast<std::streamsize>(archive.size()));
        }

        int calls = 0;
    };

    class RejectingResourceCompiler : public droidpack::package::ResourceCompiler
    {
    public:
        void compile(
            const fs::path &,
            const std::optional<fs::path> &,
            const std::optional<fs::path> &,
            const fs::path &) override
        {
            throw droidpack::ProcessFailed("aapt package -f", 1, "ERROR: resource 'drawable/icon' not found");
        }
    };

    class CopySigner : public droidpack::package::Signer
    {
    public:
        void sign(const fs::path &unsignedApk, const fs::path &outApk) override
        {
            fs::copy_file(unsignedApk, outApk, fs::copy_options::overwrite_existing);
        }
    };

    // Leaves a half-written file behind before failing.
    class FailingSigner : public droidpack::package::Signer
    {
    public:
        void sign(const fs::path &, const fs::path &outApk) override
        {
            writeText(outApk, "partial");
            throw droidpack::SigningError("key rejected");
        }
    };

    PackageOptions makeOptions(const fs::path &root)
    {
        PackageOptions options;
        options.name = "game";
        options.stagingDir = root / "staging";
        options.output = root / "out" / "game.apk";
        return options;
    }

    droidpack::model::Manifest makeManifest()
    {
        return droidpack::model::defaultFor("com.example.game");
    }

} // namespace

TEST(PackageBuild, DuplicateLibraryRejectedBeforeAnyToolRuns)
{
    const fs::path root = makeTempRoot("duplicate");
    writeText(root / "a" / "libfoo.so", "first");
    writeText(root / "b" / "libfoo.so", "second");
    auto ctx = makeContext();
    FakeToolRunner runner;

    PackageBuild build(makeManifest(), makeOptions(root), ctx);
    build.addLibrary(root / "a" / "libfoo.so", Abi::X86_64);
    build.addLibrary(root / "a" / "libfoo.so", Abi::Arm64V8a);

    try
    {
        build.addLibrary(root / "b" / "libfoo.so", Abi::X86_64);
        FAIL() << "second libfoo.so for x86_64 was accepted";
    }
    catch (const droidpack::DuplicateLibrary &e)
    {
        EXPECT_EQ(e.kind(), droidpack::ErrorKind::DuplicateLibrary);
        EXPECT_NE(std::string(e.what()).find("x86_64"), std::string::npos);
    }
    EXPECT_TRUE(runner.calls().empty());
    EXPECT_EQ(build.libraries().size(), 2U);

    cleanupTemp(root);
}

TEST(PackageBuild, MissingLibraryThrowsIoError)
{
    const fs::path root = makeTempRoot("missing");
    auto ctx = makeContext();
    PackageBuild build(makeManifest(), makeOptions(root), ctx);
    EXPECT_THROW(build.addLibrary(root / "nowhere" / "libgame.so", Abi::Arm64V8a), droidpack::IoError);
    cleanupTemp(root);
}

TEST(PackageBuild, RejectsIncompleteOptions)
{
    auto ctx = makeContext();
    PackageOptions noStaging;
    noStaging.output = "/tmp/game.apk";
    EXPECT_THROW(PackageBuild build(makeManifest(), noStaging, ctx), droidpack::ConfigError);

    PackageOptions badAlignment = makeOptions("/tmp/droidpack_never_created");
    badAlignment.nativeLibraryAlignment = 12;
    EXPECT_THROW(PackageBuild build(makeManifest(), badAlignment, ctx), droidpack::ConfigError);
    badAlignment.nativeLibraryAlignment = 65536;
    EXPECT_THROW(PackageBuild build(makeManifest(), badAlignment, ctx), droidpack::ConfigError);
}

TEST(PackageBuild, AssembleAndSignLifecycle)
{
    const fs::path root = makeTempRoot("lifecycle");
    writeText(root / "libs" / "libgame.so", "arm64 code");
    writeText(root / "libs64" / "libgame.so", "x86_64 code");
    auto ctx = makeContext();
    FakeToolRunner runner;
    FakeResourceCompiler compiler;
    CopySigner signer;

    PackageBuild build(makeManifest(), makeOptions(root), ctx);
    build.addLibrary(root / "libs" / "libgame.so", Abi::Arm64V8a);
    build.addLibrary(root / "libs64" / "libgame.so", Abi::X86_64);
    EXPECT_EQ(build.state(), droidpack::package::BuildState::Configured);
    EXPECT_THROW(build.sign(signer), std::logic_error);

    const fs::path unsignedApk = build.assemble(compiler, runner);
    EXPECT_EQ(build.state(), droidpack::package::BuildState::Assembled);
    EXPECT_EQ(compiler.calls, 1);
    EXPECT_TRUE(runner.calls().empty());
    EXPECT_THROW(build.addLibrary(root / "libs" / "libgame.so", Abi::X86), std::logic_error);

    const auto reader = droidpack::package::ZipReader::open(unsignedApk);
    ASSERT_EQ(reader.entries().size(), 5U);
    // Entries sorted bytewise.
    EXPECT_EQ(reader.entries()[0].name, "AndroidManifest.xml");
    EXPECT_EQ(reader.entries()[1].name, "lib/arm64-v8a/libgame.so");
    EXPECT_EQ(reader.entries()[2].name, "lib/x86_64/libgame.so");
    EXPECT_EQ(reader.entries()[3].name, "res/layout/main.xml");
    EXPECT_EQ(reader.entries()[4].name, "resources.arsc");

    const auto *arm = reader.find("lib/arm64-v8a/libgame.so");
    EXPECT_EQ(arm->method, droidpack::package::kZipStored);
    EXPECT_EQ(arm->dataOffset % 4, 0U);
    EXPECT_EQ(reader.read(*arm), textBytes("arm64 code"));
    EXPECT_EQ(reader.find("resources.arsc")->method, droidpack::package::kZipStored);
    EXPECT_EQ(reader.find("AndroidManifest.xml")->method, droidpack::package::kZipDeflated);

    const fs::path output = build.sign(signer);
    EXPECT_EQ(output, root / "out" / "game.apk");
    EXPECT_EQ(build.state(), droidpack::package::BuildState::Signed);
    EXPECT_TRUE(fs::exists(output));
    EXPECT_FALSE(fs::exists(build.partialOutputPath()));

    cleanupTemp(root);
}

TEST(PackageBuild, RerunProducesIdenticalArchive)
{
    const fs::path root = makeTempRoot("rerun");
    writeText(root / "libs" / "libgame.so", "arm64 code");
    writeText(root / "assets" / "level1.txt", "level");
    auto ctx = makeContext();
    FakeToolRunner runner;
    FakeResourceCompiler compiler;

    PackageOptions options = makeOptions(root);
    options.assets = root / "assets";

    std::vector<std::string> archives;
    for (int run = 0; run < 2; ++run)
    {
        PackageBuild build(makeManifest(), options, ctx);
        build.addLibrary(root / "libs" / "libgame.so", Abi::Arm64V8a);
        archives.push_back(readText(build.assemble(compiler, runner)));
    }
    EXPECT_FALSE(archives[0].empty());
    EXPECT_EQ(archives[0], archives[1]);

    cleanupTemp(root);
}

TEST(PackageBuild, SigningFailureLeavesNoOutput)
{
    const fs::path root = makeTempRoot("signfail");
    auto ctx = makeContext();
    FakeToolRunner runner;
    FakeResourceCompiler compiler;
    FailingSigner signer;

    PackageBuild build(makeManifest(), makeOptions(root), ctx);
    build.assemble(compiler, runner);
    EXPECT_THROW(build.sign(signer), droidpack::SigningError);

    EXPECT_FALSE(fs::exists(root / "out" / "game.apk"));
    EXPECT_FALSE(fs::exists(build.partialOutputPath()));
    EXPECT_EQ(build.state(), droidpack::package::BuildState::Assembled);

    cleanupTemp(root);
}

TEST(PackageBuild, StripPoliciesDriveObjcopy)
{
    const fs::path root = makeTempRoot("strip");
    writeText(root / "libs" / "libgame.so", "code+debug");
    writeText(root / "ndk" / "llvm-objcopy", "");
    auto ctx = makeContext();
    FakeResourceCompiler compiler;

    droidpack::ndk::ToolchainResolution toolchain;
    toolchain.abi = Abi::Arm64V8a;
    toolchain.paths.objcopy = root / "ndk" / "llvm-objcopy";

    {
        PackageOptions options = makeOptions(root);
        options.strip = StripConfig::Strip;
        FakeToolRunner runner;
        PackageBuild build(makeManifest(), options, ctx);
        build.useToolchain(toolchain);
        build.addLibrary(root / "libs" / "libgame.so", Abi::Arm64V8a);
        build.assemble(compiler, runner);

        const auto calls = runner.calls();
        ASSERT_EQ(calls.size(), 1U);
        EXPECT_EQ(calls[0].command, toolchain.paths.objcopy.string());
        EXPECT_EQ(calls[0].args[0], "--strip-debug");
        EXPECT_EQ(calls[0].args[2], (build.apkDir() / "lib" / "arm64-v8a" / "libgame.so").string());
    }

    {
        PackageOptions options = makeOptions(root);
        options.strip = StripConfig::Split;
        FakeToolRunner runner;
        PackageBuild build(makeManifest(), options, ctx);
        build.useToolchain(toolchain);
        build.addLibrary(root / "libs" / "libgame.so", Abi::Arm64V8a);
        build.assemble(compiler, runner);

        const auto calls = runner.calls();
        ASSERT_EQ(calls.size(), 3U);
        const fs::path dwarf = build.debugInfoDir() / "arm64-v8a" / "libgame.dwarf";
        EXPECT_EQ(calls[1].args[0], "--only-keep-debug");
        EXPECT_EQ(calls[1].args[2], dwarf.string());
        EXPECT_EQ(calls[2].args[0], "--add-gnu-debuglink=" + dwarf.string());
        EXPECT_TRUE(fs::exists(dwarf));
    }

    cleanupTemp(root);
}

TEST(PackageBuild, StripWithoutToolchainThrowsToolMissing)
{
    const fs::path root = makeTempRoot("notool");
    writeText(root / "libs" / "libgame.so", "code");
    auto ctx = makeContext();
    FakeToolRunner runner;
    FakeResourceCompiler compiler;

    PackageOptions options = makeOptions(root);
    options.strip = StripConfig::Strip;
    PackageBuild build(makeManifest(), options, ctx);
    build.addLibrary(root / "libs" / "libgame.so", Abi::X86);
    EXPECT_THROW(build.assemble(compiler, runner), droidpack::ToolMissing);
    EXPECT_EQ(build.state(), droidpack::package::BuildState::Configured);

    cleanupTemp(root);
}

TEST(PackageBuild, RuntimeLibrariesComeFromAbiDirectory)
{
    const fs::path root = makeTempRoot("runtime");
    auto ctx = makeContext();
    PackageBuild build(makeManifest(), makeOptions(root), ctx);

    EXPECT_THROW(build.addRuntimeLibraries(root / "runtime", Abi::ArmV7a, {}), droidpack::IoError);

    writeText(root / "runtime" / "armeabi-v7a" / "notes.txt", "skip");
    fs::create_directories(root / "runtime" / "armeabi-v7a");
    build.addRuntimeLibraries(root / "runtime", Abi::ArmV7a, {});
    EXPECT_TRUE(build.libraries().empty());

    cleanupTemp(root);
}

TEST(PackageCompression, EntryPolicy)
{
    PackageOptions options;
    EXPECT_TRUE(droidpack::package::storesUncompressed("lib/arm64-v8a/libgame.so", options));
    EXPECT_TRUE(droidpack::package::storesUncompressed("resources.arsc", options));
    EXPECT_TRUE(droidpack::package::storesUncompressed("assets/music.OGG", options));
    EXPECT_TRUE(droidpack::package::storesUncompressed("res/drawable/icon.png", options));
    EXPECT_FALSE(droidpack::package::storesUncompressed("AndroidManifest.xml", options));
    EXPECT_FALSE(droidpack::package::storesUncompressed("assets/libnotnative.so", options));

    EXPECT_EQ(droidpack::package::alignmentFor("AndroidManifest.xml", options), 0U);
    EXPECT_EQ(droidpack::package::alignmentFor("res/drawable/icon.png", options), 4U);
    EXPECT_EQ(droidpack::package::alignmentFor("lib/x86/libgame.so", options), 4U);

    options.nativeLibraryAlignment = 16384;
    EXPECT_EQ(droidpack::package::alignmentFor("lib/x86/libgame.so", options), 16384U);

    options.compressNativeLibraries = true;
    EXPECT_FALSE(droidpack::package::storesUncompressed("lib/x86/libgame.so", options));

    options.disableCompression = true;
    EXPECT_TRUE(droidpack::package::storesUncompressed("AndroidManifest.xml", options));
    EXPECT_TRUE(droidpack::package::storesUncompressed("lib/x86/libgame.so", options));
}

TEST(PackagePipeline, MissingPackageIdFails)
{
    const fs::path root = makeTempRoot("pipeline");
    auto ctx = makeContext();
    droidpack::model::PackageConfig config;
    config.name = "game";
    config.buildDir = root / "build";
    config.output = root / "build" / "game.apk";

    EXPECT_FALSE(droidpack::package::buildPackage(ctx, config));
    EXPECT_FALSE(fs::exists(config.output));

    cleanupTemp(root);
}

TEST(PackageBuild, RelativePathsBecomeAbsolute)
{
    auto ctx = makeContext();
    PackageOptions options;
    options.stagingDir = fs::path("build") / "apk-staging";
    options.output = fs::path("build") / "game.apk";
    options.resources = "res";

    PackageBuild build(makeManifest(), options, ctx);
    EXPECT_TRUE(build.options().stagingDir.is_absolute());
    EXPECT_TRUE(build.options().output.is_absolute());
    EXPECT_TRUE(build.options().resources.is_absolute());
    EXPECT_TRUE(build.options().assets.empty());
    EXPECT_EQ(build.manifestPath(), fs::current_path() / "build" / "apk-staging" / "AndroidManifest.xml");
}

TEST(AaptResourceCompiler, ArgumentsAndWorkingDirectory)
{
    FakeToolRunner runner;
    droidpack::package::AaptResourceCompiler aapt(runner, "/sdk/build-tools/34.0.0/aapt", "/sdk/platforms/android-34/android.jar");

    const std::vector<std::string> expected = {
        "package", "-f",
        "-F", "/stage/game.ap_",
        "-M", "/stage/AndroidManifest.xml",
        "-I", "/sdk/platforms/android-34/android.jar",
        "-S", "/project/res",
        "-A", "/project/assets"};
    EXPECT_EQ(aapt.arguments("/stage/AndroidManifest.xml", fs::path("/project/res"), fs::path("/project/assets"),
                             "/stage/game.ap_"),
              expected);

    aapt.compile("/stage/AndroidManifest.xml", std::nullopt, std::nullopt, "/stage/game.ap_");
    const auto calls = runner.calls();
    ASSERT_EQ(calls.size(), 1U);
    EXPECT_EQ(calls[0].command, "/sdk/build-tools/34.0.0/aapt");
    EXPECT_TRUE(calls[0].cwd.empty());
    EXPECT_EQ(std::find(calls[0].args.begin(), calls[0].args.end(), "-S"), calls[0].args.end());

    droidpack::package::AaptResourceCompiler stored(runner, "aapt", "android.jar", true);
    const auto storedArgs = stored.arguments("AndroidManifest.xml", std::nullopt, std::nullopt, "out.ap_");
    const auto flag = std::find(storedArgs.begin(), storedArgs.end(), "-0");
    ASSERT_NE(flag, storedArgs.end());
    ASSERT_NE(flag + 1, storedArgs.end());
    EXPECT_EQ(*(flag + 1), "");
}

TEST(AaptResourceCompiler, FailureKeepsCommandAndOutput)
{
    FakeToolRunner runner;
    runner.failCode = 1;
    runner.failOutput = "ERROR: Unable to open manifest";
    droidpack::package::AaptResourceCompiler aapt(runner, "aapt", "/sdk/android.jar");

    try
    {
        aapt.compile("/stage/AndroidManifest.xml", std::nullopt, std::nullopt, "/stage/game.ap_");
        FAIL() << "aapt exit 1 was accepted";
    }
    catch (const droidpack::ProcessFailed &e)
    {
        EXPECT_EQ(e.code(), 1);
        EXPECT_EQ(e.commandLine(), "aapt package -f -F /stage/game.ap_ -M /stage/AndroidManifest.xml -I /sdk/android.jar");
        EXPECT_EQ(e.output(), "ERROR: Unable to open manifest");
        EXPECT_NE(std::string(e.what()).find(e.commandLine()), std::string::npos);
    }

    droidpack::io::ProcessResult ok;
    ok.code = 0;
    EXPECT_NO_THROW(droidpack::package::requireSuccess(ok));
}

TEST(PackageBuild, ResourceFailureStopsBeforePlacementAndClearsOldOutput)
{
    const fs::path root = makeTempRoot("resfail");
    writeText(root / "libs" / "libgame.so", "code");
    auto ctx = makeContext();
    FakeToolRunner runner;
    RejectingResourceCompiler compiler;

    PackageOptions options = makeOptions(root);
    options.strip = StripConfig::Strip;
    writeText(options.output, "apk from an earlier run");

    droidpack::ndk::ToolchainResolution toolchain;
    toolchain.abi = Abi::Arm64V8a;
    toolchain.paths.objcopy = root / "libs" / "libgame.so";

    PackageBuild build(makeManifest(), options, ctx);
    build.useToolchain(toolchain);
    build.addLibrary(root / "libs" / "libgame.so", Abi::Arm64V8a);
    EXPECT_THROW(build.assemble(compiler, runner), droidpack::ProcessFailed);

    EXPECT_TRUE(runner.calls().empty());
    EXPECT_FALSE(fs::exists(build.apkDir() / "lib"));
    EXPECT_FALSE(fs::exists(build.unsignedApkPath()));
    EXPECT_FALSE(fs::exists(options.output));
    EXPECT_EQ(build.state(), droidpack::package::BuildState::Configured);

    cleanupTemp(root);
}

TEST(PackageBuild, RecursiveLibrariesFollowNeededEntries)
{
    const fs::path root = makeTempRoot("recursive");
    using droidpack_test::makeSharedObject;
    using droidpack_test::writeImage;
    writeImage(root / "app" / "libgame.so", makeSharedObject(true, {"libc.so", "libengine.so", "liblog.so", "libnet.so"}));
    writeImage(root / "app" / "libengine.so", makeSharedObject(true, {"libc++_shared.so", "libm.so"}));
    writeImage(root / "app" / "libnet.so", makeSharedObject(true, {"libengine.so", "libssl_missing.so"}));
    writeImage(root / "sysroot" / "libc++_shared.so", makeSharedObject(true, {"libc.so"}));
    // Platform libraries are never packaged, even when a copy sits on the search path.
    writeImage(root / "sysroot" / "libc.so", makeSharedObject(true, {}));

    auto ctx = makeContext();
    PackageBuild build(makeManifest(), makeOptions(root), ctx);
    build.addLibraryRecursively(root / "app" / "libgame.so", Abi::Arm64V8a, {root / "app", root / "sysroot"});

    std::vector<std::string> names;
    for (const auto &lib : build.libraries())
    {
        EXPECT_EQ(lib.abi, Abi::Arm64V8a);
        names.push_back(lib.source.filename().string());
    }
    const std::vector<std::string> expected = {"libgame.so", "libengine.so", "libc++_shared.so", "libnet.so"};
    EXPECT_EQ(names, expected);

    // The same tree for another ABI is independent.
    build.addLibraryRecursively(root / "app" / "libengine.so", Abi::X86_64, {root / "sysroot"});
    EXPECT_EQ(build.libraries().size(), 6U);

    EXPECT_THROW(build.addLibraryRecursively(root / "app" / "libgame.so", Abi::Arm64V8a, {}),
                 droidpack::DuplicateLibrary);

    cleanupTemp(root);
}

TEST(WorkerGroup, JoinsStartedWorkersWhileUnwinding)
{
    std::atomic<int> finished{0};
    EXPECT_THROW(
        {
            droidpack::WorkerGroup workers;
            for (int i = 0; i < 3; ++i)
            {
                workers.spawn([&finished]()
                              {
                    std::this_thread::sleep_for(std::chrono::milliseconds(20));
                    ++finished; });
            }
            EXPECT_EQ(workers.size(), 3U);
            throw std::runtime_error("thread creation failed");
        },
        std::runtime_error);
    EXPECT_EQ(finished.load(), 3);
}

#ifndef _WIN32
namespace
{

    void writeScript(const fs::path &path, const std::string &body)
    {
        writeText(path, "#!/bin/sh\n" + body);
        fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);
    }

    // An SDK whose aapt copies a prepared resource archive to -F and whose
    // apksigner copies --in to --out.
    fs::path makeScriptedSdk(const fs::path &root)
    {
        const fs::path sdk = root / "sdk";
        const fs::path tools = sdk / "build-tools" / "34.0.0";
        writeText(sdk / "platforms" / "android-33" / "android.jar", "jar");

        droidpack::package::ZipWriter writer;
        writer.addDeflated("AndroidManifest.xml", textBytes("<manifest/>"));
        writer.addStored("resources.arsc", textBytes("arsc-table"));
        const Bytes archive = writer.finish();
        writeText(root / "fixture.ap_", std::string(archive.begin(), archive.end()));

        writeScript(tools / "aapt",
                    "out=\"\"\n"
                    "while [ $# -gt 0 ]; do\n"
                    "  if [ \"$1\" = \"-F\" ]; then out=\"$2\"; fi\n"
                    "  shift\n"
                    "done\n"
                    "cp \"" + (root / "fixture.ap_").string() + "\" \"$out\"\n");
        writeScript(tools / "apksigner",
                    "in=\"\"\nout=\"\"\n"
                    "while [ $# -gt 0 ]; do\n"
                    "  case \"$1\" in\n"
                    "    --in) in=\"$2\" ;;\n"
                    "    --out) out=\"$2\" ;;\n"
                    "  esac\n"
                    "  shift\n"
                    "done\n"
                    "cp \"$in\" \"$out\"\n");
        return sdk;
    }

} // namespace

TEST(PackagePipeline, BuildsResourceOnlyPackageWithScriptedTools)
{
    const fs::path root = makeTempRoot("scripted");
    auto ctx = makeContext();

    droidpack::model::PackageConfig config;
    config.name = "game";
    config.manifest.package = "com.example.game";
    config.toolchain.androidSdk = makeScriptedSdk(root);
    config.buildDir = root / "build";
    config.output = root / "out" / "game.apk";
    droidpack::model::KeystoreCredential keystore;
    keystore.keystore = root / "release.jks";
    keystore.password = "secret";
    keystore.alias = "release";
    config.signing.keystore = keystore;
    writeText(keystore.keystore, "keystore");

    ASSERT_TRUE(droidpack::package::buildPackage(ctx, config));

    // android-34 is not installed, so android-33 was used.
    const auto reader = droidpack::package::ZipReader::open(config.output);
    ASSERT_EQ(reader.entries().size(), 2U);
    EXPECT_EQ(reader.entries()[0].name, "AndroidManifest.xml");
    EXPECT_EQ(reader.read("resources.arsc"), textBytes("arsc-table"));
    EXPECT_FALSE(fs::exists(root / "out" / "game.apk.partial"));

    cleanupTemp(root);
}

TEST(PackagePipeline, FailingSignerToolReportsFalse)
{
    const fs::path root = makeTempRoot("scriptfail");
    auto ctx = makeContext();

    droidpack::model::PackageConfig config;
    config.name = "game";
    config.manifest.package = "com.example.game";
    config.toolchain.androidSdk = makeScriptedSdk(root);
    writeScript(config.toolchain.androidSdk / "build-tools" / "34.0.0" / "apksigner", "echo bad password >&2\nexit 2\n");
    config.buildDir = root / "build";
    config.output = root / "out" / "game.apk";
    droidpack::model::KeystoreCredential keystore;
    keystore.keystore = root / "release.jks";
    keystore.password = "secret";
    config.signing.keystore = keystore;
    writeText(keystore.keystore, "keystore");

    EXPECT_FALSE(droidpack::package::buildPackage(ctx, config));
    EXPECT_FALSE(fs::exists(config.output));
    EXPECT_FALSE(fs::exists(root / "out" / "game.apk.partial"));

    cleanupTemp(root);
}
#endif

TEST(PackagePipeline, MissingSdkFails)
{
    const fs::path root = makeTempRoot("nosdk");
    auto ctx = makeContext();
    droidpack::model::PackageConfig config;
    config.name = "game";
    config.manifest.package = "com.example.game";
    config.toolchain.androidSdk = root / "no-sdk-here";
    config.buildDir = root / "build";
    config.output = root / "build" / "game.apk";

    EXPECT_FALSE(droidpack::package::buildPackage(ctx, config));
    EXPECT_FALSE(fs::exists(config.output));

    cleanupTemp(root);
}
