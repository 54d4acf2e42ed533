#include <filesystem>
#include <string>

#include <gtest/gtest.h>

#include "core/context.hpp"
#include "io/process.hpp"

namespace
{

    droidpack::Context makeContext()
    {
        return droidpack::Context(false);
    }

    std::filesystem::path missingDir()
    {
#ifdef _WIN32
        return std::filesystem::path("Z:\\droidpack\\no\\such\\staging\\dir");
#else
        return std::filesystem::path("/droidpack/no/such/staging/dir");
#endif
    }

} // namespace

TEST(ProcessRunCommand, ExitCodeAndInterleavedOutput)
{
#ifdef _WIN32
    GTEST_SKIP() << "Uses a POSIX shell.";
#else
    auto ctx = makeContext();
    auto result = droidpack::io::runCommand("sh", {"-c", "echo first; echo second 1>&2; echo third; exit 3"}, {}, ctx, false);
    EXPECT_EQ(result.code, 3);
    EXPECT_EQ(result.output, "first\nsecond\nthird\n");
#endif
}

TEST(ProcessRunCommand, OutputLargerThanPipeBuffer)
{
#ifdef _WIN32
    GTEST_SKIP() << "Uses a POSIX shell.";
#else
    auto ctx = makeContext();
    auto result = droidpack::io::runCommand(
        "sh", {"-c", "i=0; while [ $i -lt 4000 ]; do echo 'aapt: warning: resource has no default translation'; i=$((i+1)); done"},
        {}, ctx, false);
    EXPECT_EQ(result.code, 0);
    EXPECT_EQ(result.output.size(), 4000U * 51U);
#endif
}

TEST(ProcessRunCommand, RunsInRequestedDirectory)
{
#ifdef _WIN32
    GTEST_SKIP() << "Uses a POSIX shell.";
#else
    auto ctx = makeContext();
    const auto dir = std::filesystem::canonical(std::filesystem::temp_directory_path());
    auto result = droidpack::io::runCommand("pwd", {}, dir, ctx, false);
    EXPECT_EQ(result.code, 0);
    EXPECT_EQ(result.output, dir.string() + "\n");
#endif
}

TEST(ProcessRunCommand, ArgumentsAreNotReinterpreted)
{
#ifdef _WIN32
    GTEST_SKIP() << "Uses a POSIX shell.";
#else
    auto ctx = makeContext();
    auto result = droidpack::io::runCommand("echo", {"lib;rm -rf $HOME", "it's"}, {}, ctx, false);
    EXPECT_EQ(result.code, 0);
    EXPECT_EQ(result.output, "lib;rm -rf $HOME it's\n");
#endif
}

TEST(ProcessRunCommand, SignalledChildReportsShellStyleCode)
{
#ifdef _WIN32
    GTEST_SKIP() << "POSIX signals only.";
#else
    auto ctx = makeContext();
    auto result = droidpack::io::runCommand("sh", {"-c", "kill -TERM $$"}, {}, ctx, false);
    EXPECT_EQ(result.code, 128 + 15);
#endif
}

TEST(ProcessRunCommand, MissingCommandOrDirectoryFails)
{
    auto ctx = makeContext();
    EXPECT_NE(droidpack::io::runCommand("droidpack_no_such_tool", {}, {}, ctx, false).code, 0);

    auto result = droidpack::io::runCommand("echo", {"unused"}, missingDir(), ctx, false);
    EXPECT_NE(result.code, 0);
    EXPECT_TRUE(result.output.empty());
}

TEST(ProcessRunCommand, DryRunOnlyFormatsTheCommand)
{
    auto ctx = makeContext();
    auto result = droidpack::io::runCommand("droidpack_no_such_tool", {"--flag", "two words"}, {}, ctx, true);
    EXPECT_EQ(result.code, 0);
    EXPECT_TRUE(result.output.empty());
#ifndef _WIN32
    EXPECT_EQ(result.commandLine, "droidpack_no_such_tool --flag 'two words'");
#endif
}

TEST(ProcessQuote, PosixQuoting)
{
#ifdef _WIN32
    GTEST_SKIP() << "POSIX quoting rules.";
#else
    EXPECT_EQ(droidpack::io::shellQuote("/sdk/build-tools/34.0.0/aapt"), "/sdk/build-tools/34.0.0/aapt");
    EXPECT_EQ(droidpack::io::shellQuote("--ks-key-alias=release@2"), "--ks-key-alias=release@2");
    EXPECT_EQ(droidpack::io::shellQuote(""), "''");
    EXPECT_EQ(droidpack::io::shellQuote("My Game"), "'My Game'");
    EXPECT_EQ(droidpack::io::shellQuote("it's"), "'it'\"'\"'s'");
    EXPECT_EQ(droidpack::io::shellQuote("$HOME"), "'$HOME'");
#endif
}

TEST(ProcessQuote, WindowsQuoting)
{
#ifndef _WIN32
    GTEST_SKIP() << "CommandLineToArgvW rules.";
#else
    EXPECT_EQ(droidpack::io::shellQuote("C:\\sdk\\aapt.exe"), "C:\\sdk\\aapt.exe");
    EXPECT_EQ(droidpack::io::shellQuote(""), "\"\"");
    EXPECT_EQ(droidpack::io::shellQuote("C:\\My Games\\"), "\"C:\\My Games\\\\\"");
    EXPECT_EQ(droidpack::io::shellQuote("say \"hi\""), "\"say \\\"hi\\\"\"");
#endif
}

TEST(ProcessDisplayCommand, MasksInlinePasswords)
{
    const std::string line = droidpack::io::displayCommand(
        "apksigner",
        {"sign", "--ks", "release.jks", "--ks-pass", "pass:hunter2", "--key-pass", "pass:other", "--in", "a.apk"});
    EXPECT_EQ(line.find("hunter2"), std::string::npos);
    EXPECT_EQ(line.find("other"), std::string::npos);
    EXPECT_NE(line.find("--ks-pass pass:****"), std::string::npos);
    EXPECT_NE(line.find("--key-pass pass:****"), std::string::npos);

    // Password files and environment names are not secrets themselves.
    const std::string fromFile = droidpack::io::displayCommand(
        "apksigner", {"sign", "--ks-pass", "file:keystore.pass", "--key-pass", "env:KEY_PASS"});
    EXPECT_NE(fromFile.find("file:keystore.pass"), std::string::npos);
    EXPECT_NE(fromFile.find("env:KEY_PASS"), std::string::npos);

    // Only the value directly after the flag is masked.
    const std::string plain = droidpack::io::displayCommand("echo", {"pass:visible"});
    EXPECT_NE(plain.find("pass:visible"), std::string::npos);
}
