#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/context.hpp"

namespace droidpack::io {

struct ProcessResult {
    int code = -1;
    std::string commandLine;
    // Interleaved stdout and stderr of the child.
    std::string output;
};

std::string shellQuote(const std::string &value);
// Shell-quoted command line for logs and errors. An inline "pass:<secret>"
// value after --ks-pass or --key-pass is shown as "pass:****".
std::string displayCommand(const std::string &command, const std::vector<std::string> &args);

ProcessResult runCommand(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const droidpack::Context &ctx,
    bool dryRun = false
);

} // namespace droidpack::io
