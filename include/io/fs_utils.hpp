#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/context.hpp"

namespace droidpack::io {

// Create-if-absent. Safe when several workers race on the same directory.
bool ensureDir(const std::filesystem::path &path);

// Regular files under root as forward-slash relative paths, sorted bytewise.
std::vector<std::string> listFilesSorted(const std::filesystem::path &root);

std::vector<int> numericKey(const std::string &value);
std::optional<std::string> latestSubdirName(const std::filesystem::path &root);

std::vector<std::uint8_t> readBinaryFile(const std::filesystem::path &path);
std::string readTextFile(const std::filesystem::path &path);
void writeBinaryFile(const std::filesystem::path &path, const std::vector<std::uint8_t> &data);
void writeTextFile(const std::filesystem::path &path, const std::string &text);

bool removePath(const std::filesystem::path &path, const droidpack::Context &ctx);

} // namespace droidpack::io
