#pragma once

#include <filesystem>

#include <nlohmann/json.hpp>

namespace droidpack::io {

nlohmann::json loadJsonFile(const std::filesystem::path &path);

} // namespace droidpack::io
