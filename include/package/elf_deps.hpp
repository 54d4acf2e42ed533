#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace droidpack::package {

// DT_NEEDED entries of a little-endian ELF32/ELF64 shared object, in file
// order, read through the PT_DYNAMIC segment so stripped section headers do
// not matter. Throws IoError when the file is not such an object.
std::vector<std::string> readNeededLibraries(const std::filesystem::path &path);

} // namespace droidpack::package
