#pragma once

#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include "package/byte_io.hpp"

namespace droidpack::package {

constexpr std::uint16_t kZipStored = 0;
constexpr std::uint16_t kZipDeflated = 8;

// Header id of the zipalign-style padding block in a local extra field.
constexpr std::uint16_t kAlignmentExtraId = 0xD935;
// Padding lives in a 16-bit extra field, so larger alignments cannot be encoded.
constexpr std::uint32_t kMaxEntryAlignment = 32768;

// 1981-01-01 00:00, the earliest date every zip tool round-trips.
constexpr std::uint16_t kFixedDosTime = 0;
constexpr std::uint16_t kFixedDosDate = (1 << 9) | (1 << 5) | 1;

struct ZipEntry {
    std::string name;
    std::uint16_t method = kZipStored;
    std::uint32_t crc32 = 0;
    std::uint32_t compressedSize = 0;
    std::uint32_t size = 0;
    std::uint32_t localHeaderOffset = 0;
    // Offset of the first payload byte, past the local header and its extra field.
    std::uint64_t dataOffset = 0;
};

class ZipReader {
public:
    // Throws IoError when no end-of-central-directory record is found or a
    // record points outside the buffer.
    explicit ZipReader(Bytes bytes, std::string origin = "<memory>");

    static ZipReader open(const std::filesystem::path &path);

    const std::vector<ZipEntry> &entries() const { return entries_; }
    const ZipEntry *find(const std::string &name) const;

    // Uncompressed payload; the CRC is checked.
    Bytes read(const ZipEntry &entry) const;
    Bytes read(const std::string &name) const;
    // Payload exactly as stored in the archive.
    Bytes readRaw(const ZipEntry &entry) const;

    // Rejects absolute names and names escaping dir.
    void extractTo(const std::filesystem::path &dir) const;

    const Bytes &bytes() const { return bytes_; }
    std::uint32_t centralDirectoryOffset() const { return centralDirectoryOffset_; }
    std::uint32_t centralDirectorySize() const { return centralDirectorySize_; }
    std::uint64_t eocdOffset() const { return eocdOffset_; }

private:
    Bytes bytes_;
    std::string origin_;
    std::vector<ZipEntry> entries_;
    std::uint32_t centralDirectoryOffset_ = 0;
    std::uint32_t centralDirectorySize_ = 0;
    std::uint64_t eocdOffset_ = 0;
};

// Builds a zip32 archive in memory. Entries keep insertion order; all header
// fields that tools usually fill from the clock or the host are fixed.
class ZipWriter {
public:
    ZipWriter() = default;

    // Keeps every local entry of archive byte-for-byte and continues after them.
    static ZipWriter appendTo(const ZipReader &archive);

    // Payload start is padded to a multiple of alignment (0 or 1 disables it).
    // Throws IoError above kMaxEntryAlignment.
    void addStored(const std::string &name, const Bytes &data, std::uint32_t alignment = 4);
    // Raw deflate, level 9.
    void addDeflated(const std::string &name, const Bytes &data);

    bool contains(const std::string &name) const { return names_.count(name) != 0; }
    std::size_t size() const { return entries_.size(); }

    // Central directory and EOCD appended; the writer must not be reused.
    Bytes finish();

private:
    struct Entry {
        std::string name;
        std::uint16_t method = kZipStored;
        std::uint32_t crc32 = 0;
        std::uint32_t compressedSize = 0;
        std::uint32_t size = 0;
        std::uint32_t localHeaderOffset = 0;
    };

    void writeEntry(Entry entry, const Bytes &payload, std::uint32_t alignment);

    Bytes out_;
    std::vector<Entry> entries_;
    std::set<std::string> names_;
    bool finished_ = false;
};

std::uint32_t crc32Of(const Bytes &data);

// Raw deflate (no zlib header) at the given level, as stored in zip entries.
Bytes deflateRaw(const Bytes &data, int level = 9);
Bytes inflateRaw(const Bytes &data, std::size_t expectedSize);

} // namespace droidpack::package
