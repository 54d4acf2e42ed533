#include "package/zip.hpp"

#include <algorithm>
#include <limits>
#include <string>

#include <zlib.h>

#include "core/error.hpp"
#include "io/fs_utils.hpp"

namespace fs = std::filesystem;

namespace droidpack::package
{
    namespace
    {

        constexpr std::uint32_t kLocalFileHeaderSignature = 0x04034b50U;
        constexpr std::uint32_t kCentralDirectoryHeaderSignature = 0x02014b50U;
        constexpr std::uint32_t kEndOfCentralDirectorySignature = 0x06054b50U;

        constexpr std::size_t kLocalHeaderSize = 30;
        constexpr std::size_t kCentralHeaderSize = 46;
        constexpr std::size_t kEocdSize = 22;
        constexpr std::size_t kMaxCommentSize = 0xFFFF;

        // id + size + the 2-byte alignment value
        constexpr std::size_t kAlignmentExtraMinSize = 6;

        std::uint16_t versionNeeded(std::uint16_t method)
        {
            return method == kZipDeflated ? 20 : 10;
        }

        std::uint32_t checkedOffset(std::size_t value)
        {
            if (value > std::numeric_limits<std::uint32_t>::max())
            {
                throw IoError("<archive>", "Archive too large for zip32");
            }
            return static_cast<std::uint32_t>(value);
        }

        Bytes alignmentExtra(std::size_t headerEnd, std::uint32_t alignment)
        {
            Bytes extra;
            if (alignment <= 1)
            {
                return extra;
            }

            const std::size_t base = headerEnd + kAlignmentExtraMinSize;
            const std::size_t padding = (alignment - base % alignment) % alignment;
            if (kAlignmentExtraMinSize + padding > 0xFFFF)
            {
                throw IoError("<archive>", "Alignment " + std::to_string(alignment) + " does not fit a zip extra field");
            }
            putU16(extra, kAlignmentExtraId);
            putU16(extra, static_cast<std::uint16_t>(2 + padding));
            putU16(extra, static_cast<std::uint16_t>(alignment));
            extra.insert(extra.end(), padding, 0);
            return extra;
        }

        bool unsafeEntryName(const std::string &name)
        {
            if (name.empty() || name[0] == '/' || name[0] == '\\' || name.find(':') != std::string::npos)
            {
                return true;
            }
            const fs::path path(name);
            for (const auto &part : path)
            {
                if (part == "..")
                {
                    return true;
                }
            }
            return false;
        }

    } // namespace

    std::uint32_t crc32Of(const Bytes &data)
    {
        uLong crc = ::crc32(0L, Z_NULL, 0);
        std::size_t done = 0;
        while (done < data.size())
        {
            const uInt chunk = static_cast<uInt>(std::min<std::size_t>(data.size() - done, 1U << 30));
            crc = ::crc32(crc, data.data() + done, chunk);
            done += chunk;
        }
        return static_cast<std::uint32_t>(crc);
    }

    Bytes deflateRaw(const Bytes &data, int level)
    {
        z_stream stream{};
        if (deflateInit2(&stream, level, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY) != Z_OK)
        {
            throw IoError("<deflate>", "deflateInit2 failed");
        }

        Bytes out(deflateBound(&stream, static_cast<uLong>(data.size())));
        stream.next_in = const_cast<Bytef *>(data.data());
        stream.avail_in = static_cast<uInt>(data.size());
        stream.next_out = out.data();
        stream.avail_out = static_cast<uInt>(out.size());

        const int ret = deflate(&stream, Z_FINISH);
        const std::size_t produced = stream.total_out;
        deflateEnd(&stream);
        if (ret != Z_STREAM_END)
        {
            throw IoError("<deflate>", "deflate did not finish");
        }

        out.resize(produced);
        return out;
    }

    Bytes inflateRaw(const Bytes &data, std::size_t expectedSize)
    {
        z_stream stream{};
        if (inflateInit2(&stream, -15) != Z_OK)
        {
            throw IoError("<inflate>", "inflateInit2 failed");
        }

        // zlib rejects a null output pointer, so an empty entry still gets one byte.
        Bytes out(std::max<std::size_t>(expectedSize, 1));
        stream.next_in = const_cast<Bytef *>(data.data());
        stream.avail_in = static_cast<uInt>(data.size());
        stream.next_out = out.data();
        stream.avail_out = static_cast<uInt>(out.size());

        const int ret = inflate(&stream, Z_FINISH);
        const std::size_t produced = stream.total_out;
        inflateEnd(&stream);
        if (ret != Z_STREAM_END || produced != expectedSize)
        {
            throw IoError("<inflate>", "Corrupt deflate stream");
        }
        out.resize(expectedSize);
        return out;
    }

    ZipReader::ZipReader(Bytes bytes, std::string origin)
        : bytes_(std::move(bytes)), origin_(std::move(origin))
    {
        if (bytes_.size() < kEocdSize)
        {
            throw IoError(origin_, "Not a zip archive");
        }

        // The EOCD sits at the end, followed by at most a 64 KiB comment.
        const std::size_t last = bytes_.size() - kEocdSize;
        const std::size_t first = last > kMaxCommentSize ? last - kMaxCommentSize : 0;
        bool found = false;
        for (std::size_t at = last + 1; at-- > first;)
        {
            if (getU32(bytes_, at) == kEndOfCentralDirectorySignature &&
                at + kEocdSize + getU16(bytes_, at + 20) == bytes_.size())
            {
                eocdOffset_ = at;
                found = true;
                break;
            }
        }
        if (!found)
        {
            throw IoError(origin_, "No end of central directory record");
        }

        const std::uint16_t count = getU16(bytes_, eocdOffset_ + 10);
        centralDirectorySize_ = getU32(bytes_, eocdOffset_ + 12);
        centralDirectoryOffset_ = getU32(bytes_, eocdOffset_ + 16);
        if (static_cast<std::uint64_t>(centralDirectoryOffset_) + centralDirectorySize_ > eocdOffset_)
        {
            throw IoError(origin_, "Central directory overlaps the end record");
        }

        std::size_t at = centralDirectoryOffset_;
        entries_.reserve(count);
        for (std::uint16_t i = 0; i < count; ++i)
        {
            if (at + kCentralHeaderSize > eocdOffset_ || getU32(bytes_, at) != kCentralDirectoryHeaderSignature)
            {
                throw IoError(origin_, "Malformed central directory");
            }

            ZipEntry entry;
            entry.method = getU16(bytes_, at + 10);
            entry.crc32 = getU32(bytes_, at + 16);
            entry.compressedSize = getU32(bytes_, at + 20);
            entry.size = getU32(bytes_, at + 24);
            const std::uint16_t nameLength = getU16(bytes_, at + 28);
            const std::uint16_t extraLength = getU16(bytes_, at + 30);
            const std::uint16_t commentLength = getU16(bytes_, at + 32);
            entry.localHeaderOffset = getU32(bytes_, at + 42);
            if (at + kCentralHeaderSize + nameLength > eocdOffset_)
            {
                throw IoError(origin_, "Malformed central directory");
            }
            entry.name.assign(bytes_.begin() + static_cast<std::ptrdiff_t>(at + kCentralHeaderSize),
                              bytes_.begin() + static_cast<std::ptrdiff_t>(at + kCentralHeaderSize + nameLength));

            const std::size_t local = entry.localHeaderOffset;
            if (local + kLocalHeaderSize > centralDirectoryOffset_ ||
                getU32(bytes_, local) != kLocalFileHeaderSignature)
            {
                throw IoError(origin_, "Bad local header for " + entry.name);
            }
            entry.dataOffset = local + kLocalHeaderSize + getU16(bytes_, local + 26) + getU16(bytes_, local + 28);
            if (entry.dataOffset + entry.compressedSize > centralDirectoryOffset_)
            {
                throw IoError(origin_, "Entry data out of range for " + entry.name);
            }

            entries_.push_back(entry);
            at += kCentralHeaderSize + nameLength + extraLength + commentLength;
        }
    }

    ZipReader ZipReader::open(const fs::path &path)
    {
        return ZipReader(io::readBinaryFile(path), path.string());
    }

    const ZipEntry *ZipReader::find(const std::string &name) const
    {
        for (const auto &entry : entries_)
        {
            if (entry.name == name)
            {
                return &entry;
            }
        }
        return nullptr;
    }

    Bytes ZipReader::readRaw(const ZipEntry &entry) const
    {
        const auto begin = bytes_.begin() + static_cast<std::ptrdiff_t>(entry.dataOffset);
        return Bytes(begin, begin + static_cast<std::ptrdiff_t>(entry.compressedSize));
    }

    Bytes ZipReader::read(const ZipEntry &entry) const
    {
        Bytes data;
        if (entry.method == kZipStored)
        {
            data = readRaw(entry);
        }
        else if (entry.method == kZipDeflated)
        {
            data = inflateRaw(readRaw(entry), entry.size);
        }
        else
        {
            throw IoError(origin_, "Unsupported compression method " + std::to_string(entry.method) + " for " + entry.name);
        }

        if (crc32Of(data) != entry.crc32)
        {
            throw IoError(origin_, "CRC mismatch for " + entry.name);
        }
        return data;
    }

    Bytes ZipReader::read(const std::string &name) const
    {
        const ZipEntry *entry = find(name);
        if (!entry)
        {
            throw IoError(origin_, "No entry " + name);
        }
        return read(*entry);
    }

    void ZipReader::extractTo(const fs::path &dir) const
    {
        for (const auto &entry : entries_)
        {
            if (unsafeEntryName(entry.name))
            {
                throw IoError(origin_, "Refusing to extract entry " + entry.name);
            }
            if (entry.name.back() == '/')
            {
                io::ensureDir(dir / entry.name);
                continue;
            }
            const fs::path target = dir / fs::path(entry.name);
            if (!io::ensureDir(target.parent_path()))
            {
                throw IoError(target.parent_path(), "Failed create directory");
            }
            io::writeBinaryFile(target, read(entry));
        }
    }

    ZipWriter ZipWriter::appendTo(const ZipReader &archive)
    {
        ZipWriter writer;
        const Bytes &source = archive.bytes();
        writer.out_.assign(source.begin(), source.begin() + archive.centralDirectoryOffset());
        for (const auto &item : archive.entries())
        {
            Entry entry;
            entry.name = item.name;
            entry.method = item.method;
            entry.crc32 = item.crc32;
            entry.compressedSize = item.compressedSize;
            entry.size = item.size;
            entry.localHeaderOffset = item.localHeaderOffset;
            writer.names_.insert(entry.name);
            writer.entries_.push_back(entry);
        }
        return writer;
    }

    void ZipWriter::addStored(const std::string &name, const Bytes &data, std::uint32_t alignment)
    {
        if (alignment > kMaxEntryAlignment)
        {
            throw IoError(name, "Alignment " + std::to_string(alignment) + " exceeds " +
                                    std::to_string(kMaxEntryAlignment));
        }
        Entry entry;
        entry.name = name;
        entry.method = kZipStored;
        entry.crc32 = crc32Of(data);
        entry.compressedSize = checkedOffset(data.size());
        entry.size = entry.compressedSize;
        writeEntry(entry, data, alignment);
    }

    void ZipWriter::addDeflated(const std::string &name, const Bytes &data)
    {
        Entry entry;
        entry.name = name;
        entry.method = kZipDeflated;
        entry.crc32 = crc32Of(data);
        entry.size = checkedOffset(data.size());
        const Bytes compressed = deflateRaw(data);
        entry.compressedSize = checkedOffset(compressed.size());
        writeEntry(entry, compressed, 0);
    }

    void ZipWriter::writeEntry(Entry entry, const Bytes &payload, std::uint32_t alignment)
    {
        if (finished_)
        {
            throw IoError(entry.name, "Zip writer already finished, cannot add");
        }
        if (entry.name.empty() || entry.name.size() > 0xFFFF)
        {
            throw IoError(entry.name, "Invalid zip entry name");
        }
        if (!names_.insert(entry.name).second)
        {
            throw IoError(entry.name, "Duplicate zip entry");
        }

        entry.localHeaderOffset = checkedOffset(out_.size());
        const Bytes extra = alignmentExtra(out_.size() + kLocalHeaderSize + entry.name.size(), alignment);

        putU32(out_, kLocalFileHeaderSignature);
        putU16(out_, versionNeeded(entry.method));
        putU16(out_, 0); // general purpose bit flag
        putU16(out_, entry.method);
        putU16(out_, kFixedDosTime);
        putU16(out_, kFixedDosDate);
        putU32(out_, entry.crc32);
        putU32(out_, entry.compressedSize);
        putU32(out_, entry.size);
        putU16(out_, static_cast<std::uint16_t>(entry.name.size()));
        putU16(out_, static_cast<std::uint16_t>(extra.size()));
        putString(out_, entry.name);
        putBytes(out_, extra);
        putBytes(out_, payload);

        checkedOffset(out_.size());
        entries_.push_back(entry);
    }

    Bytes ZipWriter::finish()
    {
        if (finished_)
        {
            throw IoError("<archive>", "Zip writer already finished");
        }
        if (entries_.size() > 0xFFFF)
        {
            throw IoError("<archive>", "Too many entries for zip32");
        }
        finished_ = true;

        const std::uint32_t centralOffset = checkedOffset(out_.size());
        for (const auto &entry : entries_)
        {
            putU32(out_, kCentralDirectoryHeaderSignature);
            putU16(out_, 0); // version made by
            putU16(out_, versionNeeded(entry.method));
            putU16(out_, 0); // general purpose bit flag
            putU16(out_, entry.method);
            putU16(out_, kFixedDosTime);
            putU16(out_, kFixedDosDate);
            putU32(out_, entry.crc32);
            putU32(out_, entry.compressedSize);
            putU32(out_, entry.size);
            putU16(out_, static_cast<std::uint16_t>(entry.name.size()));
            putU16(out_, 0); // extra field length
            putU16(out_, 0); // file comment length
            putU16(out_, 0); // disk number start
            putU16(out_, 0); // internal file attributes
            putU32(out_, 0); // external file attributes
            putU32(out_, entry.localHeaderOffset);
            putString(out_, entry.name);
        }
        const std::uint32_t centralSize = checkedOffset(out_.size() - centralOffset);

        putU32(out_, kEndOfCentralDirectorySignature);
        putU16(out_, 0); // number of this disk
        putU16(out_, 0); // disk holding the central directory
        putU16(out_, static_cast<std::uint16_t>(entries_.size()));
        putU16(out_, static_cast<std::uint16_t>(entries_.size()));
        putU32(out_, centralSize);
        putU32(out_, centralOffset);
        putU16(out_, 0); // comment length

        return std::move(out_);
    }

} // namespace droidpack::package
