#include "package/elf_deps.hpp"

#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "core/error.hpp"
#include "io/fs_utils.hpp"
#include "package/byte_io.hpp"

namespace fs = std::filesystem;

namespace droidpack::package
{
    namespace
    {

        constexpr std::uint8_t kElfMagic[4] = {0x7F, 'E', 'L', 'F'};
        constexpr std::size_t kIdentSize = 16;
        constexpr std::size_t kIdentClass = 4;
        constexpr std::size_t kIdentData = 5;
        constexpr std::uint8_t kClass32 = 1;
        constexpr std::uint8_t kClass64 = 2;
        constexpr std::uint8_t kDataLittleEndian = 1;

        constexpr std::uint32_t kProgramLoad = 1;
        constexpr std::uint32_t kProgramDynamic = 2;

        constexpr std::int64_t kDynamicNull = 0;
        constexpr std::int64_t kDynamicNeeded = 1;
        constexpr std::int64_t kDynamicStrtab = 5;
        constexpr std::int64_t kDynamicStrsz = 10;

        // Only the fields the walk needs, widened to 64 bits.
        struct FileHeader
        {
            std::uint64_t phoff = 0;
            std::uint16_t phentsize = 0;
            std::uint16_t phnum = 0;
        };

        struct ProgramHeader
        {
            std::uint32_t type = 0;
            std::uint64_t offset = 0;
            std::uint64_t vaddr = 0;
            std::uint64_t filesz = 0;
        };

        struct DynamicEntry
        {
            std::int64_t tag = 0;
            std::uint64_t value = 0;
        };

        class ElfImage
        {
        public:
            ElfImage(Bytes bytes, const fs::path &path) : bytes_(std::move(bytes)), path_(path) {}

            void parseIdent()
            {
                if (bytes_.size() < kIdentSize || std::memcmp(bytes_.data(), kElfMagic, sizeof(kElfMagic)) != 0)
                {
                    throw IoError(path_, "Not an ELF file");
                }
                if (bytes_[kIdentData] != kDataLittleEndian)
                {
                    throw IoError(path_, "Big-endian ELF is not an Android library");
                }
                if (bytes_[kIdentClass] != kClass32 && bytes_[kIdentClass] != kClass64)
                {
                    throw IoError(path_, "Unknown ELF class");
                }
                wide_ = bytes_[kIdentClass] == kClass64;
            }

            FileHeader fileHeader() const
            {
                FileHeader header;
                if (wide_)
                {
                    require(0, 64);
                    header.phoff = getU64(bytes_, 32);
                    header.phentsize = getU16(bytes_, 54);
                    header.phnum = getU16(bytes_, 56);
                }
                else
                {
                    require(0, 52);
                    header.phoff = getU32(bytes_, 28);
                    header.phentsize = getU16(bytes_, 42);
                    header.phnum = getU16(bytes_, 44);
                }
                return header;
            }

            std::size_t programHeaderSize() const { return wide_ ? 56 : 32; }
            std::size_t dynamicEntrySize() const { return wide_ ? 16 : 8; }

            ProgramHeader programHeader(std::uint64_t at) const
            {
                require(at, programHeaderSize());
                const std::size_t base = static_cast<std::size_t>(at);
                ProgramHeader ph;
                ph.type = getU32(bytes_, base);
                if (wide_)
                {
                    ph.offset = getU64(bytes_, base + 8);
                    ph.vaddr = getU64(bytes_, base + 16);
                    ph.filesz = getU64(bytes_, base + 32);
                }
                else
                {
                    ph.offset = getU32(bytes_, base + 4);
                    ph.vaddr = getU32(bytes_, base + 8);
                    ph.filesz = getU32(bytes_, base + 16);
                }
                return ph;
            }

            DynamicEntry dynamicEntry(std::uint64_t at) const
            {
                require(at, dynamicEntrySize());
                const std::size_t base = static_cast<std::size_t>(at);
                DynamicEntry entry;
                if (wide_)
                {
                    entry.tag = static_cast<std::int64_t>(getU64(bytes_, base));
                    entry.value = getU64(bytes_, base + 8);
                }
                else
                {
                    entry.tag = static_cast<std::int32_t>(getU32(bytes_, base));
                    entry.value = getU32(bytes_, base + 4);
                }
                return entry;
            }

            std::string cString(std::uint64_t at, std::uint64_t limit) const
            {
                std::string out;
                for (std::uint64_t pos = at; pos < limit && pos < bytes_.size(); ++pos)
                {
                    const auto ch = bytes_[static_cast<std::size_t>(pos)];
                    if (ch == 0)
                    {
                        return out;
                    }
                    out.push_back(static_cast<char>(ch));
                }
                throw IoError(path_, "Unterminated string in ELF string table");
            }

            const fs::path &path() const { return path_; }

        private:
            void require(std::uint64_t at, std::uint64_t size) const
            {
                if (at > bytes_.size() || bytes_.size() - at < size)
                {
                    throw IoError(path_, "Truncated ELF file");
                }
            }

            Bytes bytes_;
            fs::path path_;
            bool wide_ = false;
        };

        // Virtual address to file offset through the PT_LOAD segments.
        std::uint64_t fileOffsetOf(std::uint64_t vaddr, const std::vector<ProgramHeader> &loads, const ElfImage &image)
        {
            for (const auto &load : loads)
            {
                if (vaddr >= load.vaddr && vaddr - load.vaddr < load.filesz)
                {
                    return load.offset + (vaddr - load.vaddr);
                }
            }
            throw IoError(image.path(), "Dynamic string table is outside every loadable segment");
        }

    } // namespace

    std::vector<std::string> readNeededLibraries(const fs::path &path)
    {
        ElfImage image(io::readBinaryFile(path), path);
        image.parseIdent();

        const FileHeader header = image.fileHeader();
        if (header.phnum == 0)
        {
            throw IoError(path, "ELF file has no program headers");
        }
        if (header.phentsize != image.programHeaderSize())
        {
            throw IoError(path, "Unexpected ELF program header size");
        }

        std::vector<ProgramHeader> loads;
        std::vector<ProgramHeader> dynamics;
        for (std::uint16_t i = 0; i < header.phnum; ++i)
        {
            const ProgramHeader ph = image.programHeader(header.phoff + static_cast<std::uint64_t>(i) * header.phentsize);
            if (ph.type == kProgramLoad)
            {
                loads.push_back(ph);
            }
            else if (ph.type == kProgramDynamic)
            {
                dynamics.push_back(ph);
            }
        }

        std::vector<std::string> needed;
        if (dynamics.empty())
        {
            // Statically linked.
            return needed;
        }

        std::vector<std::uint64_t> nameOffsets;
        std::uint64_t strtabAddr = 0;
        std::uint64_t strtabSize = 0;
        bool haveStrtab = false;
        const ProgramHeader &dynamic = dynamics.front();
        const std::uint64_t count = dynamic.filesz / image.dynamicEntrySize();
        for (std::uint64_t i = 0; i < count; ++i)
        {
            const DynamicEntry entry = image.dynamicEntry(dynamic.offset + i * image.dynamicEntrySize());
            if (entry.tag == kDynamicNull)
            {
                break;
            }
            switch (entry.tag)
            {
            case kDynamicNeeded:
                nameOffsets.push_back(entry.value);
                break;
            case kDynamicStrtab:
                strtabAddr = entry.value;
                haveStrtab = true;
                break;
            case kDynamicStrsz:
                strtabSize = entry.value;
                break;
            default:
                break;
            }
        }

        if (nameOffsets.empty())
        {
            return needed;
        }
        if (!haveStrtab)
        {
            throw IoError(path, "Dynamic segment has DT_NEEDED but no DT_STRTAB");
        }

        const std::uint64_t strtab = fileOffsetOf(strtabAddr, loads, image);
        const std::uint64_t limit = strtabSize != 0 ? strtab + strtabSize : std::numeric_limits<std::uint64_t>::max();
        for (std::uint64_t offset : nameOffsets)
        {
            if (strtabSize != 0 && offset >= strtabSize)
            {
                throw IoError(path, "DT_NEEDED points past the dynamic string table");
            }
            needed.push_back(image.cString(strtab + offset, limit));
        }
        return needed;
    }

} // namespace droidpack::package
