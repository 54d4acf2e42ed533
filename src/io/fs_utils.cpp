#include "io/fs_utils.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <limits>
#include <system_error>
#include <utility>

#include "core/error.hpp"

namespace fs = std::filesystem;

namespace droidpack::io
{

    namespace
    {

        // "34.0.0" outranks "34.0.0-rc1"; otherwise compare numerically, then bytewise.
        bool olderVersion(const std::string &a, const std::string &b)
        {
            const auto ka = numericKey(a);
            const auto kb = numericKey(b);
            if (ka != kb)
            {
                return ka < kb;
            }
            const bool preA = a.find('-') != std::string::npos;
            const bool preB = b.find('-') != std::string::npos;
            if (preA != preB)
            {
                return preA;
            }
            return a < b;
        }

    } // namespace

    bool ensureDir(const fs::path &path)
    {
        std::error_code ec;
        fs::create_directories(path, ec);
        // Concurrent workers may create it first; the end state decides.
        return fs::is_directory(path, ec);
    }

    std::vector<std::string> listFilesSorted(const fs::path &root)
    {
        std::vector<std::string> files;
        std::error_code ec;
        if (!fs::is_directory(root, ec))
        {
            return files;
        }

        fs::recursive_directory_iterator walk(root, fs::directory_options::none, ec);
        for (; !ec && walk != fs::recursive_directory_iterator(); walk.increment(ec))
        {
            if (walk->is_regular_file(ec))
            {
                files.push_back(walk->path().lexically_relative(root).generic_string());
            }
        }
        if (ec)
        {
            throw IoError(root, "Failed walk directory (" + ec.message() + ")");
        }

        std::sort(files.begin(), files.end());
        return files;
    }

    std::vector<int> numericKey(const std::string &value)
    {
        constexpr long long kCap = std::numeric_limits<int>::max();
        std::vector<int> key;
        long long current = -1;
        for (char ch : value)
        {
            if (ch >= '0' && ch <= '9')
            {
                current = std::min(kCap, (current < 0 ? 0 : current * 10) + (ch - '0'));
            }
            else if (current >= 0)
            {
                key.push_back(static_cast<int>(current));
                current = -1;
            }
        }
        if (current >= 0)
        {
            key.push_back(static_cast<int>(current));
        }
        if (key.empty())
        {
            key.push_back(0);
        }
        return key;
    }

    std::optional<std::string> latestSubdirName(const fs::path &root)
    {
        std::optional<std::string> newest;
        std::error_code ec;
        if (!fs::is_directory(root, ec))
        {
            return newest;
        }

        for (const auto &entry : fs::directory_iterator(root, ec))
        {
            if (!entry.is_directory(ec))
            {
                continue;
            }
            std::string name = entry.path().filename().string();
            if (!newest || olderVersion(*newest, name))
            {
                newest = std::move(name);
            }
        }
        return newest;
    }

    std::vector<std::uint8_t> readBinaryFile(const fs::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            throw IoError(path, "Failed open file");
        }
        std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (in.bad())
        {
            throw IoError(path, "Failed read file");
        }
        return data;
    }

    std::string readTextFile(const fs::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            throw IoError(path, "Failed open file");
        }
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    void writeBinaryFile(const fs::path &path, const std::vector<std::uint8_t> &data)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw IoError(path, "Failed create file");
        }
        out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!out)
        {
            throw IoError(path, "Failed write file");
        }
    }

    void writeTextFile(const fs::path &path, const std::string &text)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw IoError(path, "Failed create file");
        }
        out << text;
        if (!out)
        {
            throw IoError(path, "Failed write file");
        }
    }

    bool removePath(const fs::path &path, const droidpack::Context &ctx)
    {
        std::error_code ec;
        const auto removed = fs::remove_all(path, ec);
        if (ec)
        {
            ctx.warn("Failed remove ", path.string(), " : ", ec.message());
            return false;
        }
        return removed > 0;
    }

} // namespace droidpack::io
