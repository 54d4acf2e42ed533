#include "io/json_reader.hpp"

#include <fstream>

#include "core/error.hpp"

namespace droidpack::io
{

    nlohmann::json loadJsonFile(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw ConfigError("could not open JSON file " + path.string());
        }

        nlohmann::json data;
        try
        {
            in >> data;
        }
        catch (const nlohmann::json::parse_error &e)
        {
            throw ConfigError(path.string() + ": " + e.what());
        }
        if (!data.is_object())
        {
            throw ConfigError("JSON root is not object: " + path.string());
        }
        return data;
    }

} // namespace droidpack::io
