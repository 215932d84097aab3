#include "io/json_reader.hpp"

#include <fstream>
#include <stdexcept>

namespace composedeck::io
{

    nlohmann::json loadJsonFile(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + path.string());
        }

        nlohmann::json data;
        try
        {
            in >> data;
        }
        catch (const nlohmann::json::parse_error &e)
        {
            throw std::runtime_error("Malformed JSON in " + path.string() + ": " + e.what());
        }
        if (!data.is_object() && !data.is_array())
        {
            throw std::runtime_error("JSON root is not object or array: " + path.string());
        }
        return data;
    }

} // namespace composedeck::io
