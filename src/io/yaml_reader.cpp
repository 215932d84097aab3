#include "io/yaml_reader.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace composedeck::io
{

    std::optional<YAML::Node> decodeYaml(const std::string &text)
    {
        try
        {
            YAML::Node root = YAML::Load(text);
            if (!root.IsDefined() || root.IsNull())
            {
                return std::nullopt;
            }
            return root;
        }
        catch (const YAML::Exception &)
        {
            return std::nullopt;
        }
    }

    std::string readTextFile(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            throw std::runtime_error("Could not open file: " + path.string());
        }
        std::ostringstream out;
        out << in.rdbuf();
        if (in.bad())
        {
            throw std::runtime_error("Could not read file: " + path.string());
        }
        return out.str();
    }

} // namespace composedeck::io
