#include "core/settings.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>

#include "io/json_reader.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace composedeck
{

    namespace
    {

        int readNonNegative(const json &node, const char *key, int fallback, const fs::path &configPath)
        {
            if (!node.contains(key))
            {
                return fallback;
            }
            const json &value = node[key];
            if (!value.is_number_integer())
            {
                throw std::runtime_error(std::string(key) + " must be an integer in " + configPath.string());
            }
            if (value.is_number_unsigned())
            {
                if (value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
                {
                    throw std::runtime_error(std::string(key) + " is out of range in " + configPath.string());
                }
                return static_cast<int>(value.get<std::uint64_t>());
            }
            const std::int64_t out = value.get<std::int64_t>();
            if (out < 0)
            {
                throw std::runtime_error(std::string(key) + " must not be negative in " + configPath.string());
            }
            if (out > std::numeric_limits<int>::max())
            {
                throw std::runtime_error(std::string(key) + " is out of range in " + configPath.string());
            }
            return static_cast<int>(out);
        }

        std::string readString(const json &node, const char *key, const std::string &fallback, const fs::path &configPath)
        {
            if (!node.contains(key) || node[key].is_null())
            {
                return fallback;
            }
            if (!node[key].is_string())
            {
                throw std::runtime_error(std::string(key) + " must be a string in " + configPath.string());
            }
            return node[key].get<std::string>();
        }

    } // namespace

    fs::path defaultSettingsPath()
    {
        return fs::current_path() / "composedeck.json";
    }

    DiscoverySettings loadSettings(const fs::path &configPath)
    {
        json data = io::loadJsonFile(configPath);
        if (!data.is_object())
        {
            throw std::runtime_error("Settings root is not object: " + configPath.string());
        }

        json root = data;
        if (data.contains("Configuration") && data["Configuration"].is_object())
        {
            root = data["Configuration"];
        }

        DiscoverySettings settings;
        if (!root.contains("Discovery"))
        {
            return settings;
        }
        const json &discovery = root["Discovery"];
        if (!discovery.is_object())
        {
            throw std::runtime_error("Discovery section is not object: " + configPath.string());
        }

        const std::string rootPath = readString(discovery, "RootPath", settings.rootPath.string(), configPath);
        if (rootPath.empty())
        {
            throw std::runtime_error("RootPath must not be empty in " + configPath.string());
        }
        fs::path resolvedRoot(rootPath);
        if (!resolvedRoot.is_absolute())
        {
            resolvedRoot = fs::absolute(configPath.parent_path() / resolvedRoot);
        }
        settings.rootPath = resolvedRoot;

        settings.scanDepthLimit = readNonNegative(discovery, "ScanDepthLimit", settings.scanDepthLimit, configPath);
        settings.cacheDurationSeconds =
            readNonNegative(discovery, "CacheDurationSeconds", settings.cacheDurationSeconds, configPath);
        settings.maxFileSizeKB = readNonNegative(discovery, "MaxFileSizeKB", settings.maxFileSizeKB, configPath);
        settings.hostPathMapping = readString(discovery, "HostPathMapping", settings.hostPathMapping, configPath);
        return settings;
    }

} // namespace composedeck
