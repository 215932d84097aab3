#include "discovery/compose_file_scanner.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "core/strings.hpp"
#include "io/fs_utils.hpp"
#include "io/yaml_reader.hpp"

namespace fs = std::filesystem;

namespace composedeck::discovery
{

    namespace
    {

        constexpr std::array<const char *, 4> kCanonicalFileNames = {
            "docker-compose.yml", "docker-compose.yaml", "compose.yml", "compose.yaml"};

        bool isCanonicalFileName(const std::string &fileName)
        {
            return std::any_of(kCanonicalFileNames.begin(), kCanonicalFileNames.end(), [&](const char *name)
                               { return equalsIgnoreCase(fileName, name); });
        }

        std::optional<std::string> explicitProjectName(const YAML::Node &root)
        {
            const YAML::Node name = root["name"];
            if (!name || !name.IsScalar())
            {
                return std::nullopt;
            }
            const std::string value = trim(name.Scalar());
            if (value.empty())
            {
                return std::nullopt;
            }
            return value;
        }

        bool readDisabledFlag(const YAML::Node &root)
        {
            const YAML::Node flag = root["x-disabled"];
            if (!flag || !flag.IsScalar())
            {
                return false;
            }
            // Only "true" counts; yes/on/y leave the file active.
            return equalsIgnoreCase(trim(flag.Scalar()), "true");
        }

        std::vector<std::string> serviceNames(const YAML::Node &services)
        {
            std::vector<std::string> out;
            for (const auto &item : services)
            {
                if (!item.first.IsScalar())
                {
                    continue;
                }
                std::string name = item.first.Scalar();
                if (name.empty() || std::find(out.begin(), out.end(), name) != out.end())
                {
                    continue;
                }
                out.push_back(std::move(name));
            }
            return out;
        }

    } // namespace

    std::string defaultProjectName(const fs::path &file)
    {
        const std::string stem = file.stem().string();
        const std::string directoryName = file.parent_path().filename().string();
        if (directoryName.empty())
        {
            return stem;
        }

        if (isCanonicalFileName(file.filename().string()) || equalsIgnoreCase(stem, directoryName))
        {
            return directoryName;
        }
        return directoryName + "-" + stem;
    }

    ComposeFileScanner::ComposeFileScanner(DiscoverySettings settings, const composedeck::Context &ctx)
        : settings_(std::move(settings)), ctx_(ctx)
    {
    }

    model::DiscoveredFileList ComposeFileScanner::scan() const
    {
        const auto started = std::chrono::steady_clock::now();
        ctx_.debug("Starting compose file scan in root path: ", settings_.rootPath.string());

        const auto candidates = io::listDefinitionFiles(settings_.rootPath, settings_.scanDepthLimit, ctx_);

        model::DiscoveredFileList out;
        for (const auto &file : candidates)
        {
            auto parsed = parseOne(file);
            if (parsed.has_value())
            {
                out.push_back(std::move(parsed.value()));
            }
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        ctx_.debug("Compose file scan completed in ", elapsed.count(), "ms. Candidates: ", candidates.size(),
                   ", valid: ", out.size());
        return out;
    }

    std::optional<model::DiscoveredFile> ComposeFileScanner::parseOne(const fs::path &file) const
    {
        std::error_code ec;
        const std::uintmax_t size = fs::file_size(file, ec);
        if (ec)
        {
            ctx_.debug("Cannot stat ", file.string(), " : ", ec.message());
            return std::nullopt;
        }
        const std::uintmax_t maxBytes = static_cast<std::uintmax_t>(settings_.maxFileSizeKB) * 1024U;
        if (size > maxBytes)
        {
            ctx_.warn("Compose file exceeds size limit: ", file.string(), " (", size / 1024U, " KB > ",
                      settings_.maxFileSizeKB, " KB allowed)");
            return std::nullopt;
        }

        std::string text;
        try
        {
            text = io::readTextFile(file);
        }
        catch (const std::runtime_error &e)
        {
            ctx_.debug(e.what());
            return std::nullopt;
        }

        // ${VAR} placeholders stay as literal text; the runtime resolves them.
        const auto document = io::decodeYaml(text);
        if (!document.has_value() || !document->IsMap())
        {
            ctx_.debug("File ", file.string(), " is not a YAML mapping");
            return std::nullopt;
        }
        const YAML::Node &root = document.value();

        const YAML::Node services = root["services"];
        if (!services || !services.IsMap() || services.size() == 0)
        {
            ctx_.debug("File ", file.string(), " has no services defined");
            return std::nullopt;
        }

        model::DiscoveredFile out;
        out.filePath = file.string();
        out.directoryPath = file.parent_path().string();
        out.projectName = explicitProjectName(root).value_or(defaultProjectName(file));
        out.isDisabled = readDisabledFlag(root);
        out.services = serviceNames(services);
        out.isValid = true;
        out.lastModified = fs::last_write_time(file, ec);
        if (ec)
        {
            out.lastModified = fs::file_time_type{};
        }

        if (out.services.empty())
        {
            return std::nullopt;
        }
        return out;
    }

} // namespace composedeck::discovery
