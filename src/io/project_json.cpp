#include "io/project_json.hpp"

#include <stdexcept>
#include <string>

#include "discovery/action_classifier.hpp"
#include "io/json_reader.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace composedeck::io
{

    namespace
    {

        std::string stringField(const json &node, const char *key)
        {
            if (!node.contains(key) || !node[key].is_string())
            {
                return {};
            }
            return node[key].get<std::string>();
        }

        std::optional<std::string> optionalField(const json &node, const char *key)
        {
            if (!node.contains(key) || !node[key].is_string())
            {
                return std::nullopt;
            }
            return node[key].get<std::string>();
        }

        std::vector<std::string> toStringList(const json &node)
        {
            std::vector<std::string> out;
            if (!node.is_array())
            {
                return out;
            }
            for (const auto &item : node)
            {
                if (item.is_string() && !item.get<std::string>().empty())
                {
                    out.push_back(item.get<std::string>());
                }
            }
            return out;
        }

        model::ServiceInfo parseService(const json &node)
        {
            model::ServiceInfo service;
            service.id = stringField(node, "id");
            service.name = stringField(node, "name");
            service.image = optionalField(node, "image");
            service.state = stringField(node, "state");
            service.status = stringField(node, "status");
            if (node.contains("ports"))
            {
                service.ports = toStringList(node["ports"]);
            }
            service.health = optionalField(node, "health");
            return service;
        }

        model::LiveProject parseProject(const json &node, std::size_t index)
        {
            if (!node.is_object())
            {
                throw std::runtime_error("Snapshot entry " + std::to_string(index) + " is not object");
            }

            model::LiveProject project;
            project.name = stringField(node, "name");
            if (project.name.empty())
            {
                throw std::runtime_error("Snapshot entry " + std::to_string(index) + " has no name");
            }
            project.path = stringField(node, "path");

            if (node.contains("services") && node["services"].is_array())
            {
                for (const auto &item : node["services"])
                {
                    if (item.is_object())
                    {
                        project.services.push_back(parseService(item));
                    }
                }
            }
            if (node.contains("configFiles"))
            {
                project.configFiles = toStringList(node["configFiles"]);
            }

            project.state = stringField(node, "state");
            if (project.state.empty())
            {
                project.state = discovery::deriveProjectState(project.services);
            }
            return project;
        }

        json optionalJson(const std::optional<std::string> &value)
        {
            return value.has_value() ? json(value.value()) : json(nullptr);
        }

    } // namespace

    std::vector<model::LiveProject> parseLiveProjects(const json &data)
    {
        const json *list = &data;
        if (data.is_object())
        {
            if (!data.contains("projects") || !data["projects"].is_array())
            {
                throw std::runtime_error("Snapshot object has no projects array");
            }
            list = &data["projects"];
        }
        if (!list->is_array())
        {
            throw std::runtime_error("Snapshot root must be an array or an object");
        }

        std::vector<model::LiveProject> out;
        out.reserve(list->size());
        for (std::size_t i = 0; i < list->size(); ++i)
        {
            out.push_back(parseProject((*list)[i], i));
        }
        return out;
    }

    std::vector<model::LiveProject> loadLiveProjects(const fs::path &path)
    {
        try
        {
            return parseLiveProjects(loadJsonFile(path));
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("Invalid snapshot " + path.string() + ": " + e.what());
        }
    }

    json toJson(const model::DiscoveredFile &file)
    {
        return json{
            {"filePath", file.filePath},
            {"projectName", file.projectName},
            {"directoryPath", file.directoryPath},
            {"isValid", file.isValid},
            {"isDisabled", file.isDisabled},
            {"services", file.services},
        };
    }

    json toJson(const model::ConflictError &conflict)
    {
        return json{
            {"projectName", conflict.projectName},
            {"conflictingFiles", conflict.conflictingFiles},
            {"message", conflict.message},
            {"resolutionSteps", conflict.resolutionSteps},
        };
    }

    json toJson(const model::ServiceInfo &service)
    {
        return json{
            {"id", service.id},
            {"name", service.name},
            {"image", optionalJson(service.image)},
            {"state", service.state},
            {"status", service.status},
            {"ports", service.ports},
            {"health", optionalJson(service.health)},
        };
    }

    json toJson(const model::UnifiedProject &project)
    {
        json services = json::array();
        for (const auto &service : project.services)
        {
            services.push_back(toJson(service));
        }

        json actions = json::object();
        for (const auto &[key, allowed] : project.availableActions)
        {
            actions[key] = allowed;
        }

        return json{
            {"name", project.name},
            {"path", project.path},
            {"state", project.state},
            {"hasDefinitionFile", project.hasDefinitionFile},
            {"definitionFilePath", optionalJson(project.definitionFilePath)},
            {"services", services},
            {"warning", optionalJson(project.warning)},
            {"availableActions", actions},
        };
    }

    json toJson(const model::UnifiedView &view)
    {
        json projects = json::array();
        for (const auto &project : view.projects)
        {
            projects.push_back(toJson(project));
        }
        json conflicts = json::array();
        for (const auto &conflict : view.conflicts)
        {
            conflicts.push_back(toJson(conflict));
        }
        return json{{"projects", projects}, {"conflicts", conflicts}};
    }

} // namespace composedeck::io
