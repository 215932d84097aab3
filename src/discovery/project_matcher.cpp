#include "discovery/project_matcher.hpp"

#include <algorithm>
#include <future>
#include <system_error>
#include <unordered_map>
#include <utility>

#include "core/strings.hpp"
#include "discovery/action_classifier.hpp"
#include "discovery/compose_file_cache.hpp"
#include "discovery/conflict_resolver.hpp"
#include "discovery/path_validator.hpp"

namespace fs = std::filesystem;

namespace composedeck::discovery
{

    namespace
    {

        constexpr const char *kNoFileWarning = "No compose file found for this project";
        constexpr const char *kDisabledWarning = "Project is disabled (x-disabled: true)";

        std::string normalizePath(const std::string &path)
        {
            std::string out = path;
            std::replace(out.begin(), out.end(), '\\', '/');
            while (out.size() > 1 && out.back() == '/')
            {
                out.pop_back();
            }
            return out;
        }

        // Prefix test that only matches on a path segment boundary.
        std::optional<std::string> stripPrefix(const std::string &path, const std::string &prefix)
        {
            if (prefix.empty() || path.size() < prefix.size())
            {
                return std::nullopt;
            }
            if (!equalsIgnoreCase(path.substr(0, prefix.size()), prefix))
            {
                return std::nullopt;
            }
            if (path.size() == prefix.size())
            {
                return std::string();
            }
            if (path[prefix.size()] != '/' && prefix.back() != '/')
            {
                return std::nullopt;
            }
            std::string rest = path.substr(prefix.size());
            while (!rest.empty() && rest.front() == '/')
            {
                rest.erase(rest.begin());
            }
            return rest;
        }

        std::string combine(const std::string &base, const std::string &relative)
        {
            const std::string normalizedBase = normalizePath(base);
            if (relative.empty())
            {
                return normalizedBase;
            }
            if (!normalizedBase.empty() && normalizedBase.back() == '/')
            {
                return normalizedBase + relative;
            }
            return normalizedBase + "/" + relative;
        }

        std::vector<std::string> splitSegments(const std::string &path)
        {
            std::vector<std::string> out;
            std::string current;
            for (char c : path)
            {
                if (c == '/')
                {
                    if (!current.empty())
                    {
                        out.push_back(current);
                    }
                    current.clear();
                    continue;
                }
                current.push_back(c);
            }
            if (!current.empty())
            {
                out.push_back(current);
            }
            return out;
        }

        std::string fileNameOf(const std::string &path)
        {
            const auto segments = splitSegments(normalizePath(path));
            return segments.empty() ? std::string() : segments.back();
        }

        std::string parentNameOf(const std::string &path)
        {
            const auto segments = splitSegments(normalizePath(path));
            return segments.size() < 2 ? std::string() : segments[segments.size() - 2];
        }

        // Case is folded only where the filesystem itself ignores it.
        std::string pathKey(const std::string &path)
        {
            const std::string normalized = normalizePath(path);
            return kCaseInsensitiveFs ? lower(normalized) : normalized;
        }

        std::vector<model::ServiceInfo> servicesFromFile(
            const std::string &projectName,
            const model::DiscoveredFile &file,
            const std::string &state)
        {
            std::vector<model::ServiceInfo> out;
            out.reserve(file.services.size());
            for (const auto &name : file.services)
            {
                model::ServiceInfo service;
                service.id = projectName + "_" + name;
                service.name = name;
                service.state = state;
                out.push_back(std::move(service));
            }
            return out;
        }

        class FileIndex
        {
        public:
            explicit FileIndex(const model::DiscoveredFileList &files)
                : files_(files), matched_(files.size(), false)
            {
                for (std::size_t i = 0; i < files.size(); ++i)
                {
                    byName_.emplace(lower(files[i].projectName), i);
                    byPath_.emplace(pathKey(files[i].filePath), i);
                }
            }

            const model::DiscoveredFile *claimByName(const std::string &name)
            {
                auto it = byName_.find(lower(name));
                return it == byName_.end() ? nullptr : claim(it->second);
            }

            const model::DiscoveredFile *claimByPath(const std::string &path)
            {
                auto it = byPath_.find(pathKey(path));
                return it == byPath_.end() ? nullptr : claim(it->second);
            }

            const model::DiscoveredFile *claimByFileAndDirectory(const std::string &fileName, const std::string &dirName)
            {
                if (fileName.empty() || dirName.empty())
                {
                    return nullptr;
                }
                for (std::size_t i = 0; i < files_.size(); ++i)
                {
                    if (matched_[i])
                    {
                        continue;
                    }
                    if (equalsIgnoreCase(fileNameOf(files_[i].filePath), fileName) &&
                        equalsIgnoreCase(fileNameOf(files_[i].directoryPath), dirName))
                    {
                        return claim(i);
                    }
                }
                return nullptr;
            }

            std::vector<const model::DiscoveredFile *> unclaimed() const
            {
                std::vector<const model::DiscoveredFile *> out;
                for (std::size_t i = 0; i < files_.size(); ++i)
                {
                    if (!matched_[i])
                    {
                        out.push_back(&files_[i]);
                    }
                }
                return out;
            }

        private:
            const model::DiscoveredFile *claim(std::size_t index)
            {
                if (matched_[index])
                {
                    return nullptr;
                }
                matched_[index] = true;
                return &files_[index];
            }

            const model::DiscoveredFileList &files_;
            std::vector<bool> matched_;
            std::unordered_map<std::string, std::size_t> byName_;
            std::unordered_map<std::string, std::size_t> byPath_;
        };

    } // namespace

    ProjectMatcher::ProjectMatcher(
        ComposeFileCache &cache,
        RuntimeProvider provider,
        DiscoverySettings settings,
        const composedeck::Context &ctx)
        : cache_(cache), provider_(std::move(provider)), settings_(std::move(settings)), ctx_(ctx)
    {
    }

    std::optional<std::string> ProjectMatcher::toContainerPath(const std::string &hostPath) const
    {
        if (trim(hostPath).empty())
        {
            return std::nullopt;
        }

        const std::string host = normalizePath(hostPath);
        const std::string root = normalizePath(settings_.rootPath.generic_string());

        if (stripPrefix(host, root).has_value())
        {
            return hostPath;
        }

        if (!settings_.hostPathMapping.empty())
        {
            const auto relative = stripPrefix(host, normalizePath(settings_.hostPathMapping));
            if (relative.has_value())
            {
                std::string containerPath = combine(root, relative.value());
                ctx_.debug("Converted host path to container path: ", hostPath, " -> ", containerPath);
                return containerPath;
            }
        }

        // Probe successively shorter suffixes of the host path under rootPath.
        const auto parts = splitSegments(host);
        for (std::size_t start = 1; start < parts.size(); ++start)
        {
            std::string relative;
            for (std::size_t i = start; i < parts.size(); ++i)
            {
                if (!relative.empty())
                {
                    relative += "/";
                }
                relative += parts[i];
            }
            const std::string candidate = combine(root, relative);
            std::error_code ec;
            if (fs::is_regular_file(candidate, ec))
            {
                ctx_.debug("Auto-detected path mapping: ", hostPath, " -> ", candidate);
                return candidate;
            }
        }

        ctx_.debug("Could not convert host path to container path: ", hostPath,
                   ". Consider setting HostPathMapping in configuration.");
        return std::nullopt;
    }

    model::UnifiedView ProjectMatcher::getUnifiedProjects(int userId) const
    {
        ctx_.debug("Getting unified project list for user ", userId);

        auto liveFuture = std::async(std::launch::async, provider_, userId);
        const model::DiscoveredFileList discovered = cache_.getOrScan();
        const std::vector<model::LiveProject> live = liveFuture.get();

        model::ResolutionResult resolution = resolveConflicts(discovered, ctx_);
        FileIndex index(resolution.resolvedFiles);

        model::UnifiedView view;
        view.conflicts = std::move(resolution.conflictErrors);
        view.projects.reserve(live.size() + resolution.resolvedFiles.size());

        for (const auto &project : live)
        {
            const model::DiscoveredFile *file = index.claimByName(project.name);

            for (std::size_t i = 0; file == nullptr && i < project.configFiles.size(); ++i)
            {
                const auto containerPath = toContainerPath(project.configFiles[i]);
                if (containerPath.has_value())
                {
                    file = index.claimByPath(containerPath.value());
                }
            }

            if (file == nullptr && !project.configFiles.empty())
            {
                const std::string &reported = project.configFiles.front();
                file = index.claimByFileAndDirectory(fileNameOf(reported), parentNameOf(reported));
            }

            model::UnifiedProject entry;
            entry.name = project.name;
            entry.path = project.path;
            entry.state = project.state;

            if (file != nullptr)
            {
                ctx_.debug("Matched live project ", project.name, " to ", file->filePath);
                entry.hasDefinitionFile = true;
                entry.definitionFilePath = file->filePath;
                entry.services = project.services.empty() ? servicesFromFile(project.name, *file, "unknown")
                                                          : project.services;
                if (file->isDisabled)
                {
                    entry.warning = kDisabledWarning;
                }
            }
            else
            {
                ctx_.warn("No compose file found for live project ", project.name);
                entry.hasDefinitionFile = false;
                entry.services = project.services;
                entry.warning = kNoFileWarning;
            }

            entry.availableActions = computeActions(entry.hasDefinitionFile, entry.state);
            view.projects.push_back(std::move(entry));
        }

        const auto unmatched = index.unclaimed();
        for (const auto *file : unmatched)
        {
            model::UnifiedProject entry;
            entry.name = file->projectName;
            entry.path = file->directoryPath;
            entry.state = kNotStartedState;
            entry.hasDefinitionFile = true;
            entry.definitionFilePath = file->filePath;
            entry.services = servicesFromFile(file->projectName, *file, kNotStartedState);
            if (file->isDisabled)
            {
                entry.warning = kDisabledWarning;
            }
            entry.availableActions = computeActions(true, entry.state);
            view.projects.push_back(std::move(entry));
        }

        ctx_.debug("Unified project list complete: ", view.projects.size(), " projects (", live.size(),
                   " live, ", unmatched.size(), " not-started, ", view.conflicts.size(), " conflicts)");
        return view;
    }

} // namespace composedeck::discovery
