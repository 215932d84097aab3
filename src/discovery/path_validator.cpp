#include "discovery/path_validator.hpp"

#include <stdexcept>
#include <system_error>
#include <utility>

#include "core/strings.hpp"

namespace fs = std::filesystem;

namespace composedeck::discovery
{

    namespace
    {

        constexpr std::size_t kMaxPathLength = 4096;
        constexpr std::size_t kMaxComponentLength = 255;

        bool componentsWithinLimits(const fs::path &path)
        {
            for (const auto &part : path)
            {
                if (part.native().size() > kMaxComponentLength)
                {
                    return false;
                }
            }
            return true;
        }

        // Resolves symlinks for the existing prefix and folds "." and ".."
        // lexically for the rest.
        bool normalise(const fs::path &input, fs::path &out)
        {
            std::error_code ec;
            fs::path absolute = fs::absolute(input, ec);
            if (ec)
            {
                return false;
            }
            out = fs::weakly_canonical(absolute, ec);
            if (ec)
            {
                return false;
            }
            out = out.lexically_normal();
            if (!out.has_filename() && out.has_parent_path() && out != out.root_path())
            {
                out = out.parent_path();
            }
            return true;
        }

        bool sameComponent(const fs::path &a, const fs::path &b, bool ignoreCase)
        {
            if (ignoreCase)
            {
                return equalsIgnoreCase(a.string(), b.string());
            }
            return a == b;
        }

    } // namespace

    bool isWithinRoot(const fs::path &candidate, const fs::path &root, bool ignoreCase)
    {
        auto fileIt = candidate.begin();
        auto rootIt = root.begin();

        while (rootIt != root.end())
        {
            // A trailing separator shows up as an empty component.
            if (rootIt->empty())
            {
                ++rootIt;
                continue;
            }
            if (fileIt == candidate.end() || !sameComponent(*fileIt, *rootIt, ignoreCase))
            {
                return false;
            }
            ++fileIt;
            ++rootIt;
        }
        return true;
    }

    PathValidator::PathValidator(fs::path root, const composedeck::Context &ctx)
        : root_(std::move(root)), ctx_(ctx)
    {
    }

    bool PathValidator::isValid(const std::string &path) const
    {
        if (trim(path).empty())
        {
            ctx_.warn("Path validation failed: empty or null path");
            return false;
        }
        if (path.size() > kMaxPathLength)
        {
            ctx_.warn("Path validation failed: path too long (", path.size(), " chars)");
            return false;
        }
        if (path.find('\0') != std::string::npos)
        {
            ctx_.warn("Path validation failed: contains invalid characters");
            return false;
        }

        try
        {
            const fs::path candidate(path);
            if (!componentsWithinLimits(candidate))
            {
                ctx_.warn("Path validation failed: path component too long in ", path);
                return false;
            }

            fs::path resolvedRoot;
            fs::path resolvedPath;
            if (!normalise(root_, resolvedRoot) || !normalise(candidate, resolvedPath))
            {
                ctx_.warn("Path validation failed for: ", path);
                return false;
            }

            if (!isWithinRoot(resolvedPath, resolvedRoot, kCaseInsensitiveFs))
            {
                ctx_.warn("Path traversal attempt detected. Path: ", path, ", Root: ", resolvedRoot.string());
                return false;
            }
            return true;
        }
        catch (const std::exception &e)
        {
            ctx_.warn("Path validation failed for: ", path, " : ", e.what());
            return false;
        }
    }

} // namespace composedeck::discovery
