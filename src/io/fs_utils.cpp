#include "io/fs_utils.hpp"

#include <algorithm>
#include <array>
#include <system_error>

#include "core/strings.hpp"

namespace fs = std::filesystem;

namespace composedeck::io
{

    namespace
    {

        constexpr std::array<const char *, 20> kExcludedDirectories = {
            "node_modules", ".git", ".svn", ".hg", "vendor",
            "__pycache__", ".venv", "venv", "bin", "obj",
            ".vs", ".idea", "packages", "target", "dist",
            "build", ".next", ".nuxt", "coverage", ".cache"};

        bool readDirectory(
            const fs::path &dir,
            std::vector<fs::path> &files,
            std::vector<fs::path> &subdirs,
            std::error_code &ec)
        {
            fs::directory_iterator it(dir, ec);
            if (ec)
            {
                return false;
            }
            fs::directory_iterator end;
            for (; it != end; it.increment(ec))
            {
                if (ec)
                {
                    return false;
                }
                const fs::directory_entry &entry = *it;
                std::error_code statEc;
                if (entry.is_symlink(statEc))
                {
                    if (entry.is_regular_file(statEc))
                    {
                        files.push_back(entry.path());
                    }
                    continue;
                }
                if (entry.is_directory(statEc))
                {
                    subdirs.push_back(entry.path());
                }
                else if (entry.is_regular_file(statEc))
                {
                    files.push_back(entry.path());
                }
            }
            if (ec)
            {
                return false;
            }

            std::sort(files.begin(), files.end());
            std::sort(subdirs.begin(), subdirs.end());
            return true;
        }

        void walk(
            const fs::path &dir,
            int depth,
            int depthLimit,
            std::vector<fs::path> &out,
            const composedeck::Context &ctx);

        void collect(
            const fs::path &dir,
            const std::vector<fs::path> &files,
            const std::vector<fs::path> &subdirs,
            int depth,
            int depthLimit,
            std::vector<fs::path> &out,
            const composedeck::Context &ctx)
        {
            for (const auto &file : files)
            {
                if (isDefinitionFileName(file))
                {
                    out.push_back(file);
                }
            }

            if (depth >= depthLimit)
            {
                if (!subdirs.empty())
                {
                    ctx.debug("Maximum scan depth ", depthLimit, " reached at ", dir.string());
                }
                return;
            }

            for (const auto &sub : subdirs)
            {
                if (isExcludedDirectory(sub.filename().string()))
                {
                    ctx.debug("Skipping excluded directory: ", sub.string());
                    continue;
                }
                walk(sub, depth + 1, depthLimit, out, ctx);
            }
        }

        void walk(
            const fs::path &dir,
            int depth,
            int depthLimit,
            std::vector<fs::path> &out,
            const composedeck::Context &ctx)
        {
            std::vector<fs::path> files;
            std::vector<fs::path> subdirs;
            std::error_code ec;
            if (!readDirectory(dir, files, subdirs, ec))
            {
                ctx.warn("Skipping unreadable directory ", dir.string(), " : ", ec.message());
                return;
            }
            collect(dir, files, subdirs, depth, depthLimit, out, ctx);
        }

    } // namespace

    bool isDefinitionFileName(const fs::path &path)
    {
        const std::string ext = lower(path.extension().string());
        return ext == ".yml" || ext == ".yaml";
    }

    bool isExcludedDirectory(const std::string &name)
    {
        return std::any_of(kExcludedDirectories.begin(), kExcludedDirectories.end(), [&](const char *excluded)
                           { return equalsIgnoreCase(name, excluded); });
    }

    std::vector<fs::path> listDefinitionFiles(
        const fs::path &root,
        int depthLimit,
        const composedeck::Context &ctx)
    {
        std::error_code ec;
        if (!fs::is_directory(root, ec))
        {
            throw ScanError("Scan root is not an accessible directory: " + root.string());
        }

        std::vector<fs::path> rootFiles;
        std::vector<fs::path> rootSubdirs;
        if (!readDirectory(root, rootFiles, rootSubdirs, ec))
        {
            throw ScanError("Cannot read scan root " + root.string() + " : " + ec.message());
        }

        std::vector<fs::path> out;
        collect(root, rootFiles, rootSubdirs, 0, depthLimit, out, ctx);
        return out;
    }

} // namespace composedeck::io
