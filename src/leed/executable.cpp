#include "leedopt/leed/executable.hpp"
#include "leedopt/core/exception.hpp"

#include <unistd.h>

namespace leedopt::leed {

    bool IsExecutable(const fs::path& path)
    {
        std::error_code ec;
        if (!fs::exists(path, ec) || fs::is_directory(path, ec)) return false;
        return access(path.c_str(), X_OK) == 0;
    }

    fs::path ExpandUser(const std::string& name)
    {
        if (name.empty() || name[0] != '~') return name;

        // only "~" and "~/..." name the current user
        if (name.size() > 1 && name[1] != '/') return name;

        const char* home = std::getenv("HOME");
        if (home == nullptr) return name;
        return fs::path(home + name.substr(1));
    }

    fs::path ResolveExecutable(const std::string& name, const fs::path& rootDir, const std::string& searchPath)
    {
        fs::path resolved;

        if (fs::path(name).has_parent_path()) {
            // explicit location, PATH is ignored
            resolved = rootDir / ExpandUser(name);
        }
        else {
            std::vector<fs::path> candidates = {rootDir};
            std::stringstream ss(searchPath);
            std::string dir;
            while (std::getline(ss, dir, ':')) {
                candidates.emplace_back(dir.empty() ? "." : dir);
            }

            for (const auto& candidate : candidates) {
                resolved = candidate / name;
                if (IsExecutable(resolved)) break;
            }
        }

        if (!IsExecutable(resolved)) {
            throw InputError(std::format("ERROR: solver ({}) is not found", name));
        }
        // stages are exec'd from inside the workspace
        return fs::absolute(resolved);
    }

    fs::path ResolveExecutable(const std::string& name, const fs::path& rootDir)
    {
        const char* path = std::getenv("PATH");
        return ResolveExecutable(name, rootDir, path ? path : "");
    }

} // namespace leedopt::leed
