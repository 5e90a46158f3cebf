#pragma once

#include "leedopt/core/common.hpp"

namespace leedopt::leed {

    /**
     * Method: IsExecutable
     * Description: true if path names a file the process may execute
     */
    bool IsExecutable(const fs::path& path);

    /**
     * Method: ExpandUser
     * Description: replace a leading "~" with $HOME
     */
    fs::path ExpandUser(const std::string& name);

    /**
     * Method: ResolveExecutable
     * Description: locate a solver executable.
     *  - a name with a directory component is taken relative to rootDir (after
     *    ~ expansion) and searchPath is not consulted;
     *  - a bare name is looked up in rootDir, then in every directory of
     *    searchPath (colon separated), first executable match wins.
     * Throws InputError "ERROR: solver (<name>) is not found" if the result
     * is not executable.
     */
    fs::path ResolveExecutable(const std::string& name, const fs::path& rootDir, const std::string& searchPath);

    // Same as above, searching $PATH
    fs::path ResolveExecutable(const std::string& name, const fs::path& rootDir);

} // namespace leedopt::leed
