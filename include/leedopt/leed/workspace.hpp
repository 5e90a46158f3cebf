#pragma once

#include "leedopt/core/common.hpp"

namespace leedopt::leed {

    // Files every reference directory must provide
    inline const std::vector<std::string> kReferenceFiles = {"exp.d", "rfac.d", "tleed4.i", "tleed5.i"};

    // Input file carrying the optNNNN placeholders
    inline constexpr const char* kFitFile = "tleed5.i";

    //--------------------------------------------------------------------------
    // Struct: Workspace
    // Description: directory of one evaluation, keyed by (step, set)
    //--------------------------------------------------------------------------
    struct Workspace
    {
        fs::path path;
        int step = 0;
        int set = 0;
    };

    /**
     * Method: WorkspaceName
     * Description: "Log{step:08d}_{set:08d}"; distinct (step, set) give distinct names
     */
    std::string WorkspaceName(int step, int set);

    /**
     * Method: CheckReferenceFiles
     * Description: throws InputError naming the first file of kReferenceFiles
     * missing from baseDir
     */
    void CheckReferenceFiles(const fs::path& baseDir);

    /**
     * Method: CopyReference
     * Description: full recursive copy of baseDir into workDir; parents are
     * created and files already there are overwritten
     */
    void CopyReference(const fs::path& baseDir, const fs::path& workDir);

} // namespace leedopt::leed
