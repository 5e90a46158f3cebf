#include "leedopt/leed/workspace.hpp"
#include "leedopt/core/exception.hpp"

namespace leedopt::leed {

    std::string WorkspaceName(int step, int set)
    {
        if (step < 0 || set < 0) {
            throw InputError(std::format("ERROR: negative evaluation index (step {}, set {})", step, set));
        }
        return std::format("Log{:08d}_{:08d}", step, set);
    }

    void CheckReferenceFiles(const fs::path& baseDir)
    {
        for (const auto& file : kReferenceFiles) {
            if (!fs::exists(baseDir / file)) {
                throw InputError(std::format("ERROR: input file ({}) is not found in ({})", file, baseDir.string()));
            }
        }
    }

    void CopyReference(const fs::path& baseDir, const fs::path& workDir)
    {
        fs::create_directories(workDir);
        fs::copy(baseDir, workDir,
                 fs::copy_options::recursive | fs::copy_options::overwrite_existing);
    }

} // namespace leedopt::leed
