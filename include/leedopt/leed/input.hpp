#pragma once

#include "leedopt/core/common.hpp"

namespace leedopt::leed {

    // Largest number of parameters the 4-digit placeholder index can address
    inline constexpr int kMaxParameters = 10000;

    /**
     * Method: PlaceholderToken
     * Description: "opt" followed by the 4-digit zero-padded index
     */
    std::string PlaceholderToken(int idx);

    /**
     * Method: FormatParameter
     * Description: Fortran F7.4 field: right-justified, width 7, 4 decimals.
     * Wider values are kept whole, never truncated.
     */
    std::string FormatParameter(double value);

    /**
     * Method: SubstituteParameters
     * Description: replace every optNNNN token of contents by the matching
     * formatted parameter
     */
    std::string SubstituteParameters(std::string contents, const std::vector<double>& x);

    /**
     * Method: WriteFitFile
     * Description: rewrite the template file in place with the parameters x
     */
    void WriteFitFile(const fs::path& file, const std::vector<double>& x);

} // namespace leedopt::leed
