#pragma once

#include "leedopt/core/common.hpp"

namespace leedopt::leed {

    // Written by the second stage when it produced I(V) curves
    inline constexpr const char* kMarkerFile = "iv 1";

    // Summary of the search stage
    inline constexpr const char* kSummaryFile = "search.s";

    /**
     * Method: ParseRFactorLine
     * Description: value after the first '=' of a line of search.s.
     * Throws ResultError if it is not a number.
     */
    double ParseRFactorLine(const std::string& line);

    /**
     * Method: ReadRFactor
     * Description: R-factor of the evaluation held in workDir.
     *  - "iv 1" missing: +infinity, search.s is not read;
     *  - otherwise the first line of search.s containing "R-FACTOR".
     * Throws ResultError if search.s is missing or has no R-FACTOR line.
     */
    double ReadRFactor(const fs::path& workDir);

} // namespace leedopt::leed
