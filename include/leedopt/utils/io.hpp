#pragma once

#include "leedopt/core/data.hpp"
#include "leedopt/leed/leed_problem.hpp"

namespace leedopt::utils {

    /**
     * Writes the best R-factor and its parameters:
     *   fx = <rfactor>
     *   x1 = <value>
     *   ...
     */
    void WriteSolution(const fs::path& filename, double rfactor, const std::vector<double>& x);

    /**
     * Writes one line per evaluation: step set x1 .. xN rfactor
     * Failed evaluations are commented out with '#'.
     */
    void WriteEvaluations(const fs::path& filename, const std::vector<leedopt::leed::EvaluationRecord>& history);

} // namespace leedopt::utils
