#pragma once

#include "leedopt/core/data.hpp"
#include "leedopt/core/iproblem.hpp"

namespace leedopt::mh {

    /**
     * Method: SA
     * Description: Simulated Annealing over the random keys. Parameters
     * (SAmax, alphaSA, betaMin, betaMax, T0) are read from the YAML
     * parameter file; a Nelder-Mead search runs at each temperature level.
     */
    void SA(const leedopt::core::TRunData &runData, const leedopt::core::IProblem &problem);

} // namespace leedopt::mh
