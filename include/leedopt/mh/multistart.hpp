#pragma once

#include "leedopt/core/data.hpp"
#include "leedopt/core/iproblem.hpp"

namespace leedopt::mh {

    /**
     * Method: MultiStart
     * Description: samples random parameter vectors and keeps the best one
     */
    void MultiStart(const leedopt::core::TRunData &runData, const leedopt::core::IProblem &problem);

} // namespace leedopt::mh
