#pragma once

#include "leedopt/core/common.hpp"

namespace leedopt::core {

    //--------------------------------------------------------------------------
    // Struct: TSol
    // Description: Represents a solution within the Random-Key Optimization context
    //--------------------------------------------------------------------------
    struct TSol
    {
        std::vector<double> rk;                 // Random-key vector in [0,1) (decoder input)
        double ofv = kInfeasible;               // Objective function value (R-factor)
        double best_time = 0.0;                 // Time to find this specific solution
        std::string nameMH;                     // Name of the metaheuristic that found it

        TSol() = default;
    };

    //--------------------------------------------------------------------------
    // Struct: TRunData
    // Description: Configuration variables for the search process
    //--------------------------------------------------------------------------
    struct TRunData
    {
        int MAXTIME = 60;                       // maximum running time of one run in seconds (stop condition)
        int MAXRUNS = 1;                        // number of independent runs
        int debug = 0;                          // 1 - print the progress of the search on screen
        float restart = 1.0f;                   // fraction of MAXTIME a method runs before the pool restarts
        int sizePool = 10;                      // size of the elite pool of solutions
        std::string paramFile = "config/yaml/param-offline.yaml"; // tuning parameters of the metaheuristics
    };

} // namespace leedopt::core
