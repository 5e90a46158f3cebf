#pragma once
#include "leedopt/core/data.hpp"

namespace leedopt::core {

    // Abstract interface between the search methods and the problem being optimized
    class IProblem {
        public:
            virtual ~IProblem() = default;

            // Maps a random-key solution into an objective value (lower is better).
            // Called concurrently from every search thread.
            virtual double evaluate(const TSol& s) const = 0;

            virtual int getDimension() const = 0;
        };

}
