/**
 * leedopt - Main Entry Point
 */

#include "leedopt/core/solver.hpp"

#include <iostream>

int main(int argc, char *argv[]) {
    // 1. Builds the solver
    leedopt::RkoSolver rko;

    // 2. Reads CLI, run file, resolves the LEED executables
    int status = rko.init(argc, argv);
    if (status != 0) return (status > 0) ? 0 : 1;

    // 3. Runs the search and stores the results
    try {
        rko.run();
        rko.writeResults();
    } catch (const std::exception &e) {
        std::cerr << "\nRun Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
