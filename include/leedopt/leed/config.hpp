#pragma once

#include "leedopt/core/data.hpp"

#include <yaml-cpp/yaml.h>

namespace leedopt::leed {

    //--------------------------------------------------------------------------
    // Struct: SolverConfig
    // Description: settings of the two-stage LEED solver adapter (solver section)
    //--------------------------------------------------------------------------
    struct SolverConfig
    {
        fs::path rootDir = ".";                     // base of every relative path
        fs::path outputDir = "output";              // hosts the Log########_######## workspaces
        std::string firstSolver = "satl1.exe";      // path_to_first_solver, name or path
        std::string secondSolver = "satl2.exe";     // path_to_second_solver, name or path
        fs::path baseDir;                           // reference directory, relative to rootDir
        bool removeWorkDir = false;                 // delete the workspace after reading the R-factor
        int timeout = 0;                            // seconds allowed to each stage, 0 = unlimited
    };

    //--------------------------------------------------------------------------
    // Struct: RunConfig
    // Description: the whole run file (base, solver and algorithm sections)
    //--------------------------------------------------------------------------
    struct RunConfig
    {
        int dimension = 0;
        SolverConfig solver;

        std::vector<std::string> methods = {"SA"};  // metaheuristics run in parallel
        std::vector<double> minList;                // lower bound of each parameter
        std::vector<double> maxList;                // upper bound of each parameter
        core::TRunData runData;
        long seed = -1;                             // -1 = seed from the clock
    };

    /**
     * Method: ParseSolverConfig
     * Description: read the solver section. Keys outside the recognized ones
     * are rejected with InputError, as are malformed values.
     */
    SolverConfig ParseSolverConfig(const YAML::Node& solver, const fs::path& rootDir, const fs::path& outputDir);

    /**
     * Method: ParseRunConfig
     * Description: read a whole run file already loaded by yaml-cpp
     */
    RunConfig ParseRunConfig(const YAML::Node& root);

    /**
     * Method: LoadRunConfig
     * Description: load and parse a run file from disk
     */
    RunConfig LoadRunConfig(const std::string& filename);

} // namespace leedopt::leed
