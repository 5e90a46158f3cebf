/**
 * leedopt - Solver Interface
 * Main orchestrator of the LEED structure search
 */

#pragma once

#include "leedopt/core/data.hpp"
#include "leedopt/core/iproblem.hpp"
#include "leedopt/leed/config.hpp"
#include "leedopt/leed/leed_problem.hpp"

namespace leedopt {

    /**
    * @brief Runs the configured metaheuristics in parallel on the LEED problem
    */
    class RkoSolver {
    public:
        // -------------------------------------------------------------------------
        // CONSTRUCTOR
        // -------------------------------------------------------------------------
        RkoSolver();

        // -------------------------------------------------------------------------
        // PUBLIC INTERFACE
        // -------------------------------------------------------------------------

        // Reads the command line (CLI11), the run file and builds the problem.
        // Returns 0 to continue, a positive value when the program should exit
        // successfully (--help) and a negative value on error.
        int init(int argc, char* argv[]);

        // Programmatic initialization; throws InputError
        void init(const leed::RunConfig& config);

        void run();

        // Writes res.txt and evaluations.txt into the output directory
        void writeResults() const;

        // -------------------------------------------------------------------------
        // ACCESSORS
        // -------------------------------------------------------------------------
        const core::TSol& getBestSolution() const { return bestSolutionGlobal_; }
        double getBestObjective() const { return bestSolutionGlobal_.ofv; }
        double getAverageObjective() const { return averageObjective_; }
        const std::vector<double>& getObjectiveValues() const { return objectiveValues_; }
        const leed::RunConfig& getConfig() const { return config_; }
        const leed::LeedProblem& getProblem() const { return *problem_; }

    private:
        using Method = std::function<void(const core::TRunData&, const core::IProblem&)>;

        void registerAlgorithms();
        void executeRun(int runIndex, unsigned int runSeed, core::TSol& bestSolutionRun);

        std::map<std::string, Method> algoRegistry_;
        leed::RunConfig config_;
        std::shared_ptr<leed::LeedProblem> problem_;

        core::TSol bestSolutionGlobal_;
        double averageObjective_ = kInfeasible;
        std::vector<double> objectiveValues_;
    };

} // namespace leedopt
