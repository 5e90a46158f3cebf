/**
 * leedopt - LEED solver adapter
 * Drives the two-stage SATLEED executables for one parameter vector
 */

#pragma once

#include "leedopt/leed/config.hpp"
#include "leedopt/leed/runner.hpp"
#include "leedopt/leed/workspace.hpp"

namespace leedopt::leed {

    //--------------------------------------------------------------------------
    // Struct: EvaluationRequest
    // Description: one parameter vector and its (step, set) identity
    //--------------------------------------------------------------------------
    struct EvaluationRequest
    {
        std::vector<double> x;
        int step = 0;
        int set = 0;
    };

    /**
    * @brief Adapter between the optimizer and the external LEED solver
    *
    * Construction resolves both executables and validates the reference
    * directory; afterwards the object is immutable and every method is const,
    * so one instance may serve several threads. Each evaluation is
    * prepare -> run -> getResults on the Workspace returned by prepare.
    */
    class LeedSolver {
    public:
        explicit LeedSolver(const SolverConfig& config);

        // -------------------------------------------------------------------------
        // EVALUATION CYCLE
        // -------------------------------------------------------------------------

        // Copies the reference directory into <outputDir>/Log{step}_{set} and
        // writes the parameters into its tleed5.i
        Workspace prepare(const EvaluationRequest& request) const;

        // nprocs and nthreads are accepted for interface compatibility; both
        // stages always run as single sequential processes
        SolverRunStatus run(const Workspace& workspace, int nprocs = 1, int nthreads = 1) const;

        // R-factor of the evaluation; removes the workspace afterwards when
        // remove_work_dir is set
        double getResults(const Workspace& workspace) const;

        // -------------------------------------------------------------------------
        // ACCESSORS
        // -------------------------------------------------------------------------
        const std::string& name() const { return name_; }
        const SolverConfig& config() const { return config_; }
        const fs::path& firstSolver() const { return firstSolver_; }
        const fs::path& secondSolver() const { return secondSolver_; }
        const fs::path& baseDir() const { return baseDir_; }

    private:
        std::string name_ = "leed";
        SolverConfig config_;
        fs::path firstSolver_;
        fs::path secondSolver_;
        fs::path baseDir_;
    };

} // namespace leedopt::leed
