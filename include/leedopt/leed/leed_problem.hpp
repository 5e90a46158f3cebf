#pragma once

#include "leedopt/core/iproblem.hpp"
#include "leedopt/leed/leed_solver.hpp"

namespace leedopt::leed {

    //--------------------------------------------------------------------------
    // Struct: EvaluationRecord
    // Description: one finished evaluation, kept for evaluations.txt
    //--------------------------------------------------------------------------
    struct EvaluationRecord
    {
        int step = 0;
        int set = 0;
        std::vector<double> x;
        double rfactor = kInfeasible;
        bool ok = false;            // false if the solver or the extraction failed
    };

    /**
    * @brief LEED structure fit as a random-key problem
    *
    * Random keys are mapped linearly onto [min_list, max_list) and every
    * evaluation runs one prepare/run/getResults cycle of the adapter.
    * The step index comes from an atomic counter and the set index is the
    * OpenMP thread number, so concurrent evaluations never share a workspace.
    */
    class LeedProblem : public core::IProblem {
    public:
        LeedProblem(const SolverConfig& config, std::vector<double> minList, std::vector<double> maxList);

        double evaluate(const core::TSol& s) const override;
        int getDimension() const override;

        // Parameter vector encoded by the random keys of s
        std::vector<double> decode(const core::TSol& s) const;

        // Runs one evaluation cycle with an explicit identity
        EvaluationRecord evaluateRequest(const EvaluationRequest& request) const;

        std::vector<EvaluationRecord> history() const;
        int evaluations() const { return step_.load(); }

        const LeedSolver& solver() const { return solver_; }

    private:
        LeedSolver solver_;
        std::vector<double> minList_;
        std::vector<double> maxList_;

        mutable std::atomic<int> step_{0};
        mutable std::mutex historyMutex_;
        mutable std::vector<EvaluationRecord> history_;
    };

} // namespace leedopt::leed
