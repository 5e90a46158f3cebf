#include "leedopt/leed/leed_problem.hpp"
#include "leedopt/core/exception.hpp"

#include <omp.h>

namespace leedopt::leed {

    LeedProblem::LeedProblem(const SolverConfig& config, std::vector<double> minList, std::vector<double> maxList)
        : solver_(config), minList_(std::move(minList)), maxList_(std::move(maxList))
    {
        if (minList_.empty() || minList_.size() != maxList_.size()) {
            throw InputError("ERROR: min_list and max_list must have the same, non-zero length");
        }
    }

    int LeedProblem::getDimension() const
    {
        return static_cast<int>(minList_.size());
    }

    std::vector<double> LeedProblem::decode(const core::TSol& s) const
    {
        std::vector<double> x(minList_.size());
        for (size_t i = 0; i < x.size(); i++) {
            x[i] = minList_[i] + s.rk[i] * (maxList_[i] - minList_[i]);
        }
        return x;
    }

    EvaluationRecord LeedProblem::evaluateRequest(const EvaluationRequest& request) const
    {
        EvaluationRecord record;
        record.step = request.step;
        record.set = request.set;
        record.x = request.x;

        try {
            const Workspace workspace = solver_.prepare(request);
            const SolverRunStatus status = solver_.run(workspace);
            if (status.ok()) {
                record.rfactor = solver_.getResults(workspace);
                record.ok = true;
            }
        } catch (const ResultError& e) {
            #pragma omp critical(leedopt_log)
            std::cerr << std::format("\nWARNING: step {} set {}: {}", request.step, request.set, e.what()) << std::endl;
        } catch (const fs::filesystem_error& e) {
            #pragma omp critical(leedopt_log)
            std::cerr << std::format("\nWARNING: step {} set {}: {}", request.step, request.set, e.what()) << std::endl;
        }

        {
            std::lock_guard<std::mutex> lock(historyMutex_);
            history_.push_back(record);
        }
        return record;
    }

    double LeedProblem::evaluate(const core::TSol& s) const
    {
        EvaluationRequest request;
        request.x = decode(s);
        request.step = step_.fetch_add(1);
        request.set = omp_get_thread_num();
        return evaluateRequest(request).rfactor;
    }

    std::vector<EvaluationRecord> LeedProblem::history() const
    {
        std::lock_guard<std::mutex> lock(historyMutex_);
        return history_;
    }

} // namespace leedopt::leed
