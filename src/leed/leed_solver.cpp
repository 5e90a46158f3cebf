#include "leedopt/leed/leed_solver.hpp"
#include "leedopt/leed/executable.hpp"
#include "leedopt/leed/input.hpp"
#include "leedopt/leed/result.hpp"

namespace leedopt::leed {

    LeedSolver::LeedSolver(const SolverConfig& config)
        : config_(config)
    {
        firstSolver_  = ResolveExecutable(config_.firstSolver, config_.rootDir);
        secondSolver_ = ResolveExecutable(config_.secondSolver, config_.rootDir);

        baseDir_ = fs::absolute(config_.rootDir / config_.baseDir);
        CheckReferenceFiles(baseDir_);
        config_.outputDir = fs::absolute(config_.outputDir);
    }

    Workspace LeedSolver::prepare(const EvaluationRequest& request) const
    {
        Workspace workspace;
        workspace.step = request.step;
        workspace.set = request.set;
        workspace.path = config_.outputDir / WorkspaceName(request.step, request.set);

        // outputs of an earlier run under the same name must not leak into this one
        fs::remove_all(workspace.path);
        CopyReference(baseDir_, workspace.path);
        WriteFitFile(workspace.path / kFitFile, request.x);
        return workspace;
    }

    SolverRunStatus LeedSolver::run(const Workspace& workspace, int /*nprocs*/, int /*nthreads*/) const
    {
        SolverRunStatus status = RunSolvers(firstSolver_, secondSolver_, workspace.path, config_.timeout);
        if (!status.ok()) {
            #pragma omp critical(leedopt_log)
            std::cerr << std::format("\nWARNING: {} ({}): {}", workspace.path.string(), ToString(status.code), status.message) << std::endl;
        }
        return status;
    }

    double LeedSolver::getResults(const Workspace& workspace) const
    {
        const double rfactor = ReadRFactor(workspace.path);

        if (config_.removeWorkDir) {
            fs::remove_all(workspace.path);
        }
        return rfactor;
    }

} // namespace leedopt::leed
