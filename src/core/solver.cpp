#include "leedopt/core/solver.hpp"
#include "leedopt/core/method.hpp"
#include "leedopt/core/exception.hpp"
#include "leedopt/utils/io.hpp"

// CLI11 and OpenMP
#include <CLI/CLI.hpp>
#include <omp.h>

#include <exception>

// Metaheuristics
#include "leedopt/mh/sa.hpp"
#include "leedopt/mh/multistart.hpp"

namespace leedopt {

    RkoSolver::RkoSolver() {
        registerAlgorithms();
        core::SolverContext::instance().resetStopFlag();
    }

    void RkoSolver::registerAlgorithms() {
        algoRegistry_["SA"]         = leedopt::mh::SA;
        algoRegistry_["MultiStart"] = leedopt::mh::MultiStart;
    }

    int RkoSolver::init(int argc, char* argv[]) {
        CLI::App app{"leedopt - LEED structure search with the SATLEED solver"};

        std::string configPath;
        int maxTime = 0;
        long seed = -1;
        std::string paramFile;

        app.add_option("-i,--input", configPath, "Path to the run file (YAML)")->required()->check(CLI::ExistingFile);
        app.add_option("-t,--time", maxTime, "Max execution time of one run (seconds), overrides algorithm.max_time");
        app.add_option("-s,--seed", seed, "RNG seed, overrides algorithm.seed");
        app.add_option("-p,--param", paramFile, "Parameter file of the metaheuristics (YAML)")->check(CLI::ExistingFile);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError &e) {
            return (app.exit(e) == 0) ? 1 : -1;
        }

        try {
            leed::RunConfig config = leed::LoadRunConfig(configPath);
            if (app.count("--time") > 0) config.runData.MAXTIME = maxTime;
            if (app.count("--seed") > 0) config.seed = seed;
            if (app.count("--param") > 0) config.runData.paramFile = paramFile;

            init(config);
            std::cout << "Input: " << configPath << "\n";
            return 0;
        } catch (const std::exception &e) {
            std::cerr << "Initialization Error: " << e.what() << std::endl;
            return -1;
        }
    }

    void RkoSolver::init(const leed::RunConfig& config) {
        for (const auto& name : config.methods) {
            if (!algoRegistry_.count(name)) {
                throw InputError(std::format("Error: method {} is not available (SA, MultiStart).", name));
            }
        }
        if (config.runData.MAXTIME <= 0) {
            throw InputError("Error: max_time must be positive.");
        }

        config_ = config;
        problem_ = std::make_shared<leed::LeedProblem>(config_.solver, config_.minList, config_.maxList);
        fs::create_directories(config_.solver.outputDir);
    }

    void RkoSolver::executeRun(int runIndex, unsigned int runSeed, core::TSol& bestSolutionRun) {
        using namespace leedopt::core;

        SolverContext& context = SolverContext::instance();
        const TRunData& runData = config_.runData;
        const int numMethods = static_cast<int>(config_.methods.size());

        const double start_time = get_time_in_seconds();

        context.resetStopFlag();
        context.setSeed(runSeed);
        CreatePoolSolutions(*problem_, runData.sizePool);
        bestSolutionRun = LEEDOPT_POOL[0];

        std::exception_ptr failure = nullptr;
        bool keepGoing = true;

        // one thread per active method
        omp_set_num_threads(numMethods);

        #pragma omp parallel
        {
            context.setSeed(runSeed + omp_get_thread_num() + 1000);

            while (true)
            {
                #pragma omp single
                context.resetStopFlag();

                #pragma omp for schedule(static, 1)
                for (int i = 0; i < numMethods; ++i) {
                    const std::string& name = config_.methods[i];

                    if (runData.debug) {
                        #pragma omp critical(leedopt_log)
                        std::cout << std::format("\n[T{}] Start: {} [{:.1f}s]", omp_get_thread_num(), name,
                                                 get_time_in_seconds() - start_time);
                    }

                    try {
                        algoRegistry_.at(name)(runData, *problem_);
                    } catch (...) {
                        #pragma omp critical(leedopt_error)
                        {
                            if (!failure) failure = std::current_exception();
                        }
                    }

                    // first method to finish stops the others
                    context.signalStop();
                }

                #pragma omp critical(leedopt_pool)
                {
                    if (!LEEDOPT_POOL.empty() && LEEDOPT_POOL[0].ofv < bestSolutionRun.ofv) {
                        bestSolutionRun = LEEDOPT_POOL[0];
                        bestSolutionRun.best_time = get_time_in_seconds() - start_time;
                    }
                }
                #pragma omp barrier

                // one thread decides for the team, so every thread leaves together
                #pragma omp single
                {
                    keepGoing = !failure && (get_time_in_seconds() - start_time) < runData.MAXTIME;
                    if (keepGoing) {
                        if (runData.debug) std::cout << " [Restarting Pool] ";
                        context.resetStopFlag();
                        context.setSeed(runSeed + static_cast<unsigned int>(get_time_in_seconds()));
                        CreatePoolSolutions(*problem_, runData.sizePool);
                    }
                }

                if (!keepGoing) break;
            }
        }

        context.resetStopFlag();
        if (failure) std::rethrow_exception(failure);

        if (runData.debug) {
            std::cout << std::format("\nRun {}: best R-factor {} ({:.2f}s, {} evaluations)", runIndex + 1,
                                     bestSolutionRun.ofv, get_time_in_seconds() - start_time, problem_->evaluations());
        }
    }

    void RkoSolver::run() {
        if (!problem_) {
            throw Error("RkoSolver::run called before init");
        }

        bestSolutionGlobal_ = core::TSol();
        objectiveValues_.clear();

        std::cout << "Methods:";
        for (const auto& name : config_.methods) std::cout << " " << name;
        std::cout << "\nRuns: ";

        const unsigned int GLOBAL_SEED = (config_.seed < 0)
            ? static_cast<unsigned int>(std::chrono::steady_clock::now().time_since_epoch().count())
            : static_cast<unsigned int>(config_.seed);

        for (int run = 0; run < config_.runData.MAXRUNS; run++)
        {
            std::cout << (run + 1) << " " << std::flush;

            core::TSol bestSolutionRun;
            executeRun(run, GLOBAL_SEED + run, bestSolutionRun);

            objectiveValues_.push_back(bestSolutionRun.ofv);
            if (bestSolutionRun.ofv < bestSolutionGlobal_.ofv || bestSolutionGlobal_.rk.empty()) {
                bestSolutionGlobal_ = bestSolutionRun;
            }
        }

        averageObjective_ = std::accumulate(objectiveValues_.begin(), objectiveValues_.end(), 0.0)
                          / static_cast<double>(objectiveValues_.size());

        std::cout << "\n\n=== FINAL RESULT ===\n";
        std::cout << std::format("Best R-factor: {}\n", bestSolutionGlobal_.ofv);
        const std::vector<double> x = problem_->decode(bestSolutionGlobal_);
        for (size_t i = 0; i < x.size(); i++) {
            std::cout << std::format("x{} = {:.6f}\n", i + 1, x[i]);
        }
    }

    void RkoSolver::writeResults() const {
        if (!problem_) return;

        utils::WriteSolution(config_.solver.outputDir / "res.txt", bestSolutionGlobal_.ofv,
                             problem_->decode(bestSolutionGlobal_));
        utils::WriteEvaluations(config_.solver.outputDir / "evaluations.txt", problem_->history());
    }

} // namespace leedopt
