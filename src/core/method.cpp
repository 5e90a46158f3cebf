#include "leedopt/core/method.hpp"
#include "leedopt/core/exception.hpp"

#include <omp.h>
#include <yaml-cpp/yaml.h>

namespace leedopt::core {

    // -----------------------------------------------------------------------------
    // General Utilities
    // -----------------------------------------------------------------------------

    bool sortByFitness(const TSol &lhs, const TSol &rhs) {
        return lhs.ofv < rhs.ofv;
    }

    double randomico(double min, double max)
    {
        return std::uniform_real_distribution<double>(min, max)(LEEDOPT_RNG);
    }

    int irandomico(int min, int max)
    {
        return std::uniform_int_distribution<int>(min, max)(LEEDOPT_RNG);
    }

    double get_time_in_seconds() {
        struct timespec timeCur;
        clock_gettime(CLOCK_MONOTONIC, &timeCur);
        return timeCur.tv_sec + timeCur.tv_nsec / 1e9;
    }

    // -----------------------------------------------------------------------------
    // Solution & Pool Management
    // -----------------------------------------------------------------------------

    void CreateInitialSolutions(TSol &s, const int n)
    {
        s.rk.resize(n);
        for (int j = 0; j < n; j++){
            s.rk[j] = randomico(0, 1);  // random value between [0,1)
        }
        s.ofv = kInfeasible;
    }

    void CreatePoolSolutions(const IProblem &problem, const int sizePool)
    {
        const int n = problem.getDimension();
        std::vector<TSol> fresh(sizePool);

        for (int i = 0; i < sizePool; i++){
            CreateInitialSolutions(fresh[i], n);
            if (!LEEDOPT_SHOULD_STOP) fresh[i].ofv = problem.evaluate(fresh[i]);
            fresh[i].best_time = get_time_in_seconds();
            fresh[i].nameMH = "Pool";
        }

        std::sort(fresh.begin(), fresh.end(), sortByFitness);

        // perturb solutions that repeat the ofv of their predecessor
        bool clone = false;
        for (int i = sizePool - 1; i > 0; i--){
            if (std::isfinite(fresh[i].ofv) && std::abs(fresh[i].ofv - fresh[i-1].ofv) < 1e-9){
                for (int j = 0; j < std::max(1, static_cast<int>(0.2 * n)); j++){
                    int pos = irandomico(0, n - 1);
                    fresh[i].rk[pos] = randomico(0, 1);
                }
                fresh[i].ofv = problem.evaluate(fresh[i]);
                clone = true;
            }
        }

        if (clone)
        {
            std::sort(fresh.begin(), fresh.end(), sortByFitness);
        }

        #pragma omp critical(leedopt_pool)
        {
            LEEDOPT_POOL = std::move(fresh);
        }
    }

    void UpdatePoolSolutions(TSol s, const char* mh, const int debug)
    {
        #pragma omp critical(leedopt_pool)
        {
            bool exists = std::ranges::any_of(LEEDOPT_POOL, [&](const auto& entry) {
                return std::abs(entry.ofv - s.ofv) < 1e-9;
            });

            if (!LEEDOPT_POOL.empty() && s.ofv < LEEDOPT_POOL[0].ofv && debug)
            {
                std::cout << std::format("\nBest solution: {:.10f} (Thread: {} - MH: {})", s.ofv, omp_get_thread_num(), mh);
            }

            if (!exists && !LEEDOPT_POOL.empty() && s.ofv < LEEDOPT_POOL.back().ofv)
            {
                s.best_time = get_time_in_seconds();
                s.nameMH = mh;

                // insertion from the back keeps the pool sorted
                int i;
                for (i = static_cast<int>(LEEDOPT_POOL.size()) - 1; i > 0 && LEEDOPT_POOL[i - 1].ofv > s.ofv; i--) {
                    LEEDOPT_POOL[i] = LEEDOPT_POOL[i - 1];
                }
                LEEDOPT_POOL[i] = s;
            }
        }
    }

    // -----------------------------------------------------------------------------
    // Search Components
    // -----------------------------------------------------------------------------

    void ShakeSolution(TSol &s, float betaMin, float betaMax, const int n)
    {
        int intensity = static_cast<int>(n * randomico(betaMin, betaMax)) + 1;

        for (int k = 0; k < intensity; k++) {
            int i = irandomico(0, n - 1);

            switch (irandomico(1, 3)) {
                case 1:     // random reset
                    s.rk[i] = randomico(0, 1);
                    break;
                case 2:     // mirror inside the box
                    s.rk[i] = (s.rk[i] > 0.0001) ? 1.0 - s.rk[i] : 0.9999;
                    break;
                default:    // local step
                    s.rk[i] = std::clamp(s.rk[i] + randomico(-0.05, 0.05), 0.0, 0.9999999);
                    break;
            }
        }
    }

    TSol Blending(const TSol &s1, const TSol &s2, double factor, const int n)
    {
        TSol s;
        s.rk.resize(n);

        for (int j = 0; j < n; j++)
        {
            if (randomico(0, 1) < 0.02) {
                s.rk[j] = randomico(0, 1);      // mutation
            }
            else if (randomico(0, 1) < 0.5) {
                s.rk[j] = s1.rk[j];
            }
            else if (factor == -1) {
                s.rk[j] = std::clamp(1.0 - s2.rk[j], 0.0, 0.9999999);
            }
            else {
                s.rk[j] = s2.rk[j];
            }
        }
        return s;
    }

    void NelderMeadSearch(TSol &x1, const IProblem &problem)
    {
        std::vector<TSol> pool;
        #pragma omp critical(leedopt_pool)
        {
            pool = LEEDOPT_POOL;
        }

        const int poolSize = static_cast<int>(pool.size());
        if (poolSize < 2) return;

        const int n = problem.getDimension();
        TSol x1Origem = x1;
        TSol xBest = x1;

        bool improved = false;
        bool improvedX1 = false;

        auto evaluateAndUpdate = [&](TSol& candidate) {
            candidate.ofv = problem.evaluate(candidate);
            if (candidate.ofv < xBest.ofv) {
                xBest = candidate;
                improved = true;
                improvedX1 = true;
            }
        };

        auto sortSimplex = [](TSol& a, TSol& b, TSol& c) {
            if (a.ofv > b.ofv) std::swap(a, b);
            if (a.ofv > c.ofv) std::swap(a, c);
            if (b.ofv > c.ofv) std::swap(b, c);
        };

        int k1, k2;
        do {
            k1 = irandomico(0, poolSize - 1);
            k2 = irandomico(0, poolSize - 1);
        } while (k1 == k2);

        TSol x2 = pool[k1];
        TSol x3 = pool[k2];

        sortSimplex(x1, x2, x3);

        // centroid
        TSol x0 = Blending(x1, x2, 1, n);
        evaluateAndUpdate(x0);

        int iter_count = 1;
        int maxIter = std::max(10, static_cast<int>(n * std::exp(-2)));

        while (iter_count <= maxIter)
        {
            bool shrink = false;

            // reflection
            TSol x_r = Blending(x0, x3, -1, n);
            evaluateAndUpdate(x_r);

            if (x_r.ofv < x1.ofv)
            {
                // expansion
                TSol x_e = Blending(x_r, x0, -1, n);
                evaluateAndUpdate(x_e);
                x3 = (x_e.ofv < x_r.ofv) ? x_e : x_r;
            }
            else if (x_r.ofv < x2.ofv) {
                x3 = x_r;
            }
            else {
                bool outside = x_r.ofv < x3.ofv;
                TSol x_c = outside ? Blending(x_r, x0, 1, n) : Blending(x0, x3, 1, n);
                evaluateAndUpdate(x_c);
                if (x_c.ofv < (outside ? x_r.ofv : x3.ofv)) {
                    x3 = x_c;
                } else {
                    shrink = true;
                }
            }

            if (shrink) {
                x2 = Blending(x1, x2, 1, n);
                evaluateAndUpdate(x2);

                x3 = Blending(x1, x3, 1, n);
                evaluateAndUpdate(x3);
            }

            sortSimplex(x1, x2, x3);

            x0 = Blending(x1, x2, 1, n);
            evaluateAndUpdate(x0);

            if (improved) {
                improved = false;
                iter_count = 0;
            } else {
                iter_count++;
            }

            if (LEEDOPT_SHOULD_STOP) break;
        }

        x1 = improvedX1 ? xBest : x1Origem;
    }

    // -----------------------------------------------------------------------------
    // IO / Config
    // -----------------------------------------------------------------------------

    void readParametersYaml(const std::string& paramFile, const char* method,
                            std::vector<std::vector<double>> &parameters, int numPar)
    {
        parameters.assign(numPar, {});

        YAML::Node config;
        try {
            config = YAML::LoadFile(paramFile);
        } catch (const YAML::BadFile&) {
            throw InputError(std::format("ERROR: parameter file ({}) is not found", paramFile));
        } catch (const YAML::ParserException& e) {
            throw InputError(std::format("ERROR: syntax error in ({}): {}", paramFile, e.what()));
        }

        const YAML::Node methodNode = config[method];
        if (!methodNode) {
            throw InputError(std::format("ERROR: method '{}' not found in ({})", method, paramFile));
        }
        if (!methodNode.IsSequence()) {
            throw InputError(std::format("ERROR: invalid format for method {} (expected a list of lists)", method));
        }

        try {
            const int limit = std::min(numPar, static_cast<int>(methodNode.size()));
            for (int i = 0; i < limit; i++) {
                if (!methodNode[i].IsSequence()) continue;

                for (const auto& val : methodNode[i]) {
                    parameters[i].push_back(val.as<double>());
                }
            }
        } catch (const YAML::Exception& e) {
            throw InputError(std::format("ERROR: invalid value for method {} in ({}): {}", method, paramFile, e.what()));
        }
    }

} // namespace leedopt::core
