#include "leedopt/mh/sa.hpp"

#include "leedopt/core/method.hpp"
#include "leedopt/core/exception.hpp"

namespace leedopt::mh {

    void SA(const leedopt::core::TRunData &runData, const leedopt::core::IProblem &problem)
    {
        using namespace leedopt::core;

        const char* method = "SA";
        TSol s;                         // current solution
        TSol sViz;                      // neighbor solution
        TSol sBest;                     // best solution of SA

        double T0 = 0;                  // initial temperature
        double T = 0;                   // current temperature
        double alphaSA = 0;             // cool rate
        int SAmax = 0;                  // number of iterations in a temperature T
        float betaMin = 0;              // minimum perturbation
        float betaMax = 0;              // maximum perturbation
        bool reannealing = false;
        float currentTime = 0;          // computational time of the search process

        const int n = problem.getDimension();
        const double maxTime = runData.MAXTIME * runData.restart;
        double start_timeMH = get_time_in_seconds();

        // ** read file with parameter values (first value of each list)
        const int numPar = 5;
        std::vector<std::vector<double>> parameters;
        readParametersYaml(runData.paramFile, method, parameters, numPar);

        if (!parameters[0].empty()) SAmax   = static_cast<int>(parameters[0][0]);
        if (!parameters[1].empty()) alphaSA = parameters[1][0];
        if (!parameters[2].empty()) betaMin = static_cast<float>(parameters[2][0]);
        if (!parameters[3].empty()) betaMax = static_cast<float>(parameters[3][0]);
        if (!parameters[4].empty()) T0      = parameters[4][0];

        if (SAmax <= 0 || !(alphaSA > 0.0 && alphaSA < 1.0) || !(T0 > 0.0)) {
            throw InputError(std::format("ERROR: invalid SA parameters in ({})", runData.paramFile));
        }

        CreateInitialSolutions(s, n);
        s.ofv = problem.evaluate(s);
        sBest = s;
        UpdatePoolSolutions(sBest, method, runData.debug);

        while (currentTime < maxTime)
        {
            T = reannealing ? T0 * 0.3 : T0;

            // temperature loop
            while (T > 0.0001 && currentTime < maxTime)
            {
                // Metropolis loop
                for (int IterT = 0; IterT < SAmax && currentTime < maxTime; IterT++)
                {
                    if (LEEDOPT_SHOULD_STOP) return;

                    sViz = s;
                    ShakeSolution(sViz, betaMin, betaMax, n);
                    sViz.ofv = problem.evaluate(sViz);

                    const double delta = sViz.ofv - s.ofv;

                    if (delta < 0 || !std::isfinite(s.ofv))
                    {
                        s = sViz;

                        if (s.ofv < sBest.ofv)
                        {
                            sBest = s;
                            UpdatePoolSolutions(s, method, runData.debug);
                        }
                    }
                    else if (std::isfinite(delta) && randomico(0, 1) < std::exp(-delta / T))
                    {
                        s = sViz;
                    }

                    currentTime = static_cast<float>(get_time_in_seconds() - start_timeMH);
                }

                T = T * alphaSA;

                // local search (Nelder-Mead) around the current solution
                sViz = s;
                NelderMeadSearch(sViz, problem);

                if (sViz.ofv < sBest.ofv)
                {
                    sBest = sViz;
                    UpdatePoolSolutions(sBest, method, runData.debug);
                }

                currentTime = static_cast<float>(get_time_in_seconds() - start_timeMH);
            }

            reannealing = true;
        }
    }

} // namespace leedopt::mh
