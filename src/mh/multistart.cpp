#include "leedopt/mh/multistart.hpp"

#include "leedopt/core/method.hpp"

namespace leedopt::mh {

    void MultiStart(const leedopt::core::TRunData &runData, const leedopt::core::IProblem &problem)
    {
        using namespace leedopt::core;

        const char* method = "MultiStart";

        TSol s;                         // current solution
        TSol sBest;                     // best solution

        float currentTime = 0;          // computational time of the search process
        double start_timeMH = get_time_in_seconds();

        CreateInitialSolutions(s, problem.getDimension());
        s.ofv = problem.evaluate(s);
        sBest = s;
        UpdatePoolSolutions(sBest, method, runData.debug);

        // run the search process until stop criterion
        while (currentTime < runData.MAXTIME * runData.restart)
        {
            if (LEEDOPT_SHOULD_STOP) return;

            CreateInitialSolutions(s, problem.getDimension());
            s.ofv = problem.evaluate(s);

            if (s.ofv < sBest.ofv)
            {
                sBest = s;
                UpdatePoolSolutions(sBest, method, runData.debug);
            }

            currentTime = static_cast<float>(get_time_in_seconds() - start_timeMH);
        }
    }

} // namespace leedopt::mh
