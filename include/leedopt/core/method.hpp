#pragma once

#include "leedopt/core/data.hpp"
#include "leedopt/core/iproblem.hpp"
#include "leedopt/core/context.hpp"

namespace leedopt::core {

    // -----------------------------------------------------------------------------
    // General Utilities
    // -----------------------------------------------------------------------------
    bool sortByFitness(const TSol &lhs, const TSol &rhs);

    double randomico(double min, double max);
    int irandomico(int min, int max);
    double get_time_in_seconds();

    // -----------------------------------------------------------------------------
    // Solution & Pool Management
    // -----------------------------------------------------------------------------
    void CreateInitialSolutions(TSol &s, const int n);

    /**
     * Method: CreatePoolSolutions
     * Description: fill the elite pool with sizePool random solutions, sorted by ofv.
     * Evaluations run outside the critical section; only the pool swap is locked.
     */
    void CreatePoolSolutions(const IProblem &problem, const int sizePool);

    /**
     * Method: UpdatePoolSolutions
     * Description: insert s in the elite pool if its ofv is not already there
     */
    void UpdatePoolSolutions(TSol s, const char* mh, const int debug);

    // -----------------------------------------------------------------------------
    // Search Components
    // -----------------------------------------------------------------------------
    void ShakeSolution(TSol &s, float betaMin, float betaMax, const int n);

    TSol Blending(const TSol &s1, const TSol &s2, double factor, const int n);

    void NelderMeadSearch(TSol &x1, const IProblem &problem);

    // -----------------------------------------------------------------------------
    // IO / Config
    // -----------------------------------------------------------------------------

    /**
     * Method: readParametersYaml
     * Description: read the tuning parameters of a method from the YAML parameter
     * file. Each entry of parameters receives the candidate values of one parameter.
     * Throws InputError if the file is missing, malformed or lacks the method.
     */
    void readParametersYaml(const std::string& paramFile, const char* method,
                            std::vector<std::vector<double>> &parameters, int numPar);

} // namespace leedopt::core
