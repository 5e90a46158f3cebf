/**
 * leedopt - Solver Context Singleton
 * Centralizes shared search state without global variables
 */

#pragma once

#include <random>
#include <atomic>
#include <vector>
#include "leedopt/core/data.hpp"

namespace leedopt {
    namespace core {

    /**
    * @brief Singleton that holds the state shared by the search threads
    *
    * The elite pool and the stop flag are shared; every OpenMP thread owns
    * its own random engine.
    */
    class SolverContext {
      public:
          // -------------------------------------------------------------------------
          // SINGLETON ACCESS
          // -------------------------------------------------------------------------
          static SolverContext& instance() {
              static SolverContext instance;
              return instance;
          }

          SolverContext(const SolverContext&) = delete;
          SolverContext& operator=(const SolverContext&) = delete;
          SolverContext(SolverContext&&) = delete;
          SolverContext& operator=(SolverContext&&) = delete;

          // -------------------------------------------------------------------------
          // SHARED STATE ACCESSORS
          // -------------------------------------------------------------------------

          // thread_local: each search thread draws from its own engine
          std::mt19937& getRng() {
              thread_local std::mt19937 rng;
              return rng;
          }

          std::vector<TSol>& getPool() { return pool_; }

          void setSeed(unsigned int seed) { getRng().seed(seed); }

          void resetStopFlag() { stopExecution_.store(false); }

          void signalStop() { stopExecution_.store(true); }

          bool shouldStop() const { return stopExecution_.load(); }

      private:
          SolverContext()
              : stopExecution_(false)
          {}

          ~SolverContext() = default;

          std::atomic<bool> stopExecution_;
          std::vector<TSol> pool_;
      };

      // -------------------------------------------------------------------------
      // CONVENIENCE MACROS
      // -------------------------------------------------------------------------
      #define LEEDOPT_RNG         leedopt::core::SolverContext::instance().getRng()
      #define LEEDOPT_POOL        leedopt::core::SolverContext::instance().getPool()
      #define LEEDOPT_SHOULD_STOP leedopt::core::SolverContext::instance().shouldStop()

      } // namespace core
} // namespace leedopt
