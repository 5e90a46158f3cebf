#pragma once

// -------------------------------------------------------------------------
// 1. SYSTEM HEADERS
// -------------------------------------------------------------------------
#include <sys/time.h>
#include <ctime>

// -------------------------------------------------------------------------
// 2. STANDARD C++ LIBRARY (Commonly used across the project)
// -------------------------------------------------------------------------
// Containers
#include <vector>
#include <string>
#include <map>
#include <utility>
#include <functional>

// Math & Algorithms
#include <cmath>
#include <algorithm>
#include <numeric>
#include <limits>

// IO & Strings
#include <format>
#include <iostream>
#include <sstream>
#include <fstream>
#include <cstdio>
#include <cstdlib>

// Filesystem (workspaces, reference directory)
#include <filesystem>

// Concurrency & Randoms
#include <atomic>
#include <mutex>
#include <random>
#include <chrono>

#include <memory>

// -------------------------------------------------------------------------
// 3. GLOBAL CONSTANTS
// -------------------------------------------------------------------------
namespace leedopt {

    namespace fs = std::filesystem;

    // Objective value of an evaluation that produced no usable R-factor
    inline constexpr double kInfeasible = std::numeric_limits<double>::infinity();

} // namespace leedopt
