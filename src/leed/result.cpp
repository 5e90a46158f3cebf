#include "leedopt/leed/result.hpp"
#include "leedopt/core/exception.hpp"

namespace leedopt::leed {

    double ParseRFactorLine(const std::string& line)
    {
        const size_t eq = line.find('=');
        if (eq == std::string::npos) {
            throw ResultError(std::format("ERROR: no value in R-FACTOR line ({})", line));
        }

        // the field ends at the next '=', if any
        const size_t next = line.find('=', eq + 1);
        const std::string value = line.substr(eq + 1, next == std::string::npos ? std::string::npos : next - eq - 1);
        try {
            size_t used = 0;
            double rfactor = std::stod(value, &used);

            // only blanks may follow the number
            if (value.find_first_not_of(" \t\r\n", used) != std::string::npos) {
                throw ResultError(std::format("ERROR: invalid R-FACTOR value ({})", value));
            }
            return rfactor;
        } catch (const std::invalid_argument&) {
            throw ResultError(std::format("ERROR: invalid R-FACTOR value ({})", value));
        } catch (const std::out_of_range&) {
            throw ResultError(std::format("ERROR: R-FACTOR value out of range ({})", value));
        }
    }

    double ReadRFactor(const fs::path& workDir)
    {
        if (!fs::exists(workDir / kMarkerFile)) {
            return kInfeasible;
        }

        const fs::path summary = workDir / kSummaryFile;
        std::ifstream reader(summary);
        if (!reader.is_open()) {
            throw ResultError(std::format("ERROR: output file ({}) is not found", summary.string()));
        }

        std::string line;
        while (std::getline(reader, line)) {
            if (line.find("R-FACTOR") != std::string::npos) {
                return ParseRFactorLine(line);
            }
        }
        throw ResultError(std::format("ERROR: no R-FACTOR line in ({})", summary.string()));
    }

} // namespace leedopt::leed
