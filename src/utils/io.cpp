#include "leedopt/utils/io.hpp"
#include "leedopt/core/exception.hpp"

namespace leedopt::utils {

    void WriteSolution(const fs::path& filename, double rfactor, const std::vector<double>& x)
    {
        FILE *solFile = fopen(filename.c_str(), "w");
        if (!solFile)
        {
            throw Error(std::format("ERROR: cannot open ({}) for writing", filename.string()));
        }

        fprintf(solFile, "fx = %.10lf\n", rfactor);
        for (size_t i = 0; i < x.size(); i++)
            fprintf(solFile, "x%zu = %.10lf\n", i + 1, x[i]);

        fclose(solFile);
    }

    void WriteEvaluations(const fs::path& filename, const std::vector<leedopt::leed::EvaluationRecord>& history)
    {
        auto sorted = history;
        std::ranges::sort(sorted, [](const auto& a, const auto& b) {
            return (a.step != b.step) ? a.step < b.step : a.set < b.set;
        });

        FILE *File = fopen(filename.c_str(), "w");
        if (!File)
        {
            throw Error(std::format("ERROR: cannot open ({}) for writing", filename.string()));
        }

        if (!sorted.empty()) {
            fprintf(File, "# step set");
            for (size_t i = 0; i < sorted[0].x.size(); i++)
                fprintf(File, " x%zu", i + 1);
            fprintf(File, " fx\n");
        }

        for (const auto& record : sorted) {
            fprintf(File, "%s%d %d", record.ok ? "" : "# ", record.step, record.set);
            for (double value : record.x)
                fprintf(File, " %.8lf", value);
            fprintf(File, " %.10lf\n", record.rfactor);
        }

        fclose(File);
    }

} // namespace leedopt::utils
