#include "leedopt/leed/input.hpp"
#include "leedopt/core/exception.hpp"

namespace leedopt::leed {

    std::string PlaceholderToken(int idx)
    {
        return std::format("opt{:04d}", idx);
    }

    std::string FormatParameter(double value)
    {
        return std::format("{:7.4f}", value);
    }

    std::string SubstituteParameters(std::string contents, const std::vector<double>& x)
    {
        if (static_cast<int>(x.size()) > kMaxParameters) {
            throw InputError(std::format("ERROR: {} parameters exceed the {} placeholders of {}",
                                         x.size(), kMaxParameters, "optNNNN"));
        }

        for (size_t idx = 0; idx < x.size(); idx++) {
            const std::string token = PlaceholderToken(static_cast<int>(idx));
            const std::string field = FormatParameter(x[idx]);

            size_t pos = contents.find(token);
            while (pos != std::string::npos) {
                contents.replace(pos, token.size(), field);
                pos = contents.find(token, pos + field.size());
            }
        }
        return contents;
    }

    void WriteFitFile(const fs::path& file, const std::vector<double>& x)
    {
        std::ifstream reader(file, std::ios::binary);
        if (!reader.is_open()) {
            throw InputError(std::format("ERROR: input file ({}) is not found", file.string()));
        }
        std::stringstream buffer;
        buffer << reader.rdbuf();
        reader.close();

        const std::string contents = SubstituteParameters(buffer.str(), x);

        std::ofstream writer(file, std::ios::binary | std::ios::trunc);
        if (!writer.is_open()) {
            throw Error(std::format("ERROR: cannot write ({})", file.string()));
        }
        writer << contents;
        if (!writer) {
            throw Error(std::format("ERROR: failed writing ({})", file.string()));
        }
    }

} // namespace leedopt::leed
