#include "leedopt/leed/config.hpp"
#include "leedopt/core/exception.hpp"

namespace {

    using leedopt::InputError;

    const std::vector<std::string> kSolverKeywords = {"name", "config", "reference", "post"};
    const std::map<std::string, std::vector<std::string>> kSectionKeywords = {
        {"config",    {"path_to_first_solver", "path_to_second_solver", "timeout"}},
        {"reference", {"path_to_base_dir"}},
        {"post",      {"remove_work_dir"}},
    };

    void CheckKeywords(const YAML::Node& node, const std::string& segment, const std::vector<std::string>& registered)
    {
        for (const auto& item : node) {
            const std::string key = item.first.as<std::string>();
            if (std::ranges::find(registered, key) == registered.end()) {
                throw InputError(std::format("Error: {} in {} is not correct keyword.", key, segment));
            }
        }
    }

    void RequireMap(const YAML::Node& node, const std::string& segment)
    {
        if (node && !node.IsMap() && !node.IsNull()) {
            throw InputError(std::format("Error: section {} must be a mapping.", segment));
        }
    }

    // node[key] read as T, or fallback when the section or the key is absent
    template <typename T>
    T Get(const YAML::Node& node, const std::string& key, const T& fallback, const std::string& segment)
    {
        if (!node || !node.IsMap() || !node[key]) return fallback;
        try {
            return node[key].as<T>();
        } catch (const YAML::Exception& e) {
            throw InputError(std::format("Error: invalid value of {} in {} ({})", key, segment, e.what()));
        }
    }

    std::vector<double> GetList(const YAML::Node& node, const std::string& key, int dimension)
    {
        if (!node || !node.IsMap() || !node[key]) {
            throw InputError(std::format("Error: {} is required in algorithm.", key));
        }
        auto values = Get<std::vector<double>>(node, key, {}, "algorithm");
        if (static_cast<int>(values.size()) != dimension) {
            throw InputError(std::format("Error: {} has {} entries but dimension is {}.", key, values.size(), dimension));
        }
        return values;
    }

} // namespace

namespace leedopt::leed {

    SolverConfig ParseSolverConfig(const YAML::Node& solver, const fs::path& rootDir, const fs::path& outputDir)
    {
        if (!solver || !solver.IsMap()) {
            throw InputError("Error: solver section is missing.");
        }

        CheckKeywords(solver, "solver", kSolverKeywords);
        for (const auto& [section, keywords] : kSectionKeywords) {
            const YAML::Node child = solver[section];
            RequireMap(child, section);
            if (child && child.IsMap()) CheckKeywords(child, section, keywords);
        }

        const std::string name = Get<std::string>(solver, "name", "leed", "solver");
        if (name != "leed") {
            throw InputError(std::format("Error: solver name {} is not supported (expected leed).", name));
        }

        SolverConfig config;
        config.rootDir = rootDir;
        config.outputDir = outputDir;

        const YAML::Node sconfig = solver["config"];
        config.firstSolver  = Get<std::string>(sconfig, "path_to_first_solver", config.firstSolver, "config");
        config.secondSolver = Get<std::string>(sconfig, "path_to_second_solver", config.secondSolver, "config");
        config.timeout      = Get<int>(sconfig, "timeout", 0, "config");
        if (config.timeout < 0) {
            throw InputError("Error: timeout in config must be non-negative.");
        }

        const YAML::Node reference = solver["reference"];
        const std::string baseDir = Get<std::string>(reference, "path_to_base_dir", "", "reference");
        if (baseDir.empty()) {
            throw InputError("Error: path_to_base_dir in reference is required.");
        }
        config.baseDir = baseDir;

        config.removeWorkDir = Get<bool>(solver["post"], "remove_work_dir", false, "post");
        return config;
    }

    RunConfig ParseRunConfig(const YAML::Node& root)
    {
        RunConfig config;

        const YAML::Node base = root["base"];
        RequireMap(base, "base");
        config.dimension = Get<int>(base, "dimension", 0, "base");
        if (config.dimension <= 0) {
            throw InputError("Error: dimension in base must be a positive integer.");
        }

        const fs::path rootDir = Get<std::string>(base, "root_dir", ".", "base");
        const fs::path outputDir = rootDir / Get<std::string>(base, "output_dir", "output", "base");

        config.solver = ParseSolverConfig(root["solver"], rootDir, outputDir);

        const YAML::Node algorithm = root["algorithm"];
        RequireMap(algorithm, "algorithm");

        if (algorithm && algorithm.IsMap() && algorithm["methods"] && algorithm["methods"].IsScalar()) {
            config.methods = {Get<std::string>(algorithm, "methods", "", "algorithm")};
        } else {
            config.methods = Get<std::vector<std::string>>(algorithm, "methods", config.methods, "algorithm");
        }
        if (config.methods.empty()) {
            throw InputError("Error: methods in algorithm must name at least one method.");
        }

        config.minList = GetList(algorithm, "min_list", config.dimension);
        config.maxList = GetList(algorithm, "max_list", config.dimension);
        for (int i = 0; i < config.dimension; i++) {
            if (!(config.minList[i] < config.maxList[i])) {
                throw InputError(std::format("Error: min_list[{}] must be smaller than max_list[{}].", i, i));
            }
        }

        core::TRunData& runData = config.runData;
        runData.MAXTIME   = Get<int>(algorithm, "max_time", runData.MAXTIME, "algorithm");
        runData.MAXRUNS   = Get<int>(algorithm, "max_runs", runData.MAXRUNS, "algorithm");
        runData.sizePool  = Get<int>(algorithm, "size_pool", runData.sizePool, "algorithm");
        runData.restart   = Get<float>(algorithm, "restart", runData.restart, "algorithm");
        runData.debug     = Get<int>(algorithm, "debug", runData.debug, "algorithm");
        runData.paramFile = Get<std::string>(algorithm, "param_file", runData.paramFile, "algorithm");
        config.seed       = Get<long>(algorithm, "seed", config.seed, "algorithm");

        if (runData.MAXTIME <= 0 || runData.MAXRUNS <= 0) {
            throw InputError("Error: max_time and max_runs in algorithm must be positive.");
        }
        if (runData.sizePool < 2) {
            throw InputError("Error: size_pool in algorithm must be at least 2.");
        }
        if (!(runData.restart > 0.0f) || runData.restart > 1.0f) {
            throw InputError("Error: restart in algorithm must be in (0, 1].");
        }

        return config;
    }

    RunConfig LoadRunConfig(const std::string& filename)
    {
        YAML::Node root;
        try {
            root = YAML::LoadFile(filename);
        } catch (const YAML::BadFile&) {
            throw InputError(std::format("ERROR: configuration file ({}) is not found", filename));
        } catch (const YAML::ParserException& e) {
            throw InputError(std::format("ERROR: syntax error in ({}): {}", filename, e.what()));
        }
        return ParseRunConfig(root);
    }

} // namespace leedopt::leed
