#include "leedopt/leed/config.hpp"
#include "leedopt/core/exception.hpp"
#include "test_utils.hpp"

#include <cassert>
#include <iostream>

namespace
{
const char* kRunFile = R"(
base:
  dimension: 2
  root_dir: "/tmp/leed"
  output_dir: "out"
solver:
  name: "leed"
  config:
    path_to_first_solver: "bin/satl1.exe"
    timeout: 30
  reference:
    path_to_base_dir: "base"
  post:
    remove_work_dir: true
algorithm:
  methods: [SA, MultiStart]
  min_list: [-1.0, 0.0]
  max_list: [1.0, 2.5]
  max_time: 5
  size_pool: 4
  seed: 42
)";

// message of the InputError raised while parsing text, empty if none
std::string ParseError(const std::string& text)
{
    try {
        leedopt::leed::ParseRunConfig(YAML::Load(text));
    } catch (const leedopt::InputError& e) {
        return e.what();
    }
    return "";
}

std::string Replace(std::string text, const std::string& from, const std::string& to)
{
    const size_t pos = text.find(from);
    assert(pos != std::string::npos);
    return text.replace(pos, from.size(), to);
}
} // namespace

int main()
{
    using namespace leedopt;

    // full run file
    const leed::RunConfig config = leed::ParseRunConfig(YAML::Load(kRunFile));
    assert(config.dimension == 2);
    assert(config.solver.rootDir == fs::path("/tmp/leed"));
    assert(config.solver.outputDir == fs::path("/tmp/leed/out"));
    assert(config.solver.firstSolver == "bin/satl1.exe");
    assert(config.solver.secondSolver == "satl2.exe");
    assert(config.solver.baseDir == fs::path("base"));
    assert(config.solver.removeWorkDir);
    assert(config.solver.timeout == 30);
    assert((config.methods == std::vector<std::string>{"SA", "MultiStart"}));
    assert((config.minList == std::vector<double>{-1.0, 0.0}));
    assert((config.maxList == std::vector<double>{1.0, 2.5}));
    assert(config.runData.MAXTIME == 5);
    assert(config.runData.sizePool == 4);
    assert(config.runData.MAXRUNS == 1);
    assert(config.seed == 42);

    // defaults of the solver section
    const leed::SolverConfig minimal = leed::ParseSolverConfig(
        YAML::Load("reference:\n  path_to_base_dir: ref\n"), ".", "output");
    assert(minimal.firstSolver == "satl1.exe");
    assert(minimal.secondSolver == "satl2.exe");
    assert(!minimal.removeWorkDir);
    assert(minimal.timeout == 0);

    // cleanup flag is a boolean, not a string
    assert(leed::ParseSolverConfig(YAML::Load("reference: {path_to_base_dir: ref}\npost: {remove_work_dir: false}"),
                                   ".", "output").removeWorkDir == false);
    assert(ParseError(Replace(kRunFile, "remove_work_dir: true", "remove_work_dir: sometimes")).find("remove_work_dir") != std::string::npos);

    // unknown keywords
    assert(ParseError(Replace(kRunFile, "timeout: 30", "nthreads: 4")) == "Error: nthreads in config is not correct keyword.");
    assert(ParseError(Replace(kRunFile, "path_to_base_dir:", "path_to_base:")) == "Error: path_to_base in reference is not correct keyword.");
    assert(ParseError(Replace(kRunFile, "post:", "postprocess:")) == "Error: postprocess in solver is not correct keyword.");

    // required entries and consistency checks
    assert(ParseError(Replace(kRunFile, "path_to_base_dir: \"base\"", "")).find("path_to_base_dir") != std::string::npos);
    assert(ParseError(Replace(kRunFile, "dimension: 2", "dimension: 3")).find("min_list") != std::string::npos);
    assert(ParseError(Replace(kRunFile, "max_list: [1.0, 2.5]", "max_list: [1.0, -2.5]")).find("min_list[1]") != std::string::npos);
    assert(ParseError(Replace(kRunFile, "name: \"leed\"", "name: \"sxrd\"")).find("sxrd") != std::string::npos);
    assert(!ParseError(Replace(kRunFile, "size_pool: 4", "size_pool: 1")).empty());

    // a single method may be given as a scalar
    const leed::RunConfig single = leed::ParseRunConfig(YAML::Load(Replace(kRunFile, "[SA, MultiStart]", "MultiStart")));
    assert((single.methods == std::vector<std::string>{"MultiStart"}));

    // from disk
    test::TempDir tmp("config");
    test::WriteText(tmp.path() / "run.yaml", kRunFile);
    assert(leed::LoadRunConfig((tmp.path() / "run.yaml").string()).dimension == 2);

    bool missing = false;
    try {
        leed::LoadRunConfig((tmp.path() / "none.yaml").string());
    } catch (const InputError&) {
        missing = true;
    }
    assert(missing);

    std::cout << "config_test passed\n";
    return 0;
}
