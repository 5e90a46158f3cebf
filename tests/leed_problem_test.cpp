#include "leedopt/leed/leed_problem.hpp"
#include "leedopt/core/exception.hpp"
#include "test_utils.hpp"

#include <omp.h>

#include <cassert>
#include <cmath>
#include <iostream>
#include <set>

int main()
{
    using namespace leedopt;

    test::TempDir tmp("leed_problem");
    leed::SolverConfig config = test::MakeSolverConfig(tmp.path());

    leed::LeedProblem problem(config, {0.0, -1.0}, {2.0, 1.0});
    assert(problem.getDimension() == 2);

    // random keys onto the parameter box
    core::TSol s;
    s.rk = {0.25, 0.5};
    const std::vector<double> x = problem.decode(s);
    assert(std::fabs(x[0] - 0.5) < 1e-12);
    assert(std::fabs(x[1] - 0.0) < 1e-12);

    // evaluate runs the whole cycle; the fake solver reports x1
    assert(std::fabs(problem.evaluate(s) - 0.5) < 1e-12);
    s.rk = {0.75, 0.0};
    assert(std::fabs(problem.evaluate(s) - 1.5) < 1e-12);
    assert(problem.evaluations() == 2);
    assert(fs::exists(tmp.path() / "output" / "Log00000000_00000000"));
    assert(fs::exists(tmp.path() / "output" / "Log00000001_00000000"));

    std::vector<leed::EvaluationRecord> history = problem.history();
    assert(history.size() == 2);
    assert(history[1].step == 1 && history[1].ok);
    assert(std::fabs(history[1].x[1] + 1.0) < 1e-12);

    // concurrent evaluations never share a workspace
    const int threads = 4;
    const int perThread = 3;
    omp_set_num_threads(threads);
    #pragma omp parallel for schedule(static, 1)
    for (int i = 0; i < threads * perThread; i++) {
        core::TSol t;
        t.rk = {0.5, 0.5};
        const double value = problem.evaluate(t);
        assert(std::fabs(value - 1.0) < 1e-12);
    }
    history = problem.history();
    assert(history.size() == static_cast<size_t>(2 + threads * perThread));
    std::set<std::string> names;
    for (const auto& record : history) {
        names.insert(leed::WorkspaceName(record.step, record.set));
    }
    assert(names.size() == history.size());

    // solver failures score infinity instead of aborting the search
    test::WriteScript(tmp.path() / "bin" / "broken.exe", "exit 1\n");
    leed::SolverConfig broken = config;
    broken.secondSolver = "bin/broken.exe";
    broken.outputDir = tmp.path() / "output_broken";
    leed::LeedProblem brokenProblem(broken, {0.0, 0.0}, {1.0, 1.0});
    s.rk = {0.1, 0.2};
    assert(std::isinf(brokenProblem.evaluate(s)));
    assert(!brokenProblem.history()[0].ok);

    // concurrent failures each log and score infinity
    #pragma omp parallel for schedule(static, 1)
    for (int i = 0; i < threads; i++) {
        core::TSol t;
        t.rk = {0.5, 0.5};
        assert(std::isinf(brokenProblem.evaluate(t)));
    }
    assert(brokenProblem.history().size() == static_cast<size_t>(1 + threads));

    // marker written but no R-FACTOR line: infinity, logged
    test::WriteScript(tmp.path() / "bin" / "silent.exe", ": > 'iv 1'\n: > search.s\n");
    leed::SolverConfig silent = config;
    silent.secondSolver = "bin/silent.exe";
    silent.outputDir = tmp.path() / "output_silent";
    leed::LeedProblem silentProblem(silent, {0.0, 0.0}, {1.0, 1.0});
    assert(std::isinf(silentProblem.evaluate(s)));

    // explicit identity
    leed::EvaluationRequest request;
    request.x = {0.3, 0.4};
    request.step = 99;
    request.set = 1;
    const leed::EvaluationRecord record = problem.evaluateRequest(request);
    assert(record.ok && std::fabs(record.rfactor - 0.3) < 1e-12);
    assert(fs::exists(tmp.path() / "output" / "Log00000099_00000001"));

    bool mismatch = false;
    try {
        leed::LeedProblem wrong(config, {0.0, 0.0}, {1.0});
    } catch (const InputError&) {
        mismatch = true;
    }
    assert(mismatch);

    std::cout << "leed_problem_test passed\n";
    return 0;
}
