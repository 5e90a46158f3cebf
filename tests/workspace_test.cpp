#include "leedopt/leed/workspace.hpp"
#include "leedopt/core/exception.hpp"
#include "test_utils.hpp"

#include <cassert>
#include <iostream>
#include <set>

int main()
{
    using namespace leedopt;

    // names
    assert(leed::WorkspaceName(3, 7) == "Log00000003_00000007");
    assert(leed::WorkspaceName(0, 0) == "Log00000000_00000000");
    assert(leed::WorkspaceName(12345678, 1) == "Log12345678_00000001");

    std::set<std::string> names;
    for (int step = 0; step < 40; step++)
        for (int set = 0; set < 40; set++)
            names.insert(leed::WorkspaceName(step, set));
    assert(names.size() == 40 * 40);
    assert(leed::WorkspaceName(1, 23) != leed::WorkspaceName(12, 3));

    bool negative = false;
    try {
        leed::WorkspaceName(-1, 0);
    } catch (const InputError&) {
        negative = true;
    }
    assert(negative);

    test::TempDir tmp("workspace");
    const fs::path base = tmp.path() / "base";
    test::MakeReference(base);

    // every required file is checked
    leed::CheckReferenceFiles(base);
    for (const auto& file : leed::kReferenceFiles) {
        const fs::path partial = tmp.path() / ("partial_" + file);
        test::MakeReference(partial);
        fs::remove(partial / file);

        std::string message;
        try {
            leed::CheckReferenceFiles(partial);
        } catch (const InputError& e) {
            message = e.what();
        }
        assert(message == std::format("ERROR: input file ({}) is not found in ({})", file, partial.string()));
    }

    // full recursive copy, parents created
    test::WriteText(base / "phases" / "ph1.d", "phase 1\n");
    const fs::path work = tmp.path() / "output" / "nested" / leed::WorkspaceName(1, 2);
    leed::CopyReference(base, work);
    for (const auto& file : leed::kReferenceFiles) {
        assert(test::ReadText(work / file) == test::ReadText(base / file));
    }
    assert(test::ReadText(work / "phases" / "ph1.d") == "phase 1\n");

    // copying again restores the baseline
    test::WriteText(work / "tleed5.i", "modified\n");
    leed::CopyReference(base, work);
    assert(test::ReadText(work / "tleed5.i") == test::ReadText(base / "tleed5.i"));

    std::cout << "workspace_test passed\n";
    return 0;
}
