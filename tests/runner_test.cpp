#include "leedopt/leed/runner.hpp"
#include "test_utils.hpp"

#include <cassert>
#include <iostream>
#include <chrono>
#include <csignal>
#include <thread>

#include <sys/types.h>

namespace
{
// true while pid exists and is not a zombie
bool ProcessAlive(pid_t pid)
{
    const leedopt::fs::path stat = leedopt::fs::path("/proc") / std::to_string(pid) / "stat";
    std::ifstream in(stat);
    if (!in) return false;
    std::string line;
    std::getline(in, line);
    const size_t paren = line.rfind(')');
    if (paren == std::string::npos || paren + 2 >= line.size()) return false;
    const char state = line[paren + 2];
    return state != 'Z' && state != 'X';
}
} // namespace

int main()
{
    using namespace leedopt;
    using Code = leed::SolverRunStatus::Code;

    test::TempDir tmp("runner");
    const fs::path bin = tmp.path() / "bin";
    const fs::path work = tmp.path() / "work";
    fs::create_directories(work);

    test::WriteScript(bin / "ok1.exe", "echo first >> order.txt\necho hello\n");
    test::WriteScript(bin / "ok2.exe", "echo second >> order.txt\necho oops 1>&2\n");
    test::WriteScript(bin / "fail.exe", "echo failing >> order.txt\nexit 3\n");
    test::WriteScript(bin / "slow.exe", "exec sleep 30\n");
    // the shell stays the parent of a long-running child
    test::WriteScript(bin / "wrapper.exe", "sh -c 'echo $$ > child.pid; exec sleep 30'\n:\n");

    const fs::path cwdBefore = fs::current_path();

    // both stages run in order inside the workspace
    leed::ProcessResult single = leed::RunExecutable(bin / "ok1.exe", work, 0);
    assert(single.ok());
    assert(single.exitCode == 0);
    assert(test::ReadText(work / "order.txt") == "first\n");
    assert(test::ReadText(work / "stdout") == "hello\n");
    fs::remove(work / "order.txt");
    fs::remove(work / "stdout");

    leed::SolverRunStatus status = leed::RunSolvers(bin / "ok1.exe", bin / "ok2.exe", work, 0);
    assert(status.ok());
    assert(status.stage == 0);
    assert(test::ReadText(work / "order.txt") == "first\nsecond\n");
    assert(test::ReadText(work / "stdout") == "hello\noops\n");
    assert(fs::current_path() == cwdBefore);
    fs::remove(work / "order.txt");

    // a failing first stage skips the second one
    status = leed::RunSolvers(bin / "fail.exe", bin / "ok2.exe", work, 0);
    assert(status.code == Code::FirstStageFailed);
    assert(status.stage == 1);
    assert(status.exitCode == 3);
    assert(status.message.find("non-zero exit status 3") != std::string::npos);
    assert(test::ReadText(work / "order.txt") == "failing\n");
    fs::remove(work / "order.txt");

    status = leed::RunSolvers(bin / "ok1.exe", bin / "fail.exe", work, 0);
    assert(status.code == Code::SecondStageFailed);
    assert(status.stage == 2);
    assert(std::string(leed::ToString(status.code)) == "second stage failed");

    // a missing executable is a failed stage, not a crash
    status = leed::RunSolvers(bin / "none.exe", bin / "ok2.exe", work, 0);
    assert(status.code == Code::FirstStageFailed);
    assert(status.exitCode == 127);

    // timeout kills the process
    const auto start = std::chrono::steady_clock::now();
    status = leed::RunSolvers(bin / "ok1.exe", bin / "slow.exe", work, 1);
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - start);
    assert(status.code == Code::TimedOut);
    assert(status.stage == 2);
    assert(elapsed.count() < 10);

    // children of a timed-out stage are killed with it
    const fs::path wrapped = tmp.path() / "wrapped";
    fs::create_directories(wrapped);
    const leed::ProcessResult killed = leed::RunExecutable(bin / "wrapper.exe", wrapped, 1);
    assert(killed.timedOut);
    assert(killed.signal == SIGKILL);
    const pid_t child = static_cast<pid_t>(std::stol(test::ReadText(wrapped / "child.pid")));
    bool alive = ProcessAlive(child);
    for (int i = 0; alive && i < 100; i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        alive = ProcessAlive(child);
    }
    assert(!alive);

    std::cout << "runner_test passed\n";
    return 0;
}
