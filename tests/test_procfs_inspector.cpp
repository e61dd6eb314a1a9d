#include <catch2/catch_test_macros.hpp>

#include "platform/linux/procfs_inspector.hpp"

#include <csignal>
#include <sys/wait.h>
#include <unistd.h>

TEST_CASE("ProcfsInspector", "[procfs]") {
    ProcfsInspector inspector;

    SECTION("SelfHasCommandLine") {
        auto cmdline = inspector.command_line(getpid());
        REQUIRE_FALSE(cmdline.empty());
        REQUIRE(cmdline.find("hook-unify-tests") != std::string::npos);
        REQUIRE(cmdline.find('\0') == std::string::npos);
    }

    SECTION("SelfParentMatchesGetppid") {
        auto ppid = inspector.parent_pid(getpid());
        if (getppid() > 1) {
            REQUIRE(ppid == getppid());
        } else {
            REQUIRE_FALSE(ppid.has_value());
        }
    }

    SECTION("InvalidPidReturnsEmpty") {
        REQUIRE(inspector.command_line(999999999).empty());
        REQUIRE(inspector.command_line(0).empty());
        REQUIRE(inspector.command_line(-1).empty());
    }

    SECTION("InvalidPidHasNoParent") {
        REQUIRE_FALSE(inspector.parent_pid(999999999).has_value());
        REQUIRE_FALSE(inspector.parent_pid(1).has_value());
        REQUIRE_FALSE(inspector.parent_pid(0).has_value());
    }

    SECTION("ChildArgumentsJoinedWithSpaces") {
        pid_t child = fork();
        REQUIRE(child >= 0);
        if (child == 0) {
            execlp("sleep", "sleep", "10", nullptr);
            _exit(127);
        }
        usleep(100000); // 100ms for exec to complete

        REQUIRE(inspector.command_line(child) == "sleep 10");
        REQUIRE(inspector.parent_pid(child) == getpid());

        kill(child, SIGTERM);
        waitpid(child, nullptr, 0);
    }

    SECTION("ParseStat") {
        REQUIRE(ProcfsInspector::parse_stat_ppid("1234 (bash) S 987 1234 1234 0") == 987);
        // comm containing spaces and parentheses
        REQUIRE(ProcfsInspector::parse_stat_ppid("42 (my (odd) proc) R 7 42 42") == 7);
        REQUIRE_FALSE(ProcfsInspector::parse_stat_ppid("").has_value());
        REQUIRE_FALSE(ProcfsInspector::parse_stat_ppid("42 (x) S").has_value());
        REQUIRE_FALSE(ProcfsInspector::parse_stat_ppid("42 (x) S abc").has_value());
    }
}
