#include <doctest/doctest.h>

#include "fakes.hpp"

#include <boost/filesystem.hpp>
#include <boost/process.hpp>

#include <chrono>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

#include <signal.h>

using adbmux::test::FakeAdb;

namespace bp = boost::process;

namespace {

const auto kCliTimeout = std::chrono::seconds{15};

struct CliResult {
    int exitCode;
    std::string out;
    std::string err;
};

std::string drain (bp::ipstream& is) {
    return std::string{std::istreambuf_iterator<char>{is}, std::istreambuf_iterator<char>{}};
}

// Runs the built adb-multiplexer. `whileRunning` is called once the process is up.
template <class F>
CliResult runCli (const std::vector<std::string>& args, F whileRunning) {
    bp::ipstream out;
    bp::ipstream err;
    bp::child cli{ADBMUX_CLI_PATH, bp::args(args),
        bp::std_in < bp::null, bp::std_out > out, bp::std_err > err};
    whileRunning(cli);
    if (!cli.wait_for(kCliTimeout)) {
        cli.terminate();
        FAIL("adb-multiplexer did not exit in time");
    }
    auto result = CliResult{cli.exit_code(), drain(out), drain(err)};
    MESSAGE("stdout: " << result.out);
    MESSAGE("stderr: " << result.err);
    return result;
}

CliResult runCli (const std::vector<std::string>& args) {
    return runCli(args, [](bp::child&) {});
}

// A scratch path next to the fake adb scripts, removed when the test ends.
class ScratchFile {
public:
    ScratchFile ()
        : mPath(boost::filesystem::temp_directory_path()
                / boost::filesystem::unique_path("adbmux-state-%%%%-%%%%"))
    {}

    ~ScratchFile () {
        boost::system::error_code ec;
        boost::filesystem::remove(mPath, ec);
    }

    ScratchFile (const ScratchFile&) = delete;
    ScratchFile& operator= (const ScratchFile&) = delete;

    std::string path () const { return mPath.string(); }
    bool exists () const { return boost::filesystem::exists(mPath); }

private:
    boost::filesystem::path mPath;
};

const auto kOneDevice = std::string{
    "if [ \"$1\" = devices ]; then\n"
    "    printf 'List of devices attached\\nA\\tdevice\\n\\n'\n"
    "    exit 0\n"
    "fi\n"};

// =======================================================================================
// Test cases

TEST_CASE("the command runs on every device and the tool exits 0") {
    FakeAdb adb{kOneDevice + "echo \"ran $*\""};
    auto result = runCli({"--no-color", "--adb", adb.path(), "adb shell true"});
    CHECK(result.exitCode == 0);
    CHECK(result.out.find("Result for A (unknown)") != std::string::npos);
    CHECK(result.out.find("ran -s A shell true") != std::string::npos);
}

TEST_CASE("a device listing failure exits 1") {
    FakeAdb adb{"echo 'adb: server died' >&2\nexit 1"};
    auto result = runCli({"--no-color", "--adb", adb.path(), "shell true"});
    CHECK(result.exitCode == 1);
    CHECK_FALSE(result.err.empty());
}

TEST_CASE("usage errors exit 2") {
    FakeAdb adb{kOneDevice + "echo ran"};
    SUBCASE("missing command") {
        auto result = runCli({"--adb", adb.path()});
        CHECK(result.exitCode == 2);
        CHECK(result.err.find("missing <command>") != std::string::npos);
        CHECK(result.out.find("ran") == std::string::npos);
    }
    SUBCASE("unknown option") {
        CHECK(runCli({"--adb", adb.path(), "--bogus", "shell true"}).exitCode == 2);
    }
}

TEST_CASE("continuous mode stops watching and exits 0 when device detection fails") {
    ScratchFile calledOnce;
    FakeAdb adb{
        "[ -f '" + calledOnce.path() + "' ] && exit 1\n"
        "touch '" + calledOnce.path() + "'\n"
        "printf 'List of devices attached\\n\\n'"};
    auto result = runCli({"--no-color", "--continue", "--interval", "10", "--adb", adb.path(),
        "shell true"});
    CHECK(result.exitCode == 0);
    CHECK(result.err.find("no devices detected") != std::string::npos);
}

TEST_CASE("SIGINT during the first run kills the command and skips watching") {
    ScratchFile started;
    FakeAdb adb{kOneDevice + "touch '" + started.path() + "'\nsleep 10"};
    auto begin = std::chrono::steady_clock::now();
    auto result = runCli({"--no-color", "--continue", "--adb", adb.path(), "shell true"},
        [&](bp::child& cli) {
            // Only signal once the command runs, so that the tool's handlers are installed.
            auto deadline = std::chrono::steady_clock::now() + kCliTimeout;
            while (!started.exists() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds{20});
            }
            REQUIRE(started.exists());
            ::kill(cli.id(), SIGINT);
        });
    CHECK(result.exitCode == 0);
    CHECK(result.err.find("interrupted") != std::string::npos);
    CHECK(std::chrono::steady_clock::now() - begin < std::chrono::seconds{8});
}

}  // <anonymous>
