#include <doctest/doctest.h>

#include "fakes.hpp"

#include <adbmux/command.hpp>
#include <adbmux/devices.hpp>
#include <adbmux/errors.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <chrono>
#include <csignal>
#include <thread>

#include <signal.h>
#include <unistd.h>

using adbmux::test::FakeAdb;
using adbmux::test::online;

namespace {

// =======================================================================================
// Test cases

TEST_CASE("the adb keyword is optional") {
    CHECK(adbmux::normalizeCommand("adb install myApp.apk") == "install myApp.apk");
    CHECK(adbmux::normalizeCommand("install myApp.apk") == "install myApp.apk");
    CHECK(adbmux::normalizeCommand("  adb   shell getprop ro.product.model  ")
        == "shell getprop ro.product.model");
    CHECK(adbmux::normalizeCommand("adb\tdevices") == "devices");
    CHECK(adbmux::normalizeCommand("adb") == "");
}

TEST_CASE("only a whole leading adb word is stripped") {
    CHECK(adbmux::normalizeCommand("adbd restart") == "adbd restart");
    CHECK(adbmux::normalizeCommand("shell adb version") == "shell adb version");
    CHECK(adbmux::normalizeCommand("adb shell 'echo  adb'") == "shell 'echo  adb'");
}

TEST_CASE("device ids are validated") {
    CHECK(adbmux::isValidDeviceId("emulator-5554"));
    CHECK(adbmux::isValidDeviceId("192.168.1.20:5555"));
    CHECK(adbmux::isValidDeviceId("adb-R58M1234ABC-x7Yz._adb-tls-connect._tcp"));
    CHECK_FALSE(adbmux::isValidDeviceId(""));
    CHECK_FALSE(adbmux::isValidDeviceId("bad id"));
    CHECK_FALSE(adbmux::isValidDeviceId("A'; rm -rf ~; '"));
}

TEST_CASE("executes the command scoped to the device") {
    FakeAdb adb{R"(echo "$@")"};
    auto executor = adbmux::Executor{adb.path()};

    CHECK(executor.execute(online("A"), "adb shell getprop ro.product.model")
        == "-s A shell getprop ro.product.model\n");
    // The remainder is handed to the shell verbatim.
    CHECK(executor.execute(online("emulator-5554"), "shell 'echo   hi'")
        == "-s emulator-5554 shell echo   hi\n");
    CHECK(online("B").executeCommand("install x.apk", executor) == "-s B install x.apk\n");
}

TEST_CASE("captures stdout followed by stderr") {
    FakeAdb adb{"echo out\necho err >&2"};
    CHECK(adbmux::Executor{adb.path()}.execute(online("A"), "shell true") == "out\nerr\n");
}

TEST_CASE("a non-zero exit status is an execution error carrying the output") {
    FakeAdb adb{"echo 'error: device not found' >&2\nexit 1"};
    auto executor = adbmux::Executor{adb.path()};
    try {
        executor.execute(online("A"), "install x.apk");
        FAIL("expected an ExecutionError");
    }
    catch (const adbmux::ExecutionError& e) {
        CHECK(e.output() == "error: device not found\n");
        CHECK(std::string{e.what()}.find("code 1") != std::string::npos);
    }
}

TEST_CASE("a malformed device id fails without running anything") {
    FakeAdb adb{"echo ran"};
    auto executor = adbmux::Executor{adb.path()};
    CHECK_THROWS_AS(executor.execute(online("bad id"), "shell true"), adbmux::ExecutionError);
}

TEST_CASE("a missing adb is an execution error") {
    auto executor = adbmux::Executor{"/nonexistent/adbmux/adb"};
    CHECK_THROWS_AS(executor.execute(online("A"), "shell true"), adbmux::ExecutionError);
}

TEST_CASE("a command that outlives the timeout is an execution error keeping its output") {
    FakeAdb adb{"echo partial\necho partial-err >&2\nsleep 10"};
    auto executor = adbmux::Executor{adb.path(), std::chrono::seconds{1}};
    auto start = std::chrono::steady_clock::now();
    try {
        executor.execute(online("A"), "shell true");
        FAIL("expected an ExecutionError");
    }
    catch (const adbmux::ExecutionError& e) {
        CHECK(std::string{e.what()}.find("timed out") != std::string::npos);
        CHECK(e.output() == "partial\npartial-err\n");
    }
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds{8});
}

TEST_CASE("SIGINT while a command runs kills it and is an execution error") {
    // Keeps a SIGINT handler installed for the whole test, so that a signal landing outside of
    // execute() doesn't terminate the test runner.
    boost::asio::io_context idle;
    boost::asio::signal_set guard{idle, SIGINT};

    FakeAdb adb{"echo started\nsleep 10"};
    auto executor = adbmux::Executor{adb.path(), std::chrono::seconds{30}};
    auto start = std::chrono::steady_clock::now();
    std::thread interrupter{[] {
        std::this_thread::sleep_for(std::chrono::milliseconds{500});
        ::kill(::getpid(), SIGINT);
    }};
    auto message = std::string{};
    auto output = std::string{};
    try {
        executor.execute(online("A"), "shell true");
    }
    catch (const adbmux::ExecutionError& e) {
        message = e.what();
        output = e.output();
    }
    interrupter.join();
    CHECK(message.find("interrupted") != std::string::npos);
    CHECK(output == "started\n");
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds{8});
}

TEST_CASE("device listing runs adb devices -l") {
    FakeAdb adb{
        "[ \"$1 $2\" = \"devices -l\" ] || exit 1\n"
        "echo 'List of devices attached'\n"
        "echo 'emulator-5554          device product:sdk model:Pixel_3 device:generic transport_id:1'\n"
        "echo"};
    auto devices = adbmux::devices(adb.path());
    REQUIRE(devices.size() == 1);
    CHECK(devices[0] == (adbmux::Device{"emulator-5554", "Pixel_3", adbmux::DeviceState::online}));
}

TEST_CASE("device listing failures are detection errors") {
    SUBCASE("adb exits non-zero") {
        FakeAdb adb{"echo 'List of devices attached'\nexit 1"};
        CHECK_THROWS_AS(adbmux::devices(adb.path()), adbmux::DetectionError);
    }
    SUBCASE("adb prints garbage") {
        FakeAdb adb{"echo 'adb: usage: unknown command'"};
        CHECK_THROWS_AS(adbmux::devices(adb.path()), adbmux::DetectionError);
    }
    SUBCASE("adb is missing") {
        CHECK_THROWS_AS(adbmux::devices("/nonexistent/adbmux/adb"), adbmux::DetectionError);
        CHECK_THROWS_AS(adbmux::devices("adbmux-no-such-program"), adbmux::DetectionError);
    }
}

}  // <anonymous>
