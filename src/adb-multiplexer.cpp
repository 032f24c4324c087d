/// Executes an adb command on every attached Android device.
///
/// With --continue, keeps running and executes the command again on every device that is connected
/// or changes state, until interrupted.

#include <adbmux/command.hpp>
#include <adbmux/console.hpp>
#include <adbmux/devices.hpp>
#include <adbmux/errors.hpp>
#include <adbmux/log.hpp>
#include <adbmux/monitor.hpp>
#include <adbmux/multiplexer.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>

#include <boost/program_options.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

#include <unistd.h>

namespace po = boost::program_options;

namespace {

const auto kVersion = "1.0";
const auto kAdbEnv = "ADBMUX_ADB";

void printUsage (std::ostream& os, const po::options_description& desc) {
    os << "usage: adb-multiplexer [options] <command>\n\n"
       << "Executes ADB commands on all connected devices.\n\n"
       << "  <command>   ADB command to execute, for example \"adb install <path to apk>\". Use\n"
       << "              quotation marks for multiword commands. The \"adb\" prefix is optional.\n\n"
       << desc << '\n'
       << "Example usage: adb-multiplexer \"adb install myApp.apk\"\n";
}

std::string defaultAdbPath () {
    auto env = std::getenv(kAdbEnv);
    return env && *env ? env : "adb";
}

} // <anonymous>

int main (int argc, char** argv) {
    auto desc = po::options_description{"Options"};
    desc.add_options()
        ("help,h", "show this help message and exit")
        ("version,V", "show the version number and exit")
        ("continue,c", "continue to execute the given command on every device that will be "
            "connected for as long as this tool is running")
        ("no-color", "disable coloring of adb command output")
        ("interval", po::value<unsigned>()->default_value(500), "device poll interval in milliseconds")
        ("timeout", po::value<unsigned>()->default_value(300), "per-device command timeout in seconds")
        ("adb", po::value<std::string>(), "adb executable (default: $ADBMUX_ADB, or adb on PATH)")
    ;
    desc.add(adbmux::log::optionsDescription());

    auto hidden = po::options_description{};
    hidden.add_options()
        ("command", po::value<std::string>(), "adb command to execute")
    ;

    auto all = po::options_description{};
    all.add(desc).add(hidden);

    auto positional = po::positional_options_description{};
    positional.add("command", 1);

    po::variables_map options;
    try {
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), options);
        po::notify(options);
    }
    catch (const po::error& e) {
        std::cerr << "adb-multiplexer: " << e.what() << "\n\n";
        printUsage(std::cerr, desc);
        return 2;
    }

    if (options.count("help")) {
        printUsage(std::cout, desc);
        return 0;
    }
    if (options.count("version")) {
        std::cout << kVersion << '\n';
        return 0;
    }
    if (!options.count("command")) {
        std::cerr << "adb-multiplexer: missing <command>\n\n";
        printUsage(std::cerr, desc);
        return 2;
    }

    adbmux::log::initialize(options);
    adbmux::log::Logger lg;

    const auto command = options["command"].as<std::string>();
    const auto adbPath = options.count("adb") ? options["adb"].as<std::string>() : defaultAdbPath();
    const auto colorOut = !options.count("no-color") && isatty(STDOUT_FILENO);
    const auto colorErr = !options.count("no-color") && isatty(STDERR_FILENO);

    BOOST_LOG(lg) << "command: " << command << ", adb: " << adbPath;

    auto console = adbmux::Console{std::cout, std::cerr, colorOut, colorErr};
    boost::asio::io_context context;

    adbmux::Monitor monitor{context,
        [adbPath] { return adbmux::devices(adbPath); },
        std::chrono::milliseconds{options["interval"].as<unsigned>()}};

    adbmux::Multiplexer multiplexer{monitor,
        adbmux::Executor{adbPath, std::chrono::seconds{options["timeout"].as<unsigned>()}},
        console, command};

    // Installed before the first batch: a signal that arrives while it runs kills the running
    // command (see Executor::execute) and is queued here, so watching never starts.
    auto stopped = false;
    boost::asio::signal_set signals{context, SIGINT, SIGTERM};
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            BOOST_LOG(lg) << "received signal " << signo << ", shutting down";
            stopped = true;
            monitor.unwatch();
        }
    });

    try {
        // Always execute for all currently connected devices.
        multiplexer.runOnce();
    }
    catch (const adbmux::DetectionError& e) {
        console.error(e.what());
        return 1;
    }

    context.poll();
    if (options.count("continue") && !stopped) {
        // If the multiplexer gave up watching, stop waiting for signals so that run() returns.
        monitor.onError([&](const adbmux::DetectionError&) {
            boost::asio::post(context, [&] {
                if (!monitor.watching()) {
                    signals.cancel();
                }
            });
        });

        multiplexer.watch();
        context.run();
    }

    return 0;
}
