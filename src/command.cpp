#include <adbmux/command.hpp>
#include <adbmux/errors.hpp>
#include <adbmux/log.hpp>

#include "process.hpp"

#include <boost/process.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <csignal>
#include <future>
#include <string>
#include <system_error>

namespace bp = boost::process;

namespace adbmux {

constexpr std::chrono::seconds Executor::kDefaultTimeout;

std::string normalizeCommand (const std::string& command) {
    static const auto keyword = std::string{"adb"};

    auto result = boost::algorithm::trim_copy(command);
    if (boost::algorithm::starts_with(result, keyword)
        && (result.size() == keyword.size()
            || boost::algorithm::is_space()(result[keyword.size()]))) {
        result.erase(0, keyword.size());
        boost::algorithm::trim_left(result);
    }
    return result;
}

bool isValidDeviceId (const std::string& id) {
    return !id.empty()
        && boost::algorithm::all(id, boost::algorithm::is_alnum() || boost::algorithm::is_any_of("._:-"));
}

std::string Executor::execute (const Device& device, const std::string& command) const {
    log::Logger lg;

    if (!isValidDeviceId(device.id())) {
        throw ExecutionError{"malformed device id '" + device.id() + "'"};
    }

    auto adb = findExecutable(mAdbPath);
    if (adb.empty()) {
        throw ExecutionError{"could not find `" + mAdbPath + "` on PATH"};
    }
    auto sh = bp::search_path("sh");
    if (sh.empty()) {
        throw ExecutionError{"could not find `sh` on PATH"};
    }

    auto line = shellQuote(adb.string()) + " -s " + shellQuote(device.id())
        + " " + normalizeCommand(command);
    BOOST_LOG(lg) << "running: " << line;

    // The child runs in its own io_context and process group, so that a timeout can kill it along
    // with anything it spawned. Being in its own group, it doesn't see a terminal's SIGINT, so
    // SIGINT and SIGTERM are passed on while it runs.
    boost::asio::io_context context;
    boost::asio::signal_set interrupts{context, SIGINT, SIGTERM};
    std::future<std::string> childStdout;
    std::future<std::string> childStderr;
    bp::group group;
    bp::child child;
    auto exited = false;
    auto exitCode = 0;
    auto timedOut = false;
    auto interrupted = false;
    try {
        interrupts.async_wait([&](const boost::system::error_code& ec, int signo) {
            if (!ec) {
                BOOST_LOG(lg) << device.id() << ": received signal " << signo << ", killing command";
                interrupted = true;
                std::error_code killError;
                group.terminate(killError);
            }
        });

        child = bp::child{sh, "-c", line,
            bp::std_in < bp::null,
            bp::std_out > childStdout,
            bp::std_err > childStderr,
            bp::on_exit([&](int code, const std::error_code&) {
                exited = true;
                exitCode = code;
                interrupts.cancel();
            }),
            context,
            group
        };

        context.run_for(mTimeout);

        if (!exited) {
            BOOST_LOG(lg) << device.id() << ": timed out after " << mTimeout.count() << "s";
            timedOut = true;
            group.terminate();
            // Once the whole group is gone both pipes reach EOF, so whatever was printed before
            // the timeout can still be collected.
            context.restart();
            context.run();
        }
    }
    catch (const std::system_error& e) {
        BOOST_LOG(lg) << "running " << line << " threw: " << e.what();
        throw ExecutionError{"could not run command on " + device.id() + ": " + e.what()};
    }

    auto output = std::string{};
    try {
        output = childStdout.get() + childStderr.get();
    }
    catch (const std::exception& e) {
        BOOST_LOG(lg) << device.id() << ": could not read command output: " << e.what();
        throw ExecutionError{"could not read command output from " + device.id() + ": " + e.what()};
    }

    if (timedOut) {
        throw ExecutionError{"command timed out after " + std::to_string(mTimeout.count())
            + "s on " + device.id(), output};
    }
    if (interrupted) {
        throw ExecutionError{"command interrupted on " + device.id(), output};
    }

    BOOST_LOG(lg) << device.id() << ": exited with " << exitCode;
    if (exitCode) {
        throw ExecutionError{"command exited with code " + std::to_string(exitCode)
            + " on " + device.id(), output};
    }
    return output;
}

} // namespace adbmux
