#include <adbmux/devices.hpp>
#include <adbmux/errors.hpp>
#include <adbmux/log.hpp>

#include "process.hpp"

#include <boost/process.hpp>

#include <iterator>
#include <string>
#include <system_error>

namespace bp = boost::process;

namespace adbmux {

DeviceList devices (const std::string& adbPath) {
    log::Logger lg;

    auto adb = findExecutable(adbPath);
    if (adb.empty()) {
        throw DetectionError{"could not find `" + adbPath + "` on PATH"};
    }

    auto output = std::string{};
    auto exitCode = 0;
    try {
        bp::ipstream childStdout;
        bp::child child{adb, "devices", "-l",
            bp::std_out > childStdout,
            bp::std_err > bp::null,
            bp::std_in < bp::null
        };
        output.assign(std::istreambuf_iterator<char>{childStdout}, std::istreambuf_iterator<char>{});
        child.wait();
        exitCode = child.exit_code();
    }
    catch (const std::system_error& e) {
        BOOST_LOG(lg) << "running " << adb << " threw: " << e.what();
        throw DetectionError{"could not run `" + adb.string() + " devices`: " + e.what()};
    }

    if (exitCode) {
        BOOST_LOG(lg) << adb << " devices exited with " << exitCode;
        throw DetectionError{"`" + adb.string() + " devices` exited with code "
            + std::to_string(exitCode)};
    }

    auto result = parseAdbDevices(output);
    BOOST_LOG(lg) << "adb reports " << result.size() << " device(s)";
    return result;
}

} // namespace adbmux
