#ifndef ADBMUX_MULTIPLEXER_HPP
#define ADBMUX_MULTIPLEXER_HPP

#include <adbmux/command.hpp>
#include <adbmux/console.hpp>
#include <adbmux/devices.hpp>
#include <adbmux/log.hpp>
#include <adbmux/monitor.hpp>

#include <functional>
#include <string>

namespace adbmux {

using CommandRunner = std::function<std::string(const Device&, const std::string&)>;
// Runs a command on one device and returns its output. Throws ExecutionError.

enum class BatchResult {
    executed,     // the command ran on every online device
    noDevices,    // nothing attached
    offlineOnly,  // devices attached, none of them online
    aborted       // a command failed, the rest of the batch was skipped
};

std::ostream& operator<< (std::ostream& os, BatchResult r);

// Runs one command on every online device, once now and, while watching, again for each device
// that appears or changes state.
class Multiplexer {
public:
    Multiplexer (Monitor& monitor, CommandRunner runner, Console& console,
                 const std::string& command);

    Multiplexer (Monitor& monitor, const Executor& executor, Console& console,
                 const std::string& command);

    Multiplexer (const Multiplexer&) = delete;
    Multiplexer& operator= (const Multiplexer&) = delete;

    BatchResult runOnce ();
    // Run the command on every device online right now. Throws DetectionError.

    void watch ();
    // Subscribe to the monitor and start it watching. Each notification runs the command on the
    // notified devices only. A failed device query is reported, then stops the watch unless
    // `unwatchOnDetectionError(false)` was set.

    BatchResult executeForOnlineDevices (const DeviceList& devices);

    void unwatchOnDetectionError (bool b) { mUnwatchOnDetectionError = b; }

    const std::string& command () const { return mCommand; }

private:
    void subscribe ();
    bool executeCommandOnDevices (const DeviceList& devices);

    Monitor& mMonitor;
    CommandRunner mRunner;
    Console& mConsole;
    std::string mCommand;
    bool mUnwatchOnDetectionError = true;
    bool mSubscribed = false;

    log::Logger mLog;
};

std::string formatDeviceList (const DeviceList& devices);
// One "- <status>" line per device.

} // namespace adbmux

#endif
