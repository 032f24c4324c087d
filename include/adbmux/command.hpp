#ifndef ADBMUX_COMMAND_HPP
#define ADBMUX_COMMAND_HPP

#include <adbmux/devices.hpp>

#include <chrono>
#include <string>

namespace adbmux {

std::string normalizeCommand (const std::string& command);
// Trim `command` and strip a leading "adb" keyword, if present as a whole word. The rest is
// returned verbatim.

bool isValidDeviceId (const std::string& id);
// True if `id` looks like a serial adb would report: non-empty, letters, digits and "._:-" only.

class Executor {
public:
    static constexpr std::chrono::seconds kDefaultTimeout{300};

    explicit Executor (const std::string& adbPath = "adb",
                       std::chrono::seconds timeout = kDefaultTimeout)
        : mAdbPath(adbPath), mTimeout(timeout)
    {}

    const std::string& adbPath () const { return mAdbPath; }
    std::chrono::seconds timeout () const { return mTimeout; }

    std::string execute (const Device& device, const std::string& command) const;
    // Run `adb -s <id> <command>` through `sh -c` and block until it exits or the timeout expires.
    // Returns the captured stdout followed by stderr. Throws ExecutionError on a malformed device
    // id, a failure to spawn, a non-zero exit status, or a timeout.

private:
    std::string mAdbPath;
    std::chrono::seconds mTimeout;
};

} // namespace adbmux

#endif
