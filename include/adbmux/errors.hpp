#ifndef ADBMUX_ERRORS_HPP
#define ADBMUX_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace adbmux {

// The attached devices could not be enumerated.
class DetectionError : public std::runtime_error {
public:
    explicit DetectionError (const std::string& what)
        : std::runtime_error(what)
    {}
};

// A command failed, timed out, or could not be started on one device.
class ExecutionError : public std::runtime_error {
public:
    ExecutionError (const std::string& what, const std::string& output = {})
        : std::runtime_error(what), mOutput(output)
    {}

    const std::string& output () const { return mOutput; }
    // Whatever the command printed before it failed.

private:
    std::string mOutput;
};

} // namespace adbmux

#endif
