#ifndef ADBMUX_SRC_PROCESS_HPP
#define ADBMUX_SRC_PROCESS_HPP

#include <boost/process/search_path.hpp>

#include <boost/filesystem/path.hpp>

#include <string>

namespace adbmux {

// Resolve a program name the way a shell would: names containing a slash are used as-is, anything
// else is looked up on PATH. Returns an empty path if the lookup fails.
inline boost::filesystem::path findExecutable (const std::string& program) {
    if (program.find('/') != std::string::npos) {
        return boost::filesystem::path{program};
    }
    return boost::process::search_path(program);
}

// Single-quote `s` for use in a POSIX `sh -c` command line.
inline std::string shellQuote (const std::string& s) {
    auto quoted = std::string{"'"};
    for (auto c : s) {
        if ('\'' == c) {
            quoted += "'\\''";
        }
        else {
            quoted += c;
        }
    }
    return quoted + '\'';
}

} // adbmux

#endif
