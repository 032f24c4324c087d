#ifndef ADBMUX_LOG_HPP
#define ADBMUX_LOG_HPP

#include <boost/log/common.hpp>
#include <boost/log/sources/logger.hpp>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

namespace adbmux { namespace log {

using Logger = boost::log::sources::logger;

boost::program_options::options_description optionsDescription ();
// Options understood by `initialize()`: --log-file and --log-verbose.

void initialize (const boost::program_options::variables_map& options);
// Install sinks according to `options`. With neither option present, logging is disabled. Call
// once per process.

}} // namespace adbmux::log

#endif
