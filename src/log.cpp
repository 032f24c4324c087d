#include <adbmux/log.hpp>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <iostream>
#include <string>

namespace adbmux { namespace log {

namespace po = boost::program_options;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;

po::options_description optionsDescription () {
    auto desc = po::options_description{"Log options"};
    desc.add_options()
        ("log-file", po::value<std::string>(), "write diagnostic log records to this file")
        ("log-verbose", "write diagnostic log records to stderr")
    ;
    return desc;
}

void initialize (const po::variables_map& options) {
    auto core = boost::log::core::get();

    auto format = expr::stream
        << "[" << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%H:%M:%S.%f")
        << "] " << expr::smessage;

    auto enabled = false;
    if (options.count("log-verbose")) {
        boost::log::add_console_log(std::clog, keywords::format = format);
        enabled = true;
    }
    if (options.count("log-file")) {
        boost::log::add_file_log(
            keywords::file_name = options["log-file"].as<std::string>(),
            keywords::open_mode = std::ios_base::app,
            keywords::auto_flush = true,
            keywords::format = format);
        enabled = true;
    }

    boost::log::add_common_attributes();
    core->set_logging_enabled(enabled);
}

}} // namespace adbmux::log
