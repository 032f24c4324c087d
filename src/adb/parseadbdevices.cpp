#include <adbmux/devices.hpp>
#include <adbmux/errors.hpp>
#include <adbmux/log.hpp>

#include <boost/spirit/include/qi.hpp>

#include <boost/fusion/adapted.hpp>
#include <boost/fusion/include/at_c.hpp>

#include <boost/algorithm/string/trim.hpp>
#include <boost/range/algorithm/find_if.hpp>

#include <map>
#include <string>
#include <vector>

namespace adbmux { namespace adb {

// One line of `adb devices -l` output.
struct DeviceRecord {
    std::string serial;
    std::string state;
    std::map<std::string, std::string> properties;
};

}} // adbmux::adb

BOOST_FUSION_ADAPT_STRUCT(
    adbmux::adb::DeviceRecord,
    serial,
    state,
    properties
)

namespace adbmux {

namespace {
namespace qi = boost::spirit::qi;

const std::string kHeader = "List of devices attached";
const std::string kUnknownModel = "unknown";

template <class Iter>
struct AdbDevicesGrammar : qi::grammar<Iter, std::vector<adb::DeviceRecord>()> {
    qi::rule<Iter, std::vector<adb::DeviceRecord>()> start;
    qi::rule<Iter> notice;
    qi::rule<Iter> header;
    qi::rule<Iter> blankLine;
    qi::rule<Iter> ws;
    qi::rule<Iter, adb::DeviceRecord()> record;
    qi::rule<Iter, std::string()> serial;
    qi::rule<Iter, std::string()> state;
    qi::rule<Iter, std::pair<std::string, std::string>()> property;
    qi::rule<Iter, std::string()> key;
    qi::rule<Iter, std::string()> value;

    AdbDevicesGrammar () : AdbDevicesGrammar::base_type(start, "adb devices") {
        start.name("start");
        start %= *notice
            >> header
            > *record
            >> *blankLine
            > qi::eoi;

        // The adb client chats about starting its server, or about version mismatches, before
        // printing the list proper.
        notice.name("notice");
        notice = !qi::lit(kHeader) >> *(qi::char_ - qi::eol) >> qi::eol;

        header.name("header");
        header = qi::lit(kHeader) >> *qi::blank >> qi::eol;

        blankLine.name("blankLine");
        blankLine = *qi::blank >> qi::eol;

        ws.name("ws");
        ws = +qi::blank;

        record.name("record");
        record %= serial >> ws >> state
            >> *(ws >> property)
            >> -ws >> (qi::eol | qi::eoi);

        serial.name("serial");
        serial %= +(qi::char_ - qi::blank - qi::eol);

        // Usually a single word, but e.g. "no permissions (...)" is not.
        state.name("state");
        state %= +(qi::char_ - qi::eol - (ws >> key >> ':'));

        property.name("property");
        property %= key >> ':' >> value;

        key.name("key");
        key %= +(qi::alnum | qi::char_('_'));

        value.name("value");
        value %= *(qi::char_ - qi::blank - qi::eol);

        using ErrorHandlerArgs = boost::fusion::vector<
            Iter&, const Iter&, const Iter&, const qi::info&>;

        auto logError = [](ErrorHandlerArgs args, auto&, qi::error_handler_result&) {
            using boost::fusion::at_c;
            log::Logger lg;
            BOOST_LOG(lg) << "Expected '" << at_c<3>(args) << "' here: '"
                << std::string(at_c<2>(args), at_c<1>(args)) << "'";
        };

        qi::on_error<qi::fail>(start, logError);
    }
};

Device toDevice (const adb::DeviceRecord& record) {
    auto model = record.properties.find("model");
    return Device{
        record.serial,
        model != record.properties.end() && model->second.size() ? model->second : kUnknownModel,
        parseAdbState(boost::algorithm::trim_copy(record.state))
    };
}

} // <anonymous>

DeviceState parseAdbState (const std::string& state) {
    if (state == "device") {
        return DeviceState::online;
    }
    if (state == "unauthorized") {
        return DeviceState::unauthorized;
    }
    // offline, bootloader, recovery, sideload, authorizing, connecting, no permissions, ...
    return DeviceState::offline;
}

DeviceList parseAdbDevices (const std::string& output) {
    auto records = std::vector<adb::DeviceRecord>{};
    auto begin = output.cbegin();
    auto end = output.cend();
    AdbDevicesGrammar<std::string::const_iterator> grammar;
    if (!qi::parse(begin, end, grammar, records)) {
        throw DetectionError{"unexpected output from `adb devices`: " + output};
    }

    auto devices = DeviceList{};
    for (const auto& record : records) {
        auto d = toDevice(record);
        auto dup = boost::find_if(devices, [&d](const Device& x) { return x.id() == d.id(); });
        if (dup != devices.end()) {
            log::Logger lg;
            BOOST_LOG(lg) << "adb listed " << d.id() << " twice, keeping the first entry";
            continue;
        }
        devices.push_back(std::move(d));
    }
    return devices;
}

} // adbmux
