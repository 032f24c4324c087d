#include <adbmux/devices.hpp>

#include <boost/range/algorithm/copy.hpp>
#include <boost/range/algorithm/find_if.hpp>
#include <boost/range/adaptor/filtered.hpp>

#include <iterator>

using namespace boost::adaptors;

namespace adbmux {

namespace {

// For use with Boost.Range's filtered adaptor
struct ById {
    const DeviceList* mDevices;
    explicit ById (const DeviceList& devices) : mDevices(&devices) {}
    // Nullptr if no device in the list has the same id as d.
    const Device* find (const Device& d) const {
        auto it = boost::find_if(*mDevices, [&d](const Device& x) { return x.id() == d.id(); });
        return it == mDevices->end() ? nullptr : &*it;
    }
};

struct NotIn : ById {
    using ById::ById;
    bool operator() (const Device& d) const { return !find(d); }
};

struct ChangedIn : ById {
    using ById::ById;
    bool operator() (const Device& d) const {
        auto other = find(d);
        return other && *other != d;
    }
};

} // <anonymous>

DeviceListDifferences deviceListDifferences (const DeviceList& a, const DeviceList& b) {
    auto devicesRemoved = DeviceList{};
    boost::copy(a | filtered(NotIn{b}), std::back_inserter(devicesRemoved));
    // Devices which are in `a` but not `b`.

    auto devicesAdded = DeviceList{};
    boost::copy(b | filtered(NotIn{a}), std::back_inserter(devicesAdded));
    // Devices which are in `b` but not `a`.

    auto devicesChanged = DeviceList{};
    boost::copy(b | filtered(ChangedIn{a}), std::back_inserter(devicesChanged));
    // Devices in both, whose record in `b` differs from the one in `a`.

    return {std::move(devicesAdded), std::move(devicesRemoved), std::move(devicesChanged)};
}

DevicePartition partitionByOnline (const DeviceList& devices) {
    auto result = DevicePartition{};
    for (const auto& d : devices) {
        (d.isOnline() ? result.online : result.offline).push_back(d);
    }
    return result;
}

}  // adbmux
