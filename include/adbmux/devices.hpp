#ifndef ADBMUX_DEVICES_HPP
#define ADBMUX_DEVICES_HPP

#include <iostream>
#include <string>
#include <vector>

namespace adbmux {

class Executor;

enum class DeviceState {
    online,
    offline,
    unauthorized
};

std::ostream& operator<< (std::ostream& os, DeviceState s);

class Device {
public:
    Device () = default;
    Device (const std::string& id, const std::string& model, DeviceState state)
        : mId(id), mModel(model), mState(state)
    {}
    void id (const std::string& i) { mId = i; }
    void model (const std::string& m) { mModel = m; }
    void state (DeviceState s) { mState = s; }
    const std::string& id () const { return mId; }
    const std::string& model () const { return mModel; }
    DeviceState state () const { return mState; }

    bool isOnline () const { return DeviceState::online == mState; }

    std::string toStatusString () const;
    // One line with id, model and state, e.g. "0123abcd (Pixel_3) [online]".

    std::string executeCommand (const std::string& command, const Executor& executor) const;
    // Run `command` on this device. Throws ExecutionError.

private:
    std::string mId;
    std::string mModel;
    DeviceState mState = DeviceState::offline;
};

std::ostream& operator<< (std::ostream& os, const Device& d);
bool operator== (const Device& a, const Device& b);
bool operator!= (const Device& a, const Device& b);

using DeviceList = std::vector<Device>;

DeviceList devices (const std::string& adbPath);
// Query `adb devices -l`. Throws DetectionError if adb can't be run or its output doesn't parse.

DeviceList parseAdbDevices (const std::string& output);
// Parse the output of `adb devices -l`. Throws DetectionError on malformed output.

DeviceState parseAdbState (const std::string& state);

struct DeviceListDifferences {
    DeviceList added;
    DeviceList removed;
    DeviceList changed;
};

DeviceListDifferences deviceListDifferences (const DeviceList& a, const DeviceList& b);
// Devices are matched by id. `added` holds devices whose id is in `b` but not `a`, `removed` those
// whose id is in `a` but not `b`, `changed` the `b` record of ids present in both with a different
// model or state. `added` and `changed` follow the order of `b`, `removed` the order of `a`.

struct DevicePartition {
    DeviceList online;
    DeviceList offline;
};

DevicePartition partitionByOnline (const DeviceList& devices);

} // namespace adbmux

#endif
