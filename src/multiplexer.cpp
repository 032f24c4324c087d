#include <adbmux/multiplexer.hpp>
#include <adbmux/errors.hpp>

#include <utility>

namespace adbmux {

namespace {

const std::string kRule(40, '=');

} // <anonymous>

std::ostream& operator<< (std::ostream& os, BatchResult r) {
    switch (r) {
        case BatchResult::executed: return os << "executed";
        case BatchResult::noDevices: return os << "noDevices";
        case BatchResult::offlineOnly: return os << "offlineOnly";
        case BatchResult::aborted: return os << "aborted";
    }
    return os << "unknown";
}

std::string formatDeviceList (const DeviceList& devices) {
    auto result = std::string{};
    for (const auto& d : devices) {
        result += "- " + d.toStatusString() + '\n';
    }
    return result;
}

Multiplexer::Multiplexer (Monitor& monitor, CommandRunner runner, Console& console,
                          const std::string& command)
    : mMonitor(monitor)
    , mRunner(std::move(runner))
    , mConsole(console)
    , mCommand(command)
{}

Multiplexer::Multiplexer (Monitor& monitor, const Executor& executor, Console& console,
                          const std::string& command)
    : Multiplexer(monitor,
        [executor](const Device& d, const std::string& c) { return d.executeCommand(c, executor); },
        console, command)
{}

BatchResult Multiplexer::runOnce () {
    return executeForOnlineDevices(mMonitor.devices());
}

void Multiplexer::watch () {
    subscribe();
    mMonitor.watch();
}

void Multiplexer::subscribe () {
    if (mSubscribed) {
        return;
    }
    mSubscribed = true;

    auto newOrChanged = [this](const DeviceList& devices) {
        executeForOnlineDevices(devices);
    };
    mMonitor.onDevicesAdded(newOrChanged);
    mMonitor.onDevicesChanged(newOrChanged);
    mMonitor.onError([this](const DetectionError& e) {
        mConsole.error(e.what());
        if (mUnwatchOnDetectionError) {
            mMonitor.unwatch();
        }
    });
}

BatchResult Multiplexer::executeForOnlineDevices (const DeviceList& devices) {
    auto partition = partitionByOnline(devices);

    if (partition.online.size()) {
        mConsole.print("devices detected:\n" + formatDeviceList(partition.online), Color::green);
        return executeCommandOnDevices(partition.online)
            ? BatchResult::executed
            : BatchResult::aborted;
    }
    if (partition.offline.size()) {
        mConsole.print("offline devices detected:\n" + formatDeviceList(partition.offline), Color::red);
        return BatchResult::offlineOnly;
    }
    mConsole.error("no devices detected\n");
    return BatchResult::noDevices;
}

bool Multiplexer::executeCommandOnDevices (const DeviceList& devices) {
    for (const auto& d : devices) {
        mConsole.print("");
        mConsole.print(kRule);
        mConsole.print("Result for " + d.id() + " (" + d.model() + ")");
        mConsole.print(kRule);

        try {
            mConsole.print(mRunner(d, mCommand), Color::cyan);
        }
        catch (const ExecutionError& e) {
            BOOST_LOG(mLog) << d.id() << ": " << e.what();
            if (e.output().size()) {
                mConsole.error(e.output());
            }
            mConsole.error(e.what());
            // Skip the rest of this batch.
            return false;
        }
    }
    return true;
}

} // namespace adbmux
