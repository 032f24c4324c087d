#ifndef ADBMUX_MONITOR_HPP
#define ADBMUX_MONITOR_HPP

#include <adbmux/devices.hpp>
#include <adbmux/errors.hpp>
#include <adbmux/log.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <functional>
#include <vector>

namespace adbmux {

using DeviceQuery = std::function<DeviceList()>;
// Enumerates the devices attached to the host, throwing DetectionError on failure.

// Watches the set of attached devices by polling a DeviceQuery on a timer, and notifies observers
// of devices that appear or change state. All work, including the observers, runs on the
// io_context's thread, and a poll is never started before the previous one has finished.
//
// The Monitor must outlive any io_context::run() call that may invoke its handlers.
class Monitor {
public:
    using DevicesHandler = std::function<void(const DeviceList&)>;
    using ErrorHandler = std::function<void(const DetectionError&)>;

    static constexpr std::chrono::milliseconds kDefaultPollInterval{500};

    Monitor (boost::asio::io_context& context, DeviceQuery query,
             std::chrono::milliseconds pollInterval = kDefaultPollInterval);

    Monitor (const Monitor&) = delete;
    Monitor& operator= (const Monitor&) = delete;

    DeviceList devices ();
    // Query the attached devices right now. Throws DetectionError. When not watching, the result
    // becomes the baseline the next `watch()` compares against.

    void watch ();
    // Start polling. No-op if already watching. If no query has succeeded yet, the baseline is
    // sampled first; a failure there goes to the error observers.

    void unwatch ();
    // Stop polling. No-op if not watching. A poll already in progress runs to completion.

    bool watching () const { return mWatching; }

    std::chrono::milliseconds pollInterval () const { return mPollInterval; }

    void onDevicesAdded (DevicesHandler handler);
    void onDevicesChanged (DevicesHandler handler);
    void onError (ErrorHandler handler);
    // Observers are invoked in registration order, at most once per poll. An observer registered
    // during a poll first hears about the next one.

private:
    void arm ();
    void tick ();
    void reportError (const DetectionError& e);

    DeviceQuery mQuery;
    std::chrono::milliseconds mPollInterval;
    boost::asio::steady_timer mTimer;

    DeviceList mLastDevices;
    bool mHaveBaseline = false;
    bool mWatching = false;
    bool mTickInProgress = false;
    unsigned mGeneration = 0;

    std::vector<DevicesHandler> mAddedHandlers;
    std::vector<DevicesHandler> mChangedHandlers;
    std::vector<ErrorHandler> mErrorHandlers;

    log::Logger mLog;
};

} // namespace adbmux

#endif
