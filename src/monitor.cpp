#include <adbmux/monitor.hpp>

#include <boost/asio/error.hpp>

#include <utility>

namespace adbmux {

constexpr std::chrono::milliseconds Monitor::kDefaultPollInterval;

namespace {

template <class Handlers, class Arg>
void notify (const Handlers& handlers, const Arg& arg) {
    // Copy, so that observers registered from inside an observer wait for the next poll.
    auto snapshot = handlers;
    for (auto& h : snapshot) {
        h(arg);
    }
}

} // <anonymous>

Monitor::Monitor (boost::asio::io_context& context, DeviceQuery query,
                  std::chrono::milliseconds pollInterval)
    : mQuery(std::move(query))
    , mPollInterval(pollInterval)
    , mTimer(context)
{}

DeviceList Monitor::devices () {
    auto result = mQuery();
    if (!mWatching) {
        mLastDevices = result;
        mHaveBaseline = true;
    }
    return result;
}

void Monitor::watch () {
    if (mWatching) {
        return;
    }
    mWatching = true;
    ++mGeneration;
    BOOST_LOG(mLog) << "watching for device changes every " << mPollInterval.count() << "ms";

    if (!mHaveBaseline) {
        try {
            mLastDevices = mQuery();
            mHaveBaseline = true;
        }
        catch (const DetectionError& e) {
            // Compare the first successful poll against an empty baseline.
            BOOST_LOG(mLog) << "baseline device query failed: " << e.what();
            reportError(e);
        }
    }

    if (mWatching) {
        arm();
    }
}

void Monitor::unwatch () {
    if (!mWatching) {
        return;
    }
    mWatching = false;
    mTimer.cancel();
    BOOST_LOG(mLog) << "stopped watching for device changes";
}

void Monitor::onDevicesAdded (DevicesHandler handler) {
    mAddedHandlers.push_back(std::move(handler));
}

void Monitor::onDevicesChanged (DevicesHandler handler) {
    mChangedHandlers.push_back(std::move(handler));
}

void Monitor::onError (ErrorHandler handler) {
    mErrorHandlers.push_back(std::move(handler));
}

void Monitor::arm () {
    if (mTickInProgress) {
        // tick() re-arms when it finishes.
        return;
    }
    mTimer.expires_after(mPollInterval);
    auto generation = mGeneration;
    mTimer.async_wait([this, generation](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        if (ec) {
            BOOST_LOG(mLog) << "poll timer failed: " << ec.message();
            return;
        }
        if (!mWatching || generation != mGeneration) {
            // Superseded by an unwatch(), or an unwatch() and watch() pair.
            return;
        }
        tick();
    });
}

void Monitor::tick () {
    struct TickGuard {
        bool& flag;
        explicit TickGuard (bool& f) : flag(f) { flag = true; }
        ~TickGuard () { flag = false; }
    };

    {
        TickGuard guard{mTickInProgress};

        auto current = DeviceList{};
        auto ok = true;
        try {
            current = mQuery();
        }
        catch (const DetectionError& e) {
            BOOST_LOG(mLog) << "device query failed: " << e.what();
            ok = false;
            reportError(e);
        }

        if (ok) {
            auto diff = deviceListDifferences(mLastDevices, current);
            mLastDevices = std::move(current);
            mHaveBaseline = true;

            if (diff.added.size() || diff.removed.size() || diff.changed.size()) {
                BOOST_LOG(mLog) << diff.added.size() << " added, "
                    << diff.removed.size() << " removed, "
                    << diff.changed.size() << " changed";
            }

            if (diff.added.size()) {
                notify(mAddedHandlers, diff.added);
            }
            if (diff.changed.size()) {
                notify(mChangedHandlers, diff.changed);
            }
            // Removed devices need no command, they only leave mLastDevices.
        }
    }

    if (mWatching) {
        arm();
    }
}

void Monitor::reportError (const DetectionError& e) {
    notify(mErrorHandlers, e);
}

} // namespace adbmux
