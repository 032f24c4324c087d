#include <adbmux/devices.hpp>
#include <adbmux/command.hpp>

#include <sstream>

namespace adbmux {

std::ostream& operator<< (std::ostream& os, DeviceState s) {
    switch (s) {
        case DeviceState::online: return os << "online";
        case DeviceState::offline: return os << "offline";
        case DeviceState::unauthorized: return os << "unauthorized";
    }
    return os << "unknown";
}

std::string Device::toStatusString () const {
    std::ostringstream oss;
    oss << mId << " (" << mModel << ") [" << mState << ']';
    return oss.str();
}

std::string Device::executeCommand (const std::string& command, const Executor& executor) const {
    return executor.execute(*this, command);
}

std::ostream& operator<< (std::ostream& os, const Device& d) {
    return os << d.toStatusString();
}

bool operator== (const Device& a, const Device& b) {
    return a.id() == b.id() && a.model() == b.model() && a.state() == b.state();
}

bool operator!= (const Device& a, const Device& b) {
    return !(a == b);
}

} // adbmux
