#include "keel/types.h"

#include <atomic>
#include <iomanip>
#include <sstream>

namespace keel {

Address next_address() {
    static std::atomic<uint64_t> counter{0};
    return Address{++counter};
}

std::string Address::toString() const {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setw(16) << std::setfill('0') << value;
    return oss.str();
}

std::string Version::toString() const {
    return std::to_string((int)major) + "." + std::to_string((int)minor);
}

const char* action_name(Action a) {
    switch (a) {
        case Action::InstallModule:    return "InstallModule";
        case Action::UpgradeModule:    return "UpgradeModule";
        case Action::DeprecateModule:  return "DeprecateModule";
        case Action::ActivatePolicy:   return "ActivatePolicy";
        case Action::DeactivatePolicy: return "DeactivatePolicy";
        case Action::ChangeExecutor:   return "ChangeExecutor";
        case Action::MigrateKernel:    return "MigrateKernel";
    }
    return "Unknown";
}

} // namespace keel
