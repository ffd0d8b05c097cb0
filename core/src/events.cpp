#include "keel/events.h"

#include <algorithm>

namespace keel {

const char* event_kind_name(EventKind k) {
    switch (k) {
        case EventKind::ModuleInstalled:    return "ModuleInstalled";
        case EventKind::ModuleUpgraded:     return "ModuleUpgraded";
        case EventKind::ModuleDeprecated:   return "ModuleDeprecated";
        case EventKind::PolicyActivated:    return "PolicyActivated";
        case EventKind::PolicyDeactivated:  return "PolicyDeactivated";
        case EventKind::PermissionsUpdated: return "PermissionsUpdated";
        case EventKind::ExecutorChanged:    return "ExecutorChanged";
        case EventKind::KernelMigrated:     return "KernelMigrated";
        case EventKind::ActionExecuted:     return "ActionExecuted";
    }
    return "Unknown";
}

size_t MemoryEventSink::count(EventKind k) const {
    return (size_t)std::count_if(events_.begin(), events_.end(),
                                 [k](const KernelEvent& e) { return e.kind == k; });
}

} // namespace keel
