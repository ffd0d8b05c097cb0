#pragma once
#include <string>
#include <vector>

namespace keel {

enum class EventKind {
    ModuleInstalled,
    ModuleUpgraded,
    ModuleDeprecated,
    PolicyActivated,
    PolicyDeactivated,
    PermissionsUpdated,
    ExecutorChanged,
    KernelMigrated,
    ActionExecuted,
};

const char* event_kind_name(EventKind k);

struct KernelEvent {
    EventKind kind;
    std::string payload_json; // canonical JSON object
};

// Receives events after an administrative action has committed.
// A sink must not call back into the kernel's administrative surface.
struct EventSink {
    virtual ~EventSink() = default;
    virtual void emit(const KernelEvent& ev) = 0;
};

// Collects events in memory (tests, in-process observers).
class MemoryEventSink : public EventSink {
public:
    void emit(const KernelEvent& ev) override { events_.push_back(ev); }

    const std::vector<KernelEvent>& events() const { return events_; }
    size_t count(EventKind k) const;
    void clear() { events_.clear(); }

private:
    std::vector<KernelEvent> events_;
};

} // namespace keel
