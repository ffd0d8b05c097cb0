#pragma once
#include "config.h"
#include "event_log.h"
#include "kernel.h"

#include <memory>

namespace keel {

// A kernel wired to its environment: profile defaults applied, config read
// from KEEL_* variables, and a JSONL event log attached when KEEL_EVENT_LOG
// is set. The log is destroyed after the kernel detaches from it.
struct KernelRuntime {
    Profile profile{Profile::DEV};
    std::unique_ptr<JsonlEventLog> event_log;
    std::shared_ptr<Kernel> kernel;

    KernelRuntime() = default;
    KernelRuntime(KernelRuntime&&) = default;
    KernelRuntime& operator=(KernelRuntime&&) = default;
    ~KernelRuntime();
};

// Throws std::runtime_error if the configured event log cannot be opened.
KernelRuntime boot_kernel(const Account& deployer);

} // namespace keel
