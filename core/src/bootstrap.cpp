#include "keel/bootstrap.h"

namespace keel {

KernelRuntime::~KernelRuntime() {
    if (kernel) kernel->set_event_sink(nullptr);
}

KernelRuntime boot_kernel(const Account& deployer) {
    KernelRuntime rt;
    rt.profile = detect_profile();
    apply_profile_defaults(rt.profile);
    KernelConfig cfg = kernel_config_from_env();

    rt.kernel = std::make_shared<Kernel>(deployer, cfg);
    if (!cfg.event_log_path.empty()) {
        rt.event_log = std::make_unique<JsonlEventLog>(cfg.event_log_path, rt.kernel->address().toString(),
                                                       cfg.event_log_fsync);
        rt.kernel->set_event_sink(rt.event_log.get());
    }
    return rt;
}

} // namespace keel
