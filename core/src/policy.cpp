#include "keel/policy.h"
#include "keel/kernel.h"

namespace keel {

Policy::Policy(Kernel* kernel) : KernelAdapter(kernel) {}

bool Policy::is_active() const {
    return kernel() && kernel()->is_policy_active(address());
}

std::vector<Keycode> Policy::configure_dependencies(const Kernel& caller) {
    only_kernel(caller);
    return declare_dependencies();
}

std::vector<Permission> Policy::request_permissions(const Kernel& caller) const {
    only_kernel(caller);
    return declare_permissions();
}

void Policy::refresh_before_upgrade(const Kernel& caller, const Keycode& keycode, const Module& next) {
    only_kernel(caller);
    prepare_upgrade(keycode, next);
}

void Policy::receive_capability(const Kernel& caller, const Capability& cap) {
    only_kernel(caller);
    capability_ = cap;
}

std::shared_ptr<Module> Policy::get_module_address(const Keycode& keycode) const {
    std::shared_ptr<Module> m = kernel() ? kernel()->get_module_for_keycode(keycode) : nullptr;
    if (!m) {
        throw KernelError(ErrorCode::ModuleDoesNotExist, keycode.toString());
    }
    return m;
}

} // namespace keel
