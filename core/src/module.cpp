#include "keel/module.h"
#include "keel/errors.h"
#include "keel/kernel.h"

namespace keel {

KernelAdapter::KernelAdapter(Kernel* kernel) : kernel_(kernel) {}

void KernelAdapter::only_kernel(const Kernel& caller) const {
    if (&caller != kernel_) {
        throw KernelError(ErrorCode::OnlyKernel, "kernel " + caller.address().toString() + " is not trusted by " +
                                                     address().toString());
    }
}

void KernelAdapter::change_kernel(const Kernel& caller, Kernel* new_kernel) {
    only_kernel(caller);
    if (!new_kernel) {
        throw KernelError(ErrorCode::InvalidTarget, "null kernel");
    }
    kernel_ = new_kernel;
}

Module::Module(Kernel* kernel) : KernelAdapter(kernel) {}

void Module::init(const Kernel& caller) {
    only_kernel(caller);
    on_init();
}

void Module::permissioned(const Capability& caller, const std::string& function) const {
    const Kernel* k = kernel();
    if (!k || !k->module_permissions(keycode(), caller, function)) {
        throw KernelError(ErrorCode::PolicyNotPermitted,
                          "policy " + caller.policy().toString() + " may not call " +
                          keycode().toString() + "." + function);
    }
    // Permissions are keyed by keycode; a replaced instance must not keep honouring them.
    if (k->get_module_for_keycode(keycode()).get() != this) {
        throw KernelError(ErrorCode::ModuleNotInstalled,
                          address().toString() + " is no longer the installed " + keycode().toString());
    }
}

} // namespace keel
