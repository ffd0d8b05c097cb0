#pragma once
#include "capability.h"
#include "errors.h"
#include "keycode.h"
#include "module.h"

#include <memory>
#include <string>
#include <vector>

namespace keel {

// Policy: logic unit that reaches modules through kernel-granted permissions.
//
// The kernel drives three hooks during (re)activation and upgrades:
//   - declare_dependencies(): keycodes this policy needs; the usual place to
//     cache typed module handles via module_as<T>().
//   - declare_permissions(): (keycode, function) pairs to be granted.
//   - prepare_upgrade(): veto point before a dependency is swapped.
// Every (re)activation starts from scratch; nothing survives a deactivation.
class Policy : public KernelAdapter {
public:
    explicit Policy(Kernel* kernel);

    bool is_active() const;

protected:
    virtual std::vector<Keycode> declare_dependencies() { return {}; }
    virtual std::vector<Permission> declare_permissions() const { return {}; }

    // Must not mutate state it cannot undo; throwing vetoes the upgrade.
    virtual void prepare_upgrade(const Keycode& keycode, const Module& next) {
        (void)keycode;
        (void)next;
    }

    // Throws KernelError(ModuleDoesNotExist) if keycode is not installed.
    std::shared_ptr<Module> get_module_address(const Keycode& keycode) const;

    // Typed lookup; throws KernelError(InvalidTarget) on a type mismatch.
    template <typename T>
    std::shared_ptr<T> module_as(const Keycode& keycode) const {
        auto m = std::dynamic_pointer_cast<T>(get_module_address(keycode));
        if (!m) {
            throw KernelError(ErrorCode::InvalidTarget,
                              "module " + keycode.toString() + " does not have the expected type");
        }
        return m;
    }

    // Capability issued at the latest activation; null before the first one.
    const Capability& capability() const { return capability_; }

private:
    friend class Kernel;

    // Kernel-facing entry points; each checks only_kernel(caller).
    std::vector<Keycode> configure_dependencies(const Kernel& caller);
    std::vector<Permission> request_permissions(const Kernel& caller) const;
    void refresh_before_upgrade(const Kernel& caller, const Keycode& keycode, const Module& next);
    void receive_capability(const Kernel& caller, const Capability& cap);

    Capability capability_;
};

} // namespace keel
