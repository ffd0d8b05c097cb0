#pragma once
#include "capability.h"
#include "config.h"
#include "events.h"
#include "keycode.h"
#include "module.h"
#include "policy.h"
#include "reentrancy.h"
#include "state.h"
#include "tx.h"
#include "types.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace keel {

// Target of an administrative action: a deployed contract (module, policy,
// kernel), an account (ChangeExecutor) or a bare address.
struct ActionTarget {
    template <typename T, typename = std::enable_if_t<std::is_base_of<Contract, T>::value>>
    ActionTarget(std::shared_ptr<T> c) // NOLINT(google-explicit-constructor)
        : address(c ? c->address() : Address{}), contract(std::move(c)) {}
    ActionTarget(const Address& a) : address(a) {} // NOLINT(google-explicit-constructor)
    ActionTarget(const Account& a) : address(a.address()) {} // NOLINT(google-explicit-constructor)

    Address address;
    std::shared_ptr<Contract> contract;
};

// Kernel: owns the module registry, the active-policy set, the permission
// matrix and the executor identity. All of it changes only through
// execute_action(), which is all-or-nothing and non-reentrant.
//
// Not thread-safe; the host serializes calls.
class Kernel : public Contract {
public:
    // The deployer's account becomes the initial executor.
    explicit Kernel(const Account& deployer, KernelConfig config = {});

    Kernel(const Kernel&) = delete;
    Kernel& operator=(const Kernel&) = delete;

    // --- administrative surface ---

    // caller must present the executor's Account; its address alone is not
    // enough. Throws KernelError; on throw the kernel state is exactly as before.
    void execute_action(const Account& caller, Action action, const ActionTarget& target);

    // --- query surface ---

    bool module_permissions(const Keycode& keycode, const Address& policy, const std::string& function) const;
    bool module_permissions(const Keycode& keycode, const Capability& cap, const std::string& function) const;

    std::shared_ptr<Module> get_module_for_keycode(const Keycode& keycode) const;
    std::optional<Keycode> get_keycode_for_module(const Address& module) const;
    std::vector<Keycode> all_keycodes() const;

    bool is_policy_active(const Address& policy) const;
    std::vector<Address> active_policies() const;
    std::vector<Address> module_dependents(const Keycode& keycode) const;

    const Address& executor() const { return state_.executor; }
    const KernelConfig& config() const { return config_; }

    bool is_retired() const { return migrated_to_ != nullptr; }
    Kernel* migrated_to() const { return migrated_to_; }

    const KernelState& state() const { return state_; }
    std::string snapshot_json() const;

    // Non-owning; pass nullptr to detach.
    void set_event_sink(EventSink* sink) { sink_ = sink; }

private:
    using Pending = std::vector<KernelEvent>;

    void install_module(const ActionTarget& target, Pending& ev);
    void upgrade_module(const ActionTarget& target, StateTx& tx, Pending& ev);
    void deprecate_module(const ActionTarget& target, Pending& ev);
    void activate_policy(const ActionTarget& target, Pending& ev);
    void deactivate_policy(const ActionTarget& target, Pending& ev);
    void change_executor(const ActionTarget& target, Pending& ev);
    void migrate_kernel(const ActionTarget& target, Pending& ev);

    // Re-runs a dependent's dependency hook against the live registry and
    // rewrites its captured list and the dependents index.
    void reconfigure_policy(PolicyRecord& rec);

    void add_dependent(const Keycode& keycode, const Address& policy);
    void remove_dependent(const Address& policy);

    KernelState state_;
    KernelConfig config_;
    ReentrancyGuard guard_;
    uint64_t epoch_counter_{0};
    Kernel* migrated_to_{nullptr};
    EventSink* sink_{nullptr};
};

} // namespace keel
