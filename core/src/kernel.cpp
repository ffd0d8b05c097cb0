#include "keel/kernel.h"
#include "keel/errors.h"
#include "keel/serialization.h"

#include <json-c/json.h>

#include <algorithm>
#include <utility>

namespace keel {

namespace {

using Fields = std::initializer_list<std::pair<const char*, json_object*>>;

// Builds a canonical JSON object from fields; takes ownership of the values.
std::string payload(Fields fields) {
    json_object* o = json_object_new_object();
    for (const auto& f : fields) json_object_object_add(o, f.first, f.second);
    std::string out = canonical_json(o);
    json_object_put(o);
    return out;
}

json_object* jstr(const std::string& s) { return json_object_new_string(s.c_str()); }

json_object* addresses_to_json(const std::vector<Address>& v) {
    json_object* arr = json_object_new_array();
    for (const auto& a : v) json_object_array_add(arr, jstr(a.toString()));
    return arr;
}

KernelEvent permission_event(const Address& policy, const Keycode& kc, const std::string& fn, bool granted) {
    return {EventKind::PermissionsUpdated,
            payload({{"policy", jstr(policy.toString())},
                     {"keycode", jstr(kc.toString())},
                     {"function", jstr(fn)},
                     {"granted", json_object_new_boolean(granted ? 1 : 0)}})};
}

std::vector<Keycode> dedupe(std::vector<Keycode> kcs) {
    std::vector<Keycode> out;
    for (const auto& kc : kcs) {
        if (std::find(out.begin(), out.end(), kc) == out.end()) out.push_back(kc);
    }
    return out;
}

} // namespace

Kernel::Kernel(const Account& deployer, KernelConfig config) : config_(std::move(config)) {
    state_.executor = deployer.address();
}

void Kernel::execute_action(const Account& caller, Action action, const ActionTarget& target) {
    ReentrancyGuard::Scope scope(guard_, "Kernel::execute_action");

    if (is_retired()) {
        throw KernelError(ErrorCode::KernelRetired, "kernel migrated to " + migrated_to_->address().toString());
    }
    if (caller.address() != state_.executor) {
        throw KernelError(ErrorCode::OnlyExecutor, "caller " + caller.address().toString());
    }

    Pending events;
    std::string patch;
    {
        StateTx tx(state_);
        switch (action) {
            case Action::InstallModule:    install_module(target, events); break;
            case Action::UpgradeModule:    upgrade_module(target, tx, events); break;
            case Action::DeprecateModule:  deprecate_module(target, events); break;
            case Action::ActivatePolicy:   activate_policy(target, events); break;
            case Action::DeactivatePolicy: deactivate_policy(target, events); break;
            case Action::ChangeExecutor:   change_executor(target, events); break;
            case Action::MigrateKernel:    migrate_kernel(target, events); break;
        }
        tx.commit();
        patch = tx.patch_json();
    }

    json_object* patch_obj = json_tokener_parse(patch.c_str());
    events.push_back({EventKind::ActionExecuted,
                      payload({{"action", jstr(action_name(action))},
                               {"target", jstr(target.address.toString())},
                               {"patch", patch_obj ? patch_obj : json_object_new_array()}})});

    if (sink_) {
        for (const auto& ev : events) sink_->emit(ev);
    }
}

// ---------------------------------------------------------------------------
// Modules
// ---------------------------------------------------------------------------

void Kernel::install_module(const ActionTarget& target, Pending& ev) {
    auto module = std::dynamic_pointer_cast<Module>(target.contract);
    if (!module) {
        throw KernelError(ErrorCode::InvalidTarget, "InstallModule target " + target.address.toString() + " is not a module");
    }

    const Keycode kc = module->keycode();
    if (kc.is_null()) {
        throw KernelError(ErrorCode::InvalidKeycode, "module " + module->address().toString() + " reports a null keycode");
    }
    if (state_.find_module(kc)) {
        throw KernelError(ErrorCode::ModuleAlreadyInstalled, kc.toString());
    }
    auto existing = state_.module_keycodes.find(module->address());
    if (existing != state_.module_keycodes.end()) {
        throw KernelError(ErrorCode::ModuleAlreadyInstalled,
                          module->address().toString() + " already installed as " + existing->second.toString());
    }

    ModuleRecord rec{kc, module->address(), module->version(), module};
    state_.modules[kc] = rec;
    state_.module_keycodes[rec.address] = kc;

    module->init(*this);

    ev.push_back({EventKind::ModuleInstalled,
                  payload({{"keycode", jstr(kc.toString())},
                           {"module", jstr(rec.address.toString())},
                           {"version", jstr(rec.version.toString())}})});
}

void Kernel::upgrade_module(const ActionTarget& target, StateTx& tx, Pending& ev) {
    auto next = std::dynamic_pointer_cast<Module>(target.contract);
    if (!next) {
        throw KernelError(ErrorCode::InvalidTarget, "UpgradeModule target " + target.address.toString() + " is not a module");
    }

    const Keycode kc = next->keycode();
    auto it = state_.modules.find(kc);
    if (it == state_.modules.end()) {
        throw KernelError(ErrorCode::InvalidModuleUpgrade, kc.toString() + " is not installed");
    }
    const ModuleRecord old = it->second;
    if (old.address == next->address()) {
        throw KernelError(ErrorCode::InvalidModuleUpgrade, kc.toString() + " is already at " + old.address.toString());
    }
    if (state_.module_keycodes.count(next->address())) {
        throw KernelError(ErrorCode::InvalidModuleUpgrade,
                          next->address().toString() + " is already installed under another keycode");
    }
    if (config_.require_version_bump && !(old.version < next->version())) {
        throw KernelError(ErrorCode::InvalidModuleUpgrade,
                          kc.toString() + " version " + next->version().toString() +
                          " does not exceed " + old.version.toString());
    }

    std::vector<std::shared_ptr<Policy>> dependents;
    auto dit = state_.dependents.find(kc);
    if (dit != state_.dependents.end()) {
        for (const auto& a : dit->second) dependents.push_back(state_.policies.at(a).policy);
    }

    // Phase 1: every dependent inspects the replacement before anything moves.
    for (const auto& p : dependents) {
        try {
            p->refresh_before_upgrade(*this, kc, *next);
        } catch (const std::exception& e) {
            throw KernelError(ErrorCode::DependentRefreshFailed,
                              "policy " + p->address().toString() + " rejected upgrade of " +
                              kc.toString() + ": " + e.what());
        }
    }

    // Phase 2: swap, initialise, and re-point dependents at the new registry.
    state_.module_keycodes.erase(old.address);
    state_.module_keycodes[next->address()] = kc;
    it->second = ModuleRecord{kc, next->address(), next->version(), next};

    next->init(*this);

    try {
        for (const auto& p : dependents) {
            reconfigure_policy(state_.policies.at(p->address()));
        }
    } catch (const std::exception& e) {
        tx.rollback();
        std::string detail = "refresh of " + kc.toString() + " dependents failed: " + e.what();
        for (const auto& p : dependents) {
            try {
                p->configure_dependencies(*this);
            } catch (const std::exception& e2) {
                detail += "; re-pointing " + p->address().toString() + " failed: " + e2.what();
            }
        }
        throw KernelError(ErrorCode::DependentRefreshFailed, detail);
    }

    std::vector<Address> notified;
    for (const auto& p : dependents) notified.push_back(p->address());
    ev.push_back({EventKind::ModuleUpgraded,
                  payload({{"keycode", jstr(kc.toString())},
                           {"from", jstr(old.address.toString())},
                           {"to", jstr(next->address().toString())},
                           {"from_version", jstr(old.version.toString())},
                           {"to_version", jstr(next->version().toString())},
                           {"dependents", addresses_to_json(notified)}})});
}

void Kernel::deprecate_module(const ActionTarget& target, Pending& ev) {
    auto it = state_.module_keycodes.find(target.address);
    if (it == state_.module_keycodes.end()) {
        throw KernelError(ErrorCode::ModuleNotInstalled, target.address.toString());
    }
    const Keycode kc = it->second;

    auto dit = state_.dependents.find(kc);
    if (dit != state_.dependents.end() && !dit->second.empty()) {
        throw KernelError(ErrorCode::ModuleInUse,
                          kc.toString() + " has " + std::to_string(dit->second.size()) + " active dependents");
    }
    for (const auto& p : state_.permissions) {
        if (p.keycode == kc) {
            throw KernelError(ErrorCode::ModuleInUse,
                              kc.toString() + "." + p.function + " is still granted to " + p.policy.toString());
        }
    }

    state_.modules.erase(kc);
    state_.module_keycodes.erase(it);
    state_.dependents.erase(kc);

    ev.push_back({EventKind::ModuleDeprecated,
                  payload({{"keycode", jstr(kc.toString())}, {"module", jstr(target.address.toString())}})});
}

// ---------------------------------------------------------------------------
// Policies
// ---------------------------------------------------------------------------

void Kernel::add_dependent(const Keycode& keycode, const Address& policy) {
    auto& list = state_.dependents[keycode];
    if (std::find(list.begin(), list.end(), policy) == list.end()) list.push_back(policy);
}

void Kernel::remove_dependent(const Address& policy) {
    for (auto it = state_.dependents.begin(); it != state_.dependents.end();) {
        auto& list = it->second;
        list.erase(std::remove(list.begin(), list.end(), policy), list.end());
        if (list.empty()) it = state_.dependents.erase(it);
        else ++it;
    }
}

void Kernel::reconfigure_policy(PolicyRecord& rec) {
    std::vector<Keycode> deps = dedupe(rec.policy->configure_dependencies(*this));
    for (const auto& kc : deps) {
        if (!state_.find_module(kc)) {
            throw KernelError(ErrorCode::ModuleNotInstalled,
                              "policy " + rec.address.toString() + " depends on " + kc.toString());
        }
    }
    remove_dependent(rec.address);
    for (const auto& kc : deps) add_dependent(kc, rec.address);
    rec.dependencies = std::move(deps);
}

void Kernel::activate_policy(const ActionTarget& target, Pending& ev) {
    auto policy = std::dynamic_pointer_cast<Policy>(target.contract);
    if (!policy) {
        throw KernelError(ErrorCode::InvalidTarget, "ActivatePolicy target " + target.address.toString() + " is not a policy");
    }

    PolicyRecord& rec = state_.policies[policy->address()];
    if (rec.active) {
        throw KernelError(ErrorCode::PolicyAlreadyActivated, policy->address().toString());
    }
    rec.address = policy->address();
    rec.policy = policy;
    rec.active = true;
    rec.epoch = ++epoch_counter_;

    reconfigure_policy(rec);

    ev.push_back({EventKind::PolicyActivated,
                  payload({{"policy", jstr(rec.address.toString())},
                           {"dependencies", keycodes_to_json(rec.dependencies)},
                           {"epoch", json_object_new_int64((int64_t)rec.epoch)}})});

    for (const auto& req : policy->request_permissions(*this)) {
        if (!state_.find_module(req.keycode)) {
            throw KernelError(ErrorCode::ModuleNotInstalled,
                              "policy " + rec.address.toString() + " requests " +
                              req.keycode.toString() + "." + req.function);
        }
        if (state_.permissions.insert(PermissionKey{rec.address, req.keycode, req.function}).second) {
            ev.push_back(permission_event(rec.address, req.keycode, req.function, true));
        }
    }

    policy->receive_capability(*this, Capability(rec.address, rec.epoch, this));
}

void Kernel::deactivate_policy(const ActionTarget& target, Pending& ev) {
    auto it = state_.policies.find(target.address);
    if (it == state_.policies.end() || !it->second.active) {
        throw KernelError(ErrorCode::PolicyNotActivated, target.address.toString());
    }
    PolicyRecord& rec = it->second;

    for (auto pit = state_.permissions.begin(); pit != state_.permissions.end();) {
        if (pit->policy == rec.address) {
            ev.push_back(permission_event(pit->policy, pit->keycode, pit->function, false));
            pit = state_.permissions.erase(pit);
        } else {
            ++pit;
        }
    }
    remove_dependent(rec.address);
    rec.active = false;
    rec.dependencies.clear();

    ev.push_back({EventKind::PolicyDeactivated, payload({{"policy", jstr(rec.address.toString())}})});
}

// ---------------------------------------------------------------------------
// Executor / migration
// ---------------------------------------------------------------------------

void Kernel::change_executor(const ActionTarget& target, Pending& ev) {
    if (target.address.is_null()) {
        throw KernelError(ErrorCode::InvalidTarget, "executor cannot be the null address");
    }
    const Address old = state_.executor;
    state_.executor = target.address;
    ev.push_back({EventKind::ExecutorChanged,
                  payload({{"from", jstr(old.toString())}, {"to", jstr(target.address.toString())}})});
}

void Kernel::migrate_kernel(const ActionTarget& target, Pending& ev) {
    auto next = std::dynamic_pointer_cast<Kernel>(target.contract);
    if (!next || next.get() == this) {
        throw KernelError(ErrorCode::InvalidTarget, "MigrateKernel target " + target.address.toString() + " is not another kernel");
    }
    if (next->is_retired()) {
        throw KernelError(ErrorCode::KernelRetired, "target kernel " + next->address().toString() + " is retired");
    }

    std::vector<KernelAdapter*> adapters;
    std::vector<Address> moved_modules, moved_policies;
    for (const auto& kv : state_.modules) {
        adapters.push_back(kv.second.module.get());
        moved_modules.push_back(kv.second.address);
    }
    for (const auto& kv : state_.policies) {
        if (!kv.second.active) continue;
        adapters.push_back(kv.second.policy.get());
        moved_policies.push_back(kv.second.address);
    }

    // Check every adapter first so the moves below cannot fail halfway.
    for (const KernelAdapter* a : adapters) {
        if (a->kernel() != this) {
            throw KernelError(ErrorCode::OnlyKernel, a->address().toString() + " no longer trusts this kernel");
        }
    }
    for (KernelAdapter* a : adapters) a->change_kernel(*this, next.get());

    migrated_to_ = next.get();

    ev.push_back({EventKind::KernelMigrated,
                  payload({{"from", jstr(address().toString())},
                           {"to", jstr(next->address().toString())},
                           {"modules", addresses_to_json(moved_modules)},
                           {"policies", addresses_to_json(moved_policies)}})});
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

bool Kernel::module_permissions(const Keycode& keycode, const Address& policy, const std::string& function) const {
    return state_.has_permission(policy, keycode, function);
}

bool Kernel::module_permissions(const Keycode& keycode, const Capability& cap, const std::string& function) const {
    if (cap.issuer() != this) return false;
    const PolicyRecord* rec = state_.find_policy(cap.policy());
    if (!rec || !rec->active || rec->epoch != cap.epoch()) return false;
    return state_.has_permission(cap.policy(), keycode, function);
}

std::shared_ptr<Module> Kernel::get_module_for_keycode(const Keycode& keycode) const {
    const ModuleRecord* rec = state_.find_module(keycode);
    return rec ? rec->module : nullptr;
}

std::optional<Keycode> Kernel::get_keycode_for_module(const Address& module) const {
    auto it = state_.module_keycodes.find(module);
    if (it == state_.module_keycodes.end()) return std::nullopt;
    return it->second;
}

std::vector<Keycode> Kernel::all_keycodes() const {
    std::vector<Keycode> out;
    out.reserve(state_.modules.size());
    for (const auto& kv : state_.modules) out.push_back(kv.first);
    return out;
}

bool Kernel::is_policy_active(const Address& policy) const {
    return state_.is_policy_active(policy);
}

std::vector<Address> Kernel::active_policies() const {
    std::vector<Address> out;
    for (const auto& kv : state_.policies) {
        if (kv.second.active) out.push_back(kv.first);
    }
    return out;
}

std::vector<Address> Kernel::module_dependents(const Keycode& keycode) const {
    auto it = state_.dependents.find(keycode);
    if (it == state_.dependents.end()) return {};
    return it->second;
}

std::string Kernel::snapshot_json() const {
    json_object* o = kernel_state_to_json(state_);
    json_object_object_add(o, "kernel", jstr(address().toString()));
    json_object_object_add(o, "retired", json_object_new_boolean(is_retired() ? 1 : 0));
    std::string out = canonical_json(o);
    json_object_put(o);
    return out;
}

} // namespace keel
