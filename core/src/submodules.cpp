#include "keel/submodules.h"
#include "keel/errors.h"

namespace keel {

Submodule::Submodule(ModuleWithSubmodules* parent) : parent_(parent) {}

Keycode Submodule::parent_keycode() const {
    return parent_ ? parent_->keycode() : Keycode{};
}

void Submodule::only_parent(const ParentKey& key) const {
    if (!parent_ || key.parent() != parent_) {
        throw KernelError(ErrorCode::OnlyParent, "call into " + subkeycode().toString() + " not issued by its parent");
    }
}

void Submodule::init(const ParentKey& key) {
    only_parent(key);
    on_init();
}

ModuleWithSubmodules::ModuleWithSubmodules(Kernel* kernel) : Module(kernel) {}

void ModuleWithSubmodules::ensure_valid_submodule(const Submodule& submodule) const {
    if (submodule.parent() != this) {
        throw KernelError(ErrorCode::InvalidSubmodule,
                          submodule.address().toString() + " is bound to a different parent");
    }
    if (submodule.parent_keycode() != keycode()) {
        throw KernelError(ErrorCode::InvalidSubmodule,
                          submodule.address().toString() + " declares parent " +
                          submodule.parent_keycode().toString());
    }
    ensure_valid_subkeycode(submodule.subkeycode(), keycode());
    validate_submodule(submodule);
}

void ModuleWithSubmodules::install_submodule(const Capability& caller, std::shared_ptr<Submodule> submodule) {
    permissioned(caller, "install_submodule");
    ReentrancyGuard::Scope scope(guard_, "install_submodule");

    if (!submodule) throw KernelError(ErrorCode::InvalidSubmodule, "null submodule");
    ensure_valid_submodule(*submodule);

    const SubKeycode sk = submodule->subkeycode();
    if (submodules_.count(sk)) {
        throw KernelError(ErrorCode::SubmoduleAlreadyInstalled, sk.toString());
    }

    submodules_[sk] = submodule;
    try {
        submodule->init(parent_key());
    } catch (...) {
        submodules_.erase(sk);
        throw;
    }
}

void ModuleWithSubmodules::upgrade_submodule(const Capability& caller, std::shared_ptr<Submodule> submodule) {
    permissioned(caller, "upgrade_submodule");
    ReentrancyGuard::Scope scope(guard_, "upgrade_submodule");

    if (!submodule) throw KernelError(ErrorCode::InvalidSubmodule, "null submodule");
    ensure_valid_submodule(*submodule);

    const SubKeycode sk = submodule->subkeycode();
    auto it = submodules_.find(sk);
    if (it == submodules_.end()) {
        throw KernelError(ErrorCode::InvalidSubmoduleUpgrade, sk.toString() + " is not installed");
    }
    if (it->second == submodule) {
        throw KernelError(ErrorCode::InvalidSubmoduleUpgrade, sk.toString() + " is already at " +
                                                                  submodule->address().toString());
    }

    std::shared_ptr<Submodule> old = it->second;
    it->second = submodule;
    try {
        submodule->init(parent_key());
    } catch (...) {
        submodules_[sk] = old;
        throw;
    }
}

void ModuleWithSubmodules::exec_on_submodule(const Capability& caller, const SubKeycode& subkeycode,
                                             const std::function<void(Submodule&, const ParentKey&)>& fn) {
    permissioned(caller, "exec_on_submodule");
    ReentrancyGuard::Scope scope(guard_, "exec_on_submodule");

    auto sub = get_submodule_for_keycode(subkeycode);
    if (!sub) throw KernelError(ErrorCode::SubmoduleNotInstalled, subkeycode.toString());

    try {
        fn(*sub, parent_key());
    } catch (const std::exception& e) {
        throw KernelError(ErrorCode::SubmoduleExecutionReverted, subkeycode.toString() + ": " + e.what());
    }
}

std::vector<SubKeycode> ModuleWithSubmodules::submodules() const {
    std::vector<SubKeycode> out;
    out.reserve(submodules_.size());
    for (const auto& kv : submodules_) out.push_back(kv.first);
    return out;
}

std::shared_ptr<Submodule> ModuleWithSubmodules::get_submodule_for_keycode(const SubKeycode& subkeycode) const {
    auto it = submodules_.find(subkeycode);
    if (it == submodules_.end()) return nullptr;
    return it->second;
}

} // namespace keel
