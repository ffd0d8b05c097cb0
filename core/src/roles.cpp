#include "keel/roles.h"
#include "keel/errors.h"

namespace keel {

static const char* kRolesKeycode = "ROLES";

void ensure_valid_role(const std::string& role) {
    if (role.empty() || role.size() > 32) {
        throw KernelError(ErrorCode::InvalidRole, "'" + role + "' must be 1..32 characters");
    }
    for (char c : role) {
        if (!((c >= 'a' && c <= 'z') || c == '_')) {
            throw KernelError(ErrorCode::InvalidRole, "'" + role + "' may only contain a-z and '_'");
        }
    }
}

// --- RolesModule ---

RolesModule::RolesModule(Kernel* kernel) : Module(kernel) {}

Keycode RolesModule::keycode() const { return to_keycode(kRolesKeycode); }

bool RolesModule::has_role(const Address& addr, const std::string& role) const {
    auto it = members_.find(role);
    return it != members_.end() && it->second.count(addr) != 0;
}

void RolesModule::require_role(const std::string& role, const Address& addr) const {
    if (!has_role(addr, role)) {
        throw KernelError(ErrorCode::RequireRole, addr.toString() + " lacks role '" + role + "'");
    }
}

void RolesModule::save_role(const Capability& caller, const std::string& role, const Address& addr) {
    permissioned(caller, "save_role");
    ensure_valid_role(role);
    if (has_role(addr, role)) {
        throw KernelError(ErrorCode::AddressAlreadyHasRole, addr.toString() + " already has '" + role + "'");
    }
    members_[role].insert(addr);
}

void RolesModule::remove_role(const Capability& caller, const std::string& role, const Address& addr) {
    permissioned(caller, "remove_role");
    if (!has_role(addr, role)) {
        throw KernelError(ErrorCode::AddressDoesNotHaveRole, addr.toString() + " does not have '" + role + "'");
    }
    auto it = members_.find(role);
    it->second.erase(addr);
    if (it->second.empty()) members_.erase(it);
}

std::vector<Address> RolesModule::members(const std::string& role) const {
    auto it = members_.find(role);
    if (it == members_.end()) return {};
    return std::vector<Address>(it->second.begin(), it->second.end());
}

// --- RolesConsumer ---

void RolesConsumer::only_role(const std::string& role, const Account& caller) const {
    if (!roles_) {
        throw KernelError(ErrorCode::ModuleDoesNotExist, std::string(kRolesKeycode) + " not bound");
    }
    roles_->require_role(role, caller.address());
}

// --- RolesAdmin ---

RolesAdmin::RolesAdmin(Kernel* kernel, const Account& admin) : Policy(kernel), admin_(admin.address()) {}

std::vector<Keycode> RolesAdmin::declare_dependencies() {
    Keycode roles = to_keycode(kRolesKeycode);
    roles_ = module_as<RolesModule>(roles);
    return {roles};
}

std::vector<Permission> RolesAdmin::declare_permissions() const {
    Keycode roles = to_keycode(kRolesKeycode);
    return {{roles, "save_role"}, {roles, "remove_role"}};
}

void RolesAdmin::only_admin(const Account& caller) const {
    if (caller.address() != admin_) {
        throw KernelError(ErrorCode::OnlyAdmin, caller.address().toString());
    }
}

RolesModule& RolesAdmin::bound_roles() const {
    if (!roles_) {
        throw KernelError(ErrorCode::PolicyNotActivated, "RolesAdmin " + address().toString() + " was never activated");
    }
    return *roles_;
}

void RolesAdmin::grant_role(const Account& caller, const std::string& role, const Address& wallet) {
    only_admin(caller);
    bound_roles().save_role(capability(), role, wallet);
}

void RolesAdmin::revoke_role(const Account& caller, const std::string& role, const Address& wallet) {
    only_admin(caller);
    bound_roles().remove_role(capability(), role, wallet);
}

void RolesAdmin::push_new_admin(const Account& caller, const Address& nominee) {
    only_admin(caller);
    new_admin_ = nominee;
}

void RolesAdmin::pull_new_admin(const Account& caller) {
    if (new_admin_.is_null() || caller.address() != new_admin_) {
        throw KernelError(ErrorCode::OnlyNewAdmin, caller.address().toString());
    }
    admin_ = new_admin_;
    new_admin_ = Address{};
}

} // namespace keel
