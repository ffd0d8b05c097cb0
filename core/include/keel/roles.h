#pragma once
#include "capability.h"
#include "keycode.h"
#include "module.h"
#include "policy.h"

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace keel {

// Throws KernelError(InvalidRole) unless role is 1..32 chars of a-z or '_'.
void ensure_valid_role(const std::string& role);

// ROLES: address -> role membership, written only by permitted policies.
class RolesModule : public Module {
public:
    explicit RolesModule(Kernel* kernel);

    Keycode keycode() const override;
    Version version() const override { return Version{1, 0}; }

    bool has_role(const Address& addr, const std::string& role) const;

    // Throws KernelError(RequireRole) if addr lacks role.
    void require_role(const std::string& role, const Address& addr) const;

    // permissioned: "save_role"
    void save_role(const Capability& caller, const std::string& role, const Address& addr);
    // permissioned: "remove_role"
    void remove_role(const Capability& caller, const std::string& role, const Address& addr);

    std::vector<Address> members(const std::string& role) const;

private:
    std::map<std::string, std::set<Address>> members_;
};

// Mixin for policies gating their own entry points on ROLES membership.
// The policy must list "ROLES" among its dependencies and call
// bind_roles() from declare_dependencies().
class RolesConsumer {
public:
    virtual ~RolesConsumer() = default;

protected:
    void bind_roles(std::shared_ptr<RolesModule> roles) { roles_ = std::move(roles); }
    void only_role(const std::string& role, const Account& caller) const;
    const std::shared_ptr<RolesModule>& roles() const { return roles_; }

private:
    std::shared_ptr<RolesModule> roles_;
};

// RolesAdmin: the policy through which an admin grants and revokes roles.
// Admin transfer is two-step: push_new_admin by the admin, then
// pull_new_admin by the nominee. Admin calls present the admin's Account.
class RolesAdmin : public Policy {
public:
    RolesAdmin(Kernel* kernel, const Account& admin);

    const Address& admin() const { return admin_; }
    const Address& new_admin() const { return new_admin_; }

    void grant_role(const Account& caller, const std::string& role, const Address& wallet);
    void revoke_role(const Account& caller, const std::string& role, const Address& wallet);

    void push_new_admin(const Account& caller, const Address& nominee);
    void pull_new_admin(const Account& caller);

protected:
    std::vector<Keycode> declare_dependencies() override;
    std::vector<Permission> declare_permissions() const override;

private:
    void only_admin(const Account& caller) const;
    RolesModule& bound_roles() const;

    Address admin_;
    Address new_admin_;
    std::shared_ptr<RolesModule> roles_;
};

} // namespace keel
