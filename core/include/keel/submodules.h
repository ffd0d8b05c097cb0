#pragma once
#include "capability.h"
#include "keycode.h"
#include "module.h"
#include "reentrancy.h"
#include "types.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace keel {

class ModuleWithSubmodules;

// ParentKey: proof that a call was issued by a submodule's parent.
// Only ModuleWithSubmodules can mint one, and only naming itself. It cannot
// be copied, so it lives no longer than the call it was passed into.
class ParentKey {
public:
    ParentKey(const ParentKey&) = delete;
    ParentKey& operator=(const ParentKey&) = delete;

    const ModuleWithSubmodules* parent() const { return parent_; }

private:
    friend class ModuleWithSubmodules;
    explicit ParentKey(const ModuleWithSubmodules* parent) : parent_(parent) {}

    const ModuleWithSubmodules* parent_;
};

// Submodule: a plugin living inside one parent module's namespace.
// The kernel never sees it; every privileged entry point takes a
// const ParentKey& and guards with only_parent().
class Submodule : public Contract {
public:
    explicit Submodule(ModuleWithSubmodules* parent);

    virtual SubKeycode subkeycode() const = 0;
    virtual Version version() const = 0;

    // Keycode of the parent module, i.e. the namespace this submodule lives in.
    Keycode parent_keycode() const;
    ModuleWithSubmodules* parent() const { return parent_; }

protected:
    virtual void on_init() {}

    // Throws KernelError(OnlyParent) unless key was minted by the parent instance.
    void only_parent(const ParentKey& key) const;

private:
    friend class ModuleWithSubmodules;

    // Called by the parent after registration.
    void init(const ParentKey& key);

    ModuleWithSubmodules* parent_;
};

// Module hosting a table of submodules keyed by sub-keycode.
//
// install_submodule / upgrade_submodule / exec_on_submodule are kernel
// permissioned under the function names "install_submodule",
// "upgrade_submodule" and "exec_on_submodule". Subclasses add structural
// checks by overriding validate_submodule().
class ModuleWithSubmodules : public Module {
public:
    explicit ModuleWithSubmodules(Kernel* kernel);

    void install_submodule(const Capability& caller, std::shared_ptr<Submodule> submodule);
    void upgrade_submodule(const Capability& caller, std::shared_ptr<Submodule> submodule);

    // Runs fn against the submodule registered under subkeycode, lending it
    // this module's ParentKey for the duration of the call. Errors thrown by
    // fn surface as KernelError(SubmoduleExecutionReverted).
    void exec_on_submodule(const Capability& caller, const SubKeycode& subkeycode,
                           const std::function<void(Submodule&, const ParentKey&)>& fn);

    std::vector<SubKeycode> submodules() const;
    size_t submodule_count() const { return submodules_.size(); }
    std::shared_ptr<Submodule> get_submodule_for_keycode(const SubKeycode& subkeycode) const;

protected:
    // Module-specific structural checks; throw KernelError(InvalidSubmodule).
    virtual void validate_submodule(const Submodule& submodule) const { (void)submodule; }

    // Key naming this module; for the parent's own calls into its submodules.
    ParentKey parent_key() const { return ParentKey(this); }

    // For the parent's own internal routing (no kernel check).
    template <typename T>
    std::shared_ptr<T> submodule_as(const SubKeycode& subkeycode) const {
        return std::dynamic_pointer_cast<T>(get_submodule_for_keycode(subkeycode));
    }

private:
    void ensure_valid_submodule(const Submodule& submodule) const;

    std::map<SubKeycode, std::shared_ptr<Submodule>> submodules_;
    ReentrancyGuard guard_;
};

} // namespace keel
