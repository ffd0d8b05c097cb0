#pragma once
#include "capability.h"
#include "keycode.h"
#include "types.h"

#include <string>

namespace keel {

class Kernel;

// Base for anything that trusts exactly one kernel at a time.
// The kernel pointer is non-owning; the kernel must outlive its adapters
// (or migrate them away first).
//
// Kernel callbacks are private and reachable only from Kernel. Each one
// still checks that the calling Kernel instance is the trusted one.
class KernelAdapter : public Contract {
public:
    explicit KernelAdapter(Kernel* kernel);

    Kernel* kernel() const { return kernel_; }

protected:
    // Throws KernelError(OnlyKernel) unless caller is the trusted kernel instance.
    void only_kernel(const Kernel& caller) const;

private:
    friend class Kernel;

    // Moves trust to new_kernel.
    void change_kernel(const Kernel& caller, Kernel* new_kernel);

    Kernel* kernel_;
};

// Module: long-lived unit owning protocol state behind kernel-checked entry points.
//
// Subclasses report a keycode and version, and guard every mutating entry
// point with permissioned(caller, "<function>"). Read-only queries may stay
// unguarded.
class Module : public KernelAdapter {
public:
    explicit Module(Kernel* kernel);

    virtual Keycode keycode() const = 0;
    virtual Version version() const = 0;

protected:
    // Self-initialisation hook; runs inside the install/upgrade action,
    // so throwing aborts that action.
    virtual void on_init() {}

    // Throws KernelError(PolicyNotPermitted) unless the trusted kernel has
    // granted (caller, keycode(), function) under a current capability, and
    // KernelError(ModuleNotInstalled) once this instance has been upgraded
    // away or deprecated.
    void permissioned(const Capability& caller, const std::string& function) const;

private:
    friend class Kernel;

    // Called by the kernel on install and on upgrade (for the new module).
    void init(const Kernel& caller);
};

} // namespace keel
