#pragma once
#include <stdexcept>
#include <string>

namespace keel {

// Broad failure classes. Every error aborts the enclosing call as a unit.
enum class ErrorKind {
    Identity,       // malformed/duplicate identifiers, cross-wired parents
    Authorization,  // wrong caller, missing permission, untrusted kernel/parent
    Lifecycle,      // action not legal in the current install/activation state
    Consistency,    // dependent refused or failed an upgrade/migration refresh
};

enum class ErrorCode {
    // identity
    InvalidKeycode,
    InvalidSubKeycode,
    InvalidRole,
    InvalidTarget,
    InvalidSubmodule,
    SubmoduleAlreadyInstalled,
    InvalidSubmoduleUpgrade,
    // authorization
    OnlyExecutor,
    OnlyKernel,
    OnlyParent,
    PolicyNotPermitted,
    RequireRole,
    OnlyAdmin,
    OnlyNewAdmin,
    // lifecycle
    ModuleAlreadyInstalled,
    ModuleNotInstalled,
    ModuleDoesNotExist,
    InvalidModuleUpgrade,
    ModuleInUse,
    PolicyAlreadyActivated,
    PolicyNotActivated,
    KernelRetired,
    Reentrant,
    SubmoduleNotInstalled,
    AddressAlreadyHasRole,
    AddressDoesNotHaveRole,
    // consistency
    DependentRefreshFailed,
    SubmoduleExecutionReverted,
};

const char* error_code_name(ErrorCode c);
ErrorKind error_kind_of(ErrorCode c);
const char* error_kind_name(ErrorKind k);

class KernelError : public std::runtime_error {
public:
    KernelError(ErrorCode code, const std::string& detail);

    ErrorCode code() const { return code_; }
    ErrorKind kind() const { return error_kind_of(code_); }
    const std::string& detail() const { return detail_; }

private:
    ErrorCode code_;
    std::string detail_;
};

} // namespace keel
