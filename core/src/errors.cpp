#include "keel/errors.h"

namespace keel {

const char* error_code_name(ErrorCode c) {
    switch (c) {
        case ErrorCode::InvalidKeycode:             return "InvalidKeycode";
        case ErrorCode::InvalidSubKeycode:          return "InvalidSubKeycode";
        case ErrorCode::InvalidRole:                return "InvalidRole";
        case ErrorCode::InvalidTarget:              return "InvalidTarget";
        case ErrorCode::InvalidSubmodule:           return "InvalidSubmodule";
        case ErrorCode::SubmoduleAlreadyInstalled:  return "SubmoduleAlreadyInstalled";
        case ErrorCode::InvalidSubmoduleUpgrade:    return "InvalidSubmoduleUpgrade";
        case ErrorCode::OnlyExecutor:               return "OnlyExecutor";
        case ErrorCode::OnlyKernel:                 return "OnlyKernel";
        case ErrorCode::OnlyParent:                 return "OnlyParent";
        case ErrorCode::PolicyNotPermitted:         return "PolicyNotPermitted";
        case ErrorCode::RequireRole:                return "RequireRole";
        case ErrorCode::OnlyAdmin:                  return "OnlyAdmin";
        case ErrorCode::OnlyNewAdmin:               return "OnlyNewAdmin";
        case ErrorCode::ModuleAlreadyInstalled:     return "ModuleAlreadyInstalled";
        case ErrorCode::ModuleNotInstalled:         return "ModuleNotInstalled";
        case ErrorCode::ModuleDoesNotExist:         return "ModuleDoesNotExist";
        case ErrorCode::InvalidModuleUpgrade:       return "InvalidModuleUpgrade";
        case ErrorCode::ModuleInUse:                return "ModuleInUse";
        case ErrorCode::PolicyAlreadyActivated:     return "PolicyAlreadyActivated";
        case ErrorCode::PolicyNotActivated:         return "PolicyNotActivated";
        case ErrorCode::KernelRetired:              return "KernelRetired";
        case ErrorCode::Reentrant:                  return "Reentrant";
        case ErrorCode::SubmoduleNotInstalled:      return "SubmoduleNotInstalled";
        case ErrorCode::AddressAlreadyHasRole:      return "AddressAlreadyHasRole";
        case ErrorCode::AddressDoesNotHaveRole:     return "AddressDoesNotHaveRole";
        case ErrorCode::DependentRefreshFailed:     return "DependentRefreshFailed";
        case ErrorCode::SubmoduleExecutionReverted: return "SubmoduleExecutionReverted";
    }
    return "Unknown";
}

ErrorKind error_kind_of(ErrorCode c) {
    switch (c) {
        case ErrorCode::InvalidKeycode:
        case ErrorCode::InvalidSubKeycode:
        case ErrorCode::InvalidRole:
        case ErrorCode::InvalidTarget:
        case ErrorCode::InvalidSubmodule:
        case ErrorCode::SubmoduleAlreadyInstalled:
        case ErrorCode::InvalidSubmoduleUpgrade:
            return ErrorKind::Identity;
        case ErrorCode::OnlyExecutor:
        case ErrorCode::OnlyKernel:
        case ErrorCode::OnlyParent:
        case ErrorCode::PolicyNotPermitted:
        case ErrorCode::RequireRole:
        case ErrorCode::OnlyAdmin:
        case ErrorCode::OnlyNewAdmin:
            return ErrorKind::Authorization;
        case ErrorCode::DependentRefreshFailed:
        case ErrorCode::SubmoduleExecutionReverted:
            return ErrorKind::Consistency;
        default:
            return ErrorKind::Lifecycle;
    }
}

const char* error_kind_name(ErrorKind k) {
    switch (k) {
        case ErrorKind::Identity:      return "identity";
        case ErrorKind::Authorization: return "authorization";
        case ErrorKind::Lifecycle:     return "lifecycle";
        case ErrorKind::Consistency:   return "consistency";
    }
    return "unknown";
}

KernelError::KernelError(ErrorCode code, const std::string& detail)
    : std::runtime_error(std::string(error_code_name(code)) + (detail.empty() ? "" : ": " + detail)),
      code_(code), detail_(detail) {}

} // namespace keel
