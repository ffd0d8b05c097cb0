#pragma once
#include "errors.h"

#include <string>

namespace keel {

// Busy flag for entry points that must not be re-entered while mutating.
// Usage:
//   ReentrancyGuard::Scope scope(guard_, "install_submodule");
// Throws KernelError(Reentrant) if the guard is already held.
class ReentrancyGuard {
public:
    class Scope {
    public:
        Scope(ReentrancyGuard& g, const char* where) : g_(g) {
            if (g_.entered_) {
                throw KernelError(ErrorCode::Reentrant, std::string(where) + " re-entered");
            }
            g_.entered_ = true;
        }
        ~Scope() { g_.entered_ = false; }

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        ReentrancyGuard& g_;
    };

    bool entered() const { return entered_; }

private:
    bool entered_{false};
};

} // namespace keel
