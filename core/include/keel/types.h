#pragma once
#include <cstdint>
#include <functional>
#include <string>

namespace keel {

// Address: identity of a deployed contract or an external account.
// Value 0 is the null address and never names anything.
struct Address {
    uint64_t value{0};

    bool is_null() const { return value == 0; }
    std::string toString() const; // "0x000000000000002a"

    bool operator==(const Address& o) const { return value == o.value; }
    bool operator!=(const Address& o) const { return value != o.value; }
    bool operator<(const Address& o) const { return value < o.value; }
};

// Mint a fresh address for a new contract or external account.
// Addresses are never reused within a process.
Address next_address();

// Bare address for an external party that never acts itself (a role holder,
// a ChangeExecutor target before its Account is presented).
inline Address new_account() { return next_address(); }

// Account: credential of an external party such as the executor or an admin.
// Every Account mints a fresh address and cannot be copied, so presenting
// one is the only way to act as its address. Knowing the address is not.
class Account {
public:
    Account() : address_(next_address()) {}

    Account(const Account&) = delete;
    Account& operator=(const Account&) = delete;

    const Address& address() const { return address_; }

private:
    Address address_;
};

struct Version {
    uint8_t major{1};
    uint8_t minor{0};

    std::string toString() const; // "1.0"

    bool operator==(const Version& o) const { return major == o.major && minor == o.minor; }
    bool operator!=(const Version& o) const { return !(*this == o); }
    bool operator<(const Version& o) const {
        return major != o.major ? major < o.major : minor < o.minor;
    }
};

// Administrative actions accepted by Kernel::execute_action.
enum class Action {
    InstallModule,
    UpgradeModule,
    DeprecateModule,
    ActivatePolicy,
    DeactivatePolicy,
    ChangeExecutor,
    MigrateKernel,
};

const char* action_name(Action a);

// Anything with an address that the kernel can be asked to act on.
class Contract {
public:
    Contract() : address_(next_address()) {}
    virtual ~Contract() = default;

    Contract(const Contract&) = delete;
    Contract& operator=(const Contract&) = delete;

    const Address& address() const { return address_; }

private:
    Address address_;
};

} // namespace keel

namespace std {
template <>
struct hash<keel::Address> {
    size_t operator()(const keel::Address& a) const noexcept { return std::hash<uint64_t>()(a.value); }
};
} // namespace std
