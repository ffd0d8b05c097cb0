#pragma once
#include <array>
#include <cstddef>
#include <functional>
#include <string>

namespace keel {

// Keycode: fixed-width (5 byte) module identifier.
// Text form is 3..5 uppercase ASCII letters, NUL-padded on the right.
class Keycode {
public:
    static constexpr size_t kWidth = 5;
    static constexpr size_t kMinLength = 3;

    Keycode() = default; // null keycode; never valid for installation

    // Throws KernelError(InvalidKeycode) on malformed input.
    static Keycode parse(const std::string& text);
    static bool is_valid(const std::string& text);

    bool is_null() const { return bytes_[0] == '\0'; }
    std::string toString() const;
    const std::array<char, kWidth>& bytes() const { return bytes_; }

    bool operator==(const Keycode& o) const { return bytes_ == o.bytes_; }
    bool operator!=(const Keycode& o) const { return bytes_ != o.bytes_; }
    bool operator<(const Keycode& o) const { return bytes_ < o.bytes_; }

private:
    std::array<char, kWidth> bytes_{};
};

inline Keycode to_keycode(const std::string& text) { return Keycode::parse(text); }

// SubKeycode: "<PARENT>.<SUFFIX>", at most 20 bytes.
// SUFFIX is at least 3 characters of A-Z, 0-9 or '_'.
class SubKeycode {
public:
    static constexpr size_t kMaxLength = 20;
    static constexpr size_t kMinSuffix = 3;

    SubKeycode() = default;

    // Throws KernelError(InvalidSubKeycode) on malformed input.
    static SubKeycode parse(const std::string& text);
    static bool is_valid(const std::string& text);

    const Keycode& parent() const { return parent_; }
    const std::string& suffix() const { return suffix_; }
    std::string toString() const;

    bool operator==(const SubKeycode& o) const { return parent_ == o.parent_ && suffix_ == o.suffix_; }
    bool operator!=(const SubKeycode& o) const { return !(*this == o); }
    bool operator<(const SubKeycode& o) const {
        return parent_ != o.parent_ ? parent_ < o.parent_ : suffix_ < o.suffix_;
    }

private:
    Keycode parent_;
    std::string suffix_;
};

inline SubKeycode to_subkeycode(const std::string& text) { return SubKeycode::parse(text); }

// Throws KernelError(InvalidSubKeycode) unless sub lives in parent's namespace.
void ensure_valid_subkeycode(const SubKeycode& sub, const Keycode& parent);

} // namespace keel

namespace std {
template <>
struct hash<keel::Keycode> {
    size_t operator()(const keel::Keycode& k) const noexcept {
        size_t h = 1469598103934665603ULL;
        for (char c : k.bytes()) { h ^= (unsigned char)c; h *= 1099511628211ULL; }
        return h;
    }
};
template <>
struct hash<keel::SubKeycode> {
    size_t operator()(const keel::SubKeycode& s) const noexcept {
        return std::hash<keel::Keycode>()(s.parent()) ^ (std::hash<std::string>()(s.suffix()) << 1);
    }
};
} // namespace std
