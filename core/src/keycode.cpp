#include "keel/keycode.h"
#include "keel/errors.h"

namespace keel {

static bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }

static bool is_suffix_char(char c) {
    return is_upper(c) || (c >= '0' && c <= '9') || c == '_';
}

bool Keycode::is_valid(const std::string& text) {
    if (text.size() < kMinLength || text.size() > kWidth) return false;
    for (char c : text) {
        if (!is_upper(c)) return false;
    }
    return true;
}

Keycode Keycode::parse(const std::string& text) {
    if (!is_valid(text)) {
        throw KernelError(ErrorCode::InvalidKeycode, "'" + text + "'");
    }
    Keycode k;
    for (size_t i = 0; i < text.size(); i++) k.bytes_[i] = text[i];
    return k;
}

std::string Keycode::toString() const {
    std::string out;
    for (char c : bytes_) {
        if (c == '\0') break;
        out.push_back(c);
    }
    return out;
}

bool SubKeycode::is_valid(const std::string& text) {
    if (text.empty() || text.size() > kMaxLength) return false;
    auto dot = text.find('.');
    if (dot == std::string::npos) return false;
    if (!Keycode::is_valid(text.substr(0, dot))) return false;

    std::string suffix = text.substr(dot + 1);
    if (suffix.size() < kMinSuffix) return false;
    for (char c : suffix) {
        if (!is_suffix_char(c)) return false;
    }
    return true;
}

SubKeycode SubKeycode::parse(const std::string& text) {
    if (!is_valid(text)) {
        throw KernelError(ErrorCode::InvalidSubKeycode, "'" + text + "'");
    }
    auto dot = text.find('.');
    SubKeycode s;
    s.parent_ = Keycode::parse(text.substr(0, dot));
    s.suffix_ = text.substr(dot + 1);
    return s;
}

std::string SubKeycode::toString() const {
    if (parent_.is_null()) return "";
    return parent_.toString() + "." + suffix_;
}

void ensure_valid_subkeycode(const SubKeycode& sub, const Keycode& parent) {
    if (sub.parent().is_null() || sub.suffix().size() < SubKeycode::kMinSuffix) {
        throw KernelError(ErrorCode::InvalidSubKeycode, "'" + sub.toString() + "' is not well-formed");
    }
    if (sub.parent() != parent) {
        throw KernelError(ErrorCode::InvalidSubKeycode,
                          "'" + sub.toString() + "' is not in namespace " + parent.toString());
    }
}

} // namespace keel
