#include "core/types/MacAddress.hpp"

#include <cctype>

namespace lanwatch::core {

namespace {

/// Uppercase hex digits with separators removed; nullopt on any other character.
std::optional<std::string> hexDigits(const std::string& address) {
    std::string digits;
    digits.reserve(address.size());
    for (unsigned char c : address) {
        if (c == ':' || c == '-' || c == '.') {
            continue;
        }
        if (!std::isxdigit(c)) {
            return std::nullopt;
        }
        digits += static_cast<char>(std::toupper(c));
    }
    return digits;
}

} // namespace

std::optional<std::string> MacAddress::ouiPrefix(const std::string& address) {
    auto digits = hexDigits(address);
    if (!digits || digits->size() < 6) {
        return std::nullopt;
    }
    return digits->substr(0, 6);
}

std::optional<std::string> MacAddress::normalize(const std::string& address) {
    auto digits = hexDigits(address);
    if (!digits || digits->size() != 12) {
        return std::nullopt;
    }

    std::string formatted;
    for (size_t i = 0; i < digits->size(); i += 2) {
        if (i > 0) {
            formatted += ':';
        }
        formatted += digits->substr(i, 2);
    }
    return formatted;
}

bool MacAddress::isNull(const std::string& address) {
    auto digits = hexDigits(address);
    return !digits || digits->find_first_not_of('0') == std::string::npos;
}

} // namespace lanwatch::core
