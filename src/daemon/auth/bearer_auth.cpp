#include "auth/bearer_auth.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <format>
#include <random>

namespace {

constexpr std::string_view kScheme = "Bearer ";

constexpr const char* kMissingHeader =
    "Missing Authorization header. Expected: Bearer <token>";
constexpr const char* kMalformedHeader =
    "Malformed Authorization header. Expected: Bearer <token>";
constexpr const char* kInvalidToken = "Invalid bearer token";

bool starts_with_icase(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); i++) {
        if (std::tolower(static_cast<unsigned char>(s[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i])))
            return false;
    }
    return true;
}

std::string_view trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

bool constant_time_equals(std::string_view a, std::string_view b) {
    size_t len = std::max(a.size(), b.size());
    volatile uint8_t diff = static_cast<uint8_t>(a.size() != b.size());
    for (size_t i = 0; i < len; i++) {
        uint8_t x = i < a.size() ? static_cast<uint8_t>(a[i]) : 0;
        uint8_t y = i < b.size() ? static_cast<uint8_t>(b[i]) : 0;
        diff = diff | static_cast<uint8_t>(x ^ y);
    }
    return diff == 0;
}

std::string generate_token() {
    std::random_device rd;
    std::string out;
    for (int i = 0; i < 4; i++) {
        out += std::format("{:08x}", static_cast<uint32_t>(rd()));
    }
    return out;
}

BearerAuth::BearerAuth(std::string expected_token) : token_(std::move(expected_token)) {}

AuthResult BearerAuth::check(std::optional<std::string_view> header) const {
    if (!header) return {.allowed = false, .message = kMissingHeader};

    auto value = trim(*header);
    if (!starts_with_icase(value, kScheme)) {
        return {.allowed = false, .message = kMalformedHeader};
    }

    auto presented = trim(value.substr(kScheme.size()));
    if (presented.empty()) return {.allowed = false, .message = kMalformedHeader};

    if (!constant_time_equals(presented, token_)) {
        return {.allowed = false, .message = kInvalidToken};
    }
    return {.allowed = true, .message = {}};
}
