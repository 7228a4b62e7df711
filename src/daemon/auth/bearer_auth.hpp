#pragma once

#include <optional>
#include <string>
#include <string_view>

struct AuthResult {
    bool allowed = false;
    std::string message; // set when denied
};

class BearerAuth {
public:
    explicit BearerAuth(std::string expected_token);

    // header is the raw Authorization header value, nullopt when absent.
    AuthResult check(std::optional<std::string_view> header) const;

    const std::string& token() const { return token_; }

private:
    std::string token_;
};

// Compares every byte of the longer input; running time depends only on the
// lengths, never on where the first difference is.
bool constant_time_equals(std::string_view a, std::string_view b);

// 32 lowercase hex chars from std::random_device.
std::string generate_token();
