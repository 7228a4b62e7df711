#include <catch2/catch_message.hpp>
#include <catch2/catch_test_macros.hpp>

#include "auth/bearer_auth.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <string>
#include <vector>

TEST_CASE("BearerAuth", "[auth]") {
    BearerAuth auth("s3cret-token");

    SECTION("ValidToken") {
        auto r = auth.check("Bearer s3cret-token");
        REQUIRE(r.allowed);
        REQUIRE(r.message.empty());
    }

    SECTION("SchemeIsCaseInsensitive") {
        REQUIRE(auth.check("bearer s3cret-token").allowed);
        REQUIRE(auth.check("BEARER s3cret-token").allowed);
    }

    SECTION("TokenIsTrimmed") {
        REQUIRE(auth.check("Bearer   s3cret-token  ").allowed);
    }

    SECTION("MissingHeader") {
        auto r = auth.check(std::nullopt);
        REQUIRE_FALSE(r.allowed);
        REQUIRE(r.message == "Missing Authorization header. Expected: Bearer <token>");
    }

    SECTION("WrongScheme") {
        auto r = auth.check("Basic dXNlcjpwYXNz");
        REQUIRE_FALSE(r.allowed);
        REQUIRE(r.message == "Malformed Authorization header. Expected: Bearer <token>");
    }

    SECTION("BearerWithoutToken") {
        REQUIRE(auth.check("Bearer").message ==
                "Malformed Authorization header. Expected: Bearer <token>");
        REQUIRE(auth.check("Bearer    ").message ==
                "Malformed Authorization header. Expected: Bearer <token>");
    }

    SECTION("WrongToken") {
        auto r = auth.check("Bearer s3cret-tokem");
        REQUIRE_FALSE(r.allowed);
        REQUIRE(r.message == "Invalid bearer token");
    }

    SECTION("PrefixOfTokenRejected") {
        REQUIRE_FALSE(auth.check("Bearer s3cret").allowed);
        REQUIRE_FALSE(auth.check("Bearer s3cret-token-and-more").allowed);
    }

    SECTION("TokenIsCaseSensitive") {
        REQUIRE_FALSE(auth.check("Bearer S3CRET-TOKEN").allowed);
    }
}

TEST_CASE("Constant time compare", "[auth]") {

    SECTION("EqualStrings") {
        REQUIRE(constant_time_equals("abc", "abc"));
        REQUIRE(constant_time_equals("", ""));
    }

    SECTION("DifferentStrings") {
        REQUIRE_FALSE(constant_time_equals("abc", "abd"));
        REQUIRE_FALSE(constant_time_equals("abc", "ab"));
        REQUIRE_FALSE(constant_time_equals("", "a"));
    }

    SECTION("TrailingNulDoesNotMatchShorter") {
        // The shorter input is padded with zeros while comparing; the length
        // difference still has to make this fail.
        std::string padded("abc\0", 4);
        REQUIRE_FALSE(constant_time_equals("abc", padded));
    }
}

namespace {

// Nanoseconds for `reps` comparisons of a against b.
long long time_compares(const std::string& a, const std::string& b, int reps, int& matches) {
    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < reps; i++) {
        if (constant_time_equals(a, b)) matches++;
    }
    auto elapsed = std::chrono::steady_clock::now() - start;
    return std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count();
}

long long median(std::vector<long long> v) {
    std::ranges::sort(v);
    return v[v.size() / 2];
}

} // namespace

TEST_CASE("Compare time ignores mismatch position", "[auth][timing]") {
    // Long enough that an early exit at the first byte would be orders of
    // magnitude faster than one at the last byte.
    const std::string expected(4096, 'k');
    std::string first_wrong = expected;
    first_wrong.front() = 'x';
    std::string last_wrong = expected;
    last_wrong.back() = 'x';

    constexpr int kRounds = 31;
    constexpr int kReps = 400;
    std::vector<long long> first_times;
    std::vector<long long> last_times;
    int matches = 0;

    // Alternate the two cases so drift in machine load hits both alike.
    for (int round = 0; round < kRounds; round++) {
        first_times.push_back(time_compares(expected, first_wrong, kReps, matches));
        last_times.push_back(time_compares(expected, last_wrong, kReps, matches));
    }
    REQUIRE(matches == 0);

    const double first_median = static_cast<double>(std::max(1LL, median(first_times)));
    const double last_median = static_cast<double>(std::max(1LL, median(last_times)));
    const double ratio = first_median / last_median;
    INFO("median ns, first byte wrong: " << first_median << ", last byte wrong: " << last_median);
    REQUIRE(ratio > 0.5);
    REQUIRE(ratio < 2.0);
}

TEST_CASE("Generated tokens", "[auth]") {
    auto a = generate_token();
    auto b = generate_token();

    REQUIRE(a.size() == 32);
    REQUIRE(a != b);
    for (char c : a) {
        REQUIRE(std::isxdigit(static_cast<unsigned char>(c)));
        REQUIRE_FALSE(std::isupper(static_cast<unsigned char>(c)));
    }

    BearerAuth auth(a);
    REQUIRE(auth.check("Bearer " + a).allowed);
}
