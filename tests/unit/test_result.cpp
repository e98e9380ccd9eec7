#include <catch2/catch_test_macros.hpp>
#include "regtoken/core/result.hpp"
#include "regtoken/core/failures.hpp"
#include <optional>
#include <string>
using namespace regtoken;
TEST_CASE("Result<T, E> - Basic Operations", "[result][core]") {
    SECTION("Ok construction and queries") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.IsErr());
        REQUIRE(result.Unwrap() == 42);
    }
    SECTION("Err construction and queries") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE(result.IsErr());
        REQUIRE_FALSE(result.IsOk());
        REQUIRE(result.UnwrapErr() == "error");
    }
    SECTION("Unit type for void results") {
        auto result = Result<Unit, std::string>::Ok(unit);
        REQUIRE(result.IsOk());
    }
    SECTION("Unwrap on Err throws") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE_THROWS_AS(result.Unwrap(), std::runtime_error);
    }
    SECTION("UnwrapErr on Ok throws") {
        auto result = Result<int, std::string>::Ok(1);
        REQUIRE_THROWS_AS(result.UnwrapErr(), std::runtime_error);
    }
}
TEST_CASE("Result<T, E> - Monadic Operations", "[result][core]") {
    SECTION("Map transforms Ok value") {
        auto result = Result<int, std::string>::Ok(21);
        auto mapped = std::move(result).Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsOk());
        REQUIRE(mapped.Unwrap() == 42);
    }
    SECTION("Map preserves Err") {
        auto result = Result<int, std::string>::Err("error");
        auto mapped = std::move(result).Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr() == "error");
    }
    SECTION("MapErr converts failure kinds") {
        auto result = Result<int, CryptoFailure>::Err(CryptoFailure::Decrypt("bad padding"));
        auto mapped = std::move(result).MapErr([](CryptoFailure f) {
            return TokenFailure::Decryption(f.message);
        });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr().type == TokenFailureType::Decryption);
        REQUIRE(mapped.UnwrapErr().message == "bad padding");
    }
    SECTION("Bind chains operations") {
        auto result = Result<int, std::string>::Ok(10);
        auto bound = std::move(result).Bind([](int x) {
            if (x > 5) {
                return Result<int, std::string>::Ok(x * 2);
            }
            return Result<int, std::string>::Err("too small");
        });
        REQUIRE(bound.IsOk());
        REQUIRE(bound.Unwrap() == 20);
    }
    SECTION("Bind short-circuits on Err") {
        auto result = Result<int, std::string>::Err("first");
        bool called = false;
        auto bound = std::move(result).Bind([&called](int x) {
            called = true;
            return Result<int, std::string>::Ok(x);
        });
        REQUIRE_FALSE(called);
        REQUIRE(bound.UnwrapErr() == "first");
    }
}
TEST_CASE("Result<T, E> - UnwrapOr and FromOptional", "[result][core]") {
    SECTION("UnwrapOr returns value on Ok") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(std::move(result).UnwrapOr(0) == 42);
    }
    SECTION("UnwrapOr returns default on Err") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE(std::move(result).UnwrapOr(0) == 0);
    }
    SECTION("FromOptional maps presence to Ok") {
        auto result = Result<int, std::string>::FromOptional(std::optional<int>(7), "missing");
        REQUIRE(result.Unwrap() == 7);
    }
    SECTION("FromOptional maps absence to Err") {
        auto result = Result<int, std::string>::FromOptional(std::nullopt, "missing");
        REQUIRE(result.UnwrapErr() == "missing");
    }
    SECTION("IsErrAnd inspects the failure") {
        auto result = Result<int, TokenFailure>::Err(TokenFailure::MalformedToken("short"));
        REQUIRE(result.IsErrAnd([](const TokenFailure& f) { return f.type == TokenFailureType::MalformedToken; }));
        REQUIRE_FALSE(result.IsErrAnd([](const TokenFailure& f) { return f.type == TokenFailureType::Decryption; }));
    }
}
TEST_CASE("TokenFailure - Kind names", "[result][core]") {
    REQUIRE(ToString(TokenFailureType::Encoding) == "EncodingError");
    REQUIRE(ToString(TokenFailureType::MalformedToken) == "MalformedTokenError");
    REQUIRE(ToString(TokenFailureType::Decryption) == "DecryptionError");
    REQUIRE(ToString(TokenFailureType::MalformedPayload) == "MalformedPayloadError");
}
