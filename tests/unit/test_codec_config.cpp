#include <catch2/catch_test_macros.hpp>
#include "regtoken/configuration/codec_config.hpp"
#include <chrono>
using namespace regtoken;
using regtoken::configuration::CodecConfig;
using namespace std::chrono_literals;
TEST_CASE("CodecConfig - Defaults", "[config]") {
    constexpr auto config = CodecConfig::Default();
    STATIC_REQUIRE(config.ValidityWindow() == 15min);
    STATIC_REQUIRE(config.ClockSkewTolerance() == 60s);
    STATIC_REQUIRE(config.MaxTokenLength() == 64 * 1024);
    STATIC_REQUIRE(CodecConfig::Pbkdf2Iterations() == 100000);
    STATIC_REQUIRE(CodecConfig::MinSplicePosition() == 10);
    STATIC_REQUIRE(CodecConfig::MaxSplicePosition() == 99);
    STATIC_REQUIRE(CodecConfig::MinTokenLength() == 68);
    REQUIRE(config.Validate().IsOk());
}
TEST_CASE("CodecConfig - Builders", "[config]") {
    const auto base = CodecConfig::Default();
    SECTION("Each builder changes one value") {
        const auto windowed = base.WithValidityWindow(5min);
        REQUIRE(windowed.ValidityWindow() == 5min);
        REQUIRE(windowed.ClockSkewTolerance() == base.ClockSkewTolerance());
        REQUIRE(windowed.MaxTokenLength() == base.MaxTokenLength());
        const auto skewed = base.WithClockSkewTolerance(2min);
        REQUIRE(skewed.ClockSkewTolerance() == 2min);
        REQUIRE(skewed.ValidityWindow() == base.ValidityWindow());
        const auto bounded = base.WithMaxTokenLength(4096);
        REQUIRE(bounded.MaxTokenLength() == 4096);
        REQUIRE(bounded.ValidityWindow() == base.ValidityWindow());
    }
    SECTION("Builders do not modify the original") {
        (void)base.WithValidityWindow(1s);
        REQUIRE(base == CodecConfig::Default());
    }
    SECTION("Equality") {
        REQUIRE(base.WithMaxTokenLength(100) == CodecConfig::Default().WithMaxTokenLength(100));
        REQUIRE_FALSE(base.WithMaxTokenLength(100) == base);
    }
}
TEST_CASE("CodecConfig - Validation", "[config]") {
    auto is_invalid = [](const TokenFailure& f) { return f.type == TokenFailureType::InvalidInput; };
    const auto base = CodecConfig::Default();
    REQUIRE(base.WithValidityWindow(0s).Validate().IsErrAnd(is_invalid));
    REQUIRE(base.WithValidityWindow(-1s).Validate().IsErrAnd(is_invalid));
    REQUIRE(base.WithClockSkewTolerance(-1s).Validate().IsErrAnd(is_invalid));
    REQUIRE(base.WithClockSkewTolerance(0s).Validate().IsOk());
    REQUIRE(base.WithMaxTokenLength(67).Validate().IsErrAnd(is_invalid));
    REQUIRE(base.WithMaxTokenLength(68).Validate().IsOk());
}
