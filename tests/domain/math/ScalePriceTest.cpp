#include "domain/math/PriceMath.hpp"
#include "PriceMathTestUtil.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

using namespace opm::domain;

namespace {
constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
}

TEST(ScalePrice, SameExponentIsIdentity) {
    EXPECT_EQ(scale_price(12345, 8, 8), 12345u);
    EXPECT_EQ(scale_price(kMax, 40, 40), kMax);
}

TEST(ScalePrice, LargerTargetExponentDivides) {
    EXPECT_EQ(scale_price(10050, 4, 6), 100u);
    EXPECT_EQ(scale_price(10050, 4, 5), 1005u);
}

TEST(ScalePrice, DownscaleTruncatesInsteadOfRounding) {
    EXPECT_EQ(scale_price(10059, 4, 6), 100u);
    EXPECT_EQ(scale_price(999, 0, 3), 0u);
    EXPECT_EQ(scale_price(1999999999, 0, 9), 1u);
}

TEST(ScalePrice, DownscaleBeyondRangeYieldsZero) {
    EXPECT_EQ(scale_price(kMax, 0, 19), 1u);
    EXPECT_EQ(scale_price(kMax, 0, 20), 0u);
    EXPECT_EQ(scale_price(kMax, 0, 1000), 0u);
}

TEST(ScalePrice, SmallerTargetExponentMultiplies) {
    EXPECT_EQ(scale_price(15, 6, 4), 1500u);
    EXPECT_EQ(scale_price(1, 19, 0), 10000000000000000000ULL);
}

TEST(ScalePrice, UpscaleOverflowThrows) {
    expect_price_error([] { scale_price(kMax, 1, 0); }, PriceErrorKind::ARITHMETIC_OVERFLOW);
    expect_price_error([] { scale_price(2, 19, 0); }, PriceErrorKind::ARITHMETIC_OVERFLOW);
    expect_price_error([] { scale_price(1, 20, 0); }, PriceErrorKind::ARITHMETIC_OVERFLOW);
}

TEST(ScalePrice, ZeroNeverOverflows) {
    EXPECT_EQ(scale_price(0, 100, 0), 0u);
}

TEST(ScalePrice, PriceOverloadScalesMantissaAndConfidence) {
    Price p(150000000, 1000000, 8, 100);

    EXPECT_EQ(scale_price(p, 9), Price(15000000, 100000, 9, 100));
    EXPECT_EQ(scale_price(p, 6), Price(15000000000, 100000000, 6, 100));
    EXPECT_EQ(scale_price(p, 8), p);
}

TEST(ScalePrice, PriceOverloadPropagatesOverflow) {
    Price p(1, kMax, 5, 0);
    expect_price_error([&] { scale_price(p, 0); }, PriceErrorKind::ARITHMETIC_OVERFLOW);
}
