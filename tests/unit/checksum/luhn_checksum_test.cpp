// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include "checksum/luhn_checksum.hpp"

#include <fmt/format.h>

#include "common/gtest_utils.hpp"

using namespace pnr;

namespace {

TEST(TestLuhnChecksum, Compute)
{
    EXPECT_EQ(luhn_checksum{}.compute("811218987"), 6U);
    EXPECT_EQ(luhn_checksum{}.compute("640823323"), 4U);
    EXPECT_EQ(luhn_checksum{}.compute("900101001"), 7U);
    EXPECT_EQ(luhn_checksum{}.compute("811218001"), 6U);

    // Coordination day
    EXPECT_EQ(luhn_checksum{}.compute("811278987"), 3U);
    EXPECT_EQ(luhn_checksum{}.compute("640883323"), 1U);

    // Sum is a multiple of 10
    EXPECT_EQ(luhn_checksum{}.compute("811131987"), 0U);
    EXPECT_EQ(luhn_checksum{}.compute("000000000"), 0U);
}

TEST(TestLuhnChecksum, ComputeDoublesEvenIndices)
{
    // Only the digit at index 0 contributes: 2 * 1
    EXPECT_EQ(luhn_checksum{}.compute("100000000"), 8U);
    // Index 1 isn't doubled
    EXPECT_EQ(luhn_checksum{}.compute("010000000"), 9U);
    // 2 * 9 = 18 -> 9
    EXPECT_EQ(luhn_checksum{}.compute("900000000"), 1U);
    // Last payload digit is doubled
    EXPECT_EQ(luhn_checksum{}.compute("000000001"), 8U);
}

TEST(TestLuhnChecksum, ComputeInvalidPayload)
{
    EXPECT_FALSE(luhn_checksum{}.compute("").has_value());
    EXPECT_FALSE(luhn_checksum{}.compute("811218-987").has_value());
    EXPECT_FALSE(luhn_checksum{}.compute("81121898a").has_value());
    EXPECT_FALSE(luhn_checksum{}.compute("         ").has_value());
}

TEST(TestLuhnChecksum, Validate)
{
    EXPECT_TRUE(luhn_checksum{}.validate("8112189876"));
    EXPECT_TRUE(luhn_checksum{}.validate("6408233234"));
    EXPECT_TRUE(luhn_checksum{}.validate("8112789873"));
    EXPECT_TRUE(luhn_checksum{}.validate("0000000000"));

    // Random mastercard, any length is supported
    EXPECT_TRUE(luhn_checksum{}.validate("5425233430109903"));
    // Random IMEI
    EXPECT_TRUE(luhn_checksum{}.validate("350009218041876"));

    // Invalid
    EXPECT_FALSE(luhn_checksum{}.validate("8112189875"));
    EXPECT_FALSE(luhn_checksum{}.validate("8112189877"));
    EXPECT_FALSE(luhn_checksum{}.validate("5427625793410839"));
    EXPECT_FALSE(luhn_checksum{}.validate("811218-9876"));
    EXPECT_FALSE(luhn_checksum{}.validate("811218987a"));
    EXPECT_FALSE(luhn_checksum{}.validate("1"));
    EXPECT_FALSE(luhn_checksum{}.validate("              "));
    EXPECT_FALSE(luhn_checksum{}.validate(""));
}

TEST(TestLuhnChecksum, ComputeAndValidateAgree)
{
    const luhn_checksum checksum;
    for (unsigned serial = 1; serial < 1000; serial += 7) {
        auto payload = fmt::format("640823{:03}", serial);
        auto digit = checksum.compute(payload);
        ASSERT_TRUE(digit.has_value());
        EXPECT_TRUE(checksum.validate(fmt::format("{}{}", payload, *digit)));
        EXPECT_FALSE(checksum.validate(fmt::format("{}{}", payload, (*digit + 1) % 10)));
    }
}

} // namespace
