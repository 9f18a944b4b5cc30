// File: tests/unit/test_io_format.cpp
// Purpose: Validate numeric formatting used by the number encoder.
// Key invariants: Floats print the shortest round-trip digits in positional
//                 notation at their own width.
// Ownership/Lifetime: Pure function checks.
// Links: DESIGN.md#io

#include <gtest/gtest.h>

#include "io/FormatUtils.hpp"

#include <limits>
#include <string>

using namespace litexport::io;

TEST(IoFormat, Integers)
{
    EXPECT_EQ(formatSigned(-1000000), "-1000000");
    EXPECT_EQ(formatSigned(std::numeric_limits<long long>::min()), "-9223372036854775808");
    EXPECT_EQ(formatUnsigned(std::numeric_limits<unsigned long long>::max()),
              "18446744073709551615");
}

TEST(IoFormat, ShortestDoubles)
{
    EXPECT_EQ(formatFloat(3.14, 64), "3.14");
    EXPECT_EQ(formatFloat(1.5, 64), "1.5");
    EXPECT_EQ(formatFloat(0.1, 64), "0.1");
    EXPECT_EQ(formatFloat(10000000000.0, 64), "10000000000");
    EXPECT_EQ(formatFloat(1e21, 64), "1000000000000000000000");
    EXPECT_EQ(formatFloat(0.0, 64), "0");
    EXPECT_EQ(formatFloat(-0.0, 64), "-0");
}

TEST(IoFormat, ShortestFloatsAtSinglePrecision)
{
    EXPECT_EQ(formatFloat(static_cast<double>(3.14f), 32), "3.14");
    EXPECT_EQ(formatFloat(static_cast<double>(3.1416f), 32), "3.1416");
    EXPECT_EQ(formatFloat(static_cast<double>(1e10f), 32), "10000000000");
    // The widened value needs many more digits at double precision.
    EXPECT_NE(formatFloat(static_cast<double>(3.14f), 64), "3.14");
}

TEST(IoFormat, SpecialValues)
{
    EXPECT_EQ(formatFloat(std::numeric_limits<double>::quiet_NaN(), 64), "NaN");
    EXPECT_EQ(formatFloat(std::numeric_limits<double>::infinity(), 64), "+Inf");
    EXPECT_EQ(formatFloat(-std::numeric_limits<double>::infinity(), 32), "-Inf");
}

TEST(IoFormat, LargeValuesUseShortestDigits)
{
    EXPECT_EQ(formatFloat(1e23, 64), "100000000000000000000000");
    EXPECT_EQ(formatFloat(1e30, 64), "1" + std::string(30, '0'));
    EXPECT_EQ(formatFloat(-1e23, 64), "-100000000000000000000000");
    EXPECT_EQ(formatFloat(static_cast<double>(3e10f), 32), "30000000000");
}

TEST(IoFormat, FractionsKeepTheirPoint)
{
    EXPECT_EQ(formatFloat(123.456, 64), "123.456");
    EXPECT_EQ(formatFloat(0.001, 64), "0.001");
    EXPECT_EQ(formatFloat(-2.5e-7, 64), "-0.00000025");
    EXPECT_EQ(formatFloat(12345.0, 64), "12345");
}
