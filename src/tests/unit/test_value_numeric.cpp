//===----------------------------------------------------------------------===//
//
// Part of the wasmdbg project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_value_numeric.cpp
// Purpose: Exercise tagged values and the wrapping/checked numeric helpers.
// Key invariants: Floats compare by bit pattern; integer arithmetic wraps;
//                 checked operations report traps instead of invoking UB.
// Ownership/Lifetime: Pure value tests.
// Links: src/wasm/Value.hpp, src/wasm/Numeric.hpp
//
//===----------------------------------------------------------------------===//
#include "tests/TestHarness.hpp"
#include "wasm/Numeric.hpp"
#include "wasm/Value.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

using namespace wasmdbg::wasm;
namespace num = wasmdbg::wasm::numeric;

TEST(Value, DefaultIsI32Zero)
{
    Value v;
    EXPECT_TRUE(v.type() == ValueType::I32);
    EXPECT_EQ(v.as<int32_t>(), 0);
}

TEST(Value, ViewsNeverCoerceBetweenKinds)
{
    Value v(int64_t{7});
    EXPECT_FALSE(v.as<int32_t>().has_value());
    EXPECT_FALSE(v.as<double>().has_value());
    EXPECT_EQ(v.as<uint64_t>(), uint64_t{7});
}

TEST(Value, FloatEqualityIsBitwise)
{
    EXPECT_NE(Value(0.0f), Value(-0.0f));
    const Value nan = Value(F64::fromBits(0x7FF8000000000001ULL));
    EXPECT_EQ(nan, Value(F64::fromBits(0x7FF8000000000001ULL)));
    EXPECT_NE(nan, Value(F64::fromBits(0x7FF8000000000000ULL)));
}

TEST(Value, ParseIntegersWithRadixAndSign)
{
    EXPECT_EQ(Value::parse("42", ValueType::I32), Value(int32_t{42}));
    EXPECT_EQ(Value::parse("-1", ValueType::I32), Value(int32_t{-1}));
    EXPECT_EQ(Value::parse("0x10", ValueType::I64), Value(int64_t{16}));
    EXPECT_EQ(Value::parse("0b101", ValueType::I32), Value(int32_t{5}));
    EXPECT_EQ(Value::parse("0o17", ValueType::I32), Value(int32_t{15}));
    // Wider than the kind: truncated to 32 bits.
    EXPECT_EQ(Value::parse("0x100000001", ValueType::I32), Value(int32_t{1}));
    EXPECT_FALSE(Value::parse("12abc", ValueType::I32).has_value());
    EXPECT_FALSE(Value::parse("", ValueType::I64).has_value());
}

TEST(Value, ParseFloats)
{
    EXPECT_EQ(Value::parse("1.5", ValueType::F32), Value(1.5f));
    EXPECT_EQ(Value::parse("-2.25", ValueType::F64), Value(-2.25));
    auto nan = Value::parse("nan", ValueType::F64);
    ASSERT_TRUE(nan.has_value());
    EXPECT_TRUE(std::isnan(*nan->as<double>()));
    EXPECT_FALSE(Value::parse("1.5x", ValueType::F32).has_value());
}

TEST(Value, Formatting)
{
    EXPECT_EQ(toString(Value(int32_t{42})), std::string("i32 : 0x0000002a = 42"));
    EXPECT_EQ(toString(Value(int32_t{-1})), std::string("i32 : 0xffffffff = 4294967295 = -1"));
    EXPECT_EQ(toString(Value(int64_t{255})), std::string("i64 : 0x00000000000000ff = 255"));
    EXPECT_EQ(toString(ValueType::F64), std::string_view("f64"));
}

TEST(Numeric, IntegerArithmeticWraps)
{
    EXPECT_EQ(num::wrappingAdd<int32_t>(std::numeric_limits<int32_t>::max(), 1),
              std::numeric_limits<int32_t>::min());
    EXPECT_EQ(num::wrappingSub<uint32_t>(0U, 1U), 0xFFFFFFFFU);
    EXPECT_EQ(num::wrappingMul<int64_t>(std::numeric_limits<int64_t>::min(), -1),
              std::numeric_limits<int64_t>::min());
}

TEST(Numeric, CheckedDivisionAndRemainder)
{
    auto zero = num::div<int32_t>(1, 0);
    ASSERT_FALSE(zero.hasValue());
    EXPECT_TRUE(zero.error() == ArithError::DivisionByZero);

    auto overflow = num::div<int32_t>(std::numeric_limits<int32_t>::min(), -1);
    ASSERT_FALSE(overflow.hasValue());
    EXPECT_TRUE(overflow.error() == ArithError::SignedOverflow);

    auto remainder = num::rem<int32_t>(std::numeric_limits<int32_t>::min(), -1);
    ASSERT_TRUE(remainder.hasValue());
    EXPECT_EQ(remainder.value(), 0);

    EXPECT_EQ(num::div<uint32_t>(0xFFFFFFFFU, 2U).value(), 0x7FFFFFFFU);
    EXPECT_EQ(num::rem<int32_t>(-7, 2).value(), -1);
}

TEST(Numeric, ShiftsUseCountModuloWidth)
{
    EXPECT_EQ(num::shl<uint32_t>(1U, 33U), 2U);
    EXPECT_EQ(num::shrS<int32_t>(-8, 1), -4);
    EXPECT_EQ(num::shrU<uint32_t>(0x80000000U, 31U), 1U);
    EXPECT_EQ(num::rotl<uint32_t>(0x80000001U, 1U), 3U);
    EXPECT_EQ(num::rotr<uint64_t>(1ULL, 1ULL), 0x8000000000000000ULL);
}

TEST(Numeric, BitCounting)
{
    EXPECT_EQ(num::clz<uint32_t>(0U), 32U);
    EXPECT_EQ(num::ctz<uint64_t>(0ULL), 64ULL);
    EXPECT_EQ(num::popcnt<uint32_t>(0xF0F0U), 8U);
}

TEST(Numeric, ExtensionAndWrapping)
{
    EXPECT_EQ((num::wrapTo<int32_t, int64_t>(0x1'0000'0005LL)), 5);
    EXPECT_EQ((num::signExtendLow<int32_t, 8>(0x80)), -128);
    EXPECT_EQ((num::signExtendLow<int64_t, 32>(0xFFFFFFFFLL)), -1LL);
    EXPECT_EQ((num::extendTo<int64_t, int32_t>(-1)), -1LL);
    EXPECT_EQ((num::extendTo<uint64_t, uint32_t>(0xFFFFFFFFU)), 0xFFFFFFFFULL);
}

TEST(Numeric, FloatMinMaxAndSignOps)
{
    EXPECT_TRUE(std::signbit(num::fmin(0.0, -0.0)));
    EXPECT_FALSE(std::signbit(num::fmax(-0.0f, 0.0f)));
    EXPECT_TRUE(std::isnan(num::fmin(1.0, std::numeric_limits<double>::quiet_NaN())));
    EXPECT_EQ(num::nearest(2.5), 2.0);
    EXPECT_EQ(num::nearest(3.5f), 4.0f);
    EXPECT_EQ(num::fneg(F32::fromFloat(1.0f)), F32::fromFloat(-1.0f));
    EXPECT_EQ(num::fabs(F64::fromFloat(-3.0)), F64::fromFloat(3.0));
    EXPECT_EQ(num::copysign(F32::fromFloat(2.0f), F32::fromFloat(-0.0f)), F32::fromFloat(-2.0f));
}

TEST(Numeric, CheckedTruncation)
{
    EXPECT_EQ((num::truncChecked<int32_t, double>(-2.9).value()), -2);
    EXPECT_EQ((num::truncChecked<uint32_t, float>(4294967040.0f).value()), 4294967040U);
    EXPECT_FALSE((num::truncChecked<int32_t, double>(2147483648.0).hasValue()));
    EXPECT_FALSE((num::truncChecked<uint32_t, double>(-1.0).hasValue()));
    EXPECT_TRUE((num::truncChecked<uint32_t, double>(-0.5).hasValue()));
    auto nan = num::truncChecked<int64_t, double>(std::numeric_limits<double>::quiet_NaN());
    ASSERT_FALSE(nan.hasValue());
    EXPECT_TRUE(nan.error() == ArithError::InvalidConversion);
}

TEST(Numeric, LittleEndianRoundTripOfMixedWidths)
{
    uint8_t buffer[8] = {};
    num::storeLittleEndian<uint32_t>(0x11223344U, buffer);
    EXPECT_EQ(buffer[0], 0x44);
    EXPECT_EQ(buffer[3], 0x11);
    EXPECT_EQ(num::loadLittleEndian<uint16_t>(buffer + 1), 0x2233);
}

int main(int argc, char **argv)
{
    wasmdbg_test::init(&argc, argv);
    return wasmdbg_test::run_all_tests();
}
