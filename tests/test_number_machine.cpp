#include <drip_json/drip_json.hpp>
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <vector>

using namespace drip::json;

static Outcome run(StringView text) {
  NumberMachine m;
  Outcome out;
  for (char32_t c : text) {
    out = m.feed(c);
    if (out.is_terminal())
      break;
  }
  return out;
}

static double number_of(StringView text) {
  Outcome out = run(text);
  EXPECT_TRUE(out.is_partial()) << "no value for input";
  return out.is_partial() ? out.value().as_number() : std::nan("");
}

static Error error_of(StringView text) {
  Outcome out = run(text);
  return out.error();
}

// 12.45 yields 1, 12, (pending), 12.4, 12.45
TEST(NumberMachine, PartialValuesAsDigitsArrive) {
  NumberMachine m;
  std::vector<Outcome> outs;
  for (char32_t c : StringView(U"12.45"))
    outs.push_back(m.feed(c));

  ASSERT_EQ(outs.size(), 5u);
  ASSERT_TRUE(outs[0].is_partial());
  EXPECT_DOUBLE_EQ(outs[0].value().as_number(), 1.0);
  ASSERT_TRUE(outs[1].is_partial());
  EXPECT_DOUBLE_EQ(outs[1].value().as_number(), 12.0);
  EXPECT_TRUE(outs[2].is_pending());
  ASSERT_TRUE(outs[3].is_partial());
  EXPECT_DOUBLE_EQ(outs[3].value().as_number(), 12.4);
  ASSERT_TRUE(outs[4].is_partial());
  EXPECT_DOUBLE_EQ(outs[4].value().as_number(), 12.45);
  EXPECT_FALSE(m.finished());
}

TEST(NumberMachine, ZeroIsAValue) {
  Outcome out = run(U"0");
  ASSERT_TRUE(out.is_partial());
  EXPECT_TRUE(out.value().is_number());
  EXPECT_EQ(out.value().as_number(), 0.0);
}

TEST(NumberMachine, NegativeZero) {
  const double v = number_of(U"-0");
  EXPECT_EQ(v, 0.0);
  EXPECT_TRUE(std::signbit(v));
}

TEST(NumberMachine, ValidForms) {
  EXPECT_DOUBLE_EQ(number_of(U"123"), 123.0);
  EXPECT_DOUBLE_EQ(number_of(U"-5"), -5.0);
  EXPECT_DOUBLE_EQ(number_of(U"3.14"), 3.14);
  EXPECT_DOUBLE_EQ(number_of(U"-0.5"), -0.5);
  EXPECT_DOUBLE_EQ(number_of(U"1e10"), 1e10);
  EXPECT_DOUBLE_EQ(number_of(U"1E+2"), 100.0);
  EXPECT_DOUBLE_EQ(number_of(U"2.5e-3"), 2.5e-3);
  EXPECT_DOUBLE_EQ(number_of(U"-1.5e-3"), -1.5e-3);
  EXPECT_DOUBLE_EQ(number_of(U"0e0"), 0.0);
  EXPECT_DOUBLE_EQ(number_of(U"10.0010"), 10.001);
}

TEST(NumberMachine, NeverDone) {
  NumberMachine m;
  for (char32_t c : StringView(U"-12.5e+7")) {
    Outcome out = m.feed(c);
    EXPECT_FALSE(out.is_done());
    EXPECT_FALSE(out.is_rejected());
  }
}

TEST(NumberMachine, SignAndMarkersArePending) {
  EXPECT_TRUE(run(U"-").is_pending());
  EXPECT_TRUE(run(U"1.").is_pending());
  EXPECT_TRUE(run(U"1e").is_pending());
  EXPECT_TRUE(run(U"1e-").is_pending());
  EXPECT_TRUE(run(U"1.5E+").is_pending());
}

TEST(NumberMachine, LeadingZeroRejected) {
  EXPECT_EQ(error_of(U"01"), Error::LeadingZeroViolation);
  EXPECT_EQ(error_of(U"00"), Error::LeadingZeroViolation);
  EXPECT_EQ(error_of(U"-007"), Error::LeadingZeroViolation);
}

TEST(NumberMachine, MalformedRejected) {
  EXPECT_EQ(error_of(U".45"), Error::InvalidNumberFormat);
  EXPECT_EQ(error_of(U"+1"), Error::InvalidNumberFormat);
  EXPECT_EQ(error_of(U"--1"), Error::InvalidNumberFormat);
  EXPECT_EQ(error_of(U"1..2"), Error::InvalidNumberFormat);
  EXPECT_EQ(error_of(U"1.2.3"), Error::InvalidNumberFormat);
  EXPECT_EQ(error_of(U"1.e5"), Error::InvalidNumberFormat);
  EXPECT_EQ(error_of(U"1e-0.2"), Error::InvalidNumberFormat);
  EXPECT_EQ(error_of(U"1e5e"), Error::InvalidNumberFormat);
  EXPECT_EQ(error_of(U"1e+-2"), Error::InvalidNumberFormat);
  EXPECT_EQ(error_of(U"12x"), Error::InvalidNumberFormat);
  EXPECT_EQ(error_of(U"-a"), Error::InvalidNumberFormat);
}

TEST(NumberMachine, DelimitersAreNotNumberInput) {
  EXPECT_EQ(error_of(U"1,"), Error::InvalidNumberFormat);
  EXPECT_EQ(error_of(U"1]"), Error::InvalidNumberFormat);
  EXPECT_EQ(error_of(U"1 "), Error::InvalidNumberFormat);
}

TEST(NumberMachine, OutOfRangeMagnitudes) {
  EXPECT_EQ(number_of(U"1e400"), std::numeric_limits<double>::infinity());
  EXPECT_EQ(number_of(U"-1e400"), -std::numeric_limits<double>::infinity());
  EXPECT_EQ(number_of(U"1e-400"), 0.0);
  EXPECT_EQ(number_of(U"0.1e-400"), 0.0);
}

TEST(NumberMachine, VeryLongLiterals) {
  const double inf = std::numeric_limits<double>::infinity();
  EXPECT_EQ(number_of(U"1" + String(20000, U'0')), inf);
  EXPECT_EQ(number_of(U"-" + String(20000, U'9') + U".5"), -inf);
  EXPECT_EQ(number_of(U"0." + String(20000, U'0')), 0.0);
  EXPECT_DOUBLE_EQ(number_of(U"1" + String(900, U'0') + U"e-900"), 1.0);
  EXPECT_DOUBLE_EQ(number_of(U"0.5" + String(900, U'0') + U"1"), 0.5);
  EXPECT_DOUBLE_EQ(number_of(U"2.5" + String(2000, U'0')), 2.5);
}

TEST(NumberMachine, ExponentLeadingZeros) {
  EXPECT_DOUBLE_EQ(number_of(U"1e" + String(30, U'0') + U"5"), 1e5);
  EXPECT_DOUBLE_EQ(number_of(U"3e-000"), 3.0);
  EXPECT_EQ(number_of(U"1e" + String(40, U'9')),
            std::numeric_limits<double>::infinity());
  EXPECT_EQ(number_of(U"0e" + String(40, U'9')), 0.0);
}
