#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

#include "config.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace sparqlkit {

TEST(QueryOptionsTest, DefaultsAreAbsent) {
  QueryOptions options;
  EXPECT_FALSE(options.distinct.has_value());
  EXPECT_FALSE(options.reduced.has_value());
  EXPECT_FALSE(options.order_by.has_value());
  EXPECT_FALSE(options.offset.has_value());
  EXPECT_FALSE(options.limit.has_value());
  EXPECT_FALSE(options.is_distinct());
  EXPECT_FALSE(options.is_reduced());
  EXPECT_FALSE(options.has_order_by());
}

TEST(QueryOptionsTest, BuilderSetsEveryField) {
  auto options = make_options()
                     .with_distinct()
                     .with_reduced(false)
                     .with_order_by({"name", "age"})
                     .with_offset(5)
                     .with_limit(50)
                     .build();

  EXPECT_TRUE(options.is_distinct());
  ASSERT_TRUE(options.reduced.has_value());
  EXPECT_FALSE(options.is_reduced());
  EXPECT_TRUE(options.has_order_by());
  EXPECT_EQ(options.order_by->size(), 2u);
  EXPECT_EQ(options.offset, 5);
  EXPECT_EQ(options.limit, 50);
}

TEST(QueryOptionsTest, EmptyOrderByIsNotAnOrdering) {
  auto options = make_options().with_order_by({}).build();
  EXPECT_TRUE(options.order_by.has_value());
  EXPECT_FALSE(options.has_order_by());
}

TEST(CoerceIntegerTest, CleanIntegers) {
  auto ten = coerce_integer("10");
  EXPECT_EQ(ten.value, 10);
  EXPECT_TRUE(ten.exact);

  auto padded = coerce_integer("  +42 ");
  EXPECT_EQ(padded.value, 42);
  EXPECT_TRUE(padded.exact);

  auto negative = coerce_integer("-3");
  EXPECT_EQ(negative.value, -3);
  EXPECT_TRUE(negative.exact);
}

TEST(CoerceIntegerTest, LeadingDigitsOnly) {
  auto partial = coerce_integer("7 rows");
  EXPECT_EQ(partial.value, 7);
  EXPECT_FALSE(partial.exact);

  auto decimal = coerce_integer("12.9");
  EXPECT_EQ(decimal.value, 12);
  EXPECT_FALSE(decimal.exact);
}

TEST(CoerceIntegerTest, NonNumericIsZero) {
  EXPECT_EQ(coerce_integer("abc").value, 0);
  EXPECT_FALSE(coerce_integer("abc").exact);
  EXPECT_EQ(coerce_integer("").value, 0);
  EXPECT_EQ(coerce_integer("-").value, 0);
}

TEST(CoerceIntegerTest, Saturates) {
  EXPECT_EQ(coerce_integer("99999999999999999999").value,
            std::numeric_limits<int64_t>::max());
  EXPECT_EQ(coerce_integer("-99999999999999999999").value,
            std::numeric_limits<int64_t>::min());
  EXPECT_EQ(coerce_integer("-9223372036854775808").value,
            std::numeric_limits<int64_t>::min());
  EXPECT_TRUE(coerce_integer("-9223372036854775808").exact);
}

TEST(StringUtilsTest, CaseAndJoin) {
  EXPECT_EQ(to_upper("select"), "SELECT");
  EXPECT_EQ(to_lower("AsK"), "ask");
  EXPECT_EQ(join({"a", "b", "c"}, " "), "a b c");
  EXPECT_EQ(join({}, " "), "");
}

TEST(LoggerTest, LevelRoundTrip) {
  auto& logger = Logger::getInstance();
  const LogLevel saved = logger.getLevel();

  logger.setLevel(LogLevel::WARN);
  EXPECT_EQ(logger.getLevel(), LogLevel::WARN);
  logger.setLevel(LogLevel::OFF);
  EXPECT_EQ(logger.getLevel(), LogLevel::OFF);

  logger.setLevel(saved);
}

}  // namespace sparqlkit
