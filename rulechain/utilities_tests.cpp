#include "gtest/gtest.h"
#include "utilities.hpp"
#include "validation.hpp"
#include <cmath>
#include <limits>

using nlohmann::json;

TEST(UtilitiesTest, UndefinedIsNotNull)
{
  const auto undefined = rulechain::make_undefined();
  EXPECT_TRUE(rulechain::is_undefined(undefined));
  EXPECT_FALSE(rulechain::is_undefined(json(nullptr)));
  EXPECT_FALSE(rulechain::strict_equal(undefined, json(nullptr)));
  EXPECT_TRUE(rulechain::loose_equal(undefined, json(nullptr)));
  EXPECT_TRUE(rulechain::strict_equal(undefined, rulechain::make_undefined()));
}

TEST(UtilitiesTest, DisplayString)
{
  EXPECT_EQ(rulechain::to_display_string("abc"), "abc");
  EXPECT_EQ(rulechain::to_display_string(true), "true");
  EXPECT_EQ(rulechain::to_display_string(nullptr), "null");
  EXPECT_EQ(rulechain::to_display_string(rulechain::make_undefined()), "undefined");
  EXPECT_EQ(rulechain::to_display_string(12), "12");
  EXPECT_EQ(rulechain::to_display_string(4.0), "4");
  EXPECT_EQ(rulechain::to_display_string(json::array({ 1, "a", nullptr, 2 })), "1,a,,2");
  EXPECT_EQ(rulechain::to_display_string(json::object()), "[object Object]");
}

TEST(UtilitiesTest, FormatArgument)
{
  EXPECT_EQ(rulechain::format_argument("a"), "\"a\"");
  EXPECT_EQ(rulechain::format_argument(3), "3");
  EXPECT_EQ(rulechain::format_argument(2.5), "2.5");
  EXPECT_EQ(rulechain::format_argument(rulechain::make_undefined()), "undefined");
  EXPECT_EQ(rulechain::format_argument(json::array({ 1, 2 })), "[1,2]");
}

TEST(UtilitiesTest, LargeAndSmallNumbers)
{
  EXPECT_EQ(rulechain::format_argument(1e20), "100000000000000000000");
  EXPECT_EQ(rulechain::format_argument(-1e20), "-100000000000000000000");
  EXPECT_EQ(rulechain::format_argument(1e21), "1e+21");
  EXPECT_EQ(rulechain::format_argument(1.5e300), "1.5e+300");
  EXPECT_EQ(rulechain::format_argument(9007199254740992.0), "9007199254740992");
  EXPECT_EQ(rulechain::to_display_string(1e20), "100000000000000000000");
  EXPECT_EQ(rulechain::to_display_string(123.456), "123.456");
  EXPECT_EQ(rulechain::to_display_string(0.000001), "0.000001");
  EXPECT_EQ(rulechain::to_display_string(1e-7), "1e-7");
  EXPECT_EQ(rulechain::to_display_string(-0.0), "0");

  EXPECT_TRUE(rulechain::loose_equal(json::array({ 1e20 }), "100000000000000000000"));
  EXPECT_TRUE(rulechain::validation().pattern("^1").test(1e20));
  EXPECT_EQ(rulechain::validation().equal(1e20).rule_ids()[0], "equal(100000000000000000000)");
}

TEST(UtilitiesTest, NumericCoercion)
{
  EXPECT_EQ(rulechain::to_number(" 12 "), 12.0);
  EXPECT_EQ(rulechain::to_number(""), 0.0);
  EXPECT_EQ(rulechain::to_number(true), 1.0);
  EXPECT_EQ(rulechain::to_number(nullptr), 0.0);
  EXPECT_EQ(rulechain::to_number(json::array()), 0.0);
  EXPECT_EQ(rulechain::to_number(json::array({ "7" })), 7.0);
  EXPECT_EQ(rulechain::to_number("-Infinity"), -std::numeric_limits<double>::infinity());
  EXPECT_TRUE(std::isnan(rulechain::to_number("12abc")));
  EXPECT_TRUE(std::isnan(rulechain::to_number(json::array({ 1, 2 }))));
  EXPECT_TRUE(std::isnan(rulechain::to_number(json::object())));
  EXPECT_TRUE(std::isnan(rulechain::to_number(rulechain::make_undefined())));
}

TEST(UtilitiesTest, LooseAndStrictEquality)
{
  EXPECT_TRUE(rulechain::loose_equal("1", 1));
  EXPECT_TRUE(rulechain::loose_equal(false, 0));
  EXPECT_FALSE(rulechain::loose_equal(nullptr, 0));
  EXPECT_TRUE(rulechain::loose_equal(json::array({ 1 }), "1"));

  EXPECT_FALSE(rulechain::strict_equal("1", 1));
  EXPECT_TRUE(rulechain::strict_equal(1, 1.0));
  EXPECT_FALSE(rulechain::strict_equal(false, 0));
}

TEST(UtilitiesTest, SequencesSplitByCodePoint)
{
  auto characters = rulechain::as_sequence("a\xC3\xA7" "b");
  ASSERT_TRUE(characters.has_value());
  ASSERT_EQ(characters->size(), 3u);
  EXPECT_EQ(characters->at(1), json("\xC3\xA7"));

  EXPECT_EQ(rulechain::as_sequence(json::array({ 1, 2 }))->size(), 2u);
  EXPECT_FALSE(rulechain::as_sequence(12).has_value());
  EXPECT_FALSE(rulechain::as_sequence(json::object()).has_value());
}

TEST(UtilitiesTest, LengthAndElementAccess)
{
  EXPECT_EQ(rulechain::length_of("a\xC3\xA7" "b"), 3u);
  EXPECT_EQ(rulechain::length_of(json::array({ 1, 2 })), 2u);
  EXPECT_FALSE(rulechain::length_of(5).has_value());
  EXPECT_THROW(rulechain::length_of(nullptr), std::invalid_argument);
  EXPECT_THROW(rulechain::length_of(rulechain::make_undefined()), std::invalid_argument);

  EXPECT_EQ(rulechain::element_at("abc", 2), json("c"));
  EXPECT_TRUE(rulechain::is_undefined(rulechain::element_at("abc", 3)));
  EXPECT_TRUE(rulechain::is_undefined(rulechain::element_at(12, 0)));
  EXPECT_THROW(rulechain::element_at(nullptr, 0), std::invalid_argument);
}

TEST(UtilitiesTest, YamlScalarsBecomeTypedJson)
{
  auto node = YAML::Load("{ int: 3, float: 1.5, flag: true, nothing: ~, text: hello, quoted: '42' }");
  auto document = rulechain::yaml_to_json(node);

  EXPECT_EQ(document["int"], json(3));
  EXPECT_EQ(document["float"], json(1.5));
  EXPECT_EQ(document["flag"], json(true));
  EXPECT_TRUE(document["nothing"].is_null());
  EXPECT_EQ(document["text"], json("hello"));
  EXPECT_EQ(document["quoted"], json("42"));
}

TEST(UtilitiesTest, FileContents)
{
  EXPECT_FALSE(rulechain::get_file_contents<std::string>(fs::temp_directory_path() / "rulechain_no_such_file.txt").has_value());
}
