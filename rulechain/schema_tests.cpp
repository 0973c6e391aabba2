#include "gtest/gtest.h"
#include "validation.hpp"
#include "utilities.hpp"

using nlohmann::json;
using rulechain::validation;
using rulechain::validation_exception;

class SchemaTest : public ::testing::Test {
protected:
  validation nested_schema()
  {
    // clang-format off
    return validation().schema({
      { "one", validation().equal(1) },
      { "two", validation().schema({
          { "three", validation().equal(3) },
          { "four", validation().equal(4) },
          { "five", validation().schema({
              { "six", validation().equal(6) }
            }) }
        }) }
    });
    // clang-format on
  }

  validation user_schema()
  {
    // clang-format off
    return validation().schema({
      { "id", validation().number().positive() },
      { "name", validation().string().min_length(4) }
    });
    // clang-format on
  }
};

TEST_F(SchemaTest, PassesWhenEveryFieldPasses)
{
  auto chain = user_schema();
  EXPECT_TRUE(chain.test(json{ { "id", 1 }, { "name", "Sarah" } }));
  EXPECT_NO_THROW(chain.check(json{ { "id", 1 }, { "name", "Sarah" } }));
  EXPECT_TRUE(chain.test_all(json{ { "id", 1 }, { "name", "Sarah" } }).empty());
}

TEST_F(SchemaTest, FailsForMissingOrInvalidFields)
{
  auto chain = user_schema();
  EXPECT_FALSE(chain.test(json{ { "id", -1 }, { "name", "Sarah" } }));
  EXPECT_FALSE(chain.test(json{ { "id", 1 } }));
  EXPECT_FALSE(chain.test(json::object()));
  EXPECT_FALSE(chain.test(12));
}

TEST_F(SchemaTest, FieldFailuresAreCausesWithTarget)
{
  try {
    user_schema().check(json{ { "id", "abc" }, { "name", "Al" } });
    FAIL() << "check should have thrown";
  } catch (const validation_exception &e) {
    EXPECT_EQ(e.failed_rule().name(), "schema");
    ASSERT_EQ(e.causes().size(), 3u);

    EXPECT_EQ(e.causes()[0].failed_rule().name(), "number");
    EXPECT_EQ(e.causes()[0].target(), "id");
    EXPECT_EQ(e.causes()[0].value(), json("abc"));

    EXPECT_EQ(e.causes()[1].failed_rule().name(), "positive");
    EXPECT_EQ(e.causes()[1].target(), "id");

    EXPECT_EQ(e.causes()[2].failed_rule().name(), "min_length");
    EXPECT_EQ(e.causes()[2].target(), "name");
    EXPECT_EQ(e.causes()[2].value(), json("Al"));
  }
}

TEST_F(SchemaTest, NestedFailuresAreAggregated)
{
  auto failures = nested_schema().test_all(json{ { "one", "Hello" } });
  ASSERT_EQ(failures.size(), 1u);

  const auto &top = failures[0];
  EXPECT_EQ(top.failed_rule().name(), "schema");
  ASSERT_EQ(top.causes().size(), 2u);

  EXPECT_EQ(top.causes()[0].failed_rule().name(), "equal");
  EXPECT_EQ(top.causes()[0].target(), "one");
  EXPECT_EQ(top.causes()[0].value(), json("Hello"));

  const auto &two = top.causes()[1];
  EXPECT_EQ(two.failed_rule().name(), "schema");
  EXPECT_EQ(two.target(), "two");
  EXPECT_TRUE(rulechain::is_undefined(two.value()));
  ASSERT_EQ(two.causes().size(), 3u);
  EXPECT_EQ(two.causes()[0].target(), "three");
  EXPECT_EQ(two.causes()[1].target(), "four");

  const auto &five = two.causes()[2];
  EXPECT_EQ(five.failed_rule().name(), "schema");
  EXPECT_EQ(five.target(), "five");
  ASSERT_EQ(five.causes().size(), 1u);
  EXPECT_EQ(five.causes()[0].target(), "six");
  EXPECT_EQ(five.causes()[0].failed_rule().name(), "equal");
}

TEST_F(SchemaTest, NestedSchemaPassesWithCompleteDocument)
{
  const json document = { { "one", 1 }, { "two", { { "three", 3 }, { "four", 4 }, { "five", { { "six", 6 } } } } } };
  EXPECT_TRUE(nested_schema().test(document));
  EXPECT_NO_THROW(nested_schema().check(document));
}

TEST_F(SchemaTest, FieldsAreCheckedInDeclarationOrder)
{
  // clang-format off
  auto chain = validation().schema({
    { "zeta", validation().number() },
    { "alpha", validation().number() }
  });
  // clang-format on

  auto failures = chain.test_all(json::object());
  ASSERT_EQ(failures.size(), 1u);
  ASSERT_EQ(failures[0].causes().size(), 2u);
  EXPECT_EQ(failures[0].causes()[0].target(), "zeta");
  EXPECT_EQ(failures[0].causes()[1].target(), "alpha");
}

TEST_F(SchemaTest, NegatedSchemaPassesWhenSchemaFails)
{
  auto chain = validation().not_().schema({ { "id", validation().number() } });
  EXPECT_TRUE(chain.test(json{ { "id", "abc" } }));
  EXPECT_FALSE(chain.test(json{ { "id", 1 } }));
  EXPECT_NO_THROW(chain.check(json::object()));
}

TEST_F(SchemaTest, RuleIdDescribesFields)
{
  auto chain = validation().schema({ { "id", validation().number().positive() } });
  ASSERT_EQ(chain.rules().size(), 1u);

  const json expected = { { "id", json::array({ "number()", "positive()" }) } };
  ASSERT_EQ(chain.rules()[0]->args().size(), 1u);
  EXPECT_EQ(chain.rules()[0]->args()[0], expected);
}

TEST_F(SchemaTest, SchemaOverArrayOfObjects)
{
  auto chain = validation().array().every().schema({ { "id", validation().integer() } });
  EXPECT_TRUE(chain.test(json::array({ json{ { "id", 1 } }, json{ { "id", 2 } } })));
  EXPECT_FALSE(chain.test(json::array({ json{ { "id", 1 } }, json{ { "id", 2.5 } } })));
}
