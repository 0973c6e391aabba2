#include "gtest/gtest.h"
#include "validation.hpp"
#include "utilities.hpp"

using nlohmann::json;
using rulechain::validation;
using rulechain::validation_exception;

TEST(ValidationChainTest, RulesAreChainedInDeclarationOrder)
{
  auto chain = validation().string().not_().every().lowercase().not_().null().first("a").last("e").some().equal("l").length(3, 5);

  std::vector<std::string> expected = { "string()", "not.every.lowercase()", "not.null()", "first(\"a\")", "last(\"e\")", "some.equal(\"l\")", "length(3, 5)" };
  EXPECT_EQ(chain.rule_ids(), expected);
}

TEST(ValidationChainTest, BuilderCallsDoNotModifyTheReceiver)
{
  const auto a = validation().number();
  const auto b = a.not_().equal(10);

  EXPECT_EQ(a.rules().size(), 1u);
  EXPECT_EQ(b.rules().size(), 2u);
  EXPECT_TRUE(a.test(10));
  EXPECT_FALSE(b.test(10));
}

TEST(ValidationChainTest, CommonPrefixCanDiverge)
{
  const auto base  = validation().number().positive();
  const auto small = base.less_than(10);
  const auto large = base.greater_than(100);

  EXPECT_TRUE(small.test(5));
  EXPECT_FALSE(large.test(5));
  EXPECT_TRUE(large.test(500));
  EXPECT_FALSE(small.test(500));
  EXPECT_EQ(base.rules().size(), 2u);

  // The shared prefix is the same rule object
  EXPECT_EQ(small.rules()[0], large.rules()[0]);
}

TEST(ValidationChainTest, ModifierSnapshotKeepsPendingModifiers)
{
  const auto pending = validation().number().not_();
  EXPECT_EQ(pending.pending_modifiers().size(), 1u);
  EXPECT_THROW(pending.test(1), std::logic_error);

  const auto finished = pending.even();
  EXPECT_TRUE(finished.pending_modifiers().empty());
  EXPECT_EQ(finished.rules().back()->modifiers().size(), 1u);
  EXPECT_EQ(finished.rules().back()->modifiers()[0]->name(), "not");
}

TEST(ValidationChainTest, UnknownNamesAreRejectedWhenBuilding)
{
  EXPECT_THROW(validation().with_rule("no_such_rule"), std::out_of_range);
  EXPECT_THROW(validation().with_modifier("never"), std::out_of_range);
  EXPECT_THROW(validation().with_rule("between", { 1 }), std::invalid_argument);
  EXPECT_THROW(validation().pattern("(unclosed"), std::invalid_argument);
}

TEST(ValidationChainTest, GenericApplyMatchesTypedMethod)
{
  const auto typed   = validation().between(3, 5);
  const auto generic = validation().apply("between", 3, 5);

  EXPECT_EQ(typed.rule_ids(), generic.rule_ids());
  EXPECT_EQ(generic.test(4), typed.test(4));
}

class ExecutionTest : public ::testing::Test {
protected:
  validation number_chain   = validation().number().between(10, 20).not_().odd();
  validation all_chain      = validation().string().last("o").not_().includes("a");
  validation length_chain   = validation().string().max_length(3);
};

TEST_F(ExecutionTest, TestReturnsFalseForInvalidValue)
{
  EXPECT_FALSE(number_chain.test("Hello"));
  EXPECT_FALSE(number_chain.test(22));
  EXPECT_FALSE(number_chain.test(13));
}

TEST_F(ExecutionTest, TestReturnsTrueForValidValue)
{
  EXPECT_TRUE(number_chain.test(12));
}

TEST_F(ExecutionTest, TestAllReportsEveryFailedRule)
{
  auto failures = all_chain.test_all(100);
  ASSERT_EQ(failures.size(), 2u);
  for (size_t i = 0; i < failures.size(); ++i) {
    EXPECT_EQ(failures[i].failed_rule_ptr(), all_chain.rules()[i]);
    EXPECT_EQ(failures[i].value(), json(100));
  }
}

TEST_F(ExecutionTest, TestAllIsEmptyWhenEveryRulePasses)
{
  EXPECT_TRUE(all_chain.test_all("Hello").empty());
}

TEST_F(ExecutionTest, TestAllKeepsFaultsAsCause)
{
  auto failures = validation().number().includes("a").test_all(10);
  ASSERT_EQ(failures.size(), 1u);
  EXPECT_EQ(failures[0].failed_rule().name(), "includes");
  EXPECT_TRUE(failures[0].fault() != nullptr);
  EXPECT_FALSE(failures[0].fault_message().empty());
}

TEST_F(ExecutionTest, CheckThrowsForInvalidValue)
{
  EXPECT_THROW(length_chain.check("abcd"), validation_exception);
  EXPECT_NO_THROW(length_chain.check("abc"));
}

TEST_F(ExecutionTest, CheckExceptionCarriesRuleAndValue)
{
  try {
    validation().length(1, 3).check("abcd");
    FAIL() << "check should have thrown";
  } catch (const validation_exception &e) {
    EXPECT_EQ(e.failed_rule().name(), "length");
    const rulechain::rule_arguments expected_args = { 1, 3 };
    EXPECT_EQ(e.failed_rule().args(), expected_args);
    EXPECT_EQ(e.value(), json("abcd"));
    EXPECT_FALSE(e.has_cause());
    EXPECT_NE(std::string(e.what()).find("length(1, 3)"), std::string::npos);
  }
}

TEST_F(ExecutionTest, CheckStopsAtFirstFailure)
{
  int evaluated = 0;
  rulechain::predicate_registry registry;
  registry.extend("counted", [&evaluated](const rulechain::rule_arguments &) {
    return rulechain::predicate{ [&evaluated](const json &) {
                                  ++evaluated;
                                  return true;
                                },
                                 nullptr };
  });

  auto chain = validation(registry).apply("counted").number().apply("counted");
  EXPECT_THROW(chain.check("text"), validation_exception);
  EXPECT_EQ(evaluated, 1);

  auto failures = chain.test_all("text");
  EXPECT_EQ(failures.size(), 1u);
  EXPECT_EQ(evaluated, 3);
}

TEST_F(ExecutionTest, FaultResolvedThroughNegation)
{
  // includes faults on a number; not turns the fault into a pass
  auto chain = validation().not_().includes("2");
  EXPECT_TRUE(chain.test(2));
  EXPECT_NO_THROW(chain.check(2));
  EXPECT_TRUE(chain.test_all(2).empty());

  auto plain = validation().includes("2");
  EXPECT_FALSE(plain.test(2));
  EXPECT_THROW(plain.check(2), validation_exception);
}

TEST_F(ExecutionTest, StrategiesAgree)
{
  const std::vector<validation> chains = { number_chain, all_chain, length_chain, validation().not_().every().even(), validation().some().not_().exact(2),
                                           validation().not_().not_().positive(), validation().first(2).not_().includes(3) };
  const std::vector<json> values = { json(12), json(13), json("Hello"), json("abc"), json::array({ 2, 2, 3 }), json::array({ 2, 4 }), json(nullptr), rulechain::make_undefined(), json::object() };

  for (const auto &chain: chains) {
    for (const auto &value: values) {
      const bool passed       = chain.test(value);
      const bool none_failed  = chain.test_all(value).empty();
      bool check_passed       = true;
      try {
        chain.check(value);
      } catch (const validation_exception &) {
        check_passed = false;
      }
      EXPECT_EQ(passed, none_failed) << "value " << rulechain::format_argument(value);
      EXPECT_EQ(passed, check_passed) << "value " << rulechain::format_argument(value);
    }
  }
}
