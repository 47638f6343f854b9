#include <gtest/gtest.h>

#include <vector>

#include "errors.h"
#include "evaluators.h"
#include "multiset_function.h"
#include "test_helpers.h"

namespace rollr {
namespace {

using testing_helpers::literal;

MultisetFunction<Outcome> union_sum() {
  return MultisetFunction<Outcome>(
      2, [](const std::vector<ExpressionPtr> &vars) {
        return MultisetFunctionBody<Outcome>{
            {multiset_union({vars[0], vars[1]})}, sum_evaluator()};
      });
}

TEST(MultisetFunctionTest, BindsInputsToVariables) {
  Counts<Outcome> result =
      union_sum().evaluate({literal({1, 2}), literal({2, 3})});
  EXPECT_EQ(result, Counts<Outcome>::from_pairs({{6, 1}}));
}

TEST(MultisetFunctionTest, ReusableAcrossInputs) {
  MultisetFunction<Outcome> f = union_sum();
  ExpressionPtr die = source_expression(make_pool(standard_die(2), 1));
  Counts<Outcome> result = f.evaluate({die, literal({2})});
  EXPECT_EQ(result, Counts<Outcome>::from_pairs({{3, 1}, {2, 1}}));
  EXPECT_EQ(f.evaluate({literal({5}), literal({})}),
            Counts<Outcome>::from_pairs({{5, 1}}));
}

TEST(MultisetFunctionTest, RejectsWrongInputCount) {
  EXPECT_THROW(union_sum().evaluate({literal({1})}), MultisetArityError);
}

TEST(MultisetFunctionTest, RejectsMultiSlotInputs) {
  DealPtr deal = make_deal(make_deck({1, 2, 3}, 1), std::vector<int>{1, 1});
  EXPECT_THROW(union_sum().evaluate({source_expression(deal), literal({1})}),
               MultisetBindingError);
}

TEST(MultisetFunctionTest, VariableOutsideArityIsReported) {
  MultisetFunction<Outcome> f(1, [](const std::vector<ExpressionPtr> &) {
    return MultisetFunctionBody<Outcome>{{multiset_variable(2)},
                                         sum_evaluator()};
  });
  EXPECT_THROW(f.evaluate({literal({1})}), MultisetBindingError);
}

TEST(MultisetFunctionTest, DefinitionMustReturnEvaluator) {
  EXPECT_THROW(MultisetFunction<Outcome>(
                   1,
                   [](const std::vector<ExpressionPtr> &vars) {
                     return MultisetFunctionBody<Outcome>{{vars[0]}, nullptr};
                   }),
               std::invalid_argument);
}

} // namespace
} // namespace rollr
