#include <gtest/gtest.h>
#include "symbolic/symbolic_expression.hpp"
#include <map>

using namespace witgen;

class SymbolicExpressionTest : public ::testing::Test {
protected:
    void SetUp() override {
        x_cell_ = Cell("X", 0, 0);
        y_cell_ = Cell("Y", 1, 0);
        x_ = SymbolicExpression::from_symbol(x_cell_, std::nullopt);
        y_ = SymbolicExpression::from_symbol(y_cell_, std::nullopt);
    }

    static SymbolicExpression num(uint64_t v) { return SymbolicExpression(BFieldElement(v)); }

    Cell x_cell_;
    Cell y_cell_;
    SymbolicExpression x_;
    SymbolicExpression y_;
};

TEST_F(SymbolicExpressionTest, DefaultIsZero) {
    SymbolicExpression zero;
    EXPECT_TRUE(zero.is_known_zero());
    EXPECT_EQ(zero.type(), SymbolicExpression::Type::Concrete);
    EXPECT_EQ(zero.to_string(), "0");
}

TEST_F(SymbolicExpressionTest, ConstantFolding) {
    EXPECT_EQ((num(2) + num(3)).try_to_number(), std::optional<BFieldElement>(BFieldElement(5)));
    EXPECT_EQ((num(2) * num(3)).try_to_number(), std::optional<BFieldElement>(BFieldElement(6)));
    EXPECT_EQ((num(2) - num(3)).to_string(), "-1");
    EXPECT_EQ((num(11) / num(2)).to_string(), "-9223372034707292155");
}

TEST_F(SymbolicExpressionTest, NeutralElements) {
    EXPECT_EQ((x_ + num(0)).to_string(), "X[0]");
    EXPECT_EQ((num(0) + x_).to_string(), "X[0]");
    EXPECT_EQ((x_ - num(0)).to_string(), "X[0]");
    EXPECT_EQ((num(0) - x_).to_string(), "-X[0]");
    EXPECT_EQ((x_ * num(1)).to_string(), "X[0]");
    EXPECT_EQ((num(1) * x_).to_string(), "X[0]");
    EXPECT_TRUE((x_ * num(0)).is_known_zero());
    EXPECT_EQ((x_ * SymbolicExpression(BFieldElement::minus_one())).to_string(), "-X[0]");
}

TEST_F(SymbolicExpressionTest, DivisionSimplification) {
    EXPECT_EQ((x_ / num(1)).to_string(), "X[0]");
    EXPECT_EQ((x_ / SymbolicExpression(BFieldElement::minus_one())).to_string(), "-X[0]");
    EXPECT_TRUE((num(0) / x_).is_known_zero());
    EXPECT_EQ((x_ / y_).to_string(), "(X[0] / Y[0])");
}

TEST_F(SymbolicExpressionTest, DivisionByKnownZeroThrows) {
    EXPECT_THROW(x_ / num(0), std::logic_error);
    EXPECT_THROW(x_.integer_div(num(0)), std::logic_error);
}

TEST_F(SymbolicExpressionTest, DoubleNegation) {
    EXPECT_EQ((-(-x_)).to_string(), "X[0]");
    EXPECT_EQ((-(x_ + y_)).to_string(), "-(X[0] + Y[0])");
}

TEST_F(SymbolicExpressionTest, Display) {
    auto expr = (x_ + y_) * num(3) - x_.integer_div(num(4));
    EXPECT_EQ(expr.to_string(), "(((X[0] + Y[0]) * 3) - (X[0] // 4))");
    EXPECT_EQ((x_ & 0xff).to_string(), "(X[0] & 255)");
    EXPECT_EQ((x_ | 0xff).to_string(), "(X[0] | 255)");
}

TEST_F(SymbolicExpressionTest, IntegerDivByOne) {
    EXPECT_EQ(x_.integer_div(num(1)).to_string(), "X[0]");
    EXPECT_EQ(num(17).integer_div(num(5)).try_to_number(), std::optional<BFieldElement>(BFieldElement(3)));
}

TEST_F(SymbolicExpressionTest, BitOperationsOnConstants) {
    EXPECT_EQ((num(0x1234) & 0xff).try_to_number(), std::optional<BFieldElement>(BFieldElement(0x34)));
    EXPECT_EQ((num(0x1200) | 0x34).try_to_number(), std::optional<BFieldElement>(BFieldElement(0x1234)));
    EXPECT_TRUE((x_ & 0).is_known_zero());
    EXPECT_EQ((x_ | 0).to_string(), "X[0]");
}

TEST_F(SymbolicExpressionTest, KnownNonzeroFromRangeConstraint) {
    auto positive = SymbolicExpression::from_symbol(
        x_cell_, RangeConstraint::from_range(BFieldElement(1), BFieldElement(10)));
    auto byte = SymbolicExpression::from_symbol(x_cell_, RangeConstraint::from_mask(0xff));
    EXPECT_TRUE(positive.is_known_nonzero());
    EXPECT_FALSE(byte.is_known_nonzero());
    EXPECT_FALSE(x_.is_known_nonzero());
    EXPECT_TRUE(num(7).is_known_nonzero());
    EXPECT_FALSE(num(0).is_known_nonzero());
}

TEST_F(SymbolicExpressionTest, RangeConstraintOfSum) {
    auto low = SymbolicExpression::from_symbol(x_cell_, RangeConstraint::from_mask(0xff));
    auto high = SymbolicExpression::from_symbol(y_cell_, RangeConstraint::from_mask(0xff00));
    auto sum = low + high;
    ASSERT_TRUE(sum.range_constraint().has_value());
    EXPECT_EQ(*sum.range_constraint(), RangeConstraint::from_mask(0xffff));
    EXPECT_FALSE((x_ + y_).range_constraint().has_value());
}

TEST_F(SymbolicExpressionTest, RangeConstraintOfMaskAndShift) {
    auto byte = SymbolicExpression::from_symbol(x_cell_, RangeConstraint::from_mask(0xffff));
    auto masked = byte & 0xf0;
    ASSERT_TRUE(masked.range_constraint().has_value());
    EXPECT_EQ(masked.range_constraint()->mask(), 0xf0ULL);

    auto shifted = masked.integer_div(num(16));
    ASSERT_TRUE(shifted.range_constraint().has_value());
    EXPECT_EQ(*shifted.range_constraint(), RangeConstraint::from_range(BFieldElement(0), BFieldElement(15)));
}

TEST_F(SymbolicExpressionTest, ConcreteHasSingleValueConstraint) {
    auto rc = num(42).range_constraint();
    ASSERT_TRUE(rc.has_value());
    EXPECT_EQ(rc->try_to_single_value(), std::optional<BFieldElement>(BFieldElement(42)));
}

TEST_F(SymbolicExpressionTest, Evaluate) {
    std::map<Cell, BFieldElement> values{{x_cell_, BFieldElement(0x1234)}, {y_cell_, BFieldElement(10)}};
    auto value_of = [&](const Cell& cell) { return values.at(cell); };

    EXPECT_EQ((x_ & 0xff00).integer_div(num(256)).evaluate(value_of), BFieldElement(0x12));
    EXPECT_EQ((x_ + y_).evaluate(value_of), BFieldElement(0x1234 + 10));
    EXPECT_EQ((-y_).evaluate(value_of), -BFieldElement(10));
    EXPECT_EQ((num(30) / y_).evaluate(value_of), BFieldElement(3));
}

TEST_F(SymbolicExpressionTest, CollectSymbols) {
    std::set<Cell> symbols;
    ((x_ + num(1)) * (y_ & 0xff)).collect_symbols(symbols);
    EXPECT_EQ(symbols, (std::set<Cell>{x_cell_, y_cell_}));

    std::set<Cell> none;
    num(5).collect_symbols(none);
    EXPECT_TRUE(none.empty());
}

TEST_F(SymbolicExpressionTest, NodeAccessors) {
    auto sum = x_ + y_;
    EXPECT_EQ(sum.type(), SymbolicExpression::Type::BinaryOperation);
    EXPECT_EQ(sum.binary_operator(), SymbolicExpression::BinaryOperator::Add);
    EXPECT_EQ(sum.lhs().symbol(), x_cell_);
    EXPECT_EQ(sum.rhs().symbol(), y_cell_);

    auto masked = x_ & 0xff;
    EXPECT_EQ(masked.bit_operator(), SymbolicExpression::BitOperator::And);
    EXPECT_EQ(masked.bit_operand(), 0xffULL);

    auto negated = -(x_ + y_);
    EXPECT_EQ(negated.type(), SymbolicExpression::Type::UnaryOperation);
    EXPECT_EQ(negated.unary_operator(), SymbolicExpression::UnaryOperator::Neg);
    EXPECT_EQ(negated.lhs().to_string(), "(X[0] + Y[0])");

    EXPECT_THROW(num(1).symbol(), std::logic_error);
    EXPECT_THROW(x_.binary_operator(), std::logic_error);
}
