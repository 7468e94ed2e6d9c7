#pragma once

#include "types/b_field_element.hpp"
#include "range/range_constraint.hpp"
#include "symbolic/cell.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <set>
#include <string>

namespace witgen {

/**
 * SymbolicExpression - A value that is known at runtime but not necessarily now.
 *
 * Leaves are concrete field elements or known cells ("symbols"). Inner nodes are
 * field operations, integer division and bit operations with a constant operand.
 * Every node carries the range constraint derived from its operands, if any.
 *
 * Expressions are immutable and share their sub-trees. The operators simplify
 * while building (constant folding, neutral elements, double negation).
 */
class SymbolicExpression {
public:
    enum class Type {
        Concrete,
        Symbol,
        BinaryOperation,
        UnaryOperation,
        BitOperation
    };

    enum class BinaryOperator {
        Add,
        Sub,
        Mul,
        /// Field division
        Div,
        /// Integer division on the canonical representations
        IntegerDiv
    };

    enum class UnaryOperator {
        Neg
    };

    enum class BitOperator {
        And,
        Or
    };

    /// The concrete value zero.
    SymbolicExpression();
    explicit SymbolicExpression(BFieldElement value);

    static SymbolicExpression from_symbol(Cell symbol, std::optional<RangeConstraint> rc);

    Type type() const;

    std::optional<BFieldElement> try_to_number() const;
    bool is_known_zero() const;
    bool is_known_one() const;
    bool is_known_minus_one() const;
    /// True if the value can never be zero (concrete nonzero or excluded by the range constraint).
    bool is_known_nonzero() const;

    const std::optional<RangeConstraint>& range_constraint() const;

    // Node accessors. Calling an accessor that does not match type() throws std::logic_error.
    const Cell& symbol() const;
    BinaryOperator binary_operator() const;
    UnaryOperator unary_operator() const;
    BitOperator bit_operator() const;
    uint64_t bit_operand() const;
    /// Left operand of binary and bit operations, operand of unary operations.
    SymbolicExpression lhs() const;
    SymbolicExpression rhs() const;

    SymbolicExpression operator+(const SymbolicExpression& rhs) const;
    SymbolicExpression operator-(const SymbolicExpression& rhs) const;
    SymbolicExpression operator*(const SymbolicExpression& rhs) const;
    SymbolicExpression operator/(const SymbolicExpression& rhs) const;
    SymbolicExpression operator-() const;
    SymbolicExpression integer_div(const SymbolicExpression& rhs) const;
    SymbolicExpression operator&(uint64_t mask) const;
    SymbolicExpression operator|(uint64_t bits) const;

    /**
     * Compute the value given concrete values for all symbols.
     */
    BFieldElement evaluate(const std::function<BFieldElement(const Cell&)>& value_of) const;

    /**
     * Add all symbols this expression depends on to `out`.
     */
    void collect_symbols(std::set<Cell>& out) const;

    std::string to_string() const;

private:
    struct Node;

    explicit SymbolicExpression(std::shared_ptr<const Node> node);

    static SymbolicExpression make_binary(const SymbolicExpression& lhs, BinaryOperator op,
                                          const SymbolicExpression& rhs, std::optional<RangeConstraint> rc);

    std::shared_ptr<const Node> node_;
};

std::ostream& operator<<(std::ostream& os, const SymbolicExpression& expr);

} // namespace witgen
