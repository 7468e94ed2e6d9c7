#pragma once

#include "symbolic/cell.hpp"
#include "symbolic/symbolic_expression.hpp"
#include "range/range_constraint.hpp"
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace witgen {

struct Effect;
struct ProcessResult;

/**
 * AffineSymbolicExpression - Degree-one expression in the unknown cells:
 *
 *     c_1 * x_1 + ... + c_n * x_n + offset
 *
 * The coefficients c_i and the offset are SymbolicExpressions (known at runtime).
 * Every unknown x_i carries the range constraint it had when the expression was built.
 * Terms with a coefficient that is known to be zero are dropped.
 */
class AffineSymbolicExpression {
public:
    /// The expression zero.
    AffineSymbolicExpression() = default;
    explicit AffineSymbolicExpression(SymbolicExpression known) : offset_(std::move(known)) {}
    explicit AffineSymbolicExpression(BFieldElement value) : offset_(value) {}

    static AffineSymbolicExpression from_known_symbol(const Cell& cell, std::optional<RangeConstraint> rc);
    static AffineSymbolicExpression from_unknown_variable(const Cell& cell, std::optional<RangeConstraint> rc);

    const std::map<Cell, SymbolicExpression>& coefficients() const { return coefficients_; }
    const SymbolicExpression& offset() const { return offset_; }
    std::optional<RangeConstraint> range_constraint_of(const Cell& cell) const;

    /**
     * The known value if the expression has no unknown terms.
     */
    std::optional<SymbolicExpression> try_to_known() const;
    bool is_known() const { return coefficients_.empty(); }

    /**
     * The unknown cell if there is exactly one unknown term.
     */
    std::optional<Cell> single_unknown_variable() const;

    AffineSymbolicExpression operator+(const AffineSymbolicExpression& rhs) const;
    AffineSymbolicExpression operator-(const AffineSymbolicExpression& rhs) const;
    AffineSymbolicExpression operator-() const;

    /**
     * Product of two affine expressions. Only possible if at least one of them is known,
     * returns nullopt otherwise.
     */
    std::optional<AffineSymbolicExpression> try_mul(const AffineSymbolicExpression& rhs) const;

    /**
     * Solve the equation "this = 0" for the unknown terms.
     *
     * - No unknowns: complete, with an assertion unless the offset is known to be zero.
     * - One unknown with a nonzero coefficient: complete, assigns the unknown.
     * - Several range-constrained unknowns with power-of-two coefficients and disjoint
     *   bit masks: complete, assigns every unknown by masking (bit decomposition).
     * - Otherwise: incomplete, possibly with range constraints for one of the unknowns.
     */
    ProcessResult solve() const;

    std::string to_string() const;

private:
    AffineSymbolicExpression scaled(const SymbolicExpression& factor, bool factor_on_left) const;
    ProcessResult solve_bit_decomposition() const;
    /**
     * If the unknown with coefficient +-1 and the widest range can be bounded by the
     * range constraints of all other terms, append that range constraint to `effects`.
     */
    void transfer_constraints(std::vector<Effect>& effects) const;

    std::map<Cell, SymbolicExpression> coefficients_;
    std::map<Cell, RangeConstraint> range_constraints_;
    SymbolicExpression offset_;
};

std::ostream& operator<<(std::ostream& os, const AffineSymbolicExpression& expr);

} // namespace witgen
