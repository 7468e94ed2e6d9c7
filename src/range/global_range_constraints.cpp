#include "range/global_range_constraints.hpp"
#include "common/debug_control.hpp"
#include <algorithm>

namespace witgen {

namespace {

bool is_plain_witness_reference(const AlgebraicExpression& expr) {
    return expr.is_reference() && expr.reference.is_witness() && !expr.reference.next;
}

bool is_plain_fixed_reference(const AlgebraicExpression& expr) {
    return expr.is_reference() && expr.reference.is_fixed() && !expr.reference.next;
}

bool is_same_reference(const AlgebraicExpression& a, const AlgebraicExpression& b) {
    return a.is_reference() && b.is_reference()
        && a.reference.poly_id == b.reference.poly_id
        && a.reference.next == b.reference.next;
}

bool is_one(const AlgebraicExpression& expr) {
    return expr.is_number() && expr.number.is_one();
}

// Matches 1 - x and x - 1 for the given reference x.
bool is_one_minus_or_minus_one(const AlgebraicExpression& expr, const AlgebraicExpression& x) {
    if (expr.type != AlgebraicExpression::Type::BinaryOperation
        || expr.binary_op != AlgebraicBinaryOperator::Sub) {
        return false;
    }
    return (is_one(*expr.left) && is_same_reference(*expr.right, x))
        || (is_same_reference(*expr.left, x) && is_one(*expr.right));
}

/**
 * If the expression is x * (1 - x), (1 - x) * x or the variants with x - 1,
 * returns the witness reference x.
 */
const AlgebraicExpression* try_bit_constraint(const AlgebraicExpression& expr) {
    if (expr.type != AlgebraicExpression::Type::BinaryOperation
        || expr.binary_op != AlgebraicBinaryOperator::Mul) {
        return nullptr;
    }
    const AlgebraicExpression& lhs = *expr.left;
    const AlgebraicExpression& rhs = *expr.right;
    if (is_plain_witness_reference(lhs) && is_one_minus_or_minus_one(rhs, lhs)) {
        return &lhs;
    }
    if (is_plain_witness_reference(rhs) && is_one_minus_or_minus_one(lhs, rhs)) {
        return &rhs;
    }
    return nullptr;
}

} // namespace

void GlobalRangeConstraints::add(uint64_t witness_id, const RangeConstraint& rc) {
    auto it = witness_constraints_.find(witness_id);
    if (it == witness_constraints_.end()) {
        witness_constraints_.emplace(witness_id, rc);
    } else {
        it->second = it->second.conjunction(rc);
    }
}

std::optional<RangeConstraint> GlobalRangeConstraints::witness_constraint(uint64_t witness_id) const {
    auto it = witness_constraints_.find(witness_id);
    if (it == witness_constraints_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<RangeConstraint> GlobalRangeConstraints::range_constraint(const AlgebraicReference& reference) const {
    if (!reference.is_witness()) {
        return std::nullopt;
    }
    return witness_constraint(reference.poly_id.id);
}

RangeConstraint fixed_column_range_constraint(const FixedColumn& column) {
    uint64_t bits = 0;
    BFieldElement min = column.values.front();
    BFieldElement max = column.values.front();
    for (const auto& value : column.values) {
        bits |= value.value();
        min = std::min(min, value);
        max = std::max(max, value);
    }
    return RangeConstraint::from_mask(bits).conjunction(RangeConstraint::from_range(min, max));
}

GlobalConstraintsResult derive_global_range_constraints(const ConstraintSystem& system) {
    GlobalConstraintsResult result;

    std::vector<RangeConstraint> fixed_constraints;
    fixed_constraints.reserve(system.fixed_columns().size());
    for (const auto& column : system.fixed_columns()) {
        fixed_constraints.push_back(fixed_column_range_constraint(column));
    }

    for (const auto& identity : system.identities()) {
        if (identity.kind == IdentityKind::Polynomial) {
            if (const AlgebraicExpression* bit = try_bit_constraint(identity.expression)) {
                WITGEN_DEBUG_COUT("Global bit constraint on " << bit->reference.name << std::endl);
                result.constraints.add(bit->reference.poly_id.id, RangeConstraint::from_mask(1));
                continue;
            }
        } else if ((identity.kind == IdentityKind::Lookup || identity.kind == IdentityKind::PhantomLookup)
                   && !identity.left.selector && !identity.right.selector
                   && identity.left.expressions.size() == identity.right.expressions.size()
                   && std::all_of(identity.right.expressions.begin(), identity.right.expressions.end(),
                                  is_plain_fixed_reference)) {
            bool all_transferred = true;
            for (size_t i = 0; i < identity.left.expressions.size(); ++i) {
                const AlgebraicExpression& left = identity.left.expressions[i];
                if (!is_plain_witness_reference(left)) {
                    all_transferred = false;
                    continue;
                }
                const RangeConstraint& rc = fixed_constraints.at(identity.right.expressions[i].reference.poly_id.id);
                WITGEN_DEBUG_COUT("Global range constraint " << rc << " on " << left.reference.name << std::endl);
                result.constraints.add(left.reference.poly_id.id, rc);
            }
            if (all_transferred && identity.left.expressions.size() == 1) {
                continue;
            }
        }
        result.retained_identities.push_back(identity);
    }

    return result;
}

} // namespace witgen
