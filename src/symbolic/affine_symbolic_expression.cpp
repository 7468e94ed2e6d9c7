#include "symbolic/affine_symbolic_expression.hpp"
#include "symbolic/effect.hpp"
#include "common/debug_control.hpp"
#include <sstream>
#include <vector>

namespace witgen {

namespace {

bool is_power_of_two(BFieldElement value) {
    uint64_t v = value.value();
    return v != 0 && (v & (v - 1)) == 0;
}

} // namespace

AffineSymbolicExpression AffineSymbolicExpression::from_known_symbol(
    const Cell& cell,
    std::optional<RangeConstraint> rc
) {
    return AffineSymbolicExpression(SymbolicExpression::from_symbol(cell, std::move(rc)));
}

AffineSymbolicExpression AffineSymbolicExpression::from_unknown_variable(
    const Cell& cell,
    std::optional<RangeConstraint> rc
) {
    AffineSymbolicExpression result;
    result.coefficients_.emplace(cell, SymbolicExpression(BFieldElement::one()));
    if (rc) {
        result.range_constraints_.emplace(cell, std::move(*rc));
    }
    return result;
}

std::optional<RangeConstraint> AffineSymbolicExpression::range_constraint_of(const Cell& cell) const {
    auto it = range_constraints_.find(cell);
    if (it == range_constraints_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<SymbolicExpression> AffineSymbolicExpression::try_to_known() const {
    if (coefficients_.empty()) {
        return offset_;
    }
    return std::nullopt;
}

std::optional<Cell> AffineSymbolicExpression::single_unknown_variable() const {
    if (coefficients_.size() == 1) {
        return coefficients_.begin()->first;
    }
    return std::nullopt;
}

AffineSymbolicExpression AffineSymbolicExpression::operator+(const AffineSymbolicExpression& rhs) const {
    AffineSymbolicExpression result = *this;
    for (const auto& [cell, coeff] : rhs.coefficients_) {
        auto it = result.coefficients_.find(cell);
        if (it == result.coefficients_.end()) {
            result.coefficients_.emplace(cell, coeff);
            auto rc = rhs.range_constraints_.find(cell);
            if (rc != rhs.range_constraints_.end()) {
                result.range_constraints_.emplace(cell, rc->second);
            }
            continue;
        }
        SymbolicExpression sum = it->second + coeff;
        if (sum.is_known_zero()) {
            result.coefficients_.erase(it);
            result.range_constraints_.erase(cell);
        } else {
            it->second = std::move(sum);
        }
    }
    result.offset_ = offset_ + rhs.offset_;
    return result;
}

AffineSymbolicExpression AffineSymbolicExpression::operator-(const AffineSymbolicExpression& rhs) const {
    return *this + (-rhs);
}

AffineSymbolicExpression AffineSymbolicExpression::operator-() const {
    AffineSymbolicExpression result = *this;
    for (auto& entry : result.coefficients_) {
        entry.second = -entry.second;
    }
    result.offset_ = -offset_;
    return result;
}

AffineSymbolicExpression AffineSymbolicExpression::scaled(const SymbolicExpression& factor, bool factor_on_left) const {
    if (factor.is_known_zero()) {
        return AffineSymbolicExpression();
    }
    AffineSymbolicExpression result;
    for (const auto& [cell, coeff] : coefficients_) {
        SymbolicExpression product = factor_on_left ? factor * coeff : coeff * factor;
        if (product.is_known_zero()) {
            continue;
        }
        result.coefficients_.emplace(cell, std::move(product));
        auto rc = range_constraints_.find(cell);
        if (rc != range_constraints_.end()) {
            result.range_constraints_.emplace(cell, rc->second);
        }
    }
    result.offset_ = factor_on_left ? factor * offset_ : offset_ * factor;
    return result;
}

std::optional<AffineSymbolicExpression> AffineSymbolicExpression::try_mul(const AffineSymbolicExpression& rhs) const {
    if (auto known = try_to_known()) {
        return rhs.scaled(*known, true);
    }
    if (auto known = rhs.try_to_known()) {
        return scaled(*known, false);
    }
    return std::nullopt;
}

ProcessResult AffineSymbolicExpression::solve() const {
    if (coefficients_.empty()) {
        if (!offset_.is_known_nonzero()) {
            return ProcessResult::make_complete({});
        }
        // The constraint is violated whenever it is active; leave the check to the executor.
        WITGEN_DEBUG_COUT("Constraint can never be satisfied: " << offset_ << " = 0" << std::endl);
        return ProcessResult::make_complete(
            {Effect::make_assertion(Assertion::assert_eq(offset_, SymbolicExpression()))});
    }

    if (coefficients_.size() == 1) {
        const auto& [cell, coeff] = *coefficients_.begin();
        if (!coeff.is_known_nonzero()) {
            return ProcessResult::empty();
        }
        SymbolicExpression value = (-offset_) / coeff;
        return ProcessResult::make_complete({Effect::make_assignment(cell, std::move(value))});
    }

    ProcessResult result = solve_bit_decomposition();
    if (result.complete) {
        return result;
    }
    AffineSymbolicExpression negated = -*this;
    result = negated.solve_bit_decomposition();
    if (result.complete) {
        return result;
    }

    std::vector<Effect> effects;
    transfer_constraints(effects);
    negated.transfer_constraints(effects);
    return ProcessResult{std::move(effects), false};
}

ProcessResult AffineSymbolicExpression::solve_bit_decomposition() const {
    struct Component {
        Cell cell;
        BFieldElement coeff;
        uint64_t mask;
    };

    // All coefficients need to be known powers of two and all unknowns range-constrained.
    std::vector<Component> components;
    for (const auto& [cell, coeff] : coefficients_) {
        auto factor = coeff.try_to_number();
        auto rc = range_constraints_.find(cell);
        if (!factor || !is_power_of_two(*factor) || rc == range_constraints_.end()) {
            return ProcessResult::empty();
        }
        components.push_back(Component{cell, *factor, rc->second.multiple(*factor).mask()});
    }

    uint64_t covered_bits = 0;
    for (const auto& component : components) {
        if ((component.mask & covered_bits) != 0) {
            return ProcessResult::empty();
        }
        covered_bits |= component.mask;
    }
    if (covered_bits >= BFieldElement::MODULUS) {
        return ProcessResult::empty();
    }

    SymbolicExpression total = -offset_;
    std::vector<Effect> effects;
    for (const auto& component : components) {
        SymbolicExpression masked = total & component.mask;
        effects.push_back(Effect::make_assignment(
            component.cell,
            masked.integer_div(SymbolicExpression(component.coeff))));
    }

    // Asserts that every bit of covered_bits is set in the total.
    effects.push_back(Effect::make_assertion(Assertion::assert_eq(total, total | covered_bits)));

    return ProcessResult::make_complete(std::move(effects));
}

void AffineSymbolicExpression::transfer_constraints(std::vector<Effect>& effects) const {
    // We are looking for X = a * Y + b * Z + ... or -X = a * Y + b * Z + ...
    // where X is the least constrained unknown.
    const Cell* solve_for = nullptr;
    bool solve_for_coeff_is_one = false;
    uint64_t widest = 0;
    for (const auto& [cell, coeff] : coefficients_) {
        if (!coeff.is_known_one() && !coeff.is_known_minus_one()) {
            continue;
        }
        auto rc = range_constraints_.find(cell);
        uint64_t width = rc == range_constraints_.end() ? BFieldElement::MODULUS : rc->second.range_width();
        if (solve_for == nullptr || width >= widest) {
            solve_for = &cell;
            solve_for_coeff_is_one = coeff.is_known_one();
            widest = width;
        }
    }
    if (solve_for == nullptr) {
        return;
    }

    const auto& offset_rc = offset_.range_constraint();
    if (!offset_rc) {
        return;
    }
    RangeConstraint constraint = *offset_rc;
    for (const auto& [cell, coeff] : coefficients_) {
        if (cell == *solve_for) {
            continue;
        }
        auto factor = coeff.try_to_number();
        auto rc = range_constraints_.find(cell);
        if (!factor || rc == range_constraints_.end()) {
            return;
        }
        constraint = constraint.combine_sum(rc->second.multiple(*factor));
    }
    if (solve_for_coeff_is_one) {
        constraint = -constraint;
    }
    if (constraint.is_unconstrained()) {
        return;
    }
    effects.push_back(Effect::make_range_constraint(*solve_for, std::move(constraint)));
}

std::string AffineSymbolicExpression::to_string() const {
    if (coefficients_.empty()) {
        return offset_.to_string();
    }
    std::ostringstream oss;
    bool first = true;
    for (const auto& [cell, coeff] : coefficients_) {
        if (!first) {
            oss << " + ";
        }
        first = false;
        if (coeff.is_known_one()) {
            oss << cell;
        } else if (coeff.is_known_minus_one()) {
            oss << "-" << cell;
        } else {
            oss << coeff << " * " << cell;
        }
    }
    if (!offset_.is_known_zero()) {
        oss << " + " << offset_;
    }
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const AffineSymbolicExpression& expr) {
    return os << expr.to_string();
}

} // namespace witgen
