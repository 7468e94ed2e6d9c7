#include "inference/witgen_inference.hpp"
#include "common/debug_control.hpp"
#include <stdexcept>

namespace witgen {

WitgenInference::WitgenInference(const GlobalRangeConstraints& global_constraints,
                                 const FixedEvaluator& fixed_evaluator,
                                 std::set<Cell> known_cells)
    : global_constraints_(global_constraints),
      fixed_evaluator_(fixed_evaluator),
      known_cells_(std::move(known_cells)) {}

bool WitgenInference::process_identity(const Identity& identity, int32_t row) {
    ProcessResult result;
    switch (identity.kind) {
        case IdentityKind::Polynomial:
            result = process_polynomial_identity(identity, row);
            break;
        case IdentityKind::Lookup:
        case IdentityKind::Permutation:
        case IdentityKind::PhantomLookup:
        case IdentityKind::PhantomPermutation:
            result = process_lookup(identity, row);
            break;
        case IdentityKind::PhantomBusInteraction:
        case IdentityKind::Connect:
            // Not supported yet.
            result = ProcessResult::empty();
            break;
    }
    ingest(result);
    return result.complete;
}

ProcessResult WitgenInference::process_polynomial_identity(const Identity& identity, int32_t row) const {
    auto evaluated = evaluate(identity.expression, row);
    if (!evaluated) {
        return ProcessResult::empty();
    }
    return evaluated->solve();
}

ProcessResult WitgenInference::process_lookup(const Identity& identity, int32_t row) const {
    // The right side has to be a static table.
    for (const auto& expr : identity.right.expressions) {
        bool is_fixed_ref = expr.is_reference() && expr.reference.is_fixed();
        if (!is_fixed_ref && !expr.is_number()) {
            return ProcessResult::empty();
        }
    }

    auto selector = evaluate(identity.left.selector_or_one(), row);
    if (!selector) {
        return ProcessResult::empty();
    }
    auto selector_value = selector->try_to_known();
    if (!selector_value || !selector_value->is_known_one()) {
        return ProcessResult::empty();
    }

    std::vector<AffineSymbolicExpression> arguments;
    arguments.reserve(identity.left.expressions.size());
    for (const auto& expr : identity.left.expressions) {
        auto evaluated = evaluate(expr, row);
        if (!evaluated) {
            return ProcessResult::empty();
        }
        arguments.push_back(std::move(*evaluated));
    }

    size_t unknown_count = 0;
    for (const auto& arg : arguments) {
        if (!arg.is_known()) {
            if (!arg.single_unknown_variable()) {
                return ProcessResult::empty();
            }
            ++unknown_count;
        }
    }
    if (unknown_count != 1) {
        return ProcessResult::empty();
    }

    std::vector<MachineCallArgument> call_arguments;
    call_arguments.reserve(arguments.size());
    for (auto& arg : arguments) {
        if (auto known = arg.try_to_known()) {
            call_arguments.push_back(MachineCallArgument::make_known(std::move(*known)));
        } else {
            call_arguments.push_back(MachineCallArgument::make_unknown(std::move(arg)));
        }
    }
    return ProcessResult::make_complete({Effect::make_machine_call(identity.id, std::move(call_arguments))});
}

void WitgenInference::ingest(const ProcessResult& result) {
    for (const auto& effect : result.effects) {
        switch (effect.type) {
            case Effect::Type::Assignment:
                WITGEN_DEBUG_COUT("[witgen] " << effect.to_string() << std::endl);
                known_cells_.insert(effect.cell);
                if (const auto& rc = effect.value.range_constraint()) {
                    add_range_constraint(effect.cell, *rc);
                }
                code_.push_back(effect);
                break;
            case Effect::Type::RangeConstraint:
                add_range_constraint(effect.cell, effect.range_constraint);
                break;
            case Effect::Type::MachineCall:
                WITGEN_DEBUG_COUT("[witgen] " << effect.to_string() << std::endl);
                for (const auto& arg : effect.arguments) {
                    if (arg.type != MachineCallArgument::Type::Unknown) {
                        continue;
                    }
                    auto cell = arg.unknown.single_unknown_variable();
                    if (!cell) {
                        throw std::logic_error("Machine call argument " + arg.unknown.to_string()
                                               + " does not have exactly one unknown variable");
                    }
                    known_cells_.insert(*cell);
                }
                code_.push_back(effect);
                break;
            case Effect::Type::Assertion:
                WITGEN_DEBUG_COUT("[witgen] " << effect.to_string() << std::endl);
                code_.push_back(effect);
                break;
        }
    }
}

void WitgenInference::add_range_constraint(const Cell& cell, const RangeConstraint& rc) {
    RangeConstraint combined = rc;
    if (auto existing = range_constraint(cell)) {
        combined = existing->conjunction(rc);
    }

    if (combined.is_empty()) {
        bool already_reported = false;
        for (const auto& c : conflicts_) {
            if (c == cell) {
                already_reported = true;
                break;
            }
        }
        if (!already_reported) {
            WITGEN_DEBUG_COUT("[witgen] Conflicting range constraints for " << cell
                              << ": " << rc << std::endl);
            conflicts_.push_back(cell);
        }
        derived_range_constraints_[cell] = combined;
        return;
    }

    WITGEN_DEBUG_COUT("[witgen] " << cell << " in " << combined << std::endl);
    if (!is_known(cell)) {
        if (auto value = combined.try_to_single_value()) {
            known_cells_.insert(cell);
            Effect assignment = Effect::make_assignment(cell, SymbolicExpression(*value));
            WITGEN_DEBUG_COUT("[witgen] " << assignment.to_string() << std::endl);
            code_.push_back(std::move(assignment));
        }
    }
    derived_range_constraints_[cell] = combined;
}

std::optional<RangeConstraint> WitgenInference::range_constraint(const Cell& cell) const {
    std::optional<RangeConstraint> global = global_constraints_.witness_constraint(cell.id);
    auto it = derived_range_constraints_.find(cell);
    if (it == derived_range_constraints_.end()) {
        return global;
    }
    if (!global) {
        return it->second;
    }
    return global->conjunction(it->second);
}

std::optional<AffineSymbolicExpression> WitgenInference::evaluate_reference(
    const AlgebraicReference& reference,
    int32_t row
) const {
    if (reference.is_fixed()) {
        auto value = fixed_evaluator_.evaluate(reference, row);
        if (!value) {
            return std::nullopt;
        }
        return AffineSymbolicExpression(*value);
    }
    if (!reference.is_witness()) {
        return std::nullopt;
    }

    Cell cell = Cell::from_reference(reference, row);
    std::optional<RangeConstraint> rc = range_constraint(cell);
    if (rc) {
        if (auto value = rc->try_to_single_value()) {
            return AffineSymbolicExpression(*value);
        }
    }
    if (is_known(cell)) {
        return AffineSymbolicExpression::from_known_symbol(cell, rc);
    }
    return AffineSymbolicExpression::from_unknown_variable(cell, rc);
}

std::optional<AffineSymbolicExpression> WitgenInference::evaluate(
    const AlgebraicExpression& expression,
    int32_t row
) const {
    using Type = AlgebraicExpression::Type;
    switch (expression.type) {
        case Type::Reference:
            return evaluate_reference(expression.reference, row);
        case Type::PublicReference:
        case Type::Challenge:
            return std::nullopt;
        case Type::Number:
            return AffineSymbolicExpression(expression.number);
        case Type::BinaryOperation: {
            auto lhs = evaluate(*expression.left, row);
            if (!lhs) {
                return std::nullopt;
            }
            auto rhs = evaluate(*expression.right, row);
            if (!rhs) {
                return std::nullopt;
            }
            switch (expression.binary_op) {
                case AlgebraicBinaryOperator::Add:
                    return *lhs + *rhs;
                case AlgebraicBinaryOperator::Sub:
                    return *lhs - *rhs;
                case AlgebraicBinaryOperator::Mul:
                    return lhs->try_mul(*rhs);
                case AlgebraicBinaryOperator::Pow: {
                    auto base = lhs->try_to_known();
                    auto exponent = rhs->try_to_known();
                    if (!base || !exponent) {
                        return std::nullopt;
                    }
                    auto base_value = base->try_to_number();
                    auto exponent_value = exponent->try_to_number();
                    if (!base_value || !exponent_value) {
                        return std::nullopt;
                    }
                    return AffineSymbolicExpression(base_value->pow(exponent_value->value()));
                }
            }
            return std::nullopt;
        }
        case Type::UnaryOperation: {
            auto operand = evaluate(*expression.left, row);
            if (!operand) {
                return std::nullopt;
            }
            return -*operand;
        }
    }
    return std::nullopt;
}

} // namespace witgen
