#pragma once

#include "constraints/algebraic_expression.hpp"
#include "constraints/constraint_system.hpp"
#include "types/b_field_element.hpp"
#include <cstdint>
#include <optional>

namespace witgen {

/**
 * Abstract source of fixed column values.
 *
 * The solver asks for the value of a fixed column reference evaluated on `row`.
 * Returning nullopt means the value is not available at code generation time.
 */
class FixedEvaluator {
public:
    virtual ~FixedEvaluator() = default;

    virtual std::optional<BFieldElement> evaluate(const AlgebraicReference& reference, int32_t row) const {
        (void)reference;
        (void)row;
        return std::nullopt;
    }
};

/**
 * FixedEvaluator backed by the fixed columns of a constraint system.
 *
 * Rows wrap around cyclically, so row -1 is the last row of the column.
 */
class FixedColumnEvaluator : public FixedEvaluator {
public:
    explicit FixedColumnEvaluator(const ConstraintSystem& system) : system_(system) {}

    std::optional<BFieldElement> evaluate(const AlgebraicReference& reference, int32_t row) const override;

private:
    const ConstraintSystem& system_;
};

} // namespace witgen
