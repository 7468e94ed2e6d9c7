#pragma once

#include "range/range_constraint.hpp"
#include "constraints/constraint_system.hpp"
#include <map>
#include <optional>
#include <vector>

namespace witgen {

/**
 * GlobalRangeConstraints - Range constraints that hold for a witness column on every row.
 *
 * Computed once per constraint system before witness generation starts.
 */
class GlobalRangeConstraints {
public:
    /**
     * Add a constraint for a witness column (combined with an existing one by conjunction).
     */
    void add(uint64_t witness_id, const RangeConstraint& rc);

    std::optional<RangeConstraint> witness_constraint(uint64_t witness_id) const;

    /**
     * Constraint for the column of a reference. Only witness columns carry global constraints.
     */
    std::optional<RangeConstraint> range_constraint(const AlgebraicReference& reference) const;

    size_t size() const { return witness_constraints_.size(); }
    bool empty() const { return witness_constraints_.empty(); }

private:
    std::map<uint64_t, RangeConstraint> witness_constraints_;
};

/**
 * Range constraint implied by the values of a fixed column.
 */
RangeConstraint fixed_column_range_constraint(const FixedColumn& column);

struct GlobalConstraintsResult {
    GlobalRangeConstraints constraints;
    /// Identities that still have to be processed during witness generation.
    std::vector<Identity> retained_identities;
};

/**
 * Derive global range constraints from a constraint system.
 *
 * - Bit constraints `x * (1 - x) = 0` constrain x to {0, 1} and are consumed.
 * - Lookups without selectors whose right side consists of plain fixed columns
 *   transfer the range of each fixed column to the plain witness reference at the
 *   same position on the left. Single-column lookups of that shape are consumed.
 *
 * Every other identity is retained.
 */
GlobalConstraintsResult derive_global_range_constraints(const ConstraintSystem& system);

} // namespace witgen
