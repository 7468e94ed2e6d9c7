#pragma once

#include "constraints/identity.hpp"
#include "inference/fixed_evaluator.hpp"
#include "range/global_range_constraints.hpp"
#include "symbolic/affine_symbolic_expression.hpp"
#include "symbolic/effect.hpp"
#include <map>
#include <optional>
#include <set>
#include <vector>

namespace witgen {

/**
 * WitgenInference - Symbolic witness generation for one machine.
 *
 * Processes identities on concrete rows and records which cells become known
 * and how. The recorded effects form a program that computes the witness from
 * the cells that were known at construction time.
 *
 * Knowledge only grows: known cells are never removed and derived range
 * constraints are only ever tightened. Every cell is assigned at most once.
 *
 * The fixed-point loop over rows and identities is not part of this class,
 * see solve_on_rows() in inference/driver.hpp.
 */
class WitgenInference {
public:
    WitgenInference(const GlobalRangeConstraints& global_constraints,
                    const FixedEvaluator& fixed_evaluator,
                    std::set<Cell> known_cells = {});

    /**
     * Process an identity on a given row and ingest the resulting effects.
     *
     * @return true if the identity is complete on this row and never has to be
     *         processed again.
     */
    bool process_identity(const Identity& identity, int32_t row);

    /**
     * Evaluate an expression on a given row with the current knowledge.
     *
     * Returns nullopt if the expression references something that cannot be
     * evaluated (public references, challenges, unavailable fixed values) or
     * multiplies two unknown terms.
     */
    std::optional<AffineSymbolicExpression> evaluate(const AlgebraicExpression& expression, int32_t row) const;

    /**
     * Best range constraint currently known for a cell: the global constraint of
     * its column combined with everything derived locally.
     */
    std::optional<RangeConstraint> range_constraint(const Cell& cell) const;

    bool is_known(const Cell& cell) const { return known_cells_.count(cell) > 0; }

    const std::set<Cell>& known_cells() const { return known_cells_; }
    const std::map<Cell, RangeConstraint>& derived_range_constraints() const { return derived_range_constraints_; }
    const std::vector<Effect>& code() const { return code_; }

    /**
     * Cells whose range constraints turned out to be contradictory, in order of detection.
     */
    const std::vector<Cell>& conflicts() const { return conflicts_; }

private:
    ProcessResult process_polynomial_identity(const Identity& identity, int32_t row) const;
    ProcessResult process_lookup(const Identity& identity, int32_t row) const;

    void ingest(const ProcessResult& result);
    void add_range_constraint(const Cell& cell, const RangeConstraint& rc);

    std::optional<AffineSymbolicExpression> evaluate_reference(const AlgebraicReference& reference, int32_t row) const;

    const GlobalRangeConstraints& global_constraints_;
    const FixedEvaluator& fixed_evaluator_;

    std::set<Cell> known_cells_;
    std::map<Cell, RangeConstraint> derived_range_constraints_;
    std::vector<Effect> code_;
    std::vector<Cell> conflicts_;
};

} // namespace witgen
