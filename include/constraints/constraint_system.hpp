#pragma once

#include "constraints/algebraic_expression.hpp"
#include "constraints/identity.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace witgen {

/**
 * FixedColumn - A column whose values are known before witness generation.
 */
struct FixedColumn {
    std::string name;
    uint64_t id = 0;
    std::vector<BFieldElement> values;
};

/**
 * ConstraintSystem - Columns and identities of one machine.
 *
 * Witness and fixed columns get ids in declaration order (separately per type).
 * Identities get ids in declaration order.
 */
class ConstraintSystem {
public:
    ConstraintSystem() = default;

    uint64_t add_witness_column(const std::string& name);
    uint64_t add_fixed_column(const std::string& name, std::vector<BFieldElement> values);

    /**
     * Reference expressions for declared columns. Throw std::invalid_argument for unknown names.
     */
    AlgebraicExpression witness(const std::string& name) const;
    AlgebraicExpression fixed(const std::string& name) const;

    uint64_t add_polynomial_identity(AlgebraicExpression expression);
    uint64_t add_relation(IdentityKind kind, SelectedExpressions left, SelectedExpressions right);

    /**
     * Shorthand for an unselected lookup `[left...] in [right...]`.
     */
    uint64_t add_lookup(std::vector<AlgebraicExpression> left, std::vector<AlgebraicExpression> right);

    const std::vector<Identity>& identities() const { return identities_; }
    const std::vector<std::string>& witness_columns() const { return witness_columns_; }
    const std::vector<FixedColumn>& fixed_columns() const { return fixed_columns_; }

    std::optional<uint64_t> try_witness_id(const std::string& name) const;
    const FixedColumn* fixed_column(uint64_t id) const;
    const std::string& witness_name(uint64_t id) const;

    /**
     * Load a constraint system from its JSON description:
     *
     *   {
     *     "witness": ["X", "Y"],
     *     "fixed": [{"name": "FIRST", "values": [1, 0, 0, 0]}],
     *     "identities": [
     *       {"kind": "polynomial", "expression": EXPR},
     *       {"kind": "lookup", "left": {"selector": EXPR, "expressions": [EXPR]},
     *                          "right": {"expressions": [EXPR]}}
     *     ]
     *   }
     *
     * EXPR is one of {"ref": NAME, "next": bool}, {"num": int}, {"public": NAME},
     * {"challenge": NAME, "id": int}, {"op": "+|-|*|**", "left": EXPR, "right": EXPR}
     * or {"neg": EXPR}. Throws std::runtime_error on malformed input.
     */
    static ConstraintSystem from_json(const nlohmann::json& json);
    static ConstraintSystem from_file(const std::string& path);

private:
    AlgebraicExpression expression_from_json(const nlohmann::json& json) const;
    SelectedExpressions selected_from_json(const nlohmann::json& json) const;

    std::vector<std::string> witness_columns_;
    std::vector<FixedColumn> fixed_columns_;
    std::map<std::string, AlgebraicReference> references_by_name_;
    std::vector<Identity> identities_;
};

} // namespace witgen
