#pragma once

#include "symbolic/affine_symbolic_expression.hpp"
#include "symbolic/cell.hpp"
#include "symbolic/symbolic_expression.hpp"
#include "range/range_constraint.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace witgen {

/**
 * Assertion - Runtime check that two known values are (not) equal.
 */
struct Assertion {
    SymbolicExpression lhs;
    SymbolicExpression rhs;
    bool expected_equal = true;

    static Assertion assert_eq(SymbolicExpression lhs, SymbolicExpression rhs) {
        return Assertion{std::move(lhs), std::move(rhs), true};
    }

    static Assertion assert_neq(SymbolicExpression lhs, SymbolicExpression rhs) {
        return Assertion{std::move(lhs), std::move(rhs), false};
    }
};

/**
 * MachineCallArgument - Positional argument of a call into another machine.
 *
 * Known arguments are passed in. Unknown arguments are affine expressions in exactly
 * one unknown cell; the callee provides their value.
 */
struct MachineCallArgument {
    enum class Type {
        Known,
        Unknown
    };

    Type type = Type::Known;
    SymbolicExpression known;
    AffineSymbolicExpression unknown;

    static MachineCallArgument make_known(SymbolicExpression value) {
        MachineCallArgument arg;
        arg.type = Type::Known;
        arg.known = std::move(value);
        return arg;
    }

    static MachineCallArgument make_unknown(AffineSymbolicExpression expr) {
        MachineCallArgument arg;
        arg.type = Type::Unknown;
        arg.unknown = std::move(expr);
        return arg;
    }

    std::string to_string() const;
};

/**
 * Effect - One step of generated code, or a piece of knowledge for the solver.
 *
 * Matches the four outcomes of solving an identity:
 * - Assignment: `cell` is computed as the known expression `value`.
 * - RangeConstraint: new constraint `range_constraint` for the still unknown `cell`.
 * - Assertion: runtime consistency check.
 * - MachineCall: call into the machine answering identity `identity_id`.
 */
struct Effect {
    enum class Type {
        Assignment,
        RangeConstraint,
        Assertion,
        MachineCall
    };

    Type type = Type::Assignment;

    // For Assignment and RangeConstraint
    Cell cell;
    SymbolicExpression value;
    RangeConstraint range_constraint;

    // For Assertion
    Assertion assertion;

    // For MachineCall
    uint64_t identity_id = 0;
    std::vector<MachineCallArgument> arguments;

    static Effect make_assignment(Cell cell, SymbolicExpression value) {
        Effect effect;
        effect.type = Type::Assignment;
        effect.cell = std::move(cell);
        effect.value = std::move(value);
        return effect;
    }

    static Effect make_range_constraint(Cell cell, RangeConstraint rc) {
        Effect effect;
        effect.type = Type::RangeConstraint;
        effect.cell = std::move(cell);
        effect.range_constraint = std::move(rc);
        return effect;
    }

    static Effect make_assertion(Assertion assertion) {
        Effect effect;
        effect.type = Type::Assertion;
        effect.assertion = std::move(assertion);
        return effect;
    }

    static Effect make_machine_call(uint64_t identity_id, std::vector<MachineCallArgument> arguments) {
        Effect effect;
        effect.type = Type::MachineCall;
        effect.identity_id = identity_id;
        effect.arguments = std::move(arguments);
        return effect;
    }

    std::string to_string() const;
};

/**
 * ProcessResult - Outcome of processing one identity on one row.
 *
 * `complete` means the identity/row pair does not need to be processed again.
 */
struct ProcessResult {
    std::vector<Effect> effects;
    bool complete = false;

    static ProcessResult empty() { return ProcessResult{}; }

    static ProcessResult make_complete(std::vector<Effect> effects) {
        return ProcessResult{std::move(effects), true};
    }
};

/**
 * Render generated code, one effect per line. Range constraints are not code;
 * passing one throws std::logic_error.
 */
std::string format_code(const std::vector<Effect>& effects);

} // namespace witgen
