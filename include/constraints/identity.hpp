#pragma once

#include "constraints/algebraic_expression.hpp"
#include <optional>
#include <string>
#include <vector>

namespace witgen {

/**
 * SelectedExpressions - One side of a lookup-like identity.
 *
 * The tuple `expressions` is only active on rows where `selector` is nonzero.
 * A missing selector means the side is always active.
 */
struct SelectedExpressions {
    std::optional<AlgebraicExpression> selector;
    std::vector<AlgebraicExpression> expressions;

    AlgebraicExpression selector_or_one() const {
        return selector ? *selector : AlgebraicExpression::make_number(BFieldElement::one());
    }

    std::string to_string() const;
};

enum class IdentityKind {
    Polynomial,
    Lookup,
    Permutation,
    PhantomLookup,
    PhantomPermutation,
    PhantomBusInteraction,
    Connect
};

const char* identity_kind_name(IdentityKind kind);

/**
 * Identity - A constraint that has to hold on every row.
 *
 * Polynomial identities use `expression` (which has to evaluate to zero).
 * All other kinds relate the tuples `left` and `right`.
 */
struct Identity {
    uint64_t id = 0;
    IdentityKind kind = IdentityKind::Polynomial;
    AlgebraicExpression expression;
    SelectedExpressions left;
    SelectedExpressions right;

    static Identity polynomial(uint64_t id, AlgebraicExpression expression) {
        Identity identity;
        identity.id = id;
        identity.kind = IdentityKind::Polynomial;
        identity.expression = std::move(expression);
        return identity;
    }

    static Identity relation(uint64_t id, IdentityKind kind, SelectedExpressions left, SelectedExpressions right) {
        Identity identity;
        identity.id = id;
        identity.kind = kind;
        identity.left = std::move(left);
        identity.right = std::move(right);
        return identity;
    }

    /**
     * Lookup, Permutation, PhantomLookup and PhantomPermutation share one resolution rule.
     */
    bool is_lookup_family() const {
        return kind == IdentityKind::Lookup
            || kind == IdentityKind::Permutation
            || kind == IdentityKind::PhantomLookup
            || kind == IdentityKind::PhantomPermutation;
    }

    std::string to_string() const;
};

} // namespace witgen
