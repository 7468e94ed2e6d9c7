#pragma once

#include "types/b_field_element.hpp"
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace witgen {

/**
 * RangeConstraint - Sound over-approximation of the values a field element can take.
 *
 * A value x is allowed iff
 *   - (x & mask) == x when seen as an unsigned integer, and
 *   - x lies in the inclusive interval [min, max]. If max < min, the interval wraps
 *     around the modulus, i.e. it is [min, p - 1] together with [0, max].
 *
 * The empty constraint allows no value at all; it is the result of conjunctions of
 * incompatible constraints.
 */
class RangeConstraint {
public:
    /// Allows every field element.
    RangeConstraint();

    static RangeConstraint unconstrained() { return RangeConstraint(); }
    static RangeConstraint from_mask(uint64_t mask);
    /// Allows the values that fit into the bits 0..=max_bit.
    static RangeConstraint from_max_bit(uint32_t max_bit);
    static RangeConstraint from_value(BFieldElement value);
    static RangeConstraint from_range(BFieldElement min, BFieldElement max);
    static RangeConstraint empty();

    uint64_t mask() const { return mask_; }
    BFieldElement min() const { return min_; }
    BFieldElement max() const { return max_; }

    bool is_empty() const { return empty_; }
    bool is_unconstrained() const;

    /**
     * Number of values in the interval [min, max] (ignores the mask).
     * Zero for the empty constraint.
     */
    uint64_t range_width() const;

    std::optional<BFieldElement> try_to_single_value() const;
    bool allows_value(BFieldElement value) const;

    /// Values allowed by both constraints.
    RangeConstraint conjunction(const RangeConstraint& other) const;

    /// Constraint on x + y where x is allowed by this and y by `other`.
    RangeConstraint combine_sum(const RangeConstraint& other) const;

    /// Constraint on factor * x where x is allowed by this.
    RangeConstraint multiple(BFieldElement factor) const;

    /// Constraint on -x where x is allowed by this.
    RangeConstraint operator-() const;

    bool operator==(const RangeConstraint& rhs) const;
    bool operator!=(const RangeConstraint& rhs) const { return !(*this == rhs); }

    std::string to_string() const;

private:
    RangeConstraint(uint64_t mask, BFieldElement min, BFieldElement max);

    /// Tightens mask and interval against each other, detects emptiness.
    void normalize();

    uint64_t mask_;
    BFieldElement min_;
    BFieldElement max_;
    bool empty_ = false;
};

/**
 * Smallest value of the form 2^k - 1 that is at least `value`.
 */
uint64_t mask_from_bits_of(uint64_t value);

std::ostream& operator<<(std::ostream& os, const RangeConstraint& rc);

} // namespace witgen
