#include "range/range_constraint.hpp"
#include <algorithm>
#include <sstream>
#include <vector>

namespace witgen {

namespace {

constexpr uint64_t P = BFieldElement::MODULUS;
constexpr uint64_t FULL_MASK = ~0ULL;

// Inclusive, non-wrapping interval of integers in [0, p - 1]
struct Segment {
    uint64_t lo;
    uint64_t hi;
};

std::vector<Segment> segments_of(BFieldElement min, BFieldElement max) {
    if (min <= max) {
        return {Segment{min.value(), max.value()}};
    }
    return {Segment{0, max.value()}, Segment{min.value(), P - 1}};
}

} // namespace

uint64_t mask_from_bits_of(uint64_t value) {
    if (value == 0) {
        return 0;
    }
    int bits = 64 - __builtin_clzll(value);
    return bits == 64 ? FULL_MASK : (1ULL << bits) - 1;
}

RangeConstraint::RangeConstraint()
    : mask_(FULL_MASK), min_(BFieldElement::zero()), max_(BFieldElement(P - 1)) {}

RangeConstraint::RangeConstraint(uint64_t mask, BFieldElement min, BFieldElement max)
    : mask_(mask), min_(min), max_(max) {
    normalize();
}

void RangeConstraint::normalize() {
    if (empty_) {
        return;
    }
    uint64_t lo = min_.value();
    uint64_t hi = max_.value();
    if (lo > hi && mask_ < lo) {
        // The upper part [lo, p - 1] of the wrapping interval is excluded by the mask.
        lo = 0;
    }
    if (lo <= hi) {
        hi = std::min(hi, mask_);
        if (lo > hi) {
            *this = empty();
            return;
        }
        mask_ &= mask_from_bits_of(hi);
        if (lo == hi && (lo & mask_) != lo) {
            // The only value of the interval is excluded by the mask.
            *this = empty();
            return;
        }
    }
    min_ = BFieldElement(lo);
    max_ = BFieldElement(hi);
}

RangeConstraint RangeConstraint::from_mask(uint64_t mask) {
    return RangeConstraint(mask, BFieldElement::zero(), BFieldElement(P - 1));
}

RangeConstraint RangeConstraint::from_max_bit(uint32_t max_bit) {
    if (max_bit >= 63) {
        return RangeConstraint();
    }
    return from_mask((1ULL << (max_bit + 1)) - 1);
}

RangeConstraint RangeConstraint::from_value(BFieldElement value) {
    return RangeConstraint(value.value(), value, value);
}

RangeConstraint RangeConstraint::from_range(BFieldElement min, BFieldElement max) {
    return RangeConstraint(FULL_MASK, min, max);
}

RangeConstraint RangeConstraint::empty() {
    RangeConstraint rc;
    rc.mask_ = 0;
    rc.min_ = BFieldElement::zero();
    rc.max_ = BFieldElement::zero();
    rc.empty_ = true;
    return rc;
}

bool RangeConstraint::is_unconstrained() const {
    return !empty_ && mask_ == FULL_MASK && range_width() == P;
}

uint64_t RangeConstraint::range_width() const {
    if (empty_) {
        return 0;
    }
    if (min_ <= max_) {
        return max_.value() - min_.value() + 1;
    }
    return P - (min_.value() - max_.value()) + 1;
}

std::optional<BFieldElement> RangeConstraint::try_to_single_value() const {
    if (!empty_ && min_ == max_ && allows_value(min_)) {
        return min_;
    }
    return std::nullopt;
}

bool RangeConstraint::allows_value(BFieldElement value) const {
    if (empty_ || (value.value() & mask_) != value.value()) {
        return false;
    }
    if (min_ <= max_) {
        return min_ <= value && value <= max_;
    }
    return value >= min_ || value <= max_;
}

RangeConstraint RangeConstraint::conjunction(const RangeConstraint& other) const {
    if (empty_ || other.empty_) {
        return empty();
    }

    std::vector<Segment> intersection;
    for (const auto& a : segments_of(min_, max_)) {
        for (const auto& b : segments_of(other.min_, other.max_)) {
            uint64_t lo = std::max(a.lo, b.lo);
            uint64_t hi = std::min(a.hi, b.hi);
            if (lo <= hi) {
                intersection.push_back(Segment{lo, hi});
            }
        }
    }
    if (intersection.empty()) {
        return empty();
    }
    std::sort(intersection.begin(), intersection.end(),
              [](const Segment& a, const Segment& b) { return a.lo < b.lo; });

    BFieldElement min;
    BFieldElement max;
    if (intersection.size() == 1) {
        min = BFieldElement(intersection[0].lo);
        max = BFieldElement(intersection[0].hi);
    } else if (intersection.size() == 2 && intersection[0].lo == 0 && intersection[1].hi == P - 1) {
        // Still a single interval, wrapping around the modulus.
        min = BFieldElement(intersection[1].lo);
        max = BFieldElement(intersection[0].hi);
    } else {
        // Not representable as one interval: keep the narrower input.
        const RangeConstraint& narrower = range_width() <= other.range_width() ? *this : other;
        min = narrower.min_;
        max = narrower.max_;
    }
    return RangeConstraint(mask_ & other.mask_, min, max);
}

RangeConstraint RangeConstraint::combine_sum(const RangeConstraint& other) const {
    if (empty_ || other.empty_) {
        return empty();
    }

    uint64_t mask = FULL_MASK;
    if ((mask_ & other.mask_) == 0 && (mask_ | other.mask_) < P) {
        // No carries possible.
        mask = mask_ | other.mask_;
    } else {
        uint128_t sum = static_cast<uint128_t>(mask_) + static_cast<uint128_t>(other.mask_);
        if (sum < P) {
            mask = mask_from_bits_of(static_cast<uint64_t>(sum));
        }
    }

    BFieldElement min = BFieldElement::zero();
    BFieldElement max = BFieldElement(P - 1);
    uint128_t widths = static_cast<uint128_t>(range_width()) + static_cast<uint128_t>(other.range_width());
    if (widths <= P) {
        min = min_ + other.min_;
        max = max_ + other.max_;
    }
    return RangeConstraint(mask, min, max);
}

RangeConstraint RangeConstraint::multiple(BFieldElement factor) const {
    if (empty_) {
        return empty();
    }
    if (factor.is_zero()) {
        return from_value(BFieldElement::zero());
    }
    if (auto value = try_to_single_value()) {
        return from_value(*value * factor);
    }

    uint64_t mask = FULL_MASK;
    uint64_t f = factor.value();
    if ((f & (f - 1)) == 0) {
        int shift = __builtin_ctzll(f);
        uint128_t shifted = static_cast<uint128_t>(mask_) << shift;
        if (shifted < P) {
            mask = static_cast<uint64_t>(shifted);
        }
    }

    BFieldElement min = BFieldElement::zero();
    BFieldElement max = BFieldElement(P - 1);
    uint128_t span = static_cast<uint128_t>(range_width() - 1);
    if (factor.is_in_lower_half()) {
        if (span * f < P) {
            min = min_ * factor;
            max = max_ * factor;
        }
    } else {
        uint64_t negated = (-factor).value();
        if (span * negated < P) {
            min = max_ * factor;
            max = min_ * factor;
        }
    }
    return RangeConstraint(mask, min, max);
}

RangeConstraint RangeConstraint::operator-() const {
    if (empty_) {
        return empty();
    }
    if (auto value = try_to_single_value()) {
        return from_value(-*value);
    }
    return RangeConstraint(FULL_MASK, -max_, -min_);
}

bool RangeConstraint::operator==(const RangeConstraint& rhs) const {
    if (empty_ || rhs.empty_) {
        return empty_ == rhs.empty_;
    }
    return mask_ == rhs.mask_ && min_ == rhs.min_ && max_ == rhs.max_;
}

std::string RangeConstraint::to_string() const {
    if (empty_) {
        return "<empty>";
    }
    std::ostringstream oss;
    oss << "[" << min_.to_signed_string() << ", " << max_.to_signed_string() << "] & 0x"
        << std::hex << mask_;
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const RangeConstraint& rc) {
    return os << rc.to_string();
}

} // namespace witgen
