#pragma once

#include <cstdint>
#include <string>
#include <ostream>
#include <functional>

namespace witgen {

// 128-bit unsigned integer type for intermediate calculations
using uint128_t = __uint128_t;

/**
 * BFieldElement - Base Field Element
 *
 * Element of the Goldilocks prime field with modulus p = 2^64 - 2^32 + 1.
 * All trace cells, fixed column values and generated constants live in this field.
 */
class BFieldElement {
public:
    // The Goldilocks prime: 2^64 - 2^32 + 1
    static constexpr uint64_t MODULUS = 18446744069414584321ULL;

    // Constructors
    constexpr BFieldElement() : value_(0) {}
    constexpr explicit BFieldElement(uint64_t value) : value_(value % MODULUS) {}

    /**
     * Embed a signed integer: negative values map to p - |value|.
     */
    static BFieldElement from_i64(int64_t value);

    // Factory methods
    static constexpr BFieldElement zero() { return BFieldElement(0); }
    static constexpr BFieldElement one() { return BFieldElement(1); }
    static constexpr BFieldElement minus_one() { return BFieldElement(MODULUS - 1); }

    // Accessors
    constexpr uint64_t value() const { return value_; }

    // Arithmetic operations
    BFieldElement operator+(const BFieldElement& rhs) const;
    BFieldElement operator-(const BFieldElement& rhs) const;
    BFieldElement operator*(const BFieldElement& rhs) const;
    BFieldElement operator/(const BFieldElement& rhs) const;
    BFieldElement operator-() const;

    BFieldElement& operator+=(const BFieldElement& rhs);
    BFieldElement& operator-=(const BFieldElement& rhs);
    BFieldElement& operator*=(const BFieldElement& rhs);
    BFieldElement& operator/=(const BFieldElement& rhs);

    // Comparison (on the canonical integer representation)
    bool operator==(const BFieldElement& rhs) const;
    bool operator!=(const BFieldElement& rhs) const;
    bool operator<(const BFieldElement& rhs) const;
    bool operator>(const BFieldElement& rhs) const;
    bool operator<=(const BFieldElement& rhs) const;
    bool operator>=(const BFieldElement& rhs) const;

    // Field operations
    BFieldElement inverse() const;
    BFieldElement pow(uint64_t exp) const;
    bool is_zero() const { return value_ == 0; }
    bool is_one() const { return value_ == 1; }
    bool is_minus_one() const { return value_ == MODULUS - 1; }

    /**
     * True for values in [0, (p - 1) / 2], i.e. the "non-negative" half.
     */
    bool is_in_lower_half() const { return value_ <= (MODULUS - 1) / 2; }

    // String representation (canonical, unsigned)
    std::string to_string() const;

    /**
     * Signed representation used in generated code:
     * values in the upper half are printed as negative numbers.
     */
    std::string to_signed_string() const;

    friend std::ostream& operator<<(std::ostream& os, const BFieldElement& elem);

private:
    uint64_t value_;

    // Internal helper for modular reduction
    static uint64_t reduce(uint128_t value);
};

// Type alias for convenience
using BFE = BFieldElement;

} // namespace witgen

namespace std {
template<>
struct hash<witgen::BFieldElement> {
    size_t operator()(const witgen::BFieldElement& e) const noexcept {
        return std::hash<uint64_t>()(e.value());
    }
};
} // namespace std
