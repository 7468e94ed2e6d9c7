#include "types/b_field_element.hpp"
#include <stdexcept>

namespace witgen {

// The 128-bit modulo is well-optimized by GCC/Clang for this specific modulus
uint64_t BFieldElement::reduce(uint128_t value) {
    return static_cast<uint64_t>(value % MODULUS);
}

BFieldElement BFieldElement::from_i64(int64_t value) {
    if (value >= 0) {
        return BFieldElement(static_cast<uint64_t>(value));
    }
    // -(INT64_MIN) does not fit into int64_t, go through the unsigned magnitude
    uint64_t magnitude = static_cast<uint64_t>(-(value + 1)) + 1;
    return -BFieldElement(magnitude);
}

BFieldElement BFieldElement::operator+(const BFieldElement& rhs) const {
    // Branchless addition: compute sum, then subtract MODULUS if overflow
    uint64_t sum = value_ + rhs.value_;
    // Overflow happens when sum < value_ (wrapping)
    uint64_t overflow = static_cast<uint64_t>(sum < value_);
    uint64_t too_large = static_cast<uint64_t>(sum >= MODULUS);
    sum -= MODULUS & (-(overflow | too_large));
    return BFieldElement(sum);
}

BFieldElement BFieldElement::operator-(const BFieldElement& rhs) const {
    // Branchless subtraction: compute diff, add MODULUS if underflow
    uint64_t diff = value_ - rhs.value_;
    uint64_t underflow = static_cast<uint64_t>(value_ < rhs.value_);
    diff += MODULUS & (-underflow);
    return BFieldElement(diff);
}

BFieldElement BFieldElement::operator*(const BFieldElement& rhs) const {
    uint128_t product = static_cast<uint128_t>(value_) * static_cast<uint128_t>(rhs.value_);
    return BFieldElement(reduce(product));
}

BFieldElement BFieldElement::operator-() const {
    if (value_ == 0) return *this;
    return BFieldElement(MODULUS - value_);
}

BFieldElement& BFieldElement::operator+=(const BFieldElement& rhs) {
    *this = *this + rhs;
    return *this;
}

BFieldElement& BFieldElement::operator-=(const BFieldElement& rhs) {
    *this = *this - rhs;
    return *this;
}

BFieldElement& BFieldElement::operator*=(const BFieldElement& rhs) {
    *this = *this * rhs;
    return *this;
}

BFieldElement& BFieldElement::operator/=(const BFieldElement& rhs) {
    *this = *this / rhs;
    return *this;
}

bool BFieldElement::operator==(const BFieldElement& rhs) const {
    return value_ == rhs.value_;
}

bool BFieldElement::operator!=(const BFieldElement& rhs) const {
    return value_ != rhs.value_;
}

bool BFieldElement::operator<(const BFieldElement& rhs) const {
    return value_ < rhs.value_;
}

bool BFieldElement::operator>(const BFieldElement& rhs) const {
    return value_ > rhs.value_;
}

bool BFieldElement::operator<=(const BFieldElement& rhs) const {
    return value_ <= rhs.value_;
}

bool BFieldElement::operator>=(const BFieldElement& rhs) const {
    return value_ >= rhs.value_;
}

BFieldElement BFieldElement::pow(uint64_t exp) const {
    BFieldElement result = BFieldElement::one();
    BFieldElement base = *this;

    while (exp > 0) {
        if (exp & 1) {
            result *= base;
        }
        base *= base;
        exp >>= 1;
    }

    return result;
}

BFieldElement BFieldElement::inverse() const {
    if (value_ == 0) {
        throw std::domain_error("Cannot invert zero");
    }

    // Use Fermat's little theorem: a^(-1) = a^(p-2) mod p
    return pow(MODULUS - 2);
}

BFieldElement BFieldElement::operator/(const BFieldElement& rhs) const {
    return *this * rhs.inverse();
}

std::string BFieldElement::to_string() const {
    return std::to_string(value_);
}

std::string BFieldElement::to_signed_string() const {
    if (is_in_lower_half()) {
        return std::to_string(value_);
    }
    return "-" + std::to_string(MODULUS - value_);
}

std::ostream& operator<<(std::ostream& os, const BFieldElement& elem) {
    return os << elem.value_;
}

} // namespace witgen
