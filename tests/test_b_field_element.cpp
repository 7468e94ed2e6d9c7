#include <gtest/gtest.h>
#include "types/b_field_element.hpp"
#include <cstdint>

using namespace witgen;

class BFieldElementTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Common setup
    }
};

// Basic construction tests
TEST_F(BFieldElementTest, DefaultConstruction) {
    BFieldElement zero;
    EXPECT_EQ(zero.value(), 0ULL);
}

TEST_F(BFieldElementTest, ValueConstruction) {
    BFieldElement elem(42);
    EXPECT_EQ(elem.value(), 42ULL);
}

TEST_F(BFieldElementTest, ModularReduction) {
    // Value larger than modulus should be reduced
    BFieldElement elem(BFieldElement::MODULUS + 5);
    EXPECT_EQ(elem.value(), 5ULL);
}

// Factory methods
TEST_F(BFieldElementTest, Zero) {
    auto zero = BFieldElement::zero();
    EXPECT_EQ(zero.value(), 0ULL);
    EXPECT_TRUE(zero.is_zero());
}

TEST_F(BFieldElementTest, One) {
    auto one = BFieldElement::one();
    EXPECT_EQ(one.value(), 1ULL);
    EXPECT_TRUE(one.is_one());
}

// Arithmetic tests
TEST_F(BFieldElementTest, Addition) {
    BFieldElement a(100);
    BFieldElement b(200);
    auto result = a + b;
    EXPECT_EQ(result.value(), 300ULL);
}

TEST_F(BFieldElementTest, AdditionWithOverflow) {
    BFieldElement a(BFieldElement::MODULUS - 5);
    BFieldElement b(10);
    auto result = a + b;
    EXPECT_EQ(result.value(), 5ULL);
}

TEST_F(BFieldElementTest, Subtraction) {
    BFieldElement a(200);
    BFieldElement b(100);
    auto result = a - b;
    EXPECT_EQ(result.value(), 100ULL);
}

TEST_F(BFieldElementTest, SubtractionWithUnderflow) {
    BFieldElement a(5);
    BFieldElement b(10);
    auto result = a - b;
    EXPECT_EQ(result.value(), BFieldElement::MODULUS - 5);
}

TEST_F(BFieldElementTest, Multiplication) {
    BFieldElement a(100);
    BFieldElement b(200);
    auto result = a * b;
    EXPECT_EQ(result.value(), 20000ULL);
}

TEST_F(BFieldElementTest, MultiplicationWithReduction) {
    // Test that large products are reduced correctly
    BFieldElement a(1ULL << 32);
    BFieldElement b(1ULL << 32);
    auto result = a * b;
    // (2^32)^2 mod p = 2^64 mod p
    // Since p = 2^64 - 2^32 + 1, we have 2^64 = 2^32 - 1 mod p
    EXPECT_EQ(result.value(), (1ULL << 32) - 1);
}

TEST_F(BFieldElementTest, Negation) {
    BFieldElement a(100);
    auto neg_a = -a;
    EXPECT_EQ((a + neg_a).value(), 0ULL);
}

TEST_F(BFieldElementTest, NegationOfZero) {
    auto zero = BFieldElement::zero();
    auto neg_zero = -zero;
    EXPECT_EQ(neg_zero.value(), 0ULL);
}

// Power tests
TEST_F(BFieldElementTest, PowerOfZero) {
    BFieldElement a(5);
    auto result = a.pow(0);
    EXPECT_EQ(result.value(), 1ULL);
}

TEST_F(BFieldElementTest, PowerOfOne) {
    BFieldElement a(5);
    auto result = a.pow(1);
    EXPECT_EQ(result.value(), 5ULL);
}

TEST_F(BFieldElementTest, PowerOfTwo) {
    BFieldElement a(5);
    auto result = a.pow(2);
    EXPECT_EQ(result.value(), 25ULL);
}

TEST_F(BFieldElementTest, PowerOfTen) {
    BFieldElement a(2);
    auto result = a.pow(10);
    EXPECT_EQ(result.value(), 1024ULL);
}

// Inverse tests
TEST_F(BFieldElementTest, InverseOfOne) {
    auto one = BFieldElement::one();
    auto inv = one.inverse();
    EXPECT_EQ(inv.value(), 1ULL);
}

TEST_F(BFieldElementTest, InverseProperty) {
    BFieldElement a(12345);
    auto inv = a.inverse();
    auto product = a * inv;
    EXPECT_EQ(product.value(), 1ULL);
}

TEST_F(BFieldElementTest, InverseOfZeroThrows) {
    auto zero = BFieldElement::zero();
    EXPECT_THROW(zero.inverse(), std::domain_error);
}

// Division tests
TEST_F(BFieldElementTest, Division) {
    BFieldElement a(100);
    BFieldElement b(5);
    auto result = a / b;
    EXPECT_EQ(result.value(), 20ULL);
}

TEST_F(BFieldElementTest, DivisionProperty) {
    BFieldElement a(12345);
    BFieldElement b(67890);
    auto quotient = a / b;
    auto product = quotient * b;
    EXPECT_EQ(product.value(), a.value());
}

TEST_F(BFieldElementTest, ModulusValue) {
    // Goldilocks prime: 2^64 - 2^32 + 1
    uint64_t expected = 0xFFFFFFFF00000001ULL;
    EXPECT_EQ(BFieldElement::MODULUS, expected);
}


// Signed embedding and display
TEST_F(BFieldElementTest, FromNegativeInteger) {
    EXPECT_EQ(BFieldElement::from_i64(-1), BFieldElement::minus_one());
    EXPECT_EQ(BFieldElement::from_i64(-5).value(), BFieldElement::MODULUS - 5);
    EXPECT_EQ(BFieldElement::from_i64(7).value(), 7ULL);
}

TEST_F(BFieldElementTest, FromMinimalInteger) {
    auto elem = BFieldElement::from_i64(INT64_MIN);
    EXPECT_EQ((elem + BFieldElement(1ULL << 63)).value(), 0ULL);
}

TEST_F(BFieldElementTest, SignedStringOfLowerHalf) {
    EXPECT_EQ(BFieldElement(42).to_signed_string(), "42");
    EXPECT_EQ(BFieldElement::zero().to_signed_string(), "0");
}

TEST_F(BFieldElementTest, SignedStringOfUpperHalf) {
    EXPECT_EQ(BFieldElement::minus_one().to_signed_string(), "-1");
    // 11 / 2 = (p + 11) / 2, printed relative to p
    auto half = BFieldElement(11) / BFieldElement(2);
    EXPECT_EQ(half.to_signed_string(), "-9223372034707292155");
}

TEST_F(BFieldElementTest, LowerHalfBoundary) {
    BFieldElement last_positive((BFieldElement::MODULUS - 1) / 2);
    EXPECT_TRUE(last_positive.is_in_lower_half());
    EXPECT_FALSE((last_positive + BFieldElement::one()).is_in_lower_half());
}

TEST_F(BFieldElementTest, IsMinusOne) {
    EXPECT_TRUE(BFieldElement::minus_one().is_minus_one());
    EXPECT_TRUE((-BFieldElement::one()).is_minus_one());
    EXPECT_FALSE(BFieldElement::one().is_minus_one());
}
