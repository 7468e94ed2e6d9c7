#pragma once

#include "types/b_field_element.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <ostream>

namespace witgen {

enum class PolynomialType {
    Committed,
    Constant,
    Intermediate
};

/**
 * PolyID - Identifies a column. Ids are unique per polynomial type.
 */
struct PolyID {
    uint64_t id = 0;
    PolynomialType ptype = PolynomialType::Committed;

    bool operator==(const PolyID& rhs) const { return id == rhs.id && ptype == rhs.ptype; }
    bool operator!=(const PolyID& rhs) const { return !(*this == rhs); }
    bool operator<(const PolyID& rhs) const {
        if (ptype != rhs.ptype) return ptype < rhs.ptype;
        return id < rhs.id;
    }
};

/**
 * AlgebraicReference - A column reference on the current row or (next = true) on the next row.
 */
struct AlgebraicReference {
    std::string name;
    PolyID poly_id;
    bool next = false;

    bool is_fixed() const { return poly_id.ptype == PolynomialType::Constant; }
    bool is_witness() const { return poly_id.ptype == PolynomialType::Committed; }
};

enum class AlgebraicBinaryOperator {
    Add,
    Sub,
    Mul,
    Pow
};

enum class AlgebraicUnaryOperator {
    Minus
};

/**
 * AlgebraicExpression - Node of a constraint expression tree.
 *
 * Children are shared and immutable, so copying an expression is cheap.
 * Use the static constructors and the operator overloads below to build trees.
 */
struct AlgebraicExpression {
    enum class Type {
        Reference,
        PublicReference,
        Challenge,
        Number,
        BinaryOperation,
        UnaryOperation
    };

    Type type = Type::Number;

    // For Reference
    AlgebraicReference reference;

    // For PublicReference (name) and Challenge (name, id)
    std::string symbol_name;
    uint64_t challenge_id = 0;

    // For Number
    BFieldElement number;

    // For BinaryOperation / UnaryOperation (operand in `left`)
    AlgebraicBinaryOperator binary_op = AlgebraicBinaryOperator::Add;
    AlgebraicUnaryOperator unary_op = AlgebraicUnaryOperator::Minus;
    std::shared_ptr<const AlgebraicExpression> left;
    std::shared_ptr<const AlgebraicExpression> right;

    static AlgebraicExpression make_reference(AlgebraicReference reference);
    static AlgebraicExpression make_public_reference(std::string name);
    static AlgebraicExpression make_challenge(std::string name, uint64_t id);
    static AlgebraicExpression make_number(BFieldElement value);
    static AlgebraicExpression make_number(uint64_t value) { return make_number(BFieldElement(value)); }
    static AlgebraicExpression make_binary(AlgebraicExpression lhs, AlgebraicBinaryOperator op, AlgebraicExpression rhs);
    static AlgebraicExpression make_unary(AlgebraicUnaryOperator op, AlgebraicExpression operand);

    /**
     * The same reference shifted to the next row. Only valid for references on the current row.
     */
    AlgebraicExpression next() const;

    bool is_reference() const { return type == Type::Reference; }
    bool is_number() const { return type == Type::Number; }

    std::string to_string() const;
};

AlgebraicExpression operator+(const AlgebraicExpression& lhs, const AlgebraicExpression& rhs);
AlgebraicExpression operator-(const AlgebraicExpression& lhs, const AlgebraicExpression& rhs);
AlgebraicExpression operator*(const AlgebraicExpression& lhs, const AlgebraicExpression& rhs);
AlgebraicExpression operator-(const AlgebraicExpression& operand);
AlgebraicExpression pow(const AlgebraicExpression& base, const AlgebraicExpression& exponent);

inline AlgebraicExpression operator+(const AlgebraicExpression& lhs, uint64_t rhs) {
    return lhs + AlgebraicExpression::make_number(rhs);
}
inline AlgebraicExpression operator-(const AlgebraicExpression& lhs, uint64_t rhs) {
    return lhs - AlgebraicExpression::make_number(rhs);
}
inline AlgebraicExpression operator*(const AlgebraicExpression& lhs, uint64_t rhs) {
    return lhs * AlgebraicExpression::make_number(rhs);
}
inline AlgebraicExpression operator-(uint64_t lhs, const AlgebraicExpression& rhs) {
    return AlgebraicExpression::make_number(lhs) - rhs;
}

std::ostream& operator<<(std::ostream& os, const AlgebraicExpression& expr);

} // namespace witgen
