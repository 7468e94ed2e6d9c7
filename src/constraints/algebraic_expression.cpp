#include "constraints/algebraic_expression.hpp"
#include <stdexcept>

namespace witgen {

AlgebraicExpression AlgebraicExpression::make_reference(AlgebraicReference reference) {
    AlgebraicExpression expr;
    expr.type = Type::Reference;
    expr.reference = std::move(reference);
    return expr;
}

AlgebraicExpression AlgebraicExpression::make_public_reference(std::string name) {
    AlgebraicExpression expr;
    expr.type = Type::PublicReference;
    expr.symbol_name = std::move(name);
    return expr;
}

AlgebraicExpression AlgebraicExpression::make_challenge(std::string name, uint64_t id) {
    AlgebraicExpression expr;
    expr.type = Type::Challenge;
    expr.symbol_name = std::move(name);
    expr.challenge_id = id;
    return expr;
}

AlgebraicExpression AlgebraicExpression::make_number(BFieldElement value) {
    AlgebraicExpression expr;
    expr.type = Type::Number;
    expr.number = value;
    return expr;
}

AlgebraicExpression AlgebraicExpression::make_binary(
    AlgebraicExpression lhs,
    AlgebraicBinaryOperator op,
    AlgebraicExpression rhs
) {
    AlgebraicExpression expr;
    expr.type = Type::BinaryOperation;
    expr.binary_op = op;
    expr.left = std::make_shared<const AlgebraicExpression>(std::move(lhs));
    expr.right = std::make_shared<const AlgebraicExpression>(std::move(rhs));
    return expr;
}

AlgebraicExpression AlgebraicExpression::make_unary(AlgebraicUnaryOperator op, AlgebraicExpression operand) {
    AlgebraicExpression expr;
    expr.type = Type::UnaryOperation;
    expr.unary_op = op;
    expr.left = std::make_shared<const AlgebraicExpression>(std::move(operand));
    return expr;
}

AlgebraicExpression AlgebraicExpression::next() const {
    if (type != Type::Reference) {
        throw std::invalid_argument("Only column references can be shifted to the next row");
    }
    if (reference.next) {
        throw std::invalid_argument("Reference " + reference.name + " already points to the next row");
    }
    AlgebraicReference shifted = reference;
    shifted.next = true;
    return make_reference(std::move(shifted));
}

std::string AlgebraicExpression::to_string() const {
    switch (type) {
        case Type::Reference:
            return reference.next ? reference.name + "'" : reference.name;
        case Type::PublicReference:
            return ":" + symbol_name;
        case Type::Challenge:
            return symbol_name;
        case Type::Number:
            return number.to_signed_string();
        case Type::BinaryOperation: {
            const char* op = "+";
            switch (binary_op) {
                case AlgebraicBinaryOperator::Add: op = "+"; break;
                case AlgebraicBinaryOperator::Sub: op = "-"; break;
                case AlgebraicBinaryOperator::Mul: op = "*"; break;
                case AlgebraicBinaryOperator::Pow: op = "**"; break;
            }
            return "(" + left->to_string() + " " + op + " " + right->to_string() + ")";
        }
        case Type::UnaryOperation:
            return "-" + left->to_string();
    }
    return "";
}

AlgebraicExpression operator+(const AlgebraicExpression& lhs, const AlgebraicExpression& rhs) {
    return AlgebraicExpression::make_binary(lhs, AlgebraicBinaryOperator::Add, rhs);
}

AlgebraicExpression operator-(const AlgebraicExpression& lhs, const AlgebraicExpression& rhs) {
    return AlgebraicExpression::make_binary(lhs, AlgebraicBinaryOperator::Sub, rhs);
}

AlgebraicExpression operator*(const AlgebraicExpression& lhs, const AlgebraicExpression& rhs) {
    return AlgebraicExpression::make_binary(lhs, AlgebraicBinaryOperator::Mul, rhs);
}

AlgebraicExpression operator-(const AlgebraicExpression& operand) {
    return AlgebraicExpression::make_unary(AlgebraicUnaryOperator::Minus, operand);
}

AlgebraicExpression pow(const AlgebraicExpression& base, const AlgebraicExpression& exponent) {
    return AlgebraicExpression::make_binary(base, AlgebraicBinaryOperator::Pow, exponent);
}

std::ostream& operator<<(std::ostream& os, const AlgebraicExpression& expr) {
    return os << expr.to_string();
}

} // namespace witgen
