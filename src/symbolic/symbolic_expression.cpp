#include "symbolic/symbolic_expression.hpp"
#include <stdexcept>

namespace witgen {

struct SymbolicExpression::Node {
    Type type = Type::Concrete;
    BFieldElement value;
    Cell symbol;
    BinaryOperator binary_op = BinaryOperator::Add;
    UnaryOperator unary_op = UnaryOperator::Neg;
    BitOperator bit_op = BitOperator::And;
    uint64_t bit_operand = 0;
    std::shared_ptr<const Node> lhs;
    std::shared_ptr<const Node> rhs;
    std::optional<RangeConstraint> rc;
};

namespace {

const char* binary_operator_symbol(SymbolicExpression::BinaryOperator op) {
    switch (op) {
        case SymbolicExpression::BinaryOperator::Add: return "+";
        case SymbolicExpression::BinaryOperator::Sub: return "-";
        case SymbolicExpression::BinaryOperator::Mul: return "*";
        case SymbolicExpression::BinaryOperator::Div: return "/";
        case SymbolicExpression::BinaryOperator::IntegerDiv: return "//";
    }
    return "?";
}

std::optional<RangeConstraint> sum_constraint(const std::optional<RangeConstraint>& a,
                                              const std::optional<RangeConstraint>& b) {
    if (a && b) {
        return a->combine_sum(*b);
    }
    return std::nullopt;
}

} // namespace

SymbolicExpression::SymbolicExpression() : SymbolicExpression(BFieldElement::zero()) {}

SymbolicExpression::SymbolicExpression(BFieldElement value) {
    auto node = std::make_shared<Node>();
    node->type = Type::Concrete;
    node->value = value;
    node->rc = RangeConstraint::from_value(value);
    node_ = std::move(node);
}

SymbolicExpression::SymbolicExpression(std::shared_ptr<const Node> node) : node_(std::move(node)) {}

SymbolicExpression SymbolicExpression::from_symbol(Cell symbol, std::optional<RangeConstraint> rc) {
    auto node = std::make_shared<Node>();
    node->type = Type::Symbol;
    node->symbol = std::move(symbol);
    node->rc = std::move(rc);
    return SymbolicExpression(std::shared_ptr<const Node>(std::move(node)));
}

SymbolicExpression SymbolicExpression::make_binary(
    const SymbolicExpression& lhs,
    BinaryOperator op,
    const SymbolicExpression& rhs,
    std::optional<RangeConstraint> rc
) {
    auto node = std::make_shared<Node>();
    node->type = Type::BinaryOperation;
    node->binary_op = op;
    node->lhs = lhs.node_;
    node->rhs = rhs.node_;
    node->rc = std::move(rc);
    return SymbolicExpression(std::shared_ptr<const Node>(std::move(node)));
}

SymbolicExpression::Type SymbolicExpression::type() const {
    return node_->type;
}

std::optional<BFieldElement> SymbolicExpression::try_to_number() const {
    if (node_->type == Type::Concrete) {
        return node_->value;
    }
    return std::nullopt;
}

bool SymbolicExpression::is_known_zero() const {
    return node_->type == Type::Concrete && node_->value.is_zero();
}

bool SymbolicExpression::is_known_one() const {
    return node_->type == Type::Concrete && node_->value.is_one();
}

bool SymbolicExpression::is_known_minus_one() const {
    return node_->type == Type::Concrete && node_->value.is_minus_one();
}

bool SymbolicExpression::is_known_nonzero() const {
    if (node_->type == Type::Concrete) {
        return !node_->value.is_zero();
    }
    return node_->rc && !node_->rc->allows_value(BFieldElement::zero());
}

const std::optional<RangeConstraint>& SymbolicExpression::range_constraint() const {
    return node_->rc;
}

const Cell& SymbolicExpression::symbol() const {
    if (node_->type != Type::Symbol) {
        throw std::logic_error("Not a symbol: " + to_string());
    }
    return node_->symbol;
}

SymbolicExpression::BinaryOperator SymbolicExpression::binary_operator() const {
    if (node_->type != Type::BinaryOperation) {
        throw std::logic_error("Not a binary operation: " + to_string());
    }
    return node_->binary_op;
}

SymbolicExpression::UnaryOperator SymbolicExpression::unary_operator() const {
    if (node_->type != Type::UnaryOperation) {
        throw std::logic_error("Not a unary operation: " + to_string());
    }
    return node_->unary_op;
}

SymbolicExpression::BitOperator SymbolicExpression::bit_operator() const {
    if (node_->type != Type::BitOperation) {
        throw std::logic_error("Not a bit operation: " + to_string());
    }
    return node_->bit_op;
}

uint64_t SymbolicExpression::bit_operand() const {
    if (node_->type != Type::BitOperation) {
        throw std::logic_error("Not a bit operation: " + to_string());
    }
    return node_->bit_operand;
}

SymbolicExpression SymbolicExpression::lhs() const {
    if (!node_->lhs) {
        throw std::logic_error("Expression has no operands: " + to_string());
    }
    return SymbolicExpression(node_->lhs);
}

SymbolicExpression SymbolicExpression::rhs() const {
    if (!node_->rhs) {
        throw std::logic_error("Expression has no right operand: " + to_string());
    }
    return SymbolicExpression(node_->rhs);
}

SymbolicExpression SymbolicExpression::operator+(const SymbolicExpression& rhs) const {
    auto a = try_to_number();
    auto b = rhs.try_to_number();
    if (a && b) {
        return SymbolicExpression(*a + *b);
    }
    if (is_known_zero()) {
        return rhs;
    }
    if (rhs.is_known_zero()) {
        return *this;
    }
    return make_binary(*this, BinaryOperator::Add, rhs, sum_constraint(node_->rc, rhs.node_->rc));
}

SymbolicExpression SymbolicExpression::operator-(const SymbolicExpression& rhs) const {
    auto a = try_to_number();
    auto b = rhs.try_to_number();
    if (a && b) {
        return SymbolicExpression(*a - *b);
    }
    if (rhs.is_known_zero()) {
        return *this;
    }
    if (is_known_zero()) {
        return -rhs;
    }
    std::optional<RangeConstraint> rc;
    if (node_->rc && rhs.node_->rc) {
        rc = node_->rc->combine_sum(-*rhs.node_->rc);
    }
    return make_binary(*this, BinaryOperator::Sub, rhs, std::move(rc));
}

SymbolicExpression SymbolicExpression::operator*(const SymbolicExpression& rhs) const {
    auto a = try_to_number();
    auto b = rhs.try_to_number();
    if (a && b) {
        return SymbolicExpression(*a * *b);
    }
    if (is_known_zero() || rhs.is_known_zero()) {
        return SymbolicExpression();
    }
    if (is_known_one()) {
        return rhs;
    }
    if (rhs.is_known_one()) {
        return *this;
    }
    if (is_known_minus_one()) {
        return -rhs;
    }
    if (rhs.is_known_minus_one()) {
        return -*this;
    }
    std::optional<RangeConstraint> rc;
    if (a && rhs.node_->rc) {
        rc = rhs.node_->rc->multiple(*a);
    } else if (b && node_->rc) {
        rc = node_->rc->multiple(*b);
    }
    return make_binary(*this, BinaryOperator::Mul, rhs, std::move(rc));
}

SymbolicExpression SymbolicExpression::operator/(const SymbolicExpression& rhs) const {
    if (rhs.is_known_zero()) {
        throw std::logic_error("Division by zero: " + to_string() + " / 0");
    }
    auto a = try_to_number();
    auto b = rhs.try_to_number();
    if (a && b) {
        return SymbolicExpression(*a / *b);
    }
    if (rhs.is_known_one()) {
        return *this;
    }
    if (rhs.is_known_minus_one()) {
        return -*this;
    }
    if (is_known_zero()) {
        return SymbolicExpression();
    }
    std::optional<RangeConstraint> rc;
    if (b && node_->rc) {
        rc = node_->rc->multiple(b->inverse());
    }
    return make_binary(*this, BinaryOperator::Div, rhs, std::move(rc));
}

SymbolicExpression SymbolicExpression::operator-() const {
    if (auto a = try_to_number()) {
        return SymbolicExpression(-*a);
    }
    if (node_->type == Type::UnaryOperation && node_->unary_op == UnaryOperator::Neg) {
        return SymbolicExpression(node_->lhs);
    }
    auto node = std::make_shared<Node>();
    node->type = Type::UnaryOperation;
    node->unary_op = UnaryOperator::Neg;
    node->lhs = node_;
    if (node_->rc) {
        node->rc = -*node_->rc;
    }
    return SymbolicExpression(std::shared_ptr<const Node>(std::move(node)));
}

SymbolicExpression SymbolicExpression::integer_div(const SymbolicExpression& rhs) const {
    if (rhs.is_known_zero()) {
        throw std::logic_error("Integer division by zero: " + to_string() + " // 0");
    }
    auto a = try_to_number();
    auto b = rhs.try_to_number();
    if (a && b) {
        return SymbolicExpression(BFieldElement(a->value() / b->value()));
    }
    if (rhs.is_known_one()) {
        return *this;
    }
    std::optional<RangeConstraint> rc;
    if (b && node_->rc && node_->rc->min() <= node_->rc->max()) {
        rc = RangeConstraint::from_range(
            BFieldElement(node_->rc->min().value() / b->value()),
            BFieldElement(node_->rc->max().value() / b->value()));
    }
    return make_binary(*this, BinaryOperator::IntegerDiv, rhs, std::move(rc));
}

SymbolicExpression SymbolicExpression::operator&(uint64_t mask) const {
    if (auto a = try_to_number()) {
        return SymbolicExpression(BFieldElement(a->value() & mask));
    }
    if (mask == 0) {
        return SymbolicExpression();
    }
    auto node = std::make_shared<Node>();
    node->type = Type::BitOperation;
    node->bit_op = BitOperator::And;
    node->bit_operand = mask;
    node->lhs = node_;
    node->rc = RangeConstraint::from_mask(node_->rc ? (node_->rc->mask() & mask) : mask);
    return SymbolicExpression(std::shared_ptr<const Node>(std::move(node)));
}

SymbolicExpression SymbolicExpression::operator|(uint64_t bits) const {
    if (auto a = try_to_number()) {
        return SymbolicExpression(BFieldElement(a->value() | bits));
    }
    if (bits == 0) {
        return *this;
    }
    auto node = std::make_shared<Node>();
    node->type = Type::BitOperation;
    node->bit_op = BitOperator::Or;
    node->bit_operand = bits;
    node->lhs = node_;
    if (node_->rc && (node_->rc->mask() | bits) < BFieldElement::MODULUS) {
        node->rc = RangeConstraint::from_mask(node_->rc->mask() | bits);
    }
    return SymbolicExpression(std::shared_ptr<const Node>(std::move(node)));
}

BFieldElement SymbolicExpression::evaluate(const std::function<BFieldElement(const Cell&)>& value_of) const {
    switch (node_->type) {
        case Type::Concrete:
            return node_->value;
        case Type::Symbol:
            return value_of(node_->symbol);
        case Type::UnaryOperation:
            return -lhs().evaluate(value_of);
        case Type::BitOperation: {
            uint64_t operand = lhs().evaluate(value_of).value();
            if (node_->bit_op == BitOperator::And) {
                return BFieldElement(operand & node_->bit_operand);
            }
            return BFieldElement(operand | node_->bit_operand);
        }
        case Type::BinaryOperation: {
            BFieldElement l = lhs().evaluate(value_of);
            BFieldElement r = rhs().evaluate(value_of);
            switch (node_->binary_op) {
                case BinaryOperator::Add: return l + r;
                case BinaryOperator::Sub: return l - r;
                case BinaryOperator::Mul: return l * r;
                case BinaryOperator::Div: return l / r;
                case BinaryOperator::IntegerDiv:
                    if (r.is_zero()) {
                        throw std::domain_error("Integer division by zero");
                    }
                    return BFieldElement(l.value() / r.value());
            }
            break;
        }
    }
    throw std::logic_error("Unhandled symbolic expression node");
}

void SymbolicExpression::collect_symbols(std::set<Cell>& out) const {
    switch (node_->type) {
        case Type::Concrete:
            return;
        case Type::Symbol:
            out.insert(node_->symbol);
            return;
        case Type::UnaryOperation:
        case Type::BitOperation:
            lhs().collect_symbols(out);
            return;
        case Type::BinaryOperation:
            lhs().collect_symbols(out);
            rhs().collect_symbols(out);
            return;
    }
}

std::string SymbolicExpression::to_string() const {
    switch (node_->type) {
        case Type::Concrete:
            return node_->value.to_signed_string();
        case Type::Symbol:
            return node_->symbol.to_string();
        case Type::UnaryOperation:
            return "-" + lhs().to_string();
        case Type::BitOperation:
            return "(" + lhs().to_string() + (node_->bit_op == BitOperator::And ? " & " : " | ")
                + std::to_string(node_->bit_operand) + ")";
        case Type::BinaryOperation:
            return "(" + lhs().to_string() + " " + binary_operator_symbol(node_->binary_op) + " "
                + rhs().to_string() + ")";
    }
    return "";
}

std::ostream& operator<<(std::ostream& os, const SymbolicExpression& expr) {
    return os << expr.to_string();
}

} // namespace witgen
