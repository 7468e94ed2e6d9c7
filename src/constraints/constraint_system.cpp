#include "constraints/constraint_system.hpp"
#include <fstream>
#include <stdexcept>

namespace witgen {

namespace {

BFieldElement field_from_json(const nlohmann::json& json, const std::string& context) {
    if (json.is_number_unsigned()) {
        return BFieldElement(json.get<uint64_t>());
    }
    if (json.is_number_integer()) {
        return BFieldElement::from_i64(json.get<int64_t>());
    }
    throw std::runtime_error("Expected an integer in " + context + ", got: " + json.dump());
}

const nlohmann::json& require(const nlohmann::json& json, const char* field, const std::string& context) {
    if (!json.is_object() || !json.contains(field)) {
        throw std::runtime_error("JSON missing '" + std::string(field) + "' field in " + context);
    }
    return json[field];
}

IdentityKind identity_kind_from_string(const std::string& kind) {
    if (kind == "polynomial") return IdentityKind::Polynomial;
    if (kind == "lookup") return IdentityKind::Lookup;
    if (kind == "permutation") return IdentityKind::Permutation;
    if (kind == "phantom_lookup") return IdentityKind::PhantomLookup;
    if (kind == "phantom_permutation") return IdentityKind::PhantomPermutation;
    if (kind == "phantom_bus_interaction") return IdentityKind::PhantomBusInteraction;
    if (kind == "connect") return IdentityKind::Connect;
    throw std::runtime_error("Unknown identity kind: " + kind);
}

} // namespace

uint64_t ConstraintSystem::add_witness_column(const std::string& name) {
    if (references_by_name_.count(name)) {
        throw std::invalid_argument("Column declared twice: " + name);
    }
    uint64_t id = witness_columns_.size();
    witness_columns_.push_back(name);
    references_by_name_[name] = AlgebraicReference{name, PolyID{id, PolynomialType::Committed}, false};
    return id;
}

uint64_t ConstraintSystem::add_fixed_column(const std::string& name, std::vector<BFieldElement> values) {
    if (references_by_name_.count(name)) {
        throw std::invalid_argument("Column declared twice: " + name);
    }
    if (values.empty()) {
        throw std::invalid_argument("Fixed column " + name + " has no values");
    }
    uint64_t id = fixed_columns_.size();
    fixed_columns_.push_back(FixedColumn{name, id, std::move(values)});
    references_by_name_[name] = AlgebraicReference{name, PolyID{id, PolynomialType::Constant}, false};
    return id;
}

AlgebraicExpression ConstraintSystem::witness(const std::string& name) const {
    auto it = references_by_name_.find(name);
    if (it == references_by_name_.end() || !it->second.is_witness()) {
        throw std::invalid_argument("Unknown witness column: " + name);
    }
    return AlgebraicExpression::make_reference(it->second);
}

AlgebraicExpression ConstraintSystem::fixed(const std::string& name) const {
    auto it = references_by_name_.find(name);
    if (it == references_by_name_.end() || !it->second.is_fixed()) {
        throw std::invalid_argument("Unknown fixed column: " + name);
    }
    return AlgebraicExpression::make_reference(it->second);
}

uint64_t ConstraintSystem::add_polynomial_identity(AlgebraicExpression expression) {
    uint64_t id = identities_.size();
    identities_.push_back(Identity::polynomial(id, std::move(expression)));
    return id;
}

uint64_t ConstraintSystem::add_relation(IdentityKind kind, SelectedExpressions left, SelectedExpressions right) {
    if (kind == IdentityKind::Polynomial) {
        throw std::invalid_argument("Polynomial identities have no left and right side");
    }
    uint64_t id = identities_.size();
    identities_.push_back(Identity::relation(id, kind, std::move(left), std::move(right)));
    return id;
}

uint64_t ConstraintSystem::add_lookup(std::vector<AlgebraicExpression> left, std::vector<AlgebraicExpression> right) {
    SelectedExpressions lhs;
    lhs.expressions = std::move(left);
    SelectedExpressions rhs;
    rhs.expressions = std::move(right);
    return add_relation(IdentityKind::Lookup, std::move(lhs), std::move(rhs));
}

std::optional<uint64_t> ConstraintSystem::try_witness_id(const std::string& name) const {
    auto it = references_by_name_.find(name);
    if (it == references_by_name_.end() || !it->second.is_witness()) {
        return std::nullopt;
    }
    return it->second.poly_id.id;
}

const FixedColumn* ConstraintSystem::fixed_column(uint64_t id) const {
    if (id >= fixed_columns_.size()) {
        return nullptr;
    }
    return &fixed_columns_[id];
}

const std::string& ConstraintSystem::witness_name(uint64_t id) const {
    if (id >= witness_columns_.size()) {
        throw std::out_of_range("Witness column id out of range: " + std::to_string(id));
    }
    return witness_columns_[id];
}

AlgebraicExpression ConstraintSystem::expression_from_json(const nlohmann::json& json) const {
    if (!json.is_object()) {
        throw std::runtime_error("Expected an expression object, got: " + json.dump());
    }
    if (json.contains("ref")) {
        std::string name = json["ref"].get<std::string>();
        auto it = references_by_name_.find(name);
        if (it == references_by_name_.end()) {
            throw std::runtime_error("Reference to undeclared column: " + name);
        }
        AlgebraicReference reference = it->second;
        reference.next = json.value("next", false);
        return AlgebraicExpression::make_reference(std::move(reference));
    }
    if (json.contains("num")) {
        return AlgebraicExpression::make_number(field_from_json(json["num"], "number literal"));
    }
    if (json.contains("public")) {
        return AlgebraicExpression::make_public_reference(json["public"].get<std::string>());
    }
    if (json.contains("challenge")) {
        return AlgebraicExpression::make_challenge(
            json["challenge"].get<std::string>(),
            json.value("id", static_cast<uint64_t>(0)));
    }
    if (json.contains("neg")) {
        return -expression_from_json(json["neg"]);
    }
    if (json.contains("op")) {
        std::string op = json["op"].get<std::string>();
        AlgebraicExpression lhs = expression_from_json(require(json, "left", "binary operation"));
        AlgebraicExpression rhs = expression_from_json(require(json, "right", "binary operation"));
        if (op == "+") return lhs + rhs;
        if (op == "-") return lhs - rhs;
        if (op == "*") return lhs * rhs;
        if (op == "**") {
            if (rhs.is_number() && !rhs.number.is_in_lower_half()) {
                throw std::runtime_error("Negative exponent in " + json.dump());
            }
            return pow(lhs, rhs);
        }
        throw std::runtime_error("Unknown binary operator: " + op);
    }
    throw std::runtime_error("Unknown expression node: " + json.dump());
}

SelectedExpressions ConstraintSystem::selected_from_json(const nlohmann::json& json) const {
    SelectedExpressions selected;
    if (json.contains("selector") && !json["selector"].is_null()) {
        selected.selector = expression_from_json(json["selector"]);
    }
    for (const auto& expr : require(json, "expressions", "selected expressions")) {
        selected.expressions.push_back(expression_from_json(expr));
    }
    return selected;
}

ConstraintSystem ConstraintSystem::from_json(const nlohmann::json& json) {
    ConstraintSystem system;

    if (json.contains("witness")) {
        for (const auto& name : json["witness"]) {
            system.add_witness_column(name.get<std::string>());
        }
    }

    if (json.contains("fixed")) {
        for (const auto& column : json["fixed"]) {
            std::string name = require(column, "name", "fixed column").get<std::string>();
            std::vector<BFieldElement> values;
            for (const auto& value : require(column, "values", "fixed column " + name)) {
                values.push_back(field_from_json(value, "fixed column " + name));
            }
            system.add_fixed_column(name, std::move(values));
        }
    }

    if (json.contains("identities")) {
        for (const auto& identity : json["identities"]) {
            IdentityKind kind = identity_kind_from_string(
                require(identity, "kind", "identity").get<std::string>());
            if (kind == IdentityKind::Polynomial) {
                system.add_polynomial_identity(
                    system.expression_from_json(require(identity, "expression", "polynomial identity")));
            } else {
                std::string context = std::string(identity_kind_name(kind)) + " identity";
                SelectedExpressions left = system.selected_from_json(require(identity, "left", context));
                SelectedExpressions right = system.selected_from_json(require(identity, "right", context));
                system.add_relation(kind, std::move(left), std::move(right));
            }
        }
    }

    return system;
}

ConstraintSystem ConstraintSystem::from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse " + path + ": " + e.what());
    }
    return from_json(json);
}

} // namespace witgen
