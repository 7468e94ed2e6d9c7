#include "constraints/identity.hpp"
#include <sstream>

namespace witgen {

const char* identity_kind_name(IdentityKind kind) {
    switch (kind) {
        case IdentityKind::Polynomial: return "polynomial";
        case IdentityKind::Lookup: return "lookup";
        case IdentityKind::Permutation: return "permutation";
        case IdentityKind::PhantomLookup: return "phantom_lookup";
        case IdentityKind::PhantomPermutation: return "phantom_permutation";
        case IdentityKind::PhantomBusInteraction: return "phantom_bus_interaction";
        case IdentityKind::Connect: return "connect";
    }
    return "unknown";
}

std::string SelectedExpressions::to_string() const {
    std::ostringstream oss;
    if (selector) {
        oss << selector->to_string() << " $ ";
    }
    oss << "[";
    for (size_t i = 0; i < expressions.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << expressions[i].to_string();
    }
    oss << "]";
    return oss.str();
}

std::string Identity::to_string() const {
    switch (kind) {
        case IdentityKind::Polynomial:
            return expression.to_string() + " = 0";
        case IdentityKind::Lookup:
        case IdentityKind::PhantomLookup:
            return left.to_string() + " in " + right.to_string();
        case IdentityKind::Permutation:
        case IdentityKind::PhantomPermutation:
            return left.to_string() + " is " + right.to_string();
        case IdentityKind::Connect:
            return left.to_string() + " connect " + right.to_string();
        case IdentityKind::PhantomBusInteraction:
            return std::string("bus_interaction ") + left.to_string();
    }
    return "";
}

} // namespace witgen
