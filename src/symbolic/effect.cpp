#include "symbolic/effect.hpp"
#include <sstream>
#include <stdexcept>

namespace witgen {

std::string MachineCallArgument::to_string() const {
    std::ostringstream oss;
    if (type == Type::Known) {
        oss << "Known(" << known << ")";
    } else {
        oss << "Unknown(" << unknown << ")";
    }
    return oss.str();
}

std::string Effect::to_string() const {
    std::ostringstream oss;
    switch (type) {
        case Type::Assignment:
            oss << cell << " = " << value << ";";
            break;
        case Type::RangeConstraint:
            throw std::logic_error("Range constraint for " + cell.to_string() + " is not code");
        case Type::Assertion:
            oss << "assert " << assertion.lhs
                << (assertion.expected_equal ? " == " : " != ")
                << assertion.rhs << ";";
            break;
        case Type::MachineCall: {
            oss << "lookup(" << identity_id << ", [";
            for (size_t i = 0; i < arguments.size(); ++i) {
                if (i > 0) oss << ", ";
                oss << arguments[i].to_string();
            }
            oss << "]);";
            break;
        }
    }
    return oss.str();
}

std::string format_code(const std::vector<Effect>& effects) {
    std::string out;
    for (size_t i = 0; i < effects.size(); ++i) {
        if (i > 0) out += "\n";
        out += effects[i].to_string();
    }
    return out;
}

} // namespace witgen
