#include "inference/fixed_evaluator.hpp"

namespace witgen {

std::optional<BFieldElement> FixedColumnEvaluator::evaluate(const AlgebraicReference& reference, int32_t row) const {
    if (!reference.is_fixed()) {
        return std::nullopt;
    }
    const FixedColumn* column = system_.fixed_column(reference.poly_id.id);
    if (column == nullptr || column->values.empty()) {
        return std::nullopt;
    }
    int64_t len = static_cast<int64_t>(column->values.size());
    int64_t index = static_cast<int64_t>(row) + (reference.next ? 1 : 0);
    index = ((index % len) + len) % len;
    return column->values[static_cast<size_t>(index)];
}

} // namespace witgen
