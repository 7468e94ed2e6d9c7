#pragma once

#include "constraints/algebraic_expression.hpp"
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

namespace witgen {

/**
 * Cell - One entry of the witness trace: a witness column at a concrete row.
 *
 * `column_name` is only used for display. Equality, ordering and hashing use
 * (id, row_offset).
 */
struct Cell {
    std::string column_name;
    uint64_t id = 0;
    int32_t row_offset = 0;

    Cell() = default;
    Cell(std::string name, uint64_t column_id, int32_t row)
        : column_name(std::move(name)), id(column_id), row_offset(row) {}

    /**
     * The cell a witness reference points to when the identity is evaluated on `row`.
     */
    static Cell from_reference(const AlgebraicReference& reference, int32_t row) {
        return Cell(reference.name, reference.poly_id.id, row + (reference.next ? 1 : 0));
    }

    bool operator==(const Cell& rhs) const { return id == rhs.id && row_offset == rhs.row_offset; }
    bool operator!=(const Cell& rhs) const { return !(*this == rhs); }
    bool operator<(const Cell& rhs) const {
        if (id != rhs.id) return id < rhs.id;
        return row_offset < rhs.row_offset;
    }

    std::string to_string() const {
        return column_name + "[" + std::to_string(row_offset) + "]";
    }
};

inline std::ostream& operator<<(std::ostream& os, const Cell& cell) {
    return os << cell.to_string();
}

} // namespace witgen

namespace std {
template<>
struct hash<witgen::Cell> {
    size_t operator()(const witgen::Cell& cell) const noexcept {
        size_t h = std::hash<uint64_t>()(cell.id);
        return h ^ (std::hash<int32_t>()(cell.row_offset) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};
} // namespace std
