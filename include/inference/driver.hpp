#pragma once

#include "inference/witgen_inference.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace witgen {

/// (index into the identity list, row)
using IdentityRow = std::pair<size_t, int32_t>;

struct DriverResult {
    std::set<IdentityRow> completed;
    size_t passes = 0;
};

constexpr size_t DEFAULT_MAX_PASSES = 10000;

/**
 * Run passes over all (row, identity) pairs until a fixed point is reached.
 *
 * Pairs that reported completion are never submitted again. With
 * `expected_complete` set, iteration stops as soon as that many pairs are
 * complete, otherwise when a pass changes nothing.
 *
 * @throws std::runtime_error if more than `max_passes` passes are needed.
 */
DriverResult solve_on_rows(WitgenInference& inference,
                           const std::vector<Identity>& identities,
                           const std::vector<int32_t>& rows,
                           std::optional<size_t> expected_complete = std::nullopt,
                           size_t max_passes = DEFAULT_MAX_PASSES);

} // namespace witgen
