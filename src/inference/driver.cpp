#include "inference/driver.hpp"
#include "common/debug_control.hpp"
#include <chrono>
#include <stdexcept>
#include <string>

namespace witgen {

DriverResult solve_on_rows(WitgenInference& inference,
                           const std::vector<Identity>& identities,
                           const std::vector<int32_t>& rows,
                           std::optional<size_t> expected_complete,
                           size_t max_passes) {
    DriverResult result;
    while (!expected_complete || result.completed.size() != *expected_complete) {
        if (result.passes >= max_passes) {
            throw std::runtime_error("Witness generation did not converge after "
                                     + std::to_string(max_passes) + " passes ("
                                     + std::to_string(result.completed.size()) + " identities complete)");
        }

        auto pass_start = std::chrono::high_resolution_clock::now();
        size_t completed_before = result.completed.size();
        size_t code_before = inference.code().size();
        std::map<Cell, RangeConstraint> constraints_before = inference.derived_range_constraints();

        for (int32_t row : rows) {
            for (size_t i = 0; i < identities.size(); ++i) {
                IdentityRow key{i, row};
                if (result.completed.count(key) > 0) {
                    continue;
                }
                if (inference.process_identity(identities[i], row)) {
                    result.completed.insert(key);
                }
            }
        }
        ++result.passes;

        auto pass_end = std::chrono::high_resolution_clock::now();
        double pass_ms = std::chrono::duration<double, std::milli>(pass_end - pass_start).count();
        WITGEN_PROFILE_PRINT("[witgen] pass %zu: %zu complete, %zu effects, %.3f ms\n",
                             result.passes, result.completed.size(), inference.code().size(), pass_ms);

        bool progress = result.completed.size() != completed_before
            || inference.code().size() != code_before
            || inference.derived_range_constraints() != constraints_before;
        if (!expected_complete && !progress) {
            break;
        }
    }
    return result;
}

} // namespace witgen
