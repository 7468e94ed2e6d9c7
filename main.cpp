#include <iostream>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/debug_control.hpp"
#include "constraints/constraint_system.hpp"
#include "inference/driver.hpp"
#include "inference/fixed_evaluator.hpp"
#include "inference/witgen_inference.hpp"
#include "range/global_range_constraints.hpp"
#include "symbolic/effect.hpp"

using namespace witgen;

static std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> out;
    std::string normalized = s;
    for (char& ch : normalized) {
        if (ch == ',') ch = ' ';
    }
    std::istringstream iss(normalized);
    std::string tok;
    while (iss >> tok) {
        out.push_back(tok);
    }
    return out;
}

static std::vector<int32_t> parse_rows(const std::string& s) {
    std::vector<int32_t> rows;
    for (const auto& tok : split_list(s)) {
        rows.push_back(static_cast<int32_t>(std::stol(tok)));
    }
    return rows;
}

/**
 * Parse "NAME:ROW,NAME:ROW" into cells of the given system.
 */
static std::set<Cell> parse_known_cells(const std::string& s, const ConstraintSystem& system) {
    std::set<Cell> cells;
    for (const auto& tok : split_list(s)) {
        size_t colon = tok.rfind(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 == tok.size()) {
            throw std::runtime_error("Invalid known cell '" + tok + "', expected NAME:ROW");
        }
        std::string name = tok.substr(0, colon);
        auto id = system.try_witness_id(name);
        if (!id) {
            throw std::runtime_error("Unknown witness column '" + name + "'");
        }
        cells.insert(Cell(name, *id, static_cast<int32_t>(std::stol(tok.substr(colon + 1)))));
    }
    return cells;
}

static void print_usage(const char* program) {
    std::cerr << "Usage:\n";
    std::cerr << "  " << program << " <system.json> [options]\n";
    std::cerr << "Options:\n";
    std::cerr << "  --rows a,b,c              rows to process (default: 0)\n";
    std::cerr << "  --known NAME:ROW,...      cells known before witness generation\n";
    std::cerr << "  --expected N              stop once N identity/row pairs are complete\n";
    std::cerr << "  --max-passes N            iteration cap (default: " << DEFAULT_MAX_PASSES << ")\n";
    std::cerr << "  --no-global-constraints   do not derive global range constraints\n";
    std::cerr << "Environment: WITGEN_DEBUG=1 traces the solver, WITGEN_PROFILE=1 prints pass timings\n";
}

/**
 * Generate witness code for a constraint system and print it to stdout.
 */
int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        std::string system_path = argv[1];
        std::vector<int32_t> rows{0};
        std::string known_list;
        std::optional<size_t> expected;
        size_t max_passes = DEFAULT_MAX_PASSES;
        bool use_global_constraints = true;

        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            auto next_value = [&]() -> std::string {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Missing value for " + arg);
                }
                return argv[++i];
            };
            if (arg == "--rows") {
                rows = parse_rows(next_value());
            } else if (arg == "--known") {
                known_list = next_value();
            } else if (arg == "--expected") {
                expected = static_cast<size_t>(std::stoull(next_value()));
            } else if (arg == "--max-passes") {
                max_passes = static_cast<size_t>(std::stoull(next_value()));
            } else if (arg == "--no-global-constraints") {
                use_global_constraints = false;
            } else {
                print_usage(argv[0]);
                throw std::runtime_error("Unknown option " + arg);
            }
        }

        ConstraintSystem system = ConstraintSystem::from_file(system_path);
        WITGEN_DEBUG_COUT("Loaded " << system.witness_columns().size() << " witness columns, "
                          << system.fixed_columns().size() << " fixed columns, "
                          << system.identities().size() << " identities" << std::endl);

        GlobalConstraintsResult globals;
        if (use_global_constraints) {
            globals = derive_global_range_constraints(system);
        } else {
            globals.retained_identities = system.identities();
        }
        WITGEN_DEBUG_COUT("Global range constraints for " << globals.constraints.size() << " columns, "
                          << globals.retained_identities.size() << " identities retained" << std::endl);

        FixedColumnEvaluator fixed_evaluator(system);
        WitgenInference inference(globals.constraints, fixed_evaluator, parse_known_cells(known_list, system));

        DriverResult result = solve_on_rows(inference, globals.retained_identities, rows, expected, max_passes);
        WITGEN_PROFILE_PRINT("[witgen] %zu passes, %zu pairs complete\n", result.passes, result.completed.size());

        std::cout << format_code(inference.code()) << std::endl;

        if (!inference.conflicts().empty()) {
            std::cerr << "Error: contradictory range constraints for";
            for (const auto& cell : inference.conflicts()) {
                std::cerr << " " << cell;
            }
            std::cerr << std::endl;
            return 1;
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
