#pragma once

#include <string_view>
#include <vector>

#include "vm/ir.hxx"

namespace brisk {

/// @brief Which rewrite passes run. Every pass is enabled by default except the
/// odd-delta clear extension.
struct OptimizerOptions {
    bool mergeOperators = true;
    bool collapseAssignments = true;
    bool collapseOffsets = true;
    bool deferMovements = true;
    bool collapseScanLoops = true;
    bool collapseMultiplyLoops = true;
    bool eliminateDeadLoops = true;
    // Let collapseAssignments turn [+++] style loops into clears. Any odd delta is a
    // unit modulo a power of two, so the loop still reaches zero from every start value.
    bool oddDeltaClears = false;
};

/// @brief Disable the pass named `name` (merge, assign, offsets, defer, scan, mul, dead).
/// @return false for an unknown name.
bool disablePass(OptimizerOptions& options, std::string_view name);

namespace passes {
std::vector<Node> mergeRepeatedOperators(const std::vector<Node>& code);
std::vector<Node> collapseAssignments(const std::vector<Node>& code, bool oddDeltas = false);
std::vector<Node> collapseOffsets(const std::vector<Node>& code);
std::vector<Node> deferMovements(const std::vector<Node>& code);
std::vector<Node> collapseSimpleMoves(const std::vector<Node>& code);
std::vector<Node> collapseScanLoops(const std::vector<Node>& code);
std::vector<Node> collapseMultiplyLoops(const std::vector<Node>& code);
std::vector<Node> eliminateDeadLoops(const std::vector<Node>& code);
}  // namespace passes

/// @brief Run the enabled passes in their fixed order. Never fails.
std::vector<Node> optimize(const std::vector<Node>& code, const OptimizerOptions& options = {});

}  // namespace brisk
