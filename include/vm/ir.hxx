#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace brisk {

struct ParseNode;

enum class NodeKind : uint8_t {
    AddAt,
    SetAt,
    Move,
    OutputAt,
    InputAt,
    Loop,
    ScanLoop,
    MulAt,
};

inline constexpr std::size_t kNodeKinds = 8;

/// @brief One IR instruction. Offsets are relative to the pointer at the start of
/// the enclosing basic block.
///
/// `value` is the delta for AddAt and Move, the stored value for SetAt, the step for
/// ScanLoop and the factor for MulAt. `target` is only used by MulAt, which adds
/// `tape[p+offset] * value` to `tape[p+target]`.
struct Node {
    NodeKind kind;
    int32_t offset = 0;
    int64_t value = 0;
    int32_t target = 0;
    std::vector<Node> body{};

    friend bool operator==(const Node& a, const Node& b);
    friend bool operator!=(const Node& a, const Node& b) { return !(a == b); }
};

inline Node addAt(int32_t offset, int64_t delta) { return {NodeKind::AddAt, offset, delta}; }
inline Node setAt(int32_t offset, int64_t value) { return {NodeKind::SetAt, offset, value}; }
inline Node move(int64_t delta) { return {NodeKind::Move, 0, delta}; }
inline Node outputAt(int32_t offset) { return {NodeKind::OutputAt, offset}; }
inline Node inputAt(int32_t offset) { return {NodeKind::InputAt, offset}; }
inline Node loop(std::vector<Node> body) { return {NodeKind::Loop, 0, 0, 0, std::move(body)}; }
inline Node scanLoop(int64_t step) { return {NodeKind::ScanLoop, 0, step}; }
inline Node mulAt(int32_t offset, int32_t target, int64_t factor) {
    return {NodeKind::MulAt, offset, factor, target};
}

/// @brief Direct structural translation of a parse tree, no fusion.
std::vector<Node> buildIr(const std::vector<ParseNode>& program);

const char* kindName(NodeKind kind);
std::string toString(const Node& node);
/// @brief Indented multi-line listing, one node per line.
std::string dumpIr(const std::vector<Node>& ir, int indent = 0);

struct IrStats {
    std::uint64_t total = 0;
    std::array<std::uint64_t, kNodeKinds> counts{};

    std::uint64_t count(NodeKind kind) const { return counts[static_cast<std::size_t>(kind)]; }
};

/// @brief Count nodes per kind, including the contents of loop bodies.
IrStats analyze(const std::vector<Node>& ir);
std::string formatStats(const IrStats& stats);

}  // namespace brisk
