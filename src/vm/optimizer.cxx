/*
    Brisk - An optimizing brainfuck compiler and VM
    IR rewrite passes
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "vm/optimizer.hxx"

#include <cstdint>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace brisk {
namespace {

bool isCellOp(NodeKind kind) {
    switch (kind) {
        case NodeKind::AddAt:
        case NodeKind::SetAt:
        case NodeKind::OutputAt:
        case NodeKind::InputAt:
        case NodeKind::MulAt:
            return true;
        default:
            return false;
    }
}

Node shifted(Node node, int64_t by) {
    node.offset = static_cast<int32_t>(node.offset + by);
    if (node.kind == NodeKind::MulAt) node.target = static_cast<int32_t>(node.target + by);
    return node;
}

bool isClearDelta(int64_t delta, bool oddDeltas) {
    if (delta == 1 || delta == -1) return true;
    return oddDeltas && (delta % 2 != 0);
}

// Body of a counting loop: only adds, and the loop cell drops by exactly one per pass.
bool isMultiplyLoop(const std::vector<Node>& body) {
    if (body.empty()) return false;
    int64_t counter = 0;
    for (const auto& node : body) {
        if (node.kind != NodeKind::AddAt) return false;
        if (node.offset == 0) counter += node.value;
    }
    return counter == -1;
}

std::vector<Node> eliminateDeadLoopsIn(const std::vector<Node>& code, bool cellIsZero) {
    std::vector<Node> out;
    out.reserve(code.size());
    for (const auto& node : code) {
        switch (node.kind) {
            case NodeKind::Loop:
                if (cellIsZero) break;
                out.push_back(loop(eliminateDeadLoopsIn(node.body, false)));
                cellIsZero = true;
                break;
            case NodeKind::ScanLoop:
                if (cellIsZero) break;
                out.push_back(node);
                cellIsZero = true;
                break;
            case NodeKind::SetAt:
                out.push_back(node);
                if (node.offset == 0) cellIsZero = node.value == 0;
                break;
            case NodeKind::AddAt:
            case NodeKind::InputAt:
                out.push_back(node);
                if (node.offset == 0) cellIsZero = false;
                break;
            case NodeKind::MulAt:
                out.push_back(node);
                if (node.target == 0) cellIsZero = false;
                break;
            case NodeKind::Move:
                out.push_back(node);
                cellIsZero = false;
                break;
            case NodeKind::OutputAt:
                out.push_back(node);
                break;
        }
    }
    return out;
}

}  // namespace

bool disablePass(OptimizerOptions& options, std::string_view name) {
    if (name == "merge")
        options.mergeOperators = false;
    else if (name == "assign")
        options.collapseAssignments = false;
    else if (name == "offsets")
        options.collapseOffsets = false;
    else if (name == "defer")
        options.deferMovements = false;
    else if (name == "scan")
        options.collapseScanLoops = false;
    else if (name == "mul")
        options.collapseMultiplyLoops = false;
    else if (name == "dead")
        options.eliminateDeadLoops = false;
    else
        return false;
    return true;
}

namespace passes {

// ++++ becomes AddAt(0, 4), >>< becomes Move(1). Pairs that cancel out vanish, which may
// expose a new mergeable pair, so the result never holds two adjacent mergeable nodes.
std::vector<Node> mergeRepeatedOperators(const std::vector<Node>& code) {
    std::vector<Node> out;
    out.reserve(code.size());
    for (const auto& node : code) {
        if (node.kind == NodeKind::Loop) {
            out.push_back(loop(mergeRepeatedOperators(node.body)));
            continue;
        }
        if (!out.empty()) {
            Node& last = out.back();
            const bool sameAdd = last.kind == NodeKind::AddAt && node.kind == NodeKind::AddAt &&
                                 last.offset == node.offset;
            const bool bothMove = last.kind == NodeKind::Move && node.kind == NodeKind::Move;
            if (sameAdd || bothMove) {
                last.value += node.value;
                if (last.value == 0) out.pop_back();
                continue;
            }
        }
        if ((node.kind == NodeKind::AddAt || node.kind == NodeKind::Move) && node.value == 0)
            continue;
        out.push_back(node);
    }
    return out;
}

// [-] and [+] become SetAt(0, 0). A set absorbs the adds that follow it and
// replaces any add or set on the same cell right before it.
std::vector<Node> collapseAssignments(const std::vector<Node>& code, bool oddDeltas) {
    std::vector<Node> out;
    out.reserve(code.size());
    for (const auto& node : code) {
        Node current = node;
        if (node.kind == NodeKind::Loop) {
            auto body = collapseAssignments(node.body, oddDeltas);
            if (body.size() == 1 && body[0].kind == NodeKind::AddAt && body[0].offset == 0 &&
                isClearDelta(body[0].value, oddDeltas)) {
                current = setAt(0, 0);
            } else {
                current = loop(std::move(body));
            }
        }
        if (current.kind == NodeKind::AddAt && !out.empty() &&
            out.back().kind == NodeKind::SetAt && out.back().offset == current.offset) {
            out.back().value += current.value;
            continue;
        }
        if (current.kind == NodeKind::SetAt) {
            while (!out.empty() &&
                   (out.back().kind == NodeKind::AddAt || out.back().kind == NodeKind::SetAt) &&
                   out.back().offset == current.offset) {
                out.pop_back();
            }
        }
        out.push_back(std::move(current));
    }
    return out;
}

// Move(a), ops..., Move(b) becomes ops shifted by a, then Move(a + b). With b == -a the
// movement disappears entirely: >+< is AddAt(1, 1).
std::vector<Node> collapseOffsets(const std::vector<Node>& code) {
    std::vector<Node> block(code.begin(), code.end());
    std::vector<Node> out;
    out.reserve(block.size());
    for (std::size_t i = 0; i < block.size(); ++i) {
        const Node& node = block[i];
        if (node.kind == NodeKind::Loop) {
            out.push_back(loop(collapseOffsets(node.body)));
            continue;
        }
        if (node.kind != NodeKind::Move) {
            out.push_back(node);
            continue;
        }
        std::size_t j = i + 1;
        while (j < block.size() && isCellOp(block[j].kind)) ++j;
        if (j == block.size() || block[j].kind != NodeKind::Move) {
            if (node.value != 0) out.push_back(node);
            continue;
        }
        for (std::size_t k = i + 1; k < j; ++k) out.push_back(shifted(block[k], node.value));
        // The closing move carries the sum and may open the next window.
        block[j].value += node.value;
        i = j - 1;
    }
    return out;
}

// Every Move inside a basic block is folded into the offsets of the nodes after it.
// The pending distance is emitted before loops and at the end of the block, where the
// real pointer position matters.
std::vector<Node> deferMovements(const std::vector<Node>& code) {
    std::vector<Node> out;
    out.reserve(code.size());
    int64_t pending = 0;
    auto flush = [&]() {
        if (pending != 0) out.push_back(move(pending));
        pending = 0;
    };
    for (const auto& node : code) {
        switch (node.kind) {
            case NodeKind::Move:
                pending += node.value;
                break;
            case NodeKind::Loop:
                flush();
                out.push_back(loop(deferMovements(node.body)));
                break;
            case NodeKind::ScanLoop:
                flush();
                out.push_back(node);
                break;
            default:
                out.push_back(shifted(node, pending));
                break;
        }
    }
    flush();
    return out;
}

std::vector<Node> collapseSimpleMoves(const std::vector<Node>& code) {
    std::vector<Node> out;
    out.reserve(code.size());
    for (const auto& node : code) {
        if (node.kind == NodeKind::Loop) {
            out.push_back(loop(collapseSimpleMoves(node.body)));
            continue;
        }
        if (node.kind != NodeKind::Move) {
            out.push_back(node);
            continue;
        }
        if (!out.empty() && out.back().kind == NodeKind::Move) {
            out.back().value += node.value;
            if (out.back().value == 0) out.pop_back();
        } else if (node.value != 0) {
            out.push_back(node);
        }
    }
    return out;
}

// [>>] becomes ScanLoop(2)
std::vector<Node> collapseScanLoops(const std::vector<Node>& code) {
    std::vector<Node> out;
    out.reserve(code.size());
    for (const auto& node : code) {
        if (node.kind != NodeKind::Loop) {
            out.push_back(node);
            continue;
        }
        auto body = collapseScanLoops(node.body);
        if (body.size() == 1 && body[0].kind == NodeKind::Move && body[0].value != 0) {
            out.push_back(scanLoop(body[0].value));
        } else {
            out.push_back(loop(std::move(body)));
        }
    }
    return out;
}

// [->+>++<<] becomes MulAt(0 -> 1, 1), MulAt(0 -> 2, 2), SetAt(0, 0). Needs a body
// without movement, so it only fires after offsets have been folded in.
std::vector<Node> collapseMultiplyLoops(const std::vector<Node>& code) {
    std::vector<Node> out;
    out.reserve(code.size());
    for (const auto& node : code) {
        if (node.kind != NodeKind::Loop) {
            out.push_back(node);
            continue;
        }
        auto body = collapseMultiplyLoops(node.body);
        if (!isMultiplyLoop(body)) {
            out.push_back(loop(std::move(body)));
            continue;
        }
        std::unordered_map<int32_t, int64_t> factors;
        std::vector<int32_t> order;
        for (const auto& add : body) {
            if (add.offset == 0) continue;
            if (factors.insert({add.offset, add.value}).second)
                order.push_back(add.offset);
            else
                factors[add.offset] += add.value;
        }
        for (const auto target : order) {
            if (factors[target] != 0) out.push_back(mulAt(0, target, factors[target]));
        }
        out.push_back(setAt(0, 0));
    }
    return out;
}

// A loop entered while the current cell is known to be zero never runs. That holds
// right after another loop or a clear; nothing is assumed about the initial tape.
std::vector<Node> eliminateDeadLoops(const std::vector<Node>& code) {
    return eliminateDeadLoopsIn(code, false);
}

}  // namespace passes

std::vector<Node> optimize(const std::vector<Node>& code, const OptimizerOptions& options) {
    std::vector<Node> ir = code;
    if (options.mergeOperators) ir = passes::mergeRepeatedOperators(ir);
    if (options.collapseAssignments) ir = passes::collapseAssignments(ir, options.oddDeltaClears);
    if (options.collapseOffsets) ir = passes::collapseOffsets(ir);
    if (options.deferMovements) ir = passes::deferMovements(ir);
    if (options.mergeOperators || options.deferMovements) ir = passes::collapseSimpleMoves(ir);
    if (options.collapseScanLoops) ir = passes::collapseScanLoops(ir);
    if (options.collapseMultiplyLoops) {
        ir = passes::collapseMultiplyLoops(ir);
        if (options.collapseAssignments)
            ir = passes::collapseAssignments(ir, options.oddDeltaClears);
        if (options.deferMovements) ir = passes::deferMovements(ir);
        ir = passes::collapseSimpleMoves(ir);
    }
    if (options.eliminateDeadLoops) {
        ir = passes::eliminateDeadLoops(ir);
        if (options.collapseAssignments)
            ir = passes::collapseAssignments(ir, options.oddDeltaClears);
    }
    return ir;
}

}  // namespace brisk
