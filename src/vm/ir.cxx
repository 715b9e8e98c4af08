/*
    Brisk - An optimizing brainfuck compiler and VM
    IR construction and inspection
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "vm/ir.hxx"

#include <sstream>
#include <string>
#include <vector>

#include "vm/parser.hxx"

namespace brisk {

bool operator==(const Node& a, const Node& b) {
    return a.kind == b.kind && a.offset == b.offset && a.value == b.value &&
           a.target == b.target && a.body == b.body;
}

std::vector<Node> buildIr(const std::vector<ParseNode>& program) {
    std::vector<Node> ir;
    ir.reserve(program.size());
    for (const auto& node : program) {
        switch (node.kind) {
            case Token::Inc:
                ir.push_back(addAt(0, 1));
                break;
            case Token::Dec:
                ir.push_back(addAt(0, -1));
                break;
            case Token::MoveLeft:
                ir.push_back(move(-1));
                break;
            case Token::MoveRight:
                ir.push_back(move(1));
                break;
            case Token::Output:
                ir.push_back(outputAt(0));
                break;
            case Token::Input:
                ir.push_back(inputAt(0));
                break;
            case Token::Loop:
                ir.push_back(loop(buildIr(node.body)));
                break;
        }
    }
    return ir;
}

const char* kindName(NodeKind kind) {
    switch (kind) {
        case NodeKind::AddAt:
            return "AddAt";
        case NodeKind::SetAt:
            return "SetAt";
        case NodeKind::Move:
            return "Move";
        case NodeKind::OutputAt:
            return "OutputAt";
        case NodeKind::InputAt:
            return "InputAt";
        case NodeKind::Loop:
            return "Loop";
        case NodeKind::ScanLoop:
            return "ScanLoop";
        case NodeKind::MulAt:
            return "MulAt";
    }
    return "Unknown";
}

std::string toString(const Node& node) {
    std::ostringstream out;
    out << kindName(node.kind);
    switch (node.kind) {
        case NodeKind::AddAt:
        case NodeKind::SetAt:
            out << '(' << node.offset << ", " << node.value << ')';
            break;
        case NodeKind::Move:
        case NodeKind::ScanLoop:
            out << '(' << node.value << ')';
            break;
        case NodeKind::OutputAt:
        case NodeKind::InputAt:
            out << '(' << node.offset << ')';
            break;
        case NodeKind::MulAt:
            out << '(' << node.offset << " -> " << node.target << ", " << node.value << ')';
            break;
        case NodeKind::Loop:
            out << '[' << node.body.size() << ']';
            break;
    }
    return out.str();
}

std::string dumpIr(const std::vector<Node>& ir, int indent) {
    std::string out;
    const std::string pad(static_cast<std::size_t>(indent) * 2, ' ');
    for (const auto& node : ir) {
        if (node.kind == NodeKind::Loop) {
            out += pad + "Loop {\n";
            out += dumpIr(node.body, indent + 1);
            out += pad + "}\n";
        } else {
            out += pad + toString(node) + '\n';
        }
    }
    return out;
}

static void analyzeInto(const std::vector<Node>& ir, IrStats& stats) {
    for (const auto& node : ir) {
        ++stats.total;
        ++stats.counts[static_cast<std::size_t>(node.kind)];
        if (node.kind == NodeKind::Loop) analyzeInto(node.body, stats);
    }
}

IrStats analyze(const std::vector<Node>& ir) {
    IrStats stats;
    analyzeInto(ir, stats);
    return stats;
}

std::string formatStats(const IrStats& stats) {
    std::ostringstream out;
    out << "nodes: " << stats.total;
    for (std::size_t i = 0; i < kNodeKinds; ++i) {
        if (!stats.counts[i]) continue;
        out << ' ' << kindName(static_cast<NodeKind>(i)) << '=' << stats.counts[i];
    }
    return out.str();
}

}  // namespace brisk
