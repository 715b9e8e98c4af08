/*
    Brisk - An optimizing brainfuck compiler and VM
    Source parser
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "vm/parser.hxx"

#include <string>
#include <utility>
#include <vector>

#include "vm.hxx"

namespace brisk {

bool operator==(const ParseNode& a, const ParseNode& b) {
    return a.kind == b.kind && a.body == b.body;
}

int parse(std::string_view code, std::vector<ParseNode>& program, std::size_t* errorPos) {
    // One open sequence per unclosed bracket, plus the top level.
    std::vector<std::vector<ParseNode>> nested(1);
    std::vector<std::size_t> openPos;
    for (std::size_t i = 0; i < code.size(); ++i) {
        switch (code[i]) {
            case '+':
                nested.back().push_back({Token::Inc});
                break;
            case '-':
                nested.back().push_back({Token::Dec});
                break;
            case '<':
                nested.back().push_back({Token::MoveLeft});
                break;
            case '>':
                nested.back().push_back({Token::MoveRight});
                break;
            case '.':
                nested.back().push_back({Token::Output});
                break;
            case ',':
                nested.back().push_back({Token::Input});
                break;
            case '[':
                nested.emplace_back();
                openPos.push_back(i);
                break;
            case ']': {
                if (openPos.empty()) {
                    if (errorPos) *errorPos = i;
                    return Status::UnmatchedClose;
                }
                std::vector<ParseNode> body = std::move(nested.back());
                nested.pop_back();
                openPos.pop_back();
                nested.back().push_back({Token::Loop, std::move(body)});
                break;
            }
            default:
                break;
        }
    }
    if (!openPos.empty()) {
        if (errorPos) *errorPos = openPos.back();
        return Status::UnmatchedOpen;
    }
    program = std::move(nested.front());
    return Status::Ok;
}

static void serializeInto(const std::vector<ParseNode>& program, std::string& out) {
    for (const auto& node : program) {
        switch (node.kind) {
            case Token::Inc:
                out += '+';
                break;
            case Token::Dec:
                out += '-';
                break;
            case Token::MoveLeft:
                out += '<';
                break;
            case Token::MoveRight:
                out += '>';
                break;
            case Token::Output:
                out += '.';
                break;
            case Token::Input:
                out += ',';
                break;
            case Token::Loop:
                out += '[';
                serializeInto(node.body, out);
                out += ']';
                break;
        }
    }
}

std::string serialize(const std::vector<ParseNode>& program) {
    std::string out;
    serializeInto(program, out);
    return out;
}

std::string describeParseError(int status, std::string_view code, std::size_t errorPos) {
    std::size_t line = 1, column = 1;
    for (std::size_t i = 0; i < errorPos && i < code.size(); ++i) {
        if (code[i] == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
    }
    std::string what;
    switch (status) {
        case Status::UnmatchedClose:
            what = "Unmatched close bracket";
            break;
        case Status::UnmatchedOpen:
            what = "Unmatched open bracket";
            break;
        default:
            return "Unknown parse error";
    }
    return what + " at line " + std::to_string(line) + ", column " + std::to_string(column);
}

}  // namespace brisk
