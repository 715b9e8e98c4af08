#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace brisk {

enum class Token : uint8_t {
    Inc,
    Dec,
    MoveLeft,
    MoveRight,
    Output,
    Input,
    Loop,
};

struct ParseNode {
    Token kind;
    std::vector<ParseNode> body{};

    friend bool operator==(const ParseNode& a, const ParseNode& b);
};

inline bool isInstruction(char c) {
    switch (c) {
        case '+':
        case '-':
        case '>':
        case '<':
        case '[':
        case ']':
        case '.':
        case ',':
            return true;
        default:
            return false;
    }
}

/// @brief Parse source text into a loop tree. Non-instruction characters are skipped.
/// @param errorPos Receives the offset of the offending bracket on failure.
/// @return 0, Status::UnmatchedClose or Status::UnmatchedOpen. `program` is only
/// written on success.
int parse(std::string_view code, std::vector<ParseNode>& program,
          std::size_t* errorPos = nullptr);

/// @brief Canonical instruction characters of a parse tree.
std::string serialize(const std::vector<ParseNode>& program);

/// @brief "unmatched close bracket at line 3, column 7"
std::string describeParseError(int status, std::string_view code, std::size_t errorPos);

}  // namespace brisk
