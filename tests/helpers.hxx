#pragma once

#include <xxhash.h>

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "vm.hxx"

inline std::uint64_t hashOutput(std::string_view s) { return XXH64(s.data(), s.size(), 0); }

// Runs `code` on the given tape with string-backed input and returns everything printed.
template <typename CellT>
inline std::string runCode(std::string_view code, std::vector<CellT>& cells, size_t& cellPtr,
                           const std::string& input = "", brisk::RunOptions options = {},
                           int* retOut = nullptr) {
    std::istringstream in(input);
    std::ostringstream out;
    options.in = &in;
    options.out = &out;
    const int ret = brisk::execute<CellT>(cells, cellPtr, code, options);
    if (retOut) *retOut = ret;
    return out.str();
}

template <typename CellT>
struct OracleResult {
    int status = brisk::Status::Ok;
    bool finished = false;
    std::string output;
    std::vector<CellT> cells;
    size_t cellPtr = 0;
};

// Character-at-a-time interpreter used as ground truth: growing tape, strict underflow,
// EOF stores zero. Gives up after `budget` steps and reports finished == false.
template <typename CellT>
inline OracleResult<CellT> referenceRun(std::string_view code, const std::string& input,
                                        std::size_t tapeSize, std::uint64_t budget) {
    OracleResult<CellT> r;
    r.cells.assign(tapeSize ? tapeSize : 1, 0);
    std::vector<size_t> match(code.size(), 0);
    std::vector<size_t> open;
    for (size_t i = 0; i < code.size(); ++i) {
        if (code[i] == '[') {
            open.push_back(i);
        } else if (code[i] == ']') {
            if (open.empty()) {
                r.status = brisk::Status::UnmatchedClose;
                r.finished = true;
                return r;
            }
            match[i] = open.back();
            match[open.back()] = i;
            open.pop_back();
        }
    }
    if (!open.empty()) {
        r.status = brisk::Status::UnmatchedOpen;
        r.finished = true;
        return r;
    }
    size_t inPos = 0;
    size_t p = 0;
    for (size_t pc = 0; pc < code.size(); ++pc) {
        if (budget-- == 0) return r;
        switch (code[pc]) {
            case '+':
                ++r.cells[p];
                break;
            case '-':
                --r.cells[p];
                break;
            case '>':
                if (++p == r.cells.size()) r.cells.resize(r.cells.size() * 2, 0);
                break;
            case '<':
                if (p == 0) {
                    r.status = brisk::Status::PointerUnderflow;
                    r.finished = true;
                    r.cellPtr = p;
                    return r;
                }
                --p;
                break;
            case '.':
                r.output.push_back(static_cast<char>(r.cells[p]));
                break;
            case ',':
                r.cells[p] = inPos < input.size()
                                 ? static_cast<CellT>(static_cast<unsigned char>(input[inPos++]))
                                 : 0;
                break;
            case '[':
                if (!r.cells[p]) pc = match[pc];
                break;
            case ']':
                if (r.cells[p]) pc = match[pc];
                break;
            default:
                break;
        }
    }
    r.finished = true;
    r.cellPtr = p;
    return r;
}

// Tape contents without the trailing zero cells, so tapes grown differently compare equal.
template <typename CellT>
inline std::vector<CellT> trimmed(std::vector<CellT> cells) {
    while (!cells.empty() && !cells.back()) cells.pop_back();
    return cells;
}
