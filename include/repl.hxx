/*
    Brisk - An optimizing brainfuck compiler and VM
    Front end helpers and REPL API declarations
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "cpp-terminal/color.hpp"
#include "cpp-terminal/style.hpp"
#include "vm.hxx"

inline std::string errorTag() {
    return Term::color_fg(Term::Color::Name::Red) + "ERROR:" +
           Term::color_fg(Term::Color::Name::Default);
}

inline std::string warningTag() {
    return Term::color_fg(Term::Color::Name::Yellow) + "WARNING:" +
           Term::color_fg(Term::Color::Name::Default);
}

struct ReplConfig {
    bool optimize;
    bool dynamicSize;
    int eof;
    size_t tapeSize;
    int cellWidth;
    brisk::OptimizerOptions passes;
    bool showIr;
    bool showStats;
    bool highlightChanges;
};

template <typename CellT>
inline void dumpMemory(const std::vector<CellT>& cells, size_t cellPtr,
                       std::ostream& out = std::cout, const std::vector<size_t>* changed = nullptr) {
    if (cells.empty()) {
        out << "Memory dump:" << '\n' << "<empty>" << std::endl;
        return;
    }
    size_t lastNonEmpty = cells.size() - 1;
    while (lastNonEmpty > cellPtr && lastNonEmpty > 0 && !cells[lastNonEmpty]) --lastNonEmpty;

    const std::string plain = Term::color_fg(Term::Color::Name::Default);
    out << "Memory dump:" << '\n'
        << Term::style(Term::Style::Underline) << "row+col |0  |1  |2  |3  |4  |5  |6  |7  |8  |9  |"
        << Term::style(Term::Style::Reset) << std::endl;
    const size_t end = std::max(lastNonEmpty, std::min(cellPtr, cells.size() - 1));
    for (size_t i = 0; i <= end; ++i) {
        if (i % 10 == 0) {
            if (i) out << '\n';
            const std::string row = std::to_string(i);
            out << row << std::string(row.size() < 8 ? 8 - row.size() : 0, ' ') << '|';
        }
        const bool touched =
            changed && std::find(changed->begin(), changed->end(), i) != changed->end();
        std::string color = plain;
        if (i == cellPtr)
            color = Term::color_fg(Term::Color::Name::Green);
        else if (touched)
            color = Term::color_fg(Term::Color::Name::Yellow);
        const std::string cell = std::to_string(cells[i]);
        out << color << cell << plain << std::string(cell.size() < 3 ? 3 - cell.size() : 0, ' ')
            << '|';
    }
    out << std::endl;
}

/// @brief Run `code` and print a located message for bracket errors.
/// Runtime failures are already reported by the VM itself.
template <typename CellT>
inline int executeExcept(std::vector<CellT>& cells, size_t& cellPtr, std::string_view code,
                         brisk::RunOptions options) {
    std::size_t errorPos = 0;
    options.errorPos = &errorPos;
    const int ret = brisk::execute<CellT>(cells, cellPtr, code, options);
    if (ret == brisk::Status::UnmatchedClose || ret == brisk::Status::UnmatchedOpen) {
        std::cout << errorTag() << ' ' << brisk::describeParseError(ret, code, errorPos)
                  << std::endl;
    }
    return ret;
}

#ifdef BRISK_ENABLE_REPL
/// @brief Interactive loop over a caller-owned tape.
/// @return 0 on exit, or the new cell width requested with `:bits`.
template <typename CellT>
int runRepl(std::vector<CellT>& cells, size_t& cellPtr, ReplConfig& cfg);

extern template int runRepl<uint8_t>(std::vector<uint8_t>&, size_t&, ReplConfig&);
extern template int runRepl<uint16_t>(std::vector<uint16_t>&, size_t&, ReplConfig&);
extern template int runRepl<uint32_t>(std::vector<uint32_t>&, size_t&, ReplConfig&);
extern template int runRepl<uint64_t>(std::vector<uint64_t>&, size_t&, ReplConfig&);
#endif  // BRISK_ENABLE_REPL
