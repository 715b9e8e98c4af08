/*
    Brisk - An optimizing brainfuck compiler and VM
    Line-based REPL implementation using linenoise
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#ifdef BRISK_ENABLE_REPL
#include "repl.hxx"

#include <linenoise.h>
#include <simde/x86/sse2.h>

#include <algorithm>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {
constexpr int historyLen = 100;
volatile std::sig_atomic_t interruptRequested = 0;

extern "C" void onInterrupt(int) { interruptRequested = 1; }

// Installs the SIGINT handler for the duration of one run.
struct InterruptScope {
    using Handler = void (*)(int);
    Handler previous;
    InterruptScope() {
        interruptRequested = 0;
        previous = std::signal(SIGINT, onInterrupt);
    }
    ~InterruptScope() { std::signal(SIGINT, previous == SIG_ERR ? SIG_DFL : previous); }
    InterruptScope(const InterruptScope&) = delete;
    InterruptScope& operator=(const InterruptScope&) = delete;
};

bool readToggle(std::istringstream& iss, bool& flag) {
    std::string val;
    iss >> val;
    if (val == "on")
        flag = true;
    else if (val == "off")
        flag = false;
    else
        return false;
    return true;
}

// Indices of cells that differ between two runs. Cells past the old end count when nonzero.
template <typename CellT>
void diffCells(const std::vector<CellT>& prev, const std::vector<CellT>& curr,
               std::vector<size_t>& changed) {
    changed.clear();
    constexpr size_t simdBytes = 16;
    constexpr size_t elemsPerVec = simdBytes / sizeof(CellT);
    constexpr uint32_t laneMask = (1u << sizeof(CellT)) - 1u;
    const size_t limit = std::min(prev.size(), curr.size());
    const size_t vecEnd = (limit / elemsPerVec) * elemsPerVec;
    const auto* a = reinterpret_cast<const uint8_t*>(curr.data());
    const auto* b = reinterpret_cast<const uint8_t*>(prev.data());
    for (size_t off = 0; off < vecEnd * sizeof(CellT); off += simdBytes) {
        const auto va = simde_mm_loadu_si128(reinterpret_cast<const simde__m128i*>(a + off));
        const auto vb = simde_mm_loadu_si128(reinterpret_cast<const simde__m128i*>(b + off));
        const auto mask = static_cast<uint32_t>(simde_mm_movemask_epi8(simde_mm_cmpeq_epi8(va, vb)));
        if (mask == 0xFFFFu) continue;
        const size_t base = off / sizeof(CellT);
        for (size_t j = 0; j < simdBytes; j += sizeof(CellT)) {
            if (((mask >> j) & laneMask) != laneMask) changed.push_back(base + j / sizeof(CellT));
        }
    }
    for (size_t i = vecEnd; i < limit; ++i) {
        if (curr[i] != prev[i]) changed.push_back(i);
    }
    for (size_t i = limit; i < curr.size(); ++i) {
        if (curr[i]) changed.push_back(i);
    }
}

void printHelp() {
    std::cout << "Commands:\n"
              << ":dump              show memory\n"
              << ":size N            resize tape to N cells\n"
              << ":eof 0|1|2         EOF: store 0, keep cell, store max\n"
              << ":opt on|off        toggle optimization\n"
              << ":dyn on|off        toggle dynamic tape\n"
              << ":ir on|off         print the IR before each run\n"
              << ":stats on|off      print IR statistics before each run\n"
              << ":highlight on|off  highlight changed cells\n"
              << ":reset             clear memory and pointer\n"
              << ":bits 8|16|32|64   switch cell width\n"
              << ":q                 quit\n"
              << "A line with an unclosed '[' continues on the next line; Ctrl-C stops a run."
              << std::endl;
}
}  // namespace

template <typename CellT>
int runRepl(std::vector<CellT>& cells, size_t& cellPtr, ReplConfig& cfg) {
    linenoiseHistorySetMaxLen(historyLen);
    brisk::ProgramCache cache;
    std::vector<CellT> prevCells;
    std::vector<size_t> changed;
    std::string pending;
    while (true) {
        char* line = linenoise(pending.empty() ? "$ " : "... ");
        if (line == nullptr) {
            std::cout << std::endl;
            break;  // Ctrl-D or Ctrl-C
        }
        std::string input(line);
        linenoiseHistoryAdd(line);
        std::free(line);
        if (pending.empty() && input.empty()) continue;
        if (pending.empty() && input[0] == ':') {
            std::istringstream iss(input.substr(1));
            std::string cmd;
            iss >> cmd;
            if (cmd == "q" || cmd == "quit") {
                break;
            } else if (cmd == "dump") {
                dumpMemory(cells, cellPtr, std::cout, cfg.highlightChanges ? &changed : nullptr);
            } else if (cmd == "help") {
                printHelp();
            } else if (cmd == "size") {
                size_t n{};
                if (iss >> n && n > 0 && n <= BRISK_TAPE_MAX_BYTES / sizeof(CellT)) {
                    cfg.tapeSize = n;
                    cells.resize(n, 0);
                    if (cellPtr >= n) cellPtr = n - 1;
                } else {
                    std::cout << "Invalid size" << std::endl;
                }
            } else if (cmd == "eof") {
                int v{};
                if (iss >> v && v >= 0 && v <= 2) {
                    cfg.eof = v;
                } else {
                    std::cout << "Invalid EOF" << std::endl;
                }
            } else if (cmd == "opt") {
                if (!readToggle(iss, cfg.optimize)) std::cout << "Use on or off" << std::endl;
            } else if (cmd == "dyn") {
                if (!readToggle(iss, cfg.dynamicSize)) std::cout << "Use on or off" << std::endl;
            } else if (cmd == "ir") {
                if (!readToggle(iss, cfg.showIr)) std::cout << "Use on or off" << std::endl;
            } else if (cmd == "stats") {
                if (!readToggle(iss, cfg.showStats)) std::cout << "Use on or off" << std::endl;
            } else if (cmd == "highlight") {
                if (!readToggle(iss, cfg.highlightChanges)) std::cout << "Use on or off" << std::endl;
                if (!cfg.highlightChanges) changed.clear();
            } else if (cmd == "reset") {
                std::fill(cells.begin(), cells.end(), 0);
                cellPtr = 0;
                changed.clear();
            } else if (cmd == "bits") {
                int w{};
                if (iss >> w && (w == 8 || w == 16 || w == 32 || w == 64)) {
                    return w;
                } else {
                    std::cout << "Unsupported width" << std::endl;
                }
            } else {
                std::cout << "Unknown command" << std::endl;
            }
            continue;
        }

        pending += input;
        pending += '\n';
        std::vector<brisk::ParseNode> tree;
        const int status = brisk::parse(pending, tree);
        if (status == brisk::Status::UnmatchedOpen) continue;
        std::string code;
        code.swap(pending);

        if (status == brisk::Status::Ok && (cfg.showIr || cfg.showStats))
            brisk::inspect(tree, std::cout, cfg.optimize, cfg.passes, cfg.showIr, cfg.showStats);
        if (cfg.highlightChanges) prevCells = cells;

        brisk::RunOptions options;
        options.optimize = cfg.optimize;
        options.passes = cfg.passes;
        options.eof = cfg.eof;
        options.dynamicSize = cfg.dynamicSize;
        options.cache = &cache;
        options.interrupted = [] { return interruptRequested != 0; };
        {
            InterruptScope scope;
            executeExcept(cells, cellPtr, code, options);
        }
        std::cout << std::endl;
        std::cin.clear();
        if (cfg.highlightChanges) diffCells(prevCells, cells, changed);
    }
    return 0;
}

template int runRepl<uint8_t>(std::vector<uint8_t>&, size_t&, ReplConfig&);
template int runRepl<uint16_t>(std::vector<uint16_t>&, size_t&, ReplConfig&);
template int runRepl<uint32_t>(std::vector<uint32_t>&, size_t&, ReplConfig&);
template int runRepl<uint64_t>(std::vector<uint64_t>&, size_t&, ReplConfig&);
#endif  // BRISK_ENABLE_REPL
