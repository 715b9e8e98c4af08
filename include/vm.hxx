/*
    Brisk - An optimizing brainfuck compiler and VM
    VM API declarations
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once
#define BRISK_DEFAULT_EOF_BEHAVIOUR 0
#define BRISK_DYNAMIC_CELLS_SIZE 1
#define BRISK_OPTIMIZE 1
#define BRISK_DEFAULT_TAPE_SIZE 30000
#define BRISK_TAPE_WARN_BYTES (1ull << 30)  // 1 GiB
// Hard limit to prevent uncontrolled memory allocation from user inputs.
// Requests exceeding this limit are rejected by the CLI/REPL.
#define BRISK_TAPE_MAX_BYTES (1ull << 31)  // 2 GiB

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "vm/ir.hxx"
#include "vm/optimizer.hxx"
#include "vm/parser.hxx"

enum class insType : uint8_t {
    ADD_SUB,
    SET,
    PTR_MOV,
    JMP_ZER,
    JMP_NOT_ZER,
    PUT_CHR,
    RAD_CHR,
    MUL_CPY,
    SCN,
    END,
};

struct instruction {
    int64_t data;
    int32_t offset;
    int32_t auxData;  // MUL_CPY target offset, loop index for jumps
    insType op = insType{};
};

namespace brisk {

enum Status : int {
    Ok = 0,
    UnmatchedClose = 1,
    UnmatchedOpen = 2,
    PointerUnderflow = -1,
    PointerOverflow = -2,
    Interrupted = -3,
};

/// @brief Flat, executable form of an IR tree. JMP_ZER and JMP_NOT_ZER hold the distance
/// to their partner in `data`.
struct Program {
    std::vector<instruction> instructions;
    std::size_t loops = 0;
};

struct ProfileInfo {
    std::uint64_t instructions = 0;
    double seconds = 0.0;
    std::vector<std::uint64_t> loopCounts{};
    std::size_t programSize = 0;
};

struct CacheEntry {
    std::string source;
    Program program;
    std::uint64_t lastUsed = 0;
};

using ProgramCache = std::unordered_map<std::uint64_t, CacheEntry>;

/// @brief Lower an IR tree into a flat instruction stream terminated by END.
Program lower(const std::vector<Node>& ir);

/// @brief Full compilation pipeline: parse, build IR, optionally optimize, lower.
/// @return Status::Ok, or the bracket error direction. On failure `out` is untouched.
int compile(std::string_view code, Program& out, bool optimize = BRISK_OPTIMIZE,
            const OptimizerOptions& passes = {}, std::size_t* errorPos = nullptr);

/// @brief Print IR statistics before and after optimization and/or the final IR.
void inspect(const std::vector<ParseNode>& tree, std::ostream& out, bool optimize,
             const OptimizerOptions& passes, bool showIr, bool showStats);

/// @brief Look up `code` in the cache, compiling and inserting it on a miss.
/// @return nullptr when the source does not parse; `status` receives the reason.
const Program* cachedCompile(ProgramCache& cache, std::string_view code, bool optimize,
                             const OptimizerOptions& passes, int& status,
                             std::size_t* errorPos = nullptr);
}  // namespace brisk

#include "vm/executor.hxx"
