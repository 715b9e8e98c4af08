#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "vm/optimizer.hxx"

namespace brisk {
struct ProfileInfo;
struct Program;
struct CacheEntry;
using ProgramCache = std::unordered_map<std::uint64_t, CacheEntry>;

struct RunOptions {
    bool optimize = BRISK_OPTIMIZE;
    OptimizerOptions passes{};
    /// EOF behaviour. 0 = set to 0, 1 = cell unchanged, 2 = set to the cell maximum.
    int eof = BRISK_DEFAULT_EOF_BEHAVIOUR;
    /// Grow the tape on access past its end. A fixed tape fails with PointerOverflow.
    bool dynamicSize = BRISK_DYNAMIC_CELLS_SIZE;
    std::istream* in = nullptr;   // std::cin when null
    std::ostream* out = nullptr;  // std::cout when null
    /// Polled on every loop back-edge. Returning true stops the run with Status::Interrupted.
    std::function<bool()> interrupted{};
    ProfileInfo* profile = nullptr;
    ProgramCache* cache = nullptr;
    std::size_t* errorPos = nullptr;
};

/// @brief Run an already compiled program against `cells`, starting at `cellPtr`.
/// @tparam CellT Cell width type (uint8_t, uint16_t, uint32_t, uint64_t)
/// @return Status::Ok or one of the runtime statuses. `cellPtr` always holds the
/// pointer at the point the run stopped and the tape keeps every write made so far.
template <typename CellT>
int run(const Program& program, std::vector<CellT>& cells, std::size_t& cellPtr,
        const RunOptions& options = {});

/// @brief Compile (through the cache when one is given) and run source code.
///
/// A parse failure returns Status::UnmatchedClose or Status::UnmatchedOpen before
/// anything executes. An empty `cells` vector gets one zero cell.
template <typename CellT>
int execute(std::vector<CellT>& cells, std::size_t& cellPtr, std::string_view code,
            const RunOptions& options = {});
}  // namespace brisk
