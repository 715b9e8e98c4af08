/*
    Brisk - An optimizing brainfuck compiler and VM
    Compiled program cache
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <xxhash.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "vm.hxx"

namespace {
constexpr std::size_t kCacheExpectedEntries = 64;
constexpr std::size_t kCacheMaxEntries = 64;
std::uint64_t cacheCounter = 0;

std::uint64_t optionBits(bool optimize, const brisk::OptimizerOptions& passes) {
    std::uint64_t bits = optimize;
    bits |= static_cast<std::uint64_t>(passes.mergeOperators) << 1;
    bits |= static_cast<std::uint64_t>(passes.collapseAssignments) << 2;
    bits |= static_cast<std::uint64_t>(passes.collapseOffsets) << 3;
    bits |= static_cast<std::uint64_t>(passes.deferMovements) << 4;
    bits |= static_cast<std::uint64_t>(passes.collapseScanLoops) << 5;
    bits |= static_cast<std::uint64_t>(passes.collapseMultiplyLoops) << 6;
    bits |= static_cast<std::uint64_t>(passes.eliminateDeadLoops) << 7;
    bits |= static_cast<std::uint64_t>(passes.oddDeltaClears) << 8;
    return bits;
}
}  // namespace

namespace brisk {

const Program* cachedCompile(ProgramCache& cache, std::string_view code, bool optimize,
                             const OptimizerOptions& passes, int& status,
                             std::size_t* errorPos) {
    if (cache.empty()) cache.reserve(kCacheExpectedEntries);
    const std::uint64_t key = XXH64(code.data(), code.size(), optionBits(optimize, passes));
    auto it = cache.find(key);
    if (it != cache.end() && it->second.source == code) {
        it->second.lastUsed = ++cacheCounter;
        status = Status::Ok;
        return &it->second.program;
    }
    Program program;
    status = compile(code, program, optimize, passes, errorPos);
    if (status != Status::Ok) return nullptr;

    auto& entry = cache[key];
    entry.source = std::string(code);
    entry.program = std::move(program);
    entry.lastUsed = ++cacheCounter;
    if (cache.size() > kCacheMaxEntries) {
        auto victim = cache.begin();
        for (auto iter = cache.begin(); iter != cache.end(); ++iter) {
            if (iter->second.lastUsed < victim->second.lastUsed) victim = iter;
        }
        cache.erase(victim);
    }
    return &entry.program;
}

}  // namespace brisk
