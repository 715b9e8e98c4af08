/*
    Brisk - An optimizing brainfuck compiler and VM
    VM implementation
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later

#include "vm.hxx"

#include <simde/x86/sse2.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#define TZCNT32(x) __builtin_ctz((unsigned)(x))
#define LZCNT32(x) __builtin_clz((unsigned)(x))

namespace {

// Offset of the first zero byte in p[0, n), n when there is none.
inline std::size_t simdScan0Fwd(const uint8_t* p, std::size_t n) {
    const simde__m128i zero = simde_mm_setzero_si128();
    std::size_t i = 0;
    for (; i + 16 <= n; i += 16) {
        const simde__m128i v = simde_mm_loadu_si128(reinterpret_cast<const simde__m128i*>(p + i));
        const int mask = simde_mm_movemask_epi8(simde_mm_cmpeq_epi8(v, zero));
        if (mask) return i + static_cast<std::size_t>(TZCNT32(mask));
    }
    for (; i < n; ++i) {
        if (!p[i]) return i;
    }
    return n;
}

// Distance from base[pos] down to the nearest zero at or below it, pos + 1 when there is none.
inline std::size_t simdScan0Back(const uint8_t* base, std::size_t pos) {
    const simde__m128i zero = simde_mm_setzero_si128();
    std::size_t left = pos + 1;
    while (left >= 16) {
        const simde__m128i v =
            simde_mm_loadu_si128(reinterpret_cast<const simde__m128i*>(base + left - 16));
        const int mask = simde_mm_movemask_epi8(simde_mm_cmpeq_epi8(v, zero));
        if (mask) return pos - (left - 16 + static_cast<std::size_t>(31 - LZCNT32(mask)));
        left -= 16;
    }
    while (left > 0) {
        --left;
        if (!base[left]) return pos - left;
    }
    return pos + 1;
}

template <typename CellT>
inline CellT wrapAdd(CellT cell, int64_t delta) {
    return static_cast<CellT>(static_cast<uint64_t>(cell) + static_cast<uint64_t>(delta));
}

void lowerInto(const std::vector<brisk::Node>& ir, brisk::Program& program) {
    using brisk::NodeKind;
    auto& code = program.instructions;
    for (const auto& node : ir) {
        instruction inst{};
        inst.offset = node.offset;
        inst.data = node.value;
        switch (node.kind) {
            case NodeKind::AddAt:
                inst.op = insType::ADD_SUB;
                break;
            case NodeKind::SetAt:
                inst.op = insType::SET;
                break;
            case NodeKind::Move:
                inst.op = insType::PTR_MOV;
                break;
            case NodeKind::OutputAt:
                inst.op = insType::PUT_CHR;
                break;
            case NodeKind::InputAt:
                inst.op = insType::RAD_CHR;
                break;
            case NodeKind::MulAt:
                inst.op = insType::MUL_CPY;
                inst.auxData = node.target;
                break;
            case NodeKind::ScanLoop:
                inst.op = insType::SCN;
                break;
            case NodeKind::Loop: {
                const std::size_t open = code.size();
                const auto id = static_cast<int32_t>(program.loops++);
                code.push_back({0, 0, id, insType::JMP_ZER});
                lowerInto(node.body, program);
                const std::size_t close = code.size();
                const auto distance = static_cast<int64_t>(close - open);
                code.push_back({distance, 0, id, insType::JMP_NOT_ZER});
                code[open].data = distance;
                continue;
            }
        }
        code.push_back(inst);
    }
}

template <typename CellT, bool Dynamic>
int runImpl(const brisk::Program& program, std::vector<CellT>& cells, size_t& cellPtr,
            const brisk::RunOptions& options) {
    using brisk::Status;
    static void* jtable[] = {&&_ADD_SUB, &&_SET,     &&_PTR_MOV, &&_JMP_ZER, &&_JMP_NOT_ZER,
                             &&_PUT_CHR, &&_RAD_CHR, &&_MUL_CPY, &&_SCN,     &&_END};

    std::istream& in = options.in ? *options.in : std::cin;
    std::ostream& out = options.out ? *options.out : std::cout;
    brisk::ProfileInfo* profile = options.profile;
    if (profile) {
        profile->loopCounts.assign(program.loops, 0);
        profile->programSize = program.instructions.size();
    }
    if (program.instructions.empty()) return Status::Ok;
    if (cells.empty()) cells.resize(1, 0);

    constexpr std::size_t maxCells = BRISK_TAPE_MAX_BYTES / sizeof(CellT);
    CellT* base = cells.data();
    std::size_t ptr = cellPtr;

    auto grow = [&](std::size_t needed) -> bool {
        if (needed > maxCells) {
            std::cerr << "tape size limit reached" << std::endl;
            return false;
        }
        std::size_t size = cells.size();
        while (size < needed) size *= 2;
        cells.resize(std::min(size, maxCells), 0);
        base = cells.data();
        return true;
    };
    // Index of pointer + off, growing the tape to the right when allowed.
    auto reach = [&](int64_t off, std::size_t& idx) -> int {
        const int64_t target = static_cast<int64_t>(ptr) + off;
        if (target < 0) return Status::PointerUnderflow;
        idx = static_cast<std::size_t>(target);
        if (idx >= cells.size()) {
            if constexpr (Dynamic) {
                if (!grow(idx + 1)) return Status::PointerOverflow;
            } else {
                return Status::PointerOverflow;
            }
        }
        return Status::Ok;
    };
    auto fail = [&](int status) -> int {
        cellPtr = ptr;
        out.flush();
        switch (status) {
            case Status::PointerUnderflow:
                std::cerr << "cell pointer moved before start" << std::endl;
                break;
            case Status::PointerOverflow:
                std::cerr << "cell pointer moved beyond end" << std::endl;
                break;
            case Status::Interrupted:
                std::cerr << "execution interrupted" << std::endl;
                break;
        }
        return status;
    };

    if (ptr >= cells.size()) {
        std::size_t idx;
        ptr = cells.size() - 1;
        if (const int ret = reach(static_cast<int64_t>(cellPtr - ptr), idx); ret != Status::Ok)
            return fail(ret);
        ptr = idx;
    }

    const instruction* insp = program.instructions.data();
    goto* jtable[static_cast<std::size_t>(insp->op)];

#define LOOP()                            \
    insp++;                               \
    if (profile) ++profile->instructions; \
    goto* jtable[static_cast<std::size_t>(insp->op)]
#define RESOLVE(idx, off)                                                      \
    std::size_t idx = ptr;                                                     \
    if ((off) != 0) {                                                          \
        if (const int ret = reach((off), idx); ret != Status::Ok) [[unlikely]] \
            return fail(ret);                                                  \
    }

_ADD_SUB: {
    RESOLVE(idx, insp->offset)
    base[idx] = wrapAdd(base[idx], insp->data);
    LOOP();
}

_SET: {
    RESOLVE(idx, insp->offset)
    base[idx] = static_cast<CellT>(insp->data);
    LOOP();
}

_PTR_MOV: {
    std::size_t idx;
    if (const int ret = reach(insp->data, idx); ret != Status::Ok) return fail(ret);
    ptr = idx;
    LOOP();
}

_JMP_ZER: {
    if (!base[ptr]) [[unlikely]] {
        insp += insp->data;
    } else if (profile) {
        ++profile->loopCounts[static_cast<std::size_t>(insp->auxData)];
    }
    LOOP();
}

_JMP_NOT_ZER: {
    if (base[ptr]) [[likely]] {
        if (profile) ++profile->loopCounts[static_cast<std::size_t>(insp->auxData)];
        if (options.interrupted && options.interrupted()) return fail(Status::Interrupted);
        insp -= insp->data;
    }
    LOOP();
}

_PUT_CHR: {
    RESOLVE(idx, insp->offset)
    out.put(static_cast<char>(base[idx]));
    LOOP();
}

_RAD_CHR: {
    RESOLVE(idx, insp->offset)
    out.flush();
    const auto ch = in.get();
    if (ch == std::char_traits<char>::eof()) {
        switch (options.eof) {
            case 0:
                base[idx] = 0;
                break;
            case 1:
                break;
            case 2:
                base[idx] = std::numeric_limits<CellT>::max();
                break;
        }
    } else {
        base[idx] = static_cast<CellT>(ch);
    }
    LOOP();
}

_MUL_CPY: {
    RESOLVE(src, insp->offset)
    // A zero counter means the original loop never ran and never touched the target.
    if (!base[src]) {
        LOOP();
    }
    RESOLVE(dst, insp->auxData)
    const uint64_t product = static_cast<uint64_t>(base[src]) * static_cast<uint64_t>(insp->data);
    base[dst] = static_cast<CellT>(static_cast<uint64_t>(base[dst]) + product);
    LOOP();
}

_SCN: {
    const int64_t step = insp->data;
    if constexpr (sizeof(CellT) == 1) {
        // Jump close to the answer; the scalar loop below finishes off or reports the edge.
        const auto* bytes = reinterpret_cast<const uint8_t*>(base);
        if (step == 1 && bytes[ptr]) {
            const std::size_t remaining = cells.size() - ptr;
            ptr += std::min(simdScan0Fwd(bytes + ptr, remaining), remaining - 1);
        } else if (step == -1 && bytes[ptr]) {
            ptr -= std::min(simdScan0Back(bytes, ptr), ptr);
        }
    }
    while (base[ptr]) {
        std::size_t idx;
        if (const int ret = reach(step, idx); ret != Status::Ok) return fail(ret);
        ptr = idx;
    }
    LOOP();
}

_END:
    cellPtr = ptr;
    out.flush();
    return Status::Ok;

#undef RESOLVE
#undef LOOP
}

}  // namespace

namespace brisk {

Program lower(const std::vector<Node>& ir) {
    Program program;
    lowerInto(ir, program);
    program.instructions.push_back({0, 0, 0, insType::END});
    return program;
}

int compile(std::string_view code, Program& out, bool optimize, const OptimizerOptions& passes,
            std::size_t* errorPos) {
    std::vector<ParseNode> tree;
    if (const int ret = parse(code, tree, errorPos); ret != Status::Ok) return ret;
    auto ir = buildIr(tree);
    if (optimize) ir = brisk::optimize(ir, passes);
    out = lower(ir);
    return Status::Ok;
}

void inspect(const std::vector<ParseNode>& tree, std::ostream& out, bool optimize,
             const OptimizerOptions& passes, bool showIr, bool showStats) {
    const auto raw = buildIr(tree);
    const auto ir = optimize ? brisk::optimize(raw, passes) : raw;
    if (showStats) {
        out << "before: " << formatStats(analyze(raw)) << '\n';
        out << "after:  " << formatStats(analyze(ir)) << '\n';
    }
    if (showIr) out << dumpIr(ir);
    out.flush();
}

template <typename CellT>
int run(const Program& program, std::vector<CellT>& cells, std::size_t& cellPtr,
        const RunOptions& options) {
    std::chrono::steady_clock::time_point start;
    if (options.profile) {
        options.profile->instructions = 0;
        start = std::chrono::steady_clock::now();
    }
    const int ret = options.dynamicSize ? runImpl<CellT, true>(program, cells, cellPtr, options)
                                        : runImpl<CellT, false>(program, cells, cellPtr, options);
    if (options.profile)
        options.profile->seconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    return ret;
}

template <typename CellT>
int execute(std::vector<CellT>& cells, std::size_t& cellPtr, std::string_view code,
            const RunOptions& options) {
    if (options.cache) {
        int status = Status::Ok;
        const Program* program = cachedCompile(*options.cache, code, options.optimize,
                                               options.passes, status, options.errorPos);
        if (!program) return status;
        return run<CellT>(*program, cells, cellPtr, options);
    }
    Program program;
    if (const int ret = compile(code, program, options.optimize, options.passes, options.errorPos);
        ret != Status::Ok)
        return ret;
    return run<CellT>(program, cells, cellPtr, options);
}

template int run<uint8_t>(const Program&, std::vector<uint8_t>&, std::size_t&, const RunOptions&);
template int run<uint16_t>(const Program&, std::vector<uint16_t>&, std::size_t&,
                           const RunOptions&);
template int run<uint32_t>(const Program&, std::vector<uint32_t>&, std::size_t&,
                           const RunOptions&);
template int run<uint64_t>(const Program&, std::vector<uint64_t>&, std::size_t&,
                           const RunOptions&);

template int execute<uint8_t>(std::vector<uint8_t>&, std::size_t&, std::string_view,
                              const RunOptions&);
template int execute<uint16_t>(std::vector<uint16_t>&, std::size_t&, std::string_view,
                               const RunOptions&);
template int execute<uint32_t>(std::vector<uint32_t>&, std::size_t&, std::string_view,
                               const RunOptions&);
template int execute<uint64_t>(std::vector<uint64_t>&, std::size_t&, std::string_view,
                               const RunOptions&);

}  // namespace brisk
