#include <cassert>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "helpers.hxx"
#include "vm.hxx"

namespace {
constexpr int kPrograms = 1000;
constexpr std::uint64_t kStepBudget = 50000;
constexpr std::size_t kTapeSize = 16;

// Fragments that the optimizer has dedicated rewrites for, mixed with single symbols.
const char* const kIdioms[] = {"[-]", "[+]",     "[->+<]", "[->>++<<]", "[>]",  "[<]",
                               "[<<]", "[-<+>]", ">+<",    "<<->>",     "[-]+", "+[-]"};

void appendRandom(std::mt19937& gen, std::string& out, int depth, int length) {
    static const char ops[] = "+-<>.,";
    std::uniform_int_distribution<int> pick(0, 9);
    std::uniform_int_distribution<int> opDist(0, sizeof(ops) - 2);
    std::uniform_int_distribution<int> idiomDist(0, sizeof(kIdioms) / sizeof(kIdioms[0]) - 1);
    for (int i = 0; i < length; ++i) {
        const int kind = pick(gen);
        if (kind < 6) {
            out += ops[opDist(gen)];
        } else if (kind < 8) {
            out += kIdioms[idiomDist(gen)];
        } else if (depth < 3) {
            out += '[';
            appendRandom(gen, out, depth + 1, length / 2);
            out += ']';
        }
    }
}

template <typename CellT>
struct VmResult {
    int status;
    std::string output;
    std::vector<CellT> cells;
    size_t cellPtr;
};

template <typename CellT>
VmResult<CellT> vmRun(const std::string& code, const std::string& input,
                      const brisk::OptimizerOptions& passes, bool optimize) {
    VmResult<CellT> r{brisk::Status::Ok, "", std::vector<CellT>(kTapeSize, 0), 0};
    brisk::RunOptions options;
    options.optimize = optimize;
    options.passes = passes;
    r.output = runCode<CellT>(code, r.cells, r.cellPtr, input, options, &r.status);
    return r;
}

template <typename CellT>
int checkRandomPrograms(std::uint32_t seed, const brisk::OptimizerOptions& passes) {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> lenDist(1, 24);
    const std::string input = "brisk\x01\xff";
    int executed = 0;
    for (int n = 0; n < kPrograms; ++n) {
        // Start well away from the left edge so most programs stay in bounds.
        std::string code = ">>>>>>>>";
        appendRandom(gen, code, 0, lenDist(gen));

        const auto oracle = referenceRun<CellT>(code, input, kTapeSize, kStepBudget);
        if (!oracle.finished || oracle.status != brisk::Status::Ok) continue;
        ++executed;

        const auto plain = vmRun<CellT>(code, input, passes, false);
        const auto fast = vmRun<CellT>(code, input, passes, true);
        if (fast.status != brisk::Status::Ok || hashOutput(fast.output) != hashOutput(oracle.output) ||
            trimmed(fast.cells) != trimmed(oracle.cells) || fast.cellPtr != oracle.cellPtr) {
            std::cerr << "optimized run differs for: " << code << std::endl;
            assert(false);
        }
        assert(plain.status == brisk::Status::Ok);
        assert(hashOutput(plain.output) == hashOutput(oracle.output));
        assert(trimmed(plain.cells) == trimmed(oracle.cells));
        assert(plain.cellPtr == oracle.cellPtr);
    }
    return executed;
}
}  // namespace

int main() {
    const brisk::OptimizerOptions all;
    int executed = checkRandomPrograms<uint8_t>(0xB215C, all);
    assert(executed >= 50);
    executed = checkRandomPrograms<uint16_t>(0x5EED, all);
    assert(executed >= 50);

    brisk::OptimizerOptions odd;
    odd.oddDeltaClears = true;
    executed = checkRandomPrograms<uint8_t>(0x0DD, odd);
    assert(executed >= 50);

    for (const char* pass : {"merge", "assign", "offsets", "defer", "scan", "mul", "dead"}) {
        brisk::OptimizerOptions partial;
        const bool known = brisk::disablePass(partial, pass);
        assert(known);
        (void)known;
        executed = checkRandomPrograms<uint8_t>(0xC0FFEE, partial);
        assert(executed >= 50);
    }
    (void)executed;
    return 0;
}
