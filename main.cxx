/*
    Brisk - An optimizing brainfuck compiler and VM
    Main standalone file
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include "repl.hxx"
#include "vm.hxx"

namespace {
// Read-only mapping of a source file, released on destruction.
struct MappedFile {
    const char* data = nullptr;
    size_t size = 0;
    int fd = -1;

    MappedFile() = default;
    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;
    ~MappedFile() {
        if (data && size) munmap(const_cast<char*>(data), size);
        if (fd >= 0) ::close(fd);
    }

    bool open(const std::string& path) {
        fd = ::open(path.c_str(), O_RDONLY);
        if (fd < 0) return false;
        struct stat st{};
        if (fstat(fd, &st) != 0) return false;
        if (st.st_size == 0) return true;
        void* view = mmap(nullptr, static_cast<size_t>(st.st_size), PROT_READ, MAP_PRIVATE, fd, 0);
        if (view == MAP_FAILED) return false;
        data = static_cast<const char*>(view);
        size = static_cast<size_t>(st.st_size);
        return true;
    }
};

// The whole file is kept so bracket errors can be reported with their line and column.
bool readSource(const std::string& filename, std::string& out, std::string& err) {
    {
        MappedFile mf;
        if (mf.open(filename)) {
            out.assign(mf.data ? mf.data : "", mf.size);
            return true;
        }
    }
    std::ifstream in(filename, std::ios::binary);
    if (!in.is_open()) {
        err = "File could not be opened: " + filename;
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (!in.eof() && in.fail()) {
        err = "Error while reading file: " + filename;
        return false;
    }
    return true;
}

struct CmdArgs {
    std::string filename;
    std::string evalCode;
    bool dumpMemory = false;
    bool help = false;
    bool invalid = false;
    bool optimize = BRISK_OPTIMIZE;
    bool dynamicTape = BRISK_DYNAMIC_CELLS_SIZE;
    bool profile = false;
    bool showIr = false;
    bool showStats = false;
    int eof = BRISK_DEFAULT_EOF_BEHAVIOUR;
    std::size_t tapeSize = BRISK_DEFAULT_TAPE_SIZE;
    int cellWidth = 8;
    brisk::OptimizerOptions passes{};
};

CmdArgs parseArgs(int argc, char* argv[]) {
    CmdArgs args;
    auto reject = [&](std::string_view what, const char* val) {
        std::cerr << errorTag() << ' ' << what << ": " << val << std::endl;
        args.invalid = true;
    };
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-e" && i + 1 < argc) {
            args.evalCode = argv[++i];
            args.filename.clear();
        } else if (arg == "-i" && i + 1 < argc) {
            ++i;
            if (args.evalCode.empty()) args.filename = argv[i];
        } else if (arg == "-dm") {
            args.dumpMemory = true;
        } else if (arg == "-h") {
            args.help = true;
        } else if (arg == "-nopt") {
            args.optimize = false;
        } else if (arg == "-fts") {
            args.dynamicTape = false;
        } else if (arg == "-ir") {
            args.showIr = true;
        } else if (arg == "--stats") {
            args.showStats = true;
        } else if (arg == "--profile") {
            args.profile = true;
        } else if (arg == "--odd-clears") {
            args.passes.oddDeltaClears = true;
        } else if (arg == "-np" && i + 1 < argc) {
            const char* val = argv[++i];
            if (!brisk::disablePass(args.passes, val)) reject("Unknown optimization pass", val);
        } else if (arg == "-eof" && i + 1 < argc) {
            const char* val = argv[++i];
            char* end = nullptr;
            long parsed = std::strtol(val, &end, 10);
            if (end == val || *end != '\0' || parsed < 0 || parsed > 2) {
                reject("EOF mode must be 0, 1 or 2", val);
            } else {
                args.eof = static_cast<int>(parsed);
            }
        } else if (arg == "-ts" && i + 1 < argc) {
            const char* val = argv[++i];
            char* end = nullptr;
            unsigned long long parsed = std::strtoull(val, &end, 10);
            if (val[0] == '-' || end == val || *end != '\0' || parsed == 0) {
                reject("Tape size must be a positive integer", val);
            } else {
                args.tapeSize = static_cast<std::size_t>(parsed);
            }
        } else if (arg == "-cw" && i + 1 < argc) {
            const char* val = argv[++i];
            char* end = nullptr;
            long parsed = std::strtol(val, &end, 10);
            if (end == val || *end != '\0' ||
                (parsed != 8 && parsed != 16 && parsed != 32 && parsed != 64)) {
                reject("Cell width must be 8, 16, 32 or 64", val);
            } else {
                args.cellWidth = static_cast<int>(parsed);
            }
        } else {
            std::cerr << errorTag() << " Unknown option: " << arg << std::endl;
            args.invalid = true;
        }
    }
    return args;
}

void printHelp(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -e <code>        Execute code directly\n"
              << "  -i <file>        Execute code from file\n"
              << "  -dm              Dump memory after program\n"
              << "  -nopt            Disable optimizations\n"
              << "  -np <pass>       Disable one pass (merge, assign, offsets, defer, scan, mul, "
                 "dead)\n"
              << "  --odd-clears     Treat loops adding any odd value as clears\n"
              << "  -fts             Fixed tape size, no dynamic growth\n"
              << "  -ts <size>       Tape size in cells (default " << BRISK_DEFAULT_TAPE_SIZE
              << ")\n"
              << "  -cw <width>      Cell width in bits (8,16,32,64)\n"
              << "  -eof <value>     EOF: 0 store zero, 1 keep cell, 2 store maximum\n"
              << "  -ir              Print the optimized IR before running\n"
              << "  --stats          Print IR statistics before running\n"
              << "  --profile        Print execution profile\n"
              << "  -h               Show this help message" << std::endl;
}

void printProfile(const brisk::ProfileInfo& profile) {
    std::cout << "Instructions executed: " << profile.instructions << '\n'
              << "Program size: " << profile.programSize << '\n'
              << "Elapsed time: " << profile.seconds << "s" << '\n';
    for (std::size_t i = 0; i < profile.loopCounts.size(); ++i) {
        if (profile.loopCounts[i]) std::cout << "Loop " << i << ": " << profile.loopCounts[i] << '\n';
    }
    std::cout.flush();
}

template <typename CellT>
int runProgram(const CmdArgs& args, std::string_view code) {
    std::vector<CellT> cells(args.tapeSize, 0);
    size_t cellPtr = 0;
    brisk::ProfileInfo profile;
    brisk::RunOptions options;
    options.optimize = args.optimize;
    options.passes = args.passes;
    options.eof = args.eof;
    options.dynamicSize = args.dynamicTape;
    options.profile = args.profile ? &profile : nullptr;
    if (args.showIr || args.showStats) {
        std::vector<brisk::ParseNode> tree;
        if (brisk::parse(code, tree) == brisk::Status::Ok)
            brisk::inspect(tree, std::cout, args.optimize, args.passes, args.showIr,
                           args.showStats);
    }
    const int ret = executeExcept<CellT>(cells, cellPtr, code, options);
    if (args.dumpMemory) dumpMemory<CellT>(cells, cellPtr);
    if (args.profile && ret <= 0) printProfile(profile);
    return ret == brisk::Status::Ok ? 0 : 1;
}

int dispatch(const CmdArgs& args, std::string_view code) {
    switch (args.cellWidth) {
        case 8:
            return runProgram<uint8_t>(args, code);
        case 16:
            return runProgram<uint16_t>(args, code);
        case 32:
            return runProgram<uint32_t>(args, code);
        default:
            return runProgram<uint64_t>(args, code);
    }
}

#ifdef BRISK_ENABLE_REPL
int replLoop(ReplConfig& cfg) {
    while (true) {
        size_t cellPtr = 0;
        int newCw = 0;
        switch (cfg.cellWidth) {
            case 8: {
                std::vector<uint8_t> cells(cfg.tapeSize, 0);
                newCw = runRepl<uint8_t>(cells, cellPtr, cfg);
                break;
            }
            case 16: {
                std::vector<uint16_t> cells(cfg.tapeSize, 0);
                newCw = runRepl<uint16_t>(cells, cellPtr, cfg);
                break;
            }
            case 32: {
                std::vector<uint32_t> cells(cfg.tapeSize, 0);
                newCw = runRepl<uint32_t>(cells, cellPtr, cfg);
                break;
            }
            default: {
                std::vector<uint64_t> cells(cfg.tapeSize, 0);
                newCw = runRepl<uint64_t>(cells, cellPtr, cfg);
                break;
            }
        }
        if (newCw == 0) break;
        if (cfg.tapeSize > BRISK_TAPE_MAX_BYTES / static_cast<std::size_t>(newCw / 8)) {
            std::cout << errorTag() << " Tape too large for " << newCw << "-bit cells" << std::endl;
            continue;
        }
        cfg.cellWidth = newCw;
    }
    return 0;
}
#endif
}  // namespace

int main(int argc, char* argv[]) {
    const CmdArgs args = parseArgs(argc, argv);
    if (args.help || args.invalid) {
        printHelp(argv[0]);
        return args.invalid ? 1 : 0;
    }
    const std::size_t widthBytes = static_cast<std::size_t>(args.cellWidth / 8);
    if (args.tapeSize > BRISK_TAPE_MAX_BYTES / widthBytes) {
        std::cerr << errorTag() << " Requested tape exceeds maximum allowed size ("
                  << (BRISK_TAPE_MAX_BYTES >> 20) << " MiB)" << std::endl;
        return 1;
    }
    const std::size_t requiredMem = args.tapeSize * widthBytes;
    if (requiredMem > BRISK_TAPE_WARN_BYTES) {
        std::cerr << warningTag() << " Tape allocation ~" << (requiredMem >> 20)
                  << " MiB may exceed system memory" << std::endl;
    }

    if (!args.evalCode.empty()) return dispatch(args, args.evalCode);
    if (!args.filename.empty()) {
        std::string code;
        std::string err;
        if (!readSource(args.filename, code, err)) {
            std::cerr << errorTag() << ' ' << err << std::endl;
            return 1;
        }
        return dispatch(args, code);
    }
#ifdef BRISK_ENABLE_REPL
    ReplConfig cfg{args.optimize, args.dynamicTape, args.eof,        args.tapeSize, args.cellWidth,
                   args.passes,   args.showIr,      args.showStats, true};
    return replLoop(cfg);
#else
    std::cout << "REPL disabled; use -i <file> or -e <code> to run a program" << std::endl;
    return 0;
#endif
}
