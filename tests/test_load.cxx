#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include "helpers.hxx"
#include "vm.hxx"

template <typename CellT>
static std::string runFile(const std::string& path, std::vector<CellT>& cells, size_t& cellPtr,
                           const std::string& input = "", int* retOut = nullptr) {
    std::ifstream file(path);
    std::string code((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return runCode<CellT>(code, cells, cellPtr, input, {}, retOut);
}

template <typename CellT>
static void test_load_file() {
    const char* fname = "test_program.bf";
    {
        std::ofstream f(fname);
        f << "Echo one byte:\n,.\n";
    }
    std::vector<CellT> cells(1, 0);
    size_t ptr = 0;
    std::string out = runFile<CellT>(fname, cells, ptr, "A");
    assert(out == "A");
    assert(cells[0] == static_cast<CellT>('A'));
    std::remove(fname);
}

template <typename CellT>
static void test_multiline_program() {
    const char* fname = "test_hello.bf";
    {
        std::ofstream f(fname);
        f << "++++++++ set counter\n"
             "[>++++++++<-] multiply\n"
             ">+. print A\n"
             "+. print B\n";
    }
    std::vector<CellT> cells(2, 0);
    size_t ptr = 0;
    int ret;
    std::string out = runFile<CellT>(fname, cells, ptr, "", &ret);
    assert(ret == brisk::Status::Ok);
    assert(out == "AB");
    assert(ptr == 1);
    std::remove(fname);
}

template <typename CellT>
static void run_tests() {
    test_load_file<CellT>();
    test_multiline_program<CellT>();
}

int main() {
    run_tests<uint8_t>();
    run_tests<uint16_t>();
    run_tests<uint32_t>();
    run_tests<uint64_t>();
    return 0;
}
