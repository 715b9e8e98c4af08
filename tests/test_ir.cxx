#include <cassert>
#include <sstream>
#include <string>
#include <vector>

#include "vm.hxx"

using namespace brisk;

static std::vector<Node> irOf(const std::string& code) {
    std::vector<ParseNode> tree;
    int ret = parse(code, tree);
    assert(ret == Status::Ok);
    (void)ret;
    return buildIr(tree);
}

static void test_direct_translation() {
    auto ir = irOf("+-<>.,");
    std::vector<Node> expected{addAt(0, 1), addAt(0, -1), move(-1),
                               move(1),     outputAt(0),  inputAt(0)};
    assert(ir == expected);
}

static void test_loops_translate_recursively() {
    auto ir = irOf("[>[-]]");
    std::vector<Node> expected{loop({move(1), loop({addAt(0, -1)})})};
    assert(ir == expected);
    assert(irOf("[]") == std::vector<Node>{loop({})});
}

static void test_no_fusion() {
    auto ir = irOf("+++>>>");
    assert(ir.size() == 6);
}

static void test_to_string() {
    assert(toString(addAt(2, -3)) == "AddAt(2, -3)");
    assert(toString(setAt(0, 0)) == "SetAt(0, 0)");
    assert(toString(move(-4)) == "Move(-4)");
    assert(toString(scanLoop(2)) == "ScanLoop(2)");
    assert(toString(outputAt(1)) == "OutputAt(1)");
    assert(toString(mulAt(0, 1, 2)) == "MulAt(0 -> 1, 2)");
}

static void test_dump() {
    std::vector<Node> ir{addAt(0, 1), loop({move(1), loop({addAt(0, -1)})}), outputAt(0)};
    const std::string expected =
        "AddAt(0, 1)\n"
        "Loop {\n"
        "  Move(1)\n"
        "  Loop {\n"
        "    AddAt(0, -1)\n"
        "  }\n"
        "}\n"
        "OutputAt(0)\n";
    assert(dumpIr(ir) == expected);
}

static void test_analyze() {
    auto stats = analyze(irOf("++[->+<].[]"));
    assert(stats.total == 9);
    assert(stats.count(NodeKind::AddAt) == 4);
    assert(stats.count(NodeKind::Move) == 2);
    assert(stats.count(NodeKind::Loop) == 2);
    assert(stats.count(NodeKind::OutputAt) == 1);
    assert(stats.count(NodeKind::ScanLoop) == 0);
    assert(formatStats(stats) == "nodes: 9 AddAt=4 Move=2 OutputAt=1 Loop=2");
}

static void test_inspect() {
    std::vector<ParseNode> tree;
    int ret = parse("+++.", tree);
    assert(ret == Status::Ok);
    (void)ret;
    std::ostringstream out;
    inspect(tree, out, true, {}, true, true);
    const std::string expected =
        "before: nodes: 4 AddAt=3 OutputAt=1\n"
        "after:  nodes: 2 AddAt=1 OutputAt=1\n"
        "AddAt(0, 3)\n"
        "OutputAt(0)\n";
    assert(out.str() == expected);

    std::ostringstream plain;
    inspect(tree, plain, false, {}, true, false);
    assert(plain.str() == "AddAt(0, 1)\nAddAt(0, 1)\nAddAt(0, 1)\nOutputAt(0)\n");
}

int main() {
    test_direct_translation();
    test_loops_translate_recursively();
    test_no_fusion();
    test_to_string();
    test_dump();
    test_analyze();
    test_inspect();
    return 0;
}
