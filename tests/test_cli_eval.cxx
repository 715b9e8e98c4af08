// Spawns the brisk executable directly and captures stdout and stderr through a pipe.

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cassert>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

struct CliResult {
    std::string out;
    int exitCode;
};

static CliResult run_cli(const std::vector<std::string>& extra) {
    std::vector<std::string> args{BRISK_EXE_PATH};
    args.insert(args.end(), extra.begin(), extra.end());
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& s : args) argv.push_back(s.data());
    argv.push_back(nullptr);

    int pipefd[2];
    assert(pipe(pipefd) == 0);
    pid_t pid = fork();
    assert(pid >= 0);
    if (pid == 0) {
        close(pipefd[0]);
        dup2(pipefd[1], STDOUT_FILENO);
        dup2(pipefd[1], STDERR_FILENO);
        execv(argv[0], argv.data());
        _exit(127);
    }
    close(pipefd[1]);
    std::array<char, 256> buf{};
    std::string out;
    ssize_t n;
    while ((n = read(pipefd[0], buf.data(), buf.size())) > 0) {
        out.append(buf.data(), static_cast<size_t>(n));
    }
    close(pipefd[0]);
    int status;
    waitpid(pid, &status, 0);
    assert(WIFEXITED(status));
    return {out, WEXITSTATUS(status)};
}

static std::string run_inline(const std::string& code, const std::string& extra = "") {
    std::vector<std::string> args{"-e", code};
    std::istringstream iss(extra);
    for (std::string tok; iss >> tok;) args.push_back(tok);
    CliResult r = run_cli(args);
    assert(r.exitCode == 0);
    return r.out;
}

int main() {
    const std::string helloA = "++++++++[>++++++++<-]>+.";  // prints 'A'
    assert(run_inline(helloA) == "A");
    assert(run_inline(helloA, "-nopt") == "A");
    assert(run_inline(helloA, "-i nofile.bf") == "A");
    assert(run_inline(helloA, "-cw 16 -np mul -np scan") == "A");
    assert(run_inline(helloA, "-fts -ts 2") == "A");

    std::string ir = run_inline("+++.", "-ir");
    assert(ir == "AddAt(0, 3)\nOutputAt(0)\n\x03");
    std::string stats = run_inline("[-]", "--stats");
    assert(stats.find("before: nodes: 2 AddAt=1 Loop=1") != std::string::npos);
    assert(stats.find("after:  nodes: 1 SetAt=1") != std::string::npos);

    CliResult r = run_cli({"-e", "+[\n+"});
    assert(r.exitCode == 1);
    assert(r.out.find("Unmatched open bracket at line 1, column 2") != std::string::npos);

    r = run_cli({"-e", "<"});
    assert(r.exitCode == 1);
    assert(r.out.find("cell pointer moved before start") != std::string::npos);

    r = run_cli({"-e", ">>", "-fts", "-ts", "2"});
    assert(r.exitCode == 1);
    assert(r.out.find("cell pointer moved beyond end") != std::string::npos);

    r = run_cli({"-np", "nosuchpass", "-e", "+"});
    assert(r.exitCode == 1);
    r = run_cli({"-cw", "12", "-e", "+"});
    assert(r.exitCode == 1);
    r = run_cli({"-i", "definitely_missing_file.bf"});
    assert(r.exitCode == 1);
    assert(r.out.find("File could not be opened") != std::string::npos);

    {
        const char* fname = "test_cli_program.bf";
        {
            std::ofstream f(fname);
            f << "print three then one\n+++.---+.\n";
        }
        r = run_cli({"-i", fname, "-cw", "32", "-eof", "2"});
        std::remove(fname);
        assert(r.exitCode == 0);
        assert(r.out == "\x03\x01");
    }

    r = run_cli({"-e", "+++>++", "-dm"});
    assert(r.exitCode == 0);
    assert(r.out.find("Memory dump:") != std::string::npos);

    r = run_cli({"-h"});
    assert(r.exitCode == 0);
    assert(r.out.find("Usage:") != std::string::npos);
    return 0;
}
