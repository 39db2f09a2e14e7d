// tests/test_commands.cpp
//
// Command table and end-to-end runs of `design` and `score`, including the
// exit code when an output file cannot be written.

#include "cli/commands.hpp"
#include "protdes/log_utils.hpp"
#include "protdes/sequence_io.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

class ArgvBuilder {
public:
    explicit ArgvBuilder(std::initializer_list<std::string> args) {
        for (const auto& a : args) args_.push_back(strdup(a.c_str()));
    }
    ArgvBuilder(const ArgvBuilder&) = delete;
    ArgvBuilder& operator=(const ArgvBuilder&) = delete;

    ~ArgvBuilder() {
        for (char* arg : args_) {
            std::free(arg);
        }
    }

    int argc() const { return static_cast<int>(args_.size()); }
    char** argv() { return args_.data(); }

private:
    std::vector<char*> args_;
};

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "FAIL: " << msg << "\n";
        ++failed;
    }
}

int run(const char* command, std::initializer_list<std::string> args) {
    const auto* cmd = protdes::cli::find_command(command);
    if (!cmd) return -1;
    ArgvBuilder b(args);
    return cmd->run(b.argc(), b.argv());
}

std::string slurp(const fs::path& path) {
    std::ifstream in(path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

fs::path scratch_dir() {
    fs::path dir = fs::temp_directory_path() / ("protdes_cmd_test_" + std::to_string(::getpid()));
    fs::create_directories(dir);
    return dir;
}

int test_command_table() {
    int failed = 0;
    const auto* design = protdes::cli::find_command("design");
    const auto* score = protdes::cli::find_command("score");
    expect(design && std::string(design->name) == "design", "design command missing", failed);
    expect(score && std::string(score->name) == "score", "score command missing", failed);
    expect(protdes::cli::find_command("damage-profile") == nullptr, "unknown command found", failed);
    expect(protdes::cli::find_command("") == nullptr, "empty command found", failed);

    expect(run("design", {"design", "--help"}) == 0, "design --help exit code", failed);
    expect(run("design", {"design", "--bogus"}) == 1, "design unknown option exit code", failed);
    expect(run("score", {"score"}) == 1, "score without input exit code", failed);
    return failed;
}

int test_design_outputs(const fs::path& dir) {
    int failed = 0;
    const fs::path fasta = dir / "best.fa";
    const fs::path history = dir / "history.tsv";
    const fs::path summary = dir / "summary.json";

    const int rc = run("design", {"design", "--preset", "none", "--length", "20:30", "--key", "10=G",
                                  "--iterations", "3", "--population", "6", "--elite", "1", "-q",
                                  "-o", fasta.string(), "--history", history.string(),
                                  "--summary", summary.string()});
    expect(rc == 0, "design run failed", failed);

    protdes::SequenceReader reader(fasta.string());
    const auto records = reader.read_all();
    expect(records.size() == 1, "design FASTA record count", failed);
    if (records.size() == 1) {
        expect(records[0].id == "protdes_design_1", "design FASTA id", failed);
        expect(records[0].description.find("stop=exhausted") != std::string::npos,
               "design FASTA description", failed);
        expect(records[0].sequence.size() >= 20 && records[0].sequence.size() <= 30,
               "designed length outside target", failed);
        expect(records[0].sequence.size() >= 10 && records[0].sequence[9] == 'G',
               "key residue missing from design", failed);
    }

    const std::string h = slurp(history);
    expect(std::count(h.begin(), h.end(), '\n') == 4, "history rows", failed);
    expect(slurp(summary).find("\"stop_reason\": \"exhausted\"") != std::string::npos,
           "summary stop reason", failed);
    return failed;
}

int test_design_write_failures() {
    int failed = 0;
    if (!fs::exists("/dev/full")) return failed;

    // Opening succeeds, every write fails
    expect(run("design", {"design", "--preset", "none", "--length", "10:12", "--iterations", "2",
                          "--population", "4", "-q", "--history", "/dev/full"}) == 1,
           "unwritable history file not reported", failed);
    expect(run("design", {"design", "--preset", "none", "--length", "10:12", "--iterations", "2",
                          "--population", "4", "-q", "--summary", "/dev/full"}) == 1,
           "unwritable summary file not reported", failed);
    return failed;
}

int test_design_log_lines() {
    int failed = 0;
    std::ostringstream log;
    protdes::log_utils::set_log_sink(&log);
    const int rc = run("design", {"design", "--preset", "none", "--length", "10:12",
                                  "--iterations", "2", "--population", "4"});
    protdes::log_utils::set_log_sink(nullptr);

    expect(rc == 0, "design run failed", failed);
    expect(log.str().find("Running optimization...\n") != std::string::npos,
           "start line not logged", failed);
    expect(log.str().find("Runtime: ") != std::string::npos, "runtime not logged", failed);

    // -q silences the sink
    std::ostringstream quiet;
    protdes::log_utils::set_log_sink(&quiet);
    (void)run("design", {"design", "--preset", "none", "--length", "10:12",
                         "--iterations", "2", "--population", "4", "-q"});
    expect(quiet.str().empty(), "quiet run logged", failed);
    protdes::log_utils::set_log_sink(nullptr);
    return failed;
}

int test_score(const fs::path& dir) {
    int failed = 0;
    const fs::path input = dir / "designs.fa";
    {
        std::ofstream out(input);
        out << ">good\nMKTAYIAKQRQISFVKSHFSRQ\n>bad\nMKTAXXAKQR\n";
    }
    const fs::path table = dir / "scores.tsv";
    const int rc = run("score", {"score", input.string(), "--preset", "none", "--length", "5:50",
                                 "-o", table.string()});
    expect(rc == 0, "score run failed", failed);

    std::istringstream rows(slurp(table));
    std::vector<std::string> lines;
    for (std::string line; std::getline(rows, line);) lines.push_back(line);
    expect(lines.size() == 3, "score table rows", failed);
    if (lines.size() == 3) {
        expect(lines[1].rfind("good\t", 0) == 0, "good record row", failed);
        expect(lines[2].rfind("bad\t", 0) == 0 && lines[2].find("NA") != std::string::npos,
               "rejected record row", failed);
    }

    expect(run("score", {"score", (dir / "missing.fa").string(), "--preset", "none",
                         "--length", "5:50"}) == 1,
           "missing input not reported", failed);
    if (fs::exists("/dev/full")) {
        expect(run("score", {"score", input.string(), "--preset", "none", "--length", "5:50",
                             "-o", "/dev/full"}) == 1,
               "unwritable score table not reported", failed);
    }
    return failed;
}

}  // namespace

int main() {
    protdes::log_utils::set_log_sink(nullptr);
    const fs::path dir = scratch_dir();

    int failed = 0;
    failed += test_command_table();
    failed += test_design_outputs(dir);
    failed += test_design_write_failures();
    failed += test_design_log_lines();
    failed += test_score(dir);

    std::error_code ec;
    fs::remove_all(dir, ec);

    if (failed == 0) {
        std::cout << "All command tests passed\n";
        return 0;
    }
    std::cerr << failed << " command test(s) failed\n";
    return 1;
}
