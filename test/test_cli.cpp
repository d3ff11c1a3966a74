#include <catch2/catch.hpp>
#include <sys/wait.h>
#include <array>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

// Helper to run a command and capture its output
static std::pair<int, std::string> run_command(const std::string& cmd) {
    std::array<char, 128> buffer;
    std::string result;

    // Redirect stderr to stdout so we capture both
    std::string full_cmd = cmd + " 2>&1";
    FILE* pipe = popen(full_cmd.c_str(), "r");
    if (!pipe) {
        throw std::runtime_error("popen() failed!");
    }

    while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
        result += buffer.data();
    }

    int exit_code = pclose(pipe);
    if (WIFEXITED(exit_code)) {
        exit_code = WEXITSTATUS(exit_code);
    }

    return {exit_code, result};
}

static std::string brufmt(const std::string& args) { return std::string("'") + BRUFMT_EXE_PATH + "' " + args; }

static std::string sample(const std::string& name) {
    return std::string("'") + (fs::path(BRU_SAMPLES_DIR) / name).string() + "'";
}

static std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

static fs::path write_temp(const std::string& name, const std::string& content) {
    fs::path path = fs::temp_directory_path() / name;
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path;
}

TEST_CASE("CLI responds to --help flag", "[cli][help]") {
    auto [exit_code, output] = run_command(brufmt("--help"));

    REQUIRE(exit_code == 0);
    REQUIRE(output.find("brufmt - Parse, validate and format Bru") != std::string::npos);
    REQUIRE(output.find("USAGE:") != std::string::npos);
    REQUIRE(output.find("OPTIONS:") != std::string::npos);
    REQUIRE(output.find("--trailing-newline") != std::string::npos);
}

TEST_CASE("CLI without args shows help", "[cli][help]") {
    auto [exit_code, output] = run_command(brufmt(""));

    REQUIRE(exit_code == 0);
    REQUIRE(output.find("USAGE:") != std::string::npos);
}

TEST_CASE("CLI check accepts a valid file", "[cli]") {
    auto [exit_code, output] = run_command(brufmt("--check " + sample("get-users.bru")));

    REQUIRE(exit_code == 0);
    REQUIRE(output.find("is valid Bru") != std::string::npos);
}

TEST_CASE("CLI check reports the first syntax error", "[cli]") {
    auto path = write_temp("brufmt_cli_unclosed.bru", "meta {\n  url: https://toto.com\n");
    auto [exit_code, output] = run_command(brufmt("--check '" + path.string() + "'"));

    REQUIRE(exit_code == 1);
    REQUIRE(output.find("parse error: unexpected end of Bru input (offset 31)") != std::string::npos);
    fs::remove(path);
}

TEST_CASE("CLI reads standard input", "[cli]") {
    auto [exit_code, output] = run_command(brufmt("--check - < " + sample("create-user.bru")));

    REQUIRE(exit_code == 0);
    REQUIRE(output.find("OK: - is valid Bru") != std::string::npos);
}

TEST_CASE("CLI summary lists the blocks", "[cli]") {
    auto [exit_code, output] = run_command(brufmt(sample("get-users.bru")));

    REQUIRE(exit_code == 0);
    REQUIRE(output.find("OK: parsed 6 blocks") != std::string::npos);
    REQUIRE(output.find("  query {dictionary, 2 entries} page=2, ~limit=10") != std::string::npos);
}

TEST_CASE("CLI format reproduces a collection file", "[cli]") {
    auto [exit_code, output] = run_command(
        brufmt("--format --array-separator , --trailing-newline " + sample("environment-secrets.bru")));

    REQUIRE(exit_code == 0);
    REQUIRE(output == read_file(fs::path(BRU_SAMPLES_DIR) / "environment-secrets.bru"));
}

TEST_CASE("CLI format writes to an output file", "[cli]") {
    fs::path out = fs::temp_directory_path() / "brufmt_cli_out.bru";
    auto [exit_code, output] =
        run_command(brufmt("--format --separator , -o '" + out.string() + "' " + sample("get-users.bru")));

    REQUIRE(exit_code == 0);
    REQUIRE(output.empty());
    std::string written = read_file(out);
    REQUIRE(written.find("  name: Get users,\n  type: http,\n  seq: 1\n}") != std::string::npos);
    REQUIRE(written.back() == '}');
    fs::remove(out);
}

TEST_CASE("CLI format with a comma separator is stable", "[cli]") {
    std::string text = "meta {\n  name: a,b,,\n  seq: 1,\n}\n";
    auto path = write_temp("brufmt_cli_commas.bru", text);
    auto [exit_code, output] =
        run_command(brufmt("--format --separator , --trailing-newline '" + path.string() + "'"));

    REQUIRE(exit_code == 0);
    REQUIRE(output == text);
    fs::remove(path);
}

TEST_CASE("CLI reports an output file that cannot be written", "[cli]") {
    auto [exit_code, output] = run_command(brufmt("--format -o /dev/full " + sample("get-users.bru")));

    REQUIRE(exit_code == 2);
    REQUIRE(output.find("error: cannot write output: /dev/full") != std::string::npos);
}

TEST_CASE("CLI rejects separators it cannot read back", "[cli]") {
    auto [exit_code, output] = run_command(brufmt("--format --separator ';' " + sample("get-users.bru")));

    REQUIRE(exit_code == 2);
    REQUIRE(output.find("separator must be empty or ','") != std::string::npos);
}

TEST_CASE("CLI prints blocks as JSON", "[cli]") {
    auto [exit_code, output] = run_command(brufmt("--json --indent 0 " + sample("environment-secrets.bru")));

    REQUIRE(exit_code == 0);
    REQUIRE(output.find(R"({"tag":"vars:secret","name":"vars","type":"secret","kind":"array",)") != std::string::npos);
    REQUIRE(output.back() == '\n');
}

TEST_CASE("CLI verbose mode reports on stderr", "[cli]") {
    auto [exit_code, output] = run_command(brufmt("--format -v " + sample("search-countries.bru")));

    REQUIRE(exit_code == 0);
    REQUIRE(output.find("brufmt: decoded 4 blocks") != std::string::npos);
}

TEST_CASE("CLI suggests a known flag for a typo", "[cli]") {
    auto [exit_code, output] = run_command(brufmt("--fromat " + sample("get-users.bru")));

    REQUIRE(exit_code == 2);
    REQUIRE(output.find("Did you mean '--format'?") != std::string::npos);
    REQUIRE(output.find("Try 'brufmt --help' for usage.") != std::string::npos);
}

TEST_CASE("CLI fails on a missing input file", "[cli]") {
    auto [exit_code, output] = run_command(brufmt("--check /nonexistent/brufmt/input.bru"));

    REQUIRE(exit_code == 2);
    REQUIRE(output.find("cannot open file") != std::string::npos);
}
