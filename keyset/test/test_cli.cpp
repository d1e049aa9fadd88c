#include "fixtures.hpp"
#include "keyset_pack.hpp"
#include "keyset_yaml.hpp"
#include "commit.hpp"
#include <sys/wait.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

// Runs the keyset binary against files written here and checks exit codes
// and output. Usage: test_cli <keyset binary> <work dir> <case>

using keyset::OrderByInputs;
using keyset::OrderByOutputs;

static std::string g_keyset;
static std::string g_dir;

struct RunResult {
    int         code = -1;
    std::string out;
    std::string err;
};

static std::string path_of(const std::string& name) { return g_dir + "/" + name; }

static std::string quoted(const std::string& name) { return "\"" + path_of(name) + "\""; }

static std::string slurp(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static void spit(const std::string& name, const std::string& data) {
    std::ofstream out(path_of(name), std::ios::binary);
    out << data;
    if (!out) {
        std::cerr << "FAIL: cannot write fixture " << name << "\n";
        std::exit(1);
    }
}

static void spit(const std::string& name, const std::vector<uint8_t>& data) {
    spit(name, std::string(data.begin(), data.end()));
}

static RunResult run(const std::string& args) {
    const std::string out = path_of("stdout.txt");
    const std::string err = path_of("stderr.txt");
    const std::string cmd = "\"" + g_keyset + "\" " + args +
                            " >\"" + out + "\" 2>\"" + err + "\"";
    int status = std::system(cmd.c_str());

    RunResult r;
    if (status != -1 && WIFEXITED(status))
        r.code = WEXITSTATUS(status);
    r.out = slurp(out);
    r.err = slurp(err);
    std::cout << "$ keyset " << args << "  -> " << r.code << "\n";
    return r;
}

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

static std::string verifier_hex() {
    return keyset_commit::to_hex(keyset_commit::commit(mock_verifier<OrderByInputs>()));
}

static void write_fixtures() {
    spit("prover.mp",    keyset_mp::pack(mock_prover<OrderByInputs>()));
    spit("prover.yaml",  keyset_yaml::emit_prover_yaml(mock_prover<OrderByInputs>()));
    spit("verifier.mp",  keyset_mp::pack(mock_verifier<OrderByInputs>()));
    spit("verifier.yaml", keyset_yaml::emit_verifier_yaml(mock_verifier<OrderByInputs>()));
    spit("verifier_out.mp", keyset_mp::pack(mock_verifier<OrderByOutputs>()));
}

// ── cases ─────────────────────────────────────────────────────────────────────

static void case_fit_hit() {
    RunResult r = run("fit " + quoted("prover.mp") + " --inputs 1 --outputs 3");
    check(r.code == 0, "fit hit exits 0");
    check(contains(r.out, "best fit: (2, 3)"), "fit hit prints the matched size");

    r = run("fit " + quoted("verifier.yaml") + " --kind freeze --inputs 1 --outputs 1");
    check(r.code == 0, "freeze fit on YAML exits 0");
    check(contains(r.out, "best fit: (2, 2)"), "freeze fit prints (2, 2)");

    r = run("fit " + quoted("verifier_out.mp") + " --inputs 2 --outputs 1");
    check(r.code == 0 && contains(r.out, "best fit: (3, 1)"),
          "bundle ordered by outputs is searched by outputs");
}

static void case_fit_miss() {
    RunResult r = run("fit " + quoted("prover.mp") + " --inputs 3 --outputs 3");
    check(r.code == 2, "fit miss exits 2");
    check(contains(r.err, "largest supported size is (3, 1)"), "fit miss names the max size");

    r = run("fit " + quoted("verifier_out.mp") + " --inputs 3 --outputs 2");
    check(r.code == 2, "fit miss by outputs exits 2");
    check(contains(r.err, "(2, 3)"), "max size by outputs is (2, 3)");
}

static void case_exact() {
    RunResult r = run("fit " + quoted("prover.mp") + " --inputs 1 --outputs 3 --exact");
    check(r.code == 2, "exact miss exits 2");
    check(contains(r.err, "no key of size (1, 3)"), "exact miss names the size");

    r = run("fit " + quoted("prover.yaml") + " --inputs 2 --outputs 3 --exact");
    check(r.code == 0 && contains(r.out, "exact fit: (2, 3)"), "exact hit exits 0");
}

static void case_missing_file() {
    RunResult r = run("fit " + quoted("no-such-file.mp") + " --inputs 1 --outputs 1");
    check(r.code == 3, "missing file exits 3");
    check(contains(r.err, "Error:"), "missing file reports an error");

    r = run("commit " + quoted("no-such-file.yaml"));
    check(r.code == 3, "commit of a missing file exits 3");
}

static void case_tampered() {
    // Sort key of the first transfer key swapped; the header is intact.
    std::string yaml = keyset_yaml::emit_prover_yaml(mock_prover<OrderByInputs>());
    size_t pos = yaml.find("[1, 2]");
    check(pos != std::string::npos, "sort key text found in emitted YAML");
    if (pos != std::string::npos)
        yaml.replace(pos, 6, "[2, 1]");
    spit("tampered.yaml", yaml);

    RunResult r = run("fit " + quoted("tampered.yaml") + " --inputs 1 --outputs 1");
    check(r.code == 4, "tampered YAML exits 4");
    check(contains(r.err, "invalid key set"), "tampered YAML is reported as invalid");

    std::vector<uint8_t> packed = keyset_mp::pack(mock_verifier<OrderByInputs>());
    packed.resize(packed.size() / 2);
    spit("truncated.mp", packed);
    r = run("info " + quoted("truncated.mp"));
    check(r.code == 4, "truncated msgpack exits 4");

    spit("garbage.mp", std::vector<uint8_t>{0x85, 0x01});
    r = run("commit " + quoted("garbage.mp"));
    check(r.code == 4, "malformed msgpack header exits 4");
}

static void case_commit() {
    RunResult r = run("commit " + quoted("prover.mp"));
    check(r.code == 1, "commit of a prover bundle exits 1");

    r = run("commit " + quoted("verifier.mp"));
    check(r.code == 0, "commit of a verifier bundle exits 0");
    check(r.out == verifier_hex() + "\n", "commit prints the commitment");

    r = run("info " + quoted("verifier.yaml"));
    check(r.code == 0, "info exits 0");
    check(contains(r.out, verifier_hex()), "info prints the commitment");
    check(contains(r.out, "max size (3, 1)"), "info prints the max size");
}

static void case_convert() {
    const std::string hex = verifier_hex() + "\n";

    RunResult r = run("convert " + quoted("verifier.yaml") + " --to msgpack --out " +
                      quoted("converted.mp"));
    check(r.code == 0, "convert YAML to msgpack exits 0");
    check(slurp(path_of("converted.mp")) == slurp(path_of("verifier.mp")),
          "converted msgpack is the canonical encoding");
    r = run("commit " + quoted("converted.mp"));
    check(r.code == 0 && r.out == hex, "commitment survives YAML to msgpack");

    r = run("convert " + quoted("verifier.mp") + " --to yaml --out " + quoted("converted.yaml"));
    check(r.code == 0, "convert msgpack to YAML exits 0");
    r = run("commit " + quoted("converted.yaml"));
    check(r.code == 0 && r.out == hex, "commitment survives msgpack to YAML");

    r = run("convert " + quoted("verifier.mp") + " --to yaml");
    check(r.code == 0, "convert to YAML on stdout exits 0");
    check(keyset_yaml::load_verifier_yaml<OrderByInputs>(r.out) == mock_verifier<OrderByInputs>(),
          "YAML on stdout loads back to the same bundle");

    r = run("convert " + quoted("prover.yaml") + " --to msgpack");
    check(r.code == 1, "msgpack output without --out exits 1");
}

// Hand-written YAML need not start with "---".
static void case_bare_yaml() {
    std::string yaml = keyset_yaml::emit_verifier_yaml(mock_verifier<OrderByInputs>());
    if (yaml.compare(0, 3, "---") == 0)
        yaml.erase(0, yaml.find('\n') + 1);
    spit("bare.yaml", "# verifier keys\n" + yaml);

    RunResult r = run("fit " + quoted("bare.yaml") + " --inputs 1 --outputs 1");
    check(r.code == 0, "YAML without a document marker is detected");
    check(contains(r.out, "best fit: (1, 2)"), "bare YAML answers the query");

    r = run("commit " + quoted("bare.yaml"));
    check(r.code == 0 && r.out == verifier_hex() + "\n", "bare YAML commits the same");
}

static void case_usage() {
    check(run("").code == 1, "no command exits 1");
    check(run("bogus").code == 1, "unknown command exits 1");
    check(run("--help").code == 0, "--help exits 0");

    RunResult r = run("fit " + quoted("prover.mp") +
                      " --inputs 99999999999999999999999 --outputs 1");
    check(r.code == 1, "out-of-range count exits 1");
    check(contains(r.err, "--inputs"), "out-of-range count names the option");

    check(run("fit " + quoted("prover.mp") + " --inputs -1 --outputs 1").code == 1,
          "negative count exits 1");
    check(run("fit " + quoted("prover.mp") + " --kind mint --inputs 1 --outputs 1").code == 1,
          "unknown key kind exits 1");
    check(run("fit " + quoted("prover.mp") + " --inputs 1").code == 1,
          "missing --outputs exits 1");
}

int main(int argc, char* argv[]) {
    if (argc != 4) {
        std::cerr << "Usage: " << argv[0] << " <keyset binary> <work dir> <case>\n";
        return 1;
    }
    g_keyset = argv[1];
    g_dir    = argv[2];
    std::string name = argv[3];

    std::error_code ec;
    std::filesystem::create_directories(g_dir, ec);
    if (ec) {
        std::cerr << "FAIL: cannot create " << g_dir << ": " << ec.message() << "\n";
        return 1;
    }
    write_fixtures();

    if      (name == "fit_hit")      case_fit_hit();
    else if (name == "fit_miss")     case_fit_miss();
    else if (name == "exact")        case_exact();
    else if (name == "missing_file") case_missing_file();
    else if (name == "tampered")     case_tampered();
    else if (name == "commit")       case_commit();
    else if (name == "convert")      case_convert();
    else if (name == "bare_yaml")    case_bare_yaml();
    else if (name == "usage")        case_usage();
    else {
        std::cerr << "Unknown case: " << name << "\n";
        return 1;
    }
    return finish();
}
