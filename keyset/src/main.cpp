#include "bundle_reader.hpp"
#include "keyset_pack.hpp"
#include "keyset_yaml.hpp"
#include "commit.hpp"
#include <iostream>
#include <string>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <limits>

using keyset::OrderByInputs;
using keyset::OrderByOutputs;

// ── Usage ─────────────────────────────────────────────────────────────────────

static void print_usage(const char* prog) {
    std::cerr <<
        "Usage:\n"
        "  " << prog << " info    <file>\n"
        "  " << prog << " fit     <file> --kind xfr|freeze --inputs <n> --outputs <m> [--exact]\n"
        "  " << prog << " commit  <file>\n"
        "  " << prog << " convert <file> --to yaml|msgpack [--out <file>]\n"
        "\n"
        "  <file>     Prover or verifier key set (YAML or msgpack, auto-detected)\n"
        "  --kind     Which key set to search (default: xfr)\n"
        "  --exact    Require a key of exactly the requested size\n"
        "  --to       Output encoding; msgpack output requires --out\n"
        "\n"
        "  info:    prints every key size in the set, and the commitment of a verifier set\n"
        "  fit:     prints the smallest key size that can serve the transaction\n"
        "  commit:  prints the verifier key set commitment (hex)\n"
        "  convert: re-encodes a key set\n"
        "\n"
        "Exit codes: 0=ok, 1=usage, 2=no fitting key, 3=I/O, 4=invalid key set\n";
}

// ── Helpers ───────────────────────────────────────────────────────────────────

static bool parse_count(const char* s, size_t& out) {
    if (!*s || s[0] == '-') return false;
    char* end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(s, &end, 10);
    if (*end != '\0' || errno == ERANGE) return false;
    if (v > std::numeric_limits<size_t>::max()) return false;
    out = static_cast<size_t>(v);
    return true;
}

// Runs fn(Order{}) with the ordering named in the file header.
template <class F>
static int with_order(const BundleFile& f, F&& fn) {
    if (f.header.order == OrderByInputs::name())  return fn(OrderByInputs());
    if (f.header.order == OrderByOutputs::name()) return fn(OrderByOutputs());
    std::cerr << "Error: unknown key set order '" << f.header.order << "'\n";
    return 4;
}

// Returns 0, or the exit code for a file that cannot be read (3) or whose
// header is malformed (4).
static int read_input(const std::string& path, BundleFile& f) {
    try {
        f = read_bundle_file(path);
    } catch (const std::exception& e) {
        std::cerr << "Error: cannot load key set: " << e.what() << "\n";
        return 3;
    }
    try {
        read_header(f);
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid key set: " << e.what() << "\n";
        return 4;
    }
    return 0;
}

static size_t material_size(const keyset::TransferProvingKey& k)      { return k.material.size(); }
static size_t material_size(const keyset::FreezeProvingKey& k)        { return k.material.size(); }
static size_t material_size(const keyset::TransactionVerifyingKey& k) { return k.material().size(); }

template <class KS>
static void print_keyset(const char* label, const KS& ks) {
    std::cout << "  " << label << ": " << ks.size() << " keys, max size "
              << keyset::to_string(ks.max_size()) << "\n";
    for (const auto& k : ks) {
        std::cout << "    - " << keyset::to_string(keyset::shape_of(k))
                  << "  " << material_size(k) << "B\n";
    }
}

static void print_header(const BundleFile& f) {
    std::cout << "Key set:\n"
              << "  file:     " << f.path                                        << "\n"
              << "  encoding: " << (f.encoding == Encoding::Yaml ? "yaml" : "msgpack") << "\n"
              << "  kind:     " << f.header.kind                                 << "\n"
              << "  order:    " << f.header.order                                << "\n";
}

template <class KS>
static int report_fit(const KS& ks, size_t ni, size_t no, bool exact) {
    const keyset::Shape want{ni, no};
    if (exact) {
        if (ks.exact_fit_key(ni, no)) {
            std::cout << "exact fit: " << keyset::to_string(want) << "\n";
            return 0;
        }
        std::cerr << "Error: no key of size " << keyset::to_string(want) << "\n";
        return 2;
    }

    auto fit = ks.best_fit_key(ni, no);
    if (fit) {
        std::cout << "best fit: " << keyset::to_string(fit.shape())
                  << " for " << keyset::to_string(want) << "\n";
        return 0;
    }
    std::cerr << "Error: no key fits " << keyset::to_string(want)
              << "; largest supported size is " << keyset::to_string(fit.max_size()) << "\n";
    return 2;
}

// ── info command ──────────────────────────────────────────────────────────────

template <class Order>
static int run_info(const BundleFile& f) {
    print_header(f);
    if (f.header.kind == keyset::kProverBundle) {
        auto ks = load_prover<Order>(f);
        std::cout << "  mint:   " << ks.mint.material.size() << "B\n";
        print_keyset("xfr", ks.xfr);
        print_keyset("freeze", ks.freeze);
    } else {
        auto ks = load_verifier<Order>(f);
        std::cout << "  mint:   " << keyset::to_string(keyset::shape_of(ks.mint))
                  << "  " << ks.mint.material().size() << "B\n";
        print_keyset("xfr", ks.xfr);
        print_keyset("freeze", ks.freeze);
        std::cout << "  commitment: " << keyset_commit::to_hex(keyset_commit::commit(ks)) << "\n";
    }
    return 0;
}

static int cmd_info(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "Error: info takes exactly one file\n";
        return 1;
    }

    BundleFile f;
    if (int rc = read_input(argv[1], f)) return rc;

    try {
        return with_order(f, [&](auto order) {
            return run_info<decltype(order)>(f);
        });
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid key set: " << e.what() << "\n";
        return 4;
    }
}

// ── fit command ───────────────────────────────────────────────────────────────

template <class Order>
static int run_fit(const BundleFile& f, bool freeze, size_t ni, size_t no, bool exact) {
    if (f.header.kind == keyset::kProverBundle) {
        auto ks = load_prover<Order>(f);
        return freeze ? report_fit(ks.freeze, ni, no, exact) : report_fit(ks.xfr, ni, no, exact);
    }
    auto ks = load_verifier<Order>(f);
    return freeze ? report_fit(ks.freeze, ni, no, exact) : report_fit(ks.xfr, ni, no, exact);
}

static int cmd_fit(int argc, char* argv[]) {
    std::string path;
    std::string kind = "xfr";
    size_t ni = 0, no = 0;
    bool got_in = false, got_out = false, exact = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--kind") == 0) {
            if (++i >= argc) { std::cerr << "Error: --kind requires a value\n"; return 1; }
            kind = argv[i];
        } else if (std::strcmp(argv[i], "--inputs") == 0) {
            if (++i >= argc || !parse_count(argv[i], ni)) {
                std::cerr << "Error: --inputs requires a non-negative integer\n";
                return 1;
            }
            got_in = true;
        } else if (std::strcmp(argv[i], "--outputs") == 0) {
            if (++i >= argc || !parse_count(argv[i], no)) {
                std::cerr << "Error: --outputs requires a non-negative integer\n";
                return 1;
            }
            got_out = true;
        } else if (std::strcmp(argv[i], "--exact") == 0) {
            exact = true;
        } else if (argv[i][0] == '-') {
            std::cerr << "Error: unknown option: " << argv[i] << "\n";
            return 1;
        } else if (path.empty()) {
            path = argv[i];
        } else {
            std::cerr << "Error: unexpected argument: " << argv[i] << "\n";
            return 1;
        }
    }

    if (path.empty() || !got_in || !got_out) {
        std::cerr << "Error: fit requires <file>, --inputs and --outputs\n";
        return 1;
    }
    if (kind != "xfr" && kind != "freeze") {
        std::cerr << "Error: unknown key kind '" << kind << "' (must be xfr or freeze)\n";
        return 1;
    }

    BundleFile f;
    if (int rc = read_input(path, f)) return rc;

    try {
        return with_order(f, [&](auto order) {
            return run_fit<decltype(order)>(f, kind == "freeze", ni, no, exact);
        });
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid key set: " << e.what() << "\n";
        return 4;
    }
}

// ── commit command ────────────────────────────────────────────────────────────

static int cmd_commit(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "Error: commit takes exactly one file\n";
        return 1;
    }

    BundleFile f;
    if (int rc = read_input(argv[1], f)) return rc;

    if (f.header.kind != keyset::kVerifierBundle) {
        std::cerr << "Error: only verifier key sets have a commitment\n";
        return 1;
    }

    try {
        return with_order(f, [&](auto order) {
            auto ks = load_verifier<decltype(order)>(f);
            std::cout << keyset_commit::to_hex(keyset_commit::commit(ks)) << "\n";
            return 0;
        });
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid key set: " << e.what() << "\n";
        return 4;
    }
}

// ── convert command ───────────────────────────────────────────────────────────

template <class Bundle>
static int emit(const Bundle& ks, std::string yaml, bool to_yaml, const std::string& out_file) {
    if (to_yaml && out_file.empty()) {
        std::cout << yaml;
        return 0;
    }
    std::vector<uint8_t> bytes = to_yaml ? std::vector<uint8_t>(yaml.begin(), yaml.end())
                                         : keyset_mp::pack(ks);
    try {
        write_file(out_file, bytes);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    }
    std::cout << "Wrote " << bytes.size() << " bytes to " << out_file << "\n";
    return 0;
}

template <class Order>
static int run_convert(const BundleFile& f, bool to_yaml, const std::string& out_file) {
    if (f.header.kind == keyset::kProverBundle) {
        auto ks = load_prover<Order>(f);
        return emit(ks, to_yaml ? keyset_yaml::emit_prover_yaml(ks) : "", to_yaml, out_file);
    }
    auto ks = load_verifier<Order>(f);
    return emit(ks, to_yaml ? keyset_yaml::emit_verifier_yaml(ks) : "", to_yaml, out_file);
}

static int cmd_convert(int argc, char* argv[]) {
    std::string path;
    std::string to;
    std::string out_file;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--to") == 0) {
            if (++i >= argc) { std::cerr << "Error: --to requires a value\n"; return 1; }
            to = argv[i];
        } else if (std::strcmp(argv[i], "--out") == 0) {
            if (++i >= argc) { std::cerr << "Error: --out requires a filename\n"; return 1; }
            out_file = argv[i];
        } else if (argv[i][0] == '-') {
            std::cerr << "Error: unknown option: " << argv[i] << "\n";
            return 1;
        } else if (path.empty()) {
            path = argv[i];
        } else {
            std::cerr << "Error: unexpected argument: " << argv[i] << "\n";
            return 1;
        }
    }

    if (path.empty() || (to != "yaml" && to != "msgpack")) {
        std::cerr << "Error: convert requires <file> and --to yaml|msgpack\n";
        return 1;
    }
    if (to == "msgpack" && out_file.empty()) {
        std::cerr << "Error: msgpack output requires --out\n";
        return 1;
    }

    BundleFile f;
    if (int rc = read_input(path, f)) return rc;

    try {
        return with_order(f, [&](auto order) {
            return run_convert<decltype(order)>(f, to == "yaml", out_file);
        });
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid key set: " << e.what() << "\n";
        return 4;
    }
}

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];

    if (cmd == "info")    return cmd_info(argc - 1, argv + 1);
    if (cmd == "fit")     return cmd_fit(argc - 1, argv + 1);
    if (cmd == "commit")  return cmd_commit(argc - 1, argv + 1);
    if (cmd == "convert") return cmd_convert(argc - 1, argv + 1);

    if (cmd == "--help" || cmd == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    std::cerr << "Error: unknown command '" << cmd << "'\n";
    print_usage(argv[0]);
    return 1;
}
