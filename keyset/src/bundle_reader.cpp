#include "bundle_reader.hpp"
#include "keyset_pack.hpp"
#include "keyset_yaml.hpp"
#include <fstream>
#include <iterator>
#include <stdexcept>

using keyset::OrderByInputs;
using keyset::OrderByOutputs;

static std::string as_text(const BundleFile& f) {
    return std::string(f.raw.begin(), f.raw.end());
}

bool is_msgpack_map(uint8_t first) {
    return (first & 0xF0) == 0x80 || first == 0xDE || first == 0xDF;
}

BundleFile read_bundle_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw std::runtime_error("Cannot open key set file: " + path);

    BundleFile f;
    f.path = path;
    f.raw.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (!in && !in.eof())
        throw std::runtime_error("Read error on key set file: " + path);
    if (f.raw.empty())
        throw std::runtime_error("Key set file is empty: " + path);

    // Packed bundles are a msgpack map; anything else is read as YAML,
    // with or without a leading "---".
    f.encoding = is_msgpack_map(f.raw[0]) ? Encoding::Msgpack : Encoding::Yaml;
    return f;
}

void read_header(BundleFile& f) {
    if (f.encoding == Encoding::Yaml)
        f.header = keyset_yaml::peek_header(as_text(f));
    else
        f.header = keyset_mp::peek_header(f.raw);
}

template <class Order>
keyset::ProverKeySet<Order> load_prover(const BundleFile& f) {
    if (f.encoding == Encoding::Yaml)
        return keyset_yaml::load_prover_yaml<Order>(as_text(f));
    return keyset_mp::unpack_prover<Order>(f.raw);
}

template <class Order>
keyset::VerifierKeySet<Order> load_verifier(const BundleFile& f) {
    if (f.encoding == Encoding::Yaml)
        return keyset_yaml::load_verifier_yaml<Order>(as_text(f));
    return keyset_mp::unpack_verifier<Order>(f.raw);
}

void write_file(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary);
    if (!out) throw std::runtime_error("Cannot open output file: " + path);
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    if (!out) throw std::runtime_error("Write error on " + path);
}

template keyset::ProverKeySet<OrderByInputs>    load_prover(const BundleFile&);
template keyset::ProverKeySet<OrderByOutputs>   load_prover(const BundleFile&);
template keyset::VerifierKeySet<OrderByInputs>  load_verifier(const BundleFile&);
template keyset::VerifierKeySet<OrderByOutputs> load_verifier(const BundleFile&);
