#pragma once
#include "key_bundle.hpp"
#include <cstdint>
#include <string>
#include <vector>

enum class Encoding { Yaml, Msgpack };

struct BundleFile {
    std::string          path;
    Encoding             encoding = Encoding::Msgpack;
    keyset::BundleHeader header;
    std::vector<uint8_t> raw;
};

// Reads a key set file and detects its encoding. Throws std::runtime_error
// on I/O errors only; the header is left empty.
BundleFile read_bundle_file(const std::string& path);

// True if `first` opens a msgpack map (fixmap, map 16 or map 32).
bool is_msgpack_map(uint8_t first);

// Decodes the header of a file read by read_bundle_file. Throws on a
// malformed header.
void read_header(BundleFile& f);

template <class Order>
keyset::ProverKeySet<Order>   load_prover(const BundleFile& f);
template <class Order>
keyset::VerifierKeySet<Order> load_verifier(const BundleFile& f);

void write_file(const std::string& path, const std::vector<uint8_t>& bytes);
