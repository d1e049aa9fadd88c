#pragma once
#include "key_bundle.hpp"
#include <vector>
#include <cstdint>

// Canonical binary form of key sets and bundles. Every integer is packed as
// uint64 and every field appears in a fixed order, so equal key sets always
// produce identical bytes.
namespace keyset_mp {
    template <class K, class Order>
    std::vector<uint8_t>            pack(const keyset::KeySet<K, Order>& ks);
    template <class K, class Order>
    keyset::KeySet<K, Order>        unpack_keyset(const std::vector<uint8_t>& data);

    template <class Order>
    std::vector<uint8_t>            pack(const keyset::ProverKeySet<Order>& ks);
    template <class Order>
    std::vector<uint8_t>            pack(const keyset::VerifierKeySet<Order>& ks);
    template <class Order>
    keyset::ProverKeySet<Order>     unpack_prover(const std::vector<uint8_t>& data);
    template <class Order>
    keyset::VerifierKeySet<Order>   unpack_verifier(const std::vector<uint8_t>& data);

    // Reads only the version, kind and order fields of a packed bundle.
    keyset::BundleHeader            peek_header(const std::vector<uint8_t>& data);
}
