#pragma once
#include "key_bundle.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace keyset_commit {

using Commitment = std::array<uint8_t, 32>;

// Domain-separation label for verifier key set commitments.
static constexpr char kVerifierLabel[] = "VerifCRS Comm";

// BLAKE3 derive-key hash of `bytes` under context `label`. The input is
// length-prefixed (uint64 little-endian) so the encoding is unambiguous.
Commitment commit_bytes(const char* label, const std::vector<uint8_t>& bytes);

// Commits to the canonical msgpack encoding of a verifier key set. A bundle
// that cannot be encoded is corrupt and raises std::logic_error.
template <class Order>
Commitment commit(const keyset::VerifierKeySet<Order>& ks);

std::string to_hex(const Commitment& c);

} // namespace keyset_commit
