#include "commit.hpp"
#include "keyset_pack.hpp"
#include "blake3.h"
#include <cstdio>
#include <stdexcept>

using keyset::OrderByInputs;
using keyset::OrderByOutputs;
using keyset::VerifierKeySet;

namespace keyset_commit {

Commitment commit_bytes(const char* label, const std::vector<uint8_t>& bytes) {
    blake3_hasher h;
    blake3_hasher_init_derive_key(&h, label);

    uint64_t len = static_cast<uint64_t>(bytes.size());
    uint8_t  len_le[8];
    for (int i = 0; i < 8; ++i)
        len_le[i] = static_cast<uint8_t>((len >> (8 * i)) & 0xFF);
    blake3_hasher_update(&h, len_le, sizeof(len_le));
    blake3_hasher_update(&h, bytes.data(), bytes.size());

    Commitment out;
    blake3_hasher_finalize(&h, out.data(), out.size());
    return out;
}

template <class Order>
Commitment commit(const VerifierKeySet<Order>& ks) {
    std::vector<uint8_t> bytes;
    try {
        bytes = keyset_mp::pack(ks);
    } catch (const std::exception& e) {
        throw std::logic_error(std::string("commit: verifier key set is not serializable: ") +
                               e.what());
    }
    return commit_bytes(kVerifierLabel, bytes);
}

std::string to_hex(const Commitment& c) {
    std::string out;
    out.reserve(c.size() * 2);
    char buf[3];
    for (uint8_t b : c) {
        std::snprintf(buf, sizeof(buf), "%02x", b);
        out += buf;
    }
    return out;
}

template Commitment commit(const VerifierKeySet<OrderByInputs>&);
template Commitment commit(const VerifierKeySet<OrderByOutputs>&);

} // namespace keyset_commit
