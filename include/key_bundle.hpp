#pragma once
#include "keyset.hpp"
#include "cap_keys.hpp"
#include <stdexcept>
#include <string>

namespace keyset {

// Everything a wallet needs to build proofs: one mint key plus transfer and
// freeze keys for each supported transaction size.
template <class Order = OrderByInputs>
struct ProverKeySet {
    MintProvingKey                    mint;
    KeySet<TransferProvingKey, Order> xfr;
    KeySet<FreezeProvingKey, Order>   freeze;
};

// Verifier counterpart. The transfer and freeze sets hold
// TransactionVerifyingKeys of the matching kind.
template <class Order = OrderByInputs>
struct VerifierKeySet {
    TransactionVerifyingKey                 mint;
    KeySet<TransactionVerifyingKey, Order>  xfr;
    KeySet<TransactionVerifyingKey, Order>  freeze;
};

template <class Order>
bool operator==(const ProverKeySet<Order>& a, const ProverKeySet<Order>& b) {
    return a.mint == b.mint && a.xfr == b.xfr && a.freeze == b.freeze;
}

template <class Order>
bool operator==(const VerifierKeySet<Order>& a, const VerifierKeySet<Order>& b) {
    return a.mint == b.mint && a.xfr == b.xfr && a.freeze == b.freeze;
}

// Identifies a serialized bundle without decoding its keys.
struct BundleHeader {
    int         version = 1;
    std::string kind;   // "prover" or "verifier"
    std::string order;  // OrderByInputs::name() or OrderByOutputs::name()
};

static constexpr int  kBundleVersion    = 1;
static constexpr char kProverBundle[]   = "prover";
static constexpr char kVerifierBundle[] = "verifier";

// Rejects a header from another version, bundle kind or ordering.
inline void check_header(const BundleHeader& hdr, const char* kind, const char* order) {
    if (hdr.version != kBundleVersion)
        throw std::runtime_error("unsupported key set version " + std::to_string(hdr.version));
    if (hdr.kind != kind)
        throw std::runtime_error("expected a " + std::string(kind) +
                                 " key set, got '" + hdr.kind + "'");
    if (hdr.order != order)
        throw std::runtime_error("key set is ordered by " + hdr.order +
                                 ", expected " + order);
}

} // namespace keyset
