#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// Circuit keys of the transaction system. Key material is produced by the
// proof system's setup and is carried here as opaque bytes; only the arity
// each circuit was generated for is interpreted.

namespace keyset {

// ── Proving keys ──────────────────────────────────────────────────────────────

struct TransferProvingKey {
    size_t               n_in  = 0;
    size_t               n_out = 0;
    std::vector<uint8_t> material;

    size_t num_inputs() const  { return n_in; }
    size_t num_outputs() const { return n_out; }
};

// n_in includes the fee input.
struct FreezeProvingKey {
    size_t               n_in  = 0;
    size_t               n_out = 0;
    std::vector<uint8_t> material;

    size_t num_inputs() const  { return n_in; }
    size_t num_outputs() const { return n_out; }
};

struct MintProvingKey {
    std::vector<uint8_t> material;
};

// ── Verifying keys ────────────────────────────────────────────────────────────

struct TransferVerifyingKey {
    size_t               n_in  = 0;
    size_t               n_out = 0;
    std::vector<uint8_t> material;
};

struct FreezeVerifyingKey {
    size_t               n_in  = 0;
    size_t               n_out = 0;
    std::vector<uint8_t> material;
};

struct MintVerifyingKey {
    std::vector<uint8_t> material;
};

inline bool operator==(const TransferProvingKey& a, const TransferProvingKey& b) {
    return a.n_in == b.n_in && a.n_out == b.n_out && a.material == b.material;
}
inline bool operator==(const FreezeProvingKey& a, const FreezeProvingKey& b) {
    return a.n_in == b.n_in && a.n_out == b.n_out && a.material == b.material;
}
inline bool operator==(const MintProvingKey& a, const MintProvingKey& b) {
    return a.material == b.material;
}
inline bool operator==(const TransferVerifyingKey& a, const TransferVerifyingKey& b) {
    return a.n_in == b.n_in && a.n_out == b.n_out && a.material == b.material;
}
inline bool operator==(const FreezeVerifyingKey& a, const FreezeVerifyingKey& b) {
    return a.n_in == b.n_in && a.n_out == b.n_out && a.material == b.material;
}
inline bool operator==(const MintVerifyingKey& a, const MintVerifyingKey& b) {
    return a.material == b.material;
}

// ── TransactionVerifyingKey ───────────────────────────────────────────────────

// Variant order fixes the TxKind values; do not reorder.
enum class TxKind : uint8_t { Transfer = 0, Freeze = 1, Mint = 2 };

inline const char* tx_kind_name(TxKind k) {
    switch (k) {
        case TxKind::Transfer: return "transfer";
        case TxKind::Freeze:   return "freeze";
        case TxKind::Mint:     return "mint";
    }
    return "unknown";
}

inline TxKind tx_kind_from_name(const std::string& s) {
    if (s == "transfer") return TxKind::Transfer;
    if (s == "freeze")   return TxKind::Freeze;
    if (s == "mint")     return TxKind::Mint;
    throw std::runtime_error("Unknown transaction kind: " + s);
}

// Verifying key for any of the three transaction circuits.
class TransactionVerifyingKey {
public:
    TransactionVerifyingKey() = default;
    TransactionVerifyingKey(TransferVerifyingKey k) : vk_(std::move(k)) {}
    TransactionVerifyingKey(FreezeVerifyingKey k)   : vk_(std::move(k)) {}
    TransactionVerifyingKey(MintVerifyingKey k)     : vk_(std::move(k)) {}

    TxKind kind() const { return static_cast<TxKind>(vk_.index()); }

    // The mint circuit always has one input and two outputs, whatever its
    // key material says.
    size_t num_inputs() const {
        switch (kind()) {
            case TxKind::Transfer: return std::get<TransferVerifyingKey>(vk_).n_in;
            case TxKind::Freeze:   return std::get<FreezeVerifyingKey>(vk_).n_in;
            case TxKind::Mint:     return 1;
        }
        return 0;
    }

    size_t num_outputs() const {
        switch (kind()) {
            case TxKind::Transfer: return std::get<TransferVerifyingKey>(vk_).n_out;
            case TxKind::Freeze:   return std::get<FreezeVerifyingKey>(vk_).n_out;
            case TxKind::Mint:     return 2;
        }
        return 0;
    }

    const std::vector<uint8_t>& material() const {
        switch (kind()) {
            case TxKind::Transfer: return std::get<TransferVerifyingKey>(vk_).material;
            case TxKind::Freeze:   return std::get<FreezeVerifyingKey>(vk_).material;
            case TxKind::Mint:     break;
        }
        return std::get<MintVerifyingKey>(vk_).material;
    }

    const TransferVerifyingKey* as_transfer() const { return std::get_if<TransferVerifyingKey>(&vk_); }
    const FreezeVerifyingKey*   as_freeze() const   { return std::get_if<FreezeVerifyingKey>(&vk_); }
    const MintVerifyingKey*     as_mint() const     { return std::get_if<MintVerifyingKey>(&vk_); }

    bool operator==(const TransactionVerifyingKey& o) const { return vk_ == o.vk_; }
    bool operator!=(const TransactionVerifyingKey& o) const { return !(*this == o); }

private:
    std::variant<TransferVerifyingKey, FreezeVerifyingKey, MintVerifyingKey> vk_;
};

// Verifier bundles keep all three kinds in one type, so each slot checks
// what it was given.
inline void require_kind(const TransactionVerifyingKey& k, TxKind expected, const char* ctx) {
    if (k.kind() != expected)
        throw std::runtime_error(std::string(ctx) + ": expected a " + tx_kind_name(expected) +
                                 " key, got " + tx_kind_name(k.kind()));
}

} // namespace keyset
