#pragma once
#include "key_bundle.hpp"
#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

// Mock key material shared by the test programs. Material bytes are derived
// from the key size and a tag so that distinct keys never compare equal.

static int g_failures = 0;

inline bool check(bool cond, const std::string& msg) {
    if (!cond) {
        std::cerr << "FAIL: " << msg << "\n";
        ++g_failures;
    }
    return cond;
}

inline int finish() {
    if (g_failures == 0) {
        std::cout << "PASS\n";
        return 0;
    }
    std::cerr << g_failures << " check(s) failed\n";
    return 1;
}

using ShapeList = std::vector<std::pair<size_t, size_t>>;

inline std::vector<uint8_t> mock_material(size_t ni, size_t no, uint8_t tag, size_t len = 48) {
    std::vector<uint8_t> m(len);
    for (size_t i = 0; i < len; ++i)
        m[i] = static_cast<uint8_t>(tag ^ (ni * 31 + no * 7 + i));
    return m;
}

inline std::vector<keyset::TransferProvingKey> transfer_pks(const ShapeList& shapes) {
    std::vector<keyset::TransferProvingKey> keys;
    for (const auto& s : shapes)
        keys.push_back({s.first, s.second, mock_material(s.first, s.second, 0x11)});
    return keys;
}

inline std::vector<keyset::FreezeProvingKey> freeze_pks(const ShapeList& shapes) {
    std::vector<keyset::FreezeProvingKey> keys;
    for (const auto& s : shapes)
        keys.push_back({s.first, s.second, mock_material(s.first, s.second, 0x22)});
    return keys;
}

inline std::vector<keyset::TransactionVerifyingKey> transfer_vks(const ShapeList& shapes) {
    std::vector<keyset::TransactionVerifyingKey> keys;
    for (const auto& s : shapes)
        keys.push_back(keyset::TransferVerifyingKey{s.first, s.second,
                                                    mock_material(s.first, s.second, 0x33)});
    return keys;
}

inline std::vector<keyset::TransactionVerifyingKey> freeze_vks(const ShapeList& shapes) {
    std::vector<keyset::TransactionVerifyingKey> keys;
    for (const auto& s : shapes)
        keys.push_back(keyset::FreezeVerifyingKey{s.first, s.second,
                                                  mock_material(s.first, s.second, 0x44)});
    return keys;
}

template <class Order = keyset::OrderByInputs>
inline keyset::ProverKeySet<Order> mock_prover() {
    keyset::ProverKeySet<Order> ks;
    ks.mint.material = mock_material(1, 2, 0x55, 300);
    ks.xfr    = keyset::KeySet<keyset::TransferProvingKey, Order>(
        transfer_pks({{1, 2}, {2, 2}, {2, 3}, {3, 1}}));
    ks.freeze = keyset::KeySet<keyset::FreezeProvingKey, Order>(
        freeze_pks({{2, 2}, {3, 3}}));
    return ks;
}

template <class Order = keyset::OrderByInputs>
inline keyset::VerifierKeySet<Order> mock_verifier() {
    keyset::VerifierKeySet<Order> ks;
    ks.mint   = keyset::MintVerifyingKey{mock_material(1, 2, 0x66, 200)};
    ks.xfr    = keyset::KeySet<keyset::TransactionVerifyingKey, Order>(
        transfer_vks({{1, 2}, {2, 2}, {2, 3}, {3, 1}}));
    ks.freeze = keyset::KeySet<keyset::TransactionVerifyingKey, Order>(
        freeze_vks({{2, 2}, {3, 3}}));
    return ks;
}
