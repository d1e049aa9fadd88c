#pragma once
#include "key_bundle.hpp"
#include <string>

// Human-readable form of key bundles. Key sets are written as sequences of
// [sort key, key] pairs rather than maps, since YAML consumers generally
// expect scalar map keys.
namespace keyset_yaml {
    template <class Order>
    std::string                     emit_prover_yaml(const keyset::ProverKeySet<Order>& ks);
    template <class Order>
    std::string                     emit_verifier_yaml(const keyset::VerifierKeySet<Order>& ks);

    template <class Order>
    keyset::ProverKeySet<Order>     load_prover_yaml(const std::string& text);
    template <class Order>
    keyset::VerifierKeySet<Order>   load_verifier_yaml(const std::string& text);

    keyset::BundleHeader            peek_header(const std::string& text);
}
