#include "commit.hpp"
#include "keyset_pack.hpp"
#include "keyset_yaml.hpp"
#include "fixtures.hpp"
#include <iostream>
#include <string>

using keyset::OrderByInputs;
using keyset::OrderByOutputs;
using keyset_commit::Commitment;

int main() {
    auto ks = mock_verifier<OrderByInputs>();

    Commitment c1 = keyset_commit::commit(ks);
    Commitment c2 = keyset_commit::commit(mock_verifier<OrderByInputs>());
    std::cout << "Commitment: " << keyset_commit::to_hex(c1) << "\n";

    check(c1 == c2, "commitment is deterministic");
    check(keyset_commit::to_hex(c1).size() == 64, "hex form is 64 characters");

    check(c1 == keyset_commit::commit_bytes(keyset_commit::kVerifierLabel, keyset_mp::pack(ks)),
          "commitment hashes the canonical encoding");
    check(c1 != keyset_commit::commit_bytes("another label", keyset_mp::pack(ks)),
          "label separates domains");

    // Any change to the key material changes the commitment.
    auto altered = ks;
    std::vector<keyset::TransactionVerifyingKey> keys(altered.freeze.begin(), altered.freeze.end());
    std::vector<uint8_t> material = keys.back().material();
    material[0] ^= 0x01;
    keys.back() = keyset::FreezeVerifyingKey{keys.back().num_inputs(), keys.back().num_outputs(),
                                             material};
    altered.freeze = keyset::KeySet<keyset::TransactionVerifyingKey>(keys);
    check(keyset_commit::commit(altered) != c1, "one flipped bit changes the commitment");

    altered = ks;
    altered.mint = keyset::MintVerifyingKey{mock_material(1, 2, 0x67, 200)};
    check(keyset_commit::commit(altered) != c1, "different mint key changes the commitment");

    // The ordering is part of the encoding.
    check(keyset_commit::commit(mock_verifier<OrderByOutputs>()) != c1,
          "ordering is committed to");

    // The commitment survives serialization in either format.
    auto from_mp = keyset_mp::unpack_verifier<OrderByInputs>(keyset_mp::pack(ks));
    check(keyset_commit::commit(from_mp) == c1, "commitment survives msgpack");

    auto from_yaml = keyset_yaml::load_verifier_yaml<OrderByInputs>(
        keyset_yaml::emit_verifier_yaml(ks));
    check(keyset_commit::commit(from_yaml) == c1, "commitment survives YAML");

    // Length prefix: the empty input and a single zero byte differ.
    check(keyset_commit::commit_bytes(keyset_commit::kVerifierLabel, {}) !=
          keyset_commit::commit_bytes(keyset_commit::kVerifierLabel, {0}),
          "empty and one-byte inputs differ");

    return finish();
}
