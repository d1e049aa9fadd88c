#include "keyset_yaml.hpp"
#include "base64.hpp"
#include <yaml-cpp/yaml.h>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <vector>

using keyset::BundleHeader;
using keyset::FreezeProvingKey;
using keyset::KeySet;
using keyset::MintProvingKey;
using keyset::OrderByInputs;
using keyset::OrderByOutputs;
using keyset::ProverKeySet;
using keyset::TransactionVerifyingKey;
using keyset::TransferProvingKey;
using keyset::TxKind;
using keyset::VerifierKeySet;

namespace keyset_yaml {

static const char kTypeSuffix[] = "-keyset";

// ── Base64 helpers ────────────────────────────────────────────────────────────

// Base64 wrapped at 64 chars, no trailing newline, so that yaml-cpp emits a
// '|-' block for long material and a plain scalar for short material.
static std::string b64_for_yaml(const std::vector<uint8_t>& data) {
    std::string b64 = base64_encode(data);
    if (b64.size() <= 64)
        return b64;

    std::string out;
    out.reserve(b64.size() + b64.size() / 64);
    for (size_t i = 0; i < b64.size(); i += 64) {
        if (i > 0) out += '\n';
        out += b64.substr(i, 64);
    }
    return out;
}

static void emit_b64_key(YAML::Emitter& out, const char* key,
                         const std::vector<uint8_t>& data)
{
    std::string val = b64_for_yaml(data);
    out << YAML::Key << key << YAML::Value;
    if (val.find('\n') != std::string::npos)
        out << YAML::Literal;
    out << val;
}

static std::vector<uint8_t> decode_b64_yaml(const YAML::Node& node, const char* ctx) {
    if (!node)
        throw std::runtime_error(std::string("YAML key set: missing '") + ctx + "'");
    return base64_decode(node.as<std::string>());
}

static size_t require_size(const YAML::Node& key, const char* field, const char* ctx) {
    YAML::Node n = key[field];
    if (!n)
        throw std::runtime_error(std::string("YAML key set: ") + ctx + " missing '" + field + "'");
    return static_cast<size_t>(n.as<uint64_t>());
}

static void require_map(const YAML::Node& node, const char* ctx) {
    if (!node || !node.IsMap())
        throw std::runtime_error(std::string("YAML key set: ") + ctx + " must be a map");
}

// Rejects any field of `node` not named in `allowed`.
static void require_fields(const YAML::Node& node, std::initializer_list<const char*> allowed,
                           const char* ctx) {
    for (const auto& kv : node) {
        std::string key = kv.first.as<std::string>();
        bool known = false;
        for (const char* a : allowed)
            known = known || key == a;
        if (!known)
            throw std::runtime_error(std::string("YAML key set: ") + ctx +
                                     ": unexpected field '" + key + "'");
    }
}

// ── Key emission ──────────────────────────────────────────────────────────────

static void emit_sized(YAML::Emitter& out, size_t ni, size_t no) {
    out << YAML::Key << "inputs"  << YAML::Value << static_cast<uint64_t>(ni);
    out << YAML::Key << "outputs" << YAML::Value << static_cast<uint64_t>(no);
}

static void emit_key(YAML::Emitter& out, const TransferProvingKey& k) {
    out << YAML::BeginMap;
    emit_sized(out, k.n_in, k.n_out);
    emit_b64_key(out, "pk", k.material);
    out << YAML::EndMap;
}

static void emit_key(YAML::Emitter& out, const FreezeProvingKey& k) {
    out << YAML::BeginMap;
    emit_sized(out, k.n_in, k.n_out);
    emit_b64_key(out, "pk", k.material);
    out << YAML::EndMap;
}

static void emit_key(YAML::Emitter& out, const MintProvingKey& k) {
    out << YAML::BeginMap;
    emit_b64_key(out, "pk", k.material);
    out << YAML::EndMap;
}

static void emit_key(YAML::Emitter& out, const TransactionVerifyingKey& k) {
    out << YAML::BeginMap;
    out << YAML::Key << "kind" << YAML::Value << keyset::tx_kind_name(k.kind());
    if (k.kind() != TxKind::Mint)
        emit_sized(out, k.num_inputs(), k.num_outputs());
    emit_b64_key(out, "vk", k.material());
    out << YAML::EndMap;
}

// ── Key parsing ───────────────────────────────────────────────────────────────

static void load_key(const YAML::Node& n, TransferProvingKey& k) {
    require_map(n, "transfer proving key");
    require_fields(n, {"inputs", "outputs", "pk"}, "transfer proving key");
    k.n_in     = require_size(n, "inputs", "transfer proving key");
    k.n_out    = require_size(n, "outputs", "transfer proving key");
    k.material = decode_b64_yaml(n["pk"], "pk");
}

static void load_key(const YAML::Node& n, FreezeProvingKey& k) {
    require_map(n, "freeze proving key");
    require_fields(n, {"inputs", "outputs", "pk"}, "freeze proving key");
    k.n_in     = require_size(n, "inputs", "freeze proving key");
    k.n_out    = require_size(n, "outputs", "freeze proving key");
    k.material = decode_b64_yaml(n["pk"], "pk");
}

static void load_key(const YAML::Node& n, MintProvingKey& k) {
    require_map(n, "mint proving key");
    if (n["inputs"] || n["outputs"])
        throw std::runtime_error("YAML key set: mint proving key has a fixed size");
    require_fields(n, {"pk"}, "mint proving key");
    k.material = decode_b64_yaml(n["pk"], "pk");
}

static void load_key(const YAML::Node& n, TransactionVerifyingKey& k) {
    require_map(n, "verifying key");
    require_fields(n, {"kind", "inputs", "outputs", "vk"}, "verifying key");
    if (!n["kind"])
        throw std::runtime_error("YAML key set: verifying key missing 'kind'");

    switch (keyset::tx_kind_from_name(n["kind"].as<std::string>())) {
        case TxKind::Transfer:
            k = keyset::TransferVerifyingKey{require_size(n, "inputs", "transfer verifying key"),
                                             require_size(n, "outputs", "transfer verifying key"),
                                             decode_b64_yaml(n["vk"], "vk")};
            break;
        case TxKind::Freeze:
            k = keyset::FreezeVerifyingKey{require_size(n, "inputs", "freeze verifying key"),
                                           require_size(n, "outputs", "freeze verifying key"),
                                           decode_b64_yaml(n["vk"], "vk")};
            break;
        case TxKind::Mint:
            if (n["inputs"] || n["outputs"])
                throw std::runtime_error("YAML key set: mint verifying key has a fixed size");
            k = keyset::MintVerifyingKey{decode_b64_yaml(n["vk"], "vk")};
            break;
    }
}

template <class K>
static void check_slot(const K&, TxKind, const char*) {}

static void check_slot(const TransactionVerifyingKey& k, TxKind expected, const char* ctx) {
    keyset::require_kind(k, expected, ctx);
}

// ── Key sets ──────────────────────────────────────────────────────────────────

template <class K, class Order>
static void emit_keyset(YAML::Emitter& out, const KeySet<K, Order>& ks) {
    out << YAML::BeginSeq;
    for (const auto& entry : ks.entries()) {
        out << YAML::BeginSeq;
        out << YAML::Flow << YAML::BeginSeq
            << entry.first.first << entry.first.second
            << YAML::EndSeq;
        emit_key(out, entry.second);
        out << YAML::EndSeq;
    }
    out << YAML::EndSeq;
}

template <class K, class Order>
static KeySet<K, Order> load_keyset(const YAML::Node& seq, TxKind slot, const char* ctx) {
    if (!seq || !seq.IsSequence())
        throw std::runtime_error(std::string("YAML key set: missing '") + ctx + "' sequence");

    std::vector<K> keys;
    for (const auto& entry : seq) {
        if (!entry.IsSequence() || entry.size() != 2)
            throw std::runtime_error(std::string("YAML key set: '") + ctx +
                                     "' entries must be [sort key, key] pairs");
        YAML::Node sk_node = entry[0];
        if (!sk_node.IsSequence() || sk_node.size() != 2)
            throw std::runtime_error(std::string("YAML key set: '") + ctx +
                                     "' sort key must have two elements");
        typename Order::SortKey sk(sk_node[0].as<uint64_t>(), sk_node[1].as<uint64_t>());

        K key;
        load_key(entry[1], key);
        check_slot(key, slot, ctx);
        if (Order::shape(sk) != keyset::shape_of(key))
            throw std::runtime_error(std::string("YAML key set: '") + ctx + "' sort key names " +
                                     keyset::to_string(Order::shape(sk)) + " but the key is " +
                                     keyset::to_string(keyset::shape_of(key)));
        keys.push_back(std::move(key));
    }
    return KeySet<K, Order>(std::move(keys));
}

// ── Bundles ───────────────────────────────────────────────────────────────────

template <class Bundle>
static std::string emit_bundle(const Bundle& b, const char* kind) {
    using Order = typename decltype(Bundle::xfr)::order_type;

    YAML::Emitter out;

    out << YAML::BeginDoc;
    out << YAML::BeginMap;

    out << YAML::Key << "version" << YAML::Value << keyset::kBundleVersion;
    out << YAML::Key << "type"    << YAML::Value << (std::string(kind) + kTypeSuffix);
    out << YAML::Key << "order"   << YAML::Value << Order::name();

    out << YAML::Key << "mint" << YAML::Value;
    emit_key(out, b.mint);

    out << YAML::Key << "xfr" << YAML::Value;
    emit_keyset(out, b.xfr);

    out << YAML::Key << "freeze" << YAML::Value;
    emit_keyset(out, b.freeze);

    out << YAML::EndMap;
    out << YAML::EndDoc;

    if (!out.good())
        throw std::runtime_error("YAML emit failed: " + out.GetLastError());
    return std::string(out.c_str()) + "\n";
}

static BundleHeader read_header(const YAML::Node& doc) {
    require_map(doc, "document");

    BundleHeader hdr;
    uint64_t version = doc["version"].as<uint64_t>(0);
    if (version != static_cast<uint64_t>(keyset::kBundleVersion))
        throw std::runtime_error("unsupported key set version " + std::to_string(version));
    hdr.version = keyset::kBundleVersion;

    std::string type = doc["type"].as<std::string>("");
    const size_t suffix_len = sizeof(kTypeSuffix) - 1;
    if (type.size() <= suffix_len ||
        type.compare(type.size() - suffix_len, suffix_len, kTypeSuffix) != 0)
        throw std::runtime_error("YAML key set: 'type' must be prover-keyset or "
                                 "verifier-keyset (got '" + type + "')");
    hdr.kind  = type.substr(0, type.size() - suffix_len);
    hdr.order = doc["order"].as<std::string>("");
    return hdr;
}

template <class Bundle>
static Bundle load_bundle(const std::string& text, const char* kind) {
    using XfrSet = decltype(Bundle::xfr);
    using FrzSet = decltype(Bundle::freeze);
    using Order  = typename XfrSet::order_type;

    YAML::Node doc = YAML::Load(text);
    keyset::check_header(read_header(doc), kind, Order::name());
    require_fields(doc, {"version", "type", "order", "mint", "xfr", "freeze"}, "document");

    Bundle b;
    load_key(doc["mint"], b.mint);
    check_slot(b.mint, TxKind::Mint, "mint");
    b.xfr    = load_keyset<typename XfrSet::key_type, Order>(doc["xfr"], TxKind::Transfer, "xfr");
    b.freeze = load_keyset<typename FrzSet::key_type, Order>(doc["freeze"], TxKind::Freeze, "freeze");
    return b;
}

// ── Entry points ──────────────────────────────────────────────────────────────

template <class Order>
std::string emit_prover_yaml(const ProverKeySet<Order>& ks) {
    return emit_bundle(ks, keyset::kProverBundle);
}

template <class Order>
std::string emit_verifier_yaml(const VerifierKeySet<Order>& ks) {
    return emit_bundle(ks, keyset::kVerifierBundle);
}

template <class Order>
ProverKeySet<Order> load_prover_yaml(const std::string& text) {
    return load_bundle<ProverKeySet<Order>>(text, keyset::kProverBundle);
}

template <class Order>
VerifierKeySet<Order> load_verifier_yaml(const std::string& text) {
    return load_bundle<VerifierKeySet<Order>>(text, keyset::kVerifierBundle);
}

BundleHeader peek_header(const std::string& text) {
    return read_header(YAML::Load(text));
}

template std::string emit_prover_yaml(const ProverKeySet<OrderByInputs>&);
template std::string emit_prover_yaml(const ProverKeySet<OrderByOutputs>&);
template std::string emit_verifier_yaml(const VerifierKeySet<OrderByInputs>&);
template std::string emit_verifier_yaml(const VerifierKeySet<OrderByOutputs>&);

template ProverKeySet<OrderByInputs>    load_prover_yaml(const std::string&);
template ProverKeySet<OrderByOutputs>   load_prover_yaml(const std::string&);
template VerifierKeySet<OrderByInputs>  load_verifier_yaml(const std::string&);
template VerifierKeySet<OrderByOutputs> load_verifier_yaml(const std::string&);

} // namespace keyset_yaml
