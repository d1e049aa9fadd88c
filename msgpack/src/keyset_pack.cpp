#include "keyset_pack.hpp"
#include <msgpack.hpp>
#include <stdexcept>
#include <string>

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

namespace keyset_mp {

using Packer = msgpack::packer<msgpack::sbuffer>;

// ── helpers ───────────────────────────────────────────────────────────────────

static std::string require_str(const msgpack::object& obj, const char* ctx) {
    if (obj.type != msgpack::type::STR)
        throw std::runtime_error(std::string(ctx) + ": expected string");
    return {obj.via.str.ptr, obj.via.str.size};
}

static std::vector<uint8_t> require_bin(const msgpack::object& obj, const char* ctx) {
    if (obj.type != msgpack::type::BIN)
        throw std::runtime_error(std::string(ctx) + ": expected binary");
    return {reinterpret_cast<const uint8_t*>(obj.via.bin.ptr),
            reinterpret_cast<const uint8_t*>(obj.via.bin.ptr) + obj.via.bin.size};
}

static uint64_t require_u64(const msgpack::object& obj, const char* ctx) {
    if (obj.type != msgpack::type::POSITIVE_INTEGER)
        throw std::runtime_error(std::string(ctx) + ": expected unsigned int");
    return obj.via.u64;
}

static void require_array(const msgpack::object& obj, uint32_t size, const char* ctx) {
    if (obj.type != msgpack::type::ARRAY)
        throw std::runtime_error(std::string(ctx) + ": expected array");
    if (size != 0 && obj.via.array.size != size)
        throw std::runtime_error(std::string(ctx) + ": expected " + std::to_string(size) +
                                 " elements, got " + std::to_string(obj.via.array.size));
}

static void require_map(const msgpack::object& obj, const char* ctx) {
    if (obj.type != msgpack::type::MAP)
        throw std::runtime_error(std::string(ctx) + ": expected map");
}

static void pack_str(Packer& pk, const char* s) {
    pk.pack(std::string(s));
}

static void pack_bytes(Packer& pk, const std::vector<uint8_t>& b) {
    pk.pack_bin(static_cast<uint32_t>(b.size()));
    pk.pack_bin_body(reinterpret_cast<const char*>(b.data()), b.size());
}

static std::vector<uint8_t> to_bytes(const msgpack::sbuffer& buf) {
    return {reinterpret_cast<const uint8_t*>(buf.data()),
            reinterpret_cast<const uint8_t*>(buf.data()) + buf.size()};
}

// Exactly one msgpack object; trailing bytes are rejected.
static msgpack::object_handle parse(const std::vector<uint8_t>& data) {
    if (data.empty())
        throw std::runtime_error("unpack: no data");
    std::size_t off = 0;
    msgpack::object_handle oh =
        msgpack::unpack(reinterpret_cast<const char*>(data.data()), data.size(), off);
    if (off != data.size())
        throw std::runtime_error("unpack: " + std::to_string(data.size() - off) +
                                 " trailing bytes after key set");
    return oh;
}

// ── key codecs ────────────────────────────────────────────────────────────────
// Sized keys: { "ni", "no", "pk" } for proving keys; verifying keys carry a
// leading "t" (transaction kind) and use "vk". Mint keys have no size fields.

static void pack_sized(Packer& pk, size_t ni, size_t no,
                       const char* field, const std::vector<uint8_t>& material) {
    pack_str(pk, "ni");
    pk.pack_uint64(ni);
    pack_str(pk, "no");
    pk.pack_uint64(no);
    pack_str(pk, field);
    pack_bytes(pk, material);
}

static void pack_key(Packer& pk, const TransferProvingKey& k) {
    pk.pack_map(3);
    pack_sized(pk, k.n_in, k.n_out, "pk", k.material);
}

static void pack_key(Packer& pk, const FreezeProvingKey& k) {
    pk.pack_map(3);
    pack_sized(pk, k.n_in, k.n_out, "pk", k.material);
}

static void pack_key(Packer& pk, const MintProvingKey& k) {
    pk.pack_map(1);
    pack_str(pk, "pk");
    pack_bytes(pk, k.material);
}

static void pack_key(Packer& pk, const TransactionVerifyingKey& k) {
    if (k.kind() == TxKind::Mint) {
        pk.pack_map(2);
        pack_str(pk, "t");
        pack_str(pk, keyset::tx_kind_name(k.kind()));
        pack_str(pk, "vk");
        pack_bytes(pk, k.material());
        return;
    }
    pk.pack_map(4);
    pack_str(pk, "t");
    pack_str(pk, keyset::tx_kind_name(k.kind()));
    pack_sized(pk, k.num_inputs(), k.num_outputs(), "vk", k.material());
}

struct KeyFields {
    std::string          tag;
    uint64_t             ni = 0, no = 0;
    std::vector<uint8_t> material;
    bool got_t = false, got_ni = false, got_no = false, got_material = false;
};

static KeyFields read_key_fields(const msgpack::object& obj, const char* material_field,
                                 const char* ctx) {
    require_map(obj, ctx);
    KeyFields f;
    const auto& map = obj.via.map;
    for (uint32_t i = 0; i < map.size; ++i) {
        const auto& kv = map.ptr[i];
        std::string key = require_str(kv.key, "key field");
        if ((key == "t" && f.got_t) || (key == "ni" && f.got_ni) || (key == "no" && f.got_no) ||
            (key == material_field && f.got_material))
            throw std::runtime_error(std::string(ctx) + ": repeated field '" + key + "'");
        if (key == "t") {
            f.tag = require_str(kv.val, "'t'");
            f.got_t = true;
        } else if (key == "ni") {
            f.ni = require_u64(kv.val, "'ni'");
            f.got_ni = true;
        } else if (key == "no") {
            f.no = require_u64(kv.val, "'no'");
            f.got_no = true;
        } else if (key == material_field) {
            f.material = require_bin(kv.val, material_field);
            f.got_material = true;
        } else {
            throw std::runtime_error(std::string(ctx) + ": unexpected field '" + key + "'");
        }
    }
    if (!f.got_material)
        throw std::runtime_error(std::string(ctx) + ": missing '" + material_field + "'");
    return f;
}

static void require_size_fields(const KeyFields& f, const char* ctx) {
    if (!f.got_ni || !f.got_no)
        throw std::runtime_error(std::string(ctx) + ": missing 'ni' or 'no'");
}

static void unpack_key(const msgpack::object& obj, TransferProvingKey& k) {
    KeyFields f = read_key_fields(obj, "pk", "transfer proving key");
    require_size_fields(f, "transfer proving key");
    k.n_in     = static_cast<size_t>(f.ni);
    k.n_out    = static_cast<size_t>(f.no);
    k.material = std::move(f.material);
}

static void unpack_key(const msgpack::object& obj, FreezeProvingKey& k) {
    KeyFields f = read_key_fields(obj, "pk", "freeze proving key");
    require_size_fields(f, "freeze proving key");
    k.n_in     = static_cast<size_t>(f.ni);
    k.n_out    = static_cast<size_t>(f.no);
    k.material = std::move(f.material);
}

static void unpack_key(const msgpack::object& obj, MintProvingKey& k) {
    KeyFields f = read_key_fields(obj, "pk", "mint proving key");
    if (f.got_ni || f.got_no)
        throw std::runtime_error("mint proving key: unexpected size fields");
    k.material = std::move(f.material);
}

static void unpack_key(const msgpack::object& obj, TransactionVerifyingKey& k) {
    KeyFields f = read_key_fields(obj, "vk", "verifying key");
    if (!f.got_t)
        throw std::runtime_error("verifying key: missing 't'");

    switch (keyset::tx_kind_from_name(f.tag)) {
        case TxKind::Transfer:
            require_size_fields(f, "transfer verifying key");
            k = keyset::TransferVerifyingKey{static_cast<size_t>(f.ni),
                                             static_cast<size_t>(f.no),
                                             std::move(f.material)};
            break;
        case TxKind::Freeze:
            require_size_fields(f, "freeze verifying key");
            k = keyset::FreezeVerifyingKey{static_cast<size_t>(f.ni),
                                           static_cast<size_t>(f.no),
                                           std::move(f.material)};
            break;
        case TxKind::Mint:
            if (f.got_ni || f.got_no)
                throw std::runtime_error("mint verifying key: unexpected size fields");
            k = keyset::MintVerifyingKey{std::move(f.material)};
            break;
    }
}

// Proving keys are typed by slot; verifying keys must be checked.
template <class K>
static void check_slot(const K&, TxKind, const char*) {}

static void check_slot(const TransactionVerifyingKey& k, TxKind expected, const char* ctx) {
    keyset::require_kind(k, expected, ctx);
}

// ── key sets ──────────────────────────────────────────────────────────────────
// Packed as an array of [ [sort key], key ] pairs in ascending sort-key order.

template <class K, class Order>
static void pack_keyset(Packer& pk, const KeySet<K, Order>& ks) {
    pk.pack_array(static_cast<uint32_t>(ks.size()));
    for (const auto& entry : ks.entries()) {
        pk.pack_array(2);
        pk.pack_array(2);
        pk.pack_uint64(entry.first.first);
        pk.pack_uint64(entry.first.second);
        pack_key(pk, entry.second);
    }
}

// Keys are re-inserted through the KeySet constructor, so duplicate or
// missing keys fail exactly as they would when building the set directly.
template <class K, class Order>
static KeySet<K, Order> unpack_keyset_obj(const msgpack::object& obj, const char* ctx) {
    require_array(obj, 0, ctx);
    const auto& arr = obj.via.array;

    std::vector<K> keys;
    keys.reserve(arr.size);
    for (uint32_t i = 0; i < arr.size; ++i) {
        const msgpack::object& entry = arr.ptr[i];
        require_array(entry, 2, "key set entry");
        const msgpack::object& sk_obj = entry.via.array.ptr[0];
        require_array(sk_obj, 2, "sort key");
        typename Order::SortKey sk(require_u64(sk_obj.via.array.ptr[0], "sort key"),
                                   require_u64(sk_obj.via.array.ptr[1], "sort key"));

        K key;
        unpack_key(entry.via.array.ptr[1], key);
        if (Order::shape(sk) != keyset::shape_of(key))
            throw std::runtime_error(std::string(ctx) + ": sort key names " +
                                     keyset::to_string(Order::shape(sk)) + " but the key is " +
                                     keyset::to_string(keyset::shape_of(key)));
        keys.push_back(std::move(key));
    }
    return KeySet<K, Order>(std::move(keys));
}

// ── bundles ───────────────────────────────────────────────────────────────────
// { "v": version, "k": kind, "o": order, "mint": key, "xfr": set, "frz": set }

static void pack_header(Packer& pk, const char* kind, const char* order) {
    pack_str(pk, "v");
    pk.pack_uint64(static_cast<uint64_t>(keyset::kBundleVersion));
    pack_str(pk, "k");
    pack_str(pk, kind);
    pack_str(pk, "o");
    pack_str(pk, order);
}

// Bundle fields, one bit each, for presence and repeat checks.
enum : unsigned {
    kFieldV = 1, kFieldK = 2, kFieldO = 4, kHeaderFields = 7,
    kFieldMint = 8, kFieldXfr = 16, kFieldFrz = 32, kAllFields = 63
};

static void mark_seen(unsigned& seen, unsigned bit, const std::string& key) {
    if (seen & bit)
        throw std::runtime_error("unpack: repeated field '" + key + "'");
    seen |= bit;
}

// Returns true if `key` was a header field.
static bool read_header_field(const std::string& key, const msgpack::object& val,
                              BundleHeader& hdr, unsigned& seen) {
    if (key == "v") {
        mark_seen(seen, kFieldV, key);
        uint64_t v = require_u64(val, "'v'");
        if (v != static_cast<uint64_t>(keyset::kBundleVersion))
            throw std::runtime_error("unsupported key set version " + std::to_string(v));
        hdr.version = keyset::kBundleVersion;
    } else if (key == "k") {
        mark_seen(seen, kFieldK, key);
        hdr.kind = require_str(val, "'k'");
    } else if (key == "o") {
        mark_seen(seen, kFieldO, key);
        hdr.order = require_str(val, "'o'");
    } else {
        return false;
    }
    return true;
}

template <class Bundle>
static std::vector<uint8_t> pack_bundle(const Bundle& b, const char* kind) {
    using Order = typename decltype(Bundle::xfr)::order_type;

    msgpack::sbuffer buf;
    Packer pk(buf);

    pk.pack_map(6);
    pack_header(pk, kind, Order::name());

    pack_str(pk, "mint");
    pack_key(pk, b.mint);

    pack_str(pk, "xfr");
    pack_keyset(pk, b.xfr);

    pack_str(pk, "frz");
    pack_keyset(pk, b.freeze);

    return to_bytes(buf);
}

template <class Bundle>
static Bundle unpack_bundle(const std::vector<uint8_t>& data, const char* kind) {
    using XfrSet = decltype(Bundle::xfr);
    using FrzSet = decltype(Bundle::freeze);
    using Order  = typename XfrSet::order_type;

    msgpack::object_handle oh = parse(data);
    const msgpack::object& obj = oh.get();
    require_map(obj, "unpack: top-level object");

    Bundle b;
    BundleHeader hdr;
    unsigned seen = 0;

    const auto& map = obj.via.map;
    for (uint32_t i = 0; i < map.size; ++i) {
        const auto& kv = map.ptr[i];
        std::string key = require_str(kv.key, "map key");
        const msgpack::object& val = kv.val;

        if (read_header_field(key, val, hdr, seen)) {
            continue;
        } else if (key == "mint") {
            mark_seen(seen, kFieldMint, key);
            unpack_key(val, b.mint);
            check_slot(b.mint, TxKind::Mint, "'mint'");
        } else if (key == "xfr") {
            mark_seen(seen, kFieldXfr, key);
            b.xfr = unpack_keyset_obj<typename XfrSet::key_type, Order>(val, "'xfr'");
            for (const auto& k : b.xfr)
                check_slot(k, TxKind::Transfer, "'xfr'");
        } else if (key == "frz") {
            mark_seen(seen, kFieldFrz, key);
            b.freeze = unpack_keyset_obj<typename FrzSet::key_type, Order>(val, "'frz'");
            for (const auto& k : b.freeze)
                check_slot(k, TxKind::Freeze, "'frz'");
        } else {
            throw std::runtime_error("unpack: unexpected field '" + key + "'");
        }
    }

    if (seen != kAllFields)
        throw std::runtime_error("unpack: missing required fields in msgpack key set");
    keyset::check_header(hdr, kind, Order::name());

    return b;
}

// ── public entry points ───────────────────────────────────────────────────────

template <class K, class Order>
std::vector<uint8_t> pack(const KeySet<K, Order>& ks) {
    msgpack::sbuffer buf;
    Packer pk(buf);
    pack_keyset(pk, ks);
    return to_bytes(buf);
}

template <class K, class Order>
KeySet<K, Order> unpack_keyset(const std::vector<uint8_t>& data) {
    msgpack::object_handle oh = parse(data);
    return unpack_keyset_obj<K, Order>(oh.get(), "key set");
}

template <class Order>
std::vector<uint8_t> pack(const ProverKeySet<Order>& ks) {
    return pack_bundle(ks, keyset::kProverBundle);
}

template <class Order>
std::vector<uint8_t> pack(const VerifierKeySet<Order>& ks) {
    return pack_bundle(ks, keyset::kVerifierBundle);
}

template <class Order>
ProverKeySet<Order> unpack_prover(const std::vector<uint8_t>& data) {
    return unpack_bundle<ProverKeySet<Order>>(data, keyset::kProverBundle);
}

template <class Order>
VerifierKeySet<Order> unpack_verifier(const std::vector<uint8_t>& data) {
    return unpack_bundle<VerifierKeySet<Order>>(data, keyset::kVerifierBundle);
}

BundleHeader peek_header(const std::vector<uint8_t>& data) {
    msgpack::object_handle oh = parse(data);
    const msgpack::object& obj = oh.get();
    require_map(obj, "unpack: top-level object");

    BundleHeader hdr;
    unsigned seen = 0;
    const auto& map = obj.via.map;
    for (uint32_t i = 0; i < map.size; ++i)
        read_header_field(require_str(map.ptr[i].key, "map key"), map.ptr[i].val, hdr, seen);

    if ((seen & kHeaderFields) != kHeaderFields)
        throw std::runtime_error("unpack: missing 'v', 'k' or 'o' in msgpack key set");
    return hdr;
}

// ── instantiations ────────────────────────────────────────────────────────────

template std::vector<uint8_t> pack(const KeySet<TransferProvingKey, OrderByInputs>&);
template std::vector<uint8_t> pack(const KeySet<TransferProvingKey, OrderByOutputs>&);
template std::vector<uint8_t> pack(const KeySet<FreezeProvingKey, OrderByInputs>&);
template std::vector<uint8_t> pack(const KeySet<FreezeProvingKey, OrderByOutputs>&);
template std::vector<uint8_t> pack(const KeySet<TransactionVerifyingKey, OrderByInputs>&);
template std::vector<uint8_t> pack(const KeySet<TransactionVerifyingKey, OrderByOutputs>&);

template KeySet<TransferProvingKey, OrderByInputs>
    unpack_keyset(const std::vector<uint8_t>&);
template KeySet<TransferProvingKey, OrderByOutputs>
    unpack_keyset(const std::vector<uint8_t>&);
template KeySet<FreezeProvingKey, OrderByInputs>
    unpack_keyset(const std::vector<uint8_t>&);
template KeySet<FreezeProvingKey, OrderByOutputs>
    unpack_keyset(const std::vector<uint8_t>&);
template KeySet<TransactionVerifyingKey, OrderByInputs>
    unpack_keyset(const std::vector<uint8_t>&);
template KeySet<TransactionVerifyingKey, OrderByOutputs>
    unpack_keyset(const std::vector<uint8_t>&);

template std::vector<uint8_t> pack(const ProverKeySet<OrderByInputs>&);
template std::vector<uint8_t> pack(const ProverKeySet<OrderByOutputs>&);
template std::vector<uint8_t> pack(const VerifierKeySet<OrderByInputs>&);
template std::vector<uint8_t> pack(const VerifierKeySet<OrderByOutputs>&);

template ProverKeySet<OrderByInputs>    unpack_prover(const std::vector<uint8_t>&);
template ProverKeySet<OrderByOutputs>   unpack_prover(const std::vector<uint8_t>&);
template VerifierKeySet<OrderByInputs>  unpack_verifier(const std::vector<uint8_t>&);
template VerifierKeySet<OrderByOutputs> unpack_verifier(const std::vector<uint8_t>&);

} // namespace keyset_mp
