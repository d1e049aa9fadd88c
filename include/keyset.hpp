#pragma once
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace keyset {

// ── Shapes ────────────────────────────────────────────────────────────────────

// Transaction size a circuit key was generated for.
struct Shape {
    size_t num_inputs  = 0;
    size_t num_outputs = 0;
};

inline bool operator==(const Shape& a, const Shape& b) {
    return a.num_inputs == b.num_inputs && a.num_outputs == b.num_outputs;
}

inline bool operator!=(const Shape& a, const Shape& b) { return !(a == b); }

// True if a key of shape `have` can serve a transaction of shape `want`.
inline bool dominates(const Shape& have, const Shape& want) {
    return have.num_inputs >= want.num_inputs && have.num_outputs >= want.num_outputs;
}

inline std::string to_string(const Shape& s) {
    return "(" + std::to_string(s.num_inputs) + ", " + std::to_string(s.num_outputs) + ")";
}

// ── Errors ────────────────────────────────────────────────────────────────────

enum class ErrorKind { DuplicateKeys, NoKeys };

class KeySetError : public std::runtime_error {
public:
    static KeySetError duplicate_keys(size_t num_inputs, size_t num_outputs) {
        return KeySetError(ErrorKind::DuplicateKeys, {num_inputs, num_outputs},
                           "duplicate keys for size " +
                           to_string(Shape{num_inputs, num_outputs}));
    }

    static KeySetError no_keys() {
        return KeySetError(ErrorKind::NoKeys, {}, "key set must contain at least one key");
    }

    ErrorKind kind() const   { return kind_; }
    // Offending size; only meaningful for DuplicateKeys.
    Shape     shape() const  { return shape_; }

private:
    KeySetError(ErrorKind kind, Shape shape, const std::string& msg)
        : std::runtime_error(msg), kind_(kind), shape_(shape) {}

    ErrorKind kind_;
    Shape     shape_;
};

// ── Orderings ─────────────────────────────────────────────────────────────────
// An ordering maps a shape to the key a KeySet is sorted by. Both orderings
// are permutations of the pair, so equal sort keys imply equal shapes.

struct OrderByInputs {
    using SortKey = std::pair<uint64_t, uint64_t>;

    static SortKey sort_key(size_t num_inputs, size_t num_outputs) {
        return {num_inputs, num_outputs};
    }
    static Shape shape(const SortKey& k) {
        return {static_cast<size_t>(k.first), static_cast<size_t>(k.second)};
    }
    static const char* name() { return "inputs"; }
};

struct OrderByOutputs {
    using SortKey = std::pair<uint64_t, uint64_t>;

    static SortKey sort_key(size_t num_inputs, size_t num_outputs) {
        return {num_outputs, num_inputs};
    }
    static Shape shape(const SortKey& k) {
        return {static_cast<size_t>(k.second), static_cast<size_t>(k.first)};
    }
    static const char* name() { return "outputs"; }
};

template <class K>
Shape shape_of(const K& key) {
    return {key.num_inputs(), key.num_outputs()};
}

// ── Best-fit outcome ──────────────────────────────────────────────────────────

// Either the matched key and its size, or the largest size the set supports.
template <class K>
class BestFit {
public:
    static BestFit match(const Shape& shape, const K& key) {
        return BestFit(shape, &key);
    }
    static BestFit no_match(const Shape& max_size) {
        return BestFit(max_size, nullptr);
    }

    bool found() const { return key_ != nullptr; }
    explicit operator bool() const { return found(); }

    // Size of the matched key.
    Shape shape() const {
        if (!found())
            throw std::logic_error("BestFit::shape: no key matched");
        return shape_;
    }

    const K& key() const {
        if (!found())
            throw std::logic_error("BestFit::key: no key matched");
        return *key_;
    }

    // Largest supported size, reported when nothing fits.
    Shape max_size() const {
        if (found())
            throw std::logic_error("BestFit::max_size: a key matched");
        return shape_;
    }

private:
    BestFit(const Shape& shape, const K* key) : shape_(shape), key_(key) {}

    Shape    shape_;
    const K* key_;
};

// ── KeySet ────────────────────────────────────────────────────────────────────

// Collection of keys of type K with pairwise distinct sizes, sorted by Order.
// K must provide num_inputs() and num_outputs(). Immutable once built, so a
// KeySet can be shared between threads without locking.
template <class K, class Order = OrderByInputs>
class KeySet {
public:
    using key_type   = K;
    using order_type = Order;
    using SortKey    = typename Order::SortKey;
    using Map        = std::map<SortKey, K>;

    class const_iterator {
    public:
        using iterator_category = std::bidirectional_iterator_tag;
        using value_type        = K;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const K*;
        using reference         = const K&;

        const_iterator() = default;
        explicit const_iterator(typename Map::const_iterator it) : it_(it) {}

        reference operator*() const  { return it_->second; }
        pointer   operator->() const { return &it_->second; }

        const_iterator& operator++()    { ++it_; return *this; }
        const_iterator  operator++(int) { const_iterator t = *this; ++it_; return t; }
        const_iterator& operator--()    { --it_; return *this; }
        const_iterator  operator--(int) { const_iterator t = *this; --it_; return t; }

        bool operator==(const const_iterator& o) const { return it_ == o.it_; }
        bool operator!=(const const_iterator& o) const { return it_ != o.it_; }

    private:
        typename Map::const_iterator it_;
    };

    // Empty set. Only useful as a target for assignment; every query other
    // than size() and iteration requires a constructed set.
    KeySet() = default;

    // Takes ownership of `keys`. Throws KeySetError if two keys share a size
    // or if `keys` is empty.
    explicit KeySet(std::vector<K> keys) {
        for (auto& key : keys) {
            size_t ni = key.num_inputs();
            size_t no = key.num_outputs();
            auto inserted = keys_.emplace(Order::sort_key(ni, no), std::move(key));
            if (!inserted.second)
                throw KeySetError::duplicate_keys(ni, no);
        }
        if (keys_.empty())
            throw KeySetError::no_keys();
    }

    // Size of the last key in sort order.
    Shape max_size() const {
        if (keys_.empty())
            throw std::logic_error("KeySet::max_size: key set is empty (corrupt key set)");
        return shape_of(keys_.rbegin()->second);
    }

    const K* exact_fit_key(size_t num_inputs, size_t num_outputs) const {
        auto it = keys_.find(Order::sort_key(num_inputs, num_outputs));
        return it == keys_.end() ? nullptr : &it->second;
    }

    const K* key_for_size(size_t num_inputs, size_t num_outputs) const {
        return exact_fit_key(num_inputs, num_outputs);
    }

    // Smallest key, in sort order, at least as large as the request in both
    // dimensions. On a miss the result carries max_size().
    BestFit<K> best_fit_key(size_t num_inputs, size_t num_outputs) const {
        const Shape want{num_inputs, num_outputs};

        // Everything from lower_bound on is at least as large as the request
        // on the primary axis only. With OrderByInputs, (3, 1) sorts after
        // (2, 2) but has fewer outputs, so each candidate is checked on both
        // axes and the first one that passes is the answer.
        for (auto it = keys_.lower_bound(Order::sort_key(num_inputs, num_outputs));
             it != keys_.end(); ++it) {
            Shape have = shape_of(it->second);
            if (dominates(have, want))
                return BestFit<K>::match(have, it->second);
        }
        return BestFit<K>::no_match(max_size());
    }

    size_t size() const  { return keys_.size(); }
    bool   empty() const { return keys_.empty(); }

    const_iterator begin() const { return const_iterator(keys_.begin()); }
    const_iterator end() const   { return const_iterator(keys_.end()); }

    // (sort key, key) pairs in sort order, for serializers.
    const Map& entries() const { return keys_; }

    bool operator==(const KeySet& o) const { return keys_ == o.keys_; }
    bool operator!=(const KeySet& o) const { return !(*this == o); }

private:
    Map keys_;
};

} // namespace keyset
