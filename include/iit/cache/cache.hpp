#pragma once

#include "iit/core/types.hpp"
#include "iit/core/config.hpp"
#include "iit/core/errors.hpp"
#include "iit/core/log.hpp"
#include "iit/data/repertoire.hpp"
#include <atomic>
#include <cmath>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace iit {

/**
 * Key of a memoized value: which subsystem (identity hash, including the
 * network, node set, state and cut), what kind of value, direction,
 * mechanism and purview. `settings` is the digest of the configuration
 * the value depends on; repertoires depend on none and leave it 0.
 */
struct CacheKey {
    enum class Kind : uint8_t { REPERTOIRE = 0, MICE = 1 };

    uint64_t subsystem = 0;
    Kind kind = Kind::REPERTOIRE;
    Direction direction = Direction::CAUSE;
    NodeSet mechanism = 0;
    NodeSet purview = 0;
    uint64_t settings = 0;

    bool operator==(const CacheKey& other) const {
        return subsystem == other.subsystem && kind == other.kind &&
               direction == other.direction && mechanism == other.mechanism &&
               purview == other.purview && settings == other.settings;
    }

    uint64_t digest() const {
        uint64_t h = hash::combine(hash::FNV_OFFSET, subsystem);
        h = hash::combine(h, static_cast<uint64_t>(kind) << 8 | static_cast<uint64_t>(direction));
        h = hash::combine(h, mechanism);
        h = hash::combine(h, purview);
        return hash::combine(h, settings);
    }

    std::string to_string() const {
        return std::string(kind == Kind::MICE ? "mice" : "repertoire") + ":" +
               iit::to_string(direction) + ":" + bits::to_string(mechanism) + ":" +
               bits::to_string(purview);
    }
};

struct CacheKeyHash {
    size_t operator()(const CacheKey& key) const { return static_cast<size_t>(key.digest()); }
};

/**
 * Serialized cache value: integer words plus real values, sealed with a
 * checksum so a store can hand back bytes it does not understand.
 */
struct CacheRecord {
    std::vector<uint64_t> words;
    std::vector<Real> values;
    uint64_t checksum = 0;

    uint64_t compute_checksum() const {
        uint64_t h = hash::fnv1a(words.data(), words.size() * sizeof(uint64_t));
        h = hash::fnv1a(values.data(), values.size() * sizeof(Real), h);
        return hash::combine(h, words.size() << 32 | values.size());
    }

    void seal() { checksum = compute_checksum(); }

    bool intact() const { return checksum == compute_checksum(); }
};

/**
 * Pluggable key-value store behind the cache context.
 *
 * Implementations must be safe for concurrent use and must never expose a
 * partially written record. put() keeps the first record stored for a key.
 */
class CacheStore {
public:
    virtual ~CacheStore() = default;

    virtual std::optional<CacheRecord> get(const CacheKey& key) const = 0;

    // Returns false if the key was already present
    virtual bool put(const CacheKey& key, CacheRecord record) = 0;

    virtual void erase(const CacheKey& key) = 0;
    virtual size_t size() const = 0;
    virtual void clear() = 0;
};

/**
 * In-process store: hash map under a reader/writer lock.
 */
class InMemoryCacheStore : public CacheStore {
public:
    std::optional<CacheRecord> get(const CacheKey& key) const override {
        std::shared_lock lock(mutex_);
        auto it = records_.find(key);
        if (it == records_.end()) return std::nullopt;
        return it->second;
    }

    bool put(const CacheKey& key, CacheRecord record) override {
        std::unique_lock lock(mutex_);
        return records_.emplace(key, std::move(record)).second;
    }

    void erase(const CacheKey& key) override {
        std::unique_lock lock(mutex_);
        records_.erase(key);
    }

    size_t size() const override {
        std::shared_lock lock(mutex_);
        return records_.size();
    }

    void clear() override {
        std::unique_lock lock(mutex_);
        records_.clear();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<CacheKey, CacheRecord, CacheKeyHash> records_;
};

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t stores = 0;
    uint64_t corrupted = 0;
};

/**
 * Memoization context passed explicitly into every computation.
 *
 * Wraps a store with typed encode/decode. A record that fails to decode is
 * logged, evicted, counted and reported as a miss, so the caller simply
 * recomputes it.
 */
class CacheContext {
public:
    explicit CacheContext(std::shared_ptr<CacheStore> store) : store_(std::move(store)) {
        if (!store_) {
            throw std::invalid_argument("CacheContext requires a store");
        }
    }

    CacheStore& store() { return *store_; }

    /**
     * Look up and decode a value. decode(record) returns the value or throws
     * CacheCorruptionError.
     */
    template<typename T, typename Decode>
    std::optional<T> lookup(const CacheKey& key, Decode&& decode) {
        std::optional<CacheRecord> record = store_->get(key);
        if (!record) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }
        try {
            if (!record->intact()) {
                throw CacheCorruptionError("checksum mismatch");
            }
            T value = decode(*record);
            hits_.fetch_add(1, std::memory_order_relaxed);
            return value;
        } catch (const CacheCorruptionError& e) {
            corrupted_.fetch_add(1, std::memory_order_relaxed);
            misses_.fetch_add(1, std::memory_order_relaxed);
            log::message(LogLevel::WARN, "Cache", [&](std::ostream& os) {
                os << "dropping " << key.to_string() << ": " << e.what();
            });
            store_->erase(key);
            return std::nullopt;
        }
    }

    void store(const CacheKey& key, CacheRecord record) {
        record.seal();
        if (store_->put(key, std::move(record))) {
            stores_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    std::optional<Repertoire> get_repertoire(const CacheKey& key) {
        return lookup<Repertoire>(key, decode_repertoire);
    }

    void put_repertoire(const CacheKey& key, const Repertoire& rep) {
        store(key, encode_repertoire(rep));
    }

    CacheStats stats() const {
        CacheStats s;
        s.hits = hits_.load(std::memory_order_relaxed);
        s.misses = misses_.load(std::memory_order_relaxed);
        s.stores = stores_.load(std::memory_order_relaxed);
        s.corrupted = corrupted_.load(std::memory_order_relaxed);
        return s;
    }

    static constexpr uint64_t REPERTOIRE_TAG = 0x52455052;  // "REPR"

    static CacheRecord encode_repertoire(const Repertoire& rep) {
        CacheRecord record;
        record.words = {REPERTOIRE_TAG, rep.purview()};
        record.values = rep.vec();
        return record;
    }

    static Repertoire decode_repertoire(const CacheRecord& record) {
        if (record.words.size() != 2 || record.words[0] != REPERTOIRE_TAG) {
            throw CacheCorruptionError("not a repertoire record");
        }
        NodeSet purview = record.words[1];
        if (bits::popcount(purview) > MAX_NODES ||
            record.values.size() != state::num_states(bits::popcount(purview))) {
            throw CacheCorruptionError("repertoire size does not match purview");
        }
        for (Real p : record.values) {
            if (!std::isfinite(p) || p < 0) {
                throw CacheCorruptionError("repertoire entry is not a probability");
            }
        }
        return Repertoire(purview, record.values);
    }

private:
    std::shared_ptr<CacheStore> store_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> stores_{0};
    std::atomic<uint64_t> corrupted_{0};
};

/**
 * Build the cache context for the configured backend.
 *
 * NONE yields no context. EXTERNAL wraps the caller's store, which must
 * be provided.
 */
inline std::shared_ptr<CacheContext> make_cache_context(
        const Config& config, std::shared_ptr<CacheStore> external = nullptr) {
    switch (config.cache_backend) {
        case CacheBackend::NONE:
            return nullptr;
        case CacheBackend::IN_MEMORY:
            return std::make_shared<CacheContext>(std::make_shared<InMemoryCacheStore>());
        case CacheBackend::EXTERNAL:
            if (!external) {
                throw std::invalid_argument("EXTERNAL cache backend requires a CacheStore");
            }
            return std::make_shared<CacheContext>(std::move(external));
    }
    return nullptr;
}

}  // namespace iit
