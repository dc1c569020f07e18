#pragma once

#include <list>
#include <mutex>
#include <unordered_map>
#include <dg_defs.h>

namespace dg {

/**
 * Generic cache with least-recently-used eviction policy.
 * Lookups only reorder the recency list, which has its own lock, so `get()` may be called
 * by several readers holding a shared lock on the cache.
 */
template <typename Key, typename Val>
class lru_cache {
public:
    using node = std::pair<const Key, Val>;
    static constexpr size_t DEFAULT_CAPACITY = 128;

private:
    using list_type = std::list<node>;
    using map_type = std::unordered_map<Key, typename list_type::iterator>;

    size_t m_max_size;
    /** MRU at the front, LRU at the back */
    mutable with_mtx<list_type> m_nodes;
    map_type m_index;

public:
    /** A pointer-like object for accessing the cached value */
    class accessor {
    public:
        accessor() = default;

        explicit operator bool() const {
            return m_valid;
        }

        const Val &operator*() const {
            return m_it->second;
        }

        const Val *operator->() const {
            return &m_it->second;
        }

    private:
        friend class lru_cache;

        explicit accessor(typename list_type::iterator it) : m_it{it}, m_valid{true} {}

        typename list_type::iterator m_it{};
        bool m_valid = false;
    };

    /**
     * @param max_size cache capacity, 0 means default
     */
    explicit lru_cache(size_t max_size = DEFAULT_CAPACITY) : m_max_size{max_size ? max_size : DEFAULT_CAPACITY} {
    }

    /**
     * Insert a new key-value pair or replace an existing one.
     * The entry becomes most-recently-used.
     * @return true if the key was not present
     */
    bool insert(Key k, Val v) {
        std::scoped_lock l(m_nodes.mtx);
        bool inserted = true;
        if (auto i = m_index.find(k); i != m_index.end()) {
            m_nodes.val.erase(i->second);
            m_index.erase(i);
            inserted = false;
        } else if (m_nodes.val.size() >= m_max_size) {
            m_index.erase(m_nodes.val.back().first);
            m_nodes.val.pop_back();
        }
        m_nodes.val.emplace_front(k, std::move(v));
        m_index.emplace(std::move(k), m_nodes.val.begin());
        return inserted;
    }

    /**
     * Get the value associated with the given key, making it most-recently-used.
     * The accessor is valid only until the next modification of the cache.
     */
    accessor get(const Key &k) const {
        auto i = m_index.find(k);
        if (i == m_index.end()) {
            return {};
        }
        std::scoped_lock l(m_nodes.mtx);
        m_nodes.val.splice(m_nodes.val.begin(), m_nodes.val, i->second);
        return accessor(i->second);
    }

    /**
     * Delete the value with the given key from the cache
     */
    void erase(const Key &k) {
        auto i = m_index.find(k);
        if (i != m_index.end()) {
            std::scoped_lock l(m_nodes.mtx);
            m_nodes.val.erase(i->second);
            m_index.erase(i);
        }
    }

    void clear() {
        std::scoped_lock l(m_nodes.mtx);
        m_nodes.val.clear();
        m_index.clear();
    }

    size_t size() const {
        return m_index.size();
    }

    size_t max_size() const {
        return m_max_size;
    }

    /**
     * Set cache capacity. Least recently used entries which don't fit are removed.
     * @param max_size new capacity, 0 means default capacity
     */
    void set_capacity(size_t max_size) {
        m_max_size = max_size ? max_size : DEFAULT_CAPACITY;
        std::scoped_lock l(m_nodes.mtx);
        while (m_nodes.val.size() > m_max_size) {
            m_index.erase(m_nodes.val.back().first);
            m_nodes.val.pop_back();
        }
    }
};

} // namespace dg
