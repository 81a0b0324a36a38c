#ifndef LRUCACHE_H
#define LRUCACHE_H

#include <QHash>
#include <QList>
#include <functional>
#include <list>
#include <utility>

/**
 * @brief Capacity-bounded least-recently-used cache.
 *
 * Entries live in a recency list (front = least recently used) indexed by
 * a hash of list iterators. get() and put() refresh recency; peek() and
 * contains() do not. When an insertion pushes the size over capacity the
 * least-recently-used entry is removed first and then reported to the
 * eviction callback, so the callback never observes a half-updated cache.
 */
template <typename Key, typename Value>
class LruCache
{
public:
    using EvictionCallback = std::function<void(const Key&, const Value&)>;

    explicit LruCache(int capacity)
        : m_capacity(capacity > 0 ? capacity : 1)
    {
    }

    /**
     * @brief Look up an entry and mark it most recently used.
     * @return Pointer to the stored value, or nullptr on a miss.
     *
     * The pointer stays valid until the entry is evicted or removed.
     */
    Value* get(const Key& key)
    {
        auto it = m_index.find(key);
        if (it == m_index.end()) {
            return nullptr;
        }
        m_entries.splice(m_entries.end(), m_entries, it.value());
        return &it.value()->second;
    }

    // Lookup without touching recency
    Value* peek(const Key& key)
    {
        auto it = m_index.find(key);
        if (it == m_index.end()) {
            return nullptr;
        }
        return &it.value()->second;
    }

    const Value* peek(const Key& key) const
    {
        auto it = m_index.constFind(key);
        if (it == m_index.constEnd()) {
            return nullptr;
        }
        return &it.value()->second;
    }

    void put(const Key& key, Value value)
    {
        auto it = m_index.find(key);
        if (it != m_index.end()) {
            it.value()->second = std::move(value);
            m_entries.splice(m_entries.end(), m_entries, it.value());
            return;
        }

        m_entries.emplace_back(key, std::move(value));
        m_index.insert(key, std::prev(m_entries.end()));
        evictOverflow();
    }

    bool contains(const Key& key) const { return m_index.contains(key); }

    bool remove(const Key& key)
    {
        auto it = m_index.find(key);
        if (it == m_index.end()) {
            return false;
        }
        m_entries.erase(it.value());
        m_index.erase(it);
        return true;
    }

    void clear()
    {
        m_entries.clear();
        m_index.clear();
    }

    int size() const { return static_cast<int>(m_index.size()); }
    bool isEmpty() const { return m_index.isEmpty(); }
    int capacity() const { return m_capacity; }

    void setCapacity(int capacity)
    {
        m_capacity = capacity > 0 ? capacity : 1;
        evictOverflow();
    }

    // Keys ordered from least to most recently used
    QList<Key> keys() const
    {
        QList<Key> result;
        result.reserve(static_cast<int>(m_entries.size()));
        for (const auto& entry : m_entries) {
            result.append(entry.first);
        }
        return result;
    }

    void setEvictionCallback(EvictionCallback callback) { m_onEvict = std::move(callback); }

private:
    void evictOverflow()
    {
        while (static_cast<int>(m_index.size()) > m_capacity) {
            std::pair<Key, Value> victim = std::move(m_entries.front());
            m_index.remove(victim.first);
            m_entries.pop_front();
            if (m_onEvict) {
                m_onEvict(victim.first, victim.second);
            }
        }
    }

    int m_capacity;
    std::list<std::pair<Key, Value>> m_entries;
    QHash<Key, typename std::list<std::pair<Key, Value>>::iterator> m_index;
    EvictionCallback m_onEvict;
};

#endif // LRUCACHE_H
