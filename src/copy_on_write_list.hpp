#pragma once

#include <algorithm>
#include <memory>
#include <mutex>
#include <vector>

namespace querybus {

// List of shared items with lock-free snapshot reads.
// Writers serialize via mutex and atomically publish a new vector, so a
// dispatch in flight keeps iterating the snapshot it started with.
template <typename T>
class copy_on_write_list {
public:
    using item_ptr = std::shared_ptr<T>;
    using snapshot_ptr = std::shared_ptr<const std::vector<item_ptr>>;

    copy_on_write_list() : m_items(std::make_shared<const std::vector<item_ptr>>()) {}

    snapshot_ptr snapshot() const { return std::atomic_load(&m_items); }

    void add(item_ptr item) {
        std::lock_guard<std::mutex> lock(m_write_mutex);
        auto next = std::make_shared<std::vector<item_ptr>>(*std::atomic_load(&m_items));
        next->push_back(std::move(item));
        std::atomic_store(&m_items, snapshot_ptr(std::move(next)));
    }

    // Removes the first occurrence of `item`. Returns false if absent.
    bool remove(const T* item) {
        std::lock_guard<std::mutex> lock(m_write_mutex);
        auto current = std::atomic_load(&m_items);
        auto it = std::find_if(current->begin(), current->end(),
                               [item](const item_ptr& p) { return p.get() == item; });
        if (it == current->end()) return false;

        auto next = std::make_shared<std::vector<item_ptr>>(*current);
        next->erase(next->begin() + (it - current->begin()));
        std::atomic_store(&m_items, snapshot_ptr(std::move(next)));
        return true;
    }

    std::size_t size() const { return std::atomic_load(&m_items)->size(); }

private:
    std::mutex m_write_mutex;
    snapshot_ptr m_items;
};

} // namespace querybus
