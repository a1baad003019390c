/**
 * @file index_registry.hpp
 * @brief Generation-checked handle table for live indexes
 *
 * Handles pack (slot + 1) << 32 | generation. A slot's generation moves on
 * every erase, so a freed handle never aliases a later index. Each entry
 * carries its own reader/writer lock: searches share it, mutations and
 * erase take it exclusively.
 */

#pragma once

#include <core/error.hpp>
#include <export.hpp>
#include <index/nn_index.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <variant>
#include <vector>

namespace Annex {

class ANNEX_API IndexRegistry {
public:
    using Handle = uint64_t;

    IndexRegistry() = default;
    IndexRegistry(const IndexRegistry&) = delete;
    IndexRegistry& operator=(const IndexRegistry&) = delete;

    /**
     * @brief Process-wide registry used by the C API
     */
    static IndexRegistry& global();

    template <typename T>
    Handle insert(std::unique_ptr<NNIndex<T>> index) {
        if (!index) throw Error(ErrorKind::Internal, "Cannot register a null index");
        return insert_any(AnyIndex(std::move(index)));
    }

    /**
     * @brief Run `fn(const NNIndex<T>&)` under the entry's shared lock
     * @throws HandleError for unknown, zero or freed handles
     * @throws DimensionError when the index holds a different element type
     */
    template <typename T, typename Fn>
    decltype(auto) with_shared(Handle handle, Fn&& fn) const {
        const std::shared_ptr<Entry> entry = lookup(handle);
        std::shared_lock<std::shared_mutex> lock(entry->mutex);
        const NNIndex<T>& index = checked<T>(*entry, handle);
        return fn(index);
    }

    /**
     * @brief Run `fn(NNIndex<T>&)` under the entry's exclusive lock
     */
    template <typename T, typename Fn>
    decltype(auto) with_exclusive(Handle handle, Fn&& fn) {
        const std::shared_ptr<Entry> entry = lookup(handle);
        std::unique_lock<std::shared_mutex> lock(entry->mutex);
        NNIndex<T>& index = checked<T>(*entry, handle);
        return fn(index);
    }

    /**
     * @brief Invalidate the handle, then destroy the index once in-flight users finish
     */
    void erase(Handle handle);

    bool contains(Handle handle) const;
    size_t size() const;

private:
    using AnyIndex = std::variant<std::unique_ptr<NNIndex<float>>,
                                  std::unique_ptr<NNIndex<double>>,
                                  std::unique_ptr<NNIndex<uint8_t>>,
                                  std::unique_ptr<NNIndex<int32_t>>>;

    struct Entry {
        mutable std::shared_mutex mutex;
        AnyIndex index;
        bool alive = true;
    };

    struct Slot {
        std::shared_ptr<Entry> entry;
        uint32_t generation = 1;
    };

    Handle insert_any(AnyIndex index);
    std::shared_ptr<Entry> lookup(Handle handle) const;

    static const char* element_name(const AnyIndex& index);

    template <typename T>
    static NNIndex<T>& checked(const Entry& entry, Handle handle) {
        if (!entry.alive) throw HandleError("Index handle " + std::to_string(handle) + " was freed");
        const auto* held = std::get_if<std::unique_ptr<NNIndex<T>>>(&entry.index);
        if (held == nullptr) {
            throw DimensionError("Index handle " + std::to_string(handle) + " holds " +
                                 element_name(entry.index) + " elements, not " + ElementTraits<T>::name);
        }
        return **held;
    }

    mutable std::mutex mutex_;
    std::vector<Slot> slots_;
    std::vector<uint32_t> free_slots_;
    size_t live_ = 0;
};

} // namespace Annex
