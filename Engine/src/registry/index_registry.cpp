/**
 * @file index_registry.cpp
 * @brief Slot allocation, handle validation and deferred destruction
 */

#include <registry/index_registry.hpp>
#include <utils/logger.hpp>

namespace Annex {

namespace {

uint32_t slot_of(IndexRegistry::Handle handle) {
    return static_cast<uint32_t>(handle >> 32) - 1;
}

uint32_t generation_of(IndexRegistry::Handle handle) {
    return static_cast<uint32_t>(handle & 0xFFFFFFFFu);
}

IndexRegistry::Handle make_handle(uint32_t slot, uint32_t generation) {
    return (static_cast<uint64_t>(slot) + 1) << 32 | generation;
}

} // namespace

IndexRegistry& IndexRegistry::global() {
    static IndexRegistry registry;
    return registry;
}

const char* IndexRegistry::element_name(const AnyIndex& index) {
    return std::visit([](const auto& held) {
        using Held = typename std::decay_t<decltype(held)>::element_type::ElementType;
        return ElementTraits<Held>::name;
    }, index);
}

IndexRegistry::Handle IndexRegistry::insert_any(AnyIndex index) {
    auto entry = std::make_shared<Entry>();
    entry->index = std::move(index);

    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t slot;
    if (!free_slots_.empty()) {
        slot = free_slots_.back();
        free_slots_.pop_back();
    } else {
        if (slots_.size() >= 0xFFFFFFFEu) throw ResourceError("Index registry is full");
        slot = static_cast<uint32_t>(slots_.size());
        slots_.emplace_back();
    }

    slots_[slot].entry = std::move(entry);
    ++live_;

    const Handle handle = make_handle(slot, slots_[slot].generation);
    Logger::info("Registered index handle " + std::to_string(handle) + " (" + std::to_string(live_) + " live)");
    return handle;
}

std::shared_ptr<IndexRegistry::Entry> IndexRegistry::lookup(Handle handle) const {
    if (handle == 0) throw HandleError("Invalid index handle 0");

    std::lock_guard<std::mutex> lock(mutex_);
    const uint32_t slot = slot_of(handle);
    if (slot >= slots_.size() || !slots_[slot].entry || slots_[slot].generation != generation_of(handle)) {
        throw HandleError("Unknown or freed index handle " + std::to_string(handle));
    }
    return slots_[slot].entry;
}

void IndexRegistry::erase(Handle handle) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const uint32_t slot = slot_of(handle);
        if (handle == 0 || slot >= slots_.size() || !slots_[slot].entry ||
            slots_[slot].generation != generation_of(handle)) {
            throw HandleError("Unknown or freed index handle " + std::to_string(handle));
        }

        entry = std::move(slots_[slot].entry);
        slots_[slot].entry.reset();
        if (++slots_[slot].generation == 0) slots_[slot].generation = 1;
        free_slots_.push_back(slot);
        --live_;
    }

    // Waits for searches and mutations already holding the entry
    std::unique_lock<std::shared_mutex> lock(entry->mutex);
    entry->alive = false;
    entry->index = AnyIndex{};

    Logger::info("Freed index handle " + std::to_string(handle));
}

bool IndexRegistry::contains(Handle handle) const {
    if (handle == 0) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    const uint32_t slot = slot_of(handle);
    return slot < slots_.size() && slots_[slot].entry && slots_[slot].generation == generation_of(handle);
}

size_t IndexRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_;
}

} // namespace Annex
