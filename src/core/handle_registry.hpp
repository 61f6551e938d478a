#pragma once

#include "tokenizer.hpp"
#include <tkb/tkb_types.h>

#include <memory>
#include <mutex>
#include <vector>

namespace tkb {

/**
 * HandleRegistry - opaque handle table for tokenizers
 *
 * A handle is (generation << 32) | (slot + 1). Erasing a handle bumps its
 * slot's generation, so stale and forged values never resolve, and 0 is
 * never issued. Slots are reused through a free list.
 *
 * Lookups hand out a shared_ptr copy: a call in flight keeps its tokenizer
 * alive even if another thread erases the handle meanwhile.
 */
class HandleRegistry {
public:
    HandleRegistry() = default;

    // Prevent copying
    HandleRegistry(const HandleRegistry&) = delete;
    HandleRegistry& operator=(const HandleRegistry&) = delete;

    tkb_handle_t insert(std::shared_ptr<const Tokenizer> tokenizer);

    // nullptr when the handle is not live
    std::shared_ptr<const Tokenizer> find(tkb_handle_t handle) const;

    // false when the handle was not live (already erased, 0, forged)
    bool erase(tkb_handle_t handle);

    bool contains(tkb_handle_t handle) const { return find(handle) != nullptr; }

    // Number of live handles
    size_t size() const;

private:
    struct Slot {
        uint32_t generation = 1;
        std::shared_ptr<const Tokenizer> tokenizer;
    };

    // Slot index for a handle whose generation matches, or -1
    long long resolve(tkb_handle_t handle) const;

    std::vector<Slot> slots_;
    std::vector<uint32_t> free_slots_;
    size_t live_ = 0;
    mutable std::mutex mutex_;
};

} // namespace tkb
