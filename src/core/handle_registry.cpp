#include "handle_registry.hpp"
#include "error.hpp"

#include <limits>

namespace tkb {

namespace {

constexpr tkb_handle_t make_handle(uint32_t generation, uint32_t slot) {
    return (static_cast<tkb_handle_t>(generation) << 32) | (static_cast<tkb_handle_t>(slot) + 1);
}

} // namespace

tkb_handle_t HandleRegistry::insert(std::shared_ptr<const Tokenizer> tokenizer) {
    if (!tokenizer) {
        throw Error(TKB_ERROR_INVALID_ARGUMENT, "Cannot register a null tokenizer");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    uint32_t index;
    if (!free_slots_.empty()) {
        index = free_slots_.back();
        free_slots_.pop_back();
    } else {
        // slot + 1 must fit in the low 32 bits
        if (slots_.size() >= std::numeric_limits<uint32_t>::max() - 1) {
            throw Error(TKB_ERROR_OUT_OF_MEMORY, "Handle table is full");
        }
        index = static_cast<uint32_t>(slots_.size());
        slots_.emplace_back();
    }

    Slot& slot = slots_[index];
    slot.tokenizer = std::move(tokenizer);
    live_++;

    return make_handle(slot.generation, index);
}

long long HandleRegistry::resolve(tkb_handle_t handle) const {
    uint32_t low = static_cast<uint32_t>(handle & 0xFFFFFFFFu);
    uint32_t generation = static_cast<uint32_t>(handle >> 32);
    if (low == 0) return -1;

    size_t index = static_cast<size_t>(low) - 1;
    if (index >= slots_.size()) return -1;

    const Slot& slot = slots_[index];
    if (slot.generation != generation || !slot.tokenizer) return -1;
    return static_cast<long long>(index);
}

std::shared_ptr<const Tokenizer> HandleRegistry::find(tkb_handle_t handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    long long index = resolve(handle);
    return index < 0 ? nullptr : slots_[static_cast<size_t>(index)].tokenizer;
}

bool HandleRegistry::erase(tkb_handle_t handle) {
    std::shared_ptr<const Tokenizer> released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        long long index = resolve(handle);
        if (index < 0) return false;

        Slot& slot = slots_[static_cast<size_t>(index)];
        released = std::move(slot.tokenizer);
        slot.tokenizer.reset();
        if (++slot.generation == 0) slot.generation = 1;
        free_slots_.push_back(static_cast<uint32_t>(index));
        live_--;
    }
    // Tokenizer (and possibly its vocabulary) is destroyed outside the lock
    return true;
}

size_t HandleRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_;
}

} // namespace tkb
