#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <utility>

#include "FenceValue.h"
#include "Utils/Verify.h"

namespace Helios::Graphics {

// Bookkeeping for command allocator and command list reuse on one queue.
//
// Allocators come back tagged with the fence value of the submission that
// recorded into them and are handed out again only once that value has
// completed. Only the oldest allocator is considered: tags are pushed in
// submission order, so if the front is still pending every later one is too.
//
// Command lists carry no fence tag. A submitted list can be reset as soon as
// it is returned because its recorded commands live in the allocator.
template<typename Allocator, typename CommandList>
class CommandContextPool {
public:
    struct PooledAllocator {
        Allocator allocator;
        FenceValue fenceValue = kNoFenceValue;
    };

    CommandContextPool() = default;

    CommandContextPool(const CommandContextPool&) = delete;
    CommandContextPool& operator=(const CommandContextPool&) = delete;
    CommandContextPool(CommandContextPool&&) = default;
    CommandContextPool& operator=(CommandContextPool&&) = default;

    // Oldest pooled allocator whose fence has completed, or nothing.
    [[nodiscard]] std::optional<Allocator> TryAcquireAllocator(FenceValue completedValue) {
        if (m_allocators.empty() || !IsFenceValueComplete(m_allocators.front().fenceValue, completedValue)) {
            return std::nullopt;
        }
        Allocator allocator = std::move(m_allocators.front().allocator);
        m_allocators.pop_front();
        ++m_liveAllocators;
        return allocator;
    }

    // Counts an allocator the caller created because nothing was reusable.
    void TrackNewAllocator() {
        ++m_liveAllocators;
        ++m_createdAllocators;
    }

    void ReturnAllocator(Allocator allocator, FenceValue fenceValue) {
        HELIOS_VERIFY(m_liveAllocators > 0, "Returned an allocator that was never checked out");
        HELIOS_VERIFY(m_allocators.empty() || m_allocators.back().fenceValue <= fenceValue,
                      "Allocator returned with fence {} older than pooled fence {}",
                      fenceValue, m_allocators.back().fenceValue);
        --m_liveAllocators;
        m_allocators.push_back(PooledAllocator{std::move(allocator), fenceValue});
    }

    // The allocator was dropped without a submission (e.g. Close failed).
    void DiscardAllocator() {
        HELIOS_VERIFY(m_liveAllocators > 0, "Discarded an allocator that was never checked out");
        --m_liveAllocators;
        --m_createdAllocators;
    }

    [[nodiscard]] std::optional<CommandList> TryAcquireCommandList() {
        if (m_commandLists.empty()) {
            return std::nullopt;
        }
        CommandList list = std::move(m_commandLists.front());
        m_commandLists.pop_front();
        ++m_liveCommandLists;
        return list;
    }

    void TrackNewCommandList() {
        ++m_liveCommandLists;
        ++m_createdCommandLists;
    }

    void ReturnCommandList(CommandList list) {
        HELIOS_VERIFY(m_liveCommandLists > 0, "Returned a command list that was never checked out");
        --m_liveCommandLists;
        m_commandLists.push_back(std::move(list));
    }

    void DiscardCommandList() {
        HELIOS_VERIFY(m_liveCommandLists > 0, "Discarded a command list that was never checked out");
        --m_liveCommandLists;
        --m_createdCommandLists;
    }

    // Drops every pooled object. The owner must have waited for the GPU first.
    void Clear() {
        m_allocators.clear();
        m_commandLists.clear();
        m_createdAllocators = m_liveAllocators;
        m_createdCommandLists = m_liveCommandLists;
    }

    [[nodiscard]] size_t GetPooledAllocatorCount() const { return m_allocators.size(); }
    [[nodiscard]] size_t GetLiveAllocatorCount() const { return m_liveAllocators; }
    [[nodiscard]] size_t GetCreatedAllocatorCount() const { return m_createdAllocators; }
    [[nodiscard]] size_t GetPooledCommandListCount() const { return m_commandLists.size(); }
    [[nodiscard]] size_t GetLiveCommandListCount() const { return m_liveCommandLists; }
    [[nodiscard]] size_t GetCreatedCommandListCount() const { return m_createdCommandLists; }

    // Fence tag of the allocator that would be considered next.
    [[nodiscard]] std::optional<FenceValue> GetOldestPendingFence() const {
        if (m_allocators.empty()) {
            return std::nullopt;
        }
        return m_allocators.front().fenceValue;
    }

private:
    std::deque<PooledAllocator> m_allocators;
    std::deque<CommandList> m_commandLists;

    size_t m_liveAllocators = 0;
    size_t m_createdAllocators = 0;
    size_t m_liveCommandLists = 0;
    size_t m_createdCommandLists = 0;
};

} // namespace Helios::Graphics
