#pragma once

#include <cstddef>
#include <deque>
#include <utility>

#include "FenceValue.h"
#include "Utils/Verify.h"

namespace Helios::Graphics {

// Holds objects the GPU may still reference until the fence value covering
// their last use has completed. Fence values must be enqueued in order.
template<typename T>
class DeferredReleaseQueue {
public:
    void Enqueue(T object, FenceValue lastUseFence) {
        HELIOS_VERIFY(m_pending.empty() || m_pending.back().fenceValue <= lastUseFence,
                      "Deferred release fence {} is older than queued fence {}",
                      lastUseFence, m_pending.back().fenceValue);
        m_pending.push_back(Entry{std::move(object), lastUseFence});
    }

    // Releases every object whose fence has completed. Returns the number released.
    size_t ReleaseCompleted(FenceValue completedValue) {
        size_t released = 0;
        while (!m_pending.empty() && IsFenceValueComplete(m_pending.front().fenceValue, completedValue)) {
            m_pending.pop_front();
            ++released;
        }
        return released;
    }

    // Caller guarantees the GPU is idle.
    void ReleaseAll() { m_pending.clear(); }

    [[nodiscard]] size_t GetPendingCount() const { return m_pending.size(); }
    [[nodiscard]] bool IsEmpty() const { return m_pending.empty(); }

private:
    struct Entry {
        T object;
        FenceValue fenceValue = kNoFenceValue;
    };

    std::deque<Entry> m_pending;
};

} // namespace Helios::Graphics
