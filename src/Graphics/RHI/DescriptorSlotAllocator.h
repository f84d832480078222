#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace Helios::Graphics {

// Append-only slot allocator shared by every descriptor heap kind.
// Slots are handed out 0, 1, 2, ... and never freed. Running past the
// capacity is a precondition violation and goes fatal.
class DescriptorSlotAllocator {
public:
    DescriptorSlotAllocator() = default;
    DescriptorSlotAllocator(std::string heapName, uint32_t capacity)
        : m_heapName(std::move(heapName)), m_capacity(capacity) {}

    [[nodiscard]] uint32_t Allocate();

    [[nodiscard]] uint32_t GetCapacity() const { return m_capacity; }
    [[nodiscard]] uint32_t GetAllocatedCount() const { return m_allocated; }
    [[nodiscard]] uint32_t GetRemaining() const { return m_capacity - m_allocated; }
    [[nodiscard]] bool HasSpace() const { return m_allocated < m_capacity; }
    [[nodiscard]] const std::string& GetHeapName() const { return m_heapName; }

private:
    std::string m_heapName = "descriptor";
    uint32_t m_capacity = 0;
    uint32_t m_allocated = 0;
};

} // namespace Helios::Graphics
