#include "DescriptorSlotAllocator.h"
#include "Utils/Verify.h"

namespace Helios::Graphics {

uint32_t DescriptorSlotAllocator::Allocate() {
    HELIOS_VERIFY(m_allocated < m_capacity,
                  "{} heap exhausted: all {} descriptors are in use", m_heapName, m_capacity);
    return m_allocated++;
}

} // namespace Helios::Graphics
