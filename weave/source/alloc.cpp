// weave

#include "weave/alloc.hh"

#include <new>

namespace weave {
    void* wvDefaultAllocator::allocate(uint32_t size, uint32_t alignment)
    {
        if (size == 0)
            return nullptr;
        return ::operator new(size, std::align_val_t(alignment));
    }

    void wvDefaultAllocator::free(void* block, uint32_t size, uint32_t alignment)
    {
        if (block != nullptr)
            ::operator delete(block, size, std::align_val_t(alignment));
    }
} // namespace weave
