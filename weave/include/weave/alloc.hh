// weave

#pragma once

#include "weave/export.hh"

#include <cstdint>
#include <new>
#include <utility>

namespace weave {
    class wvAllocator
    {
    public:
        [[nodiscard]] virtual void* allocate(uint32_t size, uint32_t alignment) = 0;
        virtual void free(void* block, uint32_t size, uint32_t alignment) = 0;

        // constructs a single object in memory owned by this allocator
        template <typename T, typename... Args>
        [[nodiscard]] T* create(Args&&... args)
        {
            return new (allocate(sizeof(T), alignof(T))) T(std::forward<Args>(args)...);
        }

        template <typename T>
        void destroy(T* object)
        {
            if (object != nullptr)
            {
                object->~T();
                free(object, sizeof(T), alignof(T));
            }
        }

    protected:
        ~wvAllocator() = default;
    };

    class WV_API wvDefaultAllocator final : public wvAllocator
    {
    public:
        [[nodiscard]] void* allocate(uint32_t size, uint32_t alignment) override;
        void free(void* block, uint32_t size, uint32_t alignment) override;
    };
} // namespace weave
