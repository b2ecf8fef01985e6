// weave

#pragma once

#include "weave/alloc.hh"

#include "assert.hh"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <new>
#include <type_traits>
#include <utility>

namespace weave {
    template <typename Value, typename IndexT = uint32_t>
    class wvArray
    {
    public:
        static_assert(std::is_nothrow_destructible_v<Value>);
        static_assert(std::is_nothrow_move_constructible_v<Value>);

        using index_type = IndexT;

        ~wvArray() noexcept { deallocate(); }

        explicit wvArray(wvAllocator& allocator) noexcept : allocator_(&allocator) {}
        wvArray(wvArray&& rhs) noexcept : first_(rhs.first_), sentinel_(rhs.sentinel_), last_(rhs.last_), allocator_(rhs.allocator_)
        {
            rhs.first_ = rhs.sentinel_ = rhs.last_ = nullptr;
        }

        wvArray& operator=(wvArray&& rhs) noexcept
        {
            deallocate();
            first_ = rhs.first_;
            sentinel_ = rhs.sentinel_;
            last_ = rhs.last_;
            allocator_ = rhs.allocator_;
            rhs.first_ = rhs.sentinel_ = rhs.last_ = nullptr;
            return *this;
        }

        void resize(uint32_t size);
        void resize(uint32_t size, Value const& fill);
        void reserve(uint32_t minimumCapacity);

        // replaces the contents with a copy of another array
        void assign(wvArray const& source);
        void assign(Value const* items, uint32_t count);

        uint32_t size() const noexcept { return static_cast<uint32_t>(sentinel_ - first_); }
        bool empty() const noexcept { return first_ == sentinel_; }

        Value* data() noexcept { return first_; }
        Value const* data() const noexcept { return first_; }

        Value* begin() noexcept { return first_; }
        Value const* begin() const noexcept { return first_; }

        Value* end() noexcept { return sentinel_; }
        Value const* end() const noexcept { return sentinel_; }

        Value& operator[](index_type index) noexcept
        {
            WV_ASSERT(static_cast<uint32_t>(index) < size());
            return first_[static_cast<uint32_t>(index)];
        }
        Value const& operator[](index_type index) const noexcept
        {
            WV_ASSERT(static_cast<uint32_t>(index) < size());
            return first_[static_cast<uint32_t>(index)];
        }

        Value& back() noexcept
        {
            WV_ASSERT(first_ != sentinel_);
            return *(sentinel_ - 1);
        }
        Value const& back() const noexcept
        {
            WV_ASSERT(first_ != sentinel_);
            return *(sentinel_ - 1);
        }

        bool contains(index_type index) const noexcept { return static_cast<uint32_t>(index) < size(); }

        void clear() noexcept;

        Value& pushBack(Value const& value);
        Value& pushBack(Value&& value);

        template <typename... Args>
        Value& emplaceBack(Args&&... args);

        Value popBack();

        wvAllocator& allocator() const noexcept { return *allocator_; }

    private:
        void grow();
        void reallocate(uint32_t required);
        void deallocate();

        using StorageValue = std::remove_const_t<Value>;

        StorageValue* first_ = nullptr;
        StorageValue* sentinel_ = nullptr;
        StorageValue* last_ = nullptr;
        wvAllocator* allocator_ = nullptr;
    };

    template <typename Value, typename IndexT>
    void wvArray<Value, IndexT>::resize(uint32_t size)
    {
        if (size < this->size())
        {
            Value* const newSentinel = first_ + size;
            if constexpr (!std::is_trivially_destructible_v<Value>)
            {
                for (StorageValue* item = newSentinel; item != sentinel_; ++item)
                    item->~Value();
            }
            sentinel_ = newSentinel;
        }
        else if (size > this->size())
        {
            reserve(size);
            Value* const newSentinel = first_ + size;
            for (StorageValue* item = sentinel_; item != newSentinel; ++item)
                new (item) StorageValue{};
            sentinel_ = newSentinel;
        }
    }

    template <typename Value, typename IndexT>
    void wvArray<Value, IndexT>::resize(uint32_t size, Value const& fill)
    {
        if (size <= this->size())
        {
            Value* const shrunkSentinel = first_ + size;
            if constexpr (!std::is_trivially_destructible_v<Value>)
            {
                for (StorageValue* item = shrunkSentinel; item != sentinel_; ++item)
                    item->~Value();
            }
            sentinel_ = shrunkSentinel;
            return;
        }

        reserve(size);
        Value* const newSentinel = first_ + size;
        for (StorageValue* item = sentinel_; item != newSentinel; ++item)
            new (item) StorageValue(fill);
        sentinel_ = newSentinel;
    }

    template <typename Value, typename IndexT>
    void wvArray<Value, IndexT>::reserve(uint32_t minimumCapacity)
    {
        if (minimumCapacity > static_cast<uint32_t>(last_ - first_))
            reallocate(minimumCapacity);
    }

    template <typename Value, typename IndexT>
    void wvArray<Value, IndexT>::assign(wvArray const& source)
    {
        if (&source != this)
            assign(source.data(), source.size());
    }

    template <typename Value, typename IndexT>
    void wvArray<Value, IndexT>::assign(Value const* items, uint32_t count)
    {
        clear();
        reserve(count);
        for (uint32_t index = 0; index != count; ++index)
            new (sentinel_++) StorageValue(items[index]);
    }

    template <typename Value, typename IndexT>
    void wvArray<Value, IndexT>::clear() noexcept
    {
        if constexpr (std::is_trivially_destructible_v<Value>)
        {
            sentinel_ = first_;
        }
        else
        {
            while (sentinel_ != first_)
                (--sentinel_)->~Value();
        }
    }

    template <typename Value, typename IndexT>
    auto wvArray<Value, IndexT>::pushBack(Value const& value) -> Value&
    {
        if (sentinel_ == last_)
        {
            // value may alias our storage, so copy before growing
            StorageValue copy(value);
            grow();
            return *new (sentinel_++) StorageValue(std::move(copy));
        }

        return *new (sentinel_++) StorageValue(value);
    }

    template <typename Value, typename IndexT>
    auto wvArray<Value, IndexT>::pushBack(Value&& value) -> Value&
    {
        if (sentinel_ == last_)
        {
            StorageValue moved(static_cast<Value&&>(value));
            grow();
            return *new (sentinel_++) StorageValue(std::move(moved));
        }

        return *new (sentinel_++) StorageValue(static_cast<Value&&>(value));
    }

    template <typename Value, typename IndexT>
    template <typename... Args>
    Value& wvArray<Value, IndexT>::emplaceBack(Args&&... args)
    {
        if (sentinel_ == last_)
            grow();

        return *new (sentinel_++) StorageValue(static_cast<Args&&>(args)...);
    }

    template <typename Value, typename IndexT>
    auto wvArray<Value, IndexT>::popBack() -> Value
    {
        WV_ASSERT(first_ != sentinel_);
        Value ret = std::move(*--sentinel_);
        sentinel_->~Value();
        return ret;
    }

    template <typename Value, typename IndexT>
    void wvArray<Value, IndexT>::grow()
    {
        uint32_t const cap = static_cast<uint32_t>(last_ - first_);
        reallocate(cap < 16 ? 16 : (cap + (cap >> 1))); // grow by 50%
    }

    template <typename Value, typename IndexT>
    void wvArray<Value, IndexT>::reallocate(uint32_t required)
    {
        uint32_t const size = this->size();
        uint32_t const capacity = static_cast<uint32_t>(last_ - first_);

        if (capacity >= required)
            return;

        StorageValue* memory = static_cast<StorageValue*>(allocator_->allocate(required * sizeof(Value), alignof(Value)));
        if (first_ != nullptr)
        {
            if constexpr (std::is_trivially_move_constructible_v<Value>)
            {
                std::memcpy(static_cast<void*>(memory), first_, size * sizeof(Value));
            }
            else
            {
                for (StorageValue *item = first_, *out = memory; item != sentinel_; ++item, ++out)
                    new (out) StorageValue(static_cast<StorageValue&&>(*item));
            }
        }

        deallocate();

        first_ = memory;
        sentinel_ = memory + size;
        last_ = memory + required;
    }

    template <typename Value, typename IndexT>
    void wvArray<Value, IndexT>::deallocate()
    {
        clear();
        if (first_ != nullptr)
            allocator_->free(first_, static_cast<uint32_t>(last_ - first_) * sizeof(Value), alignof(Value));
        first_ = sentinel_ = last_ = nullptr;
    }
} // namespace weave
