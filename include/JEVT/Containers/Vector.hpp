/// @file Vector.hpp
/// @brief Declaration and inline implementation of the Vector container class.
/// @details
/// A dynamically resizable array-like container that stores elements contiguously
/// in memory obtained from a value-stored allocator. JEVT uses it for nesting
/// stacks and for the byte windows of the stream readers.
#pragma once

#include <JEVT/Memory/AllocatorConcept.hpp>
#include <JEVT/Memory/SystemAllocator.hpp>
#include <JEVT/Primitives.hpp>

#include <cstddef>
#include <initializer_list>
#include <new>
#include <stdexcept>
#include <utility>

namespace JEVT::Containers
{
    /// @tparam T Element type
    /// @tparam Alloc Allocator satisfying AllocatorConcept (value-stored). Defaults to SystemAllocator.
    template<class T, JEVT::Memory::AllocatorConcept Alloc = JEVT::Memory::SystemAllocator>
    class Vector
    {
    public:
        using Value     = T;
        using AllocType = Alloc;

        Vector() noexcept = default;
        explicit Vector(std::size_t initialCapacity, Alloc alloc = Alloc {}) : alloc_(std::move(alloc))
        {
            if (initialCapacity)
                Reserve(initialCapacity);
        }
        Vector(std::initializer_list<T> init, Alloc alloc = Alloc {}) : alloc_(std::move(alloc))
        {
            Reserve(init.size());
            for (auto& v: init)
                ::new (&data_[size_++]) T(v);
        }
        Vector(const Vector& other) : alloc_(other.alloc_)
        {
            Reserve(other.size_);
            for (std::size_t i = 0; i < other.size_; ++i)
                ::new (&data_[i]) T(other.data_[i]);
            size_ = other.size_;
        }
        Vector& operator=(const Vector& other)
        {
            if (this != &other)
            {
                Release();
                Reserve(other.size_);
                for (std::size_t i = 0; i < other.size_; ++i)
                    ::new (&data_[i]) T(other.data_[i]);
                size_ = other.size_;
            }
            return *this;
        }
        Vector(Vector&& other) noexcept
            : alloc_(std::move(other.alloc_)), data_(other.data_), size_(other.size_), capacity_(other.capacity_)
        {
            other.data_ = nullptr;
            other.size_ = other.capacity_ = 0;
        }
        Vector& operator=(Vector&& other) noexcept
        {
            if (this != &other)
            {
                Release();
                alloc_      = std::move(other.alloc_);
                data_       = other.data_;
                size_       = other.size_;
                capacity_   = other.capacity_;
                other.data_ = nullptr;
                other.size_ = other.capacity_ = 0;
            }
            return *this;
        }
        ~Vector()
        {
            Release();
        }

        //=== Element modifiers ===//

        /// @brief Push by copy.
        void PushBack(const T& value)
        {
            EnsureCapacityForOne();
            ::new (&data_[size_++]) T(value);
        }

        /// @brief Push by move.
        void PushBack(T&& value)
        {
            EnsureCapacityForOne();
            ::new (&data_[size_++]) T(std::move(value));
        }

        /// @brief In-place construct at the end.
        template<typename... Args>
        T& EmplaceBack(Args&&... args)
        {
            EnsureCapacityForOne();
            ::new (&data_[size_]) T(std::forward<Args>(args)...);
            return data_[size_++];
        }

        /// @brief Pop the last element.
        void PopBack()
        {
            if (size_ == 0)
                throw std::out_of_range("Vector::PopBack: vector is empty");
            data_[size_ - 1].~T();
            --size_;
        }

        /// @brief Grow with value-initialized elements or shrink by destroying the tail.
        void Resize(UIntSize newSize)
        {
            if (newSize < size_)
            {
                for (UIntSize i = newSize; i < size_; ++i)
                    data_[i].~T();
                size_ = newSize;
                return;
            }
            Reserve(newSize);
            for (; size_ < newSize; ++size_)
                ::new (&data_[size_]) T();
        }

        /// @brief Remove all elements (capacity remains).
        void Clear() noexcept
        {
            for (std::size_t i = 0; i < size_; ++i)
                data_[i].~T();
            size_ = 0;
        }

        //=== Capacity management ===//

        /// @brief Ensure at least `newCapacity` slots.
        void Reserve(UIntSize newCapacity)
        {
            if (newCapacity <= capacity_)
                return;
            if (newCapacity > JEVT::Memory::AllocatorTraits<Alloc>::MaxSize(alloc_) / sizeof(T))
                throw std::length_error("Vector::Reserve: capacity exceeds allocator limit");
            void* mem = alloc_.Allocate(newCapacity * sizeof(T), alignof(T));
            if (!mem)
                throw std::bad_alloc();
            T*       newData = static_cast<T*>(mem);
            UIntSize i       = 0;
            try
            {
                for (; i < size_; ++i)
                    ::new (&newData[i]) T(std::move(data_[i]));
            } catch (...)
            {
                for (UIntSize j = 0; j < i; ++j)
                    newData[j].~T();
                alloc_.Deallocate(newData, newCapacity * sizeof(T), alignof(T));
                throw;
            }
            for (UIntSize j = 0; j < size_; ++j)
                data_[j].~T();
            if (data_)
                alloc_.Deallocate(data_, capacity_ * sizeof(T), alignof(T));
            data_     = newData;
            capacity_ = newCapacity;
        }

        //=== Observers ===//

        [[nodiscard]] UIntSize Size() const noexcept
        {
            return size_;
        }
        [[nodiscard]] UIntSize Capacity() const noexcept
        {
            return capacity_;
        }
        [[nodiscard]] bool Empty() const noexcept
        {
            return size_ == 0;
        }

        T& At(UIntSize idx)
        {
            if (idx >= size_)
                throw std::out_of_range("Vector::At: index out of range");
            return data_[idx];
        }
        const T& At(UIntSize idx) const
        {
            if (idx >= size_)
                throw std::out_of_range("Vector::At: index out of range");
            return data_[idx];
        }

        T& Back()
        {
            if (size_ == 0)
                throw std::out_of_range("Vector::Back: vector is empty");
            return data_[size_ - 1];
        }
        const T& Back() const
        {
            if (size_ == 0)
                throw std::out_of_range("Vector::Back: vector is empty");
            return data_[size_ - 1];
        }

        T& operator[](UIntSize idx)
        {
            return data_[idx];
        }
        const T& operator[](UIntSize idx) const
        {
            return data_[idx];
        }

        //=== Iterators & data ===//

        [[nodiscard]] T* data() noexcept
        {
            return data_;
        }
        [[nodiscard]] const T* data() const noexcept
        {
            return data_;
        }
        [[nodiscard]] T* begin() noexcept
        {
            return data_;
        }
        [[nodiscard]] const T* begin() const noexcept
        {
            return data_;
        }
        [[nodiscard]] T* end() noexcept
        {
            return data_ + size_;
        }
        [[nodiscard]] const T* end() const noexcept
        {
            return data_ + size_;
        }

    private:
        void EnsureCapacityForOne()
        {
            if (size_ >= capacity_)
                Reserve(capacity_ ? capacity_ * 2 : 4);
        }
        void Release() noexcept
        {
            Clear();
            if (data_)
                alloc_.Deallocate(data_, capacity_ * sizeof(T), alignof(T));
            data_     = nullptr;
            capacity_ = 0;
        }

        Alloc    alloc_ {};
        T*       data_ {nullptr};
        UIntSize size_ {0};
        UIntSize capacity_ {0};
    };
}// namespace JEVT::Containers
