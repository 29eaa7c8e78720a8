/// @file SystemAllocator.hpp
/// @brief Default allocator of the JEVT containers, backed by the platform aligned allocation calls.
#pragma once

#include <cstddef>
#include <cstdlib>

#include <JEVT/Primitives.hpp>

namespace JEVT::Memory
{
    struct SystemAllocator
    {
        /// @brief Returns nullptr on failure or when @p size is 0. A non power of two alignment falls back to max_align_t.
        [[nodiscard]] void* Allocate(UIntSize size, UIntSize alignment) noexcept
        {
            if (size == 0)
                return nullptr;
            if (alignment == 0 || (alignment & (alignment - 1)) != 0)
                alignment = alignof(std::max_align_t);

#if defined(_WIN32)
            return _aligned_malloc(size, alignment);
#else
            if (alignment < sizeof(void*))
                alignment = sizeof(void*);
            void* block = nullptr;
            return posix_memalign(&block, alignment, size) == 0 ? block : nullptr;
#endif
        }

        void Deallocate(void* block, UIntSize, UIntSize) noexcept
        {
#if defined(_WIN32)
            _aligned_free(block);
#else
            std::free(block);
#endif
        }

        [[nodiscard]] constexpr UIntSize MaxSize() const noexcept
        {
            return static_cast<UIntSize>(-1);
        }
    };
}// namespace JEVT::Memory
