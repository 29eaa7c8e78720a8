/// @file AllocatorConcept.hpp
/// @brief Allocator concept and traits used by JEVT containers.
#pragma once

#include <concepts>
#include <cstddef>
#include <limits>

namespace JEVT::Memory
{
    // Only Allocate/Deallocate are required.
    // Size and alignment parameters to Deallocate may be ignored by implementations.
    template<class A>
    concept AllocatorConcept =
            requires(A a, std::size_t n, std::size_t align, void* p) {
                { a.Allocate(n, align) } -> std::same_as<void*>;// May return nullptr on failure
                { a.Deallocate(p, n, align) } noexcept;
            };

    template<class A>
    concept AllocatorReportsMaxSize =
            requires(const A a) {
                { a.MaxSize() } -> std::same_as<std::size_t>;
            };

    template<class A>
    struct AllocatorTraits
    {
        static constexpr bool HasMaxSizeCapability = AllocatorReportsMaxSize<A>;

        static std::size_t MaxSize(const A& allocator) noexcept
        {
            if constexpr (HasMaxSizeCapability)
            {
                return allocator.MaxSize();
            }
            else
            {
                return std::numeric_limits<std::size_t>::max();
            }
        }
    };
}// namespace JEVT::Memory
