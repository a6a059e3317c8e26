#pragma once

#include "types.hpp"
#include <cstddef>
#include <cstdlib>
#include <new>
#include <vector>

namespace hashmv {

/// Matrix rows and packed code words start on a 64-byte boundary so the
/// dot-product and XOR/popcount loops vectorize without a peeled prologue.
constexpr size_t STORAGE_ALIGNMENT = 64;

// ============================================================================
// Aligned storage for Matrix and SignCodes
// ============================================================================

/**
 * AlignedAllocator: std::allocator replacement returning memory aligned to
 * `Alignment` bytes. Used only through AlignedVector.
 *
 * @tparam T Element type
 * @tparam Alignment Power of two, at least alignof(T)
 */
template <typename T, size_t Alignment = STORAGE_ALIGNMENT>
class AlignedAllocator {
public:
    using value_type = T;
    using size_type = std::size_t;
    using difference_type = std::ptrdiff_t;

    static_assert((Alignment & (Alignment - 1)) == 0, "Alignment must be power of 2");
    static_assert(Alignment >= alignof(T), "Alignment must be >= alignof(T)");

    template <typename U>
    struct rebind {
        using other = AlignedAllocator<U, Alignment>;
    };

    AlignedAllocator() noexcept = default;

    template <typename U>
    AlignedAllocator(const AlignedAllocator<U, Alignment>&) noexcept {}

    T* allocate(size_type n) {
        if (n == 0) return nullptr;
        if (n > static_cast<size_type>(-1) / sizeof(T) - Alignment) {
            throw std::bad_alloc();
        }

        // std::aligned_alloc wants a size that is a whole number of alignments
        const size_t bytes = (n * sizeof(T) + Alignment - 1) & ~(Alignment - 1);
        void* ptr = std::aligned_alloc(Alignment, bytes);
        if (!ptr) {
            throw std::bad_alloc();
        }
        return static_cast<T*>(ptr);
    }

    void deallocate(T* p, size_type) noexcept {
        std::free(p);
    }

    template <typename U>
    bool operator==(const AlignedAllocator<U, Alignment>&) const noexcept {
        return true;
    }
};

/// Contiguous buffer with STORAGE_ALIGNMENT-aligned data()
template <typename T>
using AlignedVector = std::vector<T, AlignedAllocator<T>>;

}  // namespace hashmv
