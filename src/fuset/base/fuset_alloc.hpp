/*
 * fuset_alloc.hpp
 *
 * Created on: 19 Oct. 2026
 * Author: fuset authors
 *
 * Stateless allocator for member records.
 *
 * - fail_mode::throws       : allocate() throws std::bad_alloc
 *                             (requires FUSET_ENABLE_EXCEPTIONS != 0)
 * - fail_mode::returns_null : allocate() returns nullptr
 *
 * Records are cache-line aligned by default (FUSET_ALIGN_NODES). Alignments
 * above the default new alignment use aligned new when
 * FUSET_ALLOC_PREFER_ALIGNED_NEW is set, otherwise the record is carved out of
 * an over-sized block whose raw pointer is kept just in front of it.
 */

#ifndef FUSET_ALLOC_HPP_
#define FUSET_ALLOC_HPP_

#include <cstddef>     // std::size_t, std::byte, std::max_align_t
#include <cstdint>     // std::uintptr_t
#include <cstring>     // std::memcpy
#include <limits>
#include <new>         // std::nothrow, std::align_val_t, std::bad_alloc
#include <type_traits>

#include "fuset_tools.hpp"

namespace fuset::alloc {

enum class fail_mode : unsigned {
    throws,
    returns_null
};

namespace detail {

#if defined(__STDCPP_DEFAULT_NEW_ALIGNMENT__)
inline constexpr std::size_t kNewAlign = __STDCPP_DEFAULT_NEW_ALIGNMENT__;
#else
inline constexpr std::size_t kNewAlign = alignof(std::max_align_t);
#endif

constexpr bool is_pow2(const std::size_t x) noexcept {
    return (x != 0u) && ((x & (x - 1u)) == 0u);
}

template<fail_mode Mode>
[[nodiscard]] inline void* fail_ptr() noexcept(Mode == fail_mode::returns_null)
{
#if (FUSET_ENABLE_EXCEPTIONS != 0)
    if constexpr (Mode == fail_mode::throws) {
        throw std::bad_alloc{};
    }
#endif
    return nullptr;
}

template<fail_mode Mode>
[[nodiscard]] inline void* plain_new(const std::size_t bytes) noexcept(Mode == fail_mode::returns_null)
{
    if constexpr (Mode == fail_mode::throws) {
        return ::operator new(bytes);
    } else {
        return ::operator new(bytes, std::nothrow);
    }
}

// [raw pointer][pad ...][record (align)]
template<fail_mode Mode>
[[nodiscard]] inline void* aligned_alloc_raw(const std::size_t align, const std::size_t bytes)
    noexcept(Mode == fail_mode::returns_null)
{
    constexpr std::size_t header = sizeof(void*);
    if (FUSET_UNLIKELY(bytes > std::numeric_limits<std::size_t>::max() - align - header)) {
        return fail_ptr<Mode>();
    }

    void* const raw = plain_new<Mode>(bytes + align + header);
    if (FUSET_UNLIKELY(raw == nullptr)) {
        return nullptr;
    }

    const std::uintptr_t first = reinterpret_cast<std::uintptr_t>(raw) + header;
    const std::uintptr_t rec   = (first + (align - 1u)) & ~static_cast<std::uintptr_t>(align - 1u);
    auto* const p = reinterpret_cast<std::byte*>(rec);
    std::memcpy(p - header, &raw, header);
    return p;
}

inline void aligned_free_raw(void* p) noexcept
{
    void* raw = nullptr;
    std::memcpy(&raw, static_cast<std::byte*>(p) - sizeof(void*), sizeof(void*));
    ::operator delete(raw);
}

} // namespace detail

/*
 * allocator<T, Alignment, Mode>: records get max(Alignment, alignof(T)).
 * Alignment == 0 means alignof(T).
 */
template<class T, std::size_t Alignment, fail_mode Mode>
class allocator
{
    static_assert(Alignment == 0u || detail::is_pow2(Alignment),
                  "fuset::alloc::allocator: Alignment must be 0 or a power of two");
    static_assert((Mode != fail_mode::throws) || (FUSET_ENABLE_EXCEPTIONS != 0),
                  "fuset::alloc::allocator: fail_mode::throws requires exceptions");

    static constexpr std::size_t kAlign = (Alignment > alignof(T)) ? Alignment : alignof(T);
    static constexpr bool kNoexcept = (Mode == fail_mode::returns_null);

public:
    using value_type      = T;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;
    using is_always_equal = std::true_type;

    template<class U>
    struct rebind {
        using other = allocator<U, Alignment, Mode>;
    };

    allocator() noexcept = default;

    template<class U>
    allocator(const allocator<U, Alignment, Mode>&) noexcept {}

    [[nodiscard]] T* allocate(const size_type n) noexcept(kNoexcept)
    {
        if (FUSET_UNLIKELY(n == 0u)) {
            return nullptr;
        }
        if (FUSET_UNLIKELY(n > std::numeric_limits<size_type>::max() / sizeof(T))) {
            return static_cast<T*>(detail::fail_ptr<Mode>());
        }
        const size_type bytes = n * sizeof(T);

        if constexpr (kAlign <= detail::kNewAlign) {
            return static_cast<T*>(detail::plain_new<Mode>(bytes));
        } else if constexpr (FUSET_ALLOC_PREFER_ALIGNED_NEW != 0) {
            if constexpr (Mode == fail_mode::throws) {
                return static_cast<T*>(::operator new(bytes, std::align_val_t(kAlign)));
            } else {
                return static_cast<T*>(::operator new(bytes, std::align_val_t(kAlign), std::nothrow));
            }
        } else {
            return static_cast<T*>(detail::aligned_alloc_raw<Mode>(kAlign, bytes));
        }
    }

    void deallocate(T* p, size_type) noexcept
    {
        if (p == nullptr) {
            return;
        }
        if constexpr (kAlign <= detail::kNewAlign) {
            ::operator delete(p);
        } else if constexpr (FUSET_ALLOC_PREFER_ALIGNED_NEW != 0) {
            ::operator delete(p, std::align_val_t(kAlign));
        } else {
            detail::aligned_free_raw(p);
        }
    }
};

template<class T1, std::size_t A1, fail_mode M1, class T2, std::size_t A2, fail_mode M2>
inline bool operator==(const allocator<T1, A1, M1>&, const allocator<T2, A2, M2>&) noexcept
{
    return (A1 == A2) && (M1 == M2);
}

template<class T1, std::size_t A1, fail_mode M1, class T2, std::size_t A2, fail_mode M2>
inline bool operator!=(const allocator<T1, A1, M1>& a, const allocator<T2, A2, M2>& b) noexcept
{
    return !(a == b);
}

inline constexpr fail_mode default_fail_mode =
    (FUSET_ENABLE_EXCEPTIONS != 0) ? fail_mode::throws : fail_mode::returns_null;

using default_alloc = allocator<std::byte, 0u, default_fail_mode>;

template<std::size_t Alignment>
using align_alloc = allocator<std::byte, Alignment, default_fail_mode>;

} // namespace fuset::alloc

#endif /* FUSET_ALLOC_HPP_ */
