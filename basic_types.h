/*
 * basic_types.h - Short integer aliases shared by the fuset headers and tests
 *
 * ──────────────────────────────────────────────────────────────────────────
 *  Category      │ Purpose                         │ Types
 * ───────────────┼─────────────────────────────────┼─────────────────────────
 *  Exact-width   │ Fixed bit size                  │ u8..u64, i8..i64
 *  Native        │ Pointer-sized (register proxy)  │ reg, sreg
 *  Size-friendly │ API ergonomics for sizes        │ usize, isize
 * ──────────────────────────────────────────────────────────────────────────
 *
 * reg is the size/count domain of every fuset container (unordered::size()).
 * The header is C++ only.
 */

#ifndef BASIC_TYPES_H_
#define BASIC_TYPES_H_

#include <cstddef> /* size_t, ptrdiff_t */
#include <cstdint> /* exact-width integers */

/* Exact-width integer types */
using u8  = std::uint8_t;   using i8  = std::int8_t;
using u16 = std::uint16_t;  using i16 = std::int16_t;
using u32 = std::uint32_t;  using i32 = std::int32_t;
using u64 = std::uint64_t;  using i64 = std::int64_t;

/* Native register-size types (match pointer size) */
using reg  = std::size_t;    /* unsigned native word (counts, sizes) */
using sreg = std::ptrdiff_t; /* signed native word (differences) */

/* Size-friendly aliases */
using usize = std::size_t;
using isize = std::ptrdiff_t;

/* ------------------------------ Sanity checks ------------------------------ */
static_assert(sizeof(u8)  == 1, "u8 must be 1 byte");
static_assert(sizeof(u16) == 2, "u16 must be 2 bytes");
static_assert(sizeof(u32) == 4, "u32 must be 4 bytes");
static_assert(sizeof(u64) == 8, "u64 must be 8 bytes");

static_assert(sizeof(reg)  == sizeof(void*), "reg must match pointer size");
static_assert(sizeof(sreg) == sizeof(void*), "sreg must match pointer size");

#endif /* BASIC_TYPES_H_ */
