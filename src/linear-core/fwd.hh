#pragma once

#include <cstddef>
#include <cstdint>


namespace lc
{

//
// Primitives
//

// Explicitly-sized primitive types
// Use these wherever the range matters for correctness or memory layout.
// Plain "int" is fine for small counts and loop counters.

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// generic bytes
using byte = std::byte;

// signed size type
// Sizes, indices, and capacities are signed:
// * "size - 1" on an empty container stays -1 instead of wrapping to a huge value
// * no mixed signed/unsigned arithmetic when computing positions inside the entry storage
// * -1 is available as a "not found" position for the linear scans of map and set
// * we only target 64-bit platforms, so i64 has plenty of range
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Memory
//

struct memory_resource;
template <class T>
struct allocation;


//
// Views
//

template <class T>
struct span;

//
// Vocabulary
//

struct nullopt_t;
template <class T>
struct optional;

template <class T, class U>
struct pair;

struct unit;

//
// Container
//

template <class T>
struct vector;

namespace impl
{
template <class T, class ContainerT>
struct allocating_container;
}

template <class K, class V>
struct map;
template <class K, class V>
struct map_entry;
template <class K, class V>
struct occupied_entry;
template <class K, class V>
struct vacant_entry;

template <class T>
struct set;

} // namespace lc
