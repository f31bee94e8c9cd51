#pragma once

#include <cstddef>
#include <cstdint>


namespace ash
{

//
// Primitives
//

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
// used for all sizes, capacities and logical indices
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Memory
//

struct memory_resource;
template <class T>
struct allocation;
template <class T>
struct raw_buffer;

//
// Views
//

template <class T>
struct span;
struct string_view;

//
// Container
//

struct nullopt_t;
template <class T>
struct optional;

template <class T>
struct gap_buffer;
struct gap_string;

} // namespace ash
