#pragma once

#include <cstdint>  // uint8_t, uint64_t

// =============================
// Types.hpp
// =============================
// Fixed-size aliases used across XComponentGuard. Code above the C ABI
// headers relies on these instead of raw native types like 'int' or 'long'.
// =============================

namespace xcg
{
// ---- Integer types ----
using uint8 = std::uint8_t;
using uint64 = std::uint64_t;

// ---- Short aliases (u* pattern) ----
using u8  = uint8;
using u64 = uint64;
} // namespace xcg
