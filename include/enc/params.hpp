#pragma once
#include <cstdint>
#include <cstddef>

namespace enc {
inline constexpr size_t   MAX_KEY_SIZE    = 4096;                  // bytes, after hex decode
inline constexpr char     KEY_VAR[]       = "VITRINE_ARCHIVE_KEY"; // build environment variable
} // namespace enc
