#pragma once
#include <cstdint>
#include <cstddef>

#include "key.hpp"

namespace enc {

// buf[i] ^= key[(offset + i) % key.size()]. offset is the absolute file
// position of buf[0]; applying twice restores the input.
void xor_apply(uint8_t* buf, size_t n, uint64_t offset, const Key& key);

} // namespace enc
