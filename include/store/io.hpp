#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "store/core.hpp"

namespace store {

// All return 0 on success and -errno on failure.
//
//   open        any OS error from open/fstat, -EISDIR for directories
//   read        -EBADF unknown id (checked first), -EOVERFLOW offset/length
//               not addressable, -ENODATA end of file before length bytes,
//               -ENOMEM buffer allocation, other -errno from pread
//   close       always 0

int open_file(Ctx& ctx, const std::string& path, std::string& id, uint64_t& size);

// Fills out with exactly length bytes decoded with ctx.key at the absolute
// offset; leaves it empty on failure.
int read_bytes(Ctx& ctx, const std::string& id, uint64_t offset, uint32_t length,
               std::vector<uint8_t>& out);

int close_file(Ctx& ctx, const std::string& id);

}
