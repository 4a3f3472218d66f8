#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <sys/types.h>

namespace util {

namespace enc {

// Ensure randomness has enough size
int fill_rand(void* p, size_t n);

// RFC 4122 version 4, lowercase 8-4-4-4-12
int uuid_v4(std::string& out);

// Accepts upper or lower case; returns -EINVAL on odd length or bad digit
int hex_decode(const char* hex, std::vector<uint8_t>& out);

// Little-endian wire helpers
void put_le32(uint8_t* p, uint32_t x);
void put_le64(uint8_t* p, uint64_t x);
uint32_t get_le32(const uint8_t* p);
uint64_t get_le64(const uint8_t* p);

}


namespace fs {

// Loops over EINTR and partial reads; stops early only at EOF
ssize_t full_pread(int fd, void* buf, size_t n, off_t offset);
}

}
