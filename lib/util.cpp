#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <sys/random.h>
#include <sys/types.h>
#include <unistd.h>
#include <vector>

#include "util.hpp"


namespace util::fs {

ssize_t full_pread(int fd, void *buf, size_t n, off_t offset){
  uint8_t *p = static_cast<uint8_t*>(buf);

  size_t done = 0;
  while (done < n){
    ssize_t r = pread(fd, p+done, n-done, offset + (off_t)done);
    if (r < 0){
      if (errno==EINTR) continue;
      return -1;
    }
    if (r == 0) break; // EOF
    done += (size_t)r;
  }
  return (ssize_t)done;
}

}

namespace util::enc {

int fill_rand(void *p, size_t n){
  uint8_t *out = static_cast<uint8_t*>(p);
  size_t off = 0;
  while(off < n){
    ssize_t m = getrandom(out + off, n - off, 0);
    if (m < 0){
      if (errno == EINTR) continue;
      return -1;
    }
    off += static_cast<size_t>(m);
  }
  return 0;
}

int uuid_v4(std::string& out){
  uint8_t b[16];
  if (fill_rand(b, sizeof(b)) != 0) return -EIO;
  b[6] = static_cast<uint8_t>((b[6] & 0x0f) | 0x40); // version 4
  b[8] = static_cast<uint8_t>((b[8] & 0x3f) | 0x80); // RFC 4122 variant

  static const char digits[] = "0123456789abcdef";
  out.clear();
  out.reserve(36);
  for (size_t i = 0; i < sizeof(b); i++){
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    out.push_back(digits[b[i] >> 4]);
    out.push_back(digits[b[i] & 0x0f]);
  }
  return 0;
}

int hex_decode(const char* hex, std::vector<uint8_t>& out){
  out.clear();
  if (!hex) return -EINVAL;
  size_t n = std::strlen(hex);
  if (n % 2 != 0) return -EINVAL;
  auto hex2n = [](char c)->int{
    if ('0'<=c && c<='9') return c-'0';
    if ('a'<=c && c<='f') return 10 + c-'a';
    if ('A'<=c && c<='F') return 10 + c-'A';
    return -1;
  };
  out.reserve(n / 2);
  for (size_t i=0;i<n/2;i++){
    int hi = hex2n(hex[2*i]);
    int lo = hex2n(hex[2*i+1]);
    if (hi<0||lo<0) { out.clear(); return -EINVAL; }
    out.push_back((uint8_t)((hi<<4)|lo));
  }
  return 0;
}

void put_le32(uint8_t* p, uint32_t x){
  for (int i = 0; i < 4; i++) p[i] = static_cast<uint8_t>(x >> (8*i));
}

void put_le64(uint8_t* p, uint64_t x){
  for (int i = 0; i < 8; i++) p[i] = static_cast<uint8_t>(x >> (8*i));
}

uint32_t get_le32(const uint8_t* p){
  uint32_t x = 0;
  for (int i = 3; i >= 0; i--) x = (x << 8) | p[i];
  return x;
}

uint64_t get_le64(const uint8_t* p){
  uint64_t x = 0;
  for (int i = 7; i >= 0; i--) x = (x << 8) | p[i];
  return x;
}

}
