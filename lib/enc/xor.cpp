#include "enc/xor.hpp"

namespace enc {

void xor_apply(uint8_t* buf, size_t n, uint64_t offset, const Key& key){
  if (key.empty() || n == 0) return;

  const uint8_t* k = key.data();
  const size_t klen = key.size();
  size_t j = static_cast<size_t>(offset % klen);
  for (size_t i = 0; i < n; i++){
    buf[i] ^= k[j];
    if (++j == klen) j = 0;
  }
}

}
