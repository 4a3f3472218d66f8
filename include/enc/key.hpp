#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>

#include "params.hpp"

namespace enc {

// Repeating XOR keystream. Empty means pass-through.
// Bytes are wiped with OPENSSL_cleanse when released.
class Key {
public:
  Key() = default;
  explicit Key(std::vector<uint8_t> bytes);
  ~Key();

  Key(Key&& other) noexcept;
  Key& operator=(Key&& other) noexcept;
  Key(const Key&) = delete;
  Key& operator=(const Key&) = delete;

  bool empty() const { return bytes_.empty(); }
  size_t size() const { return bytes_.size(); }
  const uint8_t* data() const { return bytes_.data(); }

  void clear();

private:
  std::vector<uint8_t> bytes_;
};

// Returns 0 on success, -EINVAL for malformed hex, -E2BIG above MAX_KEY_SIZE.
// An empty string yields an empty key.
int load_key_from_hex(const char* hex, Key& out);

} // namespace enc
