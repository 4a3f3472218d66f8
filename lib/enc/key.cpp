#include <cerrno>
#include <cstring>
#include <utility>
#include <openssl/crypto.h>

#include "enc/key.hpp"
#include "util.hpp"

namespace enc {

Key::Key(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}

Key::~Key(){
  clear();
}

Key::Key(Key&& other) noexcept : bytes_(std::move(other.bytes_)) {
  other.bytes_.clear();
}

Key& Key::operator=(Key&& other) noexcept {
  if (this != &other){
    clear();
    bytes_ = std::move(other.bytes_);
    other.bytes_.clear();
  }
  return *this;
}

void Key::clear(){
  if (!bytes_.empty()) OPENSSL_cleanse(bytes_.data(), bytes_.size());
  bytes_.clear();
}

int load_key_from_hex(const char* hex, Key& out){
  if (!hex) return -EINVAL;
  if (std::strlen(hex) / 2 > MAX_KEY_SIZE) return -E2BIG;

  std::vector<uint8_t> raw;
  int rc = util::enc::hex_decode(hex, raw);
  if (rc != 0) return rc;
  out = Key(std::move(raw));
  return 0;
}

}
