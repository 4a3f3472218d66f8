#pragma once
#include <cerrno>
#include <cstdio>

#include "key.hpp"

// VITRINE_ARCHIVE_KEY is defined by the build for executables only.
namespace enc {

inline int load_build_key(Key& out){
#ifdef VITRINE_ARCHIVE_KEY
  int rc = load_key_from_hex(VITRINE_ARCHIVE_KEY, out);
  if (rc != 0){
    std::fprintf(stderr, "[KEY] embedded %s is not valid hex\n", KEY_VAR);
    return rc;
  }
  std::fprintf(stderr, "[KEY] archive key active (%zu bytes)\n", out.size());
#else
  out.clear();
#endif
  return 0;
}

} // namespace enc
