#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace ipc {

// Requests carry a path or an id plus a few integers
constexpr uint32_t kMaxRequestBytes = 64u * 1024u;
// A read response holds up to UINT32_MAX data bytes plus its header
constexpr uint64_t kMaxResponseBytes = 0xFFFFFFFFull;

// Reads exactly n bytes into buf. Returns false on EOF or stream failure before n bytes.
bool read_exact(std::istream &in, uint8_t *buf, size_t n);

// Reads one length-prefixed frame (uint32_le + payload bytes).
// Returns:
//  - true  => frame read successfully into out
//  - false => EOF (err empty) or fatal protocol/IO error (err non-empty)
bool read_frame(std::istream &in, std::vector<uint8_t> &out, std::string &err,
                uint32_t max_len = kMaxRequestBytes);

// Writes one frame whose payload is head followed by body, then flushes.
// body may be null when body_len is 0. Returns false on error and sets err.
bool write_frame(std::ostream &out, const uint8_t *head, size_t head_len,
                 const uint8_t *body, size_t body_len, std::string &err);

} // namespace ipc
