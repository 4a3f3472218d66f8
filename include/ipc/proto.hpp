#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "ipc/frame.hpp"

namespace ipc {

// Request payload:  u8 op | u32 seq | body
//   open   path bytes
//   read   u8 id_len | id | u64 offset | u32 length
//   close  id bytes
// Response payload: u32 seq | u8 status | body
//   ok/open   u64 size | id bytes
//   ok/read   raw bytes
//   ok/close  empty
//   error     i32 errno | message bytes
// All integers little-endian.

enum class Op : uint8_t {
  open  = 1,
  read  = 2,
  close = 3,
};

enum class Status : uint8_t {
  ok             = 0,
  open_error     = 1,
  invalid_handle = 2,
  seek_error     = 3,
  read_error     = 4,
  bad_request    = 5,
};

inline constexpr size_t REQUEST_HEAD  = 1 + 4;
inline constexpr size_t RESPONSE_HEAD = 4 + 1;
// Largest read whose response still fits a 32-bit frame length
inline constexpr uint32_t MAX_READ_LEN = static_cast<uint32_t>(kMaxResponseBytes - RESPONSE_HEAD);

struct Request {
  Op          op{Op::open};
  uint32_t    seq{0};
  std::string target;      // path for open, handle id otherwise
  uint64_t    offset{0};
  uint32_t    length{0};
};

struct Response {
  uint32_t             seq{0};
  Status               status{Status::ok};
  int32_t              err{0};
  std::string          text;   // id on open success, message on error
  uint64_t             size{0};
  std::vector<uint8_t> data;   // read payload
  Op                   op{Op::open};
};

// Returns 0, or -EBADMSG when the payload is malformed. seq is filled
// whenever the payload is long enough to carry it.
int decode_request(const uint8_t* p, size_t n, Request& out);
void encode_request(const Request& req, std::vector<uint8_t>& out);

// Everything except read data, which goes out as the frame body untouched.
void encode_response_head(const Response& resp, std::vector<uint8_t>& out);
// op selects how a success body is interpreted.
int decode_response(const uint8_t* p, size_t n, Op op, Response& out);

// Maps an operation's -errno result onto the wire status.
Status classify(Op op, int rc);
const char* status_name(Status s);

} // namespace ipc
