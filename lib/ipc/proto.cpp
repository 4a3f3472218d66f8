#include <cerrno>
#include <cstring>

#include "ipc/proto.hpp"
#include "util.hpp"

using namespace util::enc;

namespace ipc {

int decode_request(const uint8_t* p, size_t n, Request& out){
  out = Request{};
  if (n < REQUEST_HEAD) return -EBADMSG;

  uint8_t op = p[0];
  out.seq = get_le32(p + 1);
  p += REQUEST_HEAD;
  n -= REQUEST_HEAD;

  switch (op){
    case static_cast<uint8_t>(Op::open):
      if (n == 0) return -EBADMSG;
      out.op = Op::open;
      out.target.assign(reinterpret_cast<const char*>(p), n);
      if (std::memchr(p, '\0', n)) return -EBADMSG; // not representable as a path
      return 0;

    case static_cast<uint8_t>(Op::read): {
      if (n < 1) return -EBADMSG;
      size_t id_len = p[0];
      if (n != 1 + id_len + 8 + 4) return -EBADMSG;
      out.op = Op::read;
      out.target.assign(reinterpret_cast<const char*>(p + 1), id_len);
      out.offset = get_le64(p + 1 + id_len);
      out.length = get_le32(p + 1 + id_len + 8);
      return 0;
    }

    case static_cast<uint8_t>(Op::close):
      out.op = Op::close;
      out.target.assign(reinterpret_cast<const char*>(p), n);
      return 0;

    default:
      return -EBADMSG;
  }
}

void encode_request(const Request& req, std::vector<uint8_t>& out){
  out.assign(REQUEST_HEAD, 0);
  out[0] = static_cast<uint8_t>(req.op);
  put_le32(out.data() + 1, req.seq);

  switch (req.op){
    case Op::open:
    case Op::close:
      out.insert(out.end(), req.target.begin(), req.target.end());
      break;
    case Op::read: {
      out.push_back(static_cast<uint8_t>(req.target.size()));
      out.insert(out.end(), req.target.begin(), req.target.end());
      uint8_t tail[12];
      put_le64(tail, req.offset);
      put_le32(tail + 8, req.length);
      out.insert(out.end(), tail, tail + sizeof(tail));
      break;
    }
  }
}

void encode_response_head(const Response& resp, std::vector<uint8_t>& out){
  out.assign(RESPONSE_HEAD, 0);
  put_le32(out.data(), resp.seq);
  out[4] = static_cast<uint8_t>(resp.status);

  if (resp.status != Status::ok){
    uint8_t e[4];
    put_le32(e, static_cast<uint32_t>(resp.err));
    out.insert(out.end(), e, e + 4);
    out.insert(out.end(), resp.text.begin(), resp.text.end());
    return;
  }
  if (resp.op == Op::open){
    uint8_t sz[8];
    put_le64(sz, resp.size);
    out.insert(out.end(), sz, sz + 8);
    out.insert(out.end(), resp.text.begin(), resp.text.end());
  }
}

int decode_response(const uint8_t* p, size_t n, Op op, Response& out){
  out = Response{};
  out.op = op;
  if (n < RESPONSE_HEAD) return -EBADMSG;
  out.seq = get_le32(p);
  uint8_t st = p[4];
  if (st > static_cast<uint8_t>(Status::bad_request)) return -EBADMSG;
  out.status = static_cast<Status>(st);
  p += RESPONSE_HEAD;
  n -= RESPONSE_HEAD;

  if (out.status != Status::ok){
    if (n < 4) return -EBADMSG;
    out.err = static_cast<int32_t>(get_le32(p));
    out.text.assign(reinterpret_cast<const char*>(p + 4), n - 4);
    return 0;
  }

  switch (op){
    case Op::open:
      if (n < 8) return -EBADMSG;
      out.size = get_le64(p);
      out.text.assign(reinterpret_cast<const char*>(p + 8), n - 8);
      return 0;
    case Op::read:
      out.data.assign(p, p + n);
      return 0;
    case Op::close:
      return n == 0 ? 0 : -EBADMSG;
  }
  return -EBADMSG;
}

Status classify(Op op, int rc){
  if (rc >= 0) return Status::ok;
  switch (op){
    case Op::open:
      return Status::open_error;
    case Op::read:
      if (rc == -EBADF) return Status::invalid_handle;
      if (rc == -EOVERFLOW || rc == -EINVAL || rc == -ESPIPE) return Status::seek_error;
      return Status::read_error;
    case Op::close:
      return Status::ok;
  }
  return Status::bad_request;
}

const char* status_name(Status s){
  switch (s){
    case Status::ok:             return "ok";
    case Status::open_error:     return "open_error";
    case Status::invalid_handle: return "invalid_handle";
    case Status::seek_error:     return "seek_error";
    case Status::read_error:     return "read_error";
    case Status::bad_request:    return "bad_request";
  }
  return "unknown";
}

} // namespace ipc
