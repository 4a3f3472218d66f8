#include "ipc/frame.hpp"
#include "util.hpp"

namespace ipc {

bool read_exact(std::istream &in, uint8_t *buf, size_t n){
  size_t done = 0;
  while (done < n){
    in.read(reinterpret_cast<char*>(buf + done), static_cast<std::streamsize>(n - done));
    std::streamsize got = in.gcount();
    if (got <= 0) return false;
    done += static_cast<size_t>(got);
  }
  return true;
}

bool read_frame(std::istream &in, std::vector<uint8_t> &out, std::string &err, uint32_t max_len){
  err.clear();
  out.clear();

  uint8_t prefix[4];
  in.read(reinterpret_cast<char*>(prefix), sizeof(prefix));
  std::streamsize got = in.gcount();
  if (got == 0) return false; // clean EOF between frames
  if (got != static_cast<std::streamsize>(sizeof(prefix))){
    if (!read_exact(in, prefix + got, sizeof(prefix) - static_cast<size_t>(got))){
      err = "truncated frame length";
      return false;
    }
  }

  uint32_t len = util::enc::get_le32(prefix);
  if (len > max_len){
    err = "frame of " + std::to_string(len) + " bytes exceeds limit " + std::to_string(max_len);
    return false;
  }

  out.resize(len);
  if (len > 0 && !read_exact(in, out.data(), len)){
    err = "truncated frame payload";
    out.clear();
    return false;
  }
  return true;
}

bool write_frame(std::ostream &out, const uint8_t *head, size_t head_len,
                 const uint8_t *body, size_t body_len, std::string &err){
  err.clear();
  uint64_t total = static_cast<uint64_t>(head_len) + body_len;
  if (total > kMaxResponseBytes){
    err = "frame of " + std::to_string(total) + " bytes does not fit a 32-bit length";
    return false;
  }

  uint8_t prefix[4];
  util::enc::put_le32(prefix, static_cast<uint32_t>(total));
  out.write(reinterpret_cast<const char*>(prefix), sizeof(prefix));
  if (head_len > 0) out.write(reinterpret_cast<const char*>(head), static_cast<std::streamsize>(head_len));
  if (body_len > 0) out.write(reinterpret_cast<const char*>(body), static_cast<std::streamsize>(body_len));
  out.flush();
  if (!out){
    err = "output stream failed";
    return false;
  }
  return true;
}

} // namespace ipc
