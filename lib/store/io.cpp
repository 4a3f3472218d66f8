#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <limits>
#include <memory>
#include <mutex>
#include <new>
#include <string>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <vector>

#include "enc/xor.hpp"
#include "store/core.hpp"
#include "store/io.hpp"
#include "util.hpp"

namespace store {

int open_file(Ctx& ctx, const std::string& path, std::string& id, uint64_t& size){
  const char* name = path.c_str();
  int fd = open(name, O_RDONLY | O_CLOEXEC);
  if (fd == -1){
    int e = errno;
    fprintf(stderr, "[OPEN] %s: %s\n", name, strerror(e));
    return -e;
  }

  // Handle owns fd from here; every early return closes it.
  auto fh = std::make_shared<FileHandle>();
  fh->fd = fd;

  struct stat st{};
  if (fstat(fd, &st) == -1){
    int e = errno;
    fprintf(stderr, "[OPEN] fstat %s: %s\n", name, strerror(e));
    return -e;
  }
  if (S_ISDIR(st.st_mode)){
    fprintf(stderr, "[OPEN] %s: is a directory\n", name);
    return -EISDIR;
  }
  fh->size = static_cast<uint64_t>(st.st_size);

  int rc = ctx.handles.insert(fh, id);
  if (rc != 0){
    fprintf(stderr, "[OPEN] %s: could not register handle (%s)\n", name, strerror(-rc));
    return rc;
  }
  size = fh->size;

  fprintf(stderr, "[OPEN] %s -> %s size=%llu\n", name, id.c_str(),
          (unsigned long long)size);
  return 0;
}

int read_bytes(Ctx& ctx, const std::string& id, uint64_t offset, uint32_t length,
               std::vector<uint8_t>& out){
  out.clear();

  auto fh = ctx.handles.find(id);
  if (!fh){
    fprintf(stderr, "[READ] invalid handle %s\n", id.c_str());
    return -EBADF;
  }

  constexpr uint64_t off_max = static_cast<uint64_t>(std::numeric_limits<off_t>::max());
  if (offset > off_max || static_cast<uint64_t>(length) > off_max - offset){
    fprintf(stderr, "[READ] %s: range offset=%llu len=%u not addressable\n",
            id.c_str(), (unsigned long long)offset, length);
    return -EOVERFLOW;
  }

  // reads on one handle are serialized
  std::lock_guard<std::mutex> lk(fh->mtx);

  // A regular file's current size bounds what pread can return; refuse
  // before allocating the buffer
  struct stat st{};
  if (length > 0 && fstat(fh->fd, &st) == 0 && S_ISREG(st.st_mode) &&
      offset + length > static_cast<uint64_t>(st.st_size)){
    fprintf(stderr, "[READ] %s: wanted %u bytes at %llu, file is %lld bytes\n",
            id.c_str(), length, (unsigned long long)offset, (long long)st.st_size);
    return -ENODATA;
  }

  try {
    out.resize(length);
  } catch (const std::bad_alloc&) {
    fprintf(stderr, "[READ] %s: cannot allocate %u bytes\n", id.c_str(), length);
    return -ENOMEM;
  }

  ssize_t rn = util::fs::full_pread(fh->fd, out.data(), out.size(), static_cast<off_t>(offset));
  if (rn < 0){
    int e = errno;
    out.clear();
    fprintf(stderr, "[READ] %s: pread at %llu: %s\n", id.c_str(),
            (unsigned long long)offset, strerror(e));
    return -e;
  }
  if (static_cast<size_t>(rn) != out.size()){
    out.clear();
    fprintf(stderr, "[READ] %s: wanted %u bytes at %llu, file ends after %zd\n",
            id.c_str(), length, (unsigned long long)offset, rn);
    return -ENODATA;
  }

  enc::xor_apply(out.data(), out.size(), offset, ctx.key);
  return 0;
}

int close_file(Ctx& ctx, const std::string& id){
  if (ctx.handles.remove(id))
    fprintf(stderr, "[CLOSE] %s\n", id.c_str());
  return 0;
}

}
