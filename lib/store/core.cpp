#include <cerrno>
#include <unistd.h>

#include "store/core.hpp"
#include "util.hpp"

namespace store {

FileHandle::~FileHandle(){
  if (fd >= 0) close(fd);
}

int HandleStore::insert(std::shared_ptr<FileHandle> fh, std::string& id){
  if (!fh) return -EINVAL;

  std::lock_guard<std::mutex> lk(mtx_);
  do {
    if (util::enc::uuid_v4(id) != 0) return -EIO;
  } while (map_.count(id) != 0);
  map_.emplace(id, std::move(fh));
  return 0;
}

std::shared_ptr<FileHandle> HandleStore::find(const std::string& id) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = map_.find(id);
  if (it == map_.end()) return {};
  return it->second;
}

bool HandleStore::remove(const std::string& id){
  std::shared_ptr<FileHandle> gone;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = map_.find(id);
    if (it == map_.end()) return false;
    gone = std::move(it->second);
    map_.erase(it);
  }
  // fd closes here, outside the map lock, unless a read still holds it
  return true;
}

size_t HandleStore::count() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return map_.size();
}

}
