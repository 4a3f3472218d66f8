#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "enc/key.hpp"

namespace store {

// One open file. Owns fd; size is captured at open and never refreshed.
struct FileHandle {
  int      fd{-1};
  uint64_t size{0};
  std::mutex mtx;   // held for the whole positioned read

  FileHandle() = default;
  FileHandle(const FileHandle&) = delete;
  FileHandle& operator=(const FileHandle&) = delete;
  ~FileHandle();
};

// Registry of open handles keyed by opaque id. One coarse lock guards the map.
// Ids are random UUIDs and are not handed out twice while live.
class HandleStore {
public:
  // Assigns a fresh id to fh and registers it. Returns 0 or -errno.
  int insert(std::shared_ptr<FileHandle> fh, std::string& id);

  // Empty pointer when id is unknown. The caller's reference keeps the fd
  // alive until it is dropped, even if the id is removed meanwhile.
  std::shared_ptr<FileHandle> find(const std::string& id) const;

  // Returns whether an entry was removed.
  bool remove(const std::string& id);

  size_t count() const;

private:
  mutable std::mutex mtx_;
  std::unordered_map<std::string, std::shared_ptr<FileHandle>> map_;
};

// Everything an operation needs; built once at startup and passed by reference.
struct Ctx {
  HandleStore handles;
  enc::Key    key;
};

}
