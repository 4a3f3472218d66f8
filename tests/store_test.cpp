#include "test_config.h"

#include <cerrno>
#include <fcntl.h>
#include <memory>
#include <set>
#include <thread>
#include <unistd.h>

#include "store/core.hpp"

namespace vitrine::test {

class HandleStoreTest : public ::testing::Test {
protected:
  void SetUp() override
  {
    ASSERT_TRUE(dir.ok());
    path = dir.write("data.bin", bytes_of("0123456789"));
  }

  std::shared_ptr<store::FileHandle> make_handle()
  {
    auto fh = std::make_shared<store::FileHandle>();
    fh->fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    fh->size = 10;
    return fh;
  }

  TempDir dir;
  std::string path;
  store::HandleStore handles;
};

TEST_F(HandleStoreTest, InsertFindRemove)
{
  std::string id;
  ASSERT_EQ(handles.insert(make_handle(), id), 0);
  EXPECT_FALSE(id.empty());
  EXPECT_EQ(handles.count(), 1u);

  auto fh = handles.find(id);
  ASSERT_TRUE(fh);
  EXPECT_EQ(fh->size, 10u);
  EXPECT_GE(fh->fd, 0);

  EXPECT_TRUE(handles.remove(id));
  EXPECT_FALSE(handles.find(id));
  EXPECT_EQ(handles.count(), 0u);
}

TEST_F(HandleStoreTest, RemoveIsIdempotent)
{
  std::string id;
  ASSERT_EQ(handles.insert(make_handle(), id), 0);
  EXPECT_TRUE(handles.remove(id));
  EXPECT_FALSE(handles.remove(id));
  EXPECT_FALSE(handles.remove("never-issued"));
}

TEST_F(HandleStoreTest, RejectsNullHandle)
{
  std::string id;
  EXPECT_EQ(handles.insert(nullptr, id), -EINVAL);
  EXPECT_EQ(handles.count(), 0u);
}

TEST_F(HandleStoreTest, OutstandingReferenceOutlivesRemoval)
{
  std::string id;
  ASSERT_EQ(handles.insert(make_handle(), id), 0);
  auto held = handles.find(id);
  ASSERT_TRUE(held);

  EXPECT_TRUE(handles.remove(id));
  // the fd is still usable until the last reference drops
  char c = 0;
  EXPECT_EQ(pread(held->fd, &c, 1, 3), 1);
  EXPECT_EQ(c, '3');
}

TEST_F(HandleStoreTest, ConcurrentInsertsYieldDistinctIds)
{
  constexpr int kThreads = 8;
  constexpr int kPerThread = 50;
  std::vector<std::vector<std::string>> ids(kThreads);
  std::vector<std::thread> threads;

  for (int t = 0; t < kThreads; t++) {
    threads.emplace_back([&, t]() {
      for (int i = 0; i < kPerThread; i++) {
        std::string id;
        if (handles.insert(std::make_shared<store::FileHandle>(), id) == 0)
          ids[t].push_back(id);
      }
    });
  }
  for (auto& th : threads) th.join();

  std::set<std::string> all;
  for (auto& v : ids) all.insert(v.begin(), v.end());
  EXPECT_EQ(all.size(), static_cast<size_t>(kThreads * kPerThread));
  EXPECT_EQ(handles.count(), static_cast<size_t>(kThreads * kPerThread));
}

}
