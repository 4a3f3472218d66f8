#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <istream>
#include <mutex>
#include <ostream>
#include <queue>
#include <thread>
#include <vector>

#include "ipc/proto.hpp"
#include "store/core.hpp"

namespace ipc {

// Executes one request against ctx. Allocation failure becomes an ENOMEM
// response with an empty message.
Response handle(store::Ctx& ctx, const Request& req);

/**
 * Request/response loop over a pair of byte streams.
 *
 * The calling thread decodes frames; a fixed pool of workers runs them and
 * writes responses as they complete, so responses for different requests
 * may arrive out of order (match them by seq). With zero workers every
 * request is handled inline, in order.
 */
class Server {
public:
  Server(store::Ctx& ctx, std::istream& in, std::ostream& out,
         unsigned threads = 4, uint32_t max_request = kMaxRequestBytes);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Returns 0 at end of input, -EPROTO on a framing error, -EIO when the
  // output stream fails. Pending requests are finished before returning.
  int run();

private:
  void workerLoop();
  void dispatch(Request&& req);
  void serve(const Request& req);
  void reply(const Response& resp);
  void stopWorkers();

  store::Ctx& ctx_;
  std::istream& in_;
  std::ostream& out_;
  unsigned threadCount_;
  uint32_t maxRequest_;

  std::vector<std::thread> workers_;
  std::mutex queueMutex_;
  std::condition_variable queueCV_;
  std::queue<Request> queue_;
  bool stopping_ = false;

  std::mutex outMutex_;
  std::atomic<bool> outFailed_{false};
};

} // namespace ipc
