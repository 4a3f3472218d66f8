#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>
#include <new>
#include <utility>

#include "ipc/server.hpp"
#include "store/io.hpp"

namespace ipc {

static Response fail(const Request& req, Status st, int rc, std::string msg){
  Response r;
  r.seq = req.seq;
  r.op = req.op;
  r.status = st;
  r.err = -rc;
  r.text = std::move(msg);
  return r;
}

static Response run_request(store::Ctx& ctx, const Request& req){
  Response r;
  r.seq = req.seq;
  r.op = req.op;

  switch (req.op){
    case Op::open: {
      int rc = store::open_file(ctx, req.target, r.text, r.size);
      if (rc != 0)
        return fail(req, classify(req.op, rc), rc,
                    "Failed to open " + req.target + ": " + strerror(-rc));
      return r;
    }

    case Op::read: {
      if (req.length > MAX_READ_LEN)
        return fail(req, Status::read_error, -EMSGSIZE,
                    "Read of " + std::to_string(req.length) + " bytes exceeds the frame limit");

      int rc = store::read_bytes(ctx, req.target, req.offset, req.length, r.data);
      if (rc == 0) return r;

      Status st = classify(req.op, rc);
      std::string msg;
      switch (st){
        case Status::invalid_handle:
          msg = "Invalid file handle: " + req.target;
          break;
        case Status::seek_error:
          msg = "Failed to seek to " + std::to_string(req.offset) + ": " + strerror(-rc);
          break;
        default:
          msg = "Failed to read " + std::to_string(req.length) + " bytes at " +
                std::to_string(req.offset) + ": " +
                (rc == -ENODATA ? std::string("unexpected end of file") : std::string(strerror(-rc)));
          break;
      }
      return fail(req, st, rc, std::move(msg));
    }

    case Op::close:
      store::close_file(ctx, req.target);
      return r;
  }
  return fail(req, Status::bad_request, -EINVAL, "unknown operation");
}

Response handle(store::Ctx& ctx, const Request& req){
  try {
    return run_request(ctx, req);
  } catch (const std::bad_alloc&) {
    // no message text: building one could fail the same way
    Response r;
    r.seq = req.seq;
    r.op = req.op;
    r.status = classify(req.op, -ENOMEM);
    r.err = r.status == Status::ok ? 0 : ENOMEM;
    return r;
  }
}

Server::Server(store::Ctx& ctx, std::istream& in, std::ostream& out,
               unsigned threads, uint32_t max_request)
    : ctx_(ctx), in_(in), out_(out), threadCount_(threads), maxRequest_(max_request) {}

Server::~Server(){
  stopWorkers();
}

int Server::run(){
  for (unsigned i = 0; i < threadCount_; i++)
    workers_.emplace_back(&Server::workerLoop, this);

  int rc = 0;
  std::vector<uint8_t> frame;
  std::string err;
  for (;;){
    if (outFailed_.load()){
      rc = -EIO;
      break;
    }
    if (!read_frame(in_, frame, err, maxRequest_)){
      if (!err.empty()){
        fprintf(stderr, "[IPC] %s\n", err.c_str());
        rc = -EPROTO;
      }
      break;
    }

    Request req;
    if (decode_request(frame.data(), frame.size(), req) != 0){
      fprintf(stderr, "[IPC] malformed request seq=%u (%zu bytes)\n", req.seq, frame.size());
      reply(fail(req, Status::bad_request, -EBADMSG, "malformed request"));
      continue;
    }
    dispatch(std::move(req));
  }

  stopWorkers();
  if (rc == 0 && outFailed_.load()) rc = -EIO;
  return rc;
}

void Server::dispatch(Request&& req){
  if (workers_.empty()){
    serve(req);
    return;
  }
  {
    std::lock_guard<std::mutex> lock(queueMutex_);
    queue_.push(std::move(req));
  }
  queueCV_.notify_one();
}

void Server::workerLoop(){
  for (;;){
    Request req;
    {
      std::unique_lock<std::mutex> lock(queueMutex_);
      queueCV_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) return; // stopping and drained
      req = std::move(queue_.front());
      queue_.pop();
    }
    serve(req);
  }
}

void Server::serve(const Request& req){
  try {
    reply(handle(ctx_, req));
  } catch (const std::bad_alloc&) {
    fprintf(stderr, "[IPC] reply seq=%u: out of memory\n", req.seq);
    Response r;
    r.seq = req.seq;
    r.op = req.op;
    r.status = classify(req.op, -ENOMEM);
    r.err = r.status == Status::ok ? 0 : ENOMEM;
    try {
      reply(r);
    } catch (const std::bad_alloc&) {
      outFailed_.store(true);
    }
  }
}

void Server::reply(const Response& resp){
  if (resp.status != Status::ok)
    fprintf(stderr, "[IPC] seq=%u %s errno=%d %s\n", resp.seq, status_name(resp.status),
            resp.err, resp.text.c_str());

  std::vector<uint8_t> head;
  encode_response_head(resp, head);

  const bool with_data = resp.status == Status::ok && resp.op == Op::read;
  std::string err;
  std::lock_guard<std::mutex> lock(outMutex_);
  if (outFailed_.load()) return;
  if (!write_frame(out_, head.data(), head.size(),
                   with_data ? resp.data.data() : nullptr,
                   with_data ? resp.data.size() : 0, err)){
    fprintf(stderr, "[IPC] reply seq=%u: %s\n", resp.seq, err.c_str());
    outFailed_.store(true);
  }
}

void Server::stopWorkers(){
  {
    std::lock_guard<std::mutex> lock(queueMutex_);
    stopping_ = true;
  }
  queueCV_.notify_all();
  for (auto& t : workers_)
    if (t.joinable()) t.join();
  workers_.clear();
  std::lock_guard<std::mutex> lock(queueMutex_);
  stopping_ = false;
}

} // namespace ipc
