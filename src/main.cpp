#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

#include "enc/build_key.hpp"
#include "ipc/frame.hpp"
#include "ipc/server.hpp"
#include "store/core.hpp"

static bool parse_uint(const char* s, unsigned long max, unsigned long& out) {
  if (!s || !*s) return false;
  char* end = nullptr;
  errno = 0;
  unsigned long v = std::strtoul(s, &end, 10);
  if (errno != 0 || *end != '\0' || v > max || s[0] == '-') return false;
  out = v;
  return true;
}

static void usage(const char* prog) {
  std::fprintf(stderr,
    "Usage: %s [--threads N] [--max-request BYTES]\n"
    "Serves open/read/close requests as length-prefixed frames on stdin/stdout.\n", prog);
}

int main(int argc, char* argv[]) {
  unsigned long threads = 4;
  unsigned long max_request = ipc::kMaxRequestBytes;

  int i = 1;
  while (i < argc) {
    const char* arg = argv[i];
    const char* val = nullptr;
    if (std::strncmp(arg, "--threads=", 10) == 0) {
      val = arg + 10;
      if (!parse_uint(val, 256, threads)) { usage(argv[0]); return 1; }
      ++i;
    } else if (std::strcmp(arg, "--threads") == 0 && i + 1 < argc) {
      if (!parse_uint(argv[i + 1], 256, threads)) { usage(argv[0]); return 1; }
      i += 2;
    } else if (std::strncmp(arg, "--max-request=", 14) == 0) {
      val = arg + 14;
      if (!parse_uint(val, 0xFFFFFFFFul, max_request) || max_request < ipc::REQUEST_HEAD) { usage(argv[0]); return 1; }
      ++i;
    } else if (std::strcmp(arg, "--max-request") == 0 && i + 1 < argc) {
      if (!parse_uint(argv[i + 1], 0xFFFFFFFFul, max_request) || max_request < ipc::REQUEST_HEAD) { usage(argv[0]); return 1; }
      i += 2;
    } else {
      usage(argv[0]);
      return 1;
    }
  }

  store::Ctx ctx;
  if (enc::load_build_key(ctx.key) != 0) return 1;

  std::ios::sync_with_stdio(false);
  std::cin.tie(nullptr);

  std::fprintf(stderr, "[IPC] serving on stdio, %lu worker(s)\n", threads);
  ipc::Server server(ctx, std::cin, std::cout, static_cast<unsigned>(threads),
                     static_cast<uint32_t>(max_request));
  int rc = server.run();
  std::fprintf(stderr, "[IPC] stopped (%s), %zu handle(s) left open\n",
               rc == 0 ? "end of input" : std::strerror(-rc), ctx.handles.count());
  return rc == 0 ? 0 : 1;
}
