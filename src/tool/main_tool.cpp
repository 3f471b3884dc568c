#include "errors.hpp"
#include "layout.hpp"
#include "logging.hpp"
#include "session.hpp"
#include "util.hpp"
#include "version.hpp"
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <vector>

using namespace tessera;

static void usage() {
  std::cerr
      << "usage: tessera [options] encode <input> <output-dir>\n"
         "       tessera [options] metadata <input> <layout-file>\n"
         "       tessera [options] decode <symbols-dir> <output> <layout-file>\n"
         "       tessera [options] plan <file-size>\n"
         "       tessera version\n"
         "options: --symbol-size N --redundancy N --memory SIZE\n"
         "         --concurrency N --block-size SIZE --log-level LEVEL\n";
}

static int report(const std::shared_ptr<Session> &s, std::error_code ec) {
  std::cerr << ec.message() << ": " << s->last_error() << std::endl;
  return is_retriable(ec) ? 75 : 1;
}

int main(int argc, char **argv) {
  if (const char *lvl = std::getenv("TESSERA_LOG_LEVEL"))
    Logger::instance().set_level_by_name(lvl);

  SessionConfig cfg;
  uint64_t block_size = 0;
  std::vector<std::string> args;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(2);
    };
    auto number = [&](const std::string &v, uint64_t max) -> uint64_t {
      uint64_t n = 0;
      if (!parse_size(v, n) || n > max) {
        std::cerr << "bad value for " << a << ": " << v << "\n";
        std::exit(2);
      }
      return n;
    };
    if (a == "--symbol-size")
      cfg.symbol_size = (uint16_t)number(next(i), 65535);
    else if (a == "--redundancy")
      cfg.redundancy_factor = (uint8_t)number(next(i), 255);
    else if (a == "--memory")
      cfg.memory_budget = number(next(i), UINT64_MAX);
    else if (a == "--concurrency")
      cfg.concurrency_limit = (uint32_t)number(next(i), 4096);
    else if (a == "--block-size")
      block_size = number(next(i), UINT64_MAX);
    else if (a == "--log-level")
      Logger::instance().set_level_by_name(next(i).c_str());
    else if (a == "-h" || a == "--help") {
      usage();
      return 0;
    } else
      args.push_back(a);
  }

  if (args.empty()) {
    usage();
    return 2;
  }
  const std::string cmd = args[0];
  if (cmd == "version") {
    std::cout << kVersion << std::endl;
    return 0;
  }

  SessionRegistry registry;
  std::error_code ec;
  auto session = Session::open(registry, cfg, ec);
  if (!session) {
    std::cerr << "cannot open session: " << ec.message() << std::endl;
    return 2;
  }

  int rc = 0;
  if (cmd == "encode" && args.size() == 3) {
    ProcessResult result;
    ec = session->encode_file(args[1], args[2], block_size, result);
    if (ec)
      rc = report(session, ec);
    else
      std::cout << result_to_json(result) << std::endl;
  } else if (cmd == "metadata" && args.size() == 3) {
    ProcessResult result;
    ec = session->create_metadata(args[1], args[2], block_size, result);
    if (ec)
      rc = report(session, ec);
    else
      std::cout << result_to_json(result) << std::endl;
  } else if (cmd == "decode" && args.size() == 4) {
    ec = session->decode_symbols(args[1], args[2], args[3]);
    if (ec)
      rc = report(session, ec);
  } else if (cmd == "plan" && args.size() == 2) {
    uint64_t size = 0;
    if (!parse_size(args[1], size)) {
      std::cerr << "bad file size: " << args[1] << "\n";
      rc = 2;
    } else {
      std::cout << session->recommended_block_size(size) << std::endl;
    }
  } else {
    usage();
    rc = 2;
  }

  if (!session->close())
    Logger::instance().log(LogLevel::WARN, "session already closed");
  return rc;
}
