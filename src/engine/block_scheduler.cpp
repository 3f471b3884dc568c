#include "block_scheduler.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>
#include <asio.hpp>
#include <atomic>
#include <mutex>
#include <new>

namespace tessera {

std::error_code BlockScheduler::run(const std::vector<BlockSpan> &spans,
                                    const CostFn &cost, const BlockTask &task,
                                    std::string &detail) {
  if (spans.empty())
    return {};
  std::atomic<bool> failed{false};
  std::mutex err_mtx;
  std::error_code first_ec;
  std::string first_detail;

  auto record = [&](const BlockSpan &span, std::error_code ec,
                    const std::string &why) {
    std::lock_guard<std::mutex> lk(err_mtx);
    if (!first_ec) {
      first_ec = ec;
      first_detail = "block " + std::to_string(span.block_id) + ": " + why;
    }
    failed = true;
  };

  size_t threads = std::min<size_t>(std::max<uint32_t>(workers_, 1), spans.size());
  asio::thread_pool pool(threads);
  for (const auto &span : spans) {
    asio::post(pool, [&, span]() {
      if (failed)
        return;
      std::string why;
      try {
        ResourceGate::Lease lease;
        std::error_code ec = gate_.acquire(cost(span), lease, why);
        if (!ec && !failed)
          ec = task(span, why);
        if (ec)
          record(span, ec, why);
      } catch (const std::bad_alloc &) {
        record(span, errc::memory_budget_exceeded, "allocation failed");
      } catch (const std::exception &e) {
        record(span, errc::io_failure, e.what());
      }
    });
  }
  pool.join();

  if (first_ec) {
    detail = first_detail;
    Logger::instance().log(LogLevel::ERROR, "%s (%s)", first_detail.c_str(),
                           first_ec.message().c_str());
  }
  return first_ec;
}

} // namespace tessera
