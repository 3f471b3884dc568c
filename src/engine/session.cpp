#include "session.hpp"
#include "block_planner.hpp"
#include "block_processor.hpp"
#include "block_scheduler.hpp"
#include "decoder.hpp"
#include "digest.hpp"
#include "errors.hpp"
#include "file_io.hpp"
#include "logging.hpp"
#include "symbol_store.hpp"
#include <filesystem>

namespace tessera {

namespace fs = std::filesystem;

Session::Context::Context(const SessionConfig &c)
    : gate(c.concurrency_limit, c.memory_budget,
           std::chrono::milliseconds(c.acquire_timeout_ms)) {}

Session::Session(SessionRegistry &registry, uint64_t handle,
                 const SessionConfig &cfg)
    : registry_(registry), handle_(handle), cfg_(cfg),
      ctx_(std::make_shared<Context>(cfg)) {}

std::shared_ptr<Session> Session::open(SessionRegistry &registry,
                                       const SessionConfig &cfg,
                                       std::error_code &ec) {
  std::string why;
  if (!validate(cfg, why)) {
    Logger::instance().log(LogLevel::ERROR, "session open rejected: %s",
                           why.c_str());
    ec = errc::invalid_configuration;
    return nullptr;
  }
  if (!digest_init()) {
    Logger::instance().log(LogLevel::ERROR,
                           "session open rejected: libsodium unavailable");
    ec = errc::invalid_configuration;
    return nullptr;
  }
  uint64_t handle = registry.register_session();
  std::shared_ptr<Session> s(new Session(registry, handle, cfg));
  Logger::instance().log(LogLevel::INFO, "session %llu opened (%s)",
                         (unsigned long long)handle, describe(cfg).c_str());
  ec.clear();
  return s;
}

std::shared_ptr<Session> Session::open_default(SessionRegistry &registry,
                                               std::error_code &ec) {
  return open(registry, SessionConfig{}, ec);
}

Session::~Session() {
  if (close())
    Logger::instance().log(LogLevel::WARN,
                           "session %llu reclaimed without explicit close",
                           (unsigned long long)handle_);
}

bool Session::close() {
  std::shared_ptr<Context> released;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!ctx_)
      return false;
    released.swap(ctx_);
  }
  if (!registry_.unregister_session(handle_))
    Logger::instance().log(LogLevel::WARN, "session %llu was not registered",
                           (unsigned long long)handle_);
  Logger::instance().log(LogLevel::INFO, "session %llu closed",
                         (unsigned long long)handle_);
  return true;
}

bool Session::is_open() const { return context() != nullptr; }

std::shared_ptr<Session::Context> Session::context() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return ctx_;
}

std::error_code Session::fail(std::error_code ec, const std::string &detail) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    last_error_ = detail;
  }
  Logger::instance().log(LogLevel::ERROR, "session %llu: %s: %s",
                         (unsigned long long)handle_, ec.message().c_str(),
                         detail.c_str());
  return ec;
}

std::string Session::last_error() const {
  std::lock_guard<std::mutex> lk(mtx_);
  if (!ctx_)
    return "session closed";
  return last_error_;
}

ResourceGate::Stats Session::resource_stats() const {
  auto ctx = context();
  return ctx ? ctx->gate.stats() : ResourceGate::Stats{};
}

uint64_t Session::recommended_block_size(uint64_t file_size) const {
  auto ctx = context();
  if (!ctx)
    return 0;
  return recommend_block_size(cfg_, file_size, ctx->codec);
}

std::error_code Session::encode_file(const std::string &input_path,
                                     const std::string &output_dir,
                                     uint64_t block_size,
                                     ProcessResult &result) {
  auto ctx = context();
  if (!ctx)
    return fail(errc::session_closed, "session closed");
  if (input_path.empty() || output_dir.empty())
    return fail(errc::invalid_configuration,
                "input path and output directory cannot be empty");

  SymbolStore store(output_dir);
  const std::string layout_path =
      (fs::path(output_dir) / kLayoutFileName).string();
  std::error_code ec =
      encode_blocks(ctx, input_path, &store, layout_path, block_size, result);
  if (!ec)
    result.symbols_directory = output_dir;
  return ec;
}

std::error_code Session::create_metadata(const std::string &input_path,
                                         const std::string &layout_file,
                                         uint64_t block_size,
                                         ProcessResult &result) {
  auto ctx = context();
  if (!ctx)
    return fail(errc::session_closed, "session closed");
  if (input_path.empty() || layout_file.empty())
    return fail(errc::invalid_configuration,
                "input path and layout file cannot be empty");
  return encode_blocks(ctx, input_path, nullptr, layout_file, block_size,
                       result);
}

std::error_code Session::encode_blocks(const std::shared_ptr<Context> &ctx,
                                       const std::string &input_path,
                                       const SymbolStore *store,
                                       const std::string &layout_path,
                                       uint64_t block_size,
                                       ProcessResult &result) {
  result = ProcessResult{};
  std::string detail;
  uint64_t file_size = 0;
  std::error_code ec = input_file_size(input_path, file_size, detail);
  if (ec)
    return fail(ec, detail);

  const uint32_t max_symbols = ctx->codec.max_symbols();
  if (block_size == 0)
    block_size = recommend_block_size(cfg_, file_size, ctx->codec);
  ec = check_block_size(cfg_, block_size, max_symbols, detail);
  if (ec)
    return fail(ec, detail);

  if (store) {
    ec = store->prepare(detail);
    if (ec)
      return fail(ec, detail);
  }

  const std::vector<BlockSpan> spans = plan_blocks(file_size, block_size);
  Logger::instance().log(LogLevel::INFO,
                         "session %llu: %s %s (%llu bytes, %zu blocks of %llu)",
                         (unsigned long long)handle_,
                         store ? "encoding" : "planning", input_path.c_str(),
                         (unsigned long long)file_size, spans.size(),
                         (unsigned long long)block_size);

  std::vector<BlockRecord> records(spans.size());
  BlockProcessor processor(ctx->codec, cfg_, store);
  BlockScheduler sched(ctx->gate, cfg_.concurrency_limit);
  ec = sched.run(
      spans,
      [&](const BlockSpan &s) { return estimate_block_peak(cfg_, s.size); },
      [&](const BlockSpan &s, std::string &why) -> std::error_code {
        std::vector<uint8_t> bytes;
        std::error_code bec = read_range(input_path, s.offset, s.size, bytes, why);
        if (bec)
          return bec;
        return processor.process(bytes, s.block_id, s.offset,
                                 records[s.block_id], why);
      },
      detail);
  if (ec)
    return fail(ec, detail);

  // Published only after every block's symbols are on disk.
  ec = write_layout(layout_path, records, detail);
  if (ec)
    return fail(ec, detail);

  for (const auto &rec : records) {
    result.total_symbols_count += (uint32_t)rec.symbols.size();
    result.total_repair_symbols +=
        (uint32_t)rec.symbols.size() - rec.source_symbols_count;
  }
  result.blocks = std::move(records);
  result.layout_file_path = layout_path;
  Logger::instance().log(LogLevel::INFO,
                         "session %llu: %u symbols (%u repair), layout %s",
                         (unsigned long long)handle_,
                         result.total_symbols_count,
                         result.total_repair_symbols, layout_path.c_str());
  return {};
}

std::error_code Session::decode_symbols(const std::string &symbols_dir,
                                        const std::string &output_path,
                                        const std::string &layout_path) {
  auto ctx = context();
  if (!ctx)
    return fail(errc::session_closed, "session closed");
  if (symbols_dir.empty() || output_path.empty() || layout_path.empty())
    return fail(errc::invalid_configuration,
                "symbols directory, output path and layout path cannot be "
                "empty");

  std::string detail;
  std::error_code ec;
  if (!fs::is_directory(symbols_dir, ec))
    return fail(errc::not_found,
                "symbols directory " + symbols_dir + " not found");

  std::vector<BlockRecord> layout;
  ec = read_layout(layout_path, layout, detail);
  if (ec)
    return fail(ec, detail);

  Logger::instance().log(LogLevel::INFO,
                         "session %llu: decoding %zu blocks from %s into %s",
                         (unsigned long long)handle_, layout.size(),
                         symbols_dir.c_str(), output_path.c_str());
  SymbolStore store(symbols_dir);
  DecoderOrchestrator decoder(ctx->codec, ctx->gate, cfg_);
  ec = decoder.decode(store, output_path, layout, detail);
  if (ec)
    return fail(ec, detail);
  return {};
}

} // namespace tessera
