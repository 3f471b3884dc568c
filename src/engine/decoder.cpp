#include "decoder.hpp"
#include "block_scheduler.hpp"
#include "digest.hpp"
#include "errors.hpp"
#include "file_io.hpp"
#include "logging.hpp"

namespace tessera {

uint64_t estimate_decode_peak(const BlockRecord &rec) {
  return 3 * rec.size + rec.symbols.size() * kPacketHeaderBytes;
}

std::error_code DecoderOrchestrator::decode_block(const SymbolStore &symbols,
                                                  const BlockRecord &rec,
                                                  std::vector<uint8_t> &out,
                                                  std::string &detail) const {
  const auto described = codec_.transfer_length(rec.encoder_parameters);
  if (!described || *described != rec.size) {
    detail = described ? "encoder parameters describe " +
                             std::to_string(*described) +
                             " bytes, layout records " + std::to_string(rec.size)
                       : std::string("malformed encoder parameters");
    return errc::decoding_failure;
  }
  const uint32_t required = codec_.required_symbols(rec.encoder_parameters);
  std::vector<std::vector<uint8_t>> gathered;
  gathered.reserve(required);
  size_t next = 0;
  size_t missing = 0;

  auto gather = [&](size_t want) {
    while (next < rec.symbols.size() && gathered.size() < want) {
      auto sym = symbols.get(rec.symbols[next++]);
      if (sym)
        gathered.push_back(std::move(*sym));
      else
        missing++;
    }
  };

  gather(required);
  if (gathered.size() < required) {
    detail = std::to_string(gathered.size()) + " of " +
             std::to_string(rec.symbols.size()) + " symbols available (" +
             std::to_string(missing) + " missing), need " +
             std::to_string(required);
    return errc::insufficient_symbols;
  }

  std::string why;
  std::error_code ec = codec_.decode(rec.encoder_parameters, gathered, out, why);
  if (ec == errc::insufficient_symbols && next < rec.symbols.size()) {
    // Some gathered packets were unusable to the codec; offer it the rest.
    gather(rec.symbols.size());
    ec = codec_.decode(rec.encoder_parameters, gathered, out, why);
  }
  if (ec) {
    detail = why;
    return ec == errc::insufficient_symbols ? ec
                                            : make_error_code(errc::decoding_failure);
  }

  if (out.size() != rec.size) {
    detail = "reconstructed " +
             std::to_string(out.size()) + " bytes, layout records " +
             std::to_string(rec.size);
    return errc::integrity_violation;
  }
  std::string hash = content_digest(out);
  if (hash != rec.hash) {
    detail = "hash " + hash +
             " does not match recorded " + rec.hash;
    return errc::integrity_violation;
  }
  Logger::instance().log(LogLevel::DEBUG,
                         "block %llu: decoded from %zu symbols (%zu missing)",
                         (unsigned long long)rec.block_id, gathered.size(),
                         missing);
  return {};
}

std::error_code DecoderOrchestrator::decode(const SymbolStore &symbols,
                                            const std::string &output_path,
                                            const std::vector<BlockRecord> &layout,
                                            std::string &detail) const {
  uint64_t total = 0;
  std::vector<BlockSpan> spans;
  spans.reserve(layout.size());
  for (size_t i = 0; i < layout.size(); i++) {
    spans.push_back(
        BlockSpan{i, layout[i].original_offset, layout[i].size});
    total += layout[i].size;
  }

  StagedOutput staged(output_path);
  std::error_code ec = staged.open(total, detail);
  if (ec)
    return ec;

  BlockScheduler sched(gate_, cfg_.concurrency_limit);
  ec = sched.run(
      spans,
      [&](const BlockSpan &s) { return estimate_decode_peak(layout[s.block_id]); },
      [&](const BlockSpan &s, std::string &why) -> std::error_code {
        const BlockRecord &rec = layout[s.block_id];
        std::vector<uint8_t> bytes;
        std::error_code bec = decode_block(symbols, rec, bytes, why);
        if (bec)
          return bec;
        return staged.write_at(rec.original_offset, bytes, why);
      },
      detail);
  if (ec)
    return ec;

  return staged.commit(detail);
}

} // namespace tessera
