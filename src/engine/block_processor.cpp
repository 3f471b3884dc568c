#include "block_processor.hpp"
#include "digest.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace tessera {

std::error_code BlockProcessor::process(const std::vector<uint8_t> &bytes,
                                        uint64_t block_id, uint64_t offset,
                                        BlockRecord &out,
                                        std::string &detail) const {
  EncodedBlock enc;
  std::string why;
  std::error_code ec =
      codec_.encode(bytes.data(), bytes.size(), cfg_.symbol_size,
                    cfg_.redundancy_factor, enc, why);
  if (ec) {
    detail = "codec rejected block: " + why;
    return errc::encoding_failure;
  }

  BlockRecord rec;
  rec.block_id = block_id;
  rec.original_offset = offset;
  rec.size = bytes.size();
  rec.encoder_parameters = std::move(enc.parameters);
  rec.source_symbols_count = enc.source_symbols;
  rec.hash = content_digest(bytes);
  rec.symbols.reserve(enc.symbols.size());
  for (auto &sym : enc.symbols) {
    std::string id = content_digest(sym);
    if (store_) {
      ec = store_->put(id, sym, detail);
      if (ec)
        return ec;
    }
    rec.symbols.push_back(std::move(id));
    std::vector<uint8_t>().swap(sym);
  }

  Logger::instance().log(LogLevel::DEBUG,
                         "block %llu: %zu bytes at %llu -> %u source + %u repair",
                         (unsigned long long)block_id, bytes.size(),
                         (unsigned long long)offset, enc.source_symbols,
                         enc.repair_symbols);
  out = std::move(rec);
  return {};
}

} // namespace tessera
