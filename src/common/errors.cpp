#include "errors.hpp"

namespace tessera {

namespace {

class TesseraCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "tessera"; }
  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
    case errc::ok:
      return "success";
    case errc::invalid_configuration:
      return "invalid parameters";
    case errc::session_closed:
      return "session closed";
    case errc::not_found:
      return "file not found";
    case errc::io_failure:
      return "IO error";
    case errc::serialization_failure:
      return "serialization error";
    case errc::encoding_failure:
      return "encoding failed";
    case errc::decoding_failure:
      return "decoding failed";
    case errc::insufficient_symbols:
      return "insufficient symbols";
    case errc::integrity_violation:
      return "integrity violation";
    case errc::memory_budget_exceeded:
      return "memory limit exceeded";
    case errc::concurrency_limit_exceeded:
      return "concurrency limit reached";
    }
    return "unknown error";
  }
};

} // namespace

const std::error_category &tessera_category() noexcept {
  static TesseraCategory cat;
  return cat;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), tessera_category()};
}

bool is_retriable(const std::error_code &ec) noexcept {
  return ec == errc::memory_budget_exceeded ||
         ec == errc::concurrency_limit_exceeded;
}

} // namespace tessera
