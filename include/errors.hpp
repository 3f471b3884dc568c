#pragma once
#include <string>
#include <system_error>

namespace tessera {

enum class errc {
    ok = 0,
    invalid_configuration = 1,
    session_closed,
    not_found,
    io_failure,
    serialization_failure,
    encoding_failure,
    decoding_failure,
    insufficient_symbols,
    integrity_violation,
    memory_budget_exceeded,
    concurrency_limit_exceeded
};

const std::error_category& tessera_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

// Transient resource pressure; the caller may retry the whole operation.
bool is_retriable(const std::error_code& ec) noexcept;

} // namespace tessera

namespace std {
template <> struct is_error_code_enum<tessera::errc> : true_type {};
} // namespace std
