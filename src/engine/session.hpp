#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include "codec.hpp"
#include "config.hpp"
#include "layout.hpp"
#include "resource_gate.hpp"
#include "session_registry.hpp"

namespace tessera {

class SymbolStore;

// A configured, resource-bounded processing context. Every operation fails
// with errc::session_closed once close() has run; close() is idempotent and
// the destructor closes a session the caller forgot about.
class Session {
public:
    static std::shared_ptr<Session> open(SessionRegistry& registry, const SessionConfig& cfg,
                                         std::error_code& ec);
    static std::shared_ptr<Session> open_default(SessionRegistry& registry, std::error_code& ec);

    ~Session();
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // false when the session was already closed.
    bool close();
    bool is_open() const;
    uint64_t handle() const { return handle_; }
    const SessionConfig& config() const { return cfg_; }

    // 0 only when the session is closed; callers treat 0 as "use default".
    uint64_t recommended_block_size(uint64_t file_size) const;

    // block_size == 0 selects the recommended block size.
    std::error_code encode_file(const std::string& input_path, const std::string& output_dir,
                                uint64_t block_size, ProcessResult& result);
    std::error_code create_metadata(const std::string& input_path, const std::string& layout_file,
                                    uint64_t block_size, ProcessResult& result);
    std::error_code decode_symbols(const std::string& symbols_dir, const std::string& output_path,
                                   const std::string& layout_path);

    std::string last_error() const;
    ResourceGate::Stats resource_stats() const;

private:
    struct Context {
        explicit Context(const SessionConfig& c);
        CauchyCodec codec;
        ResourceGate gate;
    };

    Session(SessionRegistry& registry, uint64_t handle, const SessionConfig& cfg);

    std::shared_ptr<Context> context() const;
    std::error_code fail(std::error_code ec, const std::string& detail);
    std::error_code encode_blocks(const std::shared_ptr<Context>& ctx, const std::string& input_path,
                                  const SymbolStore* store, const std::string& layout_path,
                                  uint64_t block_size, ProcessResult& result);

    SessionRegistry& registry_;
    const uint64_t handle_;
    const SessionConfig cfg_;
    mutable std::mutex mtx_;
    std::shared_ptr<Context> ctx_;
    std::string last_error_;
};

} // namespace tessera
