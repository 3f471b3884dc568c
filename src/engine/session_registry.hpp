#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <unordered_set>

namespace tessera {

// Lifecycle accounting for open sessions. One instance is owned by the
// process (see main) and handed to Session::open; it must outlive every
// session registered with it.
class SessionRegistry {
public:
    SessionRegistry() = default;
    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    uint64_t register_session();
    bool unregister_session(uint64_t handle);
    bool contains(uint64_t handle) const;
    size_t active() const;

private:
    mutable std::mutex mtx_;
    uint64_t next_handle_{1};
    std::unordered_set<uint64_t> live_;
};

} // namespace tessera
