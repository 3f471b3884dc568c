#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <system_error>

namespace tessera {

// Admission control for block operations: at most `slots` concurrent
// leases and at most `budget` bytes of estimated peak memory.
class ResourceGate {
public:
    struct Stats {
        uint32_t in_flight{0};
        uint32_t peak_in_flight{0};
        uint64_t bytes_in_use{0};
        uint64_t peak_bytes{0};
        uint64_t admitted{0};
    };

    class Lease {
    public:
        Lease() = default;
        Lease(Lease&& o) noexcept : gate_(o.gate_), bytes_(o.bytes_) { o.gate_ = nullptr; }
        Lease& operator=(Lease&& o) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ~Lease() { release(); }
        void release();
        bool held() const { return gate_ != nullptr; }
    private:
        friend class ResourceGate;
        Lease(ResourceGate* g, uint64_t bytes) : gate_(g), bytes_(bytes) {}
        ResourceGate* gate_{nullptr};
        uint64_t bytes_{0};
    };

    ResourceGate(uint32_t slots, uint64_t budget, std::chrono::milliseconds timeout);

    std::error_code acquire(uint64_t bytes, Lease& lease, std::string& detail);
    Stats stats() const;
    uint32_t slots() const { return slots_; }
    uint64_t budget() const { return budget_; }

private:
    void release(uint64_t bytes);

    const uint32_t slots_;
    const uint64_t budget_;
    const std::chrono::milliseconds timeout_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    Stats stats_;
};

} // namespace tessera
