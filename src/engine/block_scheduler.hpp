#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <system_error>
#include <vector>
#include "block_planner.hpp"
#include "resource_gate.hpp"

namespace tessera {

// Fans block operations out to a bounded asio::thread_pool. Every operation
// holds a ResourceGate lease while it runs; the first failure stops blocks
// that have not started yet and is the one reported.
class BlockScheduler {
public:
    using CostFn = std::function<uint64_t(const BlockSpan&)>;
    using BlockTask = std::function<std::error_code(const BlockSpan&, std::string& detail)>;

    BlockScheduler(ResourceGate& gate, uint32_t workers) : gate_(gate), workers_(workers) {}

    std::error_code run(const std::vector<BlockSpan>& spans, const CostFn& cost,
                        const BlockTask& task, std::string& detail);

private:
    ResourceGate& gate_;
    uint32_t workers_;
};

} // namespace tessera
