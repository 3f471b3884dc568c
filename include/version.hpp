#pragma once

namespace tessera {

constexpr const char* kVersion = "tessera 0.3.0";

} // namespace tessera
