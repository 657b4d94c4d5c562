#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace taskforge {

namespace timing {
constexpr auto kHttpIoTimeout = std::chrono::seconds(30);
constexpr auto kWsCloseGrace = std::chrono::milliseconds(300);
constexpr auto kWsClosePoll = std::chrono::milliseconds(2);
} // namespace timing

namespace http_limits {
constexpr std::uint32_t kHeaderLimit = 64 * 1024;
constexpr std::uint64_t kBodyLimit = 16ULL * 1024ULL * 1024ULL;
constexpr std::size_t kWsMessageLimit = 1024 * 1024;
} // namespace http_limits

} // namespace taskforge
