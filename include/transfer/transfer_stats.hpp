#ifndef JSXFER_TRANSFER_STATS_HPP
#define JSXFER_TRANSFER_STATS_HPP

#include <chrono>
#include <cstdint>
#include <string>

namespace jsxfer {
namespace transfer {

// Process-local summary of one finished transfer
struct TransferStats {
  std::string stream;
  std::uint64_t bytes{0};
  std::uint64_t chunks{0};
  std::uint64_t resubscriptions{0};
  std::chrono::steady_clock::duration elapsed{};
};

} // namespace transfer
} // namespace jsxfer

#endif // JSXFER_TRANSFER_STATS_HPP
