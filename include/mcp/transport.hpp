#pragma once

#include <csignal>
#include <cstdint>
#include <iosfwd>

#include "mcp/server.hpp"

namespace weather_mcp::mcp {

struct TransportOptions {
  bool verbose{false};
  // Set asynchronously by a signal handler; checked after every read.
  const volatile std::sig_atomic_t* stop_requested{nullptr};
};

struct TransportStats {
  std::uint64_t lines_read{0};
  std::uint64_t lines_skipped{0};
  std::uint64_t responses_written{0};
};

// Newline-delimited message loop over a pair of streams. Returns 0 on end of
// input or interrupt, 1 when the output breaks or the handler throws.
class StdioTransport {
 public:
  explicit StdioTransport(TransportOptions options = {});

  int run(std::istream& in, std::ostream& out, std::ostream& err, const MessageHandler& handler);

  const TransportStats& stats() const { return stats_; }

 private:
  bool stop_requested() const;
  bool write_line(std::ostream& out, std::ostream& err, const std::string& line);

  TransportOptions options_;
  TransportStats stats_{};
};

}  // namespace weather_mcp::mcp
