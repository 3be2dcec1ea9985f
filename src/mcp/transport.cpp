#include "mcp/transport.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <istream>
#include <ostream>
#include <string>

namespace weather_mcp::mcp {

namespace {

bool is_blank(const std::string& line) {
  return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

StdioTransport::StdioTransport(TransportOptions options) : options_(options) {}

bool StdioTransport::stop_requested() const {
  return options_.stop_requested != nullptr && *options_.stop_requested != 0;
}

bool StdioTransport::write_line(std::ostream& out, std::ostream& err, const std::string& line) {
  out << line << '\n';
  out.flush();
  if (!out) {
    err << "[transport] output stream failed; stopping\n";
    return false;
  }
  ++stats_.responses_written;
  return true;
}

int StdioTransport::run(std::istream& in, std::ostream& out, std::ostream& err, const MessageHandler& handler) {
  int status = 0;
  std::string line;
  while (!stop_requested() && std::getline(in, line)) {
    ++stats_.lines_read;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (is_blank(line)) {
      ++stats_.lines_skipped;
      continue;
    }

    if (options_.verbose) {
      err << "[transport] <- " << line.size() << " bytes\n";
    }

    try {
      const auto response = handler.handle(line);
      if (!response.has_value() || response->empty()) {
        continue;
      }
      if (!write_line(out, err, *response)) {
        status = 1;
        break;
      }
      if (options_.verbose) {
        err << "[transport] -> " << response->size() << " bytes\n";
      }
    } catch (const std::exception& ex) {
      err << "[transport] handler failed: " << ex.what() << '\n';
      const auto envelope = make_error_response(
          nullptr, JsonRpcError{.code = ErrorCode::kInternalError, .message = std::string("Server error: ") + ex.what()});
      (void)write_line(out, err, envelope.dump(-1, ' ', false, json::error_handler_t::replace));
      status = 1;
      break;
    }
  }

  if (stop_requested()) {
    err << "[transport] shutdown requested; exiting cleanly\n";
  } else if (in.bad()) {
    err << "[transport] input stream failed\n";
    status = 1;
  }
  if (options_.verbose) {
    err << "[transport] lines_read=" << stats_.lines_read << " lines_skipped=" << stats_.lines_skipped
        << " responses_written=" << stats_.responses_written << '\n';
  }
  return status;
}

}  // namespace weather_mcp::mcp
