#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "otelpipe/stop_token.h"

namespace otelpipe::scrape {

struct HttpResponse {
  int status = 200;
  std::string content_type;
  std::string body;
};

// Produces the exposition document. May throw std::exception.
using Renderer = std::function<std::string()>;

// Maps one request head (request line plus headers) to a response:
//   GET /metrics[?query]  -> 200 exposition
//   any other path        -> 404
//   other method          -> 405
//   unparsable request    -> 400
//   renderer failure      -> 500
HttpResponse RouteRequest(std::string_view head, const Renderer& renderer);

// Serializes `response` with Content-Length and Connection: close.
std::string SerializeResponse(const HttpResponse& response);

// ------------------------------------------------------------
// ScrapeServer
// ------------------------------------------------------------
// Minimal HTTP/1.1 listener for Prometheus scrapes.
//
// - Binds 0.0.0.0:<port> in the constructor so that a busy port is a
//   setup error, not a runtime one. Port 0 picks an ephemeral port.
// - Serve() runs a poll() loop over the listener, the clients and a
//   wake pipe signalled by the stop token. One response per connection.
// - Responses are written without blocking as the client drains them, so
//   a client that stops reading holds only its own connection. A client
//   idle for five seconds is dropped.
// - The listening socket is closed when Serve() returns, so the port can
//   be bound again immediately.
//
class ScrapeServer {
 public:
  // Throws SetupError if the socket cannot be created or bound.
  ScrapeServer(uint16_t port, Renderer renderer);
  ~ScrapeServer();

  ScrapeServer(const ScrapeServer&) = delete;
  ScrapeServer& operator=(const ScrapeServer&) = delete;

  // Actual bound port.
  uint16_t port() const noexcept {
    return port_;
  }

  void Serve(const StopToken& stop);

 private:
  struct WakePipe;

  void CloseListener();

  int listen_fd_{-1};
  uint16_t port_{0};
  Renderer renderer_;
  std::shared_ptr<WakePipe> wake_;
};

}  // namespace otelpipe::scrape
