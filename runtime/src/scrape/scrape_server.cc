#include "otelpipe/scrape/scrape_server.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <fmt/format.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>
#include <utility>
#include <vector>

#include "otelpipe/metrics/exposition.h"
#include "otelpipe/observability/logging.h"
#include "otelpipe/setup_error.h"

namespace otelpipe::scrape {

namespace {

constexpr int kMaxClients = 64;
constexpr std::size_t kMaxRequestBytes = 8 * 1024;
constexpr auto kClientTimeout = std::chrono::seconds(5);
constexpr int kPollIntervalMs = 250;

// One connection: reading its request head, then writing its response.
struct Client {
  int fd{-1};
  std::string buf;
  std::string out;
  std::size_t sent{0};
  std::chrono::steady_clock::time_point last_progress;

  bool writing() const noexcept {
    return !out.empty();
  }
};

bool SetNonBlocking(int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0)
    return false;
  return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

void CloseClient(Client& c) {
  if (c.fd >= 0)
    ::close(c.fd);
  c.fd = -1;
  c.buf.clear();
  c.out.clear();
  c.sent = 0;
}

std::string_view ReasonPhrase(int status) {
  switch (status) {
    case 200:
      return "OK";
    case 400:
      return "Bad Request";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 500:
      return "Internal Server Error";
  }
  return "Unknown";
}

HttpResponse PlainText(int status, std::string body) {
  return HttpResponse{status, "text/plain; charset=utf-8", std::move(body)};
}

enum class SendState { kDone, kPending, kFailed };

// Sends as much of the pending response as the socket takes without
// blocking; the poll loop resumes on POLLOUT.
SendState SendPending(Client& c) {
  while (c.sent < c.out.size()) {
    const ssize_t n = ::send(c.fd, c.out.data() + c.sent, c.out.size() - c.sent, MSG_NOSIGNAL);
    if (n > 0) {
      c.sent += static_cast<std::size_t>(n);
      c.last_progress = std::chrono::steady_clock::now();
      continue;
    }
    if (n < 0 && errno == EINTR)
      continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
      return SendState::kPending;
    return SendState::kFailed;
  }
  return SendState::kDone;
}

// Queues `response` and sends what fits now. Closes the client once it
// is fully sent or the peer is gone.
void Respond(Client& c, const HttpResponse& response) {
  c.out = SerializeResponse(response);
  c.sent = 0;
  c.buf.clear();
  if (SendPending(c) != SendState::kPending) {
    CloseClient(c);
  }
}

// End of the request head, or npos if not complete yet.
std::size_t FindHeadEnd(const std::string& buf) {
  const auto crlf = buf.find("\r\n\r\n");
  if (crlf != std::string::npos)
    return crlf;
  return buf.find("\n\n");
}

}  // namespace

// ------------------------------------------------------------
// Routing
// ------------------------------------------------------------

HttpResponse RouteRequest(std::string_view head, const Renderer& renderer) {
  const std::string_view request_line = head.substr(0, head.find_first_of("\r\n"));

  const auto sp1 = request_line.find(' ');
  const auto sp2 = sp1 == std::string_view::npos ? sp1 : request_line.find(' ', sp1 + 1);
  if (sp1 == std::string_view::npos || sp2 == std::string_view::npos || sp1 == 0 ||
      sp2 == sp1 + 1) {
    return PlainText(400, "malformed request line\n");
  }

  const std::string_view method = request_line.substr(0, sp1);
  const std::string_view target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
  const std::string_view version = request_line.substr(sp2 + 1);
  if (!version.starts_with("HTTP/") || target.front() != '/') {
    return PlainText(400, "malformed request line\n");
  }

  const std::string_view path = target.substr(0, target.find('?'));
  if (path != "/metrics") {
    return PlainText(404, "not found\n");
  }
  if (method != "GET") {
    return PlainText(405, "method not allowed\n");
  }

  try {
    return HttpResponse{200, metrics::kExpositionContentType, renderer()};
  } catch (const std::exception& e) {
    OP_LOG_ERROR_FMT("rendering scrape response failed: {}", e.what());
    return PlainText(500, fmt::format("{}\n", e.what()));
  }
}

std::string SerializeResponse(const HttpResponse& response) {
  std::string out = fmt::format(
      "HTTP/1.1 {} {}\r\n"
      "Content-Type: {}\r\n"
      "Content-Length: {}\r\n",
      response.status, ReasonPhrase(response.status), response.content_type,
      response.body.size());
  if (response.status == 405) {
    out += "Allow: GET\r\n";
  }
  out += "Connection: close\r\n\r\n";
  out += response.body;
  return out;
}

// ------------------------------------------------------------
// ScrapeServer
// ------------------------------------------------------------

struct ScrapeServer::WakePipe {
  int read_fd{-1};
  int write_fd{-1};

  ~WakePipe() {
    if (read_fd >= 0)
      ::close(read_fd);
    if (write_fd >= 0)
      ::close(write_fd);
  }

  void Notify() const {
    const char byte = 1;
    // A full pipe already guarantees a pending wakeup.
    (void)::write(write_fd, &byte, 1);
  }
};

ScrapeServer::ScrapeServer(uint16_t port, Renderer renderer)
    : renderer_(std::move(renderer)), wake_(std::make_shared<WakePipe>()) {
  int fds[2];
  if (::pipe2(fds, O_NONBLOCK | O_CLOEXEC) != 0) {
    throw SetupError(fmt::format("scrape endpoint: pipe2() failed: {}", std::strerror(errno)));
  }
  wake_->read_fd = fds[0];
  wake_->write_fd = fds[1];

  listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (listen_fd_ < 0) {
    throw SetupError(fmt::format("scrape endpoint: socket() failed: {}", std::strerror(errno)));
  }

  int yes = 1;
  (void)::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_ANY);

  if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    const int err = errno;
    CloseListener();
    throw SetupError(
        fmt::format("scrape endpoint: cannot bind port {}: {}", port, std::strerror(err)));
  }

  if (::listen(listen_fd_, 16) != 0 || !SetNonBlocking(listen_fd_)) {
    const int err = errno;
    CloseListener();
    throw SetupError(fmt::format("scrape endpoint: listen() failed: {}", std::strerror(err)));
  }

  sockaddr_in bound{};
  socklen_t len = sizeof(bound);
  if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound), &len) != 0) {
    const int err = errno;
    CloseListener();
    throw SetupError(fmt::format("scrape endpoint: getsockname() failed: {}", std::strerror(err)));
  }
  port_ = ntohs(bound.sin_port);
}

ScrapeServer::~ScrapeServer() {
  CloseListener();
}

void ScrapeServer::CloseListener() {
  if (listen_fd_ >= 0) {
    ::close(listen_fd_);
    listen_fd_ = -1;
  }
}

void ScrapeServer::Serve(const StopToken& stop) {
  if (listen_fd_ < 0) {
    return;
  }

  auto wake = wake_;
  StopCallback on_stop(stop, [wake] { wake->Notify(); });

  OP_LOG_INFO_FMT("serving metrics on 0.0.0.0:{}/metrics", port_);

  std::array<Client, kMaxClients> clients{};

  // [0] wake pipe, [1] listener, [2..] clients
  while (!stop.stop_requested()) {
    std::array<pollfd, kMaxClients + 2> pfds{};
    pfds[0] = pollfd{wake_->read_fd, POLLIN, 0};
    pfds[1] = pollfd{listen_fd_, POLLIN, 0};
    for (int i = 0; i < kMaxClients; ++i) {
      const Client& c = clients[i];
      pfds[i + 2].fd = c.fd;
      pfds[i + 2].events = c.fd < 0 ? 0 : (c.writing() ? POLLOUT : POLLIN);
    }

    const int rc = ::poll(pfds.data(), pfds.size(), kPollIntervalMs);
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      OP_LOG_ERROR_FMT("scrape endpoint: poll() failed: {}", std::strerror(errno));
      stop.wait_for(std::chrono::milliseconds(kPollIntervalMs));
      continue;
    }

    if (pfds[0].revents & POLLIN) {
      break;
    }

    if (pfds[1].revents & POLLIN) {
      while (true) {
        const int cfd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (cfd < 0)
          break;

        bool placed = false;
        for (auto& c : clients) {
          if (c.fd < 0) {
            c.fd = cfd;
            c.last_progress = std::chrono::steady_clock::now();
            placed = true;
            break;
          }
        }
        if (!placed) {
          OP_LOG_WARN_FMT("scrape endpoint: too many connections, rejecting client");
          ::close(cfd);
        }
      }
    }

    for (int i = 0; i < kMaxClients; ++i) {
      Client& c = clients[i];
      const pollfd& p = pfds[i + 2];
      if (c.fd < 0 || p.fd != c.fd)
        continue;

      if (c.writing() && (p.revents & POLLOUT)) {
        if (SendPending(c) != SendState::kPending) {
          CloseClient(c);
        }
        continue;
      }

      if (!c.writing() && (p.revents & POLLIN)) {
        std::array<char, 1024> chunk;
        bool eof = false;
        while (c.buf.size() <= kMaxRequestBytes) {
          const ssize_t n = ::read(c.fd, chunk.data(), chunk.size());
          if (n < 0 && errno == EINTR)
            continue;
          if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
            break;
          if (n <= 0) {
            eof = true;
            break;
          }
          c.buf.append(chunk.data(), static_cast<std::size_t>(n));
          c.last_progress = std::chrono::steady_clock::now();
        }

        const auto head_end = FindHeadEnd(c.buf);
        if (head_end != std::string::npos) {
          Respond(c, RouteRequest(std::string_view(c.buf).substr(0, head_end), renderer_));
          continue;
        }
        if (eof) {
          CloseClient(c);
          continue;
        }
        if (c.buf.size() > kMaxRequestBytes) {
          Respond(c, PlainText(400, "request too large\n"));
          continue;
        }
      } else if (p.revents & (POLLHUP | POLLERR | POLLNVAL)) {
        CloseClient(c);
        continue;
      }
    }

    // A client that makes no progress for kClientTimeout is dropped,
    // whether it is slow to send its request or to read the response.
    const auto now = std::chrono::steady_clock::now();
    for (auto& c : clients) {
      if (c.fd >= 0 && now - c.last_progress > kClientTimeout) {
        if (c.writing()) {
          OP_LOG_DEBUG_FMT("scrape endpoint: dropping a client that stopped reading");
        }
        CloseClient(c);
      }
    }
  }

  for (auto& c : clients) {
    CloseClient(c);
  }
  CloseListener();

  OP_LOG_DEBUG_FMT("scrape endpoint on port {} closed", port_);
}

}  // namespace otelpipe::scrape
