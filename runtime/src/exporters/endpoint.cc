#include "otelpipe/exporters/endpoint.h"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

namespace otelpipe::exporters {

std::string Endpoint::ToGrpcEndpoint() const {
  return fmt::format("{}://{}:{}", tls ? "https" : "http", host, port);
}

Endpoint ParseEndpoint(std::string_view url) {
  const auto fail = [&](std::string_view why) {
    return std::invalid_argument(fmt::format("invalid endpoint url '{}': {}", url, why));
  };

  const auto scheme_end = url.find("://");
  if (scheme_end == std::string_view::npos || scheme_end == 0) {
    throw fail("missing scheme");
  }

  Endpoint endpoint;
  endpoint.scheme = std::string(url.substr(0, scheme_end));
  std::transform(endpoint.scheme.begin(), endpoint.scheme.end(), endpoint.scheme.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (endpoint.scheme == "https" || endpoint.scheme == "grpcs") {
    endpoint.tls = true;
  } else if (endpoint.scheme != "http" && endpoint.scheme != "grpc") {
    throw fail("unsupported scheme");
  }

  std::string_view authority = url.substr(scheme_end + 3);
  authority = authority.substr(0, authority.find_first_of("/?#"));
  if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
    authority.remove_prefix(at + 1);
  }

  std::string_view host;
  std::string_view rest;
  if (!authority.empty() && authority.front() == '[') {
    const auto close = authority.find(']');
    if (close == std::string_view::npos) {
      throw fail("unterminated IPv6 literal");
    }
    host = authority.substr(0, close + 1);
    rest = authority.substr(close + 1);
  } else {
    const auto colon = authority.find(':');
    host = authority.substr(0, colon);
    rest = colon == std::string_view::npos ? std::string_view{} : authority.substr(colon);
  }

  if (host.empty() || host == "[]") {
    throw fail("missing host");
  }
  if (rest.size() < 2 || rest.front() != ':') {
    throw fail("missing port");
  }

  const std::string_view port_text = rest.substr(1);
  unsigned int port = 0;
  const auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
  if (ec != std::errc() || ptr != port_text.data() + port_text.size() || port == 0 || port > 65535) {
    throw fail("invalid port");
  }

  endpoint.host = std::string(host);
  endpoint.port = static_cast<uint16_t>(port);
  return endpoint;
}

}  // namespace otelpipe::exporters
