#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace otelpipe::exporters {

// Parsed collector URL of a push target.
struct Endpoint {
  std::string scheme;  // http, https, grpc or grpcs
  std::string host;    // IPv6 literals keep their brackets
  uint16_t port = 0;
  bool tls = false;    // https and grpcs

  // "http://host:port" or "https://host:port", the form the OTLP gRPC
  // exporter options expect.
  std::string ToGrpcEndpoint() const;
};

// Throws std::invalid_argument if the URL has no scheme, an unsupported
// scheme, no host or no explicit port.
Endpoint ParseEndpoint(std::string_view url);

}  // namespace otelpipe::exporters
