#pragma once

#include "config.hpp"

#include <optional>
#include <string>

namespace router {

struct HttpTimeouts {
  int connect_seconds = 5;
  int read_seconds = 60;
  int write_seconds = 30;
};

struct HttpReply {
  int status = 0;
  std::string body;
};

// Returns std::nullopt (with *err set) when no HTTP response was received.
// Any status code, including 4xx/5xx, is returned as a reply.
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  virtual std::optional<HttpReply> Get(const HttpEndpoint& ep,
                                       const std::string& path,
                                       const RequestHeaderList& headers,
                                       const HttpTimeouts& timeouts,
                                       std::string* err) = 0;
  virtual std::optional<HttpReply> Post(const HttpEndpoint& ep,
                                        const std::string& path,
                                        const std::string& body,
                                        const RequestHeaderList& headers,
                                        const HttpTimeouts& timeouts,
                                        std::string* err) = 0;
};

class HttplibTransport : public HttpTransport {
 public:
  std::optional<HttpReply> Get(const HttpEndpoint& ep,
                               const std::string& path,
                               const RequestHeaderList& headers,
                               const HttpTimeouts& timeouts,
                               std::string* err) override;
  std::optional<HttpReply> Post(const HttpEndpoint& ep,
                                const std::string& path,
                                const std::string& body,
                                const RequestHeaderList& headers,
                                const HttpTimeouts& timeouts,
                                std::string* err) override;
};

std::string JoinPath(const std::string& base, const std::string& path);

}  // namespace router
