#pragma once

#include "config.hpp"
#include "http_transport.hpp"
#include "providers/provider.hpp"

#include <string>

namespace router {

// Remote OpenAI-compatible aggregator (OpenRouter). Retries transient
// failures up to kMaxAttempts with capped exponential backoff.
class AggregatorProvider {
 public:
  static constexpr int kMaxAttempts = 3;
  static constexpr int kMaxBackoffSeconds = 5;

  AggregatorProvider(const ProviderConfig& cfg, HttpTransport* transport, Sleeper sleeper);

  const std::string& Name() const { return cfg_.name; }
  const HttpEndpoint& Endpoint() const { return endpoint_; }

  UpstreamResponse Complete(const CompletionInput& in);

 private:
  RequestHeaderList Headers(const std::string& api_key) const;

  const ProviderConfig& cfg_;
  HttpEndpoint endpoint_;
  HttpTransport* transport_;
  Sleeper sleeper_;
};

}  // namespace router
