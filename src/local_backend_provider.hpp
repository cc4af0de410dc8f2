#pragma once

#include "config.hpp"
#include "http_transport.hpp"
#include "providers/provider.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace router {

enum class DiscoveryFlavor { kLmStudio, kOllama };

// A model server on this machine (LM Studio or Ollama). Symbolic model names
// are resolved to whatever model the server currently has loaded.
class LocalBackendProvider {
 public:
  LocalBackendProvider(const ProviderConfig& cfg, HttpTransport* transport);

  const std::string& Name() const { return cfg_.name; }
  const HttpEndpoint& Endpoint() const { return endpoint_; }
  DiscoveryFlavor Flavor() const { return flavor_; }

  bool IsSymbolicModel(const std::string& model) const;
  std::optional<std::string> DiscoverLoadedModel(std::string* err);

  UpstreamResponse Complete(const CompletionInput& in);

  // Health probe: {status:"up", models:[...]}, {status:"error", http_status}
  // or {status:"down", error}.
  nlohmann::json Probe();

 private:
  const ProviderConfig& cfg_;
  HttpEndpoint endpoint_;
  DiscoveryFlavor flavor_;
  HttpTransport* transport_;
};

}  // namespace router
