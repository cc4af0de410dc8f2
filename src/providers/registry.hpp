#pragma once

#include "aggregator_provider.hpp"
#include "config.hpp"
#include "http_transport.hpp"
#include "local_backend_provider.hpp"
#include "placeholder_provider.hpp"
#include "providers/provider.hpp"

#include <map>
#include <string>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

namespace router {

using ProviderBackend = std::variant<AggregatorProvider, LocalBackendProvider, PlaceholderProvider>;

// Built once at startup; the table is never mutated afterwards, so lookups
// need no lock. cfg and transport must outlive the registry.
class ProviderRegistry {
 public:
  ProviderRegistry(const RouterConfig& cfg, HttpTransport* transport, Sleeper sleeper) {
    for (const auto& [name, pc] : cfg.providers) {
      switch (pc.kind) {
        case ProviderKind::kAggregator:
          backends_.emplace(std::piecewise_construct, std::forward_as_tuple(name),
                            std::forward_as_tuple(std::in_place_type<AggregatorProvider>, pc, transport, sleeper));
          break;
        case ProviderKind::kLocal:
          backends_.emplace(std::piecewise_construct, std::forward_as_tuple(name),
                            std::forward_as_tuple(std::in_place_type<LocalBackendProvider>, pc, transport));
          break;
        case ProviderKind::kPlaceholder:
          backends_.emplace(std::piecewise_construct, std::forward_as_tuple(name),
                            std::forward_as_tuple(std::in_place_type<PlaceholderProvider>, pc));
          break;
      }
    }
  }

  ProviderBackend* Get(const std::string& name) {
    auto it = backends_.find(name);
    if (it == backends_.end()) return nullptr;
    return &it->second;
  }

  std::vector<LocalBackendProvider*> LocalBackends() {
    std::vector<LocalBackendProvider*> out;
    for (auto& [_, backend] : backends_) {
      if (auto* local = std::get_if<LocalBackendProvider>(&backend)) out.push_back(local);
    }
    return out;
  }

  std::vector<std::string> Names() const {
    std::vector<std::string> out;
    out.reserve(backends_.size());
    for (const auto& [name, _] : backends_) out.push_back(name);
    return out;
  }

 private:
  std::map<std::string, ProviderBackend> backends_;
};

}  // namespace router
