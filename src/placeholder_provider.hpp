#pragma once

#include "config.hpp"
#include "providers/provider.hpp"

#include <string>

namespace router {

// Stand-in for a provider whose client is not wired yet. Answers with a
// fixed notice so the routing and budget path can still be exercised.
class PlaceholderProvider {
 public:
  explicit PlaceholderProvider(const ProviderConfig& cfg) : cfg_(cfg) {}

  const std::string& Name() const { return cfg_.name; }

  UpstreamResponse Complete(const CompletionInput& in);

 private:
  const ProviderConfig& cfg_;
};

}  // namespace router
