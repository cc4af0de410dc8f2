#include "local_backend_provider.hpp"

#include "openai_chat.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>
#include <utility>

namespace router {
namespace {

static std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static DiscoveryFlavor FlavorFor(const ProviderConfig& cfg) {
  if (cfg.discovery == "ollama") return DiscoveryFlavor::kOllama;
  if (cfg.discovery == "lmstudio") return DiscoveryFlavor::kLmStudio;
  return ToLower(cfg.name) == "ollama" ? DiscoveryFlavor::kOllama : DiscoveryFlavor::kLmStudio;
}

static HttpEndpoint DefaultEndpoint(DiscoveryFlavor flavor) {
  HttpEndpoint ep;
  ep.host = "127.0.0.1";
  ep.port = flavor == DiscoveryFlavor::kOllama ? 11434 : 1234;
  return ep;
}

static std::string StringField(const nlohmann::json& j, const char* key) {
  if (!j.is_object() || !j.contains(key) || !j[key].is_string()) return {};
  return j[key].get<std::string>();
}

}  // namespace

LocalBackendProvider::LocalBackendProvider(const ProviderConfig& cfg, HttpTransport* transport)
    : cfg_(cfg), flavor_(FlavorFor(cfg)), transport_(transport) {
  endpoint_ = cfg.has_endpoint ? cfg.endpoint : DefaultEndpoint(flavor_);
}

bool LocalBackendProvider::IsSymbolicModel(const std::string& model) const {
  if (model.empty()) return true;
  const auto m = ToLower(model);
  return m == "auto" || m == "local" || m == ToLower(cfg_.name);
}

std::optional<std::string> LocalBackendProvider::DiscoverLoadedModel(std::string* err) {
  HttpTimeouts timeouts;
  timeouts.connect_seconds = 4;
  timeouts.read_seconds = 4;
  timeouts.write_seconds = 4;
  const std::string path = flavor_ == DiscoveryFlavor::kOllama ? "/api/ps" : "/api/v0/models";

  std::string http_err;
  auto reply = transport_->Get(endpoint_, path, {}, timeouts, &http_err);
  if (!reply) {
    if (err) *err = cfg_.name + ": model discovery failed: " + http_err;
    return std::nullopt;
  }
  if (reply->status < 200 || reply->status >= 300) {
    if (err) *err = cfg_.name + ": " + path + " http " + std::to_string(reply->status);
    return std::nullopt;
  }
  auto j = nlohmann::json::parse(reply->body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    if (err) *err = cfg_.name + ": invalid json from " + path;
    return std::nullopt;
  }

  if (flavor_ == DiscoveryFlavor::kOllama) {
    if (j.contains("models") && j["models"].is_array()) {
      for (const auto& m : j["models"]) {
        auto name = StringField(m, "name");
        if (name.empty()) name = StringField(m, "model");
        if (!name.empty()) return name;
      }
    }
  } else if (j.contains("data") && j["data"].is_array()) {
    for (const auto& m : j["data"]) {
      if (StringField(m, "state") != "loaded") continue;
      auto id = StringField(m, "id");
      if (!id.empty()) return id;
    }
  }
  if (err) *err = cfg_.name + ": no model loaded; load a model in " + (flavor_ == DiscoveryFlavor::kOllama ? "Ollama" : "LM Studio");
  return std::nullopt;
}

UpstreamResponse LocalBackendProvider::Complete(const CompletionInput& in) {
  std::string model = in.route->model;
  if (IsSymbolicModel(model)) {
    std::string err;
    auto loaded = DiscoverLoadedModel(&err);
    if (!loaded) throw ProviderError(err, 0, false);
    std::cout << "[local] provider=" << cfg_.name << " resolved model=" << *loaded << "\n";
    model = std::move(*loaded);
  }

  HttpTimeouts timeouts;
  timeouts.connect_seconds = 5;
  timeouts.read_seconds = cfg_.timeout_seconds;
  const auto payload = BuildChatPayload(model, *in.messages, *in.request).dump();

  std::string err;
  auto reply = transport_->Post(endpoint_, "/v1/chat/completions", payload, {}, timeouts, &err);
  if (!reply) throw ProviderError(cfg_.name + ": " + err, 0, true);
  if (reply->status < 200 || reply->status >= 300) {
    throw ProviderError(cfg_.name + ": /v1/chat/completions http " + std::to_string(reply->status), reply->status,
                        reply->status == 429 || reply->status >= 500, TruncateForLog(reply->body, 512));
  }
  auto parsed = ParseChatCompletion(reply->body, cfg_.name, model, in.context->tokens_after, &err);
  if (!parsed) throw ProviderError(err, reply->status, true, TruncateForLog(reply->body, 512));
  // Local servers never bill.
  parsed->cost_usd = 0.0;
  return std::move(*parsed);
}

nlohmann::json LocalBackendProvider::Probe() {
  HttpTimeouts timeouts;
  timeouts.connect_seconds = 3;
  timeouts.read_seconds = 3;
  timeouts.write_seconds = 3;
  const std::string path = flavor_ == DiscoveryFlavor::kOllama ? "/api/tags" : "/v1/models";

  nlohmann::json out;
  out["endpoint"] = EndpointUrl(endpoint_);
  std::string err;
  auto reply = transport_->Get(endpoint_, path, {}, timeouts, &err);
  if (!reply) {
    out["status"] = "down";
    out["error"] = TruncateForLog(err, 200);
    return out;
  }
  if (reply->status < 200 || reply->status >= 300) {
    out["status"] = "error";
    out["http_status"] = reply->status;
    return out;
  }

  nlohmann::json models = nlohmann::json::array();
  auto j = nlohmann::json::parse(reply->body, nullptr, false);
  const char* list_key = flavor_ == DiscoveryFlavor::kOllama ? "models" : "data";
  const char* name_key = flavor_ == DiscoveryFlavor::kOllama ? "name" : "id";
  if (!j.is_discarded() && j.is_object() && j.contains(list_key) && j[list_key].is_array()) {
    for (const auto& m : j[list_key]) {
      auto name = StringField(m, name_key);
      if (!name.empty()) models.push_back(name);
    }
  }
  out["status"] = "up";
  out["models"] = std::move(models);
  return out;
}

}  // namespace router
