#include "http_transport.hpp"

#include <httplib.h>

#include <memory>
#include <string>
#include <utility>

namespace router {
namespace {

static std::unique_ptr<httplib::Client> MakeClient(const HttpEndpoint& ep, const HttpTimeouts& timeouts) {
  auto cli = std::make_unique<httplib::Client>(ep.scheme + "://" + ep.host + ":" + std::to_string(ep.port));
  cli->set_connection_timeout(timeouts.connect_seconds);
  cli->set_read_timeout(timeouts.read_seconds);
  cli->set_write_timeout(timeouts.write_seconds);
  return cli;
}

static httplib::Headers ToHeaders(const RequestHeaderList& headers) {
  httplib::Headers out;
  for (const auto& kv : headers) out.emplace(kv.first, kv.second);
  return out;
}

static std::optional<HttpReply> ToReply(const httplib::Result& res, const HttpEndpoint& ep, const std::string& path,
                                        std::string* err) {
  if (!res) {
    if (err) *err = ep.host + ":" + std::to_string(ep.port) + path + ": " + httplib::to_string(res.error());
    return std::nullopt;
  }
  HttpReply reply;
  reply.status = res->status;
  reply.body = res->body;
  return reply;
}

}  // namespace

std::string JoinPath(const std::string& base, const std::string& path) {
  if (base.empty()) return path;
  if (base.back() == '/' && !path.empty() && path.front() == '/') return base + path.substr(1);
  if (base.back() != '/' && !path.empty() && path.front() != '/') return base + "/" + path;
  return base + path;
}

std::optional<HttpReply> HttplibTransport::Get(const HttpEndpoint& ep,
                                               const std::string& path,
                                               const RequestHeaderList& headers,
                                               const HttpTimeouts& timeouts,
                                               std::string* err) {
  auto cli = MakeClient(ep, timeouts);
  if (!cli->is_valid()) {
    if (err) *err = ep.scheme + "://" + ep.host + ": client unavailable (is TLS support built in?)";
    return std::nullopt;
  }
  const auto full_path = JoinPath(ep.base_path, path);
  auto res = cli->Get(full_path, ToHeaders(headers));
  return ToReply(res, ep, full_path, err);
}

std::optional<HttpReply> HttplibTransport::Post(const HttpEndpoint& ep,
                                                const std::string& path,
                                                const std::string& body,
                                                const RequestHeaderList& headers,
                                                const HttpTimeouts& timeouts,
                                                std::string* err) {
  auto cli = MakeClient(ep, timeouts);
  if (!cli->is_valid()) {
    if (err) *err = ep.scheme + "://" + ep.host + ": client unavailable (is TLS support built in?)";
    return std::nullopt;
  }
  const auto full_path = JoinPath(ep.base_path, path);
  auto res = cli->Post(full_path, ToHeaders(headers), body, "application/json");
  return ToReply(res, ep, full_path, err);
}

}  // namespace router
