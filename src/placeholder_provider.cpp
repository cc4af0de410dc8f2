#include "placeholder_provider.hpp"

namespace router {

UpstreamResponse PlaceholderProvider::Complete(const CompletionInput& in) {
  UpstreamResponse out;
  out.id = NewId("chatcmpl-placeholder");
  out.provider = cfg_.name;
  out.model = in.route->model;
  out.content = "[" + cfg_.name + " placeholder] provider '" + cfg_.name + "' is not connected; model=" +
                in.route->model + " tier=" + in.route->tier;
  out.prompt_tokens = in.context->tokens_after;
  out.completion_tokens = 0;
  return out;
}

}  // namespace router
