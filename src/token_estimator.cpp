#include "token_estimator.hpp"

#include <algorithm>

namespace router {

CharRatioTokenEstimator::CharRatioTokenEstimator(int chars_per_token)
    : chars_per_token_(chars_per_token > 0 ? chars_per_token : 4) {}

std::string CharRatioTokenEstimator::Name() const {
  return "chars/" + std::to_string(chars_per_token_);
}

int CharRatioTokenEstimator::Estimate(const std::vector<ChatMessage>& messages) const {
  size_t chars = 0;
  for (const auto& m : messages) chars += m.content.size();
  if (messages.size() > 1) chars += messages.size() - 1;
  return std::max(1, static_cast<int>(chars / static_cast<size_t>(chars_per_token_)));
}

}  // namespace router
