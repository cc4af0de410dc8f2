#pragma once

#include "chat_request.hpp"

#include <string>
#include <vector>

namespace router {

class TokenEstimator {
 public:
  virtual ~TokenEstimator() = default;
  virtual std::string Name() const = 0;
  virtual int Estimate(const std::vector<ChatMessage>& messages) const = 0;
};

// Newline-joined content length divided by a fixed ratio, never below 1.
class CharRatioTokenEstimator : public TokenEstimator {
 public:
  explicit CharRatioTokenEstimator(int chars_per_token = 4);

  std::string Name() const override;
  int Estimate(const std::vector<ChatMessage>& messages) const override;

 private:
  int chars_per_token_;
};

}  // namespace router
