#pragma once

#include "config.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace router {

class BudgetManager;

struct ProviderBudgetSnapshot {
  bool enabled = false;
  double daily_cost_estimate = 0.0;
  double monthly_cost_estimate = 0.0;
  double pending_estimate = 0.0;
  int64_t daily_calls = 0;
  double daily_cap = 0.0;
  double monthly_cap = 0.0;
};

// Spend admitted against one provider but not yet recorded. Commit() records
// exactly the admitted estimate; a hold that goes out of scope uncommitted
// gives its reservation back.
class BudgetHold {
 public:
  BudgetHold() = default;
  ~BudgetHold();
  BudgetHold(BudgetHold&& other) noexcept;
  BudgetHold& operator=(BudgetHold&& other) noexcept;
  BudgetHold(const BudgetHold&) = delete;
  BudgetHold& operator=(const BudgetHold&) = delete;

  void Commit();
  bool active() const { return owner_ != nullptr; }
  bool committed() const { return committed_; }
  const std::string& provider() const { return provider_; }
  const std::string& model() const { return model_; }
  double estimate_usd() const { return estimate_usd_; }

 private:
  friend class BudgetManager;
  BudgetHold(BudgetManager* owner, std::string provider, std::string model, double estimate_usd);
  void Release();

  BudgetManager* owner_ = nullptr;
  std::string provider_;
  std::string model_;
  double estimate_usd_ = 0.0;
  bool committed_ = false;
};

class BudgetManager {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  explicit BudgetManager(const RouterConfig& cfg, Clock clock = {});

  bool ProviderEnabled(const std::string& provider) const;
  double CostPer1k(const std::string& provider, const std::string& model) const;
  double EstimateCost(const std::string& provider, const std::string& model, int prompt_tokens, int completion_tokens) const;

  bool CanSpend(const std::string& provider, const std::string& model, int prompt_tokens, int completion_tokens) const;
  void RecordSpend(const std::string& provider, const std::string& model, int prompt_tokens, int completion_tokens);

  // Check and reserve under the provider's lock, so concurrent admissions
  // cannot jointly exceed a cap.
  std::optional<BudgetHold> TryAdmit(const std::string& provider,
                                     const std::string& model,
                                     int prompt_tokens,
                                     int completion_tokens);

  std::map<std::string, ProviderBudgetSnapshot> Snapshot() const;

 private:
  friend class BudgetHold;

  struct Ledger {
    std::mutex mu;
    bool enabled = true;
    double daily_cap = 0.0;
    double monthly_cap = 0.0;
    double daily_cost = 0.0;
    double monthly_cost = 0.0;
    double pending = 0.0;
    int64_t daily_calls = 0;
    std::string day_key;
    std::string month_key;
  };

  Ledger* Find(const std::string& provider) const;
  void RollOverLocked(Ledger* ledger) const;
  bool FitsLocked(const Ledger& ledger, double estimate) const;
  void CommitHold(const BudgetHold& hold);
  void ReleaseHold(const BudgetHold& hold);

  const RouterConfig& cfg_;
  Clock clock_;
  std::map<std::string, std::unique_ptr<Ledger>> ledgers_;
};

}  // namespace router
