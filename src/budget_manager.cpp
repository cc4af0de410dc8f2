#include "budget_manager.hpp"

#include "router_logs.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace router {

BudgetHold::BudgetHold(BudgetManager* owner, std::string provider, std::string model, double estimate_usd)
    : owner_(owner), provider_(std::move(provider)), model_(std::move(model)), estimate_usd_(estimate_usd) {}

BudgetHold::~BudgetHold() {
  Release();
}

BudgetHold::BudgetHold(BudgetHold&& other) noexcept
    : owner_(other.owner_),
      provider_(std::move(other.provider_)),
      model_(std::move(other.model_)),
      estimate_usd_(other.estimate_usd_),
      committed_(other.committed_) {
  other.owner_ = nullptr;
}

BudgetHold& BudgetHold::operator=(BudgetHold&& other) noexcept {
  if (this == &other) return *this;
  Release();
  owner_ = other.owner_;
  provider_ = std::move(other.provider_);
  model_ = std::move(other.model_);
  estimate_usd_ = other.estimate_usd_;
  committed_ = other.committed_;
  other.owner_ = nullptr;
  return *this;
}

void BudgetHold::Commit() {
  if (!owner_) return;
  owner_->CommitHold(*this);
  committed_ = true;
  owner_ = nullptr;
}

void BudgetHold::Release() {
  if (!owner_) return;
  owner_->ReleaseHold(*this);
  owner_ = nullptr;
}

BudgetManager::BudgetManager(const RouterConfig& cfg, Clock clock) : cfg_(cfg), clock_(std::move(clock)) {
  if (!clock_) clock_ = [] { return std::chrono::system_clock::now(); };
  const auto now = clock_();
  for (const auto& [name, pc] : cfg_.providers) {
    auto ledger = std::make_unique<Ledger>();
    ledger->enabled = pc.enabled;
    ledger->daily_cap = pc.daily_cap_usd.value_or(cfg_.budget.daily_cap_per_provider_usd);
    ledger->monthly_cap = pc.monthly_cap_usd.value_or(cfg_.budget.monthly_cap_per_provider_usd);
    ledger->day_key = FormatUtc(now, "%Y-%m-%d");
    ledger->month_key = FormatUtc(now, "%Y-%m");
    ledgers_.emplace(name, std::move(ledger));
  }
}

BudgetManager::Ledger* BudgetManager::Find(const std::string& provider) const {
  auto it = ledgers_.find(provider);
  if (it == ledgers_.end()) return nullptr;
  return it->second.get();
}

bool BudgetManager::ProviderEnabled(const std::string& provider) const {
  const auto* ledger = Find(provider);
  return ledger && ledger->enabled;
}

double BudgetManager::CostPer1k(const std::string& provider, const std::string& model) const {
  const auto* pc = cfg_.FindProvider(provider);
  if (pc && pc->kind == ProviderKind::kLocal) return 0.0;
  auto table = cfg_.budget.cost_per_1k_tokens_usd.find(provider);
  if (table != cfg_.budget.cost_per_1k_tokens_usd.end()) {
    auto rate = table->second.find(model);
    if (rate != table->second.end()) return rate->second;
  }
  return cfg_.budget.fallback_cost_per_1k_usd;
}

double BudgetManager::EstimateCost(const std::string& provider,
                                   const std::string& model,
                                   int prompt_tokens,
                                   int completion_tokens) const {
  const double total_tokens = static_cast<double>(prompt_tokens) + static_cast<double>(completion_tokens);
  return (total_tokens / 1000.0) * CostPer1k(provider, model);
}

void BudgetManager::RollOverLocked(Ledger* ledger) const {
  if (!cfg_.budget.internal_period_rollover) return;
  const auto now = clock_();
  const auto day = FormatUtc(now, "%Y-%m-%d");
  const auto month = FormatUtc(now, "%Y-%m");
  if (month != ledger->month_key) {
    std::cout << "[budget] monthly rollover from=" << ledger->month_key << " to=" << month
              << " monthly_cost=" << ledger->monthly_cost << "\n";
    ledger->month_key = month;
    ledger->monthly_cost = 0.0;
  }
  if (day != ledger->day_key) {
    ledger->day_key = day;
    ledger->daily_cost = 0.0;
    ledger->daily_calls = 0;
  }
}

bool BudgetManager::FitsLocked(const Ledger& ledger, double estimate) const {
  if (!ledger.enabled) return false;
  if (ledger.daily_cost + ledger.pending + estimate > ledger.daily_cap) return false;
  if (ledger.monthly_cost + ledger.pending + estimate > ledger.monthly_cap) return false;
  return true;
}

bool BudgetManager::CanSpend(const std::string& provider,
                             const std::string& model,
                             int prompt_tokens,
                             int completion_tokens) const {
  auto* ledger = Find(provider);
  if (!ledger) return false;
  const double estimate = EstimateCost(provider, model, prompt_tokens, completion_tokens);
  std::lock_guard<std::mutex> lock(ledger->mu);
  RollOverLocked(ledger);
  return FitsLocked(*ledger, estimate);
}

void BudgetManager::RecordSpend(const std::string& provider,
                                const std::string& model,
                                int prompt_tokens,
                                int completion_tokens) {
  auto* ledger = Find(provider);
  if (!ledger) return;
  const double estimate = EstimateCost(provider, model, prompt_tokens, completion_tokens);
  std::lock_guard<std::mutex> lock(ledger->mu);
  RollOverLocked(ledger);
  ledger->daily_cost += estimate;
  ledger->monthly_cost += estimate;
  ledger->daily_calls++;
}

std::optional<BudgetHold> BudgetManager::TryAdmit(const std::string& provider,
                                                  const std::string& model,
                                                  int prompt_tokens,
                                                  int completion_tokens) {
  auto* ledger = Find(provider);
  if (!ledger) return std::nullopt;
  const double estimate = EstimateCost(provider, model, prompt_tokens, completion_tokens);
  std::lock_guard<std::mutex> lock(ledger->mu);
  RollOverLocked(ledger);
  if (!FitsLocked(*ledger, estimate)) return std::nullopt;
  ledger->pending += estimate;
  return BudgetHold(this, provider, model, estimate);
}

void BudgetManager::CommitHold(const BudgetHold& hold) {
  auto* ledger = Find(hold.provider());
  if (!ledger) return;
  std::lock_guard<std::mutex> lock(ledger->mu);
  RollOverLocked(ledger);
  ledger->pending -= hold.estimate_usd();
  if (ledger->pending < 1e-12) ledger->pending = 0.0;
  ledger->daily_cost += hold.estimate_usd();
  ledger->monthly_cost += hold.estimate_usd();
  ledger->daily_calls++;
}

void BudgetManager::ReleaseHold(const BudgetHold& hold) {
  auto* ledger = Find(hold.provider());
  if (!ledger) return;
  std::lock_guard<std::mutex> lock(ledger->mu);
  ledger->pending -= hold.estimate_usd();
  if (ledger->pending < 1e-12) ledger->pending = 0.0;
}

std::map<std::string, ProviderBudgetSnapshot> BudgetManager::Snapshot() const {
  std::map<std::string, ProviderBudgetSnapshot> out;
  for (const auto& [name, ledger] : ledgers_) {
    std::lock_guard<std::mutex> lock(ledger->mu);
    RollOverLocked(ledger.get());
    ProviderBudgetSnapshot s;
    s.enabled = ledger->enabled;
    s.daily_cost_estimate = ledger->daily_cost;
    s.monthly_cost_estimate = ledger->monthly_cost;
    s.pending_estimate = ledger->pending;
    s.daily_calls = ledger->daily_calls;
    s.daily_cap = ledger->daily_cap;
    s.monthly_cap = ledger->monthly_cap;
    out.emplace(name, s);
  }
  return out;
}

}  // namespace router
