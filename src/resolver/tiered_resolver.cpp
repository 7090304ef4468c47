#include "resolver/tiered_resolver.h"

#include <filesystem>
#include <sstream>
#include <utility>

#include "core/log.h"
#include "core/time_utils.h"
#include "core/types.h"

namespace reentry {

namespace {

constexpr const char* kBuiltinSource = "builtin-defaults";
constexpr const char* kEmergencyFallbackId = "emergency_fallback";

// 层内排序：specificity 高者优先，其次声明字段多者，最后 id 字节序小者。
bool Outranks(const MatchResult& lhs_match,
              const ParameterSet& lhs,
              const MatchResult& rhs_match,
              const ParameterSet& rhs) {
  if (lhs_match.specificity != rhs_match.specificity) {
    return lhs_match.specificity > rhs_match.specificity;
  }
  if (lhs_match.declared_fields != rhs_match.declared_fields) {
    return lhs_match.declared_fields > rhs_match.declared_fields;
  }
  return lhs.id < rhs.id;
}

ResolvedParameters BuildResolved(const ParameterSet& parameter_set,
                                 const std::string& tier,
                                 double specificity,
                                 int generation) {
  ResolvedParameters resolved;
  resolved.parameter_set_id = parameter_set.id;
  resolved.parameter_set_name = parameter_set.name;
  resolved.resolved_tier = tier;
  resolved.specificity_score = specificity;
  resolved.reentry_enabled = parameter_set.reentry_enabled;
  resolved.max_generation = parameter_set.max_generation;
  resolved.lot_size_multiplier = parameter_set.lot_size_multiplier;
  resolved.stop_loss_pips = parameter_set.stop_loss_pips;
  resolved.take_profit_pips = parameter_set.take_profit_pips;
  resolved.confidence_threshold = parameter_set.confidence_threshold;
  resolved.min_wait_minutes = parameter_set.min_wait_minutes;
  resolved.max_wait_minutes = parameter_set.max_wait_minutes;
  resolved.volatility_threshold = parameter_set.volatility_threshold;
  resolved.spread_threshold = parameter_set.spread_threshold;
  resolved.generation_allowed = generation <= parameter_set.max_generation;
  if (generation < parameter_set.max_generation) {
    resolved.next_generation = generation + 1;
  }
  return resolved;
}

}  // namespace

ResolvedParameters EmergencyFallbackParameters(int generation) {
  ParameterSet fallback;
  fallback.id = kEmergencyFallbackId;
  fallback.name = "Emergency Fallback";
  fallback.tier = kEmergencyTier;
  fallback.reentry_enabled = false;
  fallback.confidence_threshold = 1.0;
  return BuildResolved(fallback, kEmergencyTier, 0.0, generation);
}

TieredResolver::TieredResolver(ResolverConfig config,
                               std::shared_ptr<const Vocabulary> vocabulary)
    : config_(std::move(config)),
      vocabulary_(vocabulary ? std::move(vocabulary)
                             : std::make_shared<const Vocabulary>()),
      snapshot_(std::make_shared<const ResolverSnapshot>()) {}

bool TieredResolver::Reload(std::string* out_error) {
  const std::string& path = config_.parameter_sets_path;
  std::error_code ec;
  const bool exists = !path.empty() && std::filesystem::exists(path, ec);
  if (!exists) {
    if (!config_.use_defaults_if_missing) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.reload_failures;
      }
      if (out_error != nullptr) {
        *out_error = "参数集文件不存在: " + path;
      }
      return false;
    }
    LogInfo("RESOLVER_DEFAULTS_LOADED: missing_file=" + path);
    return LoadParameterSets(DefaultParameterSets(), kBuiltinSource, out_error);
  }

  std::vector<ParameterSet> loaded;
  std::string load_error;
  if (!LoadParameterSetsFromJson(path, *vocabulary_, config_.tier_hierarchy, &loaded,
                                 &load_error)) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++stats_.reload_failures;
    }
    LogError("RESOLVER_RELOAD_FAILED: file=" + path + " error=" + load_error);
    if (out_error != nullptr) {
      *out_error = load_error;
    }
    return false;
  }
  return LoadParameterSets(std::move(loaded), path, out_error);
}

bool TieredResolver::LoadParameterSets(std::vector<ParameterSet> parameter_sets,
                                       std::string source,
                                       std::string* out_error) {
  std::string validate_error;
  if (!ValidateParameterSets(parameter_sets, *vocabulary_, config_.tier_hierarchy,
                             &validate_error)) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++stats_.reload_failures;
    }
    if (out_error != nullptr) {
      *out_error = validate_error;
    }
    return false;
  }
  auto next = std::make_shared<ResolverSnapshot>();
  next->parameter_sets = std::move(parameter_sets);
  next->source = std::move(source);
  next->loaded_at_ms = CurrentTimestampMs();
  const std::size_t count = next->parameter_sets.size();
  const std::string source_text = next->source;
  SwapSnapshot(std::move(next));
  LogInfo("RESOLVER_LOADED: count=" + std::to_string(count) + " source=" +
          source_text);
  return true;
}

ResolvedParameters TieredResolver::Resolve(const ResolveRequest& request) {
  const std::shared_ptr<const ResolverSnapshot> current = snapshot();
  const MatchCriteria criteria{.outcome = request.outcome,
                               .duration = request.duration,
                               .proximity = request.proximity,
                               .calendar = request.calendar,
                               .symbol = request.symbol};

  for (const auto& tier : config_.tier_hierarchy) {
    const ParameterSet* best = nullptr;
    MatchResult best_match;
    for (const auto& parameter_set : current->parameter_sets) {
      if (parameter_set.tier != tier) {
        continue;
      }
      const MatchResult match = MatchParameterSet(parameter_set, criteria);
      if (!match.matched) {
        continue;
      }
      if (best == nullptr || Outranks(match, parameter_set, best_match, *best)) {
        best = &parameter_set;
        best_match = match;
      }
    }
    if (best != nullptr) {
      RecordResolve(tier);
      return BuildResolved(*best, tier, best_match.specificity, request.generation);
    }
  }

  RecordResolve(kEmergencyTier);
  std::ostringstream alarm;
  alarm << "RESOLVER_EXHAUSTED: outcome=" << request.outcome
        << " duration=" << request.duration << " proximity=" << request.proximity
        << " calendar=" << request.calendar << " symbol=" << request.symbol
        << " generation=" << request.generation << " source=" << current->source
        << " fallback=" << kEmergencyFallbackId;
  LogError(alarm.str());
  return EmergencyFallbackParameters(request.generation);
}

ComponentHealth TieredResolver::HealthCheck() const {
  const ResolverStatus status = Status();
  ComponentHealth health;
  health.component = component_name();
  const std::string fallback_tier =
      status.tier_hierarchy.empty() ? std::string() : status.tier_hierarchy.back();
  if (status.active_parameter_sets == 0) {
    health.state = HealthState::kUnhealthy;
    health.detail = "no active parameter sets";
  } else if (!fallback_tier.empty() && status.tier_counts.at(fallback_tier) == 0) {
    health.state = HealthState::kDegraded;
    health.detail = "no active parameter set in tier " + fallback_tier;
  } else if (status.stats.emergency_fallbacks > 0) {
    health.state = HealthState::kDegraded;
    health.detail =
        "emergency_fallbacks=" + std::to_string(status.stats.emergency_fallbacks);
  } else {
    health.detail = "active=" + std::to_string(status.active_parameter_sets) +
                    " source=" + status.source;
  }
  return health;
}

std::shared_ptr<const ResolverSnapshot> TieredResolver::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return snapshot_;
}

std::vector<ParameterSet> TieredResolver::ParameterSetsForTier(
    const std::string& tier) const {
  const auto current = snapshot();
  std::vector<ParameterSet> out;
  for (const auto& parameter_set : current->parameter_sets) {
    if (parameter_set.tier == tier && parameter_set.active) {
      out.push_back(parameter_set);
    }
  }
  return out;
}

ResolverStatus TieredResolver::Status() const {
  std::shared_ptr<const ResolverSnapshot> current;
  ResolverStatus status;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    current = snapshot_;
    status.stats = stats_;
  }
  status.tier_hierarchy = config_.tier_hierarchy;
  status.total_parameter_sets = current->parameter_sets.size();
  for (const auto& tier : config_.tier_hierarchy) {
    status.tier_counts[tier] = 0;
  }
  for (const auto& parameter_set : current->parameter_sets) {
    if (!parameter_set.active) {
      continue;
    }
    ++status.active_parameter_sets;
    ++status.tier_counts[parameter_set.tier];
  }
  status.source = current->source;
  if (current->loaded_at_ms > 0) {
    status.loaded_at = FormatIsoUtc(current->loaded_at_ms);
  }
  return status;
}

void TieredResolver::SwapSnapshot(std::shared_ptr<const ResolverSnapshot> next) {
  std::lock_guard<std::mutex> lock(mutex_);
  snapshot_ = std::move(next);
  ++stats_.reloads;
}

void TieredResolver::RecordResolve(const std::string& tier) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++stats_.resolves;
  ++stats_.tier_hits[tier];
  if (tier == kEmergencyTier) {
    ++stats_.emergency_fallbacks;
  }
}

}  // namespace reentry
