#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace strata::config {

struct TenancyConfig {
  // Ordered "name:type" pairs; the order is part of the schema fingerprint.
  std::vector<std::string> fields = {"project_id:string", "agent_id:string"};
};

struct StoreConfig {
  std::string backend = "sqlite";
  std::string path = "~/.strata/strata.db";
  std::uint32_t busy_timeout_ms = 5'000;
};

struct VectorConfig {
  std::string backend = "brute_force";
  std::string path;
};

struct EmbeddingConfig {
  std::string provider = "local";
  std::string model = "text-embedding-3-small";
  std::size_t dimensions = 384;
  std::string base_url = "https://api.openai.com/v1";
  std::uint64_t timeout_ms = 30'000;
};

struct ExtractionConfig {
  std::string provider = "rule";
  std::string model = "gpt-4o-mini";
  std::string base_url = "https://api.openai.com/v1";
  double temperature = 0.0;
  std::uint64_t timeout_ms = 60'000;
  std::vector<std::string> memory_types = {"profile", "event", "knowledge", "behavior", "skill"};
};

struct BlobConfig {
  std::string backend = "local";
  std::string root = "~/.strata/resources";
};

struct MemorizeConfig {
  double category_assign_threshold = 0.25;
  std::size_t category_summary_target_length = 400;
  std::size_t anchors_per_category = 3;
  std::size_t max_intention_goals = 10;
  std::string fallback_category = "knowledge";
  // "name: description" entries, created lazily per scope.
  std::vector<std::string> categories = {
      "personal_info: Personal information about the user",
      "preferences: User preferences, likes and dislikes",
      "relationships: Information about relationships with others",
      "activities: Activities, hobbies, and interests",
      "goals: Goals, aspirations, and objectives",
      "experiences: Past experiences and events",
      "knowledge: Knowledge, facts, and learned information",
      "opinions: Opinions, viewpoints, and perspectives",
      "habits: Habits, routines, and patterns",
      "work_life: Work-related information and professional life",
  };
};

struct RetrieveConfig {
  std::size_t category_top_k = 5;
  std::size_t item_top_k = 10;
  std::size_t resource_top_k = 5;
  bool include_resources = true;
  std::string sufficiency = "rule";
  double vector_weight = 0.5;
  double keyword_weight = 0.4;
  double recency_weight = 0.1;
  double recency_half_life_days = 30.0;
  double min_score = 0.05;
};

struct PolicyConfig {
  std::size_t max_scope_combinations = 64;
  std::size_t max_vector_scope_combinations = 16;
  bool vector_on_wildcard = false;
  std::size_t max_vector_candidates = 200;
  std::size_t max_rerank_candidates = 50;
  std::string fallback = "category_only";
};

struct RunnerConfig {
  std::string kind = "inline";
  std::uint32_t max_retries = 2;
  std::uint64_t backoff_ms = 50;
  std::uint64_t step_timeout_ms = 30'000;
  std::size_t max_concurrency = 4;
  bool checkpoint = true;
};

struct EvolveConfig {
  double stale_after_days = 30.0;
  double confidence_half_life_days = 180.0;
  double reinforcement_bonus = 0.05;
  double min_confidence_delta = 0.05;
  std::size_t max_targets = 200;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  std::optional<std::string> api_key;
  TenancyConfig tenancy;
  StoreConfig store;
  VectorConfig vector;
  EmbeddingConfig embedding;
  ExtractionConfig extraction;
  BlobConfig blob;
  MemorizeConfig memorize;
  RetrieveConfig retrieve;
  PolicyConfig policy;
  RunnerConfig runner;
  EvolveConfig evolve;
  ObservabilityConfig observability;
};

} // namespace strata::config
