#include "strata/config/config.hpp"

#include "strata/common/fs.hpp"
#include "strata/common/toml.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <vector>

namespace strata::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".strata";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("STRATA_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    const std::string key = common::trim(trimmed.substr(0, eq));
    if (key.empty()) {
      continue;
    }
    set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
  }
}

void load_dotenv_files() {
  if (const char *env_file = std::getenv("STRATA_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    load_dotenv_file(common::expand_path(env_file));
  }
  if (auto dir = config_dir(); dir.ok()) {
    load_dotenv_file(dir.value() / ".env");
  }
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::ostringstream stream;
  stream << "[\n";
  for (const auto &value : values) {
    stream << "  " << common::quote_toml_string(value) << ",\n";
  }
  stream << ']';
  return stream.str();
}

bool one_of(const std::string &value, std::initializer_list<const char *> options) {
  const std::string normalized = common::to_lower(common::trim(value));
  for (const char *option : options) {
    if (normalized == option) {
      return true;
    }
  }
  return false;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const char *path = std::getenv("STRATA_STORE_PATH"); path != nullptr && *path) {
    config.store.path = common::expand_path(path);
  }
  if (const char *runner = std::getenv("STRATA_RUNNER"); runner != nullptr && *runner) {
    config.runner.kind = runner;
  }
  if (const char *observer = std::getenv("STRATA_OBSERVABILITY"); observer != nullptr && *observer) {
    config.observability.backend = observer;
  }

  if (const char *api_key = std::getenv("STRATA_API_KEY"); api_key != nullptr && *api_key) {
    config.api_key = std::string(api_key);
    return;
  }
  if (config.api_key.has_value() && !common::trim(*config.api_key).empty()) {
    return;
  }
  if (const char *openai_key = std::getenv("OPENAI_API_KEY"); openai_key != nullptr && *openai_key) {
    config.api_key = std::string(openai_key);
  }
}

common::Result<Config> parse_config(const std::string &toml_content) {
  const auto parsed = common::parse_toml(toml_content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(common::ErrorKind::Validation, parsed.error());
  }
  const auto &doc = parsed.value();
  Config config;

  if (doc.has("api_key")) {
    config.api_key = expand_config_value(doc.get_string("api_key"));
  }

  config.tenancy.fields = doc.get_string_array("tenancy.fields", config.tenancy.fields);

  config.store.backend = doc.get_string("store.backend", config.store.backend);
  config.store.path = expand_config_value(doc.get_string("store.path", config.store.path));
  config.store.busy_timeout_ms = static_cast<std::uint32_t>(
      doc.get_u64("store.busy_timeout_ms", config.store.busy_timeout_ms));

  config.vector.backend = doc.get_string("vector.backend", config.vector.backend);
  config.vector.path = expand_config_value(doc.get_string("vector.path", config.vector.path));

  config.embedding.provider = doc.get_string("embedding.provider", config.embedding.provider);
  config.embedding.model = doc.get_string("embedding.model", config.embedding.model);
  config.embedding.dimensions = static_cast<std::size_t>(
      doc.get_u64("embedding.dimensions", config.embedding.dimensions));
  config.embedding.base_url = doc.get_string("embedding.base_url", config.embedding.base_url);
  config.embedding.timeout_ms = doc.get_u64("embedding.timeout_ms", config.embedding.timeout_ms);

  config.extraction.provider = doc.get_string("extraction.provider", config.extraction.provider);
  config.extraction.model = doc.get_string("extraction.model", config.extraction.model);
  config.extraction.base_url = doc.get_string("extraction.base_url", config.extraction.base_url);
  config.extraction.temperature =
      doc.get_double("extraction.temperature", config.extraction.temperature);
  config.extraction.timeout_ms = doc.get_u64("extraction.timeout_ms", config.extraction.timeout_ms);
  config.extraction.memory_types =
      doc.get_string_array("extraction.memory_types", config.extraction.memory_types);

  config.blob.backend = doc.get_string("blob.backend", config.blob.backend);
  config.blob.root = expand_config_value(doc.get_string("blob.root", config.blob.root));

  auto &memorize = config.memorize;
  memorize.category_assign_threshold =
      doc.get_double("memorize.category_assign_threshold", memorize.category_assign_threshold);
  memorize.category_summary_target_length = static_cast<std::size_t>(doc.get_u64(
      "memorize.category_summary_target_length", memorize.category_summary_target_length));
  memorize.anchors_per_category = static_cast<std::size_t>(
      doc.get_u64("memorize.anchors_per_category", memorize.anchors_per_category));
  memorize.max_intention_goals = static_cast<std::size_t>(
      doc.get_u64("memorize.max_intention_goals", memorize.max_intention_goals));
  memorize.fallback_category =
      doc.get_string("memorize.fallback_category", memorize.fallback_category);
  memorize.categories = doc.get_string_array("memorize.categories", memorize.categories);

  auto &retrieve = config.retrieve;
  retrieve.category_top_k =
      static_cast<std::size_t>(doc.get_u64("retrieve.category_top_k", retrieve.category_top_k));
  retrieve.item_top_k =
      static_cast<std::size_t>(doc.get_u64("retrieve.item_top_k", retrieve.item_top_k));
  retrieve.resource_top_k =
      static_cast<std::size_t>(doc.get_u64("retrieve.resource_top_k", retrieve.resource_top_k));
  retrieve.include_resources =
      doc.get_bool("retrieve.include_resources", retrieve.include_resources);
  retrieve.sufficiency = doc.get_string("retrieve.sufficiency", retrieve.sufficiency);
  retrieve.vector_weight = doc.get_double("retrieve.vector_weight", retrieve.vector_weight);
  retrieve.keyword_weight = doc.get_double("retrieve.keyword_weight", retrieve.keyword_weight);
  retrieve.recency_weight = doc.get_double("retrieve.recency_weight", retrieve.recency_weight);
  retrieve.recency_half_life_days =
      doc.get_double("retrieve.recency_half_life_days", retrieve.recency_half_life_days);
  retrieve.min_score = doc.get_double("retrieve.min_score", retrieve.min_score);

  auto &policy = config.policy;
  policy.max_scope_combinations = static_cast<std::size_t>(
      doc.get_u64("policy.max_scope_combinations", policy.max_scope_combinations));
  policy.max_vector_scope_combinations = static_cast<std::size_t>(
      doc.get_u64("policy.max_vector_scope_combinations", policy.max_vector_scope_combinations));
  policy.vector_on_wildcard = doc.get_bool("policy.vector_on_wildcard", policy.vector_on_wildcard);
  policy.max_vector_candidates = static_cast<std::size_t>(
      doc.get_u64("policy.max_vector_candidates", policy.max_vector_candidates));
  policy.max_rerank_candidates = static_cast<std::size_t>(
      doc.get_u64("policy.max_rerank_candidates", policy.max_rerank_candidates));
  policy.fallback = doc.get_string("policy.fallback", policy.fallback);

  auto &runner = config.runner;
  runner.kind = doc.get_string("runner.kind", runner.kind);
  runner.max_retries =
      static_cast<std::uint32_t>(doc.get_u64("runner.max_retries", runner.max_retries));
  runner.backoff_ms = doc.get_u64("runner.backoff_ms", runner.backoff_ms);
  runner.step_timeout_ms = doc.get_u64("runner.step_timeout_ms", runner.step_timeout_ms);
  runner.max_concurrency =
      static_cast<std::size_t>(doc.get_u64("runner.max_concurrency", runner.max_concurrency));
  runner.checkpoint = doc.get_bool("runner.checkpoint", runner.checkpoint);

  auto &evolve = config.evolve;
  evolve.stale_after_days = doc.get_double("evolve.stale_after_days", evolve.stale_after_days);
  evolve.confidence_half_life_days =
      doc.get_double("evolve.confidence_half_life_days", evolve.confidence_half_life_days);
  evolve.reinforcement_bonus =
      doc.get_double("evolve.reinforcement_bonus", evolve.reinforcement_bonus);
  evolve.min_confidence_delta =
      doc.get_double("evolve.min_confidence_delta", evolve.min_confidence_delta);
  evolve.max_targets =
      static_cast<std::size_t>(doc.get_u64("evolve.max_targets", evolve.max_targets));

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  auto content = common::read_text_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  auto parsed = parse_config(content.value());
  if (!parsed.ok()) {
    return parsed;
  }
  apply_env_overrides(parsed.value());
  return parsed;
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return common::Status::error("Failed to create config directory: " + ensure_ec.message());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error("Unable to write temporary config file");
  }

  if (config.api_key.has_value()) {
    file << "api_key = " << common::quote_toml_string(*config.api_key) << "\n";
  }

  file << "\n[tenancy]\n";
  file << "fields = " << string_array_to_toml(config.tenancy.fields) << "\n";

  file << "\n[store]\n";
  file << "backend = " << common::quote_toml_string(config.store.backend) << "\n";
  file << "path = " << common::quote_toml_string(config.store.path) << "\n";
  file << "busy_timeout_ms = " << config.store.busy_timeout_ms << "\n";

  file << "\n[vector]\n";
  file << "backend = " << common::quote_toml_string(config.vector.backend) << "\n";
  file << "path = " << common::quote_toml_string(config.vector.path) << "\n";

  file << "\n[embedding]\n";
  file << "provider = " << common::quote_toml_string(config.embedding.provider) << "\n";
  file << "model = " << common::quote_toml_string(config.embedding.model) << "\n";
  file << "dimensions = " << config.embedding.dimensions << "\n";
  file << "base_url = " << common::quote_toml_string(config.embedding.base_url) << "\n";
  file << "timeout_ms = " << config.embedding.timeout_ms << "\n";

  file << "\n[extraction]\n";
  file << "provider = " << common::quote_toml_string(config.extraction.provider) << "\n";
  file << "model = " << common::quote_toml_string(config.extraction.model) << "\n";
  file << "base_url = " << common::quote_toml_string(config.extraction.base_url) << "\n";
  file << "temperature = " << config.extraction.temperature << "\n";
  file << "timeout_ms = " << config.extraction.timeout_ms << "\n";
  file << "memory_types = " << string_array_to_toml(config.extraction.memory_types) << "\n";

  file << "\n[blob]\n";
  file << "backend = " << common::quote_toml_string(config.blob.backend) << "\n";
  file << "root = " << common::quote_toml_string(config.blob.root) << "\n";

  file << "\n[memorize]\n";
  file << "category_assign_threshold = " << config.memorize.category_assign_threshold << "\n";
  file << "category_summary_target_length = " << config.memorize.category_summary_target_length
       << "\n";
  file << "anchors_per_category = " << config.memorize.anchors_per_category << "\n";
  file << "max_intention_goals = " << config.memorize.max_intention_goals << "\n";
  file << "fallback_category = " << common::quote_toml_string(config.memorize.fallback_category)
       << "\n";
  file << "categories = " << string_array_to_toml(config.memorize.categories) << "\n";

  file << "\n[retrieve]\n";
  file << "category_top_k = " << config.retrieve.category_top_k << "\n";
  file << "item_top_k = " << config.retrieve.item_top_k << "\n";
  file << "resource_top_k = " << config.retrieve.resource_top_k << "\n";
  file << "include_resources = " << bool_to_toml(config.retrieve.include_resources) << "\n";
  file << "sufficiency = " << common::quote_toml_string(config.retrieve.sufficiency) << "\n";
  file << "vector_weight = " << config.retrieve.vector_weight << "\n";
  file << "keyword_weight = " << config.retrieve.keyword_weight << "\n";
  file << "recency_weight = " << config.retrieve.recency_weight << "\n";
  file << "recency_half_life_days = " << config.retrieve.recency_half_life_days << "\n";
  file << "min_score = " << config.retrieve.min_score << "\n";

  file << "\n[policy]\n";
  file << "max_scope_combinations = " << config.policy.max_scope_combinations << "\n";
  file << "max_vector_scope_combinations = " << config.policy.max_vector_scope_combinations
       << "\n";
  file << "vector_on_wildcard = " << bool_to_toml(config.policy.vector_on_wildcard) << "\n";
  file << "max_vector_candidates = " << config.policy.max_vector_candidates << "\n";
  file << "max_rerank_candidates = " << config.policy.max_rerank_candidates << "\n";
  file << "fallback = " << common::quote_toml_string(config.policy.fallback) << "\n";

  file << "\n[runner]\n";
  file << "kind = " << common::quote_toml_string(config.runner.kind) << "\n";
  file << "max_retries = " << config.runner.max_retries << "\n";
  file << "backoff_ms = " << config.runner.backoff_ms << "\n";
  file << "step_timeout_ms = " << config.runner.step_timeout_ms << "\n";
  file << "max_concurrency = " << config.runner.max_concurrency << "\n";
  file << "checkpoint = " << bool_to_toml(config.runner.checkpoint) << "\n";

  file << "\n[evolve]\n";
  file << "stale_after_days = " << config.evolve.stale_after_days << "\n";
  file << "confidence_half_life_days = " << config.evolve.confidence_half_life_days << "\n";
  file << "reinforcement_bonus = " << config.evolve.reinforcement_bonus << "\n";
  file << "min_confidence_delta = " << config.evolve.min_confidence_delta << "\n";
  file << "max_targets = " << config.evolve.max_targets << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  file.close();
  if (!file) {
    return common::Status::error("Failed writing temporary config file");
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error("Failed to atomically replace config: " + ec.message());
  }

  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;
  using Out = common::Result<std::vector<std::string>>;

  if (config.tenancy.fields.empty()) {
    return Out::failure(common::ErrorKind::Validation, "tenancy.fields must not be empty");
  }
  if (!one_of(config.store.backend, {"memory", "sqlite"})) {
    return Out::failure(common::ErrorKind::Validation,
                        "Invalid store.backend: " + config.store.backend);
  }
  if (!one_of(config.vector.backend, {"brute_force", "sqlite", "none"})) {
    return Out::failure(common::ErrorKind::Validation,
                        "Invalid vector.backend: " + config.vector.backend);
  }
  if (!one_of(config.embedding.provider, {"local", "noop", "openai", "none"})) {
    return Out::failure(common::ErrorKind::Validation,
                        "Invalid embedding.provider: " + config.embedding.provider);
  }
  if (!one_of(config.extraction.provider, {"rule", "openai", "none"})) {
    return Out::failure(common::ErrorKind::Validation,
                        "Invalid extraction.provider: " + config.extraction.provider);
  }
  if (!one_of(config.blob.backend, {"local", "none"})) {
    return Out::failure(common::ErrorKind::Validation,
                        "Invalid blob.backend: " + config.blob.backend);
  }
  if (!one_of(config.runner.kind, {"inline", "durable"})) {
    return Out::failure(common::ErrorKind::Validation,
                        "Invalid runner.kind: " + config.runner.kind);
  }
  if (!one_of(config.policy.fallback, {"category_only", "reject"})) {
    return Out::failure(common::ErrorKind::Validation,
                        "Invalid policy.fallback: " + config.policy.fallback);
  }
  if (!one_of(config.retrieve.sufficiency, {"rule", "llm", "off"})) {
    return Out::failure(common::ErrorKind::Validation,
                        "Invalid retrieve.sufficiency: " + config.retrieve.sufficiency);
  }
  if (config.embedding.dimensions == 0) {
    return Out::failure(common::ErrorKind::Validation, "embedding.dimensions must be positive");
  }
  if (config.policy.max_scope_combinations == 0) {
    return Out::failure(common::ErrorKind::Validation,
                        "policy.max_scope_combinations must be positive");
  }
  if (config.runner.max_concurrency == 0) {
    return Out::failure(common::ErrorKind::Validation, "runner.max_concurrency must be positive");
  }

  if (config.memorize.category_assign_threshold < 0.0 ||
      config.memorize.category_assign_threshold > 1.0) {
    warnings.push_back("memorize.category_assign_threshold should be within [0, 1]");
  }
  if (config.policy.max_vector_scope_combinations > config.policy.max_scope_combinations) {
    warnings.push_back(
        "policy.max_vector_scope_combinations exceeds policy.max_scope_combinations");
  }
  const double weight_sum =
      config.retrieve.vector_weight + config.retrieve.keyword_weight + config.retrieve.recency_weight;
  if (weight_sum <= 0.0) {
    return Out::failure(common::ErrorKind::Validation, "retrieve weights must not all be zero");
  }
  if (one_of(config.vector.backend, {"brute_force", "sqlite"}) &&
      one_of(config.embedding.provider, {"none"})) {
    warnings.push_back("vector index configured without an embedding provider; vector recall is "
                       "disabled");
  }
  if ((one_of(config.embedding.provider, {"openai"}) ||
       one_of(config.extraction.provider, {"openai"})) &&
      (!config.api_key.has_value() || common::trim(*config.api_key).empty())) {
    warnings.push_back("openai provider selected without api_key");
  }

  return Out::success(std::move(warnings));
}

} // namespace strata::config
