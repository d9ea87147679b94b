#include "test_framework.hpp"

#include "strata/common/fs.hpp"
#include "strata/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>

namespace {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = strata::config::config_path_override();
    if (next.has_value()) {
      strata::config::set_config_path_override(*next);
    } else {
      strata::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      strata::config::set_config_path_override(*old_override);
    } else {
      strata::config::clear_config_path_override();
    }
  }
};

} // namespace

void register_config_tests(std::vector<strata::tests::TestCase> &tests) {
  using strata::tests::require;
  namespace cfg = strata::config;

  tests.push_back({"config_defaults_are_valid", [] {
                     cfg::Config config;
                     const auto warnings = cfg::validate_config(config);
                     require(warnings.ok(), warnings.error());
                     require(config.tenancy.fields.size() == 2, "default schema has two fields");
                     require(config.runner.kind == "inline", "inline runner by default");
                   }});

  tests.push_back({"config_parse_sections", [] {
                     const auto parsed = cfg::parse_config(R"(
[tenancy]
fields = ["project:string", "agent:integer"]

[store]
backend = "memory"

[vector]
backend = "none"

[retrieve]
item_top_k = 3
sufficiency = "off"

[policy]
max_scope_combinations = 8
fallback = "reject"

[runner]
kind = "durable"
max_retries = 4
step_timeout_ms = 250

[memorize]
categories = ["food: What the user eats"]
)");
                     require(parsed.ok(), parsed.error());
                     const auto &config = parsed.value();
                     require(config.tenancy.fields.size() == 2 &&
                                 config.tenancy.fields[1] == "agent:integer",
                             "tenancy fields not parsed");
                     require(config.store.backend == "memory", "store backend");
                     require(config.vector.backend == "none", "vector backend");
                     require(config.retrieve.item_top_k == 3, "item_top_k");
                     require(config.retrieve.sufficiency == "off", "sufficiency");
                     require(config.policy.max_scope_combinations == 8, "policy cap");
                     require(config.policy.fallback == "reject", "policy fallback");
                     require(config.runner.kind == "durable", "runner kind");
                     require(config.runner.max_retries == 4, "max_retries");
                     require(config.runner.step_timeout_ms == 250, "step timeout");
                     require(config.memorize.categories.size() == 1, "categories");
                     require(config.embedding.provider == "local", "untouched default kept");
                   }});

  tests.push_back({"config_validate_rejects_unknown_backend", [] {
                     cfg::Config config;
                     config.store.backend = "postgres";
                     const auto result = cfg::validate_config(config);
                     require(!result.ok(), "unknown store backend accepted");
                     require(result.kind() == strata::common::ErrorKind::Validation,
                             "expected validation error");
                   }});

  tests.push_back({"config_validate_warns_on_soft_issues", [] {
                     cfg::Config config;
                     config.policy.max_vector_scope_combinations = 100;
                     config.policy.max_scope_combinations = 10;
                     config.embedding.provider = "openai";
                     config.api_key.reset();
                     const auto result = cfg::validate_config(config);
                     require(result.ok(), result.error());
                     require(result.value().size() == 2, "expected two warnings");
                   }});

  tests.push_back({"config_save_and_load_roundtrip", [] {
                     strata::testing::TempWorkspace workspace;
                     const ConfigOverrideGuard guard(workspace.path() / "config.toml");
                     const EnvGuard api_key("STRATA_API_KEY", std::nullopt);
                     const EnvGuard runner("STRATA_RUNNER", std::nullopt);

                     cfg::Config config;
                     config.tenancy.fields = {"tenant:string", "user:string", "agent:string"};
                     config.store.backend = "memory";
                     config.runner.kind = "durable";
                     config.retrieve.vector_weight = 0.7;
                     config.memorize.fallback_category = "misc";
                     const auto saved = cfg::save_config(config);
                     require(saved.ok(), saved.error());
                     require(std::filesystem::exists(workspace.path() / "config.toml"),
                             "config file missing");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().tenancy.fields.size() == 3, "fields lost");
                     require(loaded.value().runner.kind == "durable", "runner lost");
                     require(loaded.value().retrieve.vector_weight == 0.7, "weight lost");
                     require(loaded.value().memorize.fallback_category == "misc",
                             "fallback category lost");
                   }});

  tests.push_back({"config_env_overrides_apply", [] {
                     const EnvGuard runner("STRATA_RUNNER", std::string("durable"));
                     const EnvGuard observer("STRATA_OBSERVABILITY", std::string("noop"));
                     const EnvGuard api_key("STRATA_API_KEY", std::string("sk-test"));
                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.runner.kind == "durable", "runner override ignored");
                     require(config.observability.backend == "noop", "observer override ignored");
                     require(config.api_key.has_value() && *config.api_key == "sk-test",
                             "api key override ignored");
                   }});

  tests.push_back({"config_missing_file_yields_defaults", [] {
                     strata::testing::TempWorkspace workspace;
                     const ConfigOverrideGuard guard(workspace.path() / "absent.toml");
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().store.backend == "sqlite", "defaults expected");
                   }});
}
