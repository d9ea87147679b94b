#pragma once

#include "strata/capability/blob_store.hpp"
#include "strata/capability/capability.hpp"
#include "strata/capability/embedder.hpp"
#include "strata/capability/extractor.hpp"
#include "strata/common/result.hpp"
#include "strata/config/schema.hpp"
#include "strata/pipeline/state.hpp"
#include "strata/scope/tenancy.hpp"
#include "strata/store/metadata_store.hpp"
#include "strata/vector/vector_index.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace strata::pipeline {

enum class Role {
  Ingestion,
  Preprocessing,
  Extraction,
  Deduplication,
  Clustering,
  Routing,
  Verification,
  Persistence,
  Custom,
};

[[nodiscard]] std::string role_to_string(Role role);
[[nodiscard]] common::Result<Role> role_from_string(std::string_view value);
/// Capabilities a step of this role needs when it declares none itself.
[[nodiscard]] std::vector<capability::Capability> default_capabilities(Role role);

/// Collaborators handed to every step. Absent capabilities are null.
struct StepServices {
  std::shared_ptr<const config::Config> config;
  std::shared_ptr<store::IMetadataStore> store;
  std::shared_ptr<vector::IVectorIndex> vector;
  std::shared_ptr<capability::IEmbedder> embedder;
  std::shared_ptr<capability::IExtractor> extractor;
  std::shared_ptr<capability::IBlobStore> blob;
  std::shared_ptr<scope::TenancyManager> tenancy;
};

struct StepSpec;

class StepContext {
public:
  StepContext(const StepServices &services, const StepSpec &step,
              const std::atomic<bool> *cancel = nullptr,
              std::shared_ptr<const std::atomic<bool>> abandoned = nullptr);

  [[nodiscard]] const StepServices &services() const { return services_; }
  [[nodiscard]] const config::Config &config() const { return *services_.config; }
  [[nodiscard]] const StepSpec &step() const { return step_; }

  [[nodiscard]] std::string config_string(const std::string &key,
                                          const std::string &fallback) const;
  [[nodiscard]] std::size_t config_size(const std::string &key, std::size_t fallback) const;
  [[nodiscard]] double config_double(const std::string &key, double fallback) const;
  [[nodiscard]] bool config_bool(const std::string &key, bool fallback) const;

  /// Set when the caller cancelled or the runner gave up on this attempt. Steps check it
  /// before committing.
  [[nodiscard]] bool cancelled() const;

private:
  const StepServices &services_;
  const StepSpec &step_;
  const std::atomic<bool> *cancel_;
  std::shared_ptr<const std::atomic<bool>> abandoned_;
};

using StepHandler = std::function<common::Status(WorkflowState &, const StepContext &)>;

struct StepSpec {
  std::string id;
  Role role = Role::Custom;
  std::vector<std::string> inputs;
  std::vector<std::string> outputs;
  // Defaults to the role's capabilities when unset.
  std::optional<std::vector<capability::Capability>> capabilities;
  // Used when present; never required.
  std::vector<capability::Capability> optional_capabilities;
  std::map<std::string, std::string> config;
  // Keys accepted by config overrides; empty accepts any key.
  std::set<std::string> config_keys;
  // A failed degradable step is skipped and the run continues as degraded.
  bool degradable = false;
  // Runs even after cancellation so partial output can be assembled.
  bool finalizer = false;
  StepHandler handler;

  [[nodiscard]] std::vector<capability::Capability> required_capabilities() const;
};

} // namespace strata::pipeline
