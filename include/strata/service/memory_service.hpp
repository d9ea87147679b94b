#pragma once

#include "strata/capability/blob_store.hpp"
#include "strata/capability/capability.hpp"
#include "strata/capability/embedder.hpp"
#include "strata/capability/extractor.hpp"
#include "strata/common/result.hpp"
#include "strata/config/schema.hpp"
#include "strata/pipeline/manager.hpp"
#include "strata/pipeline/state.hpp"
#include "strata/pipeline/step.hpp"
#include "strata/policy/retrieval_policy.hpp"
#include "strata/runner/runner.hpp"
#include "strata/scope/scope.hpp"
#include "strata/scope/tenancy.hpp"
#include "strata/store/metadata_store.hpp"
#include "strata/vector/vector_index.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace strata::service {

/// Collaborators for MemoryService::create. Null capabilities are absent from the
/// deployment; a null runner is built from `config->runner`.
struct ServiceDependencies {
  std::shared_ptr<const config::Config> config;
  std::shared_ptr<store::IMetadataStore> store;
  std::shared_ptr<vector::IVectorIndex> vector;
  std::shared_ptr<capability::IEmbedder> embedder;
  std::shared_ptr<capability::IExtractor> extractor;
  std::shared_ptr<capability::IBlobStore> blob;
  std::shared_ptr<runner::IWorkflowRunner> runner;
};

enum class PatchAction { Create, Update, Delete };

struct ItemPatch {
  PatchAction action = PatchAction::Update;
  std::string item_id;
  std::optional<std::string> text;
  std::optional<std::string> memory_type;
  std::optional<double> confidence;
  std::optional<bool> stable;
};

struct ReindexStats {
  std::size_t items = 0;
  std::size_t categories = 0;
  std::size_t resources = 0;
};

struct HealthReport {
  bool store_ok = false;
  bool vector_configured = false;
  std::string runner;
  std::string capabilities;
  std::string schema;
  std::uint64_t taxonomy_version = 0;
  std::string pipeline_revision;

  [[nodiscard]] bool ok() const { return store_ok; }
};

/// Public surface of the memory engine. Every call validates its scope against the
/// provisioned schema before touching a store; safe for concurrent use.
class MemoryService {
public:
  /// Builds every backend from configuration and provisions the tenancy schema.
  [[nodiscard]] static common::Result<std::unique_ptr<MemoryService>>
  create(const config::Config &config);
  [[nodiscard]] static common::Result<std::unique_ptr<MemoryService>>
  create(ServiceDependencies dependencies);

  [[nodiscard]] common::Result<pipeline::MemorizeResult>
  memorize(const scope::ScopeValues &scope, pipeline::MemorizeRequest request,
           const std::atomic<bool> *cancel = nullptr);

  [[nodiscard]] common::Result<pipeline::RetrieveResult>
  retrieve(const scope::SelectorSpec &selector, pipeline::RetrieveRequest request,
           const std::atomic<bool> *cancel = nullptr);
  [[nodiscard]] common::Result<pipeline::RetrieveResult>
  retrieve(const scope::ScopeValues &scope, pipeline::RetrieveRequest request,
           const std::atomic<bool> *cancel = nullptr);

  [[nodiscard]] common::Result<pipeline::EvolveResult>
  evolve(const scope::ScopeValues &scope, pipeline::EvolveRequest request = {},
         const std::atomic<bool> *cancel = nullptr);

  [[nodiscard]] common::Result<std::vector<store::MemoryCategory>>
  list_categories(const scope::ScopeValues &scope, bool include_summary = true);
  /// Looks the category up by id, then by name.
  [[nodiscard]] common::Result<store::MemoryCategory> get_category(const scope::ScopeValues &scope,
                                                                   const std::string &key);

  [[nodiscard]] common::Result<std::vector<store::MemoryItem>>
  list_items(const scope::ScopeValues &scope, const store::ItemFilter &filter = {});
  /// Create, revise or deactivate a single item outside the memorize pipeline. Updates
  /// write a new version; deletes deactivate.
  [[nodiscard]] common::Result<store::MemoryItem> patch_item(const scope::ScopeValues &scope,
                                                             const ItemPatch &patch);
  /// Hard-deletes one tenant from the metadata store and the vector index.
  [[nodiscard]] common::Result<store::PurgeStats> purge(const scope::ScopeValues &scope);

  [[nodiscard]] common::Result<store::RunLog> run_log(const std::string &run_id);
  [[nodiscard]] common::Result<std::vector<store::RunLog>> recent_runs(std::size_t limit = 20);
  [[nodiscard]] common::Result<std::vector<store::DiffRecord>>
  list_diffs(const scope::ScopeValues &scope, std::size_t limit = 20);

  [[nodiscard]] common::Result<pipeline::RevisionPtr>
  config_step(const std::string &workflow, const std::string &step_id,
              const std::map<std::string, std::string> &overrides);
  [[nodiscard]] common::Result<pipeline::RevisionPtr>
  insert_step_after(const std::string &workflow, const std::string &target_id,
                    pipeline::StepSpec step);
  [[nodiscard]] common::Result<pipeline::RevisionPtr>
  insert_step_before(const std::string &workflow, const std::string &target_id,
                     pipeline::StepSpec step);
  [[nodiscard]] common::Result<pipeline::RevisionPtr>
  replace_step(const std::string &workflow, const std::string &target_id, pipeline::StepSpec step);
  [[nodiscard]] common::Result<pipeline::RevisionPtr> remove_step(const std::string &workflow,
                                                                  const std::string &target_id);
  [[nodiscard]] common::Result<pipeline::RevisionPtr> rollback_pipeline(const std::string &workflow,
                                                                        std::uint64_t revision);
  [[nodiscard]] common::Result<std::vector<pipeline::RevisionPtr>>
  pipeline_history(const std::string &workflow) const;
  [[nodiscard]] common::Result<pipeline::RevisionPtr>
  current_pipeline(const std::string &workflow) const;

  /// Rebuilds the vector index of one scope from the metadata store.
  [[nodiscard]] common::Result<ReindexStats> reindex(const scope::ScopeValues &scope);
  /// Replays memorize and evolve runs whose checkpoints were left running. Returns the
  /// number of runs replayed.
  [[nodiscard]] common::Result<std::size_t> resume_pending();
  [[nodiscard]] HealthReport health_check();

  [[nodiscard]] const capability::CapabilitySet &capabilities() const { return capabilities_; }
  [[nodiscard]] const scope::TenancyManager &tenancy() const { return *tenancy_; }

private:
  /// Restricts construction to create() while still allowing std::make_unique.
  struct ConstructionKey {
    explicit ConstructionKey() = default;
  };

public:
  MemoryService(ConstructionKey, ServiceDependencies dependencies,
                std::shared_ptr<scope::TenancyManager> tenancy,
                capability::CapabilitySet capabilities);

private:

  [[nodiscard]] common::Result<pipeline::MemorizeResult>
  run_memorize(const scope::ScopeKey &key, pipeline::MemorizeRequest request,
               const std::string &run_id, const std::atomic<bool> *cancel);
  [[nodiscard]] common::Result<pipeline::EvolveResult>
  run_evolve(const scope::ScopeKey &key, pipeline::EvolveRequest request,
             const std::string &run_id, const std::atomic<bool> *cancel);
  [[nodiscard]] common::Result<pipeline::RevisionPtr>
  publish(common::Result<pipeline::RevisionPtr> revision);

  ServiceDependencies deps_;
  std::shared_ptr<scope::TenancyManager> tenancy_;
  capability::CapabilitySet capabilities_;
  pipeline::StepServices services_;
  pipeline::PipelineManager pipelines_;
  policy::RetrievalPolicyEngine policy_;
  scope::ScopeLocks locks_;
};

} // namespace strata::service
