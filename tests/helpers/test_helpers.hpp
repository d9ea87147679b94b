#pragma once

#include "strata/capability/http_client.hpp"
#include "strata/config/schema.hpp"
#include "strata/observability/observer.hpp"
#include "strata/pipeline/step.hpp"
#include "strata/store/metadata_store.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

namespace strata::testing {

/// In-memory store, brute-force vectors, local embeddings and rule extraction.
config::Config mock_config();

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

/// mock_config() with the SQLite store and blob root placed in the workspace.
config::Config temp_config(const TempWorkspace &workspace);

struct RecordedRequest {
  std::string url;
  capability::HttpHeaders headers;
  std::string body;
};

/// Replays queued responses in order; the last one repeats when the queue runs dry.
class MockHttpClient final : public capability::HttpClient {
public:
  void push(capability::HttpResponse response);
  void push_json(std::uint16_t status, std::string body);

  [[nodiscard]] capability::HttpResponse post_json(const std::string &url,
                                                   const capability::HttpHeaders &headers,
                                                   const std::string &body,
                                                   std::uint64_t timeout_ms) override;

  [[nodiscard]] std::vector<RecordedRequest> requests() const;

private:
  mutable std::mutex mutex_;
  std::deque<capability::HttpResponse> responses_;
  capability::HttpResponse last_;
  std::vector<RecordedRequest> requests_;
};

/// Forwards to a wrapped store and counts entity reads and commits.
class CountingStore final : public store::IMetadataStore {
public:
  explicit CountingStore(std::shared_ptr<store::IMetadataStore> inner);

  [[nodiscard]] std::string_view name() const override { return "counting"; }

  [[nodiscard]] common::Result<std::optional<store::ServiceMeta>> load_service_meta() override;
  [[nodiscard]] common::Status save_service_meta(const store::ServiceMeta &meta) override;
  [[nodiscard]] common::Status provision(const scope::ScopeSchema &schema) override;

  [[nodiscard]] common::Result<std::optional<store::Resource>>
  get_resource(const scope::ScopeKey &scope, const std::string &id) override;
  [[nodiscard]] common::Result<std::vector<store::Resource>>
  list_resources(const scope::ScopeSelector &selector,
                 const store::ResourceFilter &filter) override;
  [[nodiscard]] common::Result<std::optional<store::MemoryItem>>
  get_item(const scope::ScopeKey &scope, const std::string &id) override;
  [[nodiscard]] common::Result<std::vector<store::MemoryItem>>
  list_items(const scope::ScopeSelector &selector, const store::ItemFilter &filter) override;
  [[nodiscard]] common::Result<std::optional<store::MemoryCategory>>
  get_category(const scope::ScopeKey &scope, const std::string &id) override;
  [[nodiscard]] common::Result<std::vector<store::MemoryCategory>>
  list_categories(const scope::ScopeSelector &selector,
                  const store::CategoryFilter &filter) override;
  [[nodiscard]] common::Result<std::vector<store::CategoryItem>>
  list_links(const scope::ScopeSelector &selector, const store::LinkFilter &filter) override;
  [[nodiscard]] common::Result<std::optional<store::Intention>>
  get_intention(const scope::ScopeKey &scope) override;
  [[nodiscard]] common::Result<std::vector<store::Intention>>
  list_intentions(const scope::ScopeSelector &selector) override;

  [[nodiscard]] common::Status commit(const store::WriteBatch &batch) override;
  [[nodiscard]] common::Result<store::PurgeStats> purge_scope(const scope::ScopeKey &scope) override;

  [[nodiscard]] common::Status put_run_log(const store::RunLog &log) override;
  [[nodiscard]] common::Result<std::optional<store::RunLog>>
  get_run_log(const std::string &run_id) override;
  [[nodiscard]] common::Result<std::vector<store::RunLog>> list_run_logs(std::size_t limit) override;
  [[nodiscard]] common::Result<std::vector<store::DiffRecord>>
  list_diffs(const scope::ScopeKey &scope, std::size_t limit) override;

  [[nodiscard]] common::Status put_checkpoint(const store::Checkpoint &checkpoint) override;
  [[nodiscard]] common::Result<std::optional<store::Checkpoint>>
  get_checkpoint(const std::string &run_id) override;
  [[nodiscard]] common::Result<std::vector<store::Checkpoint>>
  list_checkpoints(const std::string &status) override;
  [[nodiscard]] common::Status delete_checkpoint(const std::string &run_id) override;

  [[nodiscard]] bool health_check() override { return inner_->health_check(); }

  std::atomic<std::size_t> reads{0};
  std::atomic<std::size_t> commits{0};
  // Fails the next N commits with TransientStore.
  std::atomic<int> fail_commits{0};
  // Each commit sleeps this long before reaching the inner store.
  std::atomic<std::uint32_t> commit_delay_ms{0};

private:
  std::shared_ptr<store::IMetadataStore> inner_;
};

struct RecordedTelemetry {
  std::mutex mutex;
  std::vector<observability::ObserverEvent> events;
  std::vector<observability::ObserverMetric> metrics;

  template <typename T> [[nodiscard]] std::size_t count_events() {
    std::lock_guard<std::mutex> lock(mutex);
    std::size_t n = 0;
    for (const auto &event : events) {
      n += std::holds_alternative<T>(event) ? 1 : 0;
    }
    return n;
  }
};

/// Copies everything it observes into a shared record that outlives the observer.
class RecordingObserver final : public observability::IObserver {
public:
  explicit RecordingObserver(std::shared_ptr<RecordedTelemetry> sink) : sink_(std::move(sink)) {}

  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

private:
  std::shared_ptr<RecordedTelemetry> sink_;
};

/// Installs a RecordingObserver globally and restores a no-op observer on destruction.
class ObserverGuard {
public:
  ObserverGuard();
  ~ObserverGuard();

  ObserverGuard(const ObserverGuard &) = delete;
  ObserverGuard &operator=(const ObserverGuard &) = delete;

  [[nodiscard]] RecordedTelemetry &telemetry() { return *sink_; }

private:
  std::shared_ptr<RecordedTelemetry> sink_;
};

/// A custom step over "extra.*" fields.
pipeline::StepSpec make_step(std::string id, std::vector<std::string> inputs,
                             std::vector<std::string> outputs, pipeline::StepHandler handler);

} // namespace strata::testing
