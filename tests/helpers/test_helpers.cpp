#include "tests/helpers/test_helpers.hpp"

#include "strata/observability/global.hpp"
#include "strata/observability/noop_observer.hpp"

#include <chrono>
#include <fstream>
#include <random>
#include <thread>

namespace strata::testing {

config::Config mock_config() {
  config::Config config;
  config.tenancy.fields = {"project_id:string", "agent_id:string"};
  config.store.backend = "memory";
  config.vector.backend = "brute_force";
  config.embedding.provider = "local";
  config.embedding.dimensions = 64;
  config.extraction.provider = "rule";
  config.blob.backend = "none";
  config.runner.kind = "inline";
  config.runner.backoff_ms = 1;
  config.observability.backend = "none";
  return config;
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("strata-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc | std::ios::binary);
  out << content;
}

config::Config temp_config(const TempWorkspace &workspace) {
  auto config = mock_config();
  config.store.backend = "sqlite";
  config.store.path = (workspace.path() / "strata.db").string();
  config.blob.backend = "local";
  config.blob.root = (workspace.path() / "resources").string();

  std::error_code ec;
  std::filesystem::create_directories(workspace.path() / "resources", ec);
  return config;
}

void MockHttpClient::push(capability::HttpResponse response) {
  std::lock_guard<std::mutex> lock(mutex_);
  responses_.push_back(std::move(response));
}

void MockHttpClient::push_json(const std::uint16_t status, std::string body) {
  capability::HttpResponse response;
  response.status = status;
  response.body = std::move(body);
  push(std::move(response));
}

capability::HttpResponse MockHttpClient::post_json(const std::string &url,
                                                   const capability::HttpHeaders &headers,
                                                   const std::string &body, std::uint64_t) {
  std::lock_guard<std::mutex> lock(mutex_);
  requests_.push_back(RecordedRequest{.url = url, .headers = headers, .body = body});
  if (!responses_.empty()) {
    last_ = responses_.front();
    responses_.pop_front();
  }
  return last_;
}

std::vector<RecordedRequest> MockHttpClient::requests() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_;
}

CountingStore::CountingStore(std::shared_ptr<store::IMetadataStore> inner)
    : inner_(std::move(inner)) {}

common::Result<std::optional<store::ServiceMeta>> CountingStore::load_service_meta() {
  return inner_->load_service_meta();
}

common::Status CountingStore::save_service_meta(const store::ServiceMeta &meta) {
  return inner_->save_service_meta(meta);
}

common::Status CountingStore::provision(const scope::ScopeSchema &schema) {
  return inner_->provision(schema);
}

common::Result<std::optional<store::Resource>>
CountingStore::get_resource(const scope::ScopeKey &scope, const std::string &id) {
  ++reads;
  return inner_->get_resource(scope, id);
}

common::Result<std::vector<store::Resource>>
CountingStore::list_resources(const scope::ScopeSelector &selector,
                              const store::ResourceFilter &filter) {
  ++reads;
  return inner_->list_resources(selector, filter);
}

common::Result<std::optional<store::MemoryItem>>
CountingStore::get_item(const scope::ScopeKey &scope, const std::string &id) {
  ++reads;
  return inner_->get_item(scope, id);
}

common::Result<std::vector<store::MemoryItem>>
CountingStore::list_items(const scope::ScopeSelector &selector, const store::ItemFilter &filter) {
  ++reads;
  return inner_->list_items(selector, filter);
}

common::Result<std::optional<store::MemoryCategory>>
CountingStore::get_category(const scope::ScopeKey &scope, const std::string &id) {
  ++reads;
  return inner_->get_category(scope, id);
}

common::Result<std::vector<store::MemoryCategory>>
CountingStore::list_categories(const scope::ScopeSelector &selector,
                               const store::CategoryFilter &filter) {
  ++reads;
  return inner_->list_categories(selector, filter);
}

common::Result<std::vector<store::CategoryItem>>
CountingStore::list_links(const scope::ScopeSelector &selector, const store::LinkFilter &filter) {
  ++reads;
  return inner_->list_links(selector, filter);
}

common::Result<std::optional<store::Intention>>
CountingStore::get_intention(const scope::ScopeKey &scope) {
  ++reads;
  return inner_->get_intention(scope);
}

common::Result<std::vector<store::Intention>>
CountingStore::list_intentions(const scope::ScopeSelector &selector) {
  ++reads;
  return inner_->list_intentions(selector);
}

common::Status CountingStore::commit(const store::WriteBatch &batch) {
  if (fail_commits.load() > 0) {
    --fail_commits;
    return common::Status::error(common::ErrorKind::TransientStore, "database is locked");
  }
  if (const auto delay = commit_delay_ms.load(); delay > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(delay));
  }
  ++commits;
  return inner_->commit(batch);
}

common::Result<store::PurgeStats> CountingStore::purge_scope(const scope::ScopeKey &scope) {
  return inner_->purge_scope(scope);
}

common::Status CountingStore::put_run_log(const store::RunLog &log) {
  return inner_->put_run_log(log);
}

common::Result<std::optional<store::RunLog>> CountingStore::get_run_log(const std::string &run_id) {
  return inner_->get_run_log(run_id);
}

common::Result<std::vector<store::RunLog>> CountingStore::list_run_logs(const std::size_t limit) {
  return inner_->list_run_logs(limit);
}

common::Result<std::vector<store::DiffRecord>>
CountingStore::list_diffs(const scope::ScopeKey &scope, const std::size_t limit) {
  return inner_->list_diffs(scope, limit);
}

common::Status CountingStore::put_checkpoint(const store::Checkpoint &checkpoint) {
  return inner_->put_checkpoint(checkpoint);
}

common::Result<std::optional<store::Checkpoint>>
CountingStore::get_checkpoint(const std::string &run_id) {
  return inner_->get_checkpoint(run_id);
}

common::Result<std::vector<store::Checkpoint>>
CountingStore::list_checkpoints(const std::string &status) {
  return inner_->list_checkpoints(status);
}

common::Status CountingStore::delete_checkpoint(const std::string &run_id) {
  return inner_->delete_checkpoint(run_id);
}

void RecordingObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(sink_->mutex);
  sink_->events.push_back(event);
}

void RecordingObserver::record_metric(const observability::ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(sink_->mutex);
  sink_->metrics.push_back(metric);
}

ObserverGuard::ObserverGuard() : sink_(std::make_shared<RecordedTelemetry>()) {
  observability::set_global_observer(std::make_unique<RecordingObserver>(sink_));
}

ObserverGuard::~ObserverGuard() {
  observability::set_global_observer(std::make_unique<observability::NoopObserver>());
}

pipeline::StepSpec make_step(std::string id, std::vector<std::string> inputs,
                             std::vector<std::string> outputs, pipeline::StepHandler handler) {
  pipeline::StepSpec step;
  step.id = std::move(id);
  step.role = pipeline::Role::Custom;
  step.inputs = std::move(inputs);
  step.outputs = std::move(outputs);
  step.capabilities = std::vector<capability::Capability>{};
  step.handler = std::move(handler);
  return step;
}

} // namespace strata::testing
