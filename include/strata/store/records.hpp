#pragma once

#include "strata/common/error.hpp"
#include "strata/common/result.hpp"
#include "strata/scope/scope.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata::store {

enum class Modality {
  Conversation,
  Document,
  Image,
  Audio,
  Video,
  Text,
};

[[nodiscard]] std::string modality_to_string(Modality modality);
[[nodiscard]] common::Result<Modality> modality_from_string(std::string_view value);
/// Image, audio and video resources need a caption or transcription before extraction.
[[nodiscard]] bool is_media(Modality modality);

struct Segment {
  std::size_t offset = 0;
  std::size_t length = 0;
  std::optional<int> page;
  std::string speaker;
  std::string timestamp;
};

struct Resource {
  std::string id;
  scope::ScopeKey scope;
  std::string uri;
  std::string content;
  Modality modality = Modality::Conversation;
  std::string content_hash;
  std::string created_at;
  std::optional<std::string> supersedes;
  std::string caption;
  std::string transcription;
  std::vector<Segment> segments;
};

struct Evidence {
  std::size_t offset = 0;
  std::size_t length = 0;
  std::optional<int> page;
  std::optional<std::size_t> segment;
  std::string timestamp;
};

struct MemoryItem {
  std::string id;
  scope::ScopeKey scope;
  std::string resource_id;
  std::string lineage_id;
  std::string memory_type = "knowledge";
  std::string text;
  std::string subject;
  std::string content_hash;
  Evidence evidence;
  double confidence = 0.5;
  bool stable = true;
  std::uint64_t version = 1;
  bool active = true;
  std::uint32_t reinforcement_count = 0;
  std::optional<std::string> superseded_by;
  std::string created_at;
  std::string updated_at;
  std::vector<float> embedding;
};

struct MemoryCategory {
  std::string id;
  scope::ScopeKey scope;
  std::string name;
  std::string description;
  std::string summary;
  std::vector<std::string> anchors;
  std::string created_at;
  std::string updated_at;
  std::vector<float> embedding;
};

struct CategoryItem {
  scope::ScopeKey scope;
  std::string category_id;
  std::string item_id;
  std::string created_at;
};

struct Intention {
  scope::ScopeKey scope;
  std::vector<std::string> goals;
  std::vector<std::string> constraints;
  std::string summary;
  std::uint64_t version = 0;
  std::vector<std::string> source_items;
  std::string updated_at;
};

enum class RunStatus {
  Running,
  Succeeded,
  Failed,
  Degraded,
  Cancelled,
};

[[nodiscard]] std::string run_status_to_string(RunStatus status);
[[nodiscard]] RunStatus run_status_from_string(std::string_view value);

struct StepRecord {
  std::string step_id;
  std::uint32_t attempts = 0;
  std::uint64_t duration_ms = 0;
  // ok | failed | skipped | degraded | timeout
  std::string status;
  std::string error;
};

struct RunLog {
  std::string run_id;
  std::string workflow;
  std::uint64_t revision = 0;
  scope::ScopeKey scope;
  RunStatus status = RunStatus::Running;
  std::string input_summary;
  std::vector<StepRecord> steps;
  std::optional<common::Error> error;
  std::string started_at;
  std::string finished_at;
};

struct DiffChange {
  // item_revised | item_linked | item_deactivated | category_refreshed | intention_updated
  std::string kind;
  std::string target_id;
  std::string detail;
};

struct DiffRecord {
  std::string id;
  std::string run_id;
  scope::ScopeKey scope;
  std::string summary;
  std::vector<DiffChange> changes;
  std::string created_at;
};

/// Single deployment-wide metadata record.
struct ServiceMeta {
  std::string fingerprint;
  std::uint64_t schema_version = 1;
  std::string fields;
  std::uint64_t taxonomy_version = 1;
  std::string pipeline_revision;
  std::string created_at;
  std::string updated_at;
};

struct Checkpoint {
  std::string run_id;
  std::string workflow;
  std::uint64_t revision = 0;
  scope::ScopeKey scope;
  std::vector<std::string> completed_steps;
  // running | done | failed
  std::string status = "running";
  std::string payload;
  std::string updated_at;
};

/// JSON text codecs shared by persistent backends and checkpoint payloads.
[[nodiscard]] std::string encode_string_list(const std::vector<std::string> &values);
[[nodiscard]] std::vector<std::string> decode_string_list(const std::string &json);
[[nodiscard]] std::string encode_evidence(const Evidence &evidence);
[[nodiscard]] Evidence decode_evidence(const std::string &json);
[[nodiscard]] std::string encode_segments(const std::vector<Segment> &segments);
[[nodiscard]] std::vector<Segment> decode_segments(const std::string &json);
[[nodiscard]] std::string encode_steps(const std::vector<StepRecord> &steps);
[[nodiscard]] std::vector<StepRecord> decode_steps(const std::string &json);
[[nodiscard]] std::string encode_changes(const std::vector<DiffChange> &changes);
[[nodiscard]] std::vector<DiffChange> decode_changes(const std::string &json);
[[nodiscard]] std::optional<common::ErrorKind> error_kind_from_string(std::string_view value);

/// First 16 hex characters of SHA-256 over "type:normalized text".
[[nodiscard]] std::string item_content_hash(const std::string &memory_type,
                                            const std::string &text);

} // namespace strata::store
