#include "strata/store/records.hpp"

#include "strata/common/fs.hpp"
#include "strata/common/hash.hpp"
#include "strata/common/json_util.hpp"
#include "strata/common/text.hpp"

#include <cstdlib>

namespace strata::store {

namespace {

std::size_t to_size(const std::string &value) {
  if (value.empty()) {
    return 0;
  }
  return static_cast<std::size_t>(std::strtoull(value.c_str(), nullptr, 10));
}

std::optional<int> to_optional_int(const std::string &value) {
  if (value.empty() || value == "null") {
    return std::nullopt;
  }
  return static_cast<int>(std::strtol(value.c_str(), nullptr, 10));
}

std::string field_or_empty(const common::JsonFlatMap &map, const std::string &key) {
  const auto it = map.find(key);
  return it == map.end() ? "" : it->second;
}

} // namespace

std::string modality_to_string(const Modality modality) {
  switch (modality) {
  case Modality::Conversation:
    return "conversation";
  case Modality::Document:
    return "document";
  case Modality::Image:
    return "image";
  case Modality::Audio:
    return "audio";
  case Modality::Video:
    return "video";
  case Modality::Text:
    return "text";
  }
  return "text";
}

common::Result<Modality> modality_from_string(const std::string_view value) {
  const std::string lowered = common::to_lower(std::string(value));
  if (lowered == "conversation") {
    return common::Result<Modality>::success(Modality::Conversation);
  }
  if (lowered == "document") {
    return common::Result<Modality>::success(Modality::Document);
  }
  if (lowered == "image") {
    return common::Result<Modality>::success(Modality::Image);
  }
  if (lowered == "audio") {
    return common::Result<Modality>::success(Modality::Audio);
  }
  if (lowered == "video") {
    return common::Result<Modality>::success(Modality::Video);
  }
  if (lowered == "text") {
    return common::Result<Modality>::success(Modality::Text);
  }
  return common::Result<Modality>::failure(common::ErrorKind::Validation,
                                           "unknown modality: " + std::string(value));
}

bool is_media(const Modality modality) {
  return modality == Modality::Image || modality == Modality::Audio ||
         modality == Modality::Video;
}

std::string run_status_to_string(const RunStatus status) {
  switch (status) {
  case RunStatus::Running:
    return "running";
  case RunStatus::Succeeded:
    return "succeeded";
  case RunStatus::Failed:
    return "failed";
  case RunStatus::Degraded:
    return "degraded";
  case RunStatus::Cancelled:
    return "cancelled";
  }
  return "failed";
}

RunStatus run_status_from_string(const std::string_view value) {
  if (value == "running") {
    return RunStatus::Running;
  }
  if (value == "succeeded") {
    return RunStatus::Succeeded;
  }
  if (value == "degraded") {
    return RunStatus::Degraded;
  }
  if (value == "cancelled") {
    return RunStatus::Cancelled;
  }
  return RunStatus::Failed;
}

std::optional<common::ErrorKind> error_kind_from_string(const std::string_view value) {
  for (const auto kind :
       {common::ErrorKind::ScopeSchemaMismatch, common::ErrorKind::PolicyViolation,
        common::ErrorKind::CapabilityUnavailable, common::ErrorKind::TransientStore,
        common::ErrorKind::TransientCapability, common::ErrorKind::Validation,
        common::ErrorKind::NotFound, common::ErrorKind::Cancelled, common::ErrorKind::Internal}) {
    if (common::error_kind_name(kind) == value) {
      return kind;
    }
  }
  return std::nullopt;
}

std::string encode_string_list(const std::vector<std::string> &values) {
  return common::json_string_array(values);
}

std::vector<std::string> decode_string_list(const std::string &json) {
  if (json.empty()) {
    return {};
  }
  return common::json_get_string_array("{\"v\":" + json + "}", "v");
}

std::string encode_evidence(const Evidence &evidence) {
  std::string out = "{\"offset\":" + std::to_string(evidence.offset) +
                    ",\"length\":" + std::to_string(evidence.length);
  if (evidence.page.has_value()) {
    out += ",\"page\":" + std::to_string(*evidence.page);
  }
  if (evidence.segment.has_value()) {
    out += ",\"segment\":" + std::to_string(*evidence.segment);
  }
  if (!evidence.timestamp.empty()) {
    out += ",\"timestamp\":" + common::json_quote(evidence.timestamp);
  }
  return out + "}";
}

Evidence decode_evidence(const std::string &json) {
  const auto map = common::json_parse_flat(json);
  Evidence evidence;
  evidence.offset = to_size(field_or_empty(map, "offset"));
  evidence.length = to_size(field_or_empty(map, "length"));
  evidence.page = to_optional_int(field_or_empty(map, "page"));
  const std::string segment = field_or_empty(map, "segment");
  if (!segment.empty() && segment != "null") {
    evidence.segment = to_size(segment);
  }
  evidence.timestamp = field_or_empty(map, "timestamp");
  return evidence;
}

std::string encode_segments(const std::vector<Segment> &segments) {
  std::string out = "[";
  for (std::size_t i = 0; i < segments.size(); ++i) {
    const auto &segment = segments[i];
    if (i > 0) {
      out += ",";
    }
    out += "{\"offset\":" + std::to_string(segment.offset) +
           ",\"length\":" + std::to_string(segment.length);
    if (segment.page.has_value()) {
      out += ",\"page\":" + std::to_string(*segment.page);
    }
    if (!segment.speaker.empty()) {
      out += ",\"speaker\":" + common::json_quote(segment.speaker);
    }
    if (!segment.timestamp.empty()) {
      out += ",\"timestamp\":" + common::json_quote(segment.timestamp);
    }
    out += "}";
  }
  return out + "]";
}

std::vector<Segment> decode_segments(const std::string &json) {
  std::vector<Segment> out;
  for (const auto &object : common::json_split_top_level_objects(json)) {
    const auto map = common::json_parse_flat(object);
    Segment segment;
    segment.offset = to_size(field_or_empty(map, "offset"));
    segment.length = to_size(field_or_empty(map, "length"));
    segment.page = to_optional_int(field_or_empty(map, "page"));
    segment.speaker = field_or_empty(map, "speaker");
    segment.timestamp = field_or_empty(map, "timestamp");
    out.push_back(std::move(segment));
  }
  return out;
}

std::string encode_steps(const std::vector<StepRecord> &steps) {
  std::string out = "[";
  for (std::size_t i = 0; i < steps.size(); ++i) {
    const auto &step = steps[i];
    if (i > 0) {
      out += ",";
    }
    out += "{\"step_id\":" + common::json_quote(step.step_id) +
           ",\"attempts\":" + std::to_string(step.attempts) +
           ",\"duration_ms\":" + std::to_string(step.duration_ms) +
           ",\"status\":" + common::json_quote(step.status) +
           ",\"error\":" + common::json_quote(step.error) + "}";
  }
  return out + "]";
}

std::vector<StepRecord> decode_steps(const std::string &json) {
  std::vector<StepRecord> out;
  for (const auto &object : common::json_split_top_level_objects(json)) {
    const auto map = common::json_parse_flat(object);
    StepRecord step;
    step.step_id = field_or_empty(map, "step_id");
    step.attempts = static_cast<std::uint32_t>(to_size(field_or_empty(map, "attempts")));
    step.duration_ms = to_size(field_or_empty(map, "duration_ms"));
    step.status = field_or_empty(map, "status");
    step.error = field_or_empty(map, "error");
    out.push_back(std::move(step));
  }
  return out;
}

std::string encode_changes(const std::vector<DiffChange> &changes) {
  std::string out = "[";
  for (std::size_t i = 0; i < changes.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += "{\"kind\":" + common::json_quote(changes[i].kind) +
           ",\"target_id\":" + common::json_quote(changes[i].target_id) +
           ",\"detail\":" + common::json_quote(changes[i].detail) + "}";
  }
  return out + "]";
}

std::vector<DiffChange> decode_changes(const std::string &json) {
  std::vector<DiffChange> out;
  for (const auto &object : common::json_split_top_level_objects(json)) {
    const auto map = common::json_parse_flat(object);
    out.push_back(DiffChange{.kind = field_or_empty(map, "kind"),
                             .target_id = field_or_empty(map, "target_id"),
                             .detail = field_or_empty(map, "detail")});
  }
  return out;
}

std::string item_content_hash(const std::string &memory_type, const std::string &text) {
  std::string normalized = common::normalize_whitespace(text);
  while (!normalized.empty() &&
         (normalized.back() == '.' || normalized.back() == '!' || normalized.back() == '?')) {
    normalized.pop_back();
  }
  return common::sha256_hex(memory_type + ":" + normalized).substr(0, 16);
}

} // namespace strata::store
