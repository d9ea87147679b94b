#pragma once

#include "strata/common/result.hpp"
#include "strata/config/schema.hpp"
#include "strata/store/records.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace strata::capability {

struct ExtractionRequest {
  std::string text;
  store::Modality modality = store::Modality::Conversation;
  std::vector<std::string> memory_types;
  std::vector<store::Segment> segments;
  // Existing category names, offered as classification hints.
  std::vector<std::string> categories;
};

struct CandidateFact {
  std::string text;
  std::string memory_type;
  std::string subject;
  store::Evidence evidence;
  double confidence = 0.8;
  bool stable = true;
  std::vector<std::string> category_hints;
};

struct SufficiencyVerdict {
  bool sufficient = false;
  // Query for the next layer, reduced to what the gathered context did not answer.
  std::string next_query;
  std::string reason;
};

struct MediaDescription {
  std::string caption;
  std::string transcription;
};

/// Extraction and reasoning collaborator. Failures carry TransientCapability when a retry
/// may succeed and a fatal kind otherwise.
class IExtractor {
public:
  virtual ~IExtractor() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;

  [[nodiscard]] virtual common::Result<std::vector<CandidateFact>>
  extract(const ExtractionRequest &request) = 0;

  [[nodiscard]] virtual common::Result<std::string>
  summarize(const std::string &topic, const std::vector<std::string> &texts,
            std::size_t target_length) = 0;

  /// One relevance score in [0, 1] per candidate, in input order.
  [[nodiscard]] virtual common::Result<std::vector<double>>
  rerank(const std::string &query, const std::vector<std::string> &candidates) = 0;

  [[nodiscard]] virtual common::Result<SufficiencyVerdict>
  judge_sufficiency(const std::string &query, const std::vector<std::string> &context) = 0;

  [[nodiscard]] virtual common::Result<MediaDescription>
  describe_media(const store::Resource &resource, const std::string &raw) = 0;
};

/// Returns nullptr when extraction is disabled ("none").
[[nodiscard]] std::unique_ptr<IExtractor> create_extractor(const config::Config &config);

/// Term-coverage verdict: sufficient when every content term of the query occurs in the
/// context; the next query keeps the uncovered terms.
[[nodiscard]] SufficiencyVerdict judge_by_coverage(const std::string &query,
                                                   const std::vector<std::string> &context);

} // namespace strata::capability
