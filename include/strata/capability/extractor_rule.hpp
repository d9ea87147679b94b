#pragma once

#include "strata/capability/extractor.hpp"

namespace strata::capability {

/// Sentence-level heuristics. Conversations yield first-person declarative statements;
/// documents yield every declarative sentence with enough content.
class RuleExtractor final : public IExtractor {
public:
  RuleExtractor() = default;

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<std::vector<CandidateFact>>
  extract(const ExtractionRequest &request) override;
  [[nodiscard]] common::Result<std::string> summarize(const std::string &topic,
                                                      const std::vector<std::string> &texts,
                                                      std::size_t target_length) override;
  [[nodiscard]] common::Result<std::vector<double>>
  rerank(const std::string &query, const std::vector<std::string> &candidates) override;
  [[nodiscard]] common::Result<SufficiencyVerdict>
  judge_sufficiency(const std::string &query, const std::vector<std::string> &context) override;
  [[nodiscard]] common::Result<MediaDescription> describe_media(const store::Resource &resource,
                                                                const std::string &raw) override;
};

[[nodiscard]] std::string classify_memory_type(const std::string &sentence);
[[nodiscard]] std::string extract_subject(const std::string &sentence);
[[nodiscard]] std::vector<std::string> category_hints_for(const std::string &sentence);

} // namespace strata::capability
