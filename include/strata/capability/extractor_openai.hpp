#pragma once

#include "strata/capability/extractor.hpp"
#include "strata/capability/http_client.hpp"

#include <cstdint>

namespace strata::capability {

/// OpenAI-compatible chat completions. Each task asks for a JSON object and parses the
/// first balanced JSON blob of the reply.
class OpenAiExtractor final : public IExtractor {
public:
  OpenAiExtractor(std::string api_key, std::string model, std::string base_url,
                  double temperature, std::uint64_t timeout_ms,
                  std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>());

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

private:
  /// Sends one system+user exchange and returns the JSON blob of the reply.
  [[nodiscard]] common::Result<std::string> complete_json(const std::string &system_prompt,
                                                          const std::string &user_prompt);

  std::string api_key_;
  std::string model_;
  std::string base_url_;
  double temperature_;
  std::uint64_t timeout_ms_;
  std::shared_ptr<HttpClient> http_client_;
};

/// Pulls `choices[0].message.content` out of a chat completions response.
[[nodiscard]] common::Result<std::string> parse_chat_content(const std::string &body);

/// Parses {"facts":[...]} and anchors each fact's evidence in `source`.
[[nodiscard]] common::Result<std::vector<CandidateFact>>
parse_facts(const std::string &json, const std::string &source,
            const std::vector<std::string> &memory_types);

} // namespace strata::capability
