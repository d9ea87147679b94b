#pragma once

#include "strata/capability/embedder.hpp"
#include "strata/capability/http_client.hpp"

#include <cstdint>

namespace strata::capability {

/// OpenAI-compatible /embeddings endpoint.
class OpenAiEmbedder final : public IEmbedder {
public:
  OpenAiEmbedder(std::string api_key, std::string model, std::size_t dimensions,
                 std::string base_url, std::uint64_t timeout_ms,
                 std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>());

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts) override;
  [[nodiscard]] std::size_t dimensions() const override;

private:
  std::string api_key_;
  std::string model_;
  std::size_t dimensions_;
  std::string base_url_;
  std::uint64_t timeout_ms_;
  std::shared_ptr<HttpClient> http_client_;
};

/// Parses the `data[].embedding` arrays of an embeddings response, ordered by `index`.
[[nodiscard]] common::Result<std::vector<std::vector<float>>>
parse_embedding_response(const std::string &body);

} // namespace strata::capability
