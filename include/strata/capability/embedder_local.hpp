#pragma once

#include "strata/capability/embedder.hpp"

namespace strata::capability {

/// Deterministic feature hashing over content terms and character trigrams. Texts that
/// share vocabulary land close together; no model is involved.
class LocalEmbedder final : public IEmbedder {
public:
  explicit LocalEmbedder(std::size_t dimensions = kDefaultDimensions);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts) override;
  [[nodiscard]] std::size_t dimensions() const override;

  static constexpr std::size_t kDefaultDimensions = 384;

private:
  std::size_t dimensions_;
};

} // namespace strata::capability
