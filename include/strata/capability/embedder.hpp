#pragma once

#include "strata/common/result.hpp"
#include "strata/config/schema.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace strata::capability {

/// Text to fixed-dimension vector. Output dimension must equal the vector index's.
class IEmbedder {
public:
  virtual ~IEmbedder() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<std::vector<float>> embed(std::string_view text) = 0;
  [[nodiscard]] virtual common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts) = 0;
  [[nodiscard]] virtual std::size_t dimensions() const = 0;
};

/// Returns nullptr when the deployment declares no embedding capability ("none").
[[nodiscard]] std::unique_ptr<IEmbedder> create_embedder(const config::Config &config);

/// `config.api_key`, else $STRATA_API_KEY.
[[nodiscard]] std::string resolve_api_key(const config::Config &config);

} // namespace strata::capability
