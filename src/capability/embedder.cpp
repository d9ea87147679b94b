#include "strata/capability/embedder.hpp"

#include "strata/capability/embedder_local.hpp"
#include "strata/capability/embedder_noop.hpp"
#include "strata/capability/embedder_openai.hpp"
#include "strata/common/fs.hpp"
#include "strata/observability/global.hpp"

#include <cstdlib>

namespace strata::capability {

std::string resolve_api_key(const config::Config &config) {
  if (config.api_key.has_value() && !config.api_key->empty()) {
    return *config.api_key;
  }
  if (const char *env = std::getenv("STRATA_API_KEY"); env != nullptr) {
    return env;
  }
  return "";
}

std::unique_ptr<IEmbedder> create_embedder(const config::Config &config) {
  const std::string provider = common::to_lower(common::trim(config.embedding.provider));

  if (provider == "none") {
    return nullptr;
  }

  if (provider == "noop") {
    return std::make_unique<NoopEmbedder>(config.embedding.dimensions);
  }

  if (provider == "openai") {
    const std::string key = resolve_api_key(config);
    if (!key.empty()) {
      return std::make_unique<OpenAiEmbedder>(key, config.embedding.model,
                                              config.embedding.dimensions,
                                              config.embedding.base_url,
                                              config.embedding.timeout_ms);
    }
    observability::record_error("embedding", "openai provider without API key; using local");
  }

  return std::make_unique<LocalEmbedder>(config.embedding.dimensions);
}

} // namespace strata::capability
