#include "strata/capability/extractor.hpp"

#include "strata/capability/embedder.hpp"
#include "strata/capability/extractor_openai.hpp"
#include "strata/capability/extractor_rule.hpp"
#include "strata/common/fs.hpp"
#include "strata/observability/global.hpp"

namespace strata::capability {

std::unique_ptr<IExtractor> create_extractor(const config::Config &config) {
  const std::string provider = common::to_lower(common::trim(config.extraction.provider));

  if (provider == "none") {
    return nullptr;
  }

  if (provider == "openai") {
    const std::string key = resolve_api_key(config);
    if (!key.empty()) {
      return std::make_unique<OpenAiExtractor>(key, config.extraction.model,
                                               config.extraction.base_url,
                                               config.extraction.temperature,
                                               config.extraction.timeout_ms);
    }
    observability::record_error("extraction", "openai provider without API key; using rule");
  }

  return std::make_unique<RuleExtractor>();
}

} // namespace strata::capability
