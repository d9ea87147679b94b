#include "strata/capability/embedder_local.hpp"

#include "strata/common/text.hpp"

#include <cmath>
#include <cstdint>

namespace strata::capability {

namespace {

constexpr float kTermWeight = 1.0F;
constexpr float kTrigramWeight = 0.35F;

// FNV-1a keeps persisted vectors comparable across builds and platforms.
std::uint64_t fnv1a(const std::string_view text) {
  std::uint64_t hash = 14695981039346656037ULL;
  for (const char ch : text) {
    hash ^= static_cast<unsigned char>(ch);
    hash *= 1099511628211ULL;
  }
  return hash;
}

void add_feature(std::vector<float> &values, const std::string_view feature, const float weight) {
  const auto hash = fnv1a(feature);
  const std::size_t idx = hash % values.size();
  const float sign = ((hash >> 63U) & 1U) != 0U ? -1.0F : 1.0F;
  values[idx] += sign * weight;
}

void normalize(std::vector<float> &values) {
  double norm = 0.0;
  for (float v : values) {
    norm += static_cast<double>(v) * static_cast<double>(v);
  }
  norm = std::sqrt(norm);
  if (norm < 1e-9) {
    return;
  }
  for (float &v : values) {
    v = static_cast<float>(static_cast<double>(v) / norm);
  }
}

} // namespace

LocalEmbedder::LocalEmbedder(const std::size_t dimensions)
    : dimensions_(dimensions == 0 ? kDefaultDimensions : dimensions) {}

std::string_view LocalEmbedder::name() const { return "local"; }

common::Result<std::vector<float>> LocalEmbedder::embed(const std::string_view text) {
  std::vector<float> values(dimensions_, 0.0F);

  for (const auto &term : common::content_terms(std::string(text))) {
    add_feature(values, term, kTermWeight);
    if (term.size() < 3) {
      continue;
    }
    const std::string padded = "#" + term + "#";
    for (std::size_t i = 0; i + 3 <= padded.size(); ++i) {
      add_feature(values, std::string_view(padded).substr(i, 3), kTrigramWeight);
    }
  }

  normalize(values);
  return common::Result<std::vector<float>>::success(std::move(values));
}

common::Result<std::vector<std::vector<float>>>
LocalEmbedder::embed_batch(const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> out;
  out.reserve(texts.size());
  for (const auto &text : texts) {
    auto emb = embed(text);
    if (!emb.ok()) {
      return common::Result<std::vector<std::vector<float>>>::failure(emb.error_info());
    }
    out.push_back(std::move(emb.value()));
  }
  return common::Result<std::vector<std::vector<float>>>::success(std::move(out));
}

std::size_t LocalEmbedder::dimensions() const { return dimensions_; }

} // namespace strata::capability
