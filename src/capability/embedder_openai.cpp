#include "strata/capability/embedder_openai.hpp"

#include "strata/common/json_util.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <utility>

namespace strata::capability {

namespace {

using Batch = std::vector<std::vector<float>>;

common::Result<std::vector<float>> parse_float_array(const std::string &array) {
  if (array.size() < 2 || array.front() != '[') {
    return common::Result<std::vector<float>>::failure("embedding array parse failed");
  }
  std::vector<float> values;
  std::stringstream stream(array.substr(1, array.size() - 2));
  std::string item;
  while (std::getline(stream, item, ',')) {
    const char *begin = item.c_str();
    char *end = nullptr;
    errno = 0;
    const float value = std::strtof(begin, &end);
    if (end == begin || errno == ERANGE) {
      return common::Result<std::vector<float>>::failure("invalid embedding value");
    }
    values.push_back(value);
  }
  return common::Result<std::vector<float>>::success(std::move(values));
}

} // namespace

common::Result<Batch> parse_embedding_response(const std::string &body) {
  const std::string data = common::json_get_array(body, "data");
  if (data.empty()) {
    return common::Result<Batch>::failure("embedding response has no data array");
  }

  std::vector<std::pair<long, std::vector<float>>> indexed;
  long position = 0;
  for (const auto &object : common::json_split_top_level_objects(data)) {
    auto values = parse_float_array(common::json_get_array(object, "embedding"));
    if (!values.ok()) {
      return common::Result<Batch>::failure(values.error());
    }
    const std::string index = common::json_get_number(object, "index");
    const long slot = index.empty() ? position : std::strtol(index.c_str(), nullptr, 10);
    indexed.emplace_back(slot, std::move(values.value()));
    ++position;
  }

  std::sort(indexed.begin(), indexed.end(),
            [](const auto &a, const auto &b) { return a.first < b.first; });
  Batch out;
  out.reserve(indexed.size());
  for (auto &[slot, values] : indexed) {
    out.push_back(std::move(values));
  }
  return common::Result<Batch>::success(std::move(out));
}

OpenAiEmbedder::OpenAiEmbedder(std::string api_key, std::string model, const std::size_t dimensions,
                               std::string base_url, const std::uint64_t timeout_ms,
                               std::shared_ptr<HttpClient> http_client)
    : api_key_(std::move(api_key)), model_(std::move(model)), dimensions_(dimensions),
      base_url_(std::move(base_url)), timeout_ms_(timeout_ms),
      http_client_(std::move(http_client)) {}

std::string_view OpenAiEmbedder::name() const { return "openai"; }

common::Result<std::vector<float>> OpenAiEmbedder::embed(const std::string_view text) {
  auto batch = embed_batch({std::string(text)});
  if (!batch.ok()) {
    return common::Result<std::vector<float>>::failure(batch.error_info());
  }
  return common::Result<std::vector<float>>::success(std::move(batch.value().front()));
}

common::Result<Batch> OpenAiEmbedder::embed_batch(const std::vector<std::string> &texts) {
  if (texts.empty()) {
    return common::Result<Batch>::success({});
  }
  if (api_key_.empty()) {
    return common::Result<Batch>::failure(common::ErrorKind::CapabilityUnavailable,
                                          "missing API key");
  }

  std::ostringstream body;
  body << "{";
  body << "\"model\":" << common::json_quote(model_) << ",";
  body << "\"dimensions\":" << dimensions_ << ",";
  body << "\"input\":" << common::json_string_array(texts);
  body << "}";

  const HttpHeaders headers = {
      {"Content-Type", "application/json"},
      {"Authorization", "Bearer " + api_key_},
  };

  const auto response =
      http_client_->post_json(base_url_ + "/embeddings", headers, body.str(), timeout_ms_);
  auto payload = classify_response(response, "embedding request");
  if (!payload.ok()) {
    return common::Result<Batch>::failure(payload.error_info());
  }

  auto parsed = parse_embedding_response(payload.value());
  if (!parsed.ok()) {
    return parsed;
  }
  if (parsed.value().size() != texts.size()) {
    return common::Result<Batch>::failure("embedding response count mismatch");
  }
  for (const auto &values : parsed.value()) {
    if (values.size() != dimensions_) {
      return common::Result<Batch>::failure("embedding dimension mismatch: expected " +
                                            std::to_string(dimensions_) + ", got " +
                                            std::to_string(values.size()));
    }
  }
  return parsed;
}

std::size_t OpenAiEmbedder::dimensions() const { return dimensions_; }

} // namespace strata::capability
