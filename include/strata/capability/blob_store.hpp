#pragma once

#include "strata/common/result.hpp"
#include "strata/config/schema.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace strata::capability {

/// Resolves a resource reference to its raw bytes.
class IBlobStore {
public:
  virtual ~IBlobStore() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<std::string> fetch(const std::string &uri) = 0;
};

/// Serves `file://` URIs and relative paths from beneath a root directory. References that
/// escape the root are rejected.
class LocalBlobStore final : public IBlobStore {
public:
  explicit LocalBlobStore(std::filesystem::path root);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<std::string> fetch(const std::string &uri) override;

  [[nodiscard]] common::Result<std::filesystem::path> resolve(const std::string &uri) const;

private:
  std::filesystem::path root_;
};

/// Returns nullptr when the deployment has no blob backend ("none").
[[nodiscard]] std::unique_ptr<IBlobStore> create_blob_store(const config::Config &config);

} // namespace strata::capability
