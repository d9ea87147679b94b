#include "strata/capability/blob_store.hpp"

#include "strata/common/fs.hpp"

#include <system_error>

namespace strata::capability {

LocalBlobStore::LocalBlobStore(std::filesystem::path root) : root_(std::move(root)) {}

std::string_view LocalBlobStore::name() const { return "local"; }

common::Result<std::filesystem::path> LocalBlobStore::resolve(const std::string &uri) const {
  std::string reference = uri;
  if (common::starts_with(reference, "file://")) {
    reference = reference.substr(7);
  } else if (reference.find("://") != std::string::npos) {
    return common::Result<std::filesystem::path>::failure(common::ErrorKind::Validation,
                                                          "unsupported blob scheme: " + uri);
  }
  if (reference.empty()) {
    return common::Result<std::filesystem::path>::failure(common::ErrorKind::Validation,
                                                          "empty blob reference");
  }

  std::error_code ec;
  const std::filesystem::path root = std::filesystem::weakly_canonical(root_, ec);
  if (ec) {
    return common::Result<std::filesystem::path>::failure(
        common::ErrorKind::Internal, "blob root unavailable: " + ec.message());
  }
  std::filesystem::path candidate(reference);
  if (candidate.is_relative()) {
    candidate = root / candidate;
  }
  candidate = std::filesystem::weakly_canonical(candidate, ec);
  if (ec) {
    return common::Result<std::filesystem::path>::failure(
        common::ErrorKind::NotFound, "blob reference unresolvable: " + uri);
  }

  if (!common::is_subpath(candidate, root)) {
    return common::Result<std::filesystem::path>::failure(
        common::ErrorKind::Validation, "blob reference escapes the blob root: " + uri);
  }
  return common::Result<std::filesystem::path>::success(candidate);
}

common::Result<std::string> LocalBlobStore::fetch(const std::string &uri) {
  auto path = resolve(uri);
  if (!path.ok()) {
    return common::Result<std::string>::failure(path.error_info());
  }
  return common::read_text_file(path.value());
}

std::unique_ptr<IBlobStore> create_blob_store(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.blob.backend));
  if (backend == "none") {
    return nullptr;
  }
  return std::make_unique<LocalBlobStore>(common::expand_path(config.blob.root));
}

} // namespace strata::capability
