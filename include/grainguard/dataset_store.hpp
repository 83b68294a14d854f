#pragma once

/** \file dataset_store.hpp
 *  \brief Resolve dataset ids to stored canonical dataset files.
 *
 * Upload storage and CSV/XLS/XLSX normalization happen upstream; this store
 * only resolves ids to the canonical <input_dir>/<id>.csv file. Ids are
 * restricted to [A-Za-z0-9_-] so they can never address a path outside the
 * input directory.
 */

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

#include "grainguard/error.hpp"

namespace grainguard {

/** \brief A resolved, storage-backed dataset. */
struct dataset_handle {
  std::string id;               /**< caller-visible dataset id */
  std::filesystem::path path;   /**< canonical CSV file */
};

/** \brief 1..128 characters of [A-Za-z0-9_-]. */
auto is_valid_dataset_id(std::string_view id) -> bool;

class dataset_store {
public:
  explicit dataset_store(std::filesystem::path input_dir);

  /** \brief Resolve an id.
   *
   * \return handle on success; dataset_not_found when no file matches (or the id
   *         is malformed); schema_unavailable when the dataset exists only in a
   *         non-canonical format (xls/xlsx not yet normalized).
   */
  auto resolve(std::string_view dataset_id) const -> std::expected<dataset_handle, core::error>;

  const std::filesystem::path& input_dir() const noexcept { return input_dir_; }

private:
  std::filesystem::path input_dir_;
};

} // namespace grainguard
