#include "grainguard/dataset_store.hpp"

#include <algorithm>
#include <array>
#include <iostream>
#include <system_error>
#include <utility>

#include "grainguard/core/platform_utils.hpp"

namespace grainguard {

namespace {
constexpr const char* kComponent = "storage.resolve";
constexpr std::array<std::string_view, 2> kUnnormalizedExtensions{".xlsx", ".xls"};
}

auto is_valid_dataset_id(std::string_view id) -> bool {
  if (id.empty() || id.size() > 128) return false;
  return std::all_of(id.begin(), id.end(), [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_';
  });
}

dataset_store::dataset_store(std::filesystem::path input_dir)
    : input_dir_(std::move(input_dir)) {}

auto dataset_store::resolve(std::string_view dataset_id) const
    -> std::expected<dataset_handle, core::error> {
  if (!is_valid_dataset_id(dataset_id)) {
    return core::make_unexpected(core::error_code::dataset_not_found,
                                 "Dataset not found", kComponent);
  }
  const std::string id(dataset_id);
  std::error_code ec;
  auto csv = input_dir_ / (id + ".csv");
  if (std::filesystem::is_regular_file(csv, ec)) {
    return dataset_handle{id, std::move(csv)};
  }
  for (auto ext : kUnnormalizedExtensions) {
    auto other = input_dir_ / (id + std::string(ext));
    if (std::filesystem::is_regular_file(other, ec)) {
      if (core::debug_enabled()) {
        std::cerr << "[STORE][resolve] " << id << " stored as " << ext << ", not normalized" << std::endl;
      }
      return core::make_unexpected(core::error_code::schema_unavailable,
                                   "Dataset is not in canonical CSV form", kComponent);
    }
  }
  return core::make_unexpected(core::error_code::dataset_not_found,
                               "Dataset not found", kComponent);
}

} // namespace grainguard
