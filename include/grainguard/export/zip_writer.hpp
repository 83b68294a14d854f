#pragma once

/** \file zip_writer.hpp
 *  \brief Minimal ZIP container writer; entries are raw-deflated with zlib (method 8).
 *
 * Layout: [local header + data]* central directory, end-of-central-directory.
 * No ZIP64: each entry and the archive must stay below 4 GiB, at most 65535 entries.
 * Timestamps are fixed (1980-01-01 00:00) so identical inputs give identical bytes.
 */

#include <cstdint>
#include <expected>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "grainguard/error.hpp"

namespace grainguard::exporting {

/** \brief CRC-32 as stored in ZIP headers (zlib crc32_z). */
auto crc32(std::span<const std::uint8_t> bytes) -> std::uint32_t;
auto crc32(std::string_view bytes) -> std::uint32_t;

class zip_writer {
public:
  explicit zip_writer(std::ostream& out) : out_(out) {}

  zip_writer(const zip_writer&) = delete;
  zip_writer& operator=(const zip_writer&) = delete;

  /** \brief Deflate and append one entry. precondition_failed past ZIP32 limits, io_failed on stream errors. */
  auto add_entry(std::string_view name, std::string_view data) -> std::expected<void, core::error>;

  /** \brief Write the central directory; no entries may be added afterwards. */
  auto finish() -> std::expected<void, core::error>;

  std::size_t entry_count() const noexcept { return entries_.size(); }

private:
  struct entry {
    std::string name;
    std::uint32_t crc{0};
    std::uint32_t compressed_size{0};
    std::uint32_t size{0};
    std::uint32_t offset{0};
  };

  auto put(std::string_view bytes) -> void;
  auto put16(std::uint16_t v) -> void;
  auto put32(std::uint32_t v) -> void;

  std::ostream& out_;
  std::uint64_t written_{0};
  std::vector<entry> entries_;
  bool finished_{false};
};

} // namespace grainguard::exporting
