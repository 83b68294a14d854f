#include "grainguard/export/zip_writer.hpp"

#include <limits>
#include <memory>
#include <utility>

#include <zlib.h>

namespace grainguard::exporting {

auto crc32(std::span<const std::uint8_t> bytes) -> std::uint32_t {
  return static_cast<std::uint32_t>(::crc32_z(::crc32_z(0L, Z_NULL, 0), bytes.data(), bytes.size()));
}

auto crc32(std::string_view bytes) -> std::uint32_t {
  return crc32(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size()));
}

namespace {
constexpr std::uint32_t kLocalHeaderSig = 0x04034b50u;
constexpr std::uint32_t kCentralHeaderSig = 0x02014b50u;
constexpr std::uint32_t kEndOfCentralSig = 0x06054b50u;
constexpr std::uint16_t kVersion = 20;        // 2.0
constexpr std::uint16_t kFlagUtf8 = 1u << 11; // names are UTF-8
constexpr std::uint16_t kMethodDeflate = 8;
constexpr std::uint16_t kDosTime = 0;                          // 00:00:00
constexpr std::uint16_t kDosDate = (0u << 9) | (1u << 5) | 1u; // 1980-01-01
constexpr std::uint64_t kMax32 = std::numeric_limits<std::uint32_t>::max();

struct deflate_end {
  void operator()(z_stream* zs) const noexcept { deflateEnd(zs); }
};

// Raw deflate (no zlib header or trailer), as ZIP method 8 expects.
auto deflate_raw(std::string_view data) -> std::expected<std::string, core::error> {
  z_stream zs{};
  if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
    return core::make_unexpected(core::error_code::internal, "deflate init failed", "export.zip");
  }
  std::unique_ptr<z_stream, deflate_end> guard(&zs);
  std::string out(deflateBound(&zs, static_cast<uLong>(data.size())), '\0');
  zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  zs.avail_in = static_cast<uInt>(data.size());
  zs.next_out = reinterpret_cast<Bytef*>(out.data());
  zs.avail_out = static_cast<uInt>(out.size());
  if (deflate(&zs, Z_FINISH) != Z_STREAM_END) {
    return core::make_unexpected(core::error_code::internal, "deflate failed", "export.zip");
  }
  out.resize(zs.total_out);
  return out;
}
}

auto zip_writer::put(std::string_view bytes) -> void {
  out_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  written_ += bytes.size();
}

auto zip_writer::put16(std::uint16_t v) -> void {
  const char b[2] = {static_cast<char>(v & 0xFF), static_cast<char>((v >> 8) & 0xFF)};
  put({b, 2});
}

auto zip_writer::put32(std::uint32_t v) -> void {
  const char b[4] = {static_cast<char>(v & 0xFF), static_cast<char>((v >> 8) & 0xFF),
                     static_cast<char>((v >> 16) & 0xFF), static_cast<char>((v >> 24) & 0xFF)};
  put({b, 4});
}

auto zip_writer::add_entry(std::string_view name, std::string_view data) -> std::expected<void, core::error> {
  if (finished_) {
    return core::make_unexpected(core::error_code::precondition_failed, "archive already finished", "export.zip");
  }
  if (name.empty() || name.size() > 0xFFFFu) {
    return core::make_unexpected(core::error_code::invalid_argument, "invalid entry name", "export.zip");
  }
  if (entries_.size() >= 0xFFFFu) {
    return core::make_unexpected(core::error_code::precondition_failed, "too many entries", "export.zip");
  }
  if (data.size() >= kMax32) {
    return core::make_unexpected(core::error_code::precondition_failed,
                                 "entry exceeds ZIP32 size limit", "export.zip");
  }

  auto packed = deflate_raw(data);
  if (!packed) return std::unexpected(packed.error());
  if (written_ + 30 + name.size() + packed->size() >= kMax32) {
    return core::make_unexpected(core::error_code::precondition_failed,
                                 "entry exceeds ZIP32 size limit", "export.zip");
  }

  entry e{std::string(name), crc32(data), static_cast<std::uint32_t>(packed->size()),
          static_cast<std::uint32_t>(data.size()), static_cast<std::uint32_t>(written_)};

  put32(kLocalHeaderSig);
  put16(kVersion);
  put16(kFlagUtf8);
  put16(kMethodDeflate);
  put16(kDosTime);
  put16(kDosDate);
  put32(e.crc);
  put32(e.compressed_size);
  put32(e.size);
  put16(static_cast<std::uint16_t>(e.name.size()));
  put16(0);      // extra
  put(e.name);
  put(*packed);

  entries_.push_back(std::move(e));
  if (!out_) {
    return core::make_unexpected(core::error_code::io_failed, "Failed to write archive", "export.zip");
  }
  return {};
}

auto zip_writer::finish() -> std::expected<void, core::error> {
  if (finished_) return {};
  const std::uint64_t cd_offset = written_;
  for (const auto& e : entries_) {
    put32(kCentralHeaderSig);
    put16(kVersion); // made by
    put16(kVersion); // needed
    put16(kFlagUtf8);
    put16(kMethodDeflate);
    put16(kDosTime);
    put16(kDosDate);
    put32(e.crc);
    put32(e.compressed_size);
    put32(e.size);
    put16(static_cast<std::uint16_t>(e.name.size()));
    put16(0); // extra
    put16(0); // comment
    put16(0); // disk
    put16(0); // internal attrs
    put32(0); // external attrs
    put32(e.offset);
    put(e.name);
  }
  const std::uint64_t cd_size = written_ - cd_offset;
  if (written_ + 22 >= kMax32) {
    return core::make_unexpected(core::error_code::precondition_failed,
                                 "archive exceeds ZIP32 size limit", "export.zip");
  }
  put32(kEndOfCentralSig);
  put16(0); // this disk
  put16(0); // cd disk
  put16(static_cast<std::uint16_t>(entries_.size()));
  put16(static_cast<std::uint16_t>(entries_.size()));
  put32(static_cast<std::uint32_t>(cd_size));
  put32(static_cast<std::uint32_t>(cd_offset));
  put16(0); // comment
  finished_ = true;
  out_.flush();
  if (!out_) {
    return core::make_unexpected(core::error_code::io_failed, "Failed to write archive", "export.zip");
  }
  return {};
}

} // namespace grainguard::exporting
