#pragma once
#include <glyphvault/schema/primitives.hpp>
#include <functional>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace glyphvault::storage {

using key_value_entry_t =
    std::pair<glyphvault::schema::bytes_t, glyphvault::schema::bytes_t>;

/// Visitor for ordered prefix scans. Return false to stop early.
using scan_visitor_t =
    std::function<bool(const glyphvault::schema::bytes_view_t& key,
                       const glyphvault::schema::bytes_view_t& value)>;

/// Puts staged in memory and committed together by `storage::commit`.
struct write_batch final {
  std::vector<key_value_entry_t> entries;

  void put(const glyphvault::schema::bytes_view_t& key,
           const glyphvault::schema::bytes_view_t& value) {
    entries.emplace_back(glyphvault::schema::make_bytes(key),
                         glyphvault::schema::make_bytes(value));
  }

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const glyphvault::schema::bytes_view_t& key,
           const T& value) {
    auto encoded = encoder.encode(value);
    put(key, glyphvault::schema::make_bytes_view(encoded));
  }

  bool empty() const noexcept { return entries.empty(); }
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const glyphvault::schema::bytes_view_t& key) const;

  /// Raw value at key, or std::nullopt when missing.
  std::optional<glyphvault::schema::bytes_t> get(
      const glyphvault::schema::bytes_view_t& key) const;

  /// Walk keys under prefix in ascending byte order.
  void scan_prefix(const glyphvault::schema::bytes_view_t& prefix,
                   const scan_visitor_t& visitor) const;

  /// Durably apply every staged put, all or nothing.
  void commit(const write_batch& batch) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace glyphvault::storage
