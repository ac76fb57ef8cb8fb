#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <glyphvault/common/critical.hpp>
#include <glyphvault/common/error.hpp>
#include <glyphvault/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace glyphvault::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const glyphvault::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline glyphvault::schema::bytes_view_t to_bytes_view(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return glyphvault::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(slice.data()), slice.size()};
}

inline glyphvault::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const glyphvault::schema::bytes_view_t& key) const;

  std::optional<glyphvault::schema::bytes_t> get(
      const glyphvault::schema::bytes_view_t& key) const;
  void scan_prefix(const glyphvault::schema::bytes_view_t& prefix,
                   const scan_visitor_t& visitor) const;
  void commit(const write_batch& batch) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const glyphvault::schema::bytes_view_t& key) const {
  auto raw = get(key);
  if (!raw.has_value()) {
    return std::nullopt;
  }
  auto decoded = encoder.template try_decode<T>(
      glyphvault::schema::make_bytes_view(*raw));
  if (!decoded.has_value()) {
    throw glyphvault::storage_error("undecodable value at key " +
                                    glyphvault::schema::to_hex(key));
  }
  return decoded;
}

inline std::optional<glyphvault::schema::bytes_t>
storage<rocksdb_storage_tag>::get(
    const glyphvault::schema::bytes_view_t& key) const {
  if (!database) {
    glyphvault::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    throw glyphvault::storage_error("RocksDB get failed: " + status.ToString());
  }
  return glyphvault::schema::make_bytes(value);
}

inline void storage<rocksdb_storage_tag>::scan_prefix(
    const glyphvault::schema::bytes_view_t& prefix,
    const scan_visitor_t& visitor) const {
  if (!database) {
    glyphvault::common::critical("RocksDB database is not initialized");
  }

  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};
  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    if (!visitor(detail::to_bytes_view(iterator->key()),
                 detail::to_bytes_view(iterator->value()))) {
      return;
    }
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    throw glyphvault::storage_error("RocksDB iteration failed: " +
                                    iterator->status().ToString());
  }
}

inline void storage<rocksdb_storage_tag>::commit(
    const write_batch& batch) const {
  if (!database) {
    glyphvault::common::critical("RocksDB database is not initialized");
  }
  auto rocks_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : batch.entries) {
    auto put_status =
        rocks_batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!put_status.ok()) {
      throw glyphvault::storage_error("failed staging RocksDB write: " +
                                      put_status.ToString());
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &rocks_batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit RocksDB batch: {}",
                  write_status.ToString());
    throw glyphvault::storage_error("RocksDB commit failed: " +
                                    write_status.ToString());
  }
}

}  // namespace glyphvault::storage
