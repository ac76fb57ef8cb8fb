#include <glyphvault/common/error.hpp>
#include <glyphvault/schema/encoding/scale/records.hpp>
#include <glyphvault/vault/encrypted_store.hpp>

#include <fcntl.h>
#include <openssl/crypto.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

namespace glyphvault::vault {

namespace {

constexpr auto kHeaderMagic = std::string_view{"GLYK"};
constexpr auto kBlobMagic = std::string_view{"GLYB"};
constexpr auto kFormatVersion = uint8_t{1};
constexpr auto kKeyCheck = std::string_view{"glyphvault key check v1"};
constexpr auto kHeaderFile = std::string_view{"vault.key"};
constexpr auto kBlobDir = std::string_view{"blobs"};
constexpr auto kBlobExtension = std::string_view{".glyph"};

void append(glyphvault::schema::bytes_t& out,
            const glyphvault::schema::bytes_view_t& bytes) {
  out.insert(out.end(), bytes.begin(), bytes.end());
}

void append(glyphvault::schema::bytes_t& out, const std::string_view str) {
  out.insert(out.end(), str.begin(), str.end());
}

void append_u32_le(glyphvault::schema::bytes_t& out, const uint32_t value) {
  for (auto i = 0u; i < 4u; ++i) {
    out.push_back(static_cast<uint8_t>((value >> (8u * i)) & 0xFFu));
  }
}

uint32_t read_u32_le(const uint8_t* data) {
  auto value = uint32_t{};
  for (auto i = 0u; i < 4u; ++i) {
    value |= static_cast<uint32_t>(data[i]) << (8u * i);
  }
  return value;
}

bool has_magic(const glyphvault::schema::bytes_view_t& bytes,
               const std::string_view magic) {
  return bytes.size() >= magic.size() + 1 &&
         std::equal(magic.begin(), magic.end(), bytes.begin()) &&
         bytes[magic.size()] == kFormatVersion;
}

glyphvault::schema::bytes_t read_file(const std::filesystem::path& path) {
  auto in = std::ifstream{path, std::ios::binary};
  if (!in) {
    throw glyphvault::storage_error("failed to open " + path.string());
  }
  auto out = glyphvault::schema::bytes_t{std::istreambuf_iterator<char>{in},
                                         std::istreambuf_iterator<char>{}};
  if (in.bad()) {
    throw glyphvault::storage_error("failed to read " + path.string());
  }
  return out;
}

// Closes the descriptor on scope exit.
struct scoped_fd {
  explicit scoped_fd(const int value) : fd(value) {}
  ~scoped_fd() {
    if (fd >= 0) {
      ::close(fd);
    }
  }
  scoped_fd(const scoped_fd&) = delete;
  scoped_fd& operator=(const scoped_fd&) = delete;

  int fd;
};

std::string errno_text() {
  return std::error_code{errno, std::generic_category()}.message();
}

void write_all(const int fd, const glyphvault::schema::bytes_t& bytes) {
  auto written = std::size_t{0};
  while (written < bytes.size()) {
    auto n = ::write(fd, bytes.data() + written, bytes.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw glyphvault::storage_error("write failed: " + errno_text());
    }
    written += static_cast<std::size_t>(n);
  }
}

void sync_directory(const std::filesystem::path& dir) {
  auto handle = scoped_fd{::open(dir.c_str(), O_RDONLY | O_DIRECTORY)};
  if (handle.fd < 0 || ::fsync(handle.fd) != 0) {
    throw glyphvault::storage_error("failed to sync directory " +
                                    dir.string() + ": " + errno_text());
  }
}

// The blob reaches disk before the rename, and the rename before the
// ledger batch that references it.
void write_file_atomic(const std::filesystem::path& path,
                       const glyphvault::schema::bytes_t& bytes) {
  auto suffix = glyphvault::schema::to_hex(glyphvault::crypto::random_bytes(6));
  auto temp_path = path;
  temp_path += ".tmp-" + suffix;
  try {
    auto handle = scoped_fd{
        ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600)};
    if (handle.fd < 0) {
      throw glyphvault::storage_error("failed to create " +
                                      temp_path.string() + ": " +
                                      errno_text());
    }
    write_all(handle.fd, bytes);
    if (::fsync(handle.fd) != 0) {
      throw glyphvault::storage_error("failed to sync " + temp_path.string() +
                                      ": " + errno_text());
    }
  } catch (const glyphvault::storage_error&) {
    auto ignored = std::error_code{};
    std::filesystem::remove(temp_path, ignored);
    throw;
  }
  auto ec = std::error_code{};
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    auto ignored = std::error_code{};
    std::filesystem::remove(temp_path, ignored);
    throw glyphvault::storage_error("failed to move blob into place at " +
                                    path.string() + ": " + ec.message());
  }
  sync_directory(path.parent_path());
}

// Header bytes covered by the key check tag.
glyphvault::schema::bytes_t header_prefix(
    const uint32_t iterations,
    const glyphvault::schema::bytes_view_t& salt) {
  auto out = glyphvault::schema::bytes_t{};
  append(out, kHeaderMagic);
  out.push_back(kFormatVersion);
  append_u32_le(out, iterations);
  append(out, salt);
  return out;
}

}  // namespace

encrypted_store::encrypted_store(const std::filesystem::path& root,
                                 const std::string_view passphrase,
                                 const uint32_t kdf_iterations)
    : root_(root), blob_dir_(root / kBlobDir), kdf_iterations_(kdf_iterations) {
  if (passphrase.empty()) {
    throw glyphvault::configuration_error(
        "vault passphrase must be provided explicitly");
  }
  if (kdf_iterations == 0) {
    throw glyphvault::configuration_error(
        "KDF iteration count must be positive");
  }

  auto ec = std::error_code{};
  std::filesystem::create_directories(blob_dir_, ec);
  if (ec) {
    throw glyphvault::storage_error("failed to create " + blob_dir_.string() +
                                    ": " + ec.message());
  }

  if (std::filesystem::exists(root_ / kHeaderFile)) {
    unlock_header(passphrase);
  } else {
    create_header(passphrase);
  }
}

encrypted_store::~encrypted_store() {
  OPENSSL_cleanse(key_.data(), key_.size());
}

void encrypted_store::create_header(const std::string_view passphrase) {
  auto salt = glyphvault::crypto::random_bytes(kSaltSize);
  key_ = glyphvault::crypto::derive_key(
      passphrase, glyphvault::schema::make_bytes_view(salt), kdf_iterations_);

  auto header = header_prefix(kdf_iterations_,
                              glyphvault::schema::make_bytes_view(salt));
  auto check = glyphvault::crypto::seal(
      key_, glyphvault::schema::make_bytes_view(kKeyCheck),
      glyphvault::schema::make_bytes_view(header));
  append(header, check.nonce);
  append(header, check.ciphertext);
  append(header, check.tag);
  write_file_atomic(root_ / kHeaderFile, header);
  spdlog::info("Initialized vault key header at {} ({} KDF iterations)",
               (root_ / kHeaderFile).string(), kdf_iterations_);
}

void encrypted_store::unlock_header(const std::string_view passphrase) {
  auto header = read_file(root_ / kHeaderFile);
  auto view = glyphvault::schema::make_bytes_view(header);
  const auto prefix_size = kHeaderMagic.size() + 1 + 4 + kSaltSize;
  const auto expected_size = prefix_size + glyphvault::crypto::kGcmNonceSize +
                             kKeyCheck.size() +
                             glyphvault::crypto::kGcmTagSize;
  if (!has_magic(view, kHeaderMagic) || header.size() != expected_size) {
    throw glyphvault::integrity_error("vault key header is malformed");
  }

  auto iterations = read_u32_le(header.data() + kHeaderMagic.size() + 1);
  if (iterations == 0) {
    throw glyphvault::integrity_error("vault key header is malformed");
  }
  auto salt = view.subspan(kHeaderMagic.size() + 5, kSaltSize);
  auto box = glyphvault::crypto::sealed_box{};
  auto cursor = header.begin() + static_cast<std::ptrdiff_t>(prefix_size);
  std::copy_n(cursor, box.nonce.size(), box.nonce.begin());
  cursor += static_cast<std::ptrdiff_t>(box.nonce.size());
  box.ciphertext.assign(cursor,
                        cursor + static_cast<std::ptrdiff_t>(kKeyCheck.size()));
  cursor += static_cast<std::ptrdiff_t>(kKeyCheck.size());
  std::copy_n(cursor, box.tag.size(), box.tag.begin());

  key_ = glyphvault::crypto::derive_key(passphrase, salt, iterations);
  auto check =
      glyphvault::crypto::open(key_, box, view.subspan(0, prefix_size));
  if (!check.has_value() ||
      glyphvault::schema::make_string_view(*check) != kKeyCheck) {
    OPENSSL_cleanse(key_.data(), key_.size());
    throw glyphvault::integrity_error(
        "passphrase does not unlock this vault");
  }
  kdf_iterations_ = iterations;
  spdlog::info("Unlocked vault at {}", root_.string());
}

std::filesystem::path encrypted_store::blob_path(
    const glyphvault::schema::glyph_id_t& id) const {
  return blob_dir_ /
         (glyphvault::schema::to_hex(id) + std::string{kBlobExtension});
}

void encrypted_store::put(const glyphvault::schema::glyph_t& glyph) const {
  auto plaintext = glyphvault::schema::encoding::scale::encode(glyph);
  auto box = glyphvault::crypto::seal(
      key_, glyphvault::schema::make_bytes_view(plaintext), glyph.id);
  OPENSSL_cleanse(plaintext.data(), plaintext.size());

  auto blob = glyphvault::schema::bytes_t{};
  append(blob, kBlobMagic);
  blob.push_back(kFormatVersion);
  append(blob, box.nonce);
  append(blob, box.ciphertext);
  append(blob, box.tag);
  write_file_atomic(blob_path(glyph.id), blob);
  spdlog::debug("Stored encrypted blob for {}",
                glyphvault::schema::to_prefixed_hex(glyph.id));
}

std::optional<glyphvault::schema::glyph_t> encrypted_store::get(
    const glyphvault::schema::glyph_id_t& id) const {
  auto path = blob_path(id);
  if (!std::filesystem::exists(path)) {
    return std::nullopt;
  }
  auto blob = read_file(path);
  auto id_text = glyphvault::schema::to_prefixed_hex(id);
  const auto overhead = kBlobMagic.size() + 1 +
                        glyphvault::crypto::kGcmNonceSize +
                        glyphvault::crypto::kGcmTagSize;
  if (!has_magic(glyphvault::schema::make_bytes_view(blob), kBlobMagic) ||
      blob.size() < overhead) {
    throw glyphvault::integrity_error("blob for " + id_text + " is malformed");
  }

  auto box = glyphvault::crypto::sealed_box{};
  auto cursor =
      blob.begin() + static_cast<std::ptrdiff_t>(kBlobMagic.size() + 1);
  std::copy_n(cursor, box.nonce.size(), box.nonce.begin());
  cursor += static_cast<std::ptrdiff_t>(box.nonce.size());
  auto tag_begin = blob.end() - static_cast<std::ptrdiff_t>(box.tag.size());
  box.ciphertext.assign(cursor, tag_begin);
  std::copy(tag_begin, blob.end(), box.tag.begin());

  auto plaintext = glyphvault::crypto::open(key_, box, id);
  if (!plaintext.has_value()) {
    spdlog::warn("Blob for {} failed authentication", id_text);
    throw glyphvault::integrity_error("blob for " + id_text +
                                      " failed authentication");
  }
  auto glyph = glyphvault::schema::encoding::scale::decode_glyph(
      glyphvault::schema::make_bytes_view(*plaintext));
  OPENSSL_cleanse(plaintext->data(), plaintext->size());
  if (!glyph.has_value() || glyph->id != id) {
    throw glyphvault::integrity_error("blob for " + id_text +
                                      " does not decode to that glyph");
  }
  return glyph;
}

bool encrypted_store::contains(const glyphvault::schema::glyph_id_t& id) const {
  return std::filesystem::exists(blob_path(id));
}

std::vector<glyphvault::schema::glyph_id_t> encrypted_store::ids() const {
  auto out = std::vector<glyphvault::schema::glyph_id_t>{};
  auto ec = std::error_code{};
  for (const auto& entry :
       std::filesystem::directory_iterator{blob_dir_, ec}) {
    if (!entry.is_regular_file() ||
        entry.path().extension().string() != kBlobExtension) {
      continue;
    }
    auto id = glyphvault::schema::try_make_hash32(entry.path().stem().string());
    if (id.has_value()) {
      out.push_back(*id);
    }
  }
  if (ec) {
    throw glyphvault::storage_error("failed to list " + blob_dir_.string() +
                                    ": " + ec.message());
  }
  std::sort(out.begin(), out.end());
  return out;
}

}  // namespace glyphvault::vault
