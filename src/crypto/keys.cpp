#include <medtrust/crypto/keys.hpp>
#include <medtrust/crypto/openssl.hpp>

#include <openssl/core_names.h>
#include <openssl/pem.h>

#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <vector>

namespace medtrust::crypto {

namespace {

std::optional<std::string> read_bio(BIO* bio) {
  auto* data = static_cast<char*>(nullptr);
  auto length = BIO_get_mem_data(bio, &data);
  if (length <= 0 || data == nullptr) {
    return std::nullopt;
  }
  return std::string{data, static_cast<size_t>(length)};
}

detail::bio_ptr make_read_bio(const std::string_view pem) {
  return detail::bio_ptr{
      BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), BIO_free};
}

std::optional<std::string> read_file(const std::filesystem::path& path) {
  auto stream = std::ifstream{path, std::ios::binary};
  if (!stream) {
    return std::nullopt;
  }
  auto buffer = std::ostringstream{};
  buffer << stream.rdbuf();
  return buffer.str();
}

bool write_file(const std::filesystem::path& path,
                const std::string& contents,
                const std::filesystem::perms permissions) {
  auto error = std::error_code{};
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), error);
    if (error) {
      spdlog::error("Failed to create directory {}: {}",
                    path.parent_path().string(), error.message());
      return false;
    }
  }
  {
    auto stream = std::ofstream{path, std::ios::binary | std::ios::trunc};
    if (!stream) {
      spdlog::error("Failed to open {} for writing", path.string());
      return false;
    }
    stream << contents;
    if (!stream) {
      spdlog::error("Failed to write {}", path.string());
      return false;
    }
  }
  std::filesystem::permissions(path, permissions,
                               std::filesystem::perm_options::replace, error);
  if (error) {
    spdlog::error("Failed to set permissions on {}: {}", path.string(),
                  error.message());
    return false;
  }
  return true;
}

}  // namespace

private_key::private_key(std::shared_ptr<EVP_PKEY> key,
                         const medtrust::schema::public_key_t& public_key)
    : key_{std::move(key)}, public_key_{public_key} {}

std::optional<private_key> private_key::generate() {
  auto ctx = detail::evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1 ||
      EVP_PKEY_CTX_set_group_name(ctx.get(), detail::kCurveName) != 1) {
    spdlog::error("OpenSSL rejected P-256 key generation setup");
    return std::nullopt;
  }
  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_keygen(ctx.get(), &raw_pkey) != 1) {
    spdlog::error("P-256 key generation failed");
    return std::nullopt;
  }
  auto key = std::shared_ptr<EVP_PKEY>{raw_pkey, EVP_PKEY_free};
  auto public_key = detail::compressed_public_key(key.get());
  if (!public_key.has_value()) {
    return std::nullopt;
  }
  return private_key{std::move(key), *public_key};
}

std::optional<private_key> private_key::from_pem(const std::string_view pem) {
  auto bio = make_read_bio(pem);
  if (!bio) {
    return std::nullopt;
  }
  auto* raw_pkey =
      PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
  if (raw_pkey == nullptr) {
    return std::nullopt;
  }
  auto key = std::shared_ptr<EVP_PKEY>{raw_pkey, EVP_PKEY_free};
  auto public_key = detail::compressed_public_key(key.get());
  if (!public_key.has_value()) {
    spdlog::warn("Rejected private key that is not on P-256");
    return std::nullopt;
  }
  return private_key{std::move(key), *public_key};
}

std::optional<private_key> private_key::load(
    const std::filesystem::path& path) {
  auto pem = read_file(path);
  if (!pem.has_value()) {
    spdlog::error("Failed to read private key {}", path.string());
    return std::nullopt;
  }
  return from_pem(*pem);
}

std::string private_key::to_pem() const {
  auto bio = detail::bio_ptr{BIO_new(BIO_s_mem()), BIO_free};
  if (!bio || PEM_write_bio_PrivateKey(bio.get(), key_.get(), nullptr, nullptr,
                                       0, nullptr, nullptr) != 1) {
    return {};
  }
  return read_bio(bio.get()).value_or(std::string{});
}

std::string private_key::public_key_pem() const {
  auto bio = detail::bio_ptr{BIO_new(BIO_s_mem()), BIO_free};
  if (!bio || PEM_write_bio_PUBKEY(bio.get(), key_.get()) != 1) {
    return {};
  }
  return read_bio(bio.get()).value_or(std::string{});
}

bool private_key::save(const std::filesystem::path& path) const {
  auto pem = to_pem();
  if (pem.empty()) {
    spdlog::error("Failed to serialize private key");
    return false;
  }
  return write_file(path, pem,
                    std::filesystem::perms::owner_read |
                        std::filesystem::perms::owner_write);
}

std::optional<medtrust::schema::signature_t> private_key::sign(
    const medtrust::schema::bytes_view_t& message) const {
  auto ctx = detail::evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                                 key_.get()) != 1) {
    return std::nullopt;
  }
  auto der_size = size_t{};
  if (EVP_DigestSign(ctx.get(), nullptr, &der_size, message.data(),
                     message.size()) != 1) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(der_size);
  if (EVP_DigestSign(ctx.get(), der.data(), &der_size, message.data(),
                     message.size()) != 1) {
    return std::nullopt;
  }

  const auto* der_ptr = static_cast<const unsigned char*>(der.data());
  auto sig = detail::ecdsa_sig_ptr{
      d2i_ECDSA_SIG(nullptr, &der_ptr, static_cast<long>(der_size)),
      ECDSA_SIG_free};
  if (!sig) {
    return std::nullopt;
  }

  const auto* r = static_cast<const BIGNUM*>(nullptr);
  const auto* s = static_cast<const BIGNUM*>(nullptr);
  ECDSA_SIG_get0(sig.get(), &r, &s);

  auto compact = medtrust::schema::signature_t{};
  if (BN_bn2binpad(r, compact.data(), 32) != 32 ||
      BN_bn2binpad(s, compact.data() + 32, 32) != 32) {
    return std::nullopt;
  }
  return compact;
}

std::optional<medtrust::schema::public_key_t> public_key_from_pem(
    const std::string_view pem) {
  auto bio = make_read_bio(pem);
  if (!bio) {
    return std::nullopt;
  }
  auto pkey = detail::evp_pkey_ptr{
      PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr),
      EVP_PKEY_free};
  if (!pkey) {
    return std::nullopt;
  }
  return detail::compressed_public_key(pkey.get());
}

std::optional<std::string> public_key_to_pem(
    const medtrust::schema::public_key_t& public_key) {
  auto pkey = detail::make_public_pkey(public_key);
  if (!pkey) {
    return std::nullopt;
  }
  auto bio = detail::bio_ptr{BIO_new(BIO_s_mem()), BIO_free};
  if (!bio || PEM_write_bio_PUBKEY(bio.get(), pkey.get()) != 1) {
    return std::nullopt;
  }
  return read_bio(bio.get());
}

bool save_public_key(const std::filesystem::path& path,
                     const medtrust::schema::public_key_t& public_key) {
  auto pem = public_key_to_pem(public_key);
  if (!pem.has_value()) {
    return false;
  }
  return write_file(path, *pem,
                    std::filesystem::perms::owner_read |
                        std::filesystem::perms::owner_write |
                        std::filesystem::perms::group_read |
                        std::filesystem::perms::others_read);
}

}  // namespace medtrust::crypto
