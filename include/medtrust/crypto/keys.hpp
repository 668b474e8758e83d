#pragma once

#include <medtrust/schema/primitives.hpp>

#include <openssl/types.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace medtrust::crypto {

/// Issuer signing key (ECDSA P-256). Copies share the underlying OpenSSL
/// key, which is immutable after construction.
class private_key final {
 public:
  /// Fresh key from the OpenSSL default RNG.
  static std::optional<private_key> generate();

  /// Parse a PKCS#8 (or traditional EC) PEM private key. Keys on any curve
  /// other than P-256 are rejected.
  static std::optional<private_key> from_pem(std::string_view pem);

  static std::optional<private_key> load(const std::filesystem::path& path);

  /// PKCS#8 PEM, unencrypted.
  std::string to_pem() const;

  /// SubjectPublicKeyInfo PEM of the matching public key.
  std::string public_key_pem() const;

  /// Write `to_pem()` to `path` with owner-only permissions (0600), creating
  /// parent directories as needed.
  bool save(const std::filesystem::path& path) const;

  const medtrust::schema::public_key_t& public_key() const {
    return public_key_;
  }

  /// ECDSA/SHA-256 signature over `message` in compact [r || s] form.
  std::optional<medtrust::schema::signature_t> sign(
      const medtrust::schema::bytes_view_t& message) const;

 private:
  private_key(std::shared_ptr<EVP_PKEY> key,
              const medtrust::schema::public_key_t& public_key);

  std::shared_ptr<EVP_PKEY> key_;
  medtrust::schema::public_key_t public_key_{};
};

/// Compressed public key from a SubjectPublicKeyInfo PEM (P-256 only).
std::optional<medtrust::schema::public_key_t> public_key_from_pem(
    std::string_view pem);

/// SubjectPublicKeyInfo PEM for a compressed public key.
std::optional<std::string> public_key_to_pem(
    const medtrust::schema::public_key_t& public_key);

/// Write a public key PEM to `path`.
bool save_public_key(const std::filesystem::path& path,
                     const medtrust::schema::public_key_t& public_key);

}  // namespace medtrust::crypto
