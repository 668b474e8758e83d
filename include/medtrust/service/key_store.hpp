#pragma once
#include <medtrust/crypto/keys.hpp>
#include <medtrust/schema/primitives.hpp>

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace medtrust::service {

/// Resolves an issuer private-key reference to a usable signing key. A
/// reference names the issuer that owns the key.
class key_store {
 public:
  virtual ~key_store() = default;
  virtual std::optional<medtrust::crypto::private_key> resolve(
      std::string_view reference) const = 0;
};

/// Keys stored as PEM files in one directory:
/// `issuer_<id>_private_key.pem` (0600) and `issuer_<id>_public_key.pem`.
class file_key_store final : public key_store {
 public:
  explicit file_key_store(std::filesystem::path directory);

  std::optional<medtrust::crypto::private_key> resolve(
      std::string_view reference) const override;

  /// Persist both halves of `key` under `reference`.
  bool store(std::string_view reference,
             const medtrust::crypto::private_key& key) const;

  std::filesystem::path private_key_path(std::string_view reference) const;
  std::filesystem::path public_key_path(std::string_view reference) const;

  const std::filesystem::path& directory() const { return directory_; }

 private:
  std::filesystem::path directory_;
};

/// Keys held in process. For embedders that source keys elsewhere.
class memory_key_store final : public key_store {
 public:
  std::optional<medtrust::crypto::private_key> resolve(
      std::string_view reference) const override;
  void add(std::string_view reference, medtrust::crypto::private_key key);

 private:
  mutable std::mutex mutex_;
  std::map<std::string, medtrust::crypto::private_key, std::less<>> keys_;
};

/// References are issuer ids restricted to `[A-Za-z0-9_.-]`, not starting
/// with a dot, so they are always safe to embed in a file name.
bool is_valid_reference(std::string_view reference);

}  // namespace medtrust::service
