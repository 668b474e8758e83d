#include <medtrust/service/key_store.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace medtrust::service {

bool is_valid_reference(const std::string_view reference) {
  if (reference.empty() || reference.front() == '.') {
    return false;
  }
  return std::ranges::all_of(reference, [](const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' ||
           c == '-' || c == '.';
  });
}

file_key_store::file_key_store(std::filesystem::path directory)
    : directory_{std::move(directory)} {}

std::filesystem::path file_key_store::private_key_path(
    const std::string_view reference) const {
  return directory_ /
         ("issuer_" + std::string{reference} + "_private_key.pem");
}

std::filesystem::path file_key_store::public_key_path(
    const std::string_view reference) const {
  return directory_ / ("issuer_" + std::string{reference} + "_public_key.pem");
}

std::optional<medtrust::crypto::private_key> file_key_store::resolve(
    const std::string_view reference) const {
  if (!is_valid_reference(reference)) {
    spdlog::warn("Rejected key reference '{}'", reference);
    return std::nullopt;
  }
  auto path = private_key_path(reference);
  auto error = std::error_code{};
  if (!std::filesystem::exists(path, error)) {
    spdlog::warn("No private key for '{}' at {}", reference, path.string());
    return std::nullopt;
  }
  return medtrust::crypto::private_key::load(path);
}

bool file_key_store::store(const std::string_view reference,
                           const medtrust::crypto::private_key& key) const {
  if (!is_valid_reference(reference)) {
    spdlog::error("Cannot store key under invalid reference '{}'", reference);
    return false;
  }
  if (!key.save(private_key_path(reference))) {
    return false;
  }
  return medtrust::crypto::save_public_key(public_key_path(reference),
                                           key.public_key());
}

std::optional<medtrust::crypto::private_key> memory_key_store::resolve(
    const std::string_view reference) const {
  auto lock = std::scoped_lock{mutex_};
  auto found = keys_.find(reference);
  if (found == std::end(keys_)) {
    return std::nullopt;
  }
  return found->second;
}

void memory_key_store::add(const std::string_view reference,
                           medtrust::crypto::private_key key) {
  auto lock = std::scoped_lock{mutex_};
  keys_.insert_or_assign(std::string{reference}, std::move(key));
}

}  // namespace medtrust::service
