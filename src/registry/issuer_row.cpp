#include <medtrust/registry/issuer_row.hpp>

#include <algorithm>
#include <iterator>

namespace medtrust::registry {

std::shared_ptr<issuer_row> issuer_row_table::find(
    const medtrust::schema::issuer_id_t& issuer_id) const {
  auto lock = std::shared_lock{mutex_};
  auto it = rows_.find(issuer_id);
  if (it == std::end(rows_)) {
    return nullptr;
  }
  return it->second;
}

std::shared_ptr<issuer_row> issuer_row_table::find_or_create(
    const medtrust::schema::issuer_id_t& issuer_id) {
  {
    auto lock = std::shared_lock{mutex_};
    auto it = rows_.find(issuer_id);
    if (it != std::end(rows_)) {
      return it->second;
    }
  }
  auto lock = std::unique_lock{mutex_};
  auto [it, inserted] =
      rows_.try_emplace(issuer_id, std::make_shared<issuer_row>());
  return it->second;
}

std::size_t issuer_row_table::size() const {
  auto lock = std::shared_lock{mutex_};
  return rows_.size();
}

medtrust::schema::key_status_t status_in(
    const std::vector<medtrust::schema::key_record>& keys,
    const medtrust::schema::public_key_t& public_key,
    const medtrust::schema::timestamp_milliseconds_t as_of) {
  auto index = index_of(keys, public_key);
  if (!index.has_value()) {
    return medtrust::schema::key_status_t::unknown;
  }
  return keys[*index].status_at(as_of);
}

std::size_t revoke_all(std::vector<medtrust::schema::key_record>& keys,
                       const medtrust::schema::timestamp_milliseconds_t now) {
  auto changed = std::size_t{};
  for (auto& key : keys) {
    if (!key.revoked_at.has_value()) {
      key.revoked_at = now;
      ++changed;
    }
  }
  return changed;
}

std::optional<std::size_t> index_of(
    const std::vector<medtrust::schema::key_record>& keys,
    const medtrust::schema::public_key_t& public_key) {
  auto it = std::ranges::find_if(keys, [&](const auto& key) {
    return key.public_key == public_key;
  });
  if (it == std::end(keys)) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(std::distance(std::begin(keys), it));
}

}  // namespace medtrust::registry
