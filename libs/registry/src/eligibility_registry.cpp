#include "unitledger/registry/eligibility_registry.hpp"

#include <stdexcept>

namespace unitledger {
namespace registry {

void StaticRegistry::list_asset(const common::AssetId& asset, AssetInfo info) {
  if (asset.is_null()) {
    throw std::invalid_argument("cannot list the null asset");
  }
  info.listed = true;
  assets_[asset] = info;
}

void StaticRegistry::delist_asset(const common::AssetId& asset) {
  if (auto it = assets_.find(asset); it != assets_.end()) {
    it->second.listed = false;
  }
}

void StaticRegistry::set_enabled(const common::AssetId& asset, bool enabled) {
  auto it = assets_.find(asset);
  if (it == assets_.end()) {
    throw std::invalid_argument("asset not listed: " + asset.to_hex());
  }
  it->second.enabled = enabled;
}

void StaticRegistry::set_cap(const common::AssetId& asset, std::optional<common::Units> cap_units) {
  auto it = assets_.find(asset);
  if (it == assets_.end()) {
    throw std::invalid_argument("asset not listed: " + asset.to_hex());
  }
  it->second.cap_units = cap_units;
}

AssetInfo StaticRegistry::lookup(const common::AssetId& asset) const {
  if (auto it = assets_.find(asset); it != assets_.end()) {
    return it->second;
  }
  return {};
}

}  // namespace registry
}  // namespace unitledger
