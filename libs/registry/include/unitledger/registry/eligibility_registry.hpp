#pragma once

#include <cstdint>
#include <optional>
#include <unordered_map>

#include "unitledger/common/types.hpp"

namespace unitledger {
namespace registry {

struct AssetInfo {
  bool listed{false};
  bool enabled{false};
  std::uint8_t decimals{0};
  common::Units units_per_reference_amount{0};
  std::optional<common::Units> cap_units{};  // nullopt = uncapped

  [[nodiscard]] bool eligible() const noexcept { return listed && enabled; }
};

// Registry feeds and configuration files encode "uncapped" as 0.
inline std::optional<common::Units> cap_from_raw(common::Units raw_cap) noexcept {
  if (raw_cap == 0) {
    return std::nullopt;
  }
  return raw_cap;
}

class EligibilityRegistry {
 public:
  virtual ~EligibilityRegistry() = default;

  // Unknown assets report a default (unlisted) AssetInfo.
  [[nodiscard]] virtual AssetInfo lookup(const common::AssetId& asset) const = 0;
};

class StaticRegistry final : public EligibilityRegistry {
 public:
  void list_asset(const common::AssetId& asset, AssetInfo info);
  void delist_asset(const common::AssetId& asset);
  void set_enabled(const common::AssetId& asset, bool enabled);
  void set_cap(const common::AssetId& asset, std::optional<common::Units> cap_units);

  [[nodiscard]] AssetInfo lookup(const common::AssetId& asset) const override;
  [[nodiscard]] std::size_t size() const noexcept { return assets_.size(); }

 private:
  std::unordered_map<common::AssetId, AssetInfo, common::AddressHash> assets_{};
};

}  // namespace registry
}  // namespace unitledger
