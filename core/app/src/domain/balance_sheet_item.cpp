#include "liqsim/domain/balance_sheet_item.hpp"

#include <stdexcept>

namespace liqsim {
namespace domain {

const BalanceSheetItem* findItem(const BalanceSheet& sheet,
                                 const std::string& name) {
  for (const auto& item : sheet) {
    if (item.name == name) {
      return &item;
    }
  }
  return nullptr;
}

BalanceSheetItem* findItem(BalanceSheet& sheet, const std::string& name) {
  for (auto& item : sheet) {
    if (item.name == name) {
      return &item;
    }
  }
  return nullptr;
}

double itemAmount(const BalanceSheet& sheet, const std::string& name) {
  const BalanceSheetItem* item = findItem(sheet, name);
  return item != nullptr ? item->amount : 0.0;
}

double totalAssets(const BalanceSheet& sheet) {
  double total = 0.0;
  for (const auto& item : sheet) {
    if (item.category == ItemCategory::LiquidAsset ||
        item.category == ItemCategory::IlliquidAsset) {
      total += item.amount;
    }
  }
  return total;
}

const char* toString(ItemCategory category) {
  switch (category) {
    case ItemCategory::LiquidAsset:
      return "liquid_asset";
    case ItemCategory::IlliquidAsset:
      return "illiquid_asset";
    case ItemCategory::Liability:
      return "liability";
    case ItemCategory::Equity:
      return "equity";
    case ItemCategory::OffBalanceSheet:
      return "off_balance_sheet";
  }
  return "unknown";
}

ItemCategory parseItemCategory(const std::string& name) {
  if (name == "liquid_asset") return ItemCategory::LiquidAsset;
  if (name == "illiquid_asset") return ItemCategory::IlliquidAsset;
  if (name == "liability") return ItemCategory::Liability;
  if (name == "equity") return ItemCategory::Equity;
  if (name == "off_balance_sheet") return ItemCategory::OffBalanceSheet;
  throw std::invalid_argument("unknown balance sheet category: " + name);
}

}  // namespace domain
}  // namespace liqsim
