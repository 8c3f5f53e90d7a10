#include "primitives/amount.hpp"

namespace veil::primitives {

std::string FormatAmount(Amount value) {
  auto text = std::to_string(value / kUnitsPerVeil);
  auto fraction = std::to_string(value % kUnitsPerVeil);
  if (fraction == "0") {
    return text;
  }
  fraction.insert(0, 8 - fraction.size(), '0');
  fraction.erase(fraction.find_last_not_of('0') + 1);
  return text + "." + fraction;
}

}  // namespace veil::primitives
