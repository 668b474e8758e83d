#pragma once

#include <string>
#include <string_view>

namespace medtrust::ledger {

inline constexpr auto kDefaultNetwork = std::string_view{"polygon-mumbai"};

/// Block explorer URL for a ledger reference on the named network. Unknown
/// networks fall back to Ethereum mainnet's explorer.
std::string explorer_url(std::string_view network,
                         std::string_view ledger_reference);

}  // namespace medtrust::ledger
