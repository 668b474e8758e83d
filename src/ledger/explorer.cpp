#include <medtrust/ledger/explorer.hpp>

#include <array>
#include <utility>

namespace medtrust::ledger {

namespace {

inline constexpr auto kExplorerBases =
    std::array<std::pair<std::string_view, std::string_view>, 5>{{
        {"polygon-mumbai", "https://mumbai.polygonscan.com/tx/"},
        {"polygon", "https://polygonscan.com/tx/"},
        {"goerli", "https://goerli.etherscan.io/tx/"},
        {"sepolia", "https://sepolia.etherscan.io/tx/"},
        {"mainnet", "https://etherscan.io/tx/"},
    }};

inline constexpr auto kFallbackExplorerBase =
    std::string_view{"https://etherscan.io/tx/"};

}  // namespace

std::string explorer_url(const std::string_view network,
                         const std::string_view ledger_reference) {
  auto base = kFallbackExplorerBase;
  for (const auto& [name, url] : kExplorerBases) {
    if (name == network) {
      base = url;
      break;
    }
  }
  auto url = std::string{base};
  url.append(ledger_reference);
  return url;
}

}  // namespace medtrust::ledger
