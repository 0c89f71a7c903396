#pragma once

#include <string>

namespace lendswap {
namespace domain {

// Identifier of a vault, a mint or a signing authority in the custodial
// token layer.
using AccountId = std::string;

}  // namespace domain
}  // namespace lendswap
