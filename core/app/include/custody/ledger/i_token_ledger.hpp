#pragma once

#include "custody/domain/principal.hpp"
#include "custody/domain/product.hpp"

namespace custody {

// -----------------------------------------------------------------------------
// ITokenLedger: fungible-token settlement boundary
// -----------------------------------------------------------------------------
//
// @brief  Balance lookup and a pull-transfer, the only ledger operations the
//         lifecycle core consumes.
//
// @details
// transfer() is atomic from the core's point of view: it either moves the
// full amount from `from` to `to` and returns true, or changes nothing and
// returns false. It is a bounded synchronous call; implementations must not
// block indefinitely or retry internally.
//
// A false return after balanceOf() reported enough funds is legitimate
// (authorization revoked, account frozen, ...). The core reports it as
// TransferFailed.
// -----------------------------------------------------------------------------
class ITokenLedger {
 public:
  virtual ~ITokenLedger() = default;

  virtual domain::Amount balanceOf(
      const domain::Principal& principal) const = 0;

  virtual bool transfer(const domain::Principal& from,
                        const domain::Principal& to,
                        domain::Amount amount) = 0;
};

}  // namespace custody
