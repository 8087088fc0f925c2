#pragma once

#include "common/types.h"
#include "svm/account.h"
#include "validator/block_production.h"
#include "validator/core.h"

namespace localnet {
namespace validator {

/**
 * @brief Test-only controls over the local chain
 *
 * Every call takes the core's mutation lock, so controls never interleave
 * with a production step.
 */
class ControlSurface {
public:
  ControlSurface(ValidatorCore &core, BlockProductionLoop &loop);

  /**
   * @brief Credit lamports without a transaction or fee
   * @return the new balance; SUPPLY over the cap, INVALID_ARGUMENT for a
   *         zero amount or malformed address
   */
  Result<Lamports> airdrop(const PublicKey &address, Lamports amount);

  /// Overwrite an account wholesale; zero lamports removes it
  Result<bool> set_account(const PublicKey &address, const svm::Account &account);

  /**
   * @brief Produce exactly target - latest entries; only the last drains
   *        the intake queue
   */
  Result<Slot> warp_to_slot(Slot target);

  /// Rebuild the chain from the retained genesis config
  Result<bool> reset();

  /// One manual production step
  Result<Slot> advance();

private:
  ValidatorCore &core_;
  BlockProductionLoop &loop_;
};

} // namespace validator
} // namespace localnet
