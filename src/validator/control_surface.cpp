#include "validator/control_surface.h"
#include "common/logging.h"

namespace localnet {
namespace validator {

ControlSurface::ControlSurface(ValidatorCore &core, BlockProductionLoop &loop)
    : core_(core), loop_(loop) {}

Result<Lamports> ControlSurface::airdrop(const PublicKey &address, Lamports amount) {
  return core_.airdrop(address, amount);
}

Result<bool> ControlSurface::set_account(const PublicKey &address, const svm::Account &account) {
  return core_.set_account(address, account);
}

Result<Slot> ControlSurface::warp_to_slot(Slot target) {
  auto result = core_.warp_to_slot(target);
  loop_.handle_result(result);
  return result;
}

Result<bool> ControlSurface::reset() {
  auto result = core_.reset();
  if (result.is_ok() && loop_.is_halted()) {
    loop_.clear_halt();
    LOG_INFO("Cleared production halt after reset; start() resumes the timer");
  }
  return result;
}

Result<Slot> ControlSurface::advance() {
  return loop_.advance();
}

} // namespace validator
} // namespace localnet
