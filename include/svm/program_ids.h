#pragma once

#include "common/types.h"
#include <string>

namespace localnet {
namespace svm {

using namespace localnet::common;

/**
 * Well-known program and sysvar addresses, identical to the live cluster's
 * so that client tooling resolves them unchanged.
 */
namespace program_ids {

// Builtin programs
const PublicKey& system_program();   // 11111111111111111111111111111111
const PublicKey& memo_program();     // MemoSq4gqABAXKb96qnH8TysNcWxMyWCqXgDLGmfcHr

// Loaders
const PublicKey& native_loader();
const PublicKey& bpf_loader();
const PublicKey& bpf_loader_upgradeable();

// Sysvars
const PublicKey& sysvar_owner();
const PublicKey& sysvar_clock();
const PublicKey& sysvar_rent();

/// True for the two BPF loaders a preloaded program may name as owner
bool is_bpf_loader(const PublicKey& id);

/// Short display name ("system", "memo", ...) or the base58 address
std::string display_name(const PublicKey& id);

} // namespace program_ids

} // namespace svm
} // namespace localnet
