#include "svm/program_ids.h"
#include "common/encoding.h"
#include <stdexcept>

namespace localnet {
namespace svm {

namespace program_ids {

namespace {

PublicKey decode_constant(const char* address) {
    auto key = parse_pubkey(address);
    if (!key.is_ok()) {
        throw std::logic_error(std::string("bad well-known address ") + address);
    }
    return key.value();
}

} // namespace

const PublicKey& system_program() {
    static const PublicKey id = decode_constant("11111111111111111111111111111111");
    return id;
}

const PublicKey& memo_program() {
    static const PublicKey id = decode_constant("MemoSq4gqABAXKb96qnH8TysNcWxMyWCqXgDLGmfcHr");
    return id;
}

const PublicKey& native_loader() {
    static const PublicKey id = decode_constant("NativeLoader1111111111111111111111111111111");
    return id;
}

const PublicKey& bpf_loader() {
    static const PublicKey id = decode_constant("BPFLoader2111111111111111111111111111111111");
    return id;
}

const PublicKey& bpf_loader_upgradeable() {
    static const PublicKey id = decode_constant("BPFLoaderUpgradeab1e11111111111111111111111");
    return id;
}

const PublicKey& sysvar_owner() {
    static const PublicKey id = decode_constant("Sysvar1111111111111111111111111111111111111");
    return id;
}

const PublicKey& sysvar_clock() {
    static const PublicKey id = decode_constant("SysvarC1ock11111111111111111111111111111111");
    return id;
}

const PublicKey& sysvar_rent() {
    static const PublicKey id = decode_constant("SysvarRent111111111111111111111111111111111");
    return id;
}

bool is_bpf_loader(const PublicKey& id) {
    return id == bpf_loader() || id == bpf_loader_upgradeable();
}

std::string display_name(const PublicKey& id) {
    if (id == system_program()) return "system";
    if (id == memo_program()) return "memo";
    if (id == native_loader()) return "native_loader";
    if (id == bpf_loader()) return "bpf_loader";
    if (id == bpf_loader_upgradeable()) return "bpf_loader_upgradeable";
    if (id == sysvar_clock()) return "sysvar_clock";
    if (id == sysvar_rent()) return "sysvar_rent";
    return encode_base58(id);
}

} // namespace program_ids

} // namespace svm
} // namespace localnet
