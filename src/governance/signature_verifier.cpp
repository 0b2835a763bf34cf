#include <covenant/crypto/verify.hpp>
#include <covenant/governance/signature_verifier.hpp>
#include <spdlog/spdlog.h>

namespace covenant::governance {

signature_verifier_t make_openssl_signature_verifier() {
  if (!covenant::crypto::available()) {
    spdlog::warn(
        "OpenSSL lacks ed25519 or secp256k1; affected oaths will not verify");
  }
  return [](const covenant::schema::bytes_view_t& message,
            const covenant::schema::signer_id_t& signer,
            const covenant::schema::signature_t& signature) {
    return covenant::crypto::verify_signature(message, signer, signature);
  };
}

}  // namespace covenant::governance
