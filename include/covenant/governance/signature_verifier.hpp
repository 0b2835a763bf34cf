#pragma once

#include <covenant/schema/primitives.hpp>

#include <functional>

namespace covenant::governance {

using signature_verifier_t =
    std::function<bool(const covenant::schema::bytes_view_t& message,
                       const covenant::schema::signer_id_t& signer,
                       const covenant::schema::signature_t& signature)>;

/// ed25519 / secp256k1 verification through OpenSSL.
signature_verifier_t make_openssl_signature_verifier();

}  // namespace covenant::governance
