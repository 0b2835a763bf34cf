#pragma once

#include <covenant/schema/primitives.hpp>

namespace covenant::crypto {

/// True when the linked OpenSSL provides both ed25519 and secp256k1.
bool available();

/// Verify signature over message under signer. Named signers carry no key
/// material and never verify.
bool verify_signature(const covenant::schema::bytes_view_t& message,
                      const covenant::schema::signer_id_t& signer,
                      const covenant::schema::signature_t& signature);

}  // namespace covenant::crypto
