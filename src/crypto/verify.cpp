#include <covenant/crypto/verify.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/objects.h>

#include <array>
#include <memory>
#include <optional>
#include <vector>

using namespace covenant::schema;

namespace covenant::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

inline constexpr auto kScalarBytes = 32;

/// One-shot EVP verification. digest is null for ed25519, which hashes
/// internally.
bool digest_verify(EVP_PKEY* key,
                   const EVP_MD* digest,
                   const bytes_view_t& signature,
                   const bytes_view_t& message) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx ||
      EVP_DigestVerifyInit(ctx.get(), nullptr, digest, nullptr, key) != 1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
}

evp_pkey_ptr make_ed25519_key(const ed25519_signer_id& signer) {
  return evp_pkey_ptr{
      EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                  signer.public_key.data(),
                                  signer.public_key.size()),
      EVP_PKEY_free};
}

evp_pkey_ptr make_secp256k1_key(const secp256k1_signer_id& signer) {
  auto none = evp_pkey_ptr{nullptr, EVP_PKEY_free};
  auto ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1) {
    return none;
  }

  auto* curve = const_cast<char*>("secp256k1");
  auto params = std::array{
      OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME, curve, 0),
      OSSL_PARAM_construct_octet_string(
          OSSL_PKEY_PARAM_PUB_KEY,
          const_cast<unsigned char*>(signer.public_key.data()),
          signer.public_key.size()),
      OSSL_PARAM_construct_end()};
  auto* key = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(ctx.get(), &key, EVP_PKEY_PUBLIC_KEY, params.data()) !=
      1) {
    return none;
  }
  return evp_pkey_ptr{key, EVP_PKEY_free};
}

/// Offset of r||s inside a 65 byte recoverable signature, which carries the
/// recovery id v in front or at the back. v is 0..3 or 27 and above.
std::optional<std::size_t> compact_offset(const secp256k1_signature_t& signature) {
  auto is_recovery_id = [](const uint8_t v) { return v <= 3 || v >= 27; };
  if (is_recovery_id(signature.front())) {
    return 1;
  }
  if (is_recovery_id(signature.back())) {
    return 0;
  }
  return std::nullopt;
}

/// r||s to the DER form EVP expects.
std::optional<bytes_t> to_der(const uint8_t* compact) {
  auto r = bignum_ptr{BN_bin2bn(compact, kScalarBytes, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(compact + kScalarBytes, kScalarBytes, nullptr),
                      BN_free};
  auto sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  if (!r || !s || !sig ||
      ECDSA_SIG_set0(sig.get(), r.get(), s.get()) != 1) {
    return std::nullopt;
  }
  // Owned by sig from here on.
  static_cast<void>(r.release());
  static_cast<void>(s.release());

  auto length = i2d_ECDSA_SIG(sig.get(), nullptr);
  if (length <= 0) {
    return std::nullopt;
  }
  auto der = bytes_t(static_cast<std::size_t>(length));
  auto* out = der.data();
  if (i2d_ECDSA_SIG(sig.get(), &out) != length) {
    return std::nullopt;
  }
  return der;
}

bool verify_ed25519(const bytes_view_t& message,
                    const ed25519_signer_id& signer,
                    const ed25519_signature_t& signature) {
  auto key = make_ed25519_key(signer);
  return key && digest_verify(key.get(), nullptr, bytes_view_t{signature},
                              message);
}

bool verify_secp256k1(const bytes_view_t& message,
                      const secp256k1_signer_id& signer,
                      const secp256k1_signature_t& signature) {
  auto offset = compact_offset(signature);
  if (!offset) {
    return false;
  }
  auto der = to_der(signature.data() + *offset);
  auto key = make_secp256k1_key(signer);
  return der && key &&
         digest_verify(key.get(), EVP_sha256(), make_bytes_view(*der), message);
}

}  // namespace

bool available() {
  static const auto probed = [] {
    auto ed25519 = evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free};
    return static_cast<bool>(ed25519) && OBJ_sn2nid("secp256k1") != NID_undef;
  }();
  return probed;
}

bool verify_signature(const bytes_view_t& message,
                      const signer_id_t& signer,
                      const signature_t& signature) {
  return std::visit(
      overloaded{[&](const ed25519_signer_id& value) {
                   const auto* raw = std::get_if<ed25519_signature_t>(&signature);
                   return raw != nullptr && verify_ed25519(message, value, *raw);
                 },
                 [&](const secp256k1_signer_id& value) {
                   const auto* raw =
                       std::get_if<secp256k1_signature_t>(&signature);
                   return raw != nullptr &&
                          verify_secp256k1(message, value, *raw);
                 }},
      signer);
}

}  // namespace covenant::crypto
