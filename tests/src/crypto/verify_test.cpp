#include <covenant/blake3/hash.hpp>
#include <covenant/crypto/verify.hpp>
#include <covenant/governance/signature_verifier.hpp>
#include <covenant/testing/oath_signer.hpp>
#include <gtest/gtest.h>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>

#include <array>
#include <memory>
#include <optional>
#include <vector>

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif

using namespace covenant::schema;

namespace {

struct secp_oath_t final {
  secp256k1_signer_id signer;
  secp256k1_signature_t signature;
  hash32_t policy_hash;
};

/// secp256k1 key signing BLAKE3(policy) as [v || r || s].
std::optional<secp_oath_t> make_secp_oath(const std::string_view policy) {
  auto ec_key = std::unique_ptr<EC_KEY, decltype(&EC_KEY_free)>{
      EC_KEY_new_by_curve_name(NID_secp256k1), EC_KEY_free};
  if (!ec_key || EC_KEY_generate_key(ec_key.get()) != 1) {
    return std::nullopt;
  }
  EC_KEY_set_conv_form(ec_key.get(), POINT_CONVERSION_COMPRESSED);

  auto oath = secp_oath_t{.policy_hash = covenant::blake3::hash(policy)};
  auto* pub_ptr = oath.signer.public_key.data();
  if (i2o_ECPublicKey(ec_key.get(), &pub_ptr) !=
      static_cast<int>(oath.signer.public_key.size())) {
    return std::nullopt;
  }

  auto pkey = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>{
      EVP_PKEY_new(), EVP_PKEY_free};
  if (!pkey || EVP_PKEY_set1_EC_KEY(pkey.get(), ec_key.get()) != 1) {
    return std::nullopt;
  }

  auto sign_ctx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>{
      EVP_MD_CTX_new(), EVP_MD_CTX_free};
  auto der_size = size_t{};
  if (!sign_ctx ||
      EVP_DigestSignInit(sign_ctx.get(), nullptr, EVP_sha256(), nullptr,
                         pkey.get()) != 1 ||
      EVP_DigestSign(sign_ctx.get(), nullptr, &der_size,
                     oath.policy_hash.data(), oath.policy_hash.size()) != 1) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(der_size);
  if (EVP_DigestSign(sign_ctx.get(), der.data(), &der_size,
                     oath.policy_hash.data(), oath.policy_hash.size()) != 1) {
    return std::nullopt;
  }

  const auto* der_ptr = der.data();
  auto sig = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>{
      d2i_ECDSA_SIG(nullptr, &der_ptr, static_cast<long>(der_size)),
      ECDSA_SIG_free};
  if (!sig) {
    return std::nullopt;
  }
  const auto* r = static_cast<const BIGNUM*>(nullptr);
  const auto* s = static_cast<const BIGNUM*>(nullptr);
  ECDSA_SIG_get0(sig.get(), &r, &s);

  oath.signature[0] = 0;
  if (BN_bn2binpad(r, oath.signature.data() + 1, 32) != 32 ||
      BN_bn2binpad(s, oath.signature.data() + 33, 32) != 32) {
    return std::nullopt;
  }
  return oath;
}

}  // namespace

TEST(crypto_verify, ed25519_oath_verifies_only_for_its_policy) {
  if (!covenant::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto signer = covenant::testing::oath_signer{};
  auto signature = signer.swear("policy v1");
  auto sworn = covenant::blake3::hash(std::string_view{"policy v1"});
  auto amended = covenant::blake3::hash(std::string_view{"policy v2"});

  EXPECT_TRUE(covenant::crypto::verify_signature(bytes_view_t{sworn},
                                                 signer.public_key(), signature));
  EXPECT_FALSE(covenant::crypto::verify_signature(
      bytes_view_t{amended}, signer.public_key(), signature));
}

TEST(crypto_verify, ed25519_signature_from_another_key_is_rejected) {
  if (!covenant::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto owner = covenant::testing::oath_signer{};
  auto impostor = covenant::testing::oath_signer{};
  auto policy_hash = covenant::blake3::hash(std::string_view{"policy v1"});
  EXPECT_FALSE(covenant::crypto::verify_signature(
      bytes_view_t{policy_hash}, owner.public_key(),
      impostor.swear("policy v1")));
}

TEST(crypto_verify, secp256k1_oath_verifies_with_leading_recovery_id) {
  if (!covenant::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto oath = make_secp_oath("policy v1");
  ASSERT_TRUE(oath.has_value());
  auto verifier = covenant::governance::make_openssl_signature_verifier();

  EXPECT_TRUE(verifier(bytes_view_t{oath->policy_hash},
                       signer_id_t{oath->signer},
                       signature_t{oath->signature}));

  auto tampered = oath->policy_hash;
  tampered[0] ^= 0x01;
  EXPECT_FALSE(verifier(bytes_view_t{tampered}, signer_id_t{oath->signer},
                        signature_t{oath->signature}));
}

TEST(crypto_verify, secp256k1_signature_without_recovery_id_is_rejected) {
  if (!covenant::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto oath = make_secp_oath("policy v1");
  ASSERT_TRUE(oath.has_value());
  oath->signature[0] = 7;
  oath->signature[64] = 7;
  EXPECT_FALSE(covenant::crypto::verify_signature(
      bytes_view_t{oath->policy_hash}, signer_id_t{oath->signer},
      signature_t{oath->signature}));
}

TEST(crypto_verify, mismatched_signer_and_signature_schemes_never_verify) {
  auto ed_signer = ed25519_signer_id{};
  ed_signer.public_key[0] = 1;
  EXPECT_FALSE(covenant::crypto::verify_signature(
      bytes_view_t{}, signer_id_t{ed_signer},
      signature_t{secp256k1_signature_t{}}));
}

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif
