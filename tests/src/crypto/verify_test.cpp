#include <trackchain/crypto/verify.hpp>
#include <trackchain/execution/signature_verifier.hpp>
#include <trackchain/schema/encoding/scale/encoder.hpp>
#include <trackchain/testing/execution_harness.hpp>
#include <gtest/gtest.h>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>

#include <algorithm>
#include <array>
#include <optional>
#include <vector>

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif

namespace {

struct ed25519_key_t final {
  EVP_PKEY* pkey{};
  trackchain::schema::ed25519_identity identity;

  ~ed25519_key_t() { EVP_PKEY_free(pkey); }
};

std::optional<trackchain::schema::ed25519_signature_t> sign_ed25519(
    EVP_PKEY* pkey,
    const trackchain::schema::bytes_view_t& message) {
  auto signature = trackchain::schema::ed25519_signature_t{};
  auto signature_size = signature.size();
  auto* sign_ctx = EVP_MD_CTX_new();
  if (sign_ctx == nullptr) {
    return std::nullopt;
  }
  auto ok = EVP_DigestSignInit(sign_ctx, nullptr, nullptr, nullptr, pkey) == 1 &&
            EVP_DigestSign(sign_ctx, signature.data(), &signature_size,
                           message.data(), message.size()) == 1;
  EVP_MD_CTX_free(sign_ctx);
  if (!ok || signature_size != signature.size()) {
    return std::nullopt;
  }
  return signature;
}

void make_ed25519_key(ed25519_key_t& key) {
  auto* keygen_ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
  ASSERT_NE(keygen_ctx, nullptr);
  ASSERT_EQ(EVP_PKEY_keygen_init(keygen_ctx), 1);
  ASSERT_EQ(EVP_PKEY_keygen(keygen_ctx, &key.pkey), 1);
  EVP_PKEY_CTX_free(keygen_ctx);

  auto public_key_size = key.identity.public_key.size();
  ASSERT_EQ(EVP_PKEY_get_raw_public_key(key.pkey, key.identity.public_key.data(),
                                        &public_key_size),
            1);
  ASSERT_EQ(public_key_size, key.identity.public_key.size());
}

struct secp_fixture_t final {
  trackchain::schema::secp256k1_identity signer;
  trackchain::schema::secp256k1_signature_t signature;
  std::vector<uint8_t> message;
};

// Signature laid out as [r || s || v] with v = 0.
std::optional<secp_fixture_t> make_secp_fixture() {
  auto* ec_key = EC_KEY_new_by_curve_name(NID_secp256k1);
  if (ec_key == nullptr) {
    return std::nullopt;
  }
  if (EC_KEY_generate_key(ec_key) != 1) {
    EC_KEY_free(ec_key);
    return std::nullopt;
  }
  EC_KEY_set_conv_form(ec_key, POINT_CONVERSION_COMPRESSED);

  auto compressed = std::array<uint8_t, 33>{};
  auto* pub_ptr = compressed.data();
  auto pub_len = i2o_ECPublicKey(ec_key, &pub_ptr);
  if (pub_len != static_cast<long>(compressed.size())) {
    EC_KEY_free(ec_key);
    return std::nullopt;
  }

  auto* pkey = EVP_PKEY_new();
  if (pkey == nullptr) {
    EC_KEY_free(ec_key);
    return std::nullopt;
  }
  if (EVP_PKEY_assign_EC_KEY(pkey, ec_key) != 1) {
    EVP_PKEY_free(pkey);
    EC_KEY_free(ec_key);
    return std::nullopt;
  }

  auto message = std::vector<uint8_t>{'c', 'u', 's', 't', 'o', 'd', 'y'};
  auto* sign_ctx = EVP_MD_CTX_new();
  if (sign_ctx == nullptr) {
    EVP_PKEY_free(pkey);
    return std::nullopt;
  }
  auto der_size = size_t{};
  auto der = std::vector<uint8_t>{};
  auto signed_ok =
      EVP_DigestSignInit(sign_ctx, nullptr, EVP_sha256(), nullptr, pkey) == 1 &&
      EVP_DigestSign(sign_ctx, nullptr, &der_size, message.data(),
                     message.size()) == 1;
  if (signed_ok) {
    der.resize(der_size);
    signed_ok = EVP_DigestSign(sign_ctx, der.data(), &der_size, message.data(),
                               message.size()) == 1;
  }
  EVP_MD_CTX_free(sign_ctx);
  EVP_PKEY_free(pkey);
  if (!signed_ok) {
    return std::nullopt;
  }

  const auto* der_ptr = static_cast<const unsigned char*>(der.data());
  auto* sig = d2i_ECDSA_SIG(nullptr, &der_ptr, static_cast<long>(der_size));
  if (sig == nullptr) {
    return std::nullopt;
  }
  const auto* r = static_cast<const BIGNUM*>(nullptr);
  const auto* s = static_cast<const BIGNUM*>(nullptr);
  ECDSA_SIG_get0(sig, &r, &s);

  auto compact = trackchain::schema::secp256k1_signature_t{};
  auto ok_r = BN_bn2binpad(r, compact.data(), 32);
  auto ok_s = BN_bn2binpad(s, compact.data() + 32, 32);
  compact[64] = 0;
  ECDSA_SIG_free(sig);
  if (ok_r != 32 || ok_s != 32) {
    return std::nullopt;
  }

  return secp_fixture_t{
      .signer =
          trackchain::schema::secp256k1_identity{.public_key = compressed},
      .signature = compact,
      .message = std::move(message)};
}

bool verify(const std::vector<uint8_t>& message,
            const trackchain::schema::identity_t& signer,
            const trackchain::schema::signature_t& signature) {
  return trackchain::crypto::verify_signature(
      trackchain::schema::bytes_view_t{message.data(), message.size()}, signer,
      signature);
}

}  // namespace

TEST(crypto_verify, verifies_ed25519_signatures) {
  if (!trackchain::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto key = ed25519_key_t{};
  make_ed25519_key(key);
  if (::testing::Test::HasFatalFailure()) {
    return;
  }

  auto message = std::vector<uint8_t>{'w', 'i', 'd', 'g', 'e', 't'};
  auto signature = sign_ed25519(
      key.pkey, trackchain::schema::bytes_view_t{message.data(), message.size()});
  ASSERT_TRUE(signature.has_value());

  auto signer = trackchain::schema::identity_t{key.identity};
  EXPECT_TRUE(verify(message, signer, signature.value()));

  message[0] ^= 0x01;
  EXPECT_FALSE(verify(message, signer, signature.value()));
}

TEST(crypto_verify, verifies_secp256k1_signatures) {
  if (!trackchain::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = make_secp_fixture();
  ASSERT_TRUE(fixture.has_value());
  auto signer = trackchain::schema::identity_t{fixture->signer};
  EXPECT_TRUE(verify(fixture->message, signer, fixture->signature));

  // The recovery id may also lead the signature.
  auto leading = trackchain::schema::secp256k1_signature_t{};
  leading[0] = 27;
  std::copy_n(fixture->signature.data(), 64, leading.data() + 1);
  if (leading[64] > 3 && leading[64] != 27 && leading[64] != 28) {
    EXPECT_TRUE(verify(fixture->message, signer, leading));
  }

  fixture->message[0] ^= 0x01;
  EXPECT_FALSE(verify(fixture->message, signer, fixture->signature));
}

TEST(crypto_verify, rejects_invalid_secp256k1_recovery_id) {
  if (!trackchain::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = make_secp_fixture();
  ASSERT_TRUE(fixture.has_value());
  fixture->signature[0] = 7;
  fixture->signature[64] = 7;
  EXPECT_FALSE(verify(fixture->message,
                      trackchain::schema::identity_t{fixture->signer},
                      fixture->signature));
}

TEST(crypto_verify, rejects_mismatched_signer_and_signature_variants) {
  auto ed_signer = trackchain::schema::ed25519_identity{};
  ed_signer.public_key[0] = 1;
  auto secp_signature = trackchain::schema::secp256k1_signature_t{};

  EXPECT_FALSE(verify({}, trackchain::schema::identity_t{ed_signer},
                      trackchain::schema::signature_t{secp_signature}));
}

TEST(crypto_verify, rejects_named_identity_signatures) {
  auto message = std::vector<uint8_t>{'a', 'b', 'c'};
  EXPECT_FALSE(verify(message, trackchain::testing::make_named_identity(0x42),
                      trackchain::schema::ed25519_signature_t{}));
}

TEST(crypto_verify, engine_accepts_transaction_signed_over_signing_message) {
  if (!trackchain::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto key = ed25519_key_t{};
  make_ed25519_key(key);
  if (::testing::Test::HasFatalFailure()) {
    return;
  }

  auto encoder = trackchain::testing::scale_encoder_t{};
  auto tx = trackchain::testing::make_transaction(
      trackchain::testing::make_hash(1), 1,
      trackchain::schema::identity_t{key.identity},
      trackchain::schema::verify_receive_t{
          .product_id = trackchain::testing::make_product_id(1),
          .content_hash = "QmR"});
  auto message = trackchain::execution::make_signing_message(encoder, tx);
  auto signature = sign_ed25519(
      key.pkey, trackchain::schema::bytes_view_t{message.data(), message.size()});
  ASSERT_TRUE(signature.has_value());
  tx.signature = signature.value();

  EXPECT_TRUE(verify(message, tx.signer, tx.signature));

  // The signature does not cover a different nonce.
  tx.nonce = 2;
  auto replayed = trackchain::execution::make_signing_message(encoder, tx);
  EXPECT_NE(replayed, message);
  EXPECT_FALSE(verify(replayed, tx.signer, tx.signature));
}

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif
