#pragma once

#include <trackchain/schema/primitives.hpp>

namespace trackchain::crypto {

/// True when the linked OpenSSL provides both ed25519 and secp256k1.
bool available();

/// Verify `signature` over `message` for `signer`. Named identities carry no
/// key material and never verify.
bool verify_signature(const trackchain::schema::bytes_view_t& message,
                      const trackchain::schema::identity_t& signer,
                      const trackchain::schema::signature_t& signature);

}  // namespace trackchain::crypto
