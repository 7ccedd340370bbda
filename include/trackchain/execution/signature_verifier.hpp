#pragma once

#include <trackchain/execution/state_overlay.hpp>
#include <trackchain/schema/primitives.hpp>
#include <trackchain/schema/transaction.hpp>
#include <functional>

namespace trackchain::execution {

using signature_verifier_t =
    std::function<bool(const trackchain::schema::bytes_view_t& message,
                       const trackchain::schema::identity_t& signer,
                       const trackchain::schema::signature_t& signature)>;

/// Bytes covered by a transaction signature: the SCALE encoding of every
/// envelope field except the signature itself.
trackchain::schema::bytes_t make_signing_message(
    encoder_t& encoder,
    const trackchain::schema::transaction_t& tx);

}  // namespace trackchain::execution
