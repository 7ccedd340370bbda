#include <trackchain/execution/signature_verifier.hpp>

#include <tuple>

namespace trackchain::execution {

trackchain::schema::bytes_t make_signing_message(
    encoder_t& encoder,
    const trackchain::schema::transaction_t& tx) {
  return encoder.encode(
      std::tuple{tx.version, tx.chain_id, tx.nonce, tx.signer, tx.payload});
}

}  // namespace trackchain::execution
