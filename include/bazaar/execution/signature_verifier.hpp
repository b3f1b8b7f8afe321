#pragma once

#include <bazaar/schema/encoding/scale/encoder.hpp>
#include <bazaar/schema/primitives.hpp>
#include <bazaar/schema/transaction.hpp>
#include <functional>

namespace bazaar::execution {

using signature_verifier_t =
    std::function<bool(const bazaar::schema::bytes_view_t& message,
                       const bazaar::schema::signer_id_t& signer,
                       const bazaar::schema::signature_t& signature)>;

/// Bytes a signer signs: every envelope field except the signature itself.
inline bazaar::schema::bytes_t signing_payload(
    bazaar::schema::encoding::encoder<
        bazaar::schema::encoding::scale_encoder_tag>& encoder,
    const bazaar::schema::transaction_t& tx) {
  return encoder.encode(
      std::tuple{tx.version, tx.chain_id, tx.nonce, tx.signer, tx.payload});
}

}  // namespace bazaar::execution
