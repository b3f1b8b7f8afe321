#pragma once

#include <bazaar/schema/primitives.hpp>

namespace bazaar::crypto {

/// True when the linked OpenSSL exposes Ed25519.
bool available();

/// Verify `signature` over `message` for `signer`.
///
/// Named signers carry no key material and never verify.
bool verify_signature(const bazaar::schema::bytes_view_t& message,
                      const bazaar::schema::signer_id_t& signer,
                      const bazaar::schema::signature_t& signature);

}  // namespace bazaar::crypto
