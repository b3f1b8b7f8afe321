#include <bazaar/crypto/verify.hpp>

#include <openssl/evp.h>

#include <memory>

namespace bazaar::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

bool verify_ed25519(const bazaar::schema::bytes_view_t& message,
                    const bazaar::schema::ed25519_signer_id& signer,
                    const bazaar::schema::ed25519_signature_t& signature) {
  auto pkey =
      evp_pkey_ptr{EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                               signer.public_key.data(),
                                               signer.public_key.size()),
                   EVP_PKEY_free};
  if (!pkey) {
    return false;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  // Ed25519 is a one-shot scheme: no digest, message passed whole.
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
      1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
}

}  // namespace

bool available() {
  static const auto available_now = [] {
    auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                                EVP_PKEY_CTX_free};
    return static_cast<bool>(ctx);
  }();
  return available_now;
}

bool verify_signature(const bazaar::schema::bytes_view_t& message,
                      const bazaar::schema::signer_id_t& signer,
                      const bazaar::schema::signature_t& signature) {
  return std::visit(
      overloaded{
          [&](const bazaar::schema::ed25519_signer_id& value) {
            const auto* ed25519 =
                std::get_if<bazaar::schema::ed25519_signature_t>(&signature);
            return ed25519 != nullptr &&
                   verify_ed25519(message, value, *ed25519);
          },
          [](const bazaar::schema::named_signer_t&) { return false; }},
      signer);
}

}  // namespace bazaar::crypto
