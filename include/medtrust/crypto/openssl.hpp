#pragma once

#include <medtrust/schema/primitives.hpp>

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>

#include <memory>
#include <optional>

namespace medtrust::crypto::detail {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using bio_ptr = std::unique_ptr<BIO, decltype(&BIO_free)>;

/// OpenSSL's name for the P-256 group.
inline constexpr auto kCurveName = "prime256v1";

/// Public EVP key from a SEC1 compressed point on P-256.
evp_pkey_ptr make_public_pkey(const medtrust::schema::public_key_t& public_key);

/// Compressed point of an EC key; nullopt for non P-256 keys.
std::optional<medtrust::schema::public_key_t> compressed_public_key(
    const EVP_PKEY* pkey);

}  // namespace medtrust::crypto::detail
