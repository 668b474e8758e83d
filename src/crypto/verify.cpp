#include <medtrust/crypto/openssl.hpp>
#include <medtrust/crypto/verify.hpp>

#include <openssl/core_names.h>

#include <array>
#include <cstring>
#include <string>
#include <vector>

namespace medtrust::crypto {

namespace detail {

evp_pkey_ptr make_public_pkey(const medtrust::schema::public_key_t& public_key) {
  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }

  auto* group_name = const_cast<char*>(kCurveName);
  auto params =
      std::array{OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                  group_name, 0),
                 OSSL_PARAM_construct_octet_string(
                     OSSL_PKEY_PARAM_PUB_KEY,
                     const_cast<unsigned char*>(public_key.data()),
                     public_key.size()),
                 OSSL_PARAM_construct_end()};

  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_PUBLIC_KEY,
                        params.data()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

std::optional<medtrust::schema::public_key_t> compressed_public_key(
    const EVP_PKEY* pkey) {
  if (pkey == nullptr || EVP_PKEY_is_a(pkey, "EC") != 1) {
    return std::nullopt;
  }
  auto group = std::array<char, 64>{};
  auto group_length = size_t{};
  if (EVP_PKEY_get_utf8_string_param(pkey, OSSL_PKEY_PARAM_GROUP_NAME,
                                     group.data(), group.size(),
                                     &group_length) != 1 ||
      std::string{group.data(), group_length} != kCurveName) {
    return std::nullopt;
  }

  auto* raw_x = static_cast<BIGNUM*>(nullptr);
  auto* raw_y = static_cast<BIGNUM*>(nullptr);
  if (EVP_PKEY_get_bn_param(pkey, OSSL_PKEY_PARAM_EC_PUB_X, &raw_x) != 1) {
    return std::nullopt;
  }
  auto x = bignum_ptr{raw_x, BN_free};
  if (EVP_PKEY_get_bn_param(pkey, OSSL_PKEY_PARAM_EC_PUB_Y, &raw_y) != 1) {
    return std::nullopt;
  }
  auto y = bignum_ptr{raw_y, BN_free};

  auto out = medtrust::schema::public_key_t{};
  out[0] = BN_is_odd(y.get()) == 1 ? 0x03 : 0x02;
  if (BN_bn2binpad(x.get(), out.data() + 1, 32) != 32) {
    return std::nullopt;
  }
  return out;
}

}  // namespace detail

bool available() {
  static const auto available_now = [] {
    auto ctx = detail::evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
    return static_cast<bool>(ctx);
  }();
  return available_now;
}

bool verify_signature(const medtrust::schema::bytes_view_t& message,
                      const medtrust::schema::public_key_t& public_key,
                      const medtrust::schema::signature_t& signature) {
  auto pkey = detail::make_public_pkey(public_key);
  if (!pkey) {
    return false;
  }

  auto ecdsa_sig = detail::ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  if (!ecdsa_sig) {
    return false;
  }
  auto r = detail::bignum_ptr{BN_bin2bn(signature.data(), 32, nullptr), BN_free};
  auto s = detail::bignum_ptr{BN_bin2bn(signature.data() + 32, 32, nullptr),
                              BN_free};
  if (!r || !s ||
      ECDSA_SIG_set0(ecdsa_sig.get(), r.get(), s.get()) != 1) {
    return false;
  }
  // ECDSA_SIG now owns r and s.
  r.release();
  s.release();

  auto der_len = i2d_ECDSA_SIG(ecdsa_sig.get(), nullptr);
  if (der_len <= 0) {
    return false;
  }
  auto der = std::vector<uint8_t>(static_cast<size_t>(der_len));
  auto* der_ptr = der.data();
  i2d_ECDSA_SIG(ecdsa_sig.get(), &der_ptr);

  auto ctx = detail::evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                           pkey.get()) == 1) {
    ok = EVP_DigestVerify(ctx.get(), der.data(), der.size(), message.data(),
                          message.size()) == 1;
  }
  return ok;
}

}  // namespace medtrust::crypto
