#pragma once

#include <medtrust/schema/primitives.hpp>

namespace medtrust::crypto {

/// True when the linked OpenSSL exposes EC keys on P-256.
bool available();

/// ECDSA P-256 / SHA-256 verification of a compact [r || s] signature over
/// `message`. Any malformed key or signature yields false.
bool verify_signature(const medtrust::schema::bytes_view_t& message,
                      const medtrust::schema::public_key_t& public_key,
                      const medtrust::schema::signature_t& signature);

}  // namespace medtrust::crypto
