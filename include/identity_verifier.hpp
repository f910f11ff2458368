#pragma once

#include <openssl/evp.h>
#include <openssl/sha.h>

#include "types.hpp"

namespace bhumi {

// Signature verification seam. The relay treats the scheme as an opaque
// primitive; the production implementation is Ed25519.
class IdentityVerifier {
public:
    virtual ~IdentityVerifier() = default;

    /**
     * Verifies that `signature` over `message` was produced by the key `id52`.
     * @return false for any malformed key or signature as well as for a mismatch.
     */
    virtual bool verify(const Id52& id52, const Bytes& message, const Signature& signature) const = 0;
};

class Ed25519Verifier : public IdentityVerifier {
public:
    bool verify(const Id52& id52, const Bytes& message, const Signature& signature) const override {
        EVP_PKEY* pkey = EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, id52.data(), id52.size());
        if (!pkey) return false;

        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        bool result = false;

        if (ctx && EVP_DigestVerifyInit(ctx, nullptr, nullptr, nullptr, pkey) == 1) {
            if (EVP_DigestVerify(ctx, signature.data(), signature.size(), message.data(), message.size()) == 1) {
                result = true;
            }
        }

        EVP_MD_CTX_free(ctx);
        EVP_PKEY_free(pkey);
        return result;
    }
};

// commit = SHA-256(preimage)
inline Commit commit_of(const Preimage& preimage) {
    Commit commit;
    SHA256(preimage.data(), preimage.size(), commit.data());
    return commit;
}

// The message a device signs in I_AM: nonce (u32 BE) || id52.
inline Bytes handshake_message(uint32_t nonce, const Id52& id52) {
    Bytes msg;
    msg.reserve(4 + id52.size());
    msg.push_back(static_cast<uint8_t>(nonce >> 24));
    msg.push_back(static_cast<uint8_t>(nonce >> 16));
    msg.push_back(static_cast<uint8_t>(nonce >> 8));
    msg.push_back(static_cast<uint8_t>(nonce));
    msg.insert(msg.end(), id52.begin(), id52.end());
    return msg;
}

}
