#include "OpensslMechanism.hpp"
#include "BenchmarkParams.hpp"
#include "Errors.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace pqc_bench {

namespace {

using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

// Generates a keypair of the given raw-key type (X25519, Ed25519)
KeyPair GenerateRawKeyPair(int type, size_t pub_size, size_t priv_size) {
    PkeyCtxPtr pctx(EVP_PKEY_CTX_new_id(type, nullptr), EVP_PKEY_CTX_free);
    if (!pctx) throw LibraryError("EVP_PKEY_CTX_new_id failed");

    if (EVP_PKEY_keygen_init(pctx.get()) <= 0) {
        throw LibraryError("EVP_PKEY_keygen_init failed");
    }

    EVP_PKEY* raw_pkey = nullptr;
    if (EVP_PKEY_keygen(pctx.get(), &raw_pkey) <= 0) {
        throw LibraryError("EVP_PKEY_keygen failed");
    }
    PkeyPtr pkey(raw_pkey, EVP_PKEY_free);

    KeyPair pair;
    size_t pub_len = pub_size;
    pair.public_key.resize(pub_len);
    if (EVP_PKEY_get_raw_public_key(pkey.get(), pair.public_key.data(), &pub_len) <= 0) {
        throw LibraryError("EVP_PKEY_get_raw_public_key failed");
    }

    size_t priv_len = priv_size;
    pair.secret_key.resize(priv_len);
    if (EVP_PKEY_get_raw_private_key(pkey.get(), pair.secret_key.data(), &priv_len) <= 0) {
        throw LibraryError("EVP_PKEY_get_raw_private_key failed");
    }
    return pair;
}

MechanismDetails MakeDetails(const char* name) {
    MechanismDetails details;
    details.method_name = name;
    details.version = OpenSSL_version(OPENSSL_VERSION);
    details.claimed_nist_level = 0; // not a post-quantum mechanism
    return details;
}

} // namespace

// ---------------------------------------------------------------------------
// X25519
// ---------------------------------------------------------------------------

X25519Kem::X25519Kem() : m_details(MakeDetails(BASELINE_KEM_ALGORITHM)) {
    m_details.length_public_key = X25519_PUBKEY_SIZE;
    m_details.length_secret_key = X25519_PRIVKEY_SIZE;
    m_details.length_ciphertext = X25519_PUBKEY_SIZE;
    m_details.length_shared_secret = X25519_SHARED_SECRET_SIZE;
}

KeyPair X25519Kem::GenerateKeyPair() {
    return GenerateRawKeyPair(EVP_PKEY_X25519, X25519_PUBKEY_SIZE, X25519_PRIVKEY_SIZE);
}

Encapsulation X25519Kem::Encapsulate(const Bytes& public_key) {
    KeyPair ephemeral = GenerateKeyPair();

    Encapsulation result;
    result.shared_secret = ComputeSharedSecret(ephemeral.secret_key, public_key);
    result.ciphertext = ephemeral.public_key;
    return result;
}

Bytes X25519Kem::Decapsulate(const Bytes& secret_key, const Bytes& ciphertext) {
    return ComputeSharedSecret(secret_key, ciphertext);
}

Bytes X25519Kem::ComputeSharedSecret(const Bytes& priv_key, const Bytes& peer_pub_key) {
    if (priv_key.size() != X25519_PRIVKEY_SIZE) {
        throw LibraryError("Invalid X25519 private key size");
    }
    if (peer_pub_key.size() != X25519_PUBKEY_SIZE) {
        throw LibraryError("Invalid X25519 public key size");
    }

    PkeyPtr my_key(EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr,
                                                priv_key.data(), priv_key.size()),
                   EVP_PKEY_free);
    if (!my_key) throw LibraryError("EVP_PKEY_new_raw_private_key failed");

    PkeyPtr peer_key(EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr,
                                                 peer_pub_key.data(), peer_pub_key.size()),
                     EVP_PKEY_free);
    if (!peer_key) throw LibraryError("EVP_PKEY_new_raw_public_key failed");

    PkeyCtxPtr pctx(EVP_PKEY_CTX_new(my_key.get(), nullptr), EVP_PKEY_CTX_free);
    if (!pctx) throw LibraryError("EVP_PKEY_CTX_new failed");

    if (EVP_PKEY_derive_init(pctx.get()) <= 0) {
        throw LibraryError("EVP_PKEY_derive_init failed");
    }
    if (EVP_PKEY_derive_set_peer(pctx.get(), peer_key.get()) <= 0) {
        throw LibraryError("EVP_PKEY_derive_set_peer failed");
    }

    size_t secret_len = 0;
    if (EVP_PKEY_derive(pctx.get(), nullptr, &secret_len) <= 0) {
        throw LibraryError("EVP_PKEY_derive (length) failed");
    }

    Bytes secret(secret_len);
    if (EVP_PKEY_derive(pctx.get(), secret.data(), &secret_len) <= 0) {
        throw LibraryError("EVP_PKEY_derive failed");
    }
    secret.resize(secret_len);
    return secret;
}

// ---------------------------------------------------------------------------
// Ed25519
// ---------------------------------------------------------------------------

Ed25519Signature::Ed25519Signature() : m_details(MakeDetails(BASELINE_SIGNATURE_ALGORITHM)) {
    m_details.strong_security = true;
    m_details.length_public_key = ED25519_PUBKEY_SIZE;
    m_details.length_secret_key = ED25519_PRIVKEY_SIZE;
    m_details.length_signature = ED25519_SIGNATURE_SIZE;
}

KeyPair Ed25519Signature::GenerateKeyPair() {
    return GenerateRawKeyPair(EVP_PKEY_ED25519, ED25519_PUBKEY_SIZE, ED25519_PRIVKEY_SIZE);
}

Bytes Ed25519Signature::Sign(const Bytes& message, const Bytes& secret_key) {
    PkeyPtr pkey(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                              secret_key.data(), secret_key.size()),
                 EVP_PKEY_free);
    if (!pkey) throw LibraryError("Invalid Ed25519 private key");

    MdCtxPtr mdctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!mdctx) throw LibraryError("EVP_MD_CTX_new failed");

    // Ed25519 is one-shot; no digest is configured
    if (EVP_DigestSignInit(mdctx.get(), nullptr, nullptr, nullptr, pkey.get()) <= 0) {
        throw LibraryError("EVP_DigestSignInit failed");
    }

    size_t sig_len = ED25519_SIGNATURE_SIZE;
    Bytes signature(sig_len);
    if (EVP_DigestSign(mdctx.get(), signature.data(), &sig_len,
                       message.data(), message.size()) <= 0) {
        throw LibraryError("EVP_DigestSign failed");
    }
    signature.resize(sig_len);
    return signature;
}

bool Ed25519Signature::Verify(const Bytes& message, const Bytes& signature, const Bytes& public_key) {
    PkeyPtr pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                             public_key.data(), public_key.size()),
                 EVP_PKEY_free);
    if (!pkey) return false;

    MdCtxPtr mdctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!mdctx) throw LibraryError("EVP_MD_CTX_new failed");

    if (EVP_DigestVerifyInit(mdctx.get(), nullptr, nullptr, nullptr, pkey.get()) <= 0) {
        throw LibraryError("EVP_DigestVerifyInit failed");
    }

    return EVP_DigestVerify(mdctx.get(), signature.data(), signature.size(),
                            message.data(), message.size()) == 1;
}

// ---------------------------------------------------------------------------
// Provider
// ---------------------------------------------------------------------------

std::unique_ptr<KemMechanism> OpensslProvider::CreateKem(const std::string& name) {
    if (name != BASELINE_KEM_ALGORITHM) {
        throw MechanismNotSupportedError(name);
    }
    return std::make_unique<X25519Kem>();
}

std::unique_ptr<SignatureMechanism> OpensslProvider::CreateSignature(const std::string& name) {
    if (name != BASELINE_SIGNATURE_ALGORITHM) {
        throw MechanismNotSupportedError(name);
    }
    return std::make_unique<Ed25519Signature>();
}

std::vector<std::string> OpensslProvider::EnabledKems() const {
    return {BASELINE_KEM_ALGORITHM};
}

std::vector<std::string> OpensslProvider::EnabledSignatures() const {
    return {BASELINE_SIGNATURE_ALGORITHM};
}

} // namespace pqc_bench
