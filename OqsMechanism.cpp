#include "OqsMechanism.hpp"
#include "Errors.hpp"

#include <oqs/oqs.h>

namespace pqc_bench {

OqsRuntime::OqsRuntime() {
    OQS_init();
}

OqsRuntime::~OqsRuntime() {
    OQS_destroy();
}

std::string OqsRuntime::Version() {
    return OQS_version();
}

// ---------------------------------------------------------------------------
// KEM
// ---------------------------------------------------------------------------

OqsKem::OqsKem(const std::string& name) {
    if (!OqsProvider::IsKnownKem(name)) {
        throw MechanismNotSupportedError(name);
    }
    if (!OQS_KEM_alg_is_enabled(name.c_str())) {
        throw MechanismNotEnabledError(name);
    }

    m_kem = OQS_KEM_new(name.c_str());
    if (m_kem == nullptr) {
        throw LibraryError("Failed to create OQS KEM context for " + name);
    }

    m_details.method_name = m_kem->method_name;
    m_details.version = m_kem->alg_version;
    m_details.claimed_nist_level = m_kem->claimed_nist_level;
    m_details.strong_security = m_kem->ind_cca;
    m_details.length_public_key = m_kem->length_public_key;
    m_details.length_secret_key = m_kem->length_secret_key;
    m_details.length_ciphertext = m_kem->length_ciphertext;
    m_details.length_shared_secret = m_kem->length_shared_secret;
}

OqsKem::~OqsKem() {
    OQS_KEM_free(m_kem);
}

KeyPair OqsKem::GenerateKeyPair() {
    KeyPair pair;
    pair.public_key.resize(m_kem->length_public_key);
    pair.secret_key.resize(m_kem->length_secret_key);

    if (OQS_KEM_keypair(m_kem, pair.public_key.data(), pair.secret_key.data()) != OQS_SUCCESS) {
        throw LibraryError("OQS keypair generation failed for " + m_details.method_name);
    }
    return pair;
}

Encapsulation OqsKem::Encapsulate(const Bytes& public_key) {
    if (public_key.size() != m_kem->length_public_key) {
        throw LibraryError("Invalid public key size for " + m_details.method_name);
    }

    Encapsulation result;
    result.ciphertext.resize(m_kem->length_ciphertext);
    result.shared_secret.resize(m_kem->length_shared_secret);

    if (OQS_KEM_encaps(m_kem, result.ciphertext.data(), result.shared_secret.data(),
                       public_key.data()) != OQS_SUCCESS) {
        throw LibraryError("OQS encapsulation failed for " + m_details.method_name);
    }
    return result;
}

Bytes OqsKem::Decapsulate(const Bytes& secret_key, const Bytes& ciphertext) {
    if (secret_key.size() != m_kem->length_secret_key) {
        throw LibraryError("Invalid secret key size for " + m_details.method_name);
    }
    if (ciphertext.size() != m_kem->length_ciphertext) {
        throw LibraryError("Invalid ciphertext size for " + m_details.method_name);
    }

    Bytes shared_secret(m_kem->length_shared_secret);
    if (OQS_KEM_decaps(m_kem, shared_secret.data(), ciphertext.data(),
                       secret_key.data()) != OQS_SUCCESS) {
        throw LibraryError("OQS decapsulation failed for " + m_details.method_name);
    }
    return shared_secret;
}

// ---------------------------------------------------------------------------
// Signature
// ---------------------------------------------------------------------------

OqsSignature::OqsSignature(const std::string& name) {
    if (!OqsProvider::IsKnownSignature(name)) {
        throw MechanismNotSupportedError(name);
    }
    if (!OQS_SIG_alg_is_enabled(name.c_str())) {
        throw MechanismNotEnabledError(name);
    }

    m_sig = OQS_SIG_new(name.c_str());
    if (m_sig == nullptr) {
        throw LibraryError("Failed to create OQS signature context for " + name);
    }

    m_details.method_name = m_sig->method_name;
    m_details.version = m_sig->alg_version;
    m_details.claimed_nist_level = m_sig->claimed_nist_level;
    m_details.strong_security = m_sig->euf_cma;
    m_details.length_public_key = m_sig->length_public_key;
    m_details.length_secret_key = m_sig->length_secret_key;
    m_details.length_signature = m_sig->length_signature;
}

OqsSignature::~OqsSignature() {
    OQS_SIG_free(m_sig);
}

KeyPair OqsSignature::GenerateKeyPair() {
    KeyPair pair;
    pair.public_key.resize(m_sig->length_public_key);
    pair.secret_key.resize(m_sig->length_secret_key);

    if (OQS_SIG_keypair(m_sig, pair.public_key.data(), pair.secret_key.data()) != OQS_SUCCESS) {
        throw LibraryError("OQS keypair generation failed for " + m_details.method_name);
    }
    return pair;
}

Bytes OqsSignature::Sign(const Bytes& message, const Bytes& secret_key) {
    if (secret_key.size() != m_sig->length_secret_key) {
        throw LibraryError("Invalid secret key size for " + m_details.method_name);
    }

    // length_signature is an upper bound; Falcon signatures are variable length
    Bytes signature(m_sig->length_signature);
    size_t signature_len = 0;
    if (OQS_SIG_sign(m_sig, signature.data(), &signature_len, message.data(), message.size(),
                     secret_key.data()) != OQS_SUCCESS) {
        throw LibraryError("OQS signing failed for " + m_details.method_name);
    }
    signature.resize(signature_len);
    return signature;
}

bool OqsSignature::Verify(const Bytes& message, const Bytes& signature, const Bytes& public_key) {
    if (public_key.size() != m_sig->length_public_key) return false;
    if (signature.size() > m_sig->length_signature) return false;

    return OQS_SIG_verify(m_sig, message.data(), message.size(), signature.data(),
                          signature.size(), public_key.data()) == OQS_SUCCESS;
}

// ---------------------------------------------------------------------------
// Provider
// ---------------------------------------------------------------------------

std::unique_ptr<KemMechanism> OqsProvider::CreateKem(const std::string& name) {
    return std::make_unique<OqsKem>(name);
}

std::unique_ptr<SignatureMechanism> OqsProvider::CreateSignature(const std::string& name) {
    return std::make_unique<OqsSignature>(name);
}

std::vector<std::string> OqsProvider::EnabledKems() const {
    std::vector<std::string> names;
    for (int i = 0; i < OQS_KEM_alg_count(); ++i) {
        const char* name = OQS_KEM_alg_identifier(static_cast<size_t>(i));
        if (OQS_KEM_alg_is_enabled(name)) {
            names.emplace_back(name);
        }
    }
    return names;
}

std::vector<std::string> OqsProvider::EnabledSignatures() const {
    std::vector<std::string> names;
    for (int i = 0; i < OQS_SIG_alg_count(); ++i) {
        const char* name = OQS_SIG_alg_identifier(static_cast<size_t>(i));
        if (OQS_SIG_alg_is_enabled(name)) {
            names.emplace_back(name);
        }
    }
    return names;
}

bool OqsProvider::IsKnownKem(const std::string& name) {
    for (int i = 0; i < OQS_KEM_alg_count(); ++i) {
        if (name == OQS_KEM_alg_identifier(static_cast<size_t>(i))) return true;
    }
    return false;
}

bool OqsProvider::IsKnownSignature(const std::string& name) {
    for (int i = 0; i < OQS_SIG_alg_count(); ++i) {
        if (name == OQS_SIG_alg_identifier(static_cast<size_t>(i))) return true;
    }
    return false;
}

} // namespace pqc_bench
