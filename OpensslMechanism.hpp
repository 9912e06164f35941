#pragma once

#include "Mechanism.hpp"

#include <memory>
#include <string>
#include <vector>

namespace pqc_bench {

// Classical baselines through OpenSSL, benchmarked alongside the PQC targets.

// X25519 exposed as a KEM:
// - Encapsulate generates an ephemeral keypair and derives with the recipient public key;
//   the ciphertext is the ephemeral public key.
// - Decapsulate derives with the recipient secret key and the ciphertext.
class X25519Kem final : public KemMechanism {
public:
    X25519Kem();

    X25519Kem(const X25519Kem&) = delete;
    X25519Kem& operator=(const X25519Kem&) = delete;

    const MechanismDetails& Details() const override { return m_details; }

    KeyPair GenerateKeyPair() override;
    Encapsulation Encapsulate(const Bytes& public_key) override;
    Bytes Decapsulate(const Bytes& secret_key, const Bytes& ciphertext) override;

private:
    MechanismDetails m_details;

    // Raw X25519 ECDH
    Bytes ComputeSharedSecret(const Bytes& priv_key, const Bytes& peer_pub_key);
};

class Ed25519Signature final : public SignatureMechanism {
public:
    Ed25519Signature();

    Ed25519Signature(const Ed25519Signature&) = delete;
    Ed25519Signature& operator=(const Ed25519Signature&) = delete;

    const MechanismDetails& Details() const override { return m_details; }

    KeyPair GenerateKeyPair() override;
    Bytes Sign(const Bytes& message, const Bytes& secret_key) override;
    bool Verify(const Bytes& message, const Bytes& signature, const Bytes& public_key) override;

private:
    MechanismDetails m_details;
};

class OpensslProvider final : public MechanismProvider {
public:
    std::unique_ptr<KemMechanism> CreateKem(const std::string& name) override;
    std::unique_ptr<SignatureMechanism> CreateSignature(const std::string& name) override;

    std::vector<std::string> EnabledKems() const override;
    std::vector<std::string> EnabledSignatures() const override;
};

} // namespace pqc_bench
