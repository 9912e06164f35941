#pragma once

#include "Mechanism.hpp"

#include <memory>
#include <string>
#include <vector>

// Keep liboqs headers out of the interface
struct OQS_KEM;
struct OQS_SIG;

namespace pqc_bench {

// Pairs OQS_init with OQS_destroy for the lifetime of the process.
class OqsRuntime {
public:
    OqsRuntime();
    ~OqsRuntime();

    OqsRuntime(const OqsRuntime&) = delete;
    OqsRuntime& operator=(const OqsRuntime&) = delete;

    static std::string Version();
};

class OqsKem final : public KemMechanism {
public:
    explicit OqsKem(const std::string& name);
    ~OqsKem() override;

    OqsKem(const OqsKem&) = delete;
    OqsKem& operator=(const OqsKem&) = delete;

    const MechanismDetails& Details() const override { return m_details; }

    KeyPair GenerateKeyPair() override;
    Encapsulation Encapsulate(const Bytes& public_key) override;
    Bytes Decapsulate(const Bytes& secret_key, const Bytes& ciphertext) override;

private:
    OQS_KEM* m_kem = nullptr;
    MechanismDetails m_details;
};

class OqsSignature final : public SignatureMechanism {
public:
    explicit OqsSignature(const std::string& name);
    ~OqsSignature() override;

    OqsSignature(const OqsSignature&) = delete;
    OqsSignature& operator=(const OqsSignature&) = delete;

    const MechanismDetails& Details() const override { return m_details; }

    KeyPair GenerateKeyPair() override;
    Bytes Sign(const Bytes& message, const Bytes& secret_key) override;
    bool Verify(const Bytes& message, const Bytes& signature, const Bytes& public_key) override;

private:
    OQS_SIG* m_sig = nullptr;
    MechanismDetails m_details;
};

class OqsProvider final : public MechanismProvider {
public:
    std::unique_ptr<KemMechanism> CreateKem(const std::string& name) override;
    std::unique_ptr<SignatureMechanism> CreateSignature(const std::string& name) override;

    std::vector<std::string> EnabledKems() const override;
    std::vector<std::string> EnabledSignatures() const override;

    // Known to liboqs, whether or not enabled in this build
    static bool IsKnownKem(const std::string& name);
    static bool IsKnownSignature(const std::string& name);
};

} // namespace pqc_bench
