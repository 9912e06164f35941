#pragma once

#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pqc_bench {

using Bytes = std::vector<uint8_t>;

enum class AlgorithmType {
    KEM,
    Signature
};

// Which provider implements a target
enum class Backend {
    OQS,
    OpenSSL
};

inline const char* ToString(AlgorithmType type) {
    return type == AlgorithmType::KEM ? "KEM" : "Signature";
}

struct BenchmarkTarget {
    std::string name;
    AlgorithmType type;
    Backend backend = Backend::OQS;
};

// Structural description of a mechanism, as reported by its provider.
// Sizes are in bytes and never change for a given mechanism.
struct MechanismDetails {
    std::string method_name;
    std::string version;
    uint8_t claimed_nist_level = 0;
    bool strong_security = false; // IND-CCA for KEMs, EUF-CMA for signatures

    size_t length_public_key = 0;
    size_t length_secret_key = 0;
    size_t length_ciphertext = 0;    // KEM only
    size_t length_shared_secret = 0; // KEM only
    size_t length_signature = 0;     // Signature only
};

struct KeyPair {
    Bytes public_key;
    Bytes secret_key;

    ~KeyPair() {
        std::fill(secret_key.begin(), secret_key.end(), 0);
    }
};

struct Encapsulation {
    Bytes ciphertext;
    Bytes shared_secret;
};

class KemMechanism {
public:
    virtual ~KemMechanism() = default;

    virtual const MechanismDetails& Details() const = 0;

    virtual KeyPair GenerateKeyPair() = 0;
    virtual Encapsulation Encapsulate(const Bytes& public_key) = 0;
    virtual Bytes Decapsulate(const Bytes& secret_key, const Bytes& ciphertext) = 0;
};

class SignatureMechanism {
public:
    virtual ~SignatureMechanism() = default;

    virtual const MechanismDetails& Details() const = 0;

    virtual KeyPair GenerateKeyPair() = 0;
    virtual Bytes Sign(const Bytes& message, const Bytes& secret_key) = 0;
    // False for any signature that does not verify, never throws for a bad signature
    virtual bool Verify(const Bytes& message, const Bytes& signature, const Bytes& public_key) = 0;
};

// Factory for mechanism handles.
// Create* throws MechanismNotEnabledError when the mechanism is known but disabled,
// and MechanismNotSupportedError when the name is unknown.
class MechanismProvider {
public:
    virtual ~MechanismProvider() = default;

    virtual std::unique_ptr<KemMechanism> CreateKem(const std::string& name) = 0;
    virtual std::unique_ptr<SignatureMechanism> CreateSignature(const std::string& name) = 0;

    virtual std::vector<std::string> EnabledKems() const = 0;
    virtual std::vector<std::string> EnabledSignatures() const = 0;
};

} // namespace pqc_bench
