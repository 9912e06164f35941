#pragma once

#include "../Clock.hpp"
#include "../Errors.hpp"
#include "../Mechanism.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace pqc_bench::test_support {

// Only moves when a stub operation advances it
class ManualClock : public Clock {
public:
    Duration Now() override { return m_now; }

    void AdvanceMs(double ms) {
        m_now += std::chrono::duration_cast<Duration>(std::chrono::duration<double, std::milli>(ms));
    }

private:
    Duration m_now{0};
};

// Fixed per-operation durations. Iteration i takes (base + i * step) ms for every step.
struct StubTiming {
    double keygen_ms = 1.0;
    double second_ms = 0.5;
    double third_ms = 0.25;
    double step_ms = 0.0;
};

struct StubConfig {
    MechanismDetails details;
    StubTiming timing;
    int fail_at = -1; // iteration whose check fails, -1 for never
};

inline MechanismDetails StubKemDetails(const std::string& name) {
    MechanismDetails d;
    d.method_name = name;
    d.version = "stub";
    d.claimed_nist_level = 3;
    d.strong_security = true;
    d.length_public_key = 1184;
    d.length_secret_key = 2400;
    d.length_ciphertext = 1088;
    d.length_shared_secret = 32;
    return d;
}

inline MechanismDetails StubSignatureDetails(const std::string& name) {
    MechanismDetails d;
    d.method_name = name;
    d.version = "stub";
    d.claimed_nist_level = 2;
    d.strong_security = true;
    d.length_public_key = 1312;
    d.length_secret_key = 2560;
    d.length_signature = 2420;
    return d;
}

class StubKem : public KemMechanism {
public:
    StubKem(StubConfig config, ManualClock& clock, int& live_handles)
        : m_config(std::move(config)), m_clock(clock), m_live(live_handles) {
        ++m_live;
    }
    ~StubKem() override { --m_live; }

    const MechanismDetails& Details() const override { return m_config.details; }

    KeyPair GenerateKeyPair() override {
        m_clock.AdvanceMs(m_config.timing.keygen_ms + m_iteration * m_config.timing.step_ms);
        KeyPair pair;
        pair.public_key.assign(m_config.details.length_public_key, 0x01);
        pair.secret_key.assign(m_config.details.length_secret_key, 0x02);
        return pair;
    }

    Encapsulation Encapsulate(const Bytes& /*public_key*/) override {
        m_clock.AdvanceMs(m_config.timing.second_ms + m_iteration * m_config.timing.step_ms);
        Encapsulation result;
        result.ciphertext.assign(m_config.details.length_ciphertext, 0x03);
        result.shared_secret.assign(m_config.details.length_shared_secret, 0x04);
        return result;
    }

    Bytes Decapsulate(const Bytes& /*secret_key*/, const Bytes& /*ciphertext*/) override {
        m_clock.AdvanceMs(m_config.timing.third_ms + m_iteration * m_config.timing.step_ms);
        Bytes secret(m_config.details.length_shared_secret, 0x04);
        if (m_iteration == m_config.fail_at) {
            secret[0] ^= 0xFF;
        }
        ++m_iteration;
        return secret;
    }

private:
    StubConfig m_config;
    ManualClock& m_clock;
    int& m_live;
    int m_iteration = 0;
};

class StubSignature : public SignatureMechanism {
public:
    StubSignature(StubConfig config, ManualClock& clock, int& live_handles)
        : m_config(std::move(config)), m_clock(clock), m_live(live_handles) {
        ++m_live;
    }
    ~StubSignature() override { --m_live; }

    const MechanismDetails& Details() const override { return m_config.details; }

    KeyPair GenerateKeyPair() override {
        m_clock.AdvanceMs(m_config.timing.keygen_ms + m_iteration * m_config.timing.step_ms);
        KeyPair pair;
        pair.public_key.assign(m_config.details.length_public_key, 0x05);
        pair.secret_key.assign(m_config.details.length_secret_key, 0x06);
        return pair;
    }

    Bytes Sign(const Bytes& message, const Bytes& /*secret_key*/) override {
        m_clock.AdvanceMs(m_config.timing.second_ms + m_iteration * m_config.timing.step_ms);
        m_last_message = message;
        return Bytes(m_config.details.length_signature, 0x07);
    }

    bool Verify(const Bytes& message, const Bytes& /*signature*/, const Bytes& /*public_key*/) override {
        m_clock.AdvanceMs(m_config.timing.third_ms + m_iteration * m_config.timing.step_ms);
        bool valid = message == m_last_message && m_iteration != m_config.fail_at;
        ++m_iteration;
        return valid;
    }

private:
    StubConfig m_config;
    ManualClock& m_clock;
    int& m_live;
    int m_iteration = 0;
    Bytes m_last_message;
};

// Names registered with Add* are supported; names in `disabled` are known but not enabled.
class StubProvider : public MechanismProvider {
public:
    explicit StubProvider(ManualClock& clock) : m_clock(clock) {}

    void AddKem(const std::string& name, StubTiming timing = {}, int fail_at = -1) {
        m_kems[name] = StubConfig{StubKemDetails(name), timing, fail_at};
    }

    void AddSignature(const std::string& name, StubTiming timing = {}, int fail_at = -1) {
        m_sigs[name] = StubConfig{StubSignatureDetails(name), timing, fail_at};
    }

    void Disable(const std::string& name) { m_disabled.insert(name); }

    std::unique_ptr<KemMechanism> CreateKem(const std::string& name) override {
        if (m_disabled.count(name)) throw MechanismNotEnabledError(name);
        auto it = m_kems.find(name);
        if (it == m_kems.end()) throw MechanismNotSupportedError(name);
        return std::make_unique<StubKem>(it->second, m_clock, m_live_handles);
    }

    std::unique_ptr<SignatureMechanism> CreateSignature(const std::string& name) override {
        if (m_disabled.count(name)) throw MechanismNotEnabledError(name);
        auto it = m_sigs.find(name);
        if (it == m_sigs.end()) throw MechanismNotSupportedError(name);
        return std::make_unique<StubSignature>(it->second, m_clock, m_live_handles);
    }

    std::vector<std::string> EnabledKems() const override {
        std::vector<std::string> names;
        for (const auto& [name, config] : m_kems) {
            if (!m_disabled.count(name)) names.push_back(name);
        }
        return names;
    }

    std::vector<std::string> EnabledSignatures() const override {
        std::vector<std::string> names;
        for (const auto& [name, config] : m_sigs) {
            if (!m_disabled.count(name)) names.push_back(name);
        }
        return names;
    }

    int LiveHandles() const { return m_live_handles; }

private:
    ManualClock& m_clock;
    std::map<std::string, StubConfig> m_kems;
    std::map<std::string, StubConfig> m_sigs;
    std::set<std::string> m_disabled;
    int m_live_handles = 0;
};

} // namespace pqc_bench::test_support
