#include <gtest/gtest.h>
#include "../BenchmarkParams.hpp"
#include "../Errors.hpp"
#include "../OpensslMechanism.hpp"

using namespace pqc_bench;

class OpensslMechanismTest : public ::testing::Test {
protected:
    OpensslProvider provider;
    const Bytes message = {'b', 'a', 's', 'e', 'l', 'i', 'n', 'e'};
};

// Test 1: Full X25519 encapsulate / decapsulate
TEST_F(OpensslMechanismTest, X25519SharedSecretsMatch) {
    auto kem = provider.CreateKem("X25519");

    KeyPair keys = kem->GenerateKeyPair();
    ASSERT_EQ(keys.public_key.size(), 32u);
    ASSERT_EQ(keys.secret_key.size(), 32u);

    Encapsulation encap = kem->Encapsulate(keys.public_key);
    ASSERT_EQ(encap.ciphertext.size(), 32u);
    ASSERT_EQ(encap.shared_secret.size(), 32u);

    Bytes decapsulated = kem->Decapsulate(keys.secret_key, encap.ciphertext);
    ASSERT_EQ(decapsulated, encap.shared_secret);
}

// Test 2: Tampered ciphertext yields a different secret (or an explicit failure)
TEST_F(OpensslMechanismTest, X25519TamperedCiphertext) {
    auto kem = provider.CreateKem("X25519");
    KeyPair keys = kem->GenerateKeyPair();
    Encapsulation encap = kem->Encapsulate(keys.public_key);

    encap.ciphertext[0] ^= 0xFF;

    try {
        Bytes decapsulated = kem->Decapsulate(keys.secret_key, encap.ciphertext);
        ASSERT_NE(decapsulated, encap.shared_secret);
    } catch (const LibraryError&) {
        SUCCEED();
    }
}

TEST_F(OpensslMechanismTest, X25519RejectsWrongKeySize) {
    auto kem = provider.CreateKem("X25519");
    EXPECT_THROW(kem->Encapsulate(Bytes(31, 0x01)), LibraryError);
}

TEST_F(OpensslMechanismTest, X25519Details) {
    auto kem = provider.CreateKem("X25519");
    const MechanismDetails& d = kem->Details();
    EXPECT_EQ(d.method_name, "X25519");
    EXPECT_EQ(d.length_public_key, X25519_PUBKEY_SIZE);
    EXPECT_EQ(d.length_secret_key, X25519_PRIVKEY_SIZE);
    EXPECT_EQ(d.length_ciphertext, X25519_PUBKEY_SIZE);
    EXPECT_EQ(d.length_shared_secret, X25519_SHARED_SECRET_SIZE);
    EXPECT_EQ(d.length_signature, 0u);
}

TEST_F(OpensslMechanismTest, Ed25519VerifiesOnlyOriginal) {
    auto sig = provider.CreateSignature("Ed25519");
    KeyPair keys = sig->GenerateKeyPair();
    KeyPair other = sig->GenerateKeyPair();

    Bytes signature = sig->Sign(message, keys.secret_key);
    ASSERT_EQ(signature.size(), ED25519_SIGNATURE_SIZE);
    EXPECT_TRUE(sig->Verify(message, signature, keys.public_key));

    Bytes mutated = message;
    mutated.back() ^= 0x01;
    EXPECT_FALSE(sig->Verify(mutated, signature, keys.public_key));
    EXPECT_FALSE(sig->Verify(message, signature, other.public_key));
    EXPECT_FALSE(sig->Verify(message, signature, Bytes(5, 0x00)));
}

TEST_F(OpensslMechanismTest, UnknownNamesNotSupported) {
    EXPECT_THROW(provider.CreateKem("Kyber768"), MechanismNotSupportedError);
    EXPECT_THROW(provider.CreateSignature("Ed448"), MechanismNotSupportedError);
    EXPECT_EQ(provider.EnabledKems(), (std::vector<std::string>{"X25519"}));
    EXPECT_EQ(provider.EnabledSignatures(), (std::vector<std::string>{"Ed25519"}));
}
