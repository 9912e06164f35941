#include <gtest/gtest.h>
#include "../Aggregator.hpp"
#include "test_helpers.hpp"

#include <stdexcept>

using namespace pqc_bench;
using namespace pqc_bench::test_support;

TEST(MeanTest, SingleSampleIsItself) {
    EXPECT_EQ(Mean({0.375}), 0.375);
}

TEST(MeanTest, ArithmeticMean) {
    EXPECT_DOUBLE_EQ(Mean({1.0, 2.0, 3.0, 6.0}), 3.0);
    EXPECT_DOUBLE_EQ(Mean({0.1, 0.2, 0.3}), 0.2);
}

TEST(MeanTest, EmptyIsPreconditionViolation) {
    EXPECT_THROW(Mean({}), std::invalid_argument);
}

TEST(AggregateTest, KemRecordCarriesCiphertextOnly) {
    BenchmarkTarget target{"Kyber768", AlgorithmType::KEM, Backend::OQS};
    TimingSamples samples{{1.0, 3.0}, {0.5, 0.5}, {0.25, 0.75}};

    BenchmarkResult r = Aggregate(target, StubKemDetails("Kyber768"), samples);

    EXPECT_EQ(r.algorithm, "Kyber768");
    EXPECT_EQ(r.type, AlgorithmType::KEM);
    EXPECT_EQ(r.public_key_bytes, 1184u);
    EXPECT_EQ(r.secret_key_bytes, 2400u);
    ASSERT_TRUE(r.ciphertext_bytes.has_value());
    EXPECT_EQ(*r.ciphertext_bytes, 1088u);
    EXPECT_FALSE(r.signature_bytes.has_value());
    EXPECT_EQ(r.keygen_ms, 2.0);
    EXPECT_EQ(r.encaps_sign_ms, 0.5);
    EXPECT_EQ(r.decaps_verify_ms, 0.5);
}

TEST(AggregateTest, SignatureRecordCarriesSignatureOnly) {
    BenchmarkTarget target{"Dilithium3", AlgorithmType::Signature, Backend::OQS};
    TimingSamples samples{{2.0}, {4.0}, {1.0}};

    BenchmarkResult r = Aggregate(target, StubSignatureDetails("Dilithium3"), samples);

    EXPECT_EQ(r.type, AlgorithmType::Signature);
    EXPECT_FALSE(r.ciphertext_bytes.has_value());
    ASSERT_TRUE(r.signature_bytes.has_value());
    EXPECT_EQ(*r.signature_bytes, 2420u);
    EXPECT_EQ(r.keygen_ms, 2.0);
    EXPECT_EQ(r.encaps_sign_ms, 4.0);
    EXPECT_EQ(r.decaps_verify_ms, 1.0);
}

TEST(AggregateTest, EmptySequenceRejected) {
    BenchmarkTarget target{"Kyber768", AlgorithmType::KEM, Backend::OQS};
    TimingSamples samples{{1.0}, {}, {1.0}};

    EXPECT_THROW(Aggregate(target, StubKemDetails("Kyber768"), samples), std::invalid_argument);
}
