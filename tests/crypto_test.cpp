/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file crypto_test.cpp
 * @brief Unit tests for the entropy source, hash engine and base-36 codec.
 */

#include "kestrel/crypto/base36.hpp"
#include "kestrel/crypto/digest.hpp"
#include "kestrel/crypto/entropy.hpp"
#include "kestrel/errors.hpp"
#include "framework.hpp"
#include "provider_context.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

using kestrel::crypto::Base36;
using kestrel::crypto::Digest;
using kestrel::crypto::HashAlgorithm;
using kestrel::crypto::SecureRandom;

void test_base36_encode_u64()
{
    ASSERT_EQ(Base36::encode(uint64_t{0}), std::string("0"));
    ASSERT_EQ(Base36::encode(uint64_t{35}), std::string("z"));
    ASSERT_EQ(Base36::encode(uint64_t{36}), std::string("10"));
    ASSERT_EQ(Base36::encode(uint64_t{1295}), std::string("zz"));
}

/**
 * @brief Byte-string encoding is big-endian and zero-padded to a fixed width.
 */
void test_base36_encode_bytes()
{
    ASSERT_EQ(Base36::encode(std::vector<uint8_t>{0x01, 0x00}), std::string("0074"));
    ASSERT_EQ(Base36::encode(std::vector<uint8_t>{0x00, 0x00}), std::string("0000"));
    ASSERT_EQ(Base36::encode(std::vector<uint8_t>{0xFF}), std::string("73"));
    ASSERT_EQ(Base36::encode(std::vector<uint8_t>{}), std::string(""));
}

/**
 * @brief A 32-byte digest always encodes to 50 digits, leaving 48 after the
 * two skewed leading digits are dropped (more than a 32-character token needs).
 */
void test_base36_width()
{
    ASSERT_EQ(Base36::width_for(1), static_cast<size_t>(2));
    ASSERT_EQ(Base36::width_for(2), static_cast<size_t>(4));
    ASSERT_EQ(Base36::width_for(8), static_cast<size_t>(13));
    ASSERT_EQ(Base36::width_for(32), static_cast<size_t>(50));

    std::vector<uint8_t> max(32, 0xFF);
    std::string encoded = Base36::encode(max);
    ASSERT_EQ(encoded.size(), static_cast<size_t>(50));
    ASSERT_TRUE(Base36::is_digits(encoded));
}

void test_base36_is_digits()
{
    ASSERT_TRUE(Base36::is_digits("0123456789abcdefghijklmnopqrstuvwxyz"));
    ASSERT_FALSE(Base36::is_digits("ABC"));
    ASSERT_FALSE(Base36::is_digits("a-b"));
}

/**
 * @brief Algorithm names are matched case-insensitively.
 */
void test_parse_algorithm()
{
    ASSERT_TRUE(kestrel::crypto::parse_algorithm("sha3-256") == HashAlgorithm::SHA3_256);
    ASSERT_TRUE(kestrel::crypto::parse_algorithm("SHA3-256") == HashAlgorithm::SHA3_256);
    ASSERT_TRUE(kestrel::crypto::parse_algorithm("Sha3_256") == HashAlgorithm::SHA3_256);
    ASSERT_TRUE(kestrel::crypto::parse_algorithm("SHA-256") == HashAlgorithm::SHA256);
    ASSERT_TRUE(kestrel::crypto::parse_algorithm("sha256") == HashAlgorithm::SHA256);

    ASSERT_THROWS(kestrel::crypto::parse_algorithm("md5"), kestrel::UnsupportedAlgorithm);
    ASSERT_THROWS(kestrel::crypto::parse_algorithm("sha3-512"), kestrel::UnsupportedAlgorithm);
    ASSERT_THROWS(kestrel::crypto::parse_algorithm(""), kestrel::UnsupportedAlgorithm);
}

void test_algorithm_names()
{
    ASSERT_EQ(std::string(kestrel::crypto::to_string(HashAlgorithm::SHA3_256)),
              std::string("sha3-256"));
    ASSERT_EQ(std::string(kestrel::crypto::to_string(HashAlgorithm::SHA256)),
              std::string("sha256"));
    ASSERT_TRUE(kestrel::crypto::alternate(HashAlgorithm::SHA3_256) == HashAlgorithm::SHA256);
    ASSERT_TRUE(kestrel::crypto::alternate(HashAlgorithm::SHA256) == HashAlgorithm::SHA3_256);
}

/**
 * @brief Known-answer vectors for the "abc" message (FIPS 180-4 / FIPS 202).
 */
void test_digest_known_answers()
{
    Digest sha256(HashAlgorithm::SHA256);
    std::vector<uint8_t> a = sha256.compute("abc");
    ASSERT_EQ(a.size(), static_cast<size_t>(32));
    ASSERT_EQ(sha256.size(), static_cast<size_t>(32));
    ASSERT_EQ(static_cast<int>(a[0]), 0xba);
    ASSERT_EQ(static_cast<int>(a[1]), 0x78);
    ASSERT_EQ(static_cast<int>(a[31]), 0xad);

    Digest sha3(HashAlgorithm::SHA3_256);
    std::vector<uint8_t> b = sha3.compute("abc");
    ASSERT_EQ(b.size(), static_cast<size_t>(32));
    ASSERT_EQ(static_cast<int>(b[0]), 0x3a);
    ASSERT_EQ(static_cast<int>(b[1]), 0x98);
    ASSERT_EQ(static_cast<int>(b[31]), 0x32);
}

/**
 * @brief A context whose providers implement no digests yields neither algorithm.
 */
void test_digest_unavailable_in_context()
{
    kestrel::test::ProviderContext base_only("base");
    ASSERT_THROWS(Digest(HashAlgorithm::SHA3_256, base_only.get()), kestrel::AlgorithmUnavailable);
    ASSERT_THROWS(Digest(HashAlgorithm::SHA256, base_only.get()), kestrel::AlgorithmUnavailable);

    kestrel::test::ProviderContext with_default("default");
    Digest sha3(HashAlgorithm::SHA3_256, with_default.get());
    ASSERT_EQ(sha3.compute("abc").size(), static_cast<size_t>(32));
}

void test_secure_bytes()
{
    ASSERT_EQ(SecureRandom::bytes(64).size(), static_cast<size_t>(64));
    ASSERT_TRUE(SecureRandom::bytes(0).empty());
    ASSERT_TRUE(SecureRandom::bytes(32) != SecureRandom::bytes(32));
}

/**
 * @brief Bounded draws stay inside the inclusive range and reach both ends.
 */
void test_secure_range()
{
    bool saw_min = false;
    bool saw_max = false;
    for (int i = 0; i < 2000; ++i) {
        uint64_t v = SecureRandom::range(3, 7);
        ASSERT_TRUE(v >= 3 && v <= 7);
        saw_min = saw_min || v == 3;
        saw_max = saw_max || v == 7;
    }
    ASSERT_TRUE(saw_min);
    ASSERT_TRUE(saw_max);

    ASSERT_EQ(SecureRandom::range(5, 5), uint64_t{5});
    ASSERT_THROWS(SecureRandom::range(9, 1), std::invalid_argument);

    // Full 64-bit span takes the unreduced path.
    (void)SecureRandom::range(0, UINT64_MAX);
}

void test_secure_letter()
{
    for (int i = 0; i < 500; ++i) {
        char c = SecureRandom::letter();
        ASSERT_TRUE(c >= 'a' && c <= 'z');
    }
}
