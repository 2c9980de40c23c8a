#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include "gcrelay/util/base-nix-32.hh"
#include "gcrelay/util/hash.hh"

#include "gcrelay/util/tests/hash.hh"

namespace gcrelay {

/* ----------------------------------------------------------------------------
 * hashString
 * --------------------------------------------------------------------------*/

TEST(hashString, testKnownSHA1Hashes1)
{
    // values taken from: https://tools.ietf.org/html/rfc3174
    auto s = "abc";
    auto hash = hashString(HashAlgorithm::SHA1, s);
    ASSERT_EQ(hash.to_string(HashFormat::Base16, true), "sha1:a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST(hashString, testKnownSHA1Hashes2)
{
    // values taken from: https://tools.ietf.org/html/rfc3174
    auto s = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";
    auto hash = hashString(HashAlgorithm::SHA1, s);
    ASSERT_EQ(hash.to_string(HashFormat::Base16, true), "sha1:84983e441c3bd26ebaae4aa1f95129e5e54670f1");
}

TEST(hashString, testKnownSHA256Hashes1)
{
    // values taken from: https://tools.ietf.org/html/rfc4634
    auto s = "abc";

    auto hash = hashString(HashAlgorithm::SHA256, s);
    ASSERT_EQ(
        hash.to_string(HashFormat::Base16, true),
        "sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(hashString, testKnownSHA256Hashes2)
{
    // values taken from: https://tools.ietf.org/html/rfc4634
    auto s = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";
    auto hash = hashString(HashAlgorithm::SHA256, s);
    ASSERT_EQ(
        hash.to_string(HashFormat::Base16, true),
        "sha256:248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

/* ----------------------------------------------------------------------------
 * Nix32
 * --------------------------------------------------------------------------*/

TEST(hashString, testKnownSHA1Nix32)
{
    auto hash = hashString(HashAlgorithm::SHA1, "abc");
    ASSERT_EQ(hash.to_string(HashFormat::Nix32, true), "sha1:kpcd173cq987hw957sx6m0868wv3x6d9");
}

TEST(hashString, testKnownSHA256Nix32)
{
    auto hash = hashString(HashAlgorithm::SHA256, "abc");
    ASSERT_EQ(hash.to_string(HashFormat::Nix32, false), "1b8m03r63zqhnjf7l5wnldhh7c134ap5vpj0850ymkq1iyzicy5s");
}

TEST(BaseNix32, encodedLengthOfSHA1IsStorePathHashLength)
{
    ASSERT_EQ(BaseNix32::encodedLength(regularHashSize(HashAlgorithm::SHA1)), 32u);
}

#ifndef COVERAGE

RC_GTEST_PROP(BaseNix32, prop_encoding_alphabet, (const Hash & hash))
{
    auto s = hash.to_string(HashFormat::Nix32, false);
    RC_ASSERT(s.size() == BaseNix32::encodedLength(hash.hashSize));
    for (auto c : s)
        RC_ASSERT(BaseNix32::lookupReverse(c).has_value());
}

#endif

} // namespace gcrelay
