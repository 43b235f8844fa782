#include <gtest/gtest.h>
#include <tollgate/crypto/credential.hpp>
#include <tollgate/schema/primitives.hpp>

TEST(credential, sha256_matches_known_vector) {
  auto digest = tollgate::crypto::sha256("abc");
  ASSERT_TRUE(digest.has_value());
  EXPECT_EQ(tollgate::schema::to_hex(*digest),
            "ba7816bf8f01cfea414140de5dae2223"
            "b00361a396177a9cb410ff61f20015ad");
}

TEST(credential, matching_token_is_accepted) {
  EXPECT_TRUE(tollgate::crypto::credential_matches("s3cret", "s3cret"));
}

TEST(credential, different_or_truncated_token_is_refused) {
  EXPECT_FALSE(tollgate::crypto::credential_matches("s3cre", "s3cret"));
  EXPECT_FALSE(tollgate::crypto::credential_matches("S3CRET", "s3cret"));
  EXPECT_FALSE(tollgate::crypto::credential_matches("", "s3cret"));
}

TEST(credential, empty_expected_token_never_matches) {
  EXPECT_FALSE(tollgate::crypto::credential_matches("", ""));
  EXPECT_FALSE(tollgate::crypto::credential_matches("anything", ""));
}
