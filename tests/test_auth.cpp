#include <gtest/gtest.h>

#include <cstring>

#include <SecmonAuth.h>

using namespace secmon;

static Secret secret(const char *s) { return Secret(s, s + strlen(s)); }

TEST(Token, DecodesKnownToken) {
  Secret out;
  ASSERT_TRUE(decodeToken("magld_c2VjcmV0LWtleS0wMDAxCsLwBQ", out));
  EXPECT_EQ(out, secret("secret-key-0001"));
}

TEST(Token, EncodeMatchesIssuedFormat) {
  EXPECT_EQ(encodeToken(secret("secret-key-0001")), "magld_c2VjcmV0LWtleS0wMDAxCsLwBQ");
  const uint8_t raw[] = {0x00, 0xff, 0x10};
  EXPECT_EQ(encodeToken(Secret(raw, raw + 3)), "magld_AP8QBDTScQ");
}

TEST(Token, TrailingWhitespaceAndPrefixCaseAreAccepted) {
  Secret out;
  ASSERT_TRUE(decodeToken("MAGLD_c2VjcmV0LWtleS0wMDAxCsLwBQ \n", out));
  EXPECT_EQ(out, secret("secret-key-0001"));
}

TEST(Token, RejectsMalformedTokens) {
  Secret out;
  EXPECT_FALSE(decodeToken("", out));
  EXPECT_FALSE(decodeToken("magld_AAAAAA", out));                       // too short
  EXPECT_FALSE(decodeToken("mogld_c2VjcmV0LWtleS0wMDAxCsLwBQ", out));   // prefix
  EXPECT_FALSE(decodeToken("magld_c2VjcmV0LWtleS0wMDAxCsLwBR", out));   // checksum
  EXPECT_FALSE(decodeToken("magld_c2VjcmV0LWtleS0wMDAyCsLwBQ", out));   // body changed
  EXPECT_FALSE(decodeToken("magld_c2Vj!mV0LWtleS0wMDAxCsLwBQ", out));   // not base64
  EXPECT_FALSE(decodeToken(" magld_c2VjcmV0LWtleS0wMDAxCsLwBQ", out));  // leading space
}

TEST(Token, RoundTripsArbitraryBytes) {
  for (size_t len = 1; len <= 48; len++) {
    Secret s;
    for (size_t i = 0; i < len; i++) s.push_back(uint8_t((i * 37 + len * 11) & 0xff));
    Secret out;
    ASSERT_TRUE(decodeToken(encodeToken(s), out)) << "length " << len;
    EXPECT_EQ(out, s) << "length " << len;
  }
}

TEST(Token, DecodeTokensDropsBadOnes) {
  std::vector<std::string> tokens;
  tokens.push_back("magld_c2VjcmV0LWtleS0wMDAxCsLwBQ");
  tokens.push_back("garbage");
  tokens.push_back("magld_AP8QBDTScQ");
  SecretSet set = decodeTokens(tokens);
  ASSERT_EQ(set.size(), 2u);
  EXPECT_EQ(set[0], secret("secret-key-0001"));
  EXPECT_EQ(set[1].size(), 3u);
}

TEST(Signature, KnownHmac) {
  EXPECT_EQ(sign("{\"time\": 1700000000, \"force\": true}", secret("secret-key-0001")),
            "Ic0ln9MmBXzUfAyAXZAdPAWr/250x3zIuR7B77frLrU");
}

TEST(Signature, AnySecretInTheSetVerifies) {
  const Secret s1 = secret("one");
  const Secret s2 = secret("two");
  const Secret s3 = secret("three");
  const std::string m = "{\"time\": 5}";
  const std::string sig = sign(m, s2);

  SecretSet a;
  a.push_back(s1);
  a.push_back(s2);
  a.push_back(s3);
  SecretSet b;
  b.push_back(s2);
  b.push_back(s3);
  b.push_back(s1);
  SecretSet c;
  c.push_back(s3);
  c.push_back(s1);
  c.push_back(s2);
  EXPECT_TRUE(verify(m, sig, a));
  EXPECT_TRUE(verify(m, sig, b));
  EXPECT_TRUE(verify(m, sig, c));
}

TEST(Signature, MutatedMessageFails) {
  const Secret s = secret("one");
  const std::string m = "{\"time\": 1700000000, \"force\": true}";
  const std::string sig = sign(m, s);
  SecretSet set(1, s);
  ASSERT_TRUE(verify(m, sig, set));

  for (size_t i = 0; i < m.size(); i++) {
    std::string mutated = m;
    mutated[i] = char(mutated[i] ^ 0x01);
    EXPECT_FALSE(verify(mutated, sig, set)) << "byte " << i;
  }
  EXPECT_FALSE(verify(m, sig, SecretSet()));
  EXPECT_FALSE(verify(m, sig + "A", set));
}
