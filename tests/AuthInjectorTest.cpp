#include "AuthInjector.hpp"
#include "RequestErrors.hpp"
#include "RequestPlan.hpp"

#include <gtest/gtest.h>

TEST(AuthInjectorTest, BasicHeader) {
    EXPECT_EQ(AuthInjector::basicHeader("Aladdin", "open sesame"), "Basic QWxhZGRpbjpvcGVuIHNlc2FtZQ==");
    EXPECT_EQ(AuthInjector::basicHeader("user", ""), "Basic dXNlcjo=");
}

TEST(AuthInjectorTest, SplitCredentials) {
    auto parts = AuthInjector::splitCredentials("user:pa:ss");
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->first, "user");
    EXPECT_EQ(parts->second, "pa:ss");

    EXPECT_FALSE(AuthInjector::splitCredentials("nocolon").has_value());
    EXPECT_FALSE(AuthInjector::splitCredentials(":password").has_value());
}

TEST(AuthInjectorTest, ParsesDigestChallenge) {
    auto challenge = AuthInjector::parseChallenge(
        "Digest realm=\"testrealm@host.com\", qop=\"auth,auth-int\", "
        "nonce=\"dcd98b7102dd2f0e8b11d0f600bfb0c093\", opaque=\"5ccc069c403ebaf9f0171e9517f40e41\"");
    ASSERT_TRUE(challenge.has_value());
    EXPECT_EQ(challenge->realm, "testrealm@host.com");
    EXPECT_EQ(challenge->nonce, "dcd98b7102dd2f0e8b11d0f600bfb0c093");
    EXPECT_EQ(challenge->qop, "auth");
    EXPECT_EQ(challenge->opaque, "5ccc069c403ebaf9f0171e9517f40e41");
    EXPECT_EQ(challenge->algorithm, "MD5");
}

TEST(AuthInjectorTest, NonDigestChallengesAreIgnored) {
    EXPECT_FALSE(AuthInjector::parseChallenge("Basic realm=\"x\"").has_value());
}

TEST(AuthInjectorTest, MalformedChallengesAreAuthErrors) {
    EXPECT_THROW(AuthInjector::parseChallenge("Digest realm=\"x\""), AuthError);
    EXPECT_THROW(AuthInjector::parseChallenge("Digest nonce=\"abc\""), AuthError);
    EXPECT_THROW(AuthInjector::parseChallenge("Digest realm=\"x\", nonce=\"n\", qop=\"auth-int\""), AuthError);
}

TEST(AuthInjectorTest, Rfc2617Md5Response) {
    DigestChallenge challenge;
    challenge.realm = "testrealm@host.com";
    challenge.nonce = "dcd98b7102dd2f0e8b11d0f600bfb0c093";
    challenge.qop = "auth";
    challenge.opaque = "5ccc069c403ebaf9f0171e9517f40e41";
    challenge.algorithm = "MD5";

    std::string header = AuthInjector::digestHeader(DigestCredentials{"Mufasa", "Circle Of Life"}, challenge,
                                                    "GET", "/dir/index.html", 1, "0a4f113b");
    EXPECT_NE(header.find("response=\"6629fae49393a05397450978507c4ef1\""), std::string::npos);
    EXPECT_NE(header.find("nc=00000001"), std::string::npos);
    EXPECT_NE(header.find("cnonce=\"0a4f113b\""), std::string::npos);
    EXPECT_NE(header.find("opaque=\"5ccc069c403ebaf9f0171e9517f40e41\""), std::string::npos);
    EXPECT_EQ(header.rfind("Digest username=\"Mufasa\"", 0), 0u);
}

TEST(AuthInjectorTest, Rfc7616Sha256Response) {
    DigestChallenge challenge;
    challenge.realm = "http-auth@example.org";
    challenge.nonce = "7ypf/xlj9XXwfDPEoM4URrv/xwf94BcCAzFZH4GiTo0v";
    challenge.qop = "auth";
    challenge.algorithm = "SHA-256";

    std::string cnonce = "f2/wE4q74E6zIJEtWaHKaf5wv/H5QzzpXusqGemxURZJ";
    DigestCredentials credentials{"Mufasa", "Circle of Life"};

    std::string sha = AuthInjector::digestHeader(credentials, challenge, "GET", "/dir/index.html", 1, cnonce);
    EXPECT_NE(sha.find("response=\"753927fa0e85d155564e2e272a28d1802ca10daf4496794697cf8db5856cb6c1\""),
              std::string::npos);
    EXPECT_NE(sha.find("algorithm=SHA-256"), std::string::npos);

    challenge.algorithm = "MD5";
    std::string md5 = AuthInjector::digestHeader(credentials, challenge, "GET", "/dir/index.html", 1, cnonce);
    EXPECT_NE(md5.find("response=\"8ca523f5e9506fed4657c9700eebdbec\""), std::string::npos);
}

TEST(AuthInjectorTest, UnsupportedAlgorithm) {
    DigestChallenge challenge;
    challenge.realm = "r";
    challenge.nonce = "n";
    challenge.algorithm = "SHA-512-256";
    EXPECT_THROW(AuthInjector::digestHeader(DigestCredentials{"u", "p"}, challenge, "GET", "/", 1, "c"),
                 AuthError);
}

TEST(AuthInjectorTest, CnonceIsRandomHex) {
    std::string a = AuthInjector::makeCnonce();
    std::string b = AuthInjector::makeCnonce();
    EXPECT_EQ(a.size(), 16u);
    EXPECT_NE(a, b);
}

TEST(DigestCacheTest, NonceCountResetsWithNewNonce) {
    DigestCache cache;
    EXPECT_EQ(cache.find("http://h:80"), nullptr);

    DigestChallenge challenge;
    challenge.realm = "r";
    challenge.nonce = "n1";
    auto entry = cache.store("http://h:80", challenge);
    entry->nonce_count = 3;

    auto same = cache.store("http://h:80", challenge);
    EXPECT_EQ(same, entry);
    EXPECT_EQ(same->nonce_count, 3u);

    challenge.nonce = "n2";
    cache.store("http://h:80", challenge);
    EXPECT_EQ(entry->nonce_count, 0u);
    EXPECT_EQ(cache.find("http://h:80")->challenge.nonce, "n2");
}
