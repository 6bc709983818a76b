#include <gtest/gtest.h>

#include "adapters/secondary/HmacSha256SignatureCodec.hpp"

#include <algorithm>
#include <cctype>

using namespace jobhook;
using namespace jobhook::adapters::secondary;

class HmacSha256SignatureCodecTest : public ::testing::Test {
protected:
    HmacSha256SignatureCodec codec_;
    const std::string secret_ = "s";
    const std::string body_ = R"({"job_id":"j1","url":"https://x"})";
};

// RFC 4231, test case 2
TEST_F(HmacSha256SignatureCodecTest, Sign_KnownVector) {
    EXPECT_EQ(codec_.sign("Jefe", "what do ya want for nothing?"),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST_F(HmacSha256SignatureCodecTest, Sign_LowercaseHex64) {
    auto digest = codec_.sign(secret_, body_);

    ASSERT_EQ(digest.size(), 64u);
    EXPECT_TRUE(std::all_of(digest.begin(), digest.end(), [](unsigned char c) {
        return std::isdigit(c) || (c >= 'a' && c <= 'f');
    }));
}

TEST_F(HmacSha256SignatureCodecTest, Sign_EmptyPayload_Works) {
    EXPECT_EQ(codec_.sign(secret_, "").size(), 64u);
}

TEST_F(HmacSha256SignatureCodecTest, HeaderValue_HasPrefix) {
    auto header = codec_.headerValue(secret_, body_);

    EXPECT_EQ(header, "sha256=" + codec_.sign(secret_, body_));
}

TEST_F(HmacSha256SignatureCodecTest, Verify_OwnSignature_Accepted) {
    EXPECT_TRUE(codec_.verify(secret_, body_, codec_.headerValue(secret_, body_)));
}

TEST_F(HmacSha256SignatureCodecTest, Verify_UppercaseHex_Accepted) {
    auto digest = codec_.sign(secret_, body_);
    std::transform(digest.begin(), digest.end(), digest.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    EXPECT_TRUE(codec_.verify(secret_, body_, "sha256=" + digest));
}

TEST_F(HmacSha256SignatureCodecTest, Verify_ModifiedPayload_Rejected) {
    auto header = codec_.headerValue(secret_, body_);
    std::string tampered = body_;
    tampered[tampered.size() - 2] = 'y';

    EXPECT_FALSE(codec_.verify(secret_, tampered, header));
}

TEST_F(HmacSha256SignatureCodecTest, Verify_WrongSecret_Rejected) {
    auto header = codec_.headerValue("other", body_);

    EXPECT_FALSE(codec_.verify(secret_, body_, header));
}

TEST_F(HmacSha256SignatureCodecTest, Verify_MissingPrefix_Rejected) {
    EXPECT_FALSE(codec_.verify(secret_, body_, codec_.sign(secret_, body_)));
}

TEST_F(HmacSha256SignatureCodecTest, Verify_MalformedHeaders_RejectedWithoutThrow) {
    auto digest = codec_.sign(secret_, body_);

    EXPECT_FALSE(codec_.verify(secret_, body_, ""));
    EXPECT_FALSE(codec_.verify(secret_, body_, "sha256="));
    EXPECT_FALSE(codec_.verify(secret_, body_, "sha1=" + digest));
    EXPECT_FALSE(codec_.verify(secret_, body_, "sha256=" + digest.substr(0, 63)));
    EXPECT_FALSE(codec_.verify(secret_, body_, "sha256=" + digest + "0"));
    EXPECT_FALSE(codec_.verify(secret_, body_, "sha256=" + std::string(64, 'z')));
    EXPECT_FALSE(codec_.verify(secret_, body_, "SHA256=" + digest));
}

// Замена любого одного hex-символа подписи должна ломать проверку
TEST_F(HmacSha256SignatureCodecTest, Verify_AnySingleDigestCharChanged_Rejected) {
    const std::string digest = codec_.sign(secret_, body_);
    ASSERT_EQ(digest.size(), 64u);
    ASSERT_TRUE(codec_.verify(secret_, body_, "sha256=" + digest));

    for (std::size_t i = 0; i < digest.size(); ++i) {
        std::string altered = digest;
        altered[i] = altered[i] == '0' ? '1' : '0';

        EXPECT_FALSE(codec_.verify(secret_, body_, "sha256=" + altered))
            << "digest accepted with position " << i << " changed";
    }
}
