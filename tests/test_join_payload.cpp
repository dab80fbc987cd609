#include <gtest/gtest.h>

#include "infrastructure/qr_generator.hpp"
#include "test_support.hpp"

using namespace aprotate::infrastructure;

TEST(JoinPayloadTest, EscapesReservedCharacters)
{
    EXPECT_EQ(escape_join_field("plain"), "plain");
    EXPECT_EQ(escape_join_field("a;b"), R"(a\;b)");
    EXPECT_EQ(escape_join_field(R"(a\b)"), R"(a\\b)");
    EXPECT_EQ(escape_join_field(R"(,":)"), R"(\,\"\:)");
}

TEST(JoinPayloadTest, EncodesWpaRecord)
{
    JoinPayload payload;
    payload.ssid = "ssb-abc123";
    payload.password = "Secret99";

    EXPECT_EQ(encode_join_payload(payload), "WIFI:T:WPA;S:ssb-abc123;P:Secret99;;");
}

TEST(JoinPayloadTest, DecodeRecoversEveryReservedCharacter)
{
    JoinPayload payload;
    payload.ssid = R"(net;work,"x":)";
    payload.password = R"(a\b;c,d"e:f)";

    auto encoded = encode_join_payload(payload);
    EXPECT_EQ(encoded, R"(WIFI:T:WPA;S:net\;work\,\"x\"\:;P:a\\b\;c\,d\"e\:f;;)");

    auto decoded = decode_join_payload(encoded);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->security, "WPA");
    EXPECT_EQ(decoded->ssid, payload.ssid);
    EXPECT_EQ(decoded->password, payload.password);
}

TEST(JoinPayloadTest, DecodeRejectsMalformedInput)
{
    EXPECT_FALSE(decode_join_payload("").has_value());
    EXPECT_FALSE(decode_join_payload("MECARD:N:x;;").has_value());
    EXPECT_FALSE(decode_join_payload("WIFI:T:WPA;S:abc").has_value());
    EXPECT_FALSE(decode_join_payload("WIFI:T:WPA;S:abc;").has_value());
}

TEST(CommandQrGeneratorTest, RunsConverterAndInstallsImage)
{
    aprotate::test::TempDir dir;
    auto runner = std::make_shared<aprotate::test::FakeCommandRunner>();
    runner->results["qrencode"] = aprotate::test::FakeCommandRunner::success();

    CommandQrGenerator generator(runner, "qrencode", dir.path(), "wlan0", std::chrono::seconds(10));

    // The fake converter does not write the staging file, so create it the way qrencode would
    aprotate::test::write_text(dir / "qr-wlan0.png.tmp", "PNG");
    ASSERT_TRUE(generator.generate("wlan0", "ssb-abc", "pa;ss"));

    ASSERT_EQ(runner->calls.size(), 1u);
    const auto &argv = runner->calls.front();
    EXPECT_EQ(argv.front(), "qrencode");
    EXPECT_EQ(argv.back(), R"(WIFI:T:WPA;S:ssb-abc;P:pa\;ss;;)");

    EXPECT_TRUE(std::filesystem::exists(dir / "qr-wlan0.png"));
    EXPECT_TRUE(std::filesystem::exists(dir / "qr.png"));
    EXPECT_FALSE(std::filesystem::exists(dir / "qr-wlan0.png.tmp"));
}

TEST(CommandQrGeneratorTest, ConverterFailureIsReported)
{
    aprotate::test::TempDir dir;
    auto runner = std::make_shared<aprotate::test::FakeCommandRunner>();

    CommandQrGenerator generator(runner, "qrencode", dir.path(), "wlan0", std::chrono::seconds(10));

    EXPECT_FALSE(generator.generate("wlan1", "ssb-abc", "password"));
    EXPECT_FALSE(std::filesystem::exists(dir / "qr-wlan1.png"));
}
