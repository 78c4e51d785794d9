#include "test_support.h"

#include <cctype>
#include <core/security/known_peers.h>
#include <core/util/error.h>
#include <gtest/gtest.h>
#include <sstream>

using namespace peerpin::core;

namespace {

const std::string kFpA = "AA:BB:CC:DD:EE:FF:00:11:22:33:44:55:66:77:88:99:"
                         "AA:BB:CC:DD:EE:FF:00:11:22:33:44:55:66:77:88:99";
const std::string kFpB = "01:23:45:67:89:AB:CD:EF:01:23:45:67:89:AB:CD:EF:"
                         "01:23:45:67:89:AB:CD:EF:01:23:45:67:89:AB:CD:EF";

KnownPeers parse(const std::string& text) {
    std::istringstream input(text);
    return KnownPeers::Parse(input, "test");
}

} // namespace

TEST(KnownPeersTest, ParsesNameAndFingerprint) {
    auto peers = parse("my_secure_client " + kFpA + "\n");

    ASSERT_EQ(peers.size(), 1u);
    EXPECT_TRUE(peers.Contains("my_secure_client"));
    EXPECT_EQ(peers.FindFingerprint("my_secure_client"), kFpA);
    EXPECT_TRUE(peers.malformed_lines().empty());
    EXPECT_EQ(peers.source(), "test");
}

TEST(KnownPeersTest, MalformedLineIsSkippedNotFatal) {
    auto peers = parse("client_a " + kFpA + "\nthis line is broken\n");

    ASSERT_EQ(peers.size(), 1u);
    EXPECT_TRUE(peers.Contains("client_a"));
    ASSERT_EQ(peers.malformed_lines().size(), 1u);
    EXPECT_EQ(peers.malformed_lines()[0].line_number, 2u);
    EXPECT_NE(peers.malformed_lines()[0].reason.find("4 field(s)"), std::string::npos);
}

TEST(KnownPeersTest, SkippedLineIsLoggedWithItsNumber) {
    peerpin::test::CapturedLog log;

    auto peers = parse("client_a " + kFpA + "\nthis line is broken\n");

    EXPECT_EQ(peers.size(), 1u);
    EXPECT_TRUE(log.Contains("warning Skipping invalid line 2 in test: "
                             "expected '<identity-name> <fingerprint>', found 4 field(s)"))
        << log.str();
    EXPECT_FALSE(log.Contains("line 1 ")) << log.str();
}

TEST(KnownPeersTest, EmptyRegistryIsLogged) {
    peerpin::test::CapturedLog log;

    parse("# nobody yet\n");

    EXPECT_TRUE(log.Contains("warning No valid peer entries found in test")) << log.str();
}

TEST(KnownPeersTest, SingleFieldAndExtraFieldsAreMalformed) {
    auto peers = parse("lonely\nname " + kFpA + " trailing\nok " + kFpB + "\n");

    ASSERT_EQ(peers.size(), 1u);
    EXPECT_TRUE(peers.Contains("ok"));
    ASSERT_EQ(peers.malformed_lines().size(), 2u);
    EXPECT_EQ(peers.malformed_lines()[0].line_number, 1u);
    EXPECT_EQ(peers.malformed_lines()[1].line_number, 2u);
}

TEST(KnownPeersTest, CommentsAndBlankLinesIgnored) {
    auto peers = parse("# provisioned clients\n"
                       "\n"
                       "   \n"
                       "  # indented comment\n"
                       "client_a " + kFpA + "\n");

    EXPECT_EQ(peers.size(), 1u);
    EXPECT_TRUE(peers.malformed_lines().empty());
}

TEST(KnownPeersTest, LastEntryWins) {
    auto peers = parse("client_a " + kFpA + "\nclient_a " + kFpB + "\n");

    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers.FindFingerprint("client_a"), kFpB);
}

TEST(KnownPeersTest, AnyWhitespaceSeparatesFields) {
    auto peers = parse("client_a\t\t" + kFpA + "\r\n  client_b   " + kFpB + "  \n");

    EXPECT_EQ(peers.FindFingerprint("client_a"), kFpA);
    EXPECT_EQ(peers.FindFingerprint("client_b"), kFpB);
}

TEST(KnownPeersTest, FingerprintIsUppercased) {
    std::string lower = kFpA;
    for (auto& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    auto peers = parse("client_a " + lower + "\n");

    EXPECT_EQ(peers.FindFingerprint("client_a"), kFpA);
}

TEST(KnownPeersTest, NamesAreCaseSensitive) {
    auto peers = parse("Client_A " + kFpA + "\n");

    EXPECT_TRUE(peers.Contains("Client_A"));
    EXPECT_FALSE(peers.Contains("client_a"));
    EXPECT_FALSE(peers.FindFingerprint("client_a").has_value());
}

TEST(KnownPeersTest, OddFingerprintKeptOpaque) {
    auto peers = parse("client_a not-a-fingerprint\n");

    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers.FindFingerprint("client_a"), "NOT-A-FINGERPRINT");
    EXPECT_TRUE(peers.malformed_lines().empty());
}

TEST(KnownPeersTest, EmptySourceGivesEmptyRegistry) {
    auto peers = parse("");
    EXPECT_TRUE(peers.empty());

    auto only_comments = parse("# nobody yet\n\n");
    EXPECT_TRUE(only_comments.empty());
}

TEST(KnownPeersTest, LoadFromFile) {
    peerpin::test::TempDir dir;
    auto file = dir.Write("knownClients.txt", "# clients\nmy_secure_client " + kFpA + "\n");

    auto peers = KnownPeers::LoadFromFile(file);

    EXPECT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers.source(), file.string());
    EXPECT_EQ(peers.FindFingerprint("my_secure_client"), kFpA);
}

TEST(KnownPeersTest, MissingFileThrows) {
    peerpin::test::TempDir dir;
    auto missing = dir.path() / "absent.txt";

    try {
        KnownPeers::LoadFromFile(missing);
        FAIL() << "expected ConfigLoadError";
    } catch (const ConfigLoadError& e) {
        EXPECT_EQ(e.path(), missing);
    }
}
