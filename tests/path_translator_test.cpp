#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "path_translator.hpp"

using namespace deskbridge;

class PathTranslatorTest : public ::testing::Test {
 protected:
  PathTranslator plain;
  PathTranslator with_distro{"Ubuntu"};
};

TEST_F(PathTranslatorTest, DetectsSyntax) {
  EXPECT_EQ(DetectSyntax("C:\\Users\\a"), PathSyntax::kHost);
  EXPECT_EQ(DetectSyntax("d:/data"), PathSyntax::kHost);
  EXPECT_EQ(DetectSyntax("\\\\wsl.localhost\\Ubuntu\\home"), PathSyntax::kHost);
  EXPECT_EQ(DetectSyntax("\\\\wsl$\\Ubuntu\\home"), PathSyntax::kHost);
  EXPECT_EQ(DetectSyntax("/home/a"), PathSyntax::kGuest);
  EXPECT_EQ(DetectSyntax("relative/x"), PathSyntax::kUnknown);
  EXPECT_EQ(DetectSyntax("C:foo"), PathSyntax::kUnknown);
  EXPECT_EQ(DetectSyntax("C:"), PathSyntax::kUnknown);
  EXPECT_EQ(DetectSyntax(""), PathSyntax::kUnknown);
  EXPECT_EQ(DetectSyntax("\\\\wsl$\\"), PathSyntax::kUnknown);
}

TEST_F(PathTranslatorTest, HostDriveToGuestAndBackIsExact) {
  const std::string original = "C:\\Users\\a\\f.txt";
  GatewayError err;
  auto guest = plain.ToGuest(original, &err);
  ASSERT_TRUE(guest.has_value()) << err.message;
  EXPECT_EQ(*guest, "/mnt/c/Users/a/f.txt");

  auto host = plain.ToHost(*guest, &err);
  ASSERT_TRUE(host.has_value()) << err.message;
  EXPECT_EQ(*host, original);
}

TEST_F(PathTranslatorTest, RoundTripsWellFormedPaths) {
  const std::vector<std::string> paths = {
      "C:\\",
      "D:\\projects\\deskbridge\\src\\main.cpp",
      "E:\\a b\\c (1)\\d.json",
      "Z:\\x",
  };
  for (const auto& p : paths) {
    GatewayError err;
    auto guest = with_distro.ToGuest(p, &err);
    ASSERT_TRUE(guest.has_value()) << p << ": " << err.message;
    auto back = with_distro.ToHost(*guest, &err);
    ASSERT_TRUE(back.has_value()) << p << ": " << err.message;
    EXPECT_EQ(*back, p);
  }
}

TEST_F(PathTranslatorTest, GuestPathsOutsideMntNeedADistro) {
  GatewayError err;
  EXPECT_FALSE(plain.ToHost("/home/u/notes.md", &err).has_value());
  EXPECT_EQ(err.code, ErrorCode::kPathTranslationError);

  auto host = with_distro.ToHost("/home/u/notes.md", &err);
  ASSERT_TRUE(host.has_value()) << err.message;
  EXPECT_EQ(*host, "\\\\wsl.localhost\\Ubuntu\\home\\u\\notes.md");

  auto guest = with_distro.ToGuest(*host, &err);
  ASSERT_TRUE(guest.has_value()) << err.message;
  EXPECT_EQ(*guest, "/home/u/notes.md");
}

TEST_F(PathTranslatorTest, DistributionRootRoundTrips) {
  GatewayError err;
  auto guest = with_distro.ToGuest("\\\\wsl.localhost\\Ubuntu\\", &err);
  ASSERT_TRUE(guest.has_value()) << err.message;
  EXPECT_EQ(*guest, "/");
  auto host = with_distro.ToHost("/", &err);
  ASSERT_TRUE(host.has_value()) << err.message;
  EXPECT_EQ(*host, "\\\\wsl.localhost\\Ubuntu\\");
}

TEST_F(PathTranslatorTest, ForeignDistroIsRejected) {
  GatewayError err;
  EXPECT_FALSE(with_distro.ToGuest("\\\\wsl.localhost\\Debian\\etc", &err).has_value());
  EXPECT_EQ(err.code, ErrorCode::kPathTranslationError);
}

TEST_F(PathTranslatorTest, RejectsMalformedInput) {
  for (const std::string p : {"", "relative\\x", "C:foo", "C:", "C:\\a/b\\c"}) {
    GatewayError err;
    EXPECT_FALSE(plain.ToGuest(p, &err).has_value()) << p;
    EXPECT_EQ(err.code, ErrorCode::kPathTranslationError) << p;
  }
  GatewayError err;
  EXPECT_FALSE(with_distro.ToHost("/tmp\\x", &err).has_value());
  EXPECT_EQ(err.code, ErrorCode::kPathTranslationError);
  EXPECT_FALSE(plain.ToHost("tmp/x", &err).has_value());
}

TEST_F(PathTranslatorTest, IdentityWhenAlreadyInTargetSyntax) {
  GatewayError err;
  auto same = plain.ToGuest("/mnt/c/x", &err);
  ASSERT_TRUE(same.has_value());
  EXPECT_EQ(*same, "/mnt/c/x");
  auto host = plain.ToHost("C:\\x", &err);
  ASSERT_TRUE(host.has_value());
  EXPECT_EQ(*host, "C:\\x");
}

TEST_F(PathTranslatorTest, NonCanonicalHostSpellingsAreRejected) {
  for (const std::string p : {"c:\\Users\\a\\f.txt", "C:/Users/a/f.txt", "\\\\wsl$\\Ubuntu\\etc\\hosts",
                              "\\\\wsl.localhost\\Ubuntu"}) {
    GatewayError err;
    EXPECT_FALSE(with_distro.ToGuest(p, &err).has_value()) << p;
    EXPECT_EQ(err.code, ErrorCode::kPathTranslationError) << p;
  }
  GatewayError err;
  EXPECT_FALSE(plain.ToGuest("\\\\wsl.localhost\\Ubuntu\\etc", &err).has_value());
}

// Every host path either fails to translate or comes back unchanged.
TEST_F(PathTranslatorTest, HostRoundTripIsExactOrRefused) {
  const std::vector<std::string> paths = {
      "C:\\Users\\a\\f.txt", "c:\\Users\\a\\f.txt", "C:/Users/a/f.txt", "C:\\", "C:\\a\\\\b\\",
      "\\\\wsl.localhost\\Ubuntu\\home\\u", "\\\\wsl.localhost\\Ubuntu\\", "\\\\wsl$\\Ubuntu\\home",
      "\\\\wsl.localhost\\Ubuntu\\mnt\\c\\x",
  };
  for (const auto* t : {&plain, &with_distro}) {
    for (const auto& p : paths) {
      GatewayError err;
      auto guest = t->ToGuest(p, &err);
      if (!guest) {
        EXPECT_EQ(err.code, ErrorCode::kPathTranslationError) << p;
        continue;
      }
      auto back = t->ToHost(*guest, &err);
      ASSERT_TRUE(back.has_value()) << p << ": " << err.message;
      EXPECT_EQ(*back, p);
    }
  }
}

TEST(PathSyntaxTest, ParsesNames) {
  PathSyntax s = PathSyntax::kUnknown;
  EXPECT_TRUE(ParsePathSyntax("host", &s));
  EXPECT_EQ(s, PathSyntax::kHost);
  EXPECT_TRUE(ParsePathSyntax("wsl", &s));
  EXPECT_EQ(s, PathSyntax::kGuest);
  EXPECT_FALSE(ParsePathSyntax("mac", &s));
}
