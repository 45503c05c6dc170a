#include "core/RecordPolicy.hpp"

#include <gtest/gtest.h>

using namespace ddns::core;
using ddns::common::RecordSpec;

TEST(RecordPolicyTest, AddressTypesAreDynamic) {
  EXPECT_TRUE(isDynamic("A"));
  EXPECT_TRUE(isDynamic("AAAA"));
  EXPECT_FALSE(isDynamic("CNAME"));
  EXPECT_FALSE(isDynamic("TXT"));
}

TEST(RecordPolicyTest, SupportedTypes) {
  EXPECT_TRUE(isSupportedType("A"));
  EXPECT_TRUE(isSupportedType("CNAME"));
  EXPECT_TRUE(isSupportedType("MX"));
  EXPECT_FALSE(isSupportedType("SPF"));
  EXPECT_FALSE(isSupportedType("cname"));
  EXPECT_FALSE(isSupportedType(""));
}

TEST(RecordPolicyTest, ApexMapsToZoneName) {
  EXPECT_EQ(recordFqdn("@", "example.com"), "example.com");
}

TEST(RecordPolicyTest, LabelIsPrefixedToZone) {
  EXPECT_EQ(recordFqdn("www", "example.com"), "www.example.com");
  EXPECT_EQ(recordFqdn("a.b", "example.com"), "a.b.example.com");
}

TEST(RecordPolicyTest, AddressContentIsTheIpEvenWithTarget) {
  RecordSpec rs;
  rs.sName = "@";
  rs.sType = "AAAA";
  rs.oTarget = "ignored.example.net";

  EXPECT_EQ(resolveContent(rs, "example.com", "2001:db8::1"), "2001:db8::1");
}

TEST(RecordPolicyTest, StaticContentPrefersTarget) {
  RecordSpec rs;
  rs.sName = "www";
  rs.sType = "CNAME";
  rs.oTarget = "cdn.example.net";

  EXPECT_EQ(resolveContent(rs, "example.com", "1.2.3.4"), "cdn.example.net");
}

TEST(RecordPolicyTest, StaticContentFallsBackToZone) {
  RecordSpec rs;
  rs.sName = "www";
  rs.sType = "CNAME";

  EXPECT_EQ(resolveContent(rs, "example.com", "1.2.3.4"), "example.com");

  rs.oTarget = "";
  EXPECT_EQ(resolveContent(rs, "example.com", "1.2.3.4"), "example.com");
}

TEST(RecordPolicyTest, TtlIsAutomaticOnlyWhenProxied) {
  EXPECT_EQ(recordTtl(true), 1);
  EXPECT_EQ(recordTtl(false), 300);
}

TEST(RecordPolicyTest, BuildPayloadCombinesPolicies) {
  RecordSpec rs;
  rs.sName = "home";
  rs.sType = "A";
  rs.bProxied = true;

  auto rp = buildPayload(rs, "example.com", "198.51.100.4");

  EXPECT_EQ(rp.sType, "A");
  EXPECT_EQ(rp.sName, "home.example.com");
  EXPECT_EQ(rp.sContent, "198.51.100.4");
  EXPECT_EQ(rp.iTtl, 1);
  EXPECT_TRUE(rp.bProxied);
}
