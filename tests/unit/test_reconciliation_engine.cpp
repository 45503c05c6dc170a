#include "core/ReconciliationEngine.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "Fakes.hpp"

using ddns::common::RecordSpec;
using ddns::common::ZoneSpec;
using ddns::core::ReconciliationEngine;
using ddns::test::FakeDnsProvider;
using ddns::test::FakeIpResolver;

namespace {

RecordSpec makeRecord(const std::string& sName, const std::string& sType = "A",
                      bool bProxied = false) {
  RecordSpec rs;
  rs.sName = sName;
  rs.sType = sType;
  rs.bProxied = bProxied;
  return rs;
}

}  // namespace

class ReconciliationEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    provider.mZones["example.com"] = "zone-1";
    resolver.sIp = "1.2.3.4";
  }

  ReconciliationEngine makeEngine(std::vector<RecordSpec> vRecords) {
    ZoneSpec zs;
    zs.sName = "example.com";
    zs.vRecords = std::move(vRecords);
    return ReconciliationEngine({zs}, provider, resolver);
  }

  FakeDnsProvider provider;
  FakeIpResolver resolver;
};

TEST_F(ReconciliationEngineTest, FirstCycleCreatesMissingApexRecord) {
  auto re = makeEngine({makeRecord("@", "A", true)});

  auto cr = re.runCycle();

  EXPECT_TRUE(cr.bIpResolved);
  EXPECT_TRUE(cr.bIpChanged);
  EXPECT_EQ(cr.iRecordsResolved, 1);
  EXPECT_EQ(provider.iResolveCalls, 1);
  EXPECT_EQ(provider.iFindCalls, 1);
  ASSERT_EQ(provider.iCreateCalls, 1);

  const auto& rp = provider.vCreated.front();
  EXPECT_EQ(rp.sType, "A");
  EXPECT_EQ(rp.sName, "example.com");
  EXPECT_EQ(rp.sContent, "1.2.3.4");
  EXPECT_EQ(rp.iTtl, 1);
  EXPECT_TRUE(rp.bProxied);
  EXPECT_EQ(re.lastKnownIp(), "1.2.3.4");
}

TEST_F(ReconciliationEngineTest, CreatedAddressRecordIsUpdatedInSameCycle) {
  auto re = makeEngine({makeRecord("@", "A", true)});

  auto cr = re.runCycle();

  ASSERT_EQ(provider.iUpdateCalls, 1);
  EXPECT_EQ(cr.iRecordsUpdated, 1);
  EXPECT_EQ(provider.vUpdated.front().first, "rec-1");
  EXPECT_EQ(provider.vUpdated.front().second.sContent, "1.2.3.4");
  EXPECT_EQ(provider.vUpdated.front().second.iTtl, 1);
}

TEST_F(ReconciliationEngineTest, UnchangedIpMakesNoRecordCalls) {
  auto re = makeEngine({makeRecord("@", "A", true)});
  re.runCycle();
  const int iCallsAfterFirst = provider.totalRecordCalls();

  auto cr = re.runCycle();

  EXPECT_FALSE(cr.bIpChanged);
  EXPECT_EQ(cr.iRecordsSkipped, 1);
  EXPECT_EQ(provider.totalRecordCalls(), iCallsAfterFirst);
  EXPECT_EQ(provider.iResolveCalls, 1);
}

TEST_F(ReconciliationEngineTest, ChangedIpIssuesSingleUpdate) {
  auto re = makeEngine({makeRecord("@", "A", true)});
  re.runCycle();
  re.runCycle();
  const int iCallsBefore = provider.totalRecordCalls();

  resolver.sIp = "5.6.7.8";
  auto cr = re.runCycle();

  EXPECT_TRUE(cr.bIpChanged);
  EXPECT_EQ(cr.iRecordsUpdated, 1);
  EXPECT_EQ(provider.totalRecordCalls(), iCallsBefore + 1);
  EXPECT_EQ(provider.iFindCalls, 1);
  ASSERT_EQ(provider.iUpdateCalls, 2);
  EXPECT_EQ(provider.vUpdated.back().first, "rec-1");
  EXPECT_EQ(provider.vUpdated.back().second.sContent, "5.6.7.8");
  EXPECT_EQ(provider.vUpdated.back().second.iTtl, 1);
}

TEST_F(ReconciliationEngineTest, UpdateFailureClearsIdentifierAndForcesRediscovery) {
  auto re = makeEngine({makeRecord("@", "A", true)});
  re.runCycle();

  resolver.sIp = "5.6.7.8";
  provider.bFailAllUpdates = true;
  auto cr = re.runCycle();

  EXPECT_EQ(cr.iRecordsFailed, 1);
  EXPECT_EQ(provider.iUpdateCalls, 2);
  EXPECT_FALSE(re.cache().cachedRecordId("example.com", makeRecord("@")).has_value());

  provider.bFailAllUpdates = false;
  resolver.sIp = "9.9.9.9";
  cr = re.runCycle();

  EXPECT_EQ(provider.iFindCalls, 2);
  EXPECT_EQ(provider.iCreateCalls, 1);
  EXPECT_EQ(provider.iUpdateCalls, 3);
  EXPECT_EQ(cr.iRecordsResolved, 1);
  EXPECT_EQ(cr.iRecordsUpdated, 1);
  EXPECT_EQ(provider.vUpdated.back().first, "rec-1");
  EXPECT_EQ(provider.vUpdated.back().second.sContent, "9.9.9.9");
  EXPECT_TRUE(re.cache().cachedRecordId("example.com", makeRecord("@")).has_value());
}

TEST_F(ReconciliationEngineTest, ExistingRemoteRecordIsUpdatedNotCreated) {
  provider.mRecords[FakeDnsProvider::key("zone-1", "A", "home.example.com")] = "rec-remote";
  auto re = makeEngine({makeRecord("home")});

  auto cr = re.runCycle();

  EXPECT_EQ(provider.iFindCalls, 1);
  EXPECT_EQ(provider.iCreateCalls, 0);
  ASSERT_EQ(provider.iUpdateCalls, 1);
  EXPECT_EQ(provider.vUpdated.front().first, "rec-remote");
  EXPECT_EQ(provider.vUpdated.front().second.iTtl, 300);
  EXPECT_FALSE(provider.vUpdated.front().second.bProxied);
  EXPECT_EQ(cr.iRecordsUpdated, 1);
}

TEST_F(ReconciliationEngineTest, StaticCnameIsCreatedOnceAndNeverRevisited) {
  auto rs = makeRecord("www", "CNAME");
  rs.oTarget = "example.com";
  auto re = makeEngine({rs});

  re.runCycle();
  ASSERT_EQ(provider.iCreateCalls, 1);
  EXPECT_EQ(provider.vCreated.front().sContent, "example.com");
  EXPECT_EQ(provider.vCreated.front().sName, "www.example.com");

  for (const char* pIp : {"5.6.7.8", "9.9.9.9", "1.2.3.4"}) {
    resolver.sIp = pIp;
    auto cr = re.runCycle();
    EXPECT_TRUE(cr.bIpChanged);
    EXPECT_EQ(cr.iRecordsSkipped, 1);
  }

  EXPECT_EQ(provider.iFindCalls, 1);
  EXPECT_EQ(provider.iCreateCalls, 1);
  EXPECT_EQ(provider.iUpdateCalls, 0);
}

TEST_F(ReconciliationEngineTest, StaticRecordWithoutTargetPointsAtZone) {
  auto re = makeEngine({makeRecord("alias", "CNAME")});

  re.runCycle();

  ASSERT_EQ(provider.vCreated.size(), 1u);
  EXPECT_EQ(provider.vCreated.front().sContent, "example.com");
}

TEST_F(ReconciliationEngineTest, ExistingStaticRecordIsFoundButNotUpdated) {
  provider.mRecords[FakeDnsProvider::key("zone-1", "TXT", "example.com")] = "rec-txt";
  auto rs = makeRecord("@", "TXT");
  rs.oTarget = "v=spf1 -all";
  auto re = makeEngine({rs});

  auto cr = re.runCycle();

  EXPECT_EQ(cr.iRecordsResolved, 1);
  EXPECT_EQ(provider.iCreateCalls, 0);
  EXPECT_EQ(provider.iUpdateCalls, 0);
  EXPECT_EQ(re.cache().cachedRecordId("example.com", rs), "rec-txt");
}

TEST_F(ReconciliationEngineTest, IpFetchFailureKeepsLastKnownIp) {
  auto re = makeEngine({makeRecord("@")});
  re.runCycle();
  const int iCallsAfterFirst = provider.totalRecordCalls();

  resolver.bFail = true;
  auto cr = re.runCycle();

  EXPECT_FALSE(cr.bIpResolved);
  EXPECT_EQ(re.lastKnownIp(), "1.2.3.4");
  EXPECT_EQ(provider.totalRecordCalls(), iCallsAfterFirst);
  EXPECT_EQ(provider.iResolveCalls, 1);

  resolver.bFail = false;
  cr = re.runCycle();

  EXPECT_TRUE(cr.bIpResolved);
  EXPECT_FALSE(cr.bIpChanged);
  EXPECT_EQ(provider.totalRecordCalls(), iCallsAfterFirst);
}

TEST_F(ReconciliationEngineTest, ZoneFailureSkipsOnlyThatZoneAndIsRetried) {
  provider.mZones["example.org"] = "zone-2";

  ZoneSpec zsMissing;
  zsMissing.sName = "missing.net";
  zsMissing.vRecords = {makeRecord("@")};
  ZoneSpec zsPresent;
  zsPresent.sName = "example.org";
  zsPresent.vRecords = {makeRecord("@")};
  ReconciliationEngine re({zsMissing, zsPresent}, provider, resolver);

  auto cr = re.runCycle();

  EXPECT_EQ(cr.iZonesFailed, 1);
  EXPECT_EQ(provider.iResolveCalls, 2);
  ASSERT_EQ(provider.iCreateCalls, 1);
  EXPECT_EQ(provider.vCreated.front().sName, "example.org");
  EXPECT_FALSE(re.cache().cachedZoneId("missing.net").has_value());
  EXPECT_EQ(re.cache().cachedZoneId("example.org"), "zone-2");

  cr = re.runCycle();

  // Only the unresolved zone is looked up again.
  EXPECT_EQ(provider.iResolveCalls, 3);
  EXPECT_EQ(cr.iZonesFailed, 1);
}

TEST_F(ReconciliationEngineTest, FailedLookupWaitsForIpChange) {
  auto re = makeEngine({makeRecord("@")});
  provider.bFailFind = true;

  auto cr = re.runCycle();
  EXPECT_EQ(cr.iRecordsFailed, 1);
  EXPECT_EQ(provider.totalRecordCalls(), 1);

  provider.bFailFind = false;
  cr = re.runCycle();

  EXPECT_FALSE(cr.bIpChanged);
  EXPECT_EQ(cr.iRecordsSkipped, 1);
  EXPECT_EQ(provider.totalRecordCalls(), 1);
  EXPECT_FALSE(re.cache().cachedRecordId("example.com", makeRecord("@")).has_value());
}

TEST_F(ReconciliationEngineTest, FailedLookupIsRetriedAfterIpChange) {
  auto re = makeEngine({makeRecord("@")});
  provider.bFailFind = true;
  re.runCycle();
  provider.bFailFind = false;
  re.runCycle();

  resolver.sIp = "5.6.7.8";
  auto cr = re.runCycle();

  EXPECT_TRUE(cr.bIpChanged);
  EXPECT_EQ(cr.iRecordsResolved, 1);
  EXPECT_EQ(provider.iFindCalls, 2);
  ASSERT_EQ(provider.iCreateCalls, 1);
  EXPECT_EQ(provider.vCreated.front().sContent, "5.6.7.8");
  EXPECT_EQ(provider.iUpdateCalls, 1);
  EXPECT_EQ(re.cache().cachedRecordId("example.com", makeRecord("@")), "rec-1");
}

TEST_F(ReconciliationEngineTest, UnresolvedAddressRecordMakesNoCallsWithSameIp) {
  auto re = makeEngine({makeRecord("a"), makeRecord("b"), makeRecord("c")});
  provider.mRecords[FakeDnsProvider::key("zone-1", "A", "c.example.com")] = "rec-c";
  provider.bFailCreate = true;
  provider.setFailingUpdates.insert("c.example.com");

  auto cr = re.runCycle();
  EXPECT_EQ(cr.iRecordsFailed, 3);
  const int iCallsAfterFirst = provider.totalRecordCalls();

  provider.bFailCreate = false;
  provider.setFailingUpdates.clear();
  for (int i = 0; i < 3; ++i) {
    cr = re.runCycle();
    EXPECT_FALSE(cr.bIpChanged);
    EXPECT_EQ(cr.iRecordsSkipped, 3);
    EXPECT_EQ(cr.iRecordsFailed, 0);
  }

  EXPECT_EQ(provider.totalRecordCalls(), iCallsAfterFirst);
}

TEST_F(ReconciliationEngineTest, FailedCreateLeavesRecordUnresolved) {
  auto rs = makeRecord("www", "CNAME");
  auto re = makeEngine({rs});
  provider.bFailCreate = true;

  auto cr = re.runCycle();

  EXPECT_EQ(cr.iRecordsFailed, 1);
  EXPECT_FALSE(re.cache().cachedRecordId("example.com", rs).has_value());

  provider.bFailCreate = false;
  re.runCycle();

  EXPECT_EQ(provider.iCreateCalls, 2);
  EXPECT_EQ(re.cache().cachedRecordId("example.com", rs), "rec-2");
}

TEST_F(ReconciliationEngineTest, LaterFailureDoesNotRollBackEarlierUpdates) {
  provider.mRecords[FakeDnsProvider::key("zone-1", "A", "a.example.com")] = "rec-a";
  provider.mRecords[FakeDnsProvider::key("zone-1", "A", "b.example.com")] = "rec-b";
  provider.setFailingUpdates.insert("b.example.com");
  auto re = makeEngine({makeRecord("a"), makeRecord("b")});

  auto cr = re.runCycle();

  EXPECT_EQ(cr.iRecordsUpdated, 1);
  EXPECT_EQ(cr.iRecordsFailed, 1);
  EXPECT_EQ(re.cache().cachedRecordId("example.com", makeRecord("a")), "rec-a");
  EXPECT_FALSE(re.cache().cachedRecordId("example.com", makeRecord("b")).has_value());
}

TEST_F(ReconciliationEngineTest, AddressFamiliesSharingANameAreTrackedSeparately) {
  auto re = makeEngine({makeRecord("@", "A"), makeRecord("@", "AAAA")});

  re.runCycle();

  EXPECT_EQ(provider.iCreateCalls, 2);
  EXPECT_EQ(re.cache().cachedRecordId("example.com", makeRecord("@", "A")), "rec-1");
  EXPECT_EQ(re.cache().cachedRecordId("example.com", makeRecord("@", "AAAA")), "rec-2");

  resolver.sIp = "2001:db8::1";
  re.runCycle();

  ASSERT_EQ(provider.vUpdated.size(), 4u);
  EXPECT_EQ(provider.vUpdated[2].first, "rec-1");
  EXPECT_EQ(provider.vUpdated[3].first, "rec-2");
}
