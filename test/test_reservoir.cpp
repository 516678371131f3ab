/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------*/
#include <gtest/gtest.h>
#include "TestHelpers.h"

class ReservoirTest : public ::testing::Test {
protected:
    void SetUp() override {
        double ht[3]={100.0, 110.0, 120.0};
        double V [3]={0.0,   2.0e7, 6.0e7};
        pRes=new CReservoir("Upper",1,6.0e7,400.0,ht,V,3);
        pRes->SetZoneBoundaries(102.0,112.0,118.0);
    }
    void TearDown() override {
        delete pRes;
    }
    CReservoir *pRes;
};

TEST_F(ReservoirTest, StageStorageCurveIsPiecewiseLinear)
{
    EXPECT_DOUBLE_EQ(pRes->GetStageFromStorage(1.0e7), 105.0);
    EXPECT_DOUBLE_EQ(pRes->GetStageFromStorage(4.0e7), 115.0);
    EXPECT_DOUBLE_EQ(pRes->GetStorageFromStage(115.0), 4.0e7);
    EXPECT_DOUBLE_EQ(pRes->GetStorageFromStage(100.0), 0.0);
}

TEST_F(ReservoirTest, ZonesAreLowerInclusive)
{
    EXPECT_EQ(pRes->GetZone(101.9), ZONE_DEAD);
    EXPECT_EQ(pRes->GetZone(102.0), ZONE_NORMAL);
    EXPECT_EQ(pRes->GetZone(111.99),ZONE_NORMAL);
    EXPECT_EQ(pRes->GetZone(112.0), ZONE_FLOOD_CONTROL);
    EXPECT_EQ(pRes->GetZone(118.0), ZONE_SURCHARGE);
    EXPECT_EQ(pRes->GetZone(500.0), ZONE_SURCHARGE);
    EXPECT_DOUBLE_EQ(pRes->GetFloodLimitStage(), 112.0);
}

TEST_F(ReservoirTest, DefaultZonesSpanEmptyToFull)
{
    CReservoir *pR=UnitReservoir("Unzoned",2,1000.0,10.0);
    EXPECT_EQ(pR->GetZone(0.0),    ZONE_NORMAL);
    EXPECT_EQ(pR->GetZone(999.0),  ZONE_NORMAL);
    EXPECT_EQ(pR->GetZone(1000.0), ZONE_FLOOD_CONTROL);
    EXPECT_DOUBLE_EQ(pR->GetFloodLimitStage(), 1000.0);
    delete pR;
}

TEST_F(ReservoirTest, MassBalanceUpdatesStorageAndHistory)
{
    optStruct Options=TestOptions(3,SEC_PER_DAY);
    pRes->SetInitialStage(110.0);
    pRes->Initialize(Options);
    EXPECT_DOUBLE_EQ(pRes->GetStorage(), 2.0e7);
    EXPECT_EQ(pRes->GetCurrentZone(), ZONE_NORMAL);

    int flags;
    double Q=pRes->ApplyMassBalance(150.0,100.0,SEC_PER_DAY,0,flags);
    EXPECT_DOUBLE_EQ(Q, 100.0);
    EXPECT_EQ(flags, DIAG_NONE);
    EXPECT_DOUBLE_EQ(pRes->GetStorage(), 2.0e7+50.0*SEC_PER_DAY);
    EXPECT_DOUBLE_EQ(pRes->GetOldStorage(), 2.0e7);
    EXPECT_DOUBLE_EQ(pRes->GetOutflowHistory(0), 100.0);
    EXPECT_EQ(pRes->GetNumCompletedSteps(), 1);
}

TEST_F(ReservoirTest, ExcessAboveCapacityIsSpilled)
{
    optStruct Options=TestOptions(2,1.0);
    CReservoir *pR=UnitReservoir("Small",3,100.0,10.0,95.0);
    pR->Initialize(Options);

    int flags;
    double Q=pR->ApplyMassBalance(20.0,5.0,1.0,0,flags);
    EXPECT_DOUBLE_EQ(pR->GetStorage(), 100.0);
    EXPECT_DOUBLE_EQ(Q, 15.0);
    EXPECT_TRUE((flags & DIAG_FORCED_SPILL)!=0);
    delete pR;
}

TEST_F(ReservoirTest, ReleaseIsCappedAtAvailableWater)
{
    optStruct Options=TestOptions(2,1.0);
    CReservoir *pR=UnitReservoir("Dry",4,100.0,50.0,10.0);
    pR->Initialize(Options);

    int flags;
    double Q=pR->ApplyMassBalance(5.0,40.0,1.0,0,flags);
    EXPECT_DOUBLE_EQ(pR->GetStorage(), 0.0);
    EXPECT_DOUBLE_EQ(Q, 15.0);
    EXPECT_TRUE((flags & DIAG_RELEASE_CAPPED)!=0);
    delete pR;
}

TEST_F(ReservoirTest, CrossingTwoBoundariesFlagsZoneJump)
{
    optStruct Options=TestOptions(2,1.0);
    CReservoir *pR=UnitReservoir("Jumpy",5,100.0,10.0,5.0);
    pR->SetZoneBoundaries(10.0,20.0,30.0);
    pR->Initialize(Options);
    EXPECT_EQ(pR->GetCurrentZone(), ZONE_DEAD);

    int flags;
    pR->ApplyMassBalance(30.0,0.0,1.0,0,flags);
    EXPECT_EQ(pR->GetCurrentZone(), ZONE_SURCHARGE);
    EXPECT_TRUE((flags & DIAG_ZONE_JUMP)!=0);
    EXPECT_TRUE((flags & DIAG_FLOOD_LIMIT_EXCEEDED)!=0);

    pR->ApplyMassBalance(0.0,0.0,1.0,1,flags);
    EXPECT_EQ(flags & DIAG_ZONE_JUMP, 0);
    delete pR;
}

TEST_F(ReservoirTest, OutOfOrderStepIsRuntimeError)
{
    optStruct Options=TestOptions(3,1.0);
    pRes->Initialize(Options);
    int flags;
    EXPECT_EXIT(pRes->ApplyMassBalance(1.0,1.0,1.0,1,flags),
                ::testing::ExitedWithCode(RUNTIME_ERR), "sequentially");
}

TEST_F(ReservoirTest, UnfinishedHistoryIsRuntimeError)
{
    optStruct Options=TestOptions(3,1.0);
    pRes->Initialize(Options);
    EXPECT_EXIT(pRes->GetOutflowHistory(0),
                ::testing::ExitedWithCode(RUNTIME_ERR), "has not been completed");
}

TEST_F(ReservoirTest, NonMonotonicCurveIsRejected)
{
    double ht[3]={0.0, 10.0, 5.0};
    double V [3]={0.0, 50.0, 100.0};
    CReservoir R("Bent",9,100.0,10.0,ht,V,3);
    EXPECT_EXIT(R.CheckConfiguration(),
                ::testing::ExitedWithCode(BAD_DATA), "strictly increasing");
}

TEST_F(ReservoirTest, InitialStorageAboveCapacityIsRejected)
{
    CReservoir *pR=UnitReservoir("Overfull",6,100.0,10.0,150.0);
    EXPECT_EXIT(pR->CheckConfiguration(),
                ::testing::ExitedWithCode(BAD_DATA), "initial storage");
    delete pR;
}
