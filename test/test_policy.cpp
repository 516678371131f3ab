/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------*/
#include <gtest/gtest.h>
#include "TestHelpers.h"
#include "OperatingPolicy.h"

// Reservoir with zones DEAD [0,10), NORMAL [10,60), FLOOD_CONTROL [60,90), SURCHARGE [90,...)
class OperatingPolicyTest : public ::testing::Test {
protected:
    void SetUp() override {
        Options=TestOptions(5,1.0);
        pRes=UnitReservoir("Policy",1,100.0,500.0,30.0);
        pRes->SetZoneBoundaries(10.0,60.0,90.0);
        pRes->Initialize(Options);
    }
    void TearDown() override {
        delete pRes;
    }
    void SetStorage(const double V) {
        pRes->SetInitialStorage(V);
        pRes->Initialize(Options);
    }
    optStruct   Options;
    CReservoir *pRes;
};

TEST_F(OperatingPolicyTest, ForecastPeakTriggersPreRelease)
{
    COperatingPolicy policy;
    policy.SetPreRelease(1.5,1.2);
    double aF[3]={100.0,200.0,300.0};

    release_decision dec=policy.Decide(pRes,100.0,aF,3,0);
    EXPECT_DOUBLE_EQ(dec.Q, 120.0);
    EXPECT_TRUE(dec.pre_release);
    EXPECT_EQ(dec.zone, ZONE_NORMAL);
}

TEST_F(OperatingPolicyTest, SmallForecastPeakUsesZoneRule)
{
    COperatingPolicy policy;
    policy.SetPreRelease(1.5,1.2);
    policy.SetZoneRule(ZONE_NORMAL,RULE_CONSTANT,15.0,0.0);
    double aF[3]={100.0,120.0,150.0}; //150 is not greater than 1.5*100

    release_decision dec=policy.Decide(pRes,100.0,aF,3,0);
    EXPECT_DOUBLE_EQ(dec.Q, 15.0);
    EXPECT_FALSE(dec.pre_release);
}

TEST_F(OperatingPolicyTest, MissingForecastUsesZoneRule)
{
    COperatingPolicy policy;
    policy.SetPreRelease(1.5,1.2);
    release_decision dec=policy.Decide(pRes,100.0,NULL,0,0);
    EXPECT_DOUBLE_EQ(dec.Q, 100.0); //NORMAL default passes inflow
    EXPECT_FALSE(dec.pre_release);
}

TEST_F(OperatingPolicyTest, DisabledPreReleaseIgnoresForecast)
{
    COperatingPolicy policy;
    double aF[2]={1000.0,1000.0};
    release_decision dec=policy.Decide(pRes,10.0,aF,2,0);
    EXPECT_DOUBLE_EQ(dec.Q, 10.0);
    EXPECT_FALSE(dec.pre_release);
}

TEST_F(OperatingPolicyTest, DecisionIsDeterministic)
{
    COperatingPolicy policy;
    policy.SetPreRelease(1.5,1.2);
    policy.SetZoneRule(ZONE_NORMAL,RULE_STAGE_INTERP,5.0,50.0);
    double aF[4]={40.0,55.0,61.0,20.0};

    release_decision first=policy.Decide(pRes,40.0,aF,4,2);
    for (int i=0;i<10;i++){
        release_decision again=policy.Decide(pRes,40.0,aF,4,2);
        EXPECT_EQ(again.Q,           first.Q);
        EXPECT_EQ(again.zone,        first.zone);
        EXPECT_EQ(again.pre_release, first.pre_release);
    }
}

TEST_F(OperatingPolicyTest, DefaultRulesPerZone)
{
    COperatingPolicy policy;
    SetStorage(5.0);
    EXPECT_DOUBLE_EQ(policy.Decide(pRes,40.0,NULL,0,0).Q, 0.0);   //DEAD: nothing released
    SetStorage(30.0);
    EXPECT_DOUBLE_EQ(policy.Decide(pRes,40.0,NULL,0,0).Q, 40.0);  //NORMAL: pass inflow
    SetStorage(70.0);
    EXPECT_DOUBLE_EQ(policy.Decide(pRes,40.0,NULL,0,0).Q, 500.0); //FLOOD_CONTROL: maximum release
    SetStorage(95.0);
    EXPECT_DOUBLE_EQ(policy.Decide(pRes,40.0,NULL,0,0).Q, 500.0); //SURCHARGE: maximum release
}

TEST_F(OperatingPolicyTest, StageInterpolationAcrossZone)
{
    COperatingPolicy policy;
    policy.SetZoneRule(ZONE_NORMAL,RULE_STAGE_INTERP,10.0,110.0);
    SetStorage(10.0);
    EXPECT_DOUBLE_EQ(policy.Decide(pRes,0.0,NULL,0,0).Q, 10.0);
    SetStorage(35.0);
    EXPECT_DOUBLE_EQ(policy.Decide(pRes,0.0,NULL,0,0).Q, 60.0);
}

TEST_F(OperatingPolicyTest, InflowCappedRule)
{
    COperatingPolicy policy;
    policy.SetZoneRule(ZONE_NORMAL,RULE_INFLOW_CAPPED,30.0,0.0);
    EXPECT_DOUBLE_EQ(policy.Decide(pRes,50.0,NULL,0,0).Q, 30.0);
    EXPECT_DOUBLE_EQ(policy.Decide(pRes,20.0,NULL,0,0).Q, 20.0);

    policy.SetZoneRule(ZONE_NORMAL,RULE_INFLOW_CAPPED,DOESNT_EXIST,0.0); //no value: capped at maximum release
    EXPECT_DOUBLE_EQ(policy.Decide(pRes,800.0,NULL,0,0).Q, 500.0);
}

TEST_F(OperatingPolicyTest, ZeroInflowCapReleasesNothing)
{
    COperatingPolicy policy;
    policy.SetZoneRule(ZONE_NORMAL,RULE_INFLOW_CAPPED,0.0,0.0);
    policy.CheckConfiguration("Test");
    EXPECT_DOUBLE_EQ(policy.Decide(pRes,800.0,NULL,0,0).Q, 0.0);
}

TEST_F(OperatingPolicyTest, SwitchedOffPreReleaseIsRemembered)
{
    COperatingPolicy policy;
    EXPECT_FALSE(policy.IsPreReleaseDisabled());
    policy.DisablePreRelease();
    EXPECT_TRUE (policy.IsPreReleaseDisabled());
    EXPECT_FALSE(policy.UsesPreRelease());
    policy.SetPreRelease(2.0,1.1);
    EXPECT_FALSE(policy.IsPreReleaseDisabled());
    EXPECT_TRUE (policy.UsesPreRelease());
}

TEST_F(OperatingPolicyTest, ReleaseClampedToMaximumRate)
{
    COperatingPolicy policy;
    policy.SetPreRelease(1.5,1.2);
    double aF[1]={5000.0};
    release_decision dec=policy.Decide(pRes,1000.0,aF,1,0);
    EXPECT_TRUE(dec.pre_release);
    EXPECT_DOUBLE_EQ(dec.Q, 500.0);
}

TEST_F(OperatingPolicyTest, InvalidPreReleaseFactorIsRejected)
{
    COperatingPolicy policy;
    policy.SetPreRelease(0.0,1.2);
    EXPECT_EXIT(policy.CheckConfiguration("Policy"),
                ::testing::ExitedWithCode(BAD_DATA), "trigger factor must be positive");
}

TEST_F(OperatingPolicyTest, InvertedStageInterpolationLimitsAreRejected)
{
    COperatingPolicy policy;
    policy.SetZoneRule(ZONE_FLOOD_CONTROL,RULE_STAGE_INTERP,50.0,10.0);
    EXPECT_EXIT(policy.CheckConfiguration("Policy"),
                ::testing::ExitedWithCode(BAD_DATA), "Qmin<=Qmax");
}
