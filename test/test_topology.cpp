/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------*/
#include <gtest/gtest.h>
#include "TestHelpers.h"
#include "RoutingLink.h"

class CascadeTopologyTest : public ::testing::Test {
protected:
    void SetUp() override {
        Options=TestOptions(10,1.0);
        pTopo=new CCascadeTopology();
    }
    void TearDown() override {
        delete pTopo;
    }
    void AddChain() {  //A(1) -> B(2) -> C(3)
        pTopo->AddReservoir(UnitReservoir("A",1,1000.0,100.0));
        pTopo->AddReservoir(UnitReservoir("B",2,1000.0,100.0));
        pTopo->AddReservoir(UnitReservoir("C",3,1000.0,100.0));
    }
    optStruct         Options;
    CCascadeTopology *pTopo;
};

TEST_F(CascadeTopologyTest, ZeroDelayLinksOrderUpstreamFirst)
{
    // inserted downstream-first
    pTopo->AddReservoir(UnitReservoir("C",3,1000.0,100.0));
    pTopo->AddReservoir(UnitReservoir("B",2,1000.0,100.0));
    pTopo->AddReservoir(UnitReservoir("A",1,1000.0,100.0));
    pTopo->AddRoutingLink(new CRoutingLink(1,2,0,0.0));
    pTopo->AddRoutingLink(new CRoutingLink(2,3,0,0.0));
    pTopo->Initialize(Options);

    EXPECT_EQ(pTopo->GetOrderedResIndex(0), 2);
    EXPECT_EQ(pTopo->GetOrderedResIndex(1), 1);
    EXPECT_EQ(pTopo->GetOrderedResIndex(2), 0);
    EXPECT_EQ(pTopo->GetMaxDepth(), 2);
}

TEST_F(CascadeTopologyTest, DelayedLinksDoNotConstrainOrder)
{
    AddChain();
    pTopo->AddRoutingLink(new CRoutingLink(1,2,2,0.0));
    pTopo->AddRoutingLink(new CRoutingLink(2,3,1,0.0));
    pTopo->Initialize(Options);

    EXPECT_EQ(pTopo->GetMaxDepth(), 0);
    for (int i=0;i<3;i++){EXPECT_EQ(pTopo->GetOrderedResIndex(i), i);} //insertion order
    EXPECT_TRUE (pTopo->IsOutlet(2));
    EXPECT_FALSE(pTopo->IsOutlet(0));
}

TEST_F(CascadeTopologyTest, PositiveDelayCycleIsAllowed)
{
    AddChain();
    pTopo->AddRoutingLink(new CRoutingLink(1,2,0,0.0));
    pTopo->AddRoutingLink(new CRoutingLink(2,1,1,0.0)); //return flow with one step delay
    pTopo->AddInflowSeries(ConstantSeries(1,5.0,10));
    pTopo->Initialize(Options);
    EXPECT_EQ(pTopo->GetDepth(0), 0);
    EXPECT_EQ(pTopo->GetDepth(1), 1);
}

TEST_F(CascadeTopologyTest, ZeroDelayCycleIsConfigurationError)
{
    AddChain();
    pTopo->AddRoutingLink(new CRoutingLink(1,2,0,0.0));
    pTopo->AddRoutingLink(new CRoutingLink(2,3,0,0.0));
    pTopo->AddRoutingLink(new CRoutingLink(3,1,0,0.0));
    EXPECT_EXIT(pTopo->Initialize(Options), ::testing::ExitedWithCode(BAD_DATA), "zero-delay cycle");
}

TEST_F(CascadeTopologyTest, ZeroDelaySelfLoopIsConfigurationError)
{
    AddChain();
    pTopo->AddRoutingLink(new CRoutingLink(2,2,0,0.0));
    EXPECT_EXIT(pTopo->Initialize(Options), ::testing::ExitedWithCode(BAD_DATA), "circular reference");
}

TEST_F(CascadeTopologyTest, UnknownReservoirIDIsConfigurationError)
{
    AddChain();
    pTopo->AddRoutingLink(new CRoutingLink(1,7,1,0.0));
    EXPECT_EXIT(pTopo->Initialize(Options), ::testing::ExitedWithCode(BAD_DATA), "downstream reservoir ID not found");
}

TEST_F(CascadeTopologyTest, NegativeTravelTimeIsConfigurationError)
{
    AddChain();
    pTopo->AddRoutingLink(new CRoutingLink(1,2,-1,0.0));
    EXPECT_EXIT(pTopo->Initialize(Options), ::testing::ExitedWithCode(BAD_DATA), "travel time cannot be negative");
}

TEST_F(CascadeTopologyTest, OverallocatedBifurcationIsConfigurationError)
{
    AddChain();
    CRoutingLink *pL1=new CRoutingLink(1,2,0,0.0); pL1->SetFraction(0.7);
    CRoutingLink *pL2=new CRoutingLink(1,3,0,0.0); pL2->SetFraction(0.6);
    pTopo->AddRoutingLink(pL1);
    pTopo->AddRoutingLink(pL2);
    EXPECT_EXIT(pTopo->Initialize(Options), ::testing::ExitedWithCode(BAD_DATA), "sum to more than one");
}

TEST_F(CascadeTopologyTest, DuplicateReservoirIDIsConfigurationError)
{
    AddChain();
    pTopo->AddReservoir(UnitReservoir("A2",1,1000.0,100.0));
    EXPECT_EXIT(pTopo->Initialize(Options), ::testing::ExitedWithCode(BAD_DATA), "duplicate reservoir ID 1");
}

TEST_F(CascadeTopologyTest, UnorderedZoneBoundariesAreConfigurationError)
{
    AddChain();
    pTopo->GetReservoirByID(2)->SetZoneBoundaries(50.0,20.0,80.0);
    EXPECT_EXIT(pTopo->Initialize(Options), ::testing::ExitedWithCode(BAD_DATA), "strictly ordered");
}

TEST_F(CascadeTopologyTest, NonMonotonicCurveIsConfigurationError)
{
    double ht[3]={0.0,10.0,10.0};
    double V [3]={0.0,50.0,100.0};
    pTopo->AddReservoir(new CReservoir("Flat",1,100.0,10.0,ht,V,3));
    EXPECT_EXIT(pTopo->Initialize(Options), ::testing::ExitedWithCode(BAD_DATA), "Flat");
}

TEST_F(CascadeTopologyTest, ShortInflowSeriesIsHorizonMismatch)
{
    AddChain();
    pTopo->AddInflowSeries(ConstantSeries(1,10.0,5));
    EXPECT_EXIT(pTopo->Initialize(Options), ::testing::ExitedWithCode(BAD_DATA), "shorter than simulation horizon");
}

TEST_F(CascadeTopologyTest, NegativeInflowIsConfigurationError)
{
    AddChain();
    vector<double> v(10,1.0); v[4]=-3.0;
    pTopo->AddInflowSeries(MakeSeries(2,v));
    EXPECT_EXIT(pTopo->Initialize(Options), ::testing::ExitedWithCode(BAD_DATA), "negative values");
}

TEST_F(CascadeTopologyTest, ExternalAndRoutedInflowAccessors)
{
    AddChain();
    pTopo->AddInflowSeries(ConstantSeries(1,10.0,10));
    pTopo->AddRoutingLink(new CRoutingLink(1,2,3,4.0));
    pTopo->Initialize(Options);
    EXPECT_DOUBLE_EQ(pTopo->GetExternalInflow(0,0), 10.0);
    EXPECT_DOUBLE_EQ(pTopo->GetExternalInflow(1,0), 0.0);
    EXPECT_DOUBLE_EQ(pTopo->GetRoutedInflow(1,0), 4.0);
    EXPECT_TRUE(pTopo->GetInflowSeries(1)==NULL);
    EXPECT_EQ(pTopo->GetReservoirIndex(3), 2);
    EXPECT_EQ(pTopo->GetReservoirIndex(99), INDEX_NOT_FOUND);
}
