/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------*/
#include <gtest/gtest.h>
#include <random>
#include "TestHelpers.h"
#include "RoutingLink.h"
#include "OperatingPolicy.h"
#include "Forecast.h"
#include "SchedulingEngine.h"

// ============================================================================
// Three-reservoir chain A -> B -> C with travel times 2 and 1
// ============================================================================

TEST(SchedulingEngineTest, ChainDelaysArriveOnSchedule)
{
    optStruct Options=TestOptions(8,1.0);
    CCascadeTopology topo;
    topo.AddReservoir(UnitReservoir("A",1,1.0e6,1000.0));
    topo.AddReservoir(UnitReservoir("B",2,1.0e6,1000.0));
    topo.AddReservoir(UnitReservoir("C",3,1.0e6,1000.0));
    topo.AddRoutingLink(new CRoutingLink(1,2,2,0.0));
    topo.AddRoutingLink(new CRoutingLink(2,3,1,0.0));
    topo.AddInflowSeries(ConstantSeries(1,100.0,8));
    for (long ID=1;ID<=3;ID++){SetUniformRule(&topo,ID,RULE_PASS_INFLOW,1.0);}

    CMetricsCollector *pM=RunCascade(&topo,Options);

    EXPECT_DOUBLE_EQ(pM->GetRecord(0,0).Qout, 100.0);
    for (int n=0;n<8;n++)
    {
        EXPECT_DOUBLE_EQ(pM->GetRecord(1,n).Qin, (n>=2) ? 100.0 : 0.0) << "step " << n;
        EXPECT_DOUBLE_EQ(pM->GetRecord(2,n).Qin, (n>=3) ? 100.0 : 0.0) << "step " << n;
    }
    EXPECT_TRUE(pM->GetSystemMetrics().mass_balance_ok);
    delete pM;
}

// ============================================================================
// Single reservoir filling to capacity under a capped release
// ============================================================================

TEST(SchedulingEngineTest, CappedReleaseFillsThenSpills)
{
    const int N=40;
    optStruct Options=TestOptions(N,1.0);
    CCascadeTopology topo;
    CReservoir *pRes=UnitReservoir("Single",1,1000.0,30.0,500.0);
    pRes->SetZoneBoundaries(100.0,800.0,950.0);
    topo.AddReservoir(pRes);
    topo.AddInflowSeries(ConstantSeries(1,50.0,N));
    SetUniformRule(&topo,1,RULE_INFLOW_CAPPED,30.0);

    CMetricsCollector *pM=RunCascade(&topo,Options);

    double S=500.0;
    for (int n=0;n<N;n++)
    {
        const step_record &R=pM->GetRecord(0,n);
        if (S+20.0<=1000.0){
            S+=20.0;
            EXPECT_DOUBLE_EQ(R.Qout, 30.0) << "step " << n;
            EXPECT_EQ(R.flags & DIAG_FORCED_SPILL, 0);
        }
        else{
            EXPECT_DOUBLE_EQ(R.Qout, 50.0) << "step " << n;
            EXPECT_NE(R.flags & DIAG_FORCED_SPILL, 0);
        }
        EXPECT_DOUBLE_EQ(R.storage, S) << "step " << n;
    }
    const res_metrics &M=pM->GetReservoirMetrics(0);
    EXPECT_DOUBLE_EQ(M.max_stage, 1000.0);
    EXPECT_FALSE(M.flood_compliant);
    EXPECT_FALSE(pM->GetSystemMetrics().flood_compliant);
    EXPECT_EQ(M.n_spill, N-25);
    EXPECT_TRUE(M.MB_ok);
    delete pM;
}

// ============================================================================
// Forecast-driven pre-release within a run
// ============================================================================

TEST(SchedulingEngineTest, ForecastFloodTriggersPreRelease)
{
    optStruct Options=TestOptions(6,1.0);
    CCascadeTopology topo;
    topo.AddReservoir(UnitReservoir("Fcst",1,1.0e6,1000.0,1000.0));
    double v[6]={100.0,100.0,100.0,300.0,100.0,100.0};
    topo.AddInflowSeries(new CTimeSeries("Inflow_1",1,v,6));
    SetUniformRule(&topo,1,RULE_CONSTANT,10.0);
    topo.AddForecastAdapter(new CForecastAdapter(1,new CSeriesForecast(topo.FindInflowSeries(1),1.0),3,10.0));

    CMetricsCollector *pM=RunCascade(&topo,Options);

    // steps 1..3 see the 300 peak within three steps of lead time
    EXPECT_FALSE(pM->GetRecord(0,0).pre_release);
    EXPECT_DOUBLE_EQ(pM->GetRecord(0,0).Qout, 10.0);
    EXPECT_TRUE (pM->GetRecord(0,1).pre_release);
    EXPECT_DOUBLE_EQ(pM->GetRecord(0,1).Qout, 120.0);
    EXPECT_TRUE (pM->GetRecord(0,2).pre_release);
    EXPECT_FALSE(pM->GetRecord(0,3).pre_release); //300 is the current inflow
    EXPECT_EQ(pM->GetReservoirMetrics(0).n_pre_release, 2);
    delete pM;
}

TEST(SchedulingEngineTest, MultiBoundaryCrossingIsRecorded)
{
    optStruct Options=TestOptions(3,1.0);
    CCascadeTopology topo;
    CReservoir *pRes=UnitReservoir("Jumpy",1,100.0,1.0,5.0);
    pRes->SetZoneBoundaries(10.0,20.0,30.0);
    topo.AddReservoir(pRes);
    double v[3]={30.0,0.0,0.0};
    topo.AddInflowSeries(new CTimeSeries("Inflow_1",1,v,3));
    SetUniformRule(&topo,1,RULE_NONE);

    CMetricsCollector *pM=RunCascade(&topo,Options);
    EXPECT_NE(pM->GetRecord(0,0).flags & DIAG_ZONE_JUMP, 0);
    EXPECT_EQ(pM->GetRecord(0,0).zone, ZONE_SURCHARGE);
    EXPECT_EQ(pM->GetReservoirMetrics(0).n_zone_jumps, 1);
    delete pM;
}

TEST(SchedulingEngineTest, SecondRunRequiresReinitialization)
{
    optStruct Options=TestOptions(3,1.0);
    CCascadeTopology topo;
    topo.AddReservoir(UnitReservoir("Once",1,100.0,10.0));
    CMetricsCollector *pM=RunCascade(&topo,Options);
    CSchedulingEngine engine;
    EXPECT_EXIT(engine.Run(&topo,Options,pM), ::testing::ExitedWithCode(RUNTIME_ERR), "re-initialized");

    topo.Initialize(Options);
    engine.Run(&topo,Options,pM);
    EXPECT_EQ(pM->GetSystemMetrics().nSteps, 3);
    delete pM;
}

TEST(SchedulingEngineTest, UninitializedCascadeIsRuntimeError)
{
    optStruct Options=TestOptions(3,1.0);
    CCascadeTopology topo;
    topo.AddReservoir(UnitReservoir("Raw",1,100.0,10.0));
    CMetricsCollector M;
    CSchedulingEngine engine;
    EXPECT_EXIT(engine.Run(&topo,Options,&M), ::testing::ExitedWithCode(RUNTIME_ERR), "must be initialized");
}

// ============================================================================
// Randomized cascades: storage bounds and water balance closure
// ============================================================================

class RandomCascadeTest : public ::testing::TestWithParam<unsigned int> {};

TEST_P(RandomCascadeTest, StorageStaysWithinBoundsAndWaterBalanceCloses)
{
    std::mt19937 gen(GetParam());
    std::uniform_int_distribution<int>     nres_dist(1,6);
    std::uniform_int_distribution<int>     tau_dist (0,3);
    std::uniform_real_distribution<double> cap_dist (50.0,5000.0);
    std::uniform_real_distribution<double> unit_dist(0.0,1.0);
    std::uniform_int_distribution<int>     rule_dist(0,5);

    const int N=60;
    const double tstep=3600.0;
    optStruct Options=TestOptions(N,tstep);

    CCascadeTopology topo;
    int nRes=nres_dist(gen);
    for (int p=0;p<nRes;p++)
    {
        double cap=cap_dist(gen)*tstep;
        CReservoir *pRes=UnitReservoir("R"+to_string(p),p+1,cap,cap_dist(gen)/10.0,unit_dist(gen)*cap);
        pRes->SetZoneBoundaries(0.1*cap,0.6*cap,0.9*cap);
        topo.AddReservoir(pRes);

        vector<double> Q(N);
        for (int n=0;n<N;n++){Q[n]=200.0*unit_dist(gen)*unit_dist(gen);}
        topo.AddInflowSeries(MakeSeries(p+1,Q));

        COperatingPolicy *pPol=new COperatingPolicy();
        for (int z=0;z<NUM_RES_ZONES;z++){
            release_rule r=(release_rule)(rule_dist(gen));
            double v1=100.0*unit_dist(gen);
            pPol->SetZoneRule((res_zone)(z),r,v1,v1+100.0*unit_dist(gen));
        }
        topo.SetPolicy(p+1,pPol);
    }
    for (int p=0;p<nRes-1;p++)  // random tree: every reservoir but the last drains to a higher-indexed one
    {
        std::uniform_int_distribution<int> down_dist(p+1,nRes-1);
        topo.AddRoutingLink(new CRoutingLink(p+1,down_dist(gen)+1,tau_dist(gen),5.0*unit_dist(gen)));
    }

    CMetricsCollector *pM=RunCascade(&topo,Options);
    for (int p=0;p<nRes;p++)
    {
        double cap=topo.GetReservoir(p)->GetMaxCapacity();
        for (int n=0;n<N;n++)
        {
            const step_record &R=pM->GetRecord(p,n);
            EXPECT_GE(R.storage, 0.0);
            EXPECT_LE(R.storage, cap);
            EXPECT_GE(R.Qout, 0.0);
        }
        EXPECT_TRUE(pM->GetReservoirMetrics(p).MB_ok) << "reservoir " << p << " residual " << pM->GetReservoirMetrics(p).MB_residual;
    }
    EXPECT_TRUE(pM->GetSystemMetrics().mass_balance_ok);
    delete pM;
}

INSTANTIATE_TEST_SUITE_P(Seeds, RandomCascadeTest, ::testing::Values(1u,7u,42u,1234u,2024u,31337u,99991u,5u));

TEST(SchedulingEngineTest, SummaryReportsWithoutAlteringMetrics)
{
    optStruct Options=TestOptions(4,1.0);
    CCascadeTopology topo;
    topo.AddReservoir(UnitReservoir("Small",1,10.0,1.0,9.0));
    topo.AddInflowSeries(ConstantSeries(1,5.0,4));
    SetUniformRule(&topo,1,RULE_CONSTANT,1.0);

    CMetricsCollector *pM=RunCascade(&topo,Options);
    int nspill=pM->GetSystemMetrics().n_spill;
    CSchedulingEngine engine;
    engine.SummarizeToScreen(pM,Options);
    EXPECT_EQ(pM->GetSystemMetrics().n_spill,nspill);
    EXPECT_EQ(nspill,4);
    delete pM;
}

TEST(SchedulingEngineTest, SwitchedOffPreReleaseStaysOffWithForecast)
{
    optStruct Options=TestOptions(4,1.0);
    CCascadeTopology topo;
    topo.AddReservoir(UnitReservoir("NoPre",1,1.0e6,1000.0,1000.0));
    double v[4]={100.0,300.0,100.0,100.0};
    topo.AddInflowSeries(new CTimeSeries("Inflow_1",1,v,4));

    COperatingPolicy *pPol=new COperatingPolicy();
    for (int z=0;z<NUM_RES_ZONES;z++){pPol->SetZoneRule((res_zone)(z),RULE_CONSTANT,10.0,0.0);}
    pPol->DisablePreRelease();
    topo.SetPolicy(1,pPol);
    topo.AddForecastAdapter(new CForecastAdapter(1,new CSeriesForecast(topo.FindInflowSeries(1),1.0),2,10.0));

    CMetricsCollector *pM=RunCascade(&topo,Options);
    EXPECT_FALSE(topo.GetPolicy(0)->UsesPreRelease());
    for (int n=0;n<4;n++){
        EXPECT_FALSE(pM->GetRecord(0,n).pre_release) << "step " << n;
        EXPECT_DOUBLE_EQ(pM->GetRecord(0,n).Qout, 10.0) << "step " << n;
    }
    EXPECT_EQ(pM->GetReservoirMetrics(0).n_pre_release, 0);
    delete pM;
}
