/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------*/
#include <gtest/gtest.h>
#include "TestHelpers.h"
#include "RoutingLink.h"
#include "MetricsCollector.h"

class MetricsCollectorTest : public ::testing::Test {
protected:
    CCascadeTopology  *topo;
    CMetricsCollector  metrics;
    optStruct          Options;

    void SetUp() override {
        Options=TestOptions(3,1.0);
        topo=new CCascadeTopology();
        CReservoir *pRes=UnitReservoir("Upper",1,100.0,50.0);
        pRes->SetZoneBoundaries(1.0,15.0,30.0);
        topo->AddReservoir(pRes);
        topo->AddReservoir(UnitReservoir("Lower",2,100.0,50.0));
        topo->AddRoutingLink(new CRoutingLink(1,2,1,0.0));
        topo->Initialize(Options);
        metrics.Initialize(topo,Options);
    }
    void TearDown() override {
        delete topo;
    }

    void IngestUpper(const double *Qin, const double *Qout, const double *S)
    {
        for (int n=0;n<3;n++){
            step_record R;
            R.Qin=Qin[n]; R.Qrequested=Qout[n]; R.Qout=Qout[n];
            R.storage=S[n]; R.stage=S[n];
            metrics.Ingest(0,n,R);
        }
    }
    void IngestQuietLower()
    {
        for (int n=0;n<3;n++){metrics.Ingest(1,n,step_record());}
    }
};

TEST_F(MetricsCollectorTest, PeakShavingFloodComplianceAndBalance)
{
    double Qin [3]={10.0,40.0,20.0};
    double Qout[3]={10.0,20.0,20.0};
    double S   [3]={ 0.0,20.0,20.0};
    IngestUpper(Qin,Qout,S);
    IngestQuietLower();
    metrics.Compute();

    const res_metrics &M=metrics.GetReservoirMetrics(0);
    EXPECT_DOUBLE_EQ(M.peak_inflow, 40.0);
    EXPECT_DOUBLE_EQ(M.peak_outflow,20.0);
    EXPECT_DOUBLE_EQ(M.peak_shaving, 0.5);
    EXPECT_DOUBLE_EQ(M.max_stage,   20.0);
    EXPECT_DOUBLE_EQ(M.flood_limit_stage,15.0);
    EXPECT_FALSE(M.flood_compliant);
    EXPECT_DOUBLE_EQ(M.inflow_volume, 70.0);
    EXPECT_DOUBLE_EQ(M.outflow_volume,50.0);
    EXPECT_NEAR(M.MB_residual,0.0,1e-12);
    EXPECT_TRUE(M.MB_ok);

    const system_metrics &Sys=metrics.GetSystemMetrics();
    EXPECT_EQ(Sys.nReservoirs,2);
    EXPECT_EQ(Sys.nSteps,3);
    EXPECT_FALSE(Sys.flood_compliant);
    EXPECT_TRUE(Sys.mass_balance_ok);
}

TEST_F(MetricsCollectorTest, InconsistentRecordFailsWaterBalance)
{
    double Qin [3]={10.0,40.0,20.0};
    double Qout[3]={10.0,20.0,20.0};
    double S   [3]={ 0.0,25.0,25.0}; //5 m3 appears from nowhere
    IngestUpper(Qin,Qout,S);
    IngestQuietLower();
    metrics.Compute();

    EXPECT_NEAR(metrics.GetReservoirMetrics(0).MB_residual,-5.0,1e-12);
    EXPECT_FALSE(metrics.GetReservoirMetrics(0).MB_ok);
    EXPECT_FALSE(metrics.GetSystemMetrics().mass_balance_ok);
    EXPECT_DOUBLE_EQ(metrics.GetSystemMetrics().max_abs_MB_residual,5.0);
}

TEST_F(MetricsCollectorTest, ZeroInflowGivesZeroPeakShaving)
{
    IngestQuietLower();
    double zero[3]={0.0,0.0,0.0};
    IngestUpper(zero,zero,zero);
    metrics.Compute();
    EXPECT_DOUBLE_EQ(metrics.GetReservoirMetrics(0).peak_shaving,0.0);
    EXPECT_DOUBLE_EQ(metrics.GetSystemMetrics().outlet_peak_shaving,0.0);
    EXPECT_TRUE(metrics.GetReservoirMetrics(1).flood_compliant);
}

TEST_F(MetricsCollectorTest, OutletPeaksUseOnlyTerminalReservoirs)
{
    double Qin [3]={10.0,40.0,20.0};
    double Qout[3]={10.0,20.0,20.0};
    double S   [3]={ 0.0,20.0,20.0};
    IngestUpper(Qin,Qout,S);
    for (int n=0;n<3;n++){
        step_record R;
        R.Qin=(n==0) ? 0.0 : Qout[n-1];
        R.Qout=R.Qrequested=0.5*R.Qin;
        R.storage=R.stage=(n==0) ? 0.0 : 5.0*n;
        metrics.Ingest(1,n,R);
    }
    metrics.Compute();
    EXPECT_DOUBLE_EQ(metrics.GetSystemMetrics().outlet_peak_inflow, 20.0);
    EXPECT_DOUBLE_EQ(metrics.GetSystemMetrics().outlet_peak_outflow,10.0);
    EXPECT_DOUBLE_EQ(metrics.GetSystemMetrics().outlet_peak_shaving, 0.5);
}

TEST_F(MetricsCollectorTest, SpillAndFlagCounts)
{
    for (int n=0;n<3;n++){
        step_record R;
        R.Qin=10.0; R.Qrequested=4.0; R.Qout=10.0;
        R.flags=DIAG_FORCED_SPILL | ((n==1) ? DIAG_ZONE_JUMP : DIAG_NONE);
        R.pre_release=(n==2);
        metrics.Ingest(0,n,R);
    }
    IngestQuietLower();
    metrics.Compute();
    const res_metrics &M=metrics.GetReservoirMetrics(0);
    EXPECT_EQ(M.n_spill,3);
    EXPECT_DOUBLE_EQ(M.spill_volume,18.0);
    EXPECT_EQ(M.n_zone_jumps,1);
    EXPECT_EQ(M.n_pre_release,1);
    EXPECT_EQ(metrics.GetSystemMetrics().n_spill,3);
}

TEST_F(MetricsCollectorTest, PartialRunReportsCompletedStepsOnly)
{
    step_record R;
    R.Qin=R.Qout=R.Qrequested=3.0;
    metrics.Ingest(0,0,R);
    metrics.Ingest(1,0,R);
    metrics.Ingest(0,1,R);
    EXPECT_EQ(metrics.GetNumCompleted(),1);
    metrics.Compute();
    EXPECT_EQ(metrics.GetSystemMetrics().nSteps,1);
    EXPECT_DOUBLE_EQ(metrics.GetReservoirMetrics(0).inflow_volume,3.0);
}

TEST_F(MetricsCollectorTest, MetricsBeforeComputeIsRuntimeError)
{
    EXPECT_EXIT(metrics.GetSystemMetrics(), ::testing::ExitedWithCode(RUNTIME_ERR), "metrics not computed");
}

TEST_F(MetricsCollectorTest, OutOfOrderIngestIsRuntimeError)
{
    EXPECT_EXIT(metrics.Ingest(0,1,step_record()), ::testing::ExitedWithCode(RUNTIME_ERR), "sequentially");
}

TEST(MetricsInitialStateTest, StartingAboveFloodLimitIsNotCompliant)
{
    optStruct Options=TestOptions(2,1.0);
    CCascadeTopology topo;
    CReservoir *pRes=UnitReservoir("Full",1,100.0,50.0,20.0);
    pRes->SetZoneBoundaries(1.0,15.0,30.0);
    topo.AddReservoir(pRes);
    topo.Initialize(Options);

    CMetricsCollector M;
    M.Initialize(&topo,Options);
    for (int n=0;n<2;n++){
        step_record R;
        R.Qin=0.0; R.Qout=R.Qrequested=5.0;
        R.storage=R.stage=20.0-5.0*(n+1); //drops below flood limit in the first step
        M.Ingest(0,n,R);
    }
    M.Compute();
    EXPECT_DOUBLE_EQ(M.GetReservoirMetrics(0).max_stage,20.0);
    EXPECT_DOUBLE_EQ(M.GetReservoirMetrics(0).min_stage,10.0);
    EXPECT_FALSE(M.GetReservoirMetrics(0).flood_compliant);
    EXPECT_FALSE(M.GetSystemMetrics().flood_compliant);
    EXPECT_TRUE(M.GetReservoirMetrics(0).MB_ok);
}
