/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------*/
#include <gtest/gtest.h>
#include "TestHelpers.h"
#include "StandardOutput.h"

namespace {

vector<string> SplitCSV(const string &line)
{
    vector<string> out;
    stringstream ss(line);
    string item;
    while (getline(ss,item,',')){out.push_back(item);}
    if ((!line.empty()) && (line[line.length()-1]==',')){out.push_back("");}
    return out;
}

vector<string> ReadLines(const string &filename)
{
    vector<string> lines;
    ifstream IN(filename.c_str());
    string line;
    while (getline(IN,line)){lines.push_back(line);}
    return lines;
}

} // namespace

// single reservoir filling through its flood and surcharge zones, spilling in the last step
class StandardOutputTest : public ::testing::Test {
protected:
    CCascadeTopology  *topo;
    CMetricsCollector *pMetrics;
    optStruct          Options;

    void SetUp() override {
        Options=TestOptions(3,1.0);
        Options.output_dir        ="output_test/";
        Options.run_name          ="otest";
        Options.write_reservoir_ts=true;
        Options.write_metrics     =true;
        PrepareOutputdirectory(Options);

        topo=new CCascadeTopology();
        CReservoir *pRes=UnitReservoir("Res",1,100.0,30.0,50.0);
        pRes->SetZoneBoundaries(10.0,60.0,90.0);
        topo->AddReservoir(pRes);
        topo->AddInflowSeries(ConstantSeries(1,50.0,3));
        SetUniformRule(topo,1,RULE_INFLOW_CAPPED,30.0);
        pMetrics=RunCascade(topo,Options);
        WriteMajorOutput(pMetrics,Options);
    }
    void TearDown() override {
        delete pMetrics;
        delete topo;
        g_output_directory="";
    }
};

TEST_F(StandardOutputTest, FilenamesCarryDirectoryAndRunName)
{
    EXPECT_EQ(FilenamePrepare("ReservoirMetrics.csv",Options),"output_test/otest_ReservoirMetrics.csv");
    optStruct Plain;
    EXPECT_EQ(FilenamePrepare("ReservoirMetrics.csv",Plain),"ReservoirMetrics.csv");
}

TEST_F(StandardOutputTest, TimeSeriesHasOneRowPerStep)
{
    vector<string> lines=ReadLines("output_test/otest_ReservoirTimeSeries.csv");
    ASSERT_EQ(lines.size(),4u);

    vector<string> hdr=SplitCSV(lines[0]);
    ASSERT_EQ(hdr.size(),10u);
    EXPECT_EQ(hdr[0],"step");
    EXPECT_EQ(hdr[1],"time [s]");
    EXPECT_EQ(hdr[2],"Res inflow [m3/s]");
    EXPECT_EQ(hdr[4],"Res outflow [m3/s]");
    EXPECT_EQ(hdr[7],"Res zone");
    EXPECT_EQ(hdr[9],"Res diagnostics");

    vector<string> r0=SplitCSV(lines[1]);
    ASSERT_EQ(r0.size(),10u);
    EXPECT_EQ(r0[0],"0");
    EXPECT_DOUBLE_EQ(atof(r0[1].c_str()),1.0);
    EXPECT_DOUBLE_EQ(atof(r0[2].c_str()),50.0);
    EXPECT_DOUBLE_EQ(atof(r0[4].c_str()),30.0);
    EXPECT_DOUBLE_EQ(atof(r0[5].c_str()),70.0);
    EXPECT_EQ(r0[7],"FLOOD_CONTROL");
    EXPECT_EQ(r0[8],"0");
    EXPECT_EQ(r0[9],"ABOVE_FLOOD_LIMIT");

    vector<string> r2=SplitCSV(lines[3]);
    ASSERT_EQ(r2.size(),10u);
    EXPECT_DOUBLE_EQ(atof(r2[3].c_str()),30.0); //requested
    EXPECT_DOUBLE_EQ(atof(r2[4].c_str()),40.0); //actual, including spill
    EXPECT_DOUBLE_EQ(atof(r2[5].c_str()),100.0);
    EXPECT_EQ(r2[7],"SURCHARGE");
    EXPECT_EQ(r2[9],"SPILL|ABOVE_FLOOD_LIMIT");
}

TEST_F(StandardOutputTest, MetricsHasReservoirAndSystemRows)
{
    vector<string> lines=ReadLines("output_test/otest_ReservoirMetrics.csv");
    ASSERT_EQ(lines.size(),3u);

    vector<string> hdr=SplitCSV(lines[0]);
    ASSERT_EQ(hdr.size(),25u);
    EXPECT_EQ(hdr[0],"reservoir");
    EXPECT_EQ(hdr[6],"peak shaving ratio");
    EXPECT_EQ(hdr[11],"flood compliant");
    EXPECT_EQ(hdr[24],"MB ok");

    vector<string> res=SplitCSV(lines[1]);
    ASSERT_EQ(res.size(),25u);
    EXPECT_EQ(res[0],"Res");
    EXPECT_EQ(res[1],"1");
    EXPECT_DOUBLE_EQ(atof(res[2].c_str()),50.0);
    EXPECT_DOUBLE_EQ(atof(res[3].c_str()),40.0);
    EXPECT_NEAR(atof(res[6].c_str()),0.2,1e-9);
    EXPECT_DOUBLE_EQ(atof(res[7].c_str()),100.0);
    EXPECT_DOUBLE_EQ(atof(res[10].c_str()),60.0);
    EXPECT_EQ(res[11],"FALSE");
    EXPECT_DOUBLE_EQ(atof(res[12].c_str()),10.0); //spill volume
    EXPECT_EQ(res[13],"1");
    EXPECT_EQ(res[24],"TRUE");

    vector<string> sys=SplitCSV(lines[2]);
    ASSERT_EQ(sys.size(),25u);
    EXPECT_EQ(sys[0],"SYSTEM");
    EXPECT_DOUBLE_EQ(atof(sys[2].c_str()),50.0);
    EXPECT_EQ(sys[11],"FALSE");
    EXPECT_EQ(sys[13],"1");
    EXPECT_EQ(sys[24],"TRUE");
}
