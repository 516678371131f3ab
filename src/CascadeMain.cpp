/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------*/
#include <time.h>
#include "CascadeInclude.h"
#include "CascadeMain.h"
#include "CascadeTopology.h"
#include "SchedulingEngine.h"
#include "MetricsCollector.h"
#include "StandardOutput.h"

static string CascadeBuildDate(__DATE__);

//////////////////////////////////////////////////////////////////
//
/// \brief Primary Cascade driver routine
//
/// \param argc [in] number of arguments to executable
/// \param argv[] [in] executable arguments; Cascade.exe [base_filename] [-o output_dir] [-r runname] [-s] [-n]
/// \return Success of main method
//
int main(int argc, char* argv[])
{
  clock_t     t0, t1;          //computational time markers
  optStruct   Options;

  Options.version=__CASCADE_VERSION__;
#ifdef _CASCADE_NETCDF_
  Options.version+=" w/ netCDF";
#endif

  ProcessExecutableArguments(argc,argv,Options);
  PrepareOutputdirectory(Options);

  if (!Options.silent){
    int year = s_to_i(CascadeBuildDate.substr(CascadeBuildDate.length()-4,4).c_str());
    cout <<"============================================================"<<endl;
    cout <<"                        CASCADE                             "<<endl;
    cout <<"        a multi-reservoir cascade operation engine          "<<endl;
    cout <<"    Copyright 2025-"<<year<<", the Cascade Development Team "<<endl;
    cout <<"                    Version "<<Options.version               <<endl;
    cout <<"                BuildDate "<<CascadeBuildDate                <<endl;
    cout <<"============================================================"<<endl;
  }

  ofstream WARNINGS;
  WARNINGS.open((Options.output_dir+"Cascade_errors.txt").c_str());
  if (WARNINGS.fail()){
    ExitGracefully("Main::Unable to open Cascade_errors.txt. Bad output directory specified?",CASCADE_OPEN_ERR);
  }
  WARNINGS.close();

  t0=clock();

  //Read input file, create cascade, set options
  CCascadeTopology *pTopo=NULL;
  if (!ParseInputFiles(pTopo, Options)){
    ExitGracefully("Main::Unable to read input file(s)",BAD_DATA);}

  CheckForErrorWarnings(true,Options);

  if (!Options.silent){
    cout <<"======================================================"<<endl;
    cout <<"Initializing Cascade..."<<endl;
  }
  pTopo->Initialize(Options);

  CheckForErrorWarnings(false,Options);

  if (!Options.silent){
    cout <<"  "<<pTopo->GetNumReservoirs()<<" reservoirs, "<<pTopo->GetNumLinks()<<" routing links, "
         <<pTopo->GetNumForecasts()<<" forecasts, maximum dependency depth "<<pTopo->GetMaxDepth()<<endl;
    cout <<endl<<"======================================================"<<endl;
    cout <<"Simulation Start..."<<endl;
  }

  //Simulate cascade operation over horizon----------------------------
  t1=clock();
  CMetricsCollector  *pMetrics=new CMetricsCollector();
  CSchedulingEngine   engine;

  engine.Run              (pTopo,Options,pMetrics);
  engine.SummarizeToScreen(pMetrics,Options);

  //Finished Solving----------------------------------------------------
  WriteMajorOutput(pMetrics,Options);

  if (!Options.silent)
  {
    cout <<"======================================================"<<endl;
    cout <<"...Cascade Simulation Complete: "<<Options.run_name<<endl;
    cout <<"    Parsing & initialization: "<< float(t1     -t0)/CLOCKS_PER_SEC << " seconds elapsed . "<<endl;
    cout <<"                  Simulation: "<< float(clock()-t1)/CLOCKS_PER_SEC << " seconds elapsed . "<<endl;
    if (Options.output_dir!=""){
      cout <<"  Output written to "        << Options.output_dir                                       <<endl;
    }
    cout <<"======================================================"<<endl;
  }

  delete pMetrics;
  delete pTopo;

  ExitGracefully("Successful Simulation",SIMULATION_DONE);
  return 0;
}

//////////////////////////////////////////////////////////////////
/// \param argc [in] number of arguments to executable
/// \param argv[] [in] executable arguments; Cascade.exe [filebase] [-o output_dir] [-r runname] [-s] [-n] [-v]
/// \details initializes input file and output directory
/// \details filebase has no extension; .csc is appended
/// \param Options [out] Global options
//
void ProcessExecutableArguments(int argc, char* argv[], optStruct &Options)
{
  int i=1;
  string word,argument;
  bool version_announce=false;
  int mode=0;
  argument="";
  //initialization:
  Options.run_name    ="";
  Options.csc_filename="";
  Options.output_dir  ="";
  Options.silent=false;
  Options.noisy =false;

  //Parse argument list
  while (i<=argc)
  {
    if (i!=argc){
      word=string(argv[i]);
    }
    if ((word=="-o") || (word=="-r") || (word=="-s") || (word=="-n") || (word=="-v") || (i==argc))
    {
      if      (mode==0){
        Options.csc_filename=argument+".csc";
        argument="";
        mode=10;
      }
      else if (mode==1){Options.output_dir=argument; argument="";}
      else if (mode==2){Options.run_name  =argument; argument="";}

      if      (word=="-o"){mode=1; }
      else if (word=="-r"){mode=2; }
      else if (word=="-s"){Options.silent=true; mode=10;}
      else if (word=="-n"){Options.noisy=true;  mode=10;}
      else if (word=="-v"){version_announce=true; mode=10;}
    }
    else{
      if (argument==""){argument+=word;}
      else             {argument+=" "+word;}
    }
    i++;
  }
  if (argc==1){//no arguments
    Options.csc_filename="nomodel.csc";
  }

  // make sure that output dir has trailing '/' if not empty
  if ((Options.output_dir.compare("")!=0) && (Options.output_dir.back()!='/')){ Options.output_dir=Options.output_dir+"/"; }

  if (version_announce){
    cout<<Options.version<<endl;
    ExitGracefully("Version check",SIMULATION_DONE);
  }
}
