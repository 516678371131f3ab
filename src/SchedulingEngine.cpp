/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------*/
#include "SchedulingEngine.h"

CSchedulingEngine::CSchedulingEngine(){}
CSchedulingEngine::~CSchedulingEngine(){}

//////////////////////////////////////////////////////////////////
/// \brief simulates cascade operation over the full horizon
/// \param pTopo [in/out] initialized cascade topology (no steps completed)
/// \param Options [in] global options
/// \param pMetrics [out] receives all step results; metrics are computed on completion
//
void CSchedulingEngine::Run(CCascadeTopology *pTopo, const optStruct &Options, CMetricsCollector *pMetrics) const
{
  ExitGracefullyIf(pTopo==NULL,   "CSchedulingEngine::Run: NULL cascade",RUNTIME_ERR);
  ExitGracefullyIf(pMetrics==NULL,"CSchedulingEngine::Run: NULL metrics collector",RUNTIME_ERR);
  ExitGracefullyIf(!pTopo->IsInitialized(),"CSchedulingEngine::Run: cascade must be initialized prior to simulation",RUNTIME_ERR);

  int nRes=pTopo->GetNumReservoirs();
  for (int p=0;p<nRes;p++){
    ExitGracefullyIf(pTopo->GetReservoir(p)->GetNumCompletedSteps()!=0,
      "CSchedulingEngine::Run: cascade must be re-initialized before each simulation",RUNTIME_ERR);
  }

  pMetrics->Initialize(pTopo,Options);

  bool *aWarned=new bool [nRes];
  for (int p=0;p<nRes;p++){aWarned[p]=false;}

  clock_t t1=clock();
  for (int n=0;n<Options.num_steps;n++)
  {
    SolveTimeStep(pTopo,Options,n,pMetrics,aWarned);

    if ((Options.noisy) && (!Options.silent)){
      cout<<"  step "<<n+1<<" of "<<Options.num_steps<<" completed ("<<float(clock()-t1)/CLOCKS_PER_SEC<<" s)"<<endl;
    }
  }
  delete [] aWarned;

  pMetrics->Compute();
}

//////////////////////////////////////////////////////////////////
/// \brief advances all reservoirs through time step n in evaluation order
/// \param aWarned [in/out] true if forecast failure of reservoir p has already been reported [size: nReservoirs]
//
void CSchedulingEngine::SolveTimeStep(CCascadeTopology *pTopo, const optStruct &Options, const int n,
                                      CMetricsCollector *pMetrics, bool *aWarned) const
{
  for (int i=0;i<pTopo->GetNumReservoirs();i++)
  {
    int p=pTopo->GetOrderedResIndex(i);
    step_record rec=UpdateReservoir(pTopo,Options,p,n);

    if ((rec.flags & DIAG_FORECAST_UNAVAILABLE) && (!aWarned[p])){
      WriteWarning("Forecast unavailable for reservoir "+pTopo->GetReservoir(p)->GetName()+" at step "+to_string(n)+
                   "; regular operating rule applied (further failures counted in metrics)",Options.noisy);
      aWarned[p]=true;
    }
    pMetrics->Ingest(p,n,rec);
  }
}

//////////////////////////////////////////////////////////////////
/// \brief computes inflow, release decision and mass balance of reservoir p over step n
/// \returns step record of reservoir p
//
step_record CSchedulingEngine::UpdateReservoir(CCascadeTopology *pTopo, const optStruct &Options, const int p, const int n) const
{
  CReservoir             *pRes=pTopo->GetReservoir(p);
  const COperatingPolicy *pPol=pTopo->GetPolicy(p);
  CForecastAdapter       *pFA =pTopo->GetForecastAdapter(p);

  step_record rec;
  rec.Qin=pTopo->GetExternalInflow(p,n)+pTopo->GetRoutedInflow(p,n);

  const double *aForecast=NULL;
  int           nForecast=0;
  int           flags    =DIAG_NONE;
  if (pFA!=NULL)
  {
    aForecast=pFA->GetForecast(n);
    if (aForecast==NULL){flags|=DIAG_FORECAST_UNAVAILABLE;}
    else                {nForecast=pFA->GetLeadTime();}
  }

  release_decision dec=pPol->Decide(pRes,rec.Qin,aForecast,nForecast,n);

  int mb_flags;
  rec.Qrequested =dec.Q;
  rec.Qout       =pRes->ApplyMassBalance(rec.Qin,dec.Q,Options.timestep,n,mb_flags);
  rec.storage    =pRes->GetStorage();
  rec.stage      =pRes->GetStage();
  rec.zone       =pRes->GetCurrentZone();
  rec.pre_release=dec.pre_release;
  rec.flags      =flags | mb_flags;
  return rec;
}

//////////////////////////////////////////////////////////////////
/// \brief writes metrics summary to screen and reports runtime conditions once per reservoir
//
void CSchedulingEngine::SummarizeToScreen(const CMetricsCollector *pMetrics, const optStruct &Options) const
{
  const system_metrics &S=pMetrics->GetSystemMetrics();
  for (int p=0;p<pMetrics->GetNumReservoirs();p++)
  {
    const res_metrics &M=pMetrics->GetReservoirMetrics(p);
    if (M.n_spill>0){
      WriteWarning("Reservoir "+M.name+": forced spill in "+to_string(M.n_spill)+" time step(s)",Options.noisy);}
    if (M.n_capped>0){
      WriteWarning("Reservoir "+M.name+": release limited by available storage in "+to_string(M.n_capped)+" time step(s)",Options.noisy);}
    if (M.n_zone_jumps>0){
      WriteWarning("Reservoir "+M.name+": more than one zone boundary crossed in a single step "+to_string(M.n_zone_jumps)+" time(s)",Options.noisy);}
    if (!M.MB_ok){
      WriteWarning("Reservoir "+M.name+": water balance residual of "+to_string(M.MB_residual)+" m3 exceeds tolerance",true);}
  }
  if (Options.silent){return;}

  cout <<"======================================================"<<endl;
  cout <<"Cascade Summary"<<endl;
  cout <<"  # reservoirs:            "<<S.nReservoirs<<endl;
  cout <<"  # time steps:            "<<S.nSteps<<endl;
  for (int p=0;p<pMetrics->GetNumReservoirs();p++)
  {
    const res_metrics &M=pMetrics->GetReservoirMetrics(p);
    cout<<"  "<<M.name<<" ["<<M.ID<<"]: peak in="<<M.peak_inflow<<" m3/s, peak out="<<M.peak_outflow
        <<" m3/s, peak shaving="<<M.peak_shaving<<", max stage="<<M.max_stage
        <<" m"<<(M.flood_compliant ? "" : " (ABOVE FLOOD LIMIT)")<<endl;
  }
  cout <<"  flood limit compliance:  "<<(S.flood_compliant ? "TRUE" : "FALSE")<<endl;
  cout <<"  outlet peak shaving:     "<<S.outlet_peak_shaving<<endl;
  cout <<"  max water balance error: "<<S.max_abs_MB_residual<<" m3"<<endl;
}
