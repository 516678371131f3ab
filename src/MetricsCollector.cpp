/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------*/
#include "MetricsCollector.h"
#include "CascadeTopology.h"

CMetricsCollector::CMetricsCollector()
{
  _nReservoirs =0;
  _nSteps      =0;
  _tstep       =SEC_PER_DAY;
  _MB_tolerance=DEFAULT_MB_TOLERANCE;
  _aNames      =NULL;
  _aIDs        =NULL;
  _aInitStorage=NULL;
  _aInitStage  =NULL;
  _aFloodLimit =NULL;
  _aIsOutlet   =NULL;
  _aRecords    =NULL;
  _aNumRecorded=NULL;
  _aMetrics    =NULL;
  _computed    =false;
}
CMetricsCollector::~CMetricsCollector()
{
  DeleteArrays();
}
void CMetricsCollector::DeleteArrays()
{
  if (_aRecords!=NULL){
    for (int p=0;p<_nReservoirs;p++){delete [] _aRecords[p];}
  }
  delete [] _aRecords;     _aRecords    =NULL;
  delete [] _aNumRecorded; _aNumRecorded=NULL;
  delete [] _aNames;       _aNames      =NULL;
  delete [] _aIDs;         _aIDs        =NULL;
  delete [] _aInitStorage; _aInitStorage=NULL;
  delete [] _aInitStage;   _aInitStage  =NULL;
  delete [] _aFloodLimit;  _aFloodLimit =NULL;
  delete [] _aIsOutlet;    _aIsOutlet   =NULL;
  delete [] _aMetrics;     _aMetrics    =NULL;
  _nReservoirs=0;
}

//////////////////////////////////////////////////////////////////
/// \brief allocates result storage for an initialized cascade
/// \param pTopo [in] initialized cascade topology
/// \param Options [in] global options
//
void CMetricsCollector::Initialize(const CCascadeTopology *pTopo, const optStruct &Options)
{
  ExitGracefullyIf(!pTopo->IsInitialized(),"CMetricsCollector::Initialize: cascade not initialized",RUNTIME_ERR);
  DeleteArrays();

  _nReservoirs =pTopo->GetNumReservoirs();
  _nSteps      =Options.num_steps;
  _tstep       =Options.timestep;
  _MB_tolerance=Options.MB_tolerance;

  _aNames      =new string [_nReservoirs];
  _aIDs        =new long   [_nReservoirs];
  _aInitStorage=new double [_nReservoirs];
  _aInitStage  =new double [_nReservoirs];
  _aFloodLimit =new double [_nReservoirs];
  _aIsOutlet   =new bool   [_nReservoirs];
  _aNumRecorded=new int    [_nReservoirs];
  _aMetrics    =new res_metrics [_nReservoirs];
  _aRecords    =new step_record *[_nReservoirs];
  for (int p=0;p<_nReservoirs;p++)
  {
    const CReservoir *pRes=pTopo->GetReservoir(p);
    _aNames      [p]=pRes->GetName();
    _aIDs        [p]=pRes->GetID();
    _aInitStorage[p]=pRes->GetInitialStorage();
    _aInitStage  [p]=pRes->GetStageFromStorage(pRes->GetInitialStorage());
    _aFloodLimit [p]=pRes->GetFloodLimitStage();
    _aIsOutlet   [p]=pTopo->IsOutlet(p);
    _aNumRecorded[p]=0;
    _aRecords    [p]=new step_record [max(_nSteps,1)];
  }
  _computed=false;
}

//////////////////////////////////////////////////////////////////
/// \brief stores step result of reservoir p
/// \remark steps of each reservoir must be ingested in order
//
void CMetricsCollector::Ingest(const int p, const int n, const step_record &rec)
{
  ExitGracefullyIf((p<0) || (p>=_nReservoirs),"CMetricsCollector::Ingest: bad reservoir index",RUNTIME_ERR);
  ExitGracefullyIf((n!=_aNumRecorded[p]) || (n>=_nSteps),"CMetricsCollector::Ingest: steps must be ingested sequentially",RUNTIME_ERR);
  _aRecords[p][n]=rec;
  _aNumRecorded[p]++;
  _computed=false;
}

int    CMetricsCollector::GetNumReservoirs() const {return _nReservoirs;}
int    CMetricsCollector::GetNumSteps     () const {return _nSteps;}
string CMetricsCollector::GetReservoirName(const int p) const {return _aNames[p];}
long   CMetricsCollector::GetReservoirID  (const int p) const {return _aIDs[p];}

//////////////////////////////////////////////////////////////////
/// \brief returns number of steps completed by every reservoir
//
int CMetricsCollector::GetNumCompleted() const
{
  if (_nReservoirs==0){return 0;}
  int nmin=_aNumRecorded[0];
  for (int p=1;p<_nReservoirs;p++){lowerswap(nmin,_aNumRecorded[p]);}
  return nmin;
}
const step_record &CMetricsCollector::GetRecord(const int p, const int n) const
{
  ExitGracefullyIf((p<0) || (p>=_nReservoirs),"CMetricsCollector::GetRecord: bad reservoir index",RUNTIME_ERR);
  ExitGracefullyIf((n<0) || (n>=_aNumRecorded[p]),"CMetricsCollector::GetRecord: step not recorded",RUNTIME_ERR);
  return _aRecords[p][n];
}
const res_metrics &CMetricsCollector::GetReservoirMetrics(const int p) const
{
  ExitGracefullyIf(!_computed,"CMetricsCollector::GetReservoirMetrics: metrics not computed",RUNTIME_ERR);
  ExitGracefullyIf((p<0) || (p>=_nReservoirs),"CMetricsCollector::GetReservoirMetrics: bad reservoir index",RUNTIME_ERR);
  return _aMetrics[p];
}
const system_metrics &CMetricsCollector::GetSystemMetrics() const
{
  ExitGracefullyIf(!_computed,"CMetricsCollector::GetSystemMetrics: metrics not computed",RUNTIME_ERR);
  return _sysMetrics;
}

//////////////////////////////////////////////////////////////////
/// \brief computes reservoir and system metrics over all completed steps
/// \details water balance residual R=sum((Qin-Qout)*dt)-(S_final-S_initial) must satisfy
///  |R| <= tol*max(1,Vin+Vout+S_initial), where Vin,Vout are cumulative volumes
//
void CMetricsCollector::Compute()
{
  int p,n;
  int N=GetNumCompleted();

  _sysMetrics.nReservoirs        =_nReservoirs;
  _sysMetrics.nSteps             =N;
  _sysMetrics.flood_compliant    =true;
  _sysMetrics.max_abs_MB_residual=0.0;
  _sysMetrics.mass_balance_ok    =true;
  _sysMetrics.n_spill            =0;
  _sysMetrics.n_forecast_fail    =0;

  for (p=0;p<_nReservoirs;p++)
  {
    res_metrics &M=_aMetrics[p];
    M.name             =_aNames[p];
    M.ID               =_aIDs[p];
    M.peak_inflow      =0.0;
    M.peak_outflow     =0.0;
    M.max_stage        =_aInitStage[p]; //starting above flood limit is a violation
    M.min_stage        = ALMOST_INF;
    M.flood_limit_stage=_aFloodLimit[p];
    M.spill_volume     =0.0;
    M.n_spill=M.n_capped=M.n_pre_release=M.n_forecast_fail=M.n_zone_jumps=M.n_flood_exceed=0;
    M.initial_storage  =_aInitStorage[p];
    M.inflow_volume    =0.0;
    M.outflow_volume   =0.0;

    double sum_stage=0.0;
    for (n=0;n<N;n++)
    {
      const step_record &R=_aRecords[p][n];
      upperswap(M.peak_inflow ,R.Qin);
      upperswap(M.peak_outflow,R.Qout);
      upperswap(M.max_stage   ,R.stage);
      lowerswap(M.min_stage   ,R.stage);
      sum_stage       +=R.stage;
      M.inflow_volume +=R.Qin *_tstep;
      M.outflow_volume+=R.Qout*_tstep;

      if (R.flags & DIAG_FORCED_SPILL){
        M.n_spill++;
        M.spill_volume+=max(R.Qout-R.Qrequested,0.0)*_tstep;
      }
      if (R.flags & DIAG_RELEASE_CAPPED      ){M.n_capped++;}
      if (R.flags & DIAG_FORECAST_UNAVAILABLE){M.n_forecast_fail++;}
      if (R.flags & DIAG_ZONE_JUMP           ){M.n_zone_jumps++;}
      if (R.flags & DIAG_FLOOD_LIMIT_EXCEEDED){M.n_flood_exceed++;}
      if (R.pre_release                      ){M.n_pre_release++;}
    }
    if (N>0){
      M.mean_inflow  =M.inflow_volume /_tstep/N;
      M.mean_outflow =M.outflow_volume/_tstep/N;
      M.mean_stage   =sum_stage/N;
      M.final_storage=_aRecords[p][N-1].storage;
    }
    else {
      M.mean_inflow=M.mean_outflow=0.0;
      M.min_stage=M.mean_stage=M.max_stage;
      M.final_storage=M.initial_storage;
    }

    if (M.peak_inflow>REAL_SMALL){M.peak_shaving=(M.peak_inflow-M.peak_outflow)/M.peak_inflow;}
    else                         {M.peak_shaving=0.0;}

    M.flood_compliant=(M.max_stage<=M.flood_limit_stage+REAL_SMALL);

    M.MB_residual=(M.inflow_volume-M.outflow_volume)-(M.final_storage-M.initial_storage);
    double scale=max(1.0,M.inflow_volume+M.outflow_volume+M.initial_storage);
    M.MB_ok=(fabs(M.MB_residual)<=_MB_tolerance*scale);

    if (!M.flood_compliant){_sysMetrics.flood_compliant=false;}
    if (!M.MB_ok          ){_sysMetrics.mass_balance_ok=false;}
    upperswap(_sysMetrics.max_abs_MB_residual,fabs(M.MB_residual));
    _sysMetrics.n_spill        +=M.n_spill;
    _sysMetrics.n_forecast_fail+=M.n_forecast_fail;
  }

  //outlet peaks
  //----------------------------------------------------------------------
  _sysMetrics.outlet_peak_inflow =0.0;
  _sysMetrics.outlet_peak_outflow=0.0;
  for (n=0;n<N;n++)
  {
    double Qin(0.0),Qout(0.0);
    for (p=0;p<_nReservoirs;p++){
      if (_aIsOutlet[p]){
        Qin +=_aRecords[p][n].Qin;
        Qout+=_aRecords[p][n].Qout;
      }
    }
    upperswap(_sysMetrics.outlet_peak_inflow ,Qin);
    upperswap(_sysMetrics.outlet_peak_outflow,Qout);
  }
  if (_sysMetrics.outlet_peak_inflow>REAL_SMALL){
    _sysMetrics.outlet_peak_shaving=(_sysMetrics.outlet_peak_inflow-_sysMetrics.outlet_peak_outflow)/_sysMetrics.outlet_peak_inflow;
  }
  else{
    _sysMetrics.outlet_peak_shaving=0.0;
  }
  _computed=true;
}
