/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------*/
#include "Forecast.h"
#include <chrono>

/*****************************************************************
   CSeriesForecast
*****************************************************************/
CSeriesForecast::CSeriesForecast(const CTimeSeries *pSeries, const double bias)
{
  ExitGracefullyIf(pSeries==NULL,"CSeriesForecast constructor: NULL time series",RUNTIME_ERR);
  _pSeries=pSeries;
  _bias   =bias;
}
CSeriesForecast::~CSeriesForecast(){}

string CSeriesForecast::GetName() const {return "SERIES["+_pSeries->GetName()+"]";}

//////////////////////////////////////////////////////////////////
/// \brief returns biased series values for steps n..n+lead-1
/// \returns false if series does not cover the forecast window or contains blanks
//
bool CSeriesForecast::Forecast(const int n, const int lead, double *aQ) const
{
  if (_pSeries->HasBlanks(n,n+lead)){return false;}
  for (int i=0;i<lead;i++){
    aQ[i]=_bias*_pSeries->GetValue(n+i);
  }
  return true;
}

/*****************************************************************
   CRainfallRunoffForecast
*****************************************************************/
CRainfallRunoffForecast::CRainfallRunoffForecast(const CTimeSeries *pRain, const double coef, const double area_km2)
{
  ExitGracefullyIf(pRain==NULL,"CRainfallRunoffForecast constructor: NULL rainfall series",RUNTIME_ERR);
  _pRain      =pRain;
  _runoff_coef=coef;
  _area       =area_km2;
  _tstep      =SEC_PER_DAY;
}
CRainfallRunoffForecast::~CRainfallRunoffForecast(){}

string CRainfallRunoffForecast::GetName() const {return "RAINFALL_RUNOFF["+_pRain->GetName()+"]";}

void CRainfallRunoffForecast::Initialize(const optStruct &Options)
{
  _tstep=Options.timestep;
}

//////////////////////////////////////////////////////////////////
/// \brief converts forecast rainfall [mm/step] to inflow [m3/s]
/// \returns false if rainfall forcing is too short or blank within the forecast window
//
bool CRainfallRunoffForecast::Forecast(const int n, const int lead, double *aQ) const
{
  if (_pRain->HasBlanks(n,n+lead)){return false;}
  for (int i=0;i<lead;i++){
    aQ[i]=_runoff_coef*(_pRain->GetValue(n+i)/MM_PER_METER)*(_area*M2_PER_KM2)/_tstep;
  }
  return true;
}

/*****************************************************************
   CForecastAdapter
*****************************************************************/
//////////////////////////////////////////////////////////////////
/// \brief adapter constructor
/// \param res_ID [in] reservoir receiving forecast
/// \param pModel [in] forecast model; adapter takes ownership
/// \param lead [in] lead time [time steps]
/// \param timeout [in] wall-clock timeout [s]; <=0 uses Options.forecast_timeout
//
CForecastAdapter::CForecastAdapter(const long res_ID, CForecastModelABC *pModel, const int lead, const double timeout)
{
  _res_ID   =res_ID;
  _pModel   =pModel;
  _lead     =lead;
  _timeout  =timeout;
  _aQ       =NULL;
  _nFailures=0;
}
CForecastAdapter::~CForecastAdapter()
{
  delete _pModel;  _pModel=NULL;
  delete [] _aQ;   _aQ    =NULL;
}

long   CForecastAdapter::GetReservoirID() const {return _res_ID;}
int    CForecastAdapter::GetLeadTime   () const {return _lead;}
double CForecastAdapter::GetTimeout    () const {return _timeout;}
int    CForecastAdapter::GetNumFailures() const {return _nFailures;}
string CForecastAdapter::GetModelName  () const {return (_pModel==NULL) ? "NONE" : _pModel->GetName();}

void CForecastAdapter::CheckConfiguration() const
{
  string bad=" [bad forecast for reservoir ID "+to_string(_res_ID)+"]";
  ExitGracefullyIf(_pModel==NULL,("CForecastAdapter: no forecast model specified"+bad).c_str(),BAD_DATA);
  ExitGracefullyIf(_lead<1,      ("CForecastAdapter: forecast lead time must be at least one time step"+bad).c_str(),BAD_DATA);
}

void CForecastAdapter::Initialize(const optStruct &Options)
{
  if (_timeout<=0.0){_timeout=Options.forecast_timeout;}
  delete [] _aQ;
  _aQ=new double [_lead];
  for (int i=0;i<_lead;i++){_aQ[i]=0.0;}
  _nFailures=0;
  _pModel->Initialize(Options);
}

//////////////////////////////////////////////////////////////////
/// \brief queries forecast model for inflow over steps n..n+lead-1
/// \returns pointer to forecast sequence (size: lead), or NULL if forecast is unavailable
/// \note returned array is overwritten by the next call
//
const double *CForecastAdapter::GetForecast(const int n)
{
  std::chrono::steady_clock::time_point t0=std::chrono::steady_clock::now();
  bool ok=_pModel->Forecast(n,_lead,_aQ);
  double elapsed=std::chrono::duration<double>(std::chrono::steady_clock::now()-t0).count(); //[s], wall clock

  if ((ok) && (elapsed>_timeout)){ok=false;}
  if (ok){
    for (int i=0;i<_lead;i++){
      if ((_aQ[i]!=_aQ[i]) || (_aQ[i]<0.0)){ok=false;break;} //NaN or negative
    }
  }
  if (!ok){_nFailures++;return NULL;}
  return _aQ;
}
