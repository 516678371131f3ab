/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------
  Forecast.h
  ------------------------------------------------------------------
  defines inflow forecast models and the adapter used by the
  scheduling engine to query them
  ----------------------------------------------------------------*/
#ifndef FORECAST_H
#define FORECAST_H

#include "CascadeInclude.h"
#include "TimeSeries.h"

///////////////////////////////////////////////////////////////////
/// \brief Abstract base class for inflow forecast models
/// \details Forecast() fills aQ[0..lead-1] with predicted inflow for steps n..n+lead-1 [m3/s]
///  and returns false if a forecast cannot be produced
//
class CForecastModelABC
{
public:/*-------------------------------------------------------*/
  virtual ~CForecastModelABC(){}

  virtual string GetName() const=0;
  virtual bool   Forecast(const int n, const int lead, double *aQ) const=0;
  virtual void   Initialize(const optStruct &Options){}
};

///////////////////////////////////////////////////////////////////
/// \brief forecast by look-ahead over a known inflow series, optionally biased
//
class CSeriesForecast : public CForecastModelABC
{
private:/*------------------------------------------------------*/
  const CTimeSeries *_pSeries;  ///< series sampled for forecast (not owned)
  double             _bias;     ///< multiplicative bias applied to series values [-]

public:/*-------------------------------------------------------*/
  CSeriesForecast(const CTimeSeries *pSeries, const double bias);
  ~CSeriesForecast();

  string GetName() const;
  bool   Forecast(const int n, const int lead, double *aQ) const;
};

///////////////////////////////////////////////////////////////////
/// \brief simple rainfall-runoff forecast: Q=coef*P*area/dt
//
class CRainfallRunoffForecast : public CForecastModelABC
{
private:/*------------------------------------------------------*/
  const CTimeSeries *_pRain;    ///< forecast rainfall [mm/time step] (not owned)
  double             _runoff_coef; ///< runoff coefficient [-]
  double             _area;     ///< contributing area [km2]
  double             _tstep;    ///< time step [s]

public:/*-------------------------------------------------------*/
  CRainfallRunoffForecast(const CTimeSeries *pRain, const double coef, const double area_km2);
  ~CRainfallRunoffForecast();

  string GetName() const;
  void   Initialize(const optStruct &Options);
  bool   Forecast(const int n, const int lead, double *aQ) const;
};

///////////////////////////////////////////////////////////////////
/// \brief wraps forecast model with lead time and wall-clock timeout
/// \details model failures, timeouts and invalid (negative/NaN) values all
///  make the forecast unavailable; the adapter never terminates the run
//
class CForecastAdapter
{
private:/*------------------------------------------------------*/
  long               _res_ID;   ///< ID of reservoir which receives the forecast
  CForecastModelABC *_pModel;   ///< forecast model (owned)
  int                _lead;     ///< lead time [time steps]
  double             _timeout;  ///< wall-clock timeout [s]; <=0 uses global default
  double            *_aQ;       ///< work array [size: _lead]

  int                _nFailures;///< number of unavailable forecasts

  CForecastAdapter(const CForecastAdapter &f); //suppresses default copy constructor
  CForecastAdapter &operator=(const CForecastAdapter &f);

public:/*-------------------------------------------------------*/
  CForecastAdapter(const long res_ID, CForecastModelABC *pModel, const int lead, const double timeout);
  ~CForecastAdapter();

  long   GetReservoirID() const;
  int    GetLeadTime   () const;
  double GetTimeout    () const;
  int    GetNumFailures() const;
  string GetModelName  () const;

  void   CheckConfiguration() const;
  void   Initialize(const optStruct &Options);

  const double *GetForecast(const int n);
};
#endif
