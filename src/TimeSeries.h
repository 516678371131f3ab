/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------
  TimeSeries.h
  ------------------------------------------------------------------
  defines regular (one value per simulation time step) time series
  ----------------------------------------------------------------*/
#ifndef TIMESERIES_H
#define TIMESERIES_H

#include "CascadeInclude.h"
#include "ParseLib.h"

///////////////////////////////////////////////////////////////////
/// \brief Data abstraction for a time series sampled once per model time step
/// \details value n is the (time-averaged) value over time step n
//
class CTimeSeries
{
private:/*------------------------------------------------------*/
  string  _name;       ///< name of time series (used only for error messages)
  long    _loc_ID;     ///< location ID (reservoir ID to which series applies)
  double *_aVal;       ///< array of values [size: _nVals]
  int     _nVals;      ///< number of values

  CTimeSeries(const CTimeSeries &t); //suppresses default copy constructor
  CTimeSeries &operator=(const CTimeSeries &t);

public:/*-------------------------------------------------------*/
  CTimeSeries(const string name, const long loc_ID, const double *aValues, const int N);
  CTimeSeries(const string name, const long loc_ID, const double one_value, const int N);
  ~CTimeSeries();

  string GetName      () const;
  long   GetLocID     () const;
  int    GetNumValues () const;
  double GetValue     (const int n) const;
  bool   HasBlanks    (const int nstart, const int nend) const;

  static CTimeSeries *Parse(CParser *p, const string name, const long loc_ID, const optStruct &Options);
};
#endif
