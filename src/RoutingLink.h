/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------
  RoutingLink.h
  ------------------------------------------------------------------
  defines delayed upstream->downstream reservoir connection
  ----------------------------------------------------------------*/
#ifndef ROUTINGLINK_H
#define ROUTINGLINK_H

#include "CascadeInclude.h"
#include "Reservoir.h"

/*****************************************************************
   Class CRoutingLink
------------------------------------------------------------------
   Data Abstraction for pure-translation routing between two
   reservoirs. At step n, delivers fraction*Q_up(n-travel_time)+Qlat;
   for n<travel_time the upstream outflow is taken as the warm-up
   value (0.0 unless specified)
******************************************************************/
class CRoutingLink
{
private:/*-------------------------------------------------------*/
  long              _up_ID;          ///< upstream reservoir ID
  long              _down_ID;        ///< downstream reservoir ID
  int               _travel_time;    ///< travel time [time steps]
  double            _Qlateral;       ///< constant lateral (interval) inflow added at downstream end [m3/s]
  double            _fraction;       ///< fraction of upstream release carried by this link [-]
  double            _Qwarmup;        ///< upstream outflow assumed before any history exists [m3/s]

  const CReservoir *_pUpstream;      ///< pointer to upstream reservoir (set in topology initialization)

public:/*-------------------------------------------------------*/
  CRoutingLink(const long up_ID, const long down_ID, const int travel_time, const double Qlat);
  ~CRoutingLink();

  long    GetUpstreamID  () const;
  long    GetDownstreamID() const;
  int     GetTravelTime  () const;
  double  GetLateralInflow() const;
  double  GetFraction    () const;
  double  GetWarmupFlow  () const;

  void    SetFraction    (const double &frac);
  void    SetWarmupFlow  (const double &Q);
  void    SetUpstreamReservoir(const CReservoir *pRes);

  double  GetContribution(const int n) const;
};
#endif
