/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------
  CascadeTopology.h
  ------------------------------------------------------------------
  defines reservoir network: reservoirs, routing links, external
  inflows, operating policies and forecast adapters
  ----------------------------------------------------------------*/
#ifndef CASCADE_TOPOLOGY_H
#define CASCADE_TOPOLOGY_H

#include "CascadeInclude.h"
#include "Reservoir.h"
#include "RoutingLink.h"
#include "OperatingPolicy.h"
#include "Forecast.h"
#include "TimeSeries.h"

/*****************************************************************
   Class CCascadeTopology
------------------------------------------------------------------
   Owns all reservoirs, links, time series, policies and forecast
   adapters of a cascade. Initialize() validates the complete
   configuration before any state is touched, then determines the
   evaluation order.
******************************************************************/
class CCascadeTopology
{
private:/*-------------------------------------------------------*/
  CReservoir        **_pReservoirs;    ///< array of pointers to reservoirs [size: _nReservoirs]
  int                 _nReservoirs;
  COperatingPolicy  **_pPolicies;      ///< operating policy of each reservoir [size: _nReservoirs]

  CRoutingLink      **_pLinks;         ///< array of pointers to routing links [size: _nLinks]
  int                 _nLinks;

  CTimeSeries       **_pInflows;       ///< external inflow series, keyed by location ID [size: _nInflows]
  int                 _nInflows;
  CTimeSeries       **_pForcings;      ///< auxiliary forcing series (e.g., forecast rainfall) [size: _nForcings]
  int                 _nForcings;

  CForecastAdapter  **_pForecasts;     ///< forecast adapters [size: _nForecasts]
  int                 _nForecasts;

  //set during initialization
  bool                _initialized;
  int                *_aInflowInd;       ///< index of external inflow series of reservoir p, or DOESNT_EXIST [size: _nReservoirs]
  int                *_aForecastInd;     ///< index of forecast adapter of reservoir p, or DOESNT_EXIST [size: _nReservoirs]
  int                *_aDepth;           ///< zero-delay dependency depth of reservoir p [size: _nReservoirs]
  int                 _maxDepth;         ///< maximum dependency depth
  int                *_aOrderedResInd;   ///< reservoir indices in evaluation order [size: _nReservoirs]
  int                *_nInLinks;         ///< number of links entering reservoir p [size: _nReservoirs]
  int               **_aInLinks;         ///< indices of links entering reservoir p [size: _nReservoirs x _nInLinks[p]]
  int                *_nOutLinks;        ///< number of links leaving reservoir p [size: _nReservoirs]

  void                CheckConfiguration(const optStruct &Options) const;
  void                InitializeRoutingNetwork();
  void                DeleteNetworkArrays();

  CCascadeTopology(const CCascadeTopology &t); //suppresses default copy constructor
  CCascadeTopology &operator=(const CCascadeTopology &t);

public:/*-------------------------------------------------------*/
  CCascadeTopology();
  ~CCascadeTopology();

  //Manipulators (called during construction/parsing)
  void   AddReservoir       (CReservoir *pRes);
  void   AddRoutingLink     (CRoutingLink *pLink);
  void   AddInflowSeries    (CTimeSeries *pTS);
  void   AddForcingSeries   (CTimeSeries *pTS);
  void   AddForecastAdapter (CForecastAdapter *pFA);
  void   SetPolicy          (const long res_ID, COperatingPolicy *pPolicy);

  void   Initialize         (const optStruct &Options);

  //Accessors
  int                GetNumReservoirs   () const;
  CReservoir        *GetReservoir       (const int p) const;
  CReservoir        *GetReservoirByID   (const long ID) const;
  int                GetReservoirIndex  (const long ID) const;
  COperatingPolicy  *GetPolicy          (const int p) const;
  int                GetNumLinks        () const;
  CRoutingLink      *GetLink            (const int i) const;
  int                GetNumForecasts    () const;
  CForecastAdapter  *GetForecastAdapter (const int p) const;
  const CTimeSeries *GetInflowSeries    (const int p) const;
  const CTimeSeries *GetForcingSeries   (const long loc_ID) const;
  const CTimeSeries *FindInflowSeries   (const long loc_ID) const;

  bool               IsInitialized      () const;
  int                GetOrderedResIndex (const int i) const;
  int                GetDepth           (const int p) const;
  int                GetMaxDepth        () const;
  bool               IsOutlet           (const int p) const;
  int                GetNumInLinks      (const int p) const;

  double             GetExternalInflow  (const int p, const int n) const;
  double             GetRoutedInflow    (const int p, const int n) const;
};
#endif
