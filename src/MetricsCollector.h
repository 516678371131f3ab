/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------
  MetricsCollector.h
  ------------------------------------------------------------------
  per-step reservoir results and post-run performance metrics
  ----------------------------------------------------------------*/
#ifndef METRICS_COLLECTOR_H
#define METRICS_COLLECTOR_H

#include "CascadeInclude.h"

class CCascadeTopology;

///////////////////////////////////////////////////////////////////
/// \brief result of a single reservoir over a single time step
//
struct step_record
{
  double   Qin;          ///< total inflow [m3/s]
  double   Qrequested;   ///< release requested by policy [m3/s]
  double   Qout;         ///< actual release, including forced spill [m3/s]
  double   storage;      ///< storage at end of step [m3]
  double   stage;        ///< stage at end of step [m]
  res_zone zone;         ///< zone at end of step
  bool     pre_release;  ///< true if forecast pre-release was active
  int      flags;        ///< bitwise step_diag flags
  step_record() {Qin=Qrequested=Qout=storage=stage=0.0;zone=ZONE_DEAD;pre_release=false;flags=DIAG_NONE;}
};

///////////////////////////////////////////////////////////////////
/// \brief performance metrics of single reservoir over the simulation
//
struct res_metrics
{
  string name;
  long   ID;

  double peak_inflow;        ///< [m3/s]
  double peak_outflow;       ///< [m3/s]
  double mean_inflow;        ///< [m3/s]
  double mean_outflow;       ///< [m3/s]
  double peak_shaving;       ///< (peak_inflow-peak_outflow)/peak_inflow [-]; 0 if peak inflow is zero

  double max_stage;          ///< [m], including initial stage
  double min_stage;          ///< [m]
  double mean_stage;         ///< [m]
  double flood_limit_stage;  ///< [m]
  bool   flood_compliant;    ///< true if max_stage<=flood_limit_stage

  double spill_volume;       ///< volume released as forced spill [m3]
  int    n_spill;            ///< number of forced spill steps
  int    n_capped;           ///< number of steps in which release was limited by available water
  int    n_pre_release;      ///< number of pre-release steps
  int    n_forecast_fail;    ///< number of steps with unavailable forecast
  int    n_zone_jumps;       ///< number of steps crossing more than one zone boundary
  int    n_flood_exceed;     ///< number of steps ending above flood limit stage

  double initial_storage;    ///< [m3]
  double final_storage;      ///< [m3]
  double inflow_volume;      ///< cumulative inflow [m3]
  double outflow_volume;     ///< cumulative actual release [m3]
  double MB_residual;        ///< (inflow_volume-outflow_volume)-(final_storage-initial_storage) [m3]
  bool   MB_ok;              ///< true if |MB_residual| within tolerance
};

///////////////////////////////////////////////////////////////////
/// \brief system-wide performance metrics
//
struct system_metrics
{
  int    nReservoirs;
  int    nSteps;                ///< number of completed steps
  bool   flood_compliant;       ///< true if all reservoirs are flood compliant
  double max_abs_MB_residual;   ///< maximum absolute water balance residual of any reservoir [m3]
  bool   mass_balance_ok;       ///< true if all reservoirs close water balance
  double outlet_peak_inflow;    ///< peak of total inflow to outlet reservoirs [m3/s]
  double outlet_peak_outflow;   ///< peak of total release from outlet reservoirs [m3/s]
  double outlet_peak_shaving;   ///< peak-shaving ratio at system outlet(s) [-]
  int    n_spill;               ///< total forced spill steps
  int    n_forecast_fail;       ///< total unavailable forecasts
};

/*****************************************************************
   Class CMetricsCollector
------------------------------------------------------------------
   Stores per-step results of every reservoir and computes
   reservoir and system metrics after (or during) a run
******************************************************************/
class CMetricsCollector
{
private:/*-------------------------------------------------------*/
  int           _nReservoirs;
  int           _nSteps;            ///< simulation horizon [steps]
  double        _tstep;             ///< time step [s]
  double        _MB_tolerance;      ///< relative water balance tolerance [-]

  string       *_aNames;            ///< reservoir names [size: _nReservoirs]
  long         *_aIDs;              ///< reservoir IDs [size: _nReservoirs]
  double       *_aInitStorage;      ///< initial storage [m3] [size: _nReservoirs]
  double       *_aInitStage;        ///< initial stage [m] [size: _nReservoirs]
  double       *_aFloodLimit;       ///< flood limit stage [m] [size: _nReservoirs]
  bool         *_aIsOutlet;         ///< true if reservoir has no outgoing links [size: _nReservoirs]

  step_record **_aRecords;          ///< step results [size: _nReservoirs x _nSteps]
  int          *_aNumRecorded;      ///< number of steps recorded for each reservoir [size: _nReservoirs]

  res_metrics  *_aMetrics;          ///< reservoir metrics [size: _nReservoirs]
  system_metrics _sysMetrics;
  bool          _computed;

  void          DeleteArrays();

  CMetricsCollector(const CMetricsCollector &m); //suppresses default copy constructor
  CMetricsCollector &operator=(const CMetricsCollector &m);

public:/*-------------------------------------------------------*/
  CMetricsCollector();
  ~CMetricsCollector();

  void                  Initialize(const CCascadeTopology *pTopo, const optStruct &Options);
  void                  Ingest    (const int p, const int n, const step_record &rec);
  void                  Compute   ();

  int                   GetNumReservoirs  () const;
  int                   GetNumSteps       () const;
  int                   GetNumCompleted   () const;
  string                GetReservoirName  (const int p) const;
  long                  GetReservoirID    (const int p) const;
  const step_record    &GetRecord         (const int p, const int n) const;
  const res_metrics    &GetReservoirMetrics(const int p) const;
  const system_metrics &GetSystemMetrics  () const;
};
#endif
