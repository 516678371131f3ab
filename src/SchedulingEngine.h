/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------
  SchedulingEngine.h
  ------------------------------------------------------------------
  time-stepping driver for cascade operation
  ----------------------------------------------------------------*/
#ifndef SCHEDULING_ENGINE_H
#define SCHEDULING_ENGINE_H

#include "CascadeInclude.h"
#include "CascadeTopology.h"
#include "MetricsCollector.h"

/*****************************************************************
   Class CSchedulingEngine
------------------------------------------------------------------
   Stateless driver: all mutable state lives in the reservoirs and
   forecast adapters owned by the CCascadeTopology and in the
   CMetricsCollector. Each step walks reservoirs from upstream to
   downstream; the time loop is strictly sequential.
******************************************************************/
class CSchedulingEngine
{
public:/*-------------------------------------------------------*/
  CSchedulingEngine();
  ~CSchedulingEngine();

  void Run            (CCascadeTopology *pTopo, const optStruct &Options, CMetricsCollector *pMetrics) const;

  void SolveTimeStep  (CCascadeTopology *pTopo, const optStruct &Options, const int n,
                       CMetricsCollector *pMetrics, bool *aWarned) const;
  step_record UpdateReservoir(CCascadeTopology *pTopo, const optStruct &Options, const int p, const int n) const;

  void SummarizeToScreen(const CMetricsCollector *pMetrics, const optStruct &Options) const;
};
#endif
