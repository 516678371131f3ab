/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------
  StandardOutput.h
  ------------------------------------------------------------------
  output file preparation and writing of reservoir results
  ----------------------------------------------------------------*/
#ifndef STANDARD_OUTPUT_H
#define STANDARD_OUTPUT_H

#include "CascadeInclude.h"
#include "MetricsCollector.h"

string FilenamePrepare              (string filebase, const optStruct &Options);
void   PrepareOutputdirectory       (const optStruct &Options);

void   WriteReservoirTimeSeries     (const CMetricsCollector *pMetrics, const optStruct &Options);
void   WriteReservoirMetrics        (const CMetricsCollector *pMetrics, const optStruct &Options);
void   WriteNetCDFReservoirOutput   (const CMetricsCollector *pMetrics, const optStruct &Options);
void   WriteMajorOutput             (const CMetricsCollector *pMetrics, const optStruct &Options);

#endif
