/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------*/
#include <pybind11/pybind11.h>
#include "CascadeInclude.h"
#include "CascadeMain.h"
#include "CascadeTopology.h"
#include "SchedulingEngine.h"
#include "MetricsCollector.h"
#include "StandardOutput.h"

#ifdef _CASCADE_NETCDF_
const bool    __HAS_NETCDF__ = true;
#endif
#ifndef _CASCADE_NETCDF_
const bool    __HAS_NETCDF__ = false;
#endif

namespace py = pybind11;

//////////////////////////////////////////////////////////////////
/// \brief parses, simulates and writes output for a single .csc file
/// \param input_file [in] .csc file, with extension
/// \param output_dir [in] output directory (may be empty)
/// \return dictionary of system metrics, with per-reservoir metrics under "reservoirs"
//
static py::dict RunCascade(const string &input_file, const string &output_dir)
{
  optStruct Options;
  Options.csc_filename=input_file;
  Options.output_dir  =output_dir;
  Options.silent      =true;
  if ((Options.output_dir!="") && (Options.output_dir.back()!='/')){Options.output_dir+="/";}
  PrepareOutputdirectory(Options);

  ofstream WARNINGS((Options.output_dir+"Cascade_errors.txt").c_str());
  WARNINGS.close();

  CCascadeTopology *pTopo=NULL;
  if (!ParseInputFiles(pTopo,Options)){
    ExitGracefully("libcascade: unable to read input file",BAD_DATA);}
  CheckForErrorWarnings(true,Options);
  pTopo->Initialize(Options);

  CMetricsCollector *pMetrics=new CMetricsCollector();
  CSchedulingEngine  engine;
  engine.Run      (pTopo,Options,pMetrics);
  WriteMajorOutput(pMetrics,Options);

  const system_metrics &S=pMetrics->GetSystemMetrics();
  py::dict out;
  out["n_reservoirs"]       =S.nReservoirs;
  out["n_steps"]            =S.nSteps;
  out["flood_compliant"]    =S.flood_compliant;
  out["mass_balance_ok"]    =S.mass_balance_ok;
  out["max_abs_MB_residual"]=S.max_abs_MB_residual;
  out["outlet_peak_inflow"] =S.outlet_peak_inflow;
  out["outlet_peak_outflow"]=S.outlet_peak_outflow;
  out["outlet_peak_shaving"]=S.outlet_peak_shaving;
  out["n_spill"]            =S.n_spill;
  out["n_forecast_fail"]    =S.n_forecast_fail;

  py::list reservoirs;
  for (int p=0;p<pMetrics->GetNumReservoirs();p++)
  {
    const res_metrics &M=pMetrics->GetReservoirMetrics(p);
    py::dict r;
    r["name"]           =M.name;
    r["ID"]             =M.ID;
    r["peak_inflow"]    =M.peak_inflow;
    r["peak_outflow"]   =M.peak_outflow;
    r["peak_shaving"]   =M.peak_shaving;
    r["max_stage"]      =M.max_stage;
    r["flood_compliant"]=M.flood_compliant;
    r["MB_residual"]    =M.MB_residual;
    r["n_spill"]        =M.n_spill;
    r["n_pre_release"]  =M.n_pre_release;
    reservoirs.append(r);
  }
  out["reservoirs"]=reservoirs;

  delete pMetrics;
  delete pTopo;
  return out;
}

PYBIND11_MODULE(libcascade, m) {
    m.doc() =
      R"pbdoc(A Python wrapper to the multi-reservoir cascade operation engine Cascade.)pbdoc";

    m.attr("__version__") = __CASCADE_VERSION__;
    m.attr("__netcdf__") = __HAS_NETCDF__;

    m.def("run", &RunCascade, py::arg("input_file"), py::arg("output_dir")="",
          "Simulates the cascade described by a .csc file and returns its performance metrics");
}
