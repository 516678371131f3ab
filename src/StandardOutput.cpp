/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------
  StandardOutput.cpp
  ------------------------------------------------------------------
  ReservoirTimeSeries.csv, ReservoirMetrics.csv, ReservoirTimeSeries.nc
  ----------------------------------------------------------------*/
#include "StandardOutput.h"
#include <sys/stat.h>
#if defined(_WIN32)
#include <direct.h>
#endif
#ifdef _CASCADE_NETCDF_
#include <netcdf.h>
#endif

//////////////////////////////////////////////////////////////////
/// \brief adds run name prefix and output directory to output filename
/// \param filebase [in] base filename, with extension, no directory information
/// \param Options [in] global options
//
string FilenamePrepare(string filebase, const optStruct &Options)
{
  string fn;
  if (Options.run_name==""){fn=Options.output_dir+filebase;}
  else                     {fn=Options.output_dir+Options.run_name+"_"+filebase;}
  return fn;
}

//////////////////////////////////////////////////////////////////
/// \brief creates output directory if needed; redirects errors file there
//
void PrepareOutputdirectory(const optStruct &Options)
{
  if (Options.output_dir!="")
  {
#if defined(_WIN32)
    _mkdir(Options.output_dir.c_str());
#else
    mkdir(Options.output_dir.c_str(),0777);
#endif
  }
  g_output_directory=Options.output_dir;
}

//////////////////////////////////////////////////////////////////
/// \brief writes ReservoirTimeSeries.csv: one row per time step, one block of columns per reservoir
//
void WriteReservoirTimeSeries(const CMetricsCollector *pMetrics, const optStruct &Options)
{
  int p,n;
  string tmpFilename=FilenamePrepare("ReservoirTimeSeries.csv",Options);
  ofstream TS;
  TS.open(tmpFilename.c_str());
  if (TS.fail()){
    ExitGracefully(("WriteReservoirTimeSeries: unable to open output file "+tmpFilename+" for writing.").c_str(),FILE_OPEN_ERR);
  }
  TS<<"step,time [s]";
  for (p=0;p<pMetrics->GetNumReservoirs();p++)
  {
    string nm=pMetrics->GetReservoirName(p);
    TS<<","<<nm<<" inflow [m3/s],"<<nm<<" requested [m3/s],"<<nm<<" outflow [m3/s]";
    TS<<","<<nm<<" storage [m3],"<<nm<<" stage [m],"<<nm<<" zone,"<<nm<<" pre-release,"<<nm<<" diagnostics";
  }
  TS<<endl;

  TS.precision(10);
  for (n=0;n<pMetrics->GetNumCompleted();n++)
  {
    TS<<n<<","<<(n+1)*Options.timestep;
    for (p=0;p<pMetrics->GetNumReservoirs();p++)
    {
      const step_record &R=pMetrics->GetRecord(p,n);
      TS<<","<<R.Qin<<","<<R.Qrequested<<","<<R.Qout<<","<<R.storage<<","<<R.stage;
      TS<<","<<ZoneToString(R.zone)<<","<<(R.pre_release ? 1 : 0)<<","<<DiagFlagsToString(R.flags);
    }
    TS<<endl;
  }
  TS.close();
}

//////////////////////////////////////////////////////////////////
/// \brief writes ReservoirMetrics.csv: one row per reservoir and a final SYSTEM row
//
void WriteReservoirMetrics(const CMetricsCollector *pMetrics, const optStruct &Options)
{
  string tmpFilename=FilenamePrepare("ReservoirMetrics.csv",Options);
  ofstream MET;
  MET.open(tmpFilename.c_str());
  if (MET.fail()){
    ExitGracefully(("WriteReservoirMetrics: unable to open output file "+tmpFilename+" for writing.").c_str(),FILE_OPEN_ERR);
  }
  MET<<"reservoir,ID,peak inflow [m3/s],peak outflow [m3/s],mean inflow [m3/s],mean outflow [m3/s],peak shaving ratio,";
  MET<<"max stage [m],min stage [m],mean stage [m],flood limit stage [m],flood compliant,";
  MET<<"spill volume [m3],spill steps,capped steps,pre-release steps,forecast failures,zone jumps,flood limit exceedances,";
  MET<<"initial storage [m3],final storage [m3],inflow volume [m3],outflow volume [m3],MB residual [m3],MB ok"<<endl;

  MET.precision(10);
  for (int p=0;p<pMetrics->GetNumReservoirs();p++)
  {
    const res_metrics &M=pMetrics->GetReservoirMetrics(p);
    MET<<M.name<<","<<M.ID<<","<<M.peak_inflow<<","<<M.peak_outflow<<","<<M.mean_inflow<<","<<M.mean_outflow<<","<<M.peak_shaving<<",";
    MET<<M.max_stage<<","<<M.min_stage<<","<<M.mean_stage<<","<<M.flood_limit_stage<<","<<(M.flood_compliant ? "TRUE" : "FALSE")<<",";
    MET<<M.spill_volume<<","<<M.n_spill<<","<<M.n_capped<<","<<M.n_pre_release<<","<<M.n_forecast_fail<<","<<M.n_zone_jumps<<","<<M.n_flood_exceed<<",";
    MET<<M.initial_storage<<","<<M.final_storage<<","<<M.inflow_volume<<","<<M.outflow_volume<<","<<M.MB_residual<<","<<(M.MB_ok ? "TRUE" : "FALSE")<<endl;
  }
  const system_metrics &S=pMetrics->GetSystemMetrics();
  MET<<"SYSTEM,,"<<S.outlet_peak_inflow<<","<<S.outlet_peak_outflow<<",,,"<<S.outlet_peak_shaving<<",";
  MET<<",,,,"<<(S.flood_compliant ? "TRUE" : "FALSE")<<",";
  MET<<","<<S.n_spill<<",,,"<<S.n_forecast_fail<<",,,";
  MET<<",,,,"<<S.max_abs_MB_residual<<","<<(S.mass_balance_ok ? "TRUE" : "FALSE")<<endl;
  MET.close();
}

#ifdef _CASCADE_NETCDF_
//////////////////////////////////////////////////////////////////
/// \brief defines 2D (time x nreservoirs) double variable with metadata
/// \returns netCDF variable ID
//
static int NetCDFAddMetadata2D(const int fileid,const int time_dimid,const int nres_dimid,string shortname,string longname,string units)
{
  int    varid(0);
  int    retval;
  int    dimids2[2];
  string tmp="reservoir_name";
  static double fill_val[] = {CAS_BLANK_DATA};

  dimids2[0] = time_dimid;
  dimids2[1] = nres_dimid;

  retval = nc_def_var     (fileid,shortname.c_str(),NC_DOUBLE,2,dimids2,&varid);                  HandleNetCDFErrors(retval);
  retval = nc_put_att_text(fileid,varid,"units",      units.length(),   units.c_str());           HandleNetCDFErrors(retval);
  retval = nc_put_att_text(fileid,varid,"long_name",  longname.length(),longname.c_str());        HandleNetCDFErrors(retval);
  retval = nc_put_att_double(fileid,varid,"_FillValue",NC_DOUBLE,1,     fill_val);                HandleNetCDFErrors(retval);
  retval = nc_put_att_text(fileid,varid,"coordinates",tmp.length(),     tmp.c_str());             HandleNetCDFErrors(retval);
  return varid;
}
#endif

//////////////////////////////////////////////////////////////////
/// \brief writes ReservoirTimeSeries.nc with dimensions (time, nreservoirs)
/// \note does nothing unless built with netCDF support
//
void WriteNetCDFReservoirOutput(const CMetricsCollector *pMetrics, const optStruct &Options)
{
#ifdef _CASCADE_NETCDF_
  int    ncid,retval;
  int    time_dimid,nres_dimid;
  int    varid_time,varid_name;
  int    p,n;
  int    nRes=pMetrics->GetNumReservoirs();
  int    N   =pMetrics->GetNumCompleted();

  string tmpFilename=FilenamePrepare("ReservoirTimeSeries.nc",Options);
  retval = nc_create(tmpFilename.c_str(),NC_CLOBBER|NC_NETCDF4,&ncid);   HandleNetCDFErrors(retval);

  retval = nc_put_att_text(ncid,NC_GLOBAL,"Conventions",strlen("CF-1.6"),           "CF-1.6");            HandleNetCDFErrors(retval);
  retval = nc_put_att_text(ncid,NC_GLOBAL,"featureType",strlen("timeSeries"),       "timeSeries");        HandleNetCDFErrors(retval);
  retval = nc_put_att_text(ncid,NC_GLOBAL,"history",    strlen("Created by Cascade"),"Created by Cascade");HandleNetCDFErrors(retval);

  retval = nc_def_dim(ncid,"time",       N,   &time_dimid);                     HandleNetCDFErrors(retval);
  retval = nc_def_dim(ncid,"nreservoirs",nRes,&nres_dimid);                     HandleNetCDFErrors(retval);

  string units="seconds since simulation start";
  retval = nc_def_var     (ncid,"time",NC_DOUBLE,1,&time_dimid,&varid_time);     HandleNetCDFErrors(retval);
  retval = nc_put_att_text(ncid,varid_time,"units",units.length(),units.c_str());HandleNetCDFErrors(retval);
  retval = nc_def_var     (ncid,"reservoir_name",NC_STRING,1,&nres_dimid,&varid_name); HandleNetCDFErrors(retval);

  const int NVARS=5;
  int    varids[NVARS];
  varids[0]=NetCDFAddMetadata2D(ncid,time_dimid,nres_dimid,"q_in",   "Total reservoir inflow",   "m**3 s**-1");
  varids[1]=NetCDFAddMetadata2D(ncid,time_dimid,nres_dimid,"q_req",  "Requested release",        "m**3 s**-1");
  varids[2]=NetCDFAddMetadata2D(ncid,time_dimid,nres_dimid,"q_out",  "Actual release",           "m**3 s**-1");
  varids[3]=NetCDFAddMetadata2D(ncid,time_dimid,nres_dimid,"storage","Reservoir storage",        "m**3");
  varids[4]=NetCDFAddMetadata2D(ncid,time_dimid,nres_dimid,"stage",  "Reservoir stage",          "m");

  retval = nc_enddef(ncid);  HandleNetCDFErrors(retval);

  //reservoir names
  size_t start1[1],count1[1];
  char  *name[1];
  for (p=0;p<nRes;p++){
    string nm=pMetrics->GetReservoirName(p);
    name[0]=new char[nm.length()+1];
    strcpy(name[0],nm.c_str());
    start1[0]=p; count1[0]=1;
    retval = nc_put_vara_string(ncid,varid_name,start1,count1,(const char**)name); HandleNetCDFErrors(retval);
    delete [] name[0];
  }

  //time and values
  double *row=new double [max(nRes,1)];
  size_t  start2[2],count2[2];
  for (n=0;n<N;n++)
  {
    double t=(n+1)*Options.timestep;
    start1[0]=n; count1[0]=1;
    retval = nc_put_vara_double(ncid,varid_time,start1,count1,&t);  HandleNetCDFErrors(retval);

    start2[0]=n; start2[1]=0;
    count2[0]=1; count2[1]=nRes;
    for (int v=0;v<NVARS;v++)
    {
      for (p=0;p<nRes;p++){
        const step_record &R=pMetrics->GetRecord(p,n);
        if      (v==0){row[p]=R.Qin;}
        else if (v==1){row[p]=R.Qrequested;}
        else if (v==2){row[p]=R.Qout;}
        else if (v==3){row[p]=R.storage;}
        else          {row[p]=R.stage;}
      }
      retval = nc_put_vara_double(ncid,varids[v],start2,count2,row); HandleNetCDFErrors(retval);
    }
  }
  delete [] row;

  retval = nc_close(ncid); HandleNetCDFErrors(retval);
#else
  WriteWarning("WriteNetCDFReservoirOutput: Cascade was built without netCDF support; ReservoirTimeSeries.nc not written",Options.noisy);
#endif
}

//////////////////////////////////////////////////////////////////
/// \brief writes all requested end-of-simulation output files
//
void WriteMajorOutput(const CMetricsCollector *pMetrics, const optStruct &Options)
{
  if (Options.write_reservoir_ts){WriteReservoirTimeSeries  (pMetrics,Options);}
  if (Options.write_metrics     ){WriteReservoirMetrics     (pMetrics,Options);}
  if (Options.write_netcdf      ){WriteNetCDFReservoirOutput(pMetrics,Options);}
}
