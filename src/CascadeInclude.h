/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------
  CascadeInclude.h
  ------------------------------------------------------------------
  global constants, enumerated types, options structure and
  declarations of common functions used throughout the library
  ----------------------------------------------------------------*/
#ifndef CASCADEINCLUDE_H
#define CASCADEINCLUDE_H

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <limits>

using namespace std;

#define __CASCADE_VERSION__ "1.2"

//*****************************************************************
// Global Variables (defined in CommonFunctions.cpp)
//*****************************************************************
extern string g_output_directory;   ///< output directory for Cascade_errors.txt
extern bool   g_suppress_warnings;  ///< true if warnings should not be written to screen or file

//*****************************************************************
// Constants
//*****************************************************************
const int    DOESNT_EXIST       =-1;        ///< return value for nonexistent index
const int    INDEX_NOT_FOUND    =-2;        ///< return value for failed index search
const double REAL_SMALL         =1e-12;     ///< small real number used for comparisons
const double ALMOST_INF         =1e99;      ///< effectively infinite value
const double CAS_BLANK_DATA     =-1.2345;   ///< flag for blank entries in time series
const double SEC_PER_DAY        =86400.0;   ///< seconds per day
const double MM_PER_METER       =1000.0;    ///< millimeters per meter
const double M2_PER_KM2         =1.0e6;     ///< square meters per square kilometer

const int    MAXINPUTITEMS      =500;       ///< maximum number of items in single input line
const int    MAXCHARINLINE      =6000;      ///< maximum characters in single input line
const int    MAX_CASCADE_ITER   =10000;     ///< maximum iterations in routing order determination

const double DEFAULT_PRERELEASE_FACTOR=1.5; ///< forecast peak / current inflow ratio which triggers pre-release
const double DEFAULT_PRERELEASE_GAIN  =1.2; ///< pre-release outflow as multiple of current inflow
const double DEFAULT_MB_TOLERANCE     =1e-6;///< relative water balance closure tolerance
const double DEFAULT_FORECAST_TIMEOUT =10.0;///< default forecast wall-clock timeout [s]

//*****************************************************************
// Enumerated types
//*****************************************************************

///////////////////////////////////////////////////////////////////
/// \brief reasons for program exit
//
enum exitcode
{
  SIMULATION_DONE,   ///< normal completion
  RUNTIME_ERR,       ///< runtime error (bug)
  BAD_DATA,          ///< bad input data - fatal
  BAD_DATA_WARN,     ///< bad input data - logged, not immediately fatal
  OUT_OF_MEMORY,     ///< memory allocation failed
  FILE_OPEN_ERR,     ///< unable to open file
  STUB,              ///< unimplemented function called
  CASCADE_OPEN_ERR   ///< unable to open Cascade_errors.txt
};

///////////////////////////////////////////////////////////////////
/// \brief reservoir operating zones, ordered from bottom to top
//
enum res_zone
{
  ZONE_DEAD,          ///< dead storage (below dead pool top)
  ZONE_NORMAL,        ///< normal / conservation pool
  ZONE_FLOOD_CONTROL, ///< flood control pool (above flood limit stage)
  ZONE_SURCHARGE      ///< surcharge pool (above design flood stage), open-ended upward
};
const int NUM_RES_ZONES=4;

///////////////////////////////////////////////////////////////////
/// \brief release rule kinds used in zone-based policy tables
//
enum release_rule
{
  RULE_NONE,          ///< zero release
  RULE_PASS_INFLOW,   ///< Q=factor*Qin
  RULE_CONSTANT,      ///< Q=constant value
  RULE_MAX_RELEASE,   ///< Q=maximum release rate
  RULE_INFLOW_CAPPED, ///< Q=min(value,Qin)
  RULE_STAGE_INTERP   ///< Q interpolated between Qmin and Qmax across zone
};

///////////////////////////////////////////////////////////////////
/// \brief per-step runtime condition flags (bitwise)
//
enum step_diag
{
  DIAG_NONE                 =0,
  DIAG_FORCED_SPILL         =1,  ///< storage would exceed capacity; excess spilled
  DIAG_RELEASE_CAPPED       =2,  ///< requested release would draw storage negative
  DIAG_FORECAST_UNAVAILABLE =4,  ///< forecast failed or timed out; regular rule used
  DIAG_ZONE_JUMP            =8,  ///< more than one zone boundary crossed in a single step
  DIAG_FLOOD_LIMIT_EXCEEDED =16  ///< stage above flood limit stage at end of step
};

///////////////////////////////////////////////////////////////////
/// \brief parsing result codes
//
enum parse_error
{
  PARSE_GOOD,      ///< successful parse
  PARSE_BAD,       ///< improperly formatted line
  PARSE_EOF,       ///< end of file reached
  PARSE_NOT_ENOUGH,///< too few entries
  PARSE_TOO_MANY   ///< too many entries
};

//*****************************************************************
// Options structure
//*****************************************************************
///////////////////////////////////////////////////////////////////
/// \brief Stores global simulation options
//
struct optStruct
{
  string version;              ///< library version string
  string run_name;             ///< prefix applied to output files
  string csc_filename;         ///< primary input file
  string output_dir;           ///< output directory (with trailing slash)

  double timestep;             ///< duration of time step [s]
  int    num_steps;            ///< simulation horizon [time steps]

  bool   silent;              ///< true if nothing is written to screen
  bool   noisy;               ///< true if parsing is echoed to screen

  bool   write_reservoir_ts;  ///< write ReservoirTimeSeries.csv
  bool   write_metrics;       ///< write ReservoirMetrics.csv
  bool   write_netcdf;        ///< write ReservoirTimeSeries.nc (requires netCDF build)

  double forecast_timeout;    ///< default forecast wall-clock timeout [s]
  double MB_tolerance;        ///< relative water balance closure tolerance [-]

  optStruct(){
    version           =__CASCADE_VERSION__;
    run_name          ="";
    csc_filename      ="";
    output_dir        ="";
    timestep          =SEC_PER_DAY;
    num_steps         =0;
    silent            =false;
    noisy             =false;
    write_reservoir_ts=true;
    write_metrics     =true;
    write_netcdf      =false;
    forecast_timeout  =DEFAULT_FORECAST_TIMEOUT;
    MB_tolerance      =DEFAULT_MB_TOLERANCE;
  }
};

//*****************************************************************
// Exit / warning handling (GracefulEnds.cpp, CommonFunctions.cpp)
//*****************************************************************
void ExitGracefully     (const char *statement, exitcode code);

inline void ExitGracefullyIf(bool condition, const char *statement, exitcode code)
{
  if (condition){ExitGracefully(statement,code);}
}
void WriteWarning       (const string warn, bool noisy);
void WriteAdvisory      (const string warn, bool noisy);
void HandleNetCDFErrors (int error_code);

//*****************************************************************
// Common functions (CommonFunctions.cpp)
//*****************************************************************
string ZoneToString        (const res_zone zone);
res_zone StringToZone      (const string s);
string ReleaseRuleToString (const release_rule rule);
release_rule StringToReleaseRule(const string s);
string DiagFlagsToString   (const int flags);

int    SmartIntervalSearch (const double &x,const double *ax,const int N,const int iguess);
double InterpolateCurve    (const double x,const double *xx,const double *y,int N,bool extrapbottom);
bool   IsMonotonicIncreasing(const double *a,const int N);
bool   DynArrayAppend      (void **& pArr, void *xptr,int &size);

string StringToUppercase   (const string &s);
bool   IsComment           (const char *s, const int Len);
bool   StringIsLong        (const char *s);
string CorrectForRelativePath(const string filename,const string relfile);

inline double s_to_d (const char *s1) {return atof(s1);}
inline int    s_to_i (const char *s1) {return (int)atof(s1);}
inline long   s_to_l (const char *s1) {return atol(s1);}
inline bool   is_numeric(const char *s1){
  char *end;
  strtod(s1,&end);
  return ((end!=s1) && (*end=='\0'));
}

template<class T> inline void upperswap(T &u,const T &v){if (v>u){u=v;}}
template<class T> inline void lowerswap(T &u,const T &v){if (v<u){u=v;}}

#endif
