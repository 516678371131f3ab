/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------
  CommonFunctions.cpp
  ------------------------------------------------------------------
  string conversion, interpolation, and warning utilities
  ----------------------------------------------------------------*/
#include "CascadeInclude.h"
#ifdef _CASCADE_NETCDF_
#include <netcdf.h>
#endif

// Global variables - declared as extern in CascadeInclude.h--------
string g_output_directory ="";
bool   g_suppress_warnings=false;

//////////////////////////////////////////////////////////////////
/// \brief returns operating zone name
/// \param zone [in] operating zone
/// \returns string representation of zone
//
string ZoneToString(const res_zone zone)
{
  switch(zone)
  {
  case(ZONE_DEAD):          {return "DEAD";}
  case(ZONE_NORMAL):        {return "NORMAL";}
  case(ZONE_FLOOD_CONTROL): {return "FLOOD_CONTROL";}
  case(ZONE_SURCHARGE):     {return "SURCHARGE";}
  default:                  {return "UNKNOWN";}
  }
}
//////////////////////////////////////////////////////////////////
/// \brief converts string to operating zone
/// \param s [in] zone name, with or without ZONE_ prefix (case insensitive)
/// \returns operating zone; exits if unrecognized
//
res_zone StringToZone(const string s)
{
  string tmp=StringToUppercase(s);
  if (tmp.substr(0,5)=="ZONE_"){tmp=tmp.substr(5);}

  if      (tmp=="DEAD"         ){return ZONE_DEAD;}
  else if (tmp=="NORMAL"       ){return ZONE_NORMAL;}
  else if (tmp=="FLOOD_CONTROL"){return ZONE_FLOOD_CONTROL;}
  else if (tmp=="SURCHARGE"    ){return ZONE_SURCHARGE;}

  string warn="StringToZone: unrecognized operating zone "+s;
  ExitGracefully(warn.c_str(),BAD_DATA);
  return ZONE_DEAD;
}
//////////////////////////////////////////////////////////////////
/// \brief returns release rule name
//
string ReleaseRuleToString(const release_rule rule)
{
  switch(rule)
  {
  case(RULE_NONE):          {return "RULE_NONE";}
  case(RULE_PASS_INFLOW):   {return "RULE_PASS_INFLOW";}
  case(RULE_CONSTANT):      {return "RULE_CONSTANT";}
  case(RULE_MAX_RELEASE):   {return "RULE_MAX_RELEASE";}
  case(RULE_INFLOW_CAPPED): {return "RULE_INFLOW_CAPPED";}
  case(RULE_STAGE_INTERP):  {return "RULE_STAGE_INTERP";}
  default:                  {return "";}
  }
}
//////////////////////////////////////////////////////////////////
/// \brief converts string to release rule; exits if unrecognized
//
release_rule StringToReleaseRule(const string s)
{
  string tmp=StringToUppercase(s);
  if (tmp.substr(0,5)!="RULE_"){tmp="RULE_"+tmp;}

  if      (tmp=="RULE_NONE"         ){return RULE_NONE;}
  else if (tmp=="RULE_PASS_INFLOW"  ){return RULE_PASS_INFLOW;}
  else if (tmp=="RULE_CONSTANT"     ){return RULE_CONSTANT;}
  else if (tmp=="RULE_MAX_RELEASE"  ){return RULE_MAX_RELEASE;}
  else if (tmp=="RULE_INFLOW_CAPPED"){return RULE_INFLOW_CAPPED;}
  else if (tmp=="RULE_STAGE_INTERP" ){return RULE_STAGE_INTERP;}

  string warn="StringToReleaseRule: unrecognized release rule "+s;
  ExitGracefully(warn.c_str(),BAD_DATA);
  return RULE_NONE;
}
//////////////////////////////////////////////////////////////////
/// \brief returns '|'-separated list of diagnostic flags (or "OK")
/// \param flags [in] bitwise combination of step_diag values
//
string DiagFlagsToString(const int flags)
{
  if (flags==DIAG_NONE){return "OK";}
  string out="";
  if (flags & DIAG_FORCED_SPILL        ){out+="SPILL|";}
  if (flags & DIAG_RELEASE_CAPPED      ){out+="CAPPED|";}
  if (flags & DIAG_FORECAST_UNAVAILABLE){out+="NO_FORECAST|";}
  if (flags & DIAG_ZONE_JUMP           ){out+="ZONE_JUMP|";}
  if (flags & DIAG_FLOOD_LIMIT_EXCEEDED){out+="ABOVE_FLOOD_LIMIT|";}
  return out.substr(0,out.length()-1);
}

///////////////////////////////////////////////////////////////////////////
/// \brief identifies index location of value in uneven continuous list of sorted value ranges
///
/// \param &x [in] value for which the interval index is to be found
/// \param *ax [in] array of consecutive values from ax[0] to ax[N-1] indicating interval boundaries
/// \param N [in] size of array ax
/// \param iguess [in] best guess as to which interval x is in
/// \return interval index value i, such that ax[i]<=x<ax[i+1]
/// \note returns DOESNT_EXIST if outside of range
//
int SmartIntervalSearch(const double &x,const double *ax,const int N,const int iguess)
{
  int i=iguess;
  if((iguess>N-2) || (iguess<0)) { i=0; }
  if((x>=ax[i]) && (x<ax[i+1])) { return i; }

  int up,down;
  for(int d=1;d<N;d++)
  {
    up  =i+d;
    down=i-d;
    if((up  <N-1) && (x>=ax[up  ]) && (x<ax[up  +1])) { return up;   }
    if((down>=0 ) && (x>=ax[down]) && (x<ax[down+1])) { return down; }
  }
  return DOESNT_EXIST;
}

//////////////////////////////////////////////////////////////////
/// \brief interpolates value from tabulated curve
/// \param x [in] interpolation location
/// \param xx [in] array (size:N) of vertices ordinates of interpolant
/// \param y [in] array (size:N)  of values corresponding to array points xx
/// \param N size of arrays x and y
/// \returns y value corresponding to interpolation point
/// \note does not assume regular spacing between min and max x value
/// \note if below minimum xx, either extrapolates (if extrapbottom=true), or uses minimum value
/// \note if above maximum xx, always extrapolates
//
double InterpolateCurve(const double x,const double *xx,const double *y,int N,bool extrapbottom)
{
  ExitGracefullyIf(N<2,"InterpolateCurve: curve must have at least two points",RUNTIME_ERR);
  if(x<=xx[0])
  {
    if(extrapbottom) { return y[0]+(y[1]-y[0])/(xx[1]-xx[0])*(x-xx[0]); }
    return y[0];
  }
  else if(x>=xx[N-1])
  {
    return y[N-1]+(y[N-1]-y[N-2])/(xx[N-1]-xx[N-2])*(x-xx[N-1]);
  }
  int i=SmartIntervalSearch(x,xx,N,N/2);
  ExitGracefullyIf(i==DOESNT_EXIST,"InterpolateCurve::mis-ordered list or infinite x",RUNTIME_ERR);
  if (fabs(xx[i+1]-xx[i]) < REAL_SMALL) { return (y[i]+y[i+1])/2; }
  return y[i]+(y[i+1]-y[i])/(xx[i+1]-xx[i])*(x-xx[i]);
}
//////////////////////////////////////////////////////////////////
/// \brief true if array values are strictly increasing
//
bool IsMonotonicIncreasing(const double *a,const int N)
{
  for (int i=1;i<N;i++){
    if (a[i]-a[i-1]<=REAL_SMALL){return false;}
  }
  return true;
}

//////////////////////////////////////////////////////////////////
/// \brief dynamically appends pointer to array
/// \param pArr [in/out] array of pointers, possibly NULL if size==0
/// \param xptr [in] pointer to be appended
/// \param size [in/out] size of array
/// \returns false if xptr is NULL or array is inconsistent with size
//
bool DynArrayAppend(void **& pArr, void *xptr,int &size)
{
  void **tmp=NULL;
  if (xptr==NULL){return false;}
  if ((pArr==NULL) && (size>0)) {return false;}
  size=size+1;
  tmp=new void *[size+1];
  for (int i=0; i<(size-1); i++){tmp[i]=pArr[i];}
  tmp[size-1]=xptr;
  if (size>1){delete [] pArr; pArr=NULL;}
  pArr=tmp;
  return true;
}

//////////////////////////////////////////////////////////////////
/// \brief converts string to uppercase
//
string StringToUppercase(const string &s)
{
  string ret(s);
  for(int i = 0; i < (int)(s.size()); ++i)
  {
    if ((s[i] <= 'z' && s[i] >= 'a')){ret[i]=s[i]-('a'-'A');}
  }
  return ret;
}
//////////////////////////////////////////////////////////////////
/// \brief true if line is a comment or blank
//
bool IsComment(const char *s, const int Len)
{
  if ((Len==0) || (s[0]=='#') || (s[0]=='*')){return true;}
  return false;
}
//////////////////////////////////////////////////////////////////
/// \brief true if string is a valid (possibly negative) integer
//
bool StringIsLong(const char *s)
{
  if ((s==NULL) || (*s=='\0')){return false;}
  const char *p=s;
  if ((*p=='-') || (*p=='+')){p++;}
  if (*p=='\0'){return false;}
  while (*p!='\0'){
    if ((*p<'0') || (*p>'9')){return false;}
    p++;
  }
  return true;
}
//////////////////////////////////////////////////////////////////
/// \brief corrects filename for path relative to the file in which it was referenced
/// \param filename [in] filename, possibly relative
/// \param relfile [in] file (with path) in which filename was referenced
//
string CorrectForRelativePath(const string filename,const string relfile)
{
  if (filename.length()==0){return filename;}
  if ((filename[0]=='/') || (filename[0]=='\\')){return filename;} //absolute path
  if ((filename.length()>1) && (filename[1]==':')){return filename;} //windows drive

  size_t pos=relfile.find_last_of("/\\");
  if (pos==string::npos){return filename;}
  return relfile.substr(0,pos+1)+filename;
}

//////////////////////////////////////////////////////////////////
/// \brief writes warning to screen and to Cascade_errors.txt file
/// \param warn [in] warning message printed
/// \param noisy [in] true if warning should also be written to screen
//
void WriteWarning(const string warn, bool noisy)
{
  if (!g_suppress_warnings){
    ofstream WARNINGS;
    WARNINGS.open((g_output_directory+"Cascade_errors.txt").c_str(),ios::app);
    if (noisy){cout<<"WARNING!: "<<warn<<endl;}
    WARNINGS<<"WARNING  : "<<warn<<endl;
    WARNINGS.close();
  }
}
/////////////////////////////////////////////////////////////////
/// \brief writes advisory to screen and to Cascade_errors.txt file
/// \param warn [in] advisory message printed
//
void WriteAdvisory(const string warn, bool noisy)
{
  if (!g_suppress_warnings){
    ofstream WARNINGS;
    WARNINGS.open((g_output_directory+"Cascade_errors.txt").c_str(),ios::app);
    if (noisy){cout<<"ADVISORY: "<<warn<<endl;}
    WARNINGS<<"ADVISORY : "<<warn<<endl;
    WARNINGS.close();
  }
}
///////////////////////////////////////////////////////////////////
/// \brief NetCDF error handling
//
void HandleNetCDFErrors(int error_code)
{
#ifdef _CASCADE_NETCDF_
  if(error_code==0){ return; }
  string warn="NetCDF error ["+ string(nc_strerror(error_code))+"] occured.";
  ExitGracefully(warn.c_str(),FILE_OPEN_ERR);
#endif
}
