/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------*/
#include "TimeSeries.h"

//////////////////////////////////////////////////////////////////
/// \brief time series constructor from array of values
/// \param name    [in] time series name
/// \param loc_ID  [in] location (reservoir) ID
/// \param aValues [in] array of values [size: N]
/// \param N       [in] number of values
//
CTimeSeries::CTimeSeries(const string name, const long loc_ID, const double *aValues, const int N)
{
  ExitGracefullyIf(N<0,"CTimeSeries constructor: negative number of values",RUNTIME_ERR);
  _name  =name;
  _loc_ID=loc_ID;
  _nVals =N;
  _aVal  =NULL;
  if (_nVals>0){
    _aVal=new double [_nVals];
    for (int n=0;n<_nVals;n++){_aVal[n]=aValues[n];}
  }
}
//////////////////////////////////////////////////////////////////
/// \brief time series constructor when time series is single constant value
/// \param one_value [in] constant value of time series
/// \param N         [in] number of time steps covered
//
CTimeSeries::CTimeSeries(const string name, const long loc_ID, const double one_value, const int N)
{
  ExitGracefullyIf(N<0,"CTimeSeries constructor: negative number of values",RUNTIME_ERR);
  _name  =name;
  _loc_ID=loc_ID;
  _nVals =N;
  _aVal  =NULL;
  if (_nVals>0){
    _aVal=new double [_nVals];
    for (int n=0;n<_nVals;n++){_aVal[n]=one_value;}
  }
}
//////////////////////////////////////////////////////////////////
/// \brief destructor
//
CTimeSeries::~CTimeSeries()
{
  delete [] _aVal; _aVal=NULL;
}

string CTimeSeries::GetName     () const {return _name;}
long   CTimeSeries::GetLocID    () const {return _loc_ID;}
int    CTimeSeries::GetNumValues() const {return _nVals;}

//////////////////////////////////////////////////////////////////
/// \brief returns value n; exits if out of range
//
double CTimeSeries::GetValue(const int n) const
{
  if ((n<0) || (n>=_nVals)){
    string warn="CTimeSeries::GetValue: index out of range in time series "+_name;
    ExitGracefully(warn.c_str(),RUNTIME_ERR);
  }
  return _aVal[n];
}
//////////////////////////////////////////////////////////////////
/// \brief true if any value in [nstart,nend) is blank or outside of series
//
bool CTimeSeries::HasBlanks(const int nstart, const int nend) const
{
  if ((nstart<0) || (nend>_nVals)){return true;}
  for (int n=nstart;n<nend;n++){
    if (_aVal[n]==CAS_BLANK_DATA){return true;}
  }
  return false;
}

///////////////////////////////////////////////////////////////////
/// \brief parses time series from input file
/// \details format:\n
///   [nMeasurements]\n
///   v1 v2 v3 ... (any number of values per line)\n
///   :EndXXX\n
/// the opening command line (e.g., :InflowSeries [ID]) has already been read
/// \param *p [in] CParser object pointing to input file
/// \param name [in] name of series
/// \param loc_ID [in] reservoir ID to which series applies
/// \return pointer to new time series
//
CTimeSeries *CTimeSeries::Parse(CParser *p, const string name, const long loc_ID, const optStruct &Options)
{
  char *s[MAXINPUTITEMS];
  int   Len;
  int   nMeasurements;

  p->Tokenize(s,Len);
  if (IsComment(s[0],Len)){p->Tokenize(s,Len);}//try again
  if (Len<1){p->ImproperFormat(s); ExitGracefully("CTimeSeries::Parse: missing number of time series points",BAD_DATA);}
  nMeasurements=s_to_i(s[0]);
  ExitGracefullyIf(nMeasurements<=0,"CTimeSeries::Parse: number of time series points must be positive",BAD_DATA);

  double *aVal=new double [nMeasurements];
  int n=0;
  while ((n<nMeasurements) && (!p->Tokenize(s,Len)))
  {
    if (IsComment(s[0],Len)){continue;}
    for (int i=0;i<Len;i++){
      if (n>=nMeasurements){
        ExitGracefully("CTimeSeries::Parse: Bad number of time series points",BAD_DATA);
      }
      if (!is_numeric(s[i])){
        ExitGracefully(("Non-numeric value found in time series (line "+to_string(p->GetLineNumber())+" of file "+p->GetFilename()+")").c_str(),BAD_DATA);
      }
      aVal[n]=s_to_d(s[i]);
      n++;
    }
  }
  if (n!=nMeasurements){
    ExitGracefully(("CTimeSeries::Parse: Bad number of time series points in series "+name).c_str(),BAD_DATA);}

  p->Tokenize(s,Len);//read closing term (e.g., ":EndInflowSeries")
  if ((Len<1) || (string(s[0]).substr(0,4)!=":End")){
    ExitGracefully("CTimeSeries::Parse: exceeded specified number of time series points in sequence or no :End command used.",BAD_DATA);
  }
  if (Options.noisy){cout<<"  "<<name<<": "<<n<<" values read"<<endl;}

  CTimeSeries *pTS=new CTimeSeries(name,loc_ID,aVal,n);
  delete [] aVal;
  return pTS;
}
