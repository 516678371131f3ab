/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------*/
#include "CascadeTopology.h"

//////////////////////////////////////////////////////////////////
/// \brief cascade topology constructor; creates empty network
//
CCascadeTopology::CCascadeTopology()
{
  _pReservoirs=NULL; _nReservoirs=0;
  _pPolicies  =NULL;
  _pLinks     =NULL; _nLinks     =0;
  _pInflows   =NULL; _nInflows   =0;
  _pForcings  =NULL; _nForcings  =0;
  _pForecasts =NULL; _nForecasts =0;

  _initialized   =false;
  _aInflowInd    =NULL;
  _aForecastInd  =NULL;
  _aDepth        =NULL;
  _maxDepth      =0;
  _aOrderedResInd=NULL;
  _nInLinks      =NULL;
  _aInLinks      =NULL;
  _nOutLinks     =NULL;
}

//////////////////////////////////////////////////////////////////
/// \brief destructor; deletes all owned entities
//
CCascadeTopology::~CCascadeTopology()
{
  DeleteNetworkArrays();
  for (int p=0;p<_nReservoirs;p++){delete _pReservoirs[p]; delete _pPolicies[p];}
  for (int i=0;i<_nLinks;     i++){delete _pLinks[i];    }
  for (int i=0;i<_nInflows;   i++){delete _pInflows[i];  }
  for (int i=0;i<_nForcings;  i++){delete _pForcings[i]; }
  for (int i=0;i<_nForecasts; i++){delete _pForecasts[i];}
  delete [] _pReservoirs; _pReservoirs=NULL;
  delete [] _pPolicies;   _pPolicies  =NULL;
  delete [] _pLinks;      _pLinks     =NULL;
  delete [] _pInflows;    _pInflows   =NULL;
  delete [] _pForcings;   _pForcings  =NULL;
  delete [] _pForecasts;  _pForecasts =NULL;
}
void CCascadeTopology::DeleteNetworkArrays()
{
  if (_aInLinks!=NULL){
    for (int p=0;p<_nReservoirs;p++){delete [] _aInLinks[p];}
  }
  delete [] _aInLinks;       _aInLinks      =NULL;
  delete [] _nInLinks;       _nInLinks      =NULL;
  delete [] _nOutLinks;      _nOutLinks     =NULL;
  delete [] _aInflowInd;     _aInflowInd    =NULL;
  delete [] _aForecastInd;   _aForecastInd  =NULL;
  delete [] _aDepth;         _aDepth        =NULL;
  delete [] _aOrderedResInd; _aOrderedResInd=NULL;
}

/*****************************************************************
   Manipulators
*****************************************************************/
//////////////////////////////////////////////////////////////////
/// \brief adds reservoir to network with default operating policy
/// \param *pRes [in] (valid) pointer to reservoir; topology takes ownership
//
void CCascadeTopology::AddReservoir(CReservoir *pRes)
{
  ExitGracefullyIf(_initialized,"CCascadeTopology::AddReservoir: cannot modify network after initialization",RUNTIME_ERR);
  int N=_nReservoirs;
  if (!DynArrayAppend((void**&)(_pReservoirs),(void*)(pRes),_nReservoirs)){
    ExitGracefully("CCascadeTopology::AddReservoir: adding NULL reservoir",BAD_DATA);}
  COperatingPolicy *pPol=new COperatingPolicy();
  DynArrayAppend((void**&)(_pPolicies),(void*)(pPol),N);
}
void CCascadeTopology::AddRoutingLink(CRoutingLink *pLink)
{
  ExitGracefullyIf(_initialized,"CCascadeTopology::AddRoutingLink: cannot modify network after initialization",RUNTIME_ERR);
  if (!DynArrayAppend((void**&)(_pLinks),(void*)(pLink),_nLinks)){
    ExitGracefully("CCascadeTopology::AddRoutingLink: adding NULL link",BAD_DATA);}
}
void CCascadeTopology::AddInflowSeries(CTimeSeries *pTS)
{
  if (!DynArrayAppend((void**&)(_pInflows),(void*)(pTS),_nInflows)){
    ExitGracefully("CCascadeTopology::AddInflowSeries: adding NULL time series",BAD_DATA);}
}
void CCascadeTopology::AddForcingSeries(CTimeSeries *pTS)
{
  if (!DynArrayAppend((void**&)(_pForcings),(void*)(pTS),_nForcings)){
    ExitGracefully("CCascadeTopology::AddForcingSeries: adding NULL time series",BAD_DATA);}
}
void CCascadeTopology::AddForecastAdapter(CForecastAdapter *pFA)
{
  if (!DynArrayAppend((void**&)(_pForecasts),(void*)(pFA),_nForecasts)){
    ExitGracefully("CCascadeTopology::AddForecastAdapter: adding NULL forecast",BAD_DATA);}
}
//////////////////////////////////////////////////////////////////
/// \brief replaces operating policy of reservoir
/// \param res_ID [in] reservoir ID
/// \param pPolicy [in] new policy; topology takes ownership
//
void CCascadeTopology::SetPolicy(const long res_ID, COperatingPolicy *pPolicy)
{
  int p=GetReservoirIndex(res_ID);
  ExitGracefullyIf(p==INDEX_NOT_FOUND,
    ("CCascadeTopology::SetPolicy: reservoir ID "+to_string(res_ID)+" not found").c_str(),BAD_DATA);
  ExitGracefullyIf(pPolicy==NULL,"CCascadeTopology::SetPolicy: NULL policy",RUNTIME_ERR);
  if (pPolicy!=_pPolicies[p]){delete _pPolicies[p];}
  _pPolicies[p]=pPolicy;
}

/*****************************************************************
   Accessors
*****************************************************************/
int  CCascadeTopology::GetNumReservoirs() const {return _nReservoirs;}
int  CCascadeTopology::GetNumLinks     () const {return _nLinks;}
int  CCascadeTopology::GetNumForecasts () const {return _nForecasts;}
bool CCascadeTopology::IsInitialized   () const {return _initialized;}
int  CCascadeTopology::GetMaxDepth     () const {return _maxDepth;}

CReservoir *CCascadeTopology::GetReservoir(const int p) const
{
  ExitGracefullyIf((p<0) || (p>=_nReservoirs),"CCascadeTopology::GetReservoir: bad index",RUNTIME_ERR);
  return _pReservoirs[p];
}
COperatingPolicy *CCascadeTopology::GetPolicy(const int p) const
{
  ExitGracefullyIf((p<0) || (p>=_nReservoirs),"CCascadeTopology::GetPolicy: bad index",RUNTIME_ERR);
  return _pPolicies[p];
}
CRoutingLink *CCascadeTopology::GetLink(const int i) const
{
  ExitGracefullyIf((i<0) || (i>=_nLinks),"CCascadeTopology::GetLink: bad index",RUNTIME_ERR);
  return _pLinks[i];
}
//////////////////////////////////////////////////////////////////
/// \brief returns index of reservoir with given ID, or INDEX_NOT_FOUND
//
int CCascadeTopology::GetReservoirIndex(const long ID) const
{
  for (int p=0;p<_nReservoirs;p++){
    if (_pReservoirs[p]->GetID()==ID){return p;}
  }
  return INDEX_NOT_FOUND;
}
CReservoir *CCascadeTopology::GetReservoirByID(const long ID) const
{
  int p=GetReservoirIndex(ID);
  if (p==INDEX_NOT_FOUND){return NULL;}
  return _pReservoirs[p];
}
const CTimeSeries *CCascadeTopology::GetForcingSeries(const long loc_ID) const
{
  for (int i=0;i<_nForcings;i++){
    if (_pForcings[i]->GetLocID()==loc_ID){return _pForcings[i];}
  }
  return NULL;
}
//////////////////////////////////////////////////////////////////
/// \brief returns external inflow series with location ID loc_ID (NULL if none); usable prior to initialization
//
const CTimeSeries *CCascadeTopology::FindInflowSeries(const long loc_ID) const
{
  for (int i=0;i<_nInflows;i++){
    if (_pInflows[i]->GetLocID()==loc_ID){return _pInflows[i];}
  }
  return NULL;
}
//////////////////////////////////////////////////////////////////
/// \brief returns external inflow series of reservoir p (NULL if none); valid after initialization
//
const CTimeSeries *CCascadeTopology::GetInflowSeries(const int p) const
{
  ExitGracefullyIf(!_initialized,"CCascadeTopology::GetInflowSeries: network not initialized",RUNTIME_ERR);
  if (_aInflowInd[p]==DOESNT_EXIST){return NULL;}
  return _pInflows[_aInflowInd[p]];
}
//////////////////////////////////////////////////////////////////
/// \brief returns forecast adapter of reservoir p (NULL if reservoir does not use forecasts)
//
CForecastAdapter *CCascadeTopology::GetForecastAdapter(const int p) const
{
  ExitGracefullyIf(!_initialized,"CCascadeTopology::GetForecastAdapter: network not initialized",RUNTIME_ERR);
  if (_aForecastInd[p]==DOESNT_EXIST){return NULL;}
  return _pForecasts[_aForecastInd[p]];
}
//////////////////////////////////////////////////////////////////
/// \brief returns index of i-th reservoir in evaluation order (upstream to downstream)
//
int CCascadeTopology::GetOrderedResIndex(const int i) const
{
  ExitGracefullyIf(!_initialized,"CCascadeTopology::GetOrderedResIndex: network not initialized",RUNTIME_ERR);
  return _aOrderedResInd[i];
}
int CCascadeTopology::GetDepth(const int p) const
{
  ExitGracefullyIf(!_initialized,"CCascadeTopology::GetDepth: network not initialized",RUNTIME_ERR);
  return _aDepth[p];
}
bool CCascadeTopology::IsOutlet(const int p) const
{
  ExitGracefullyIf(!_initialized,"CCascadeTopology::IsOutlet: network not initialized",RUNTIME_ERR);
  return (_nOutLinks[p]==0);
}
int CCascadeTopology::GetNumInLinks(const int p) const
{
  ExitGracefullyIf(!_initialized,"CCascadeTopology::GetNumInLinks: network not initialized",RUNTIME_ERR);
  return _nInLinks[p];
}
//////////////////////////////////////////////////////////////////
/// \brief returns external inflow to reservoir p during step n [m3/s] (zero if no series)
//
double CCascadeTopology::GetExternalInflow(const int p, const int n) const
{
  ExitGracefullyIf(!_initialized,"CCascadeTopology::GetExternalInflow: network not initialized",RUNTIME_ERR);
  if (_aInflowInd[p]==DOESNT_EXIST){return 0.0;}
  return _pInflows[_aInflowInd[p]]->GetValue(n);
}
//////////////////////////////////////////////////////////////////
/// \brief returns sum of routing link contributions to reservoir p during step n [m3/s]
/// \remark all upstream reservoirs of zero-delay links must already have completed step n
//
double CCascadeTopology::GetRoutedInflow(const int p, const int n) const
{
  ExitGracefullyIf(!_initialized,"CCascadeTopology::GetRoutedInflow: network not initialized",RUNTIME_ERR);
  double Q=0.0;
  for (int i=0;i<_nInLinks[p];i++){
    Q+=_pLinks[_aInLinks[p][i]]->GetContribution(n);
  }
  return Q;
}

/*****************************************************************
   Initialization
*****************************************************************/
//////////////////////////////////////////////////////////////////
/// \brief validates the complete configuration; exits with BAD_DATA on the first problem found
/// \remark does not modify any entity
//
void CCascadeTopology::CheckConfiguration(const optStruct &Options) const
{
  int p,pp,i,j;
  string warn;

  ExitGracefullyIf(_nReservoirs==0,"CCascadeTopology::Initialize: no reservoirs in cascade",BAD_DATA);
  ExitGracefullyIf(Options.num_steps<=0,"CCascadeTopology::Initialize: simulation horizon (:NumSteps) must be positive",BAD_DATA);
  ExitGracefullyIf(Options.timestep<=0.0,"CCascadeTopology::Initialize: time step must be positive",BAD_DATA);

  //reservoirs
  //----------------------------------------------------------------------
  for (p=0;p<_nReservoirs;p++)
  {
    for (pp=0;pp<p;pp++){
      if (_pReservoirs[pp]->GetID()==_pReservoirs[p]->GetID()){
        warn="CCascadeTopology::Initialize: duplicate reservoir ID "+to_string(_pReservoirs[p]->GetID());
        ExitGracefully(warn.c_str(),BAD_DATA);
      }
    }
    _pReservoirs[p]->CheckConfiguration();
    _pPolicies  [p]->CheckConfiguration(_pReservoirs[p]->GetName());
  }

  //routing links
  //----------------------------------------------------------------------
  for (i=0;i<_nLinks;i++)
  {
    const CRoutingLink *pL=_pLinks[i];
    string bad=" [bad routing link: "+to_string(pL->GetUpstreamID())+" -> "+to_string(pL->GetDownstreamID())+"]";
    ExitGracefullyIf(GetReservoirIndex(pL->GetUpstreamID())==INDEX_NOT_FOUND,
      ("CCascadeTopology::Initialize: upstream reservoir ID not found"+bad).c_str(),BAD_DATA);
    ExitGracefullyIf(GetReservoirIndex(pL->GetDownstreamID())==INDEX_NOT_FOUND,
      ("CCascadeTopology::Initialize: downstream reservoir ID not found"+bad).c_str(),BAD_DATA);
    ExitGracefullyIf(pL->GetTravelTime()<0,
      ("CCascadeTopology::Initialize: travel time cannot be negative"+bad).c_str(),BAD_DATA);
    ExitGracefullyIf(pL->GetLateralInflow()<0.0,
      ("CCascadeTopology::Initialize: lateral inflow cannot be negative"+bad).c_str(),BAD_DATA);
    ExitGracefullyIf((pL->GetFraction()<=0.0) || (pL->GetFraction()>1.0),
      ("CCascadeTopology::Initialize: routing link fraction must be in (0,1]"+bad).c_str(),BAD_DATA);
    ExitGracefullyIf(pL->GetWarmupFlow()<0.0,
      ("CCascadeTopology::Initialize: warm-up flow cannot be negative"+bad).c_str(),BAD_DATA);
    ExitGracefullyIf((pL->GetUpstreamID()==pL->GetDownstreamID()) && (pL->GetTravelTime()==0),
      ("CCascadeTopology::Initialize: reservoir empties into itself with zero delay: circular reference!"+bad).c_str(),BAD_DATA);
  }
  for (p=0;p<_nReservoirs;p++)
  {
    double fsum=0.0;
    for (i=0;i<_nLinks;i++){
      if (_pLinks[i]->GetUpstreamID()==_pReservoirs[p]->GetID()){fsum+=_pLinks[i]->GetFraction();}
    }
    ExitGracefullyIf(fsum>1.0+REAL_SMALL,
      ("CCascadeTopology::Initialize: fractions of routing links leaving reservoir "+_pReservoirs[p]->GetName()+" sum to more than one").c_str(),BAD_DATA);
  }

  //external inflows
  //----------------------------------------------------------------------
  for (i=0;i<_nInflows;i++)
  {
    const CTimeSeries *pTS=_pInflows[i];
    string bad=" [inflow series for reservoir ID "+to_string(pTS->GetLocID())+"]";
    ExitGracefullyIf(GetReservoirIndex(pTS->GetLocID())==INDEX_NOT_FOUND,
      ("CCascadeTopology::Initialize: reservoir ID not found"+bad).c_str(),BAD_DATA);
    for (j=0;j<i;j++){
      ExitGracefullyIf(_pInflows[j]->GetLocID()==pTS->GetLocID(),
        ("CCascadeTopology::Initialize: more than one inflow series specified"+bad).c_str(),BAD_DATA);
    }
    if (pTS->GetNumValues()<Options.num_steps){
      warn="CCascadeTopology::Initialize: inflow series shorter than simulation horizon ("+
           to_string(pTS->GetNumValues())+" < "+to_string(Options.num_steps)+" steps)"+bad;
      ExitGracefully(warn.c_str(),BAD_DATA);
    }
    ExitGracefullyIf(pTS->HasBlanks(0,Options.num_steps),
      ("CCascadeTopology::Initialize: inflow series contains blank data within simulation horizon"+bad).c_str(),BAD_DATA);
    for (int n=0;n<Options.num_steps;n++){
      ExitGracefullyIf(pTS->GetValue(n)<0.0,
        ("CCascadeTopology::Initialize: inflow series contains negative values"+bad).c_str(),BAD_DATA);
    }
  }

  //forecasts
  //----------------------------------------------------------------------
  for (i=0;i<_nForecasts;i++)
  {
    const CForecastAdapter *pFA=_pForecasts[i];
    string bad=" [forecast for reservoir ID "+to_string(pFA->GetReservoirID())+"]";
    ExitGracefullyIf(GetReservoirIndex(pFA->GetReservoirID())==INDEX_NOT_FOUND,
      ("CCascadeTopology::Initialize: reservoir ID not found"+bad).c_str(),BAD_DATA);
    for (j=0;j<i;j++){
      ExitGracefullyIf(_pForecasts[j]->GetReservoirID()==pFA->GetReservoirID(),
        ("CCascadeTopology::Initialize: more than one forecast specified"+bad).c_str(),BAD_DATA);
    }
    pFA->CheckConfiguration();
  }
}

//////////////////////////////////////////////////////////////////
/// \brief validates network, connects links, determines evaluation order and initializes state
/// \details all configuration errors are reported before any reservoir state is modified
/// \param Options [in] global options
//
void CCascadeTopology::Initialize(const optStruct &Options)
{
  int p,i;

  CheckConfiguration(Options);

  DeleteNetworkArrays();

  //index external inflows and forecasts
  //----------------------------------------------------------------------
  _aInflowInd  =new int [_nReservoirs];
  _aForecastInd=new int [_nReservoirs];
  for (p=0;p<_nReservoirs;p++){_aInflowInd[p]=DOESNT_EXIST;_aForecastInd[p]=DOESNT_EXIST;}
  for (i=0;i<_nInflows;  i++){_aInflowInd  [GetReservoirIndex(_pInflows  [i]->GetLocID      ())]=i;}
  for (i=0;i<_nForecasts;i++){_aForecastInd[GetReservoirIndex(_pForecasts[i]->GetReservoirID())]=i;}

  for (p=0;p<_nReservoirs;p++)
  {
    if ((_aInflowInd[p]==DOESNT_EXIST) && (!Options.silent)){
      WriteAdvisory("CCascadeTopology::Initialize: no external inflow series for reservoir "+_pReservoirs[p]->GetName()+"; external inflow set to zero",Options.noisy);
    }
    if ((_aForecastInd[p]!=DOESNT_EXIST) && (!_pPolicies[p]->UsesPreRelease()) && (!_pPolicies[p]->IsPreReleaseDisabled())){
      _pPolicies[p]->SetPreRelease(DEFAULT_PRERELEASE_FACTOR,DEFAULT_PRERELEASE_GAIN);
    }
    if ((_aForecastInd[p]==DOESNT_EXIST) && (_pPolicies[p]->UsesPreRelease())){
      WriteWarning("CCascadeTopology::Initialize: pre-release specified for reservoir "+_pReservoirs[p]->GetName()+
                   " which has no forecast; pre-release will never be triggered",Options.noisy);
    }
  }

  //connect links
  //----------------------------------------------------------------------
  _nInLinks =new int  [_nReservoirs];
  _nOutLinks=new int  [_nReservoirs];
  _aInLinks =new int *[_nReservoirs];
  for (p=0;p<_nReservoirs;p++){_nInLinks[p]=0;_nOutLinks[p]=0;_aInLinks[p]=NULL;}
  for (i=0;i<_nLinks;i++){
    _nInLinks [GetReservoirIndex(_pLinks[i]->GetDownstreamID())]++;
    _nOutLinks[GetReservoirIndex(_pLinks[i]->GetUpstreamID  ())]++;
  }
  for (p=0;p<_nReservoirs;p++){
    _aInLinks[p]=new int [max(_nInLinks[p],1)];
    _nInLinks[p]=0;
  }
  for (i=0;i<_nLinks;i++){
    p=GetReservoirIndex(_pLinks[i]->GetDownstreamID());
    _aInLinks[p][_nInLinks[p]]=i;
    _nInLinks[p]++;
    _pLinks[i]->SetUpstreamReservoir(_pReservoirs[GetReservoirIndex(_pLinks[i]->GetUpstreamID())]);
  }

  InitializeRoutingNetwork();

  //initialize state
  //----------------------------------------------------------------------
  for (p=0;p<_nReservoirs;p++){_pReservoirs[p]->Initialize(Options);}
  for (i=0;i<_nForecasts; i++){_pForecasts [i]->Initialize(Options);}

  _initialized=true;
}

//////////////////////////////////////////////////////////////////
/// \brief determines evaluation order of reservoirs
/// \details depth of reservoir = 0 if it receives no zero-delay link, otherwise
///  1+max(depth of zero-delay upstream reservoirs). Determined iteratively;
///  a depth >= number of reservoirs implies a zero-delay cycle.
///  Reservoirs are ordered by increasing depth, then insertion order; reservoirs of
///  equal depth do not depend upon each other within a time step.
//
void CCascadeTopology::InitializeRoutingNetwork()
{
  int p,pUp,i,d;
  bool noisy=false;//useful for debugging

  _aDepth=new int [_nReservoirs];
  for (p=0;p<_nReservoirs;p++){_aDepth[p]=0;}

  int iter(0);
  bool changed;
  _maxDepth=0;
  do
  {
    changed=false;
    for (i=0;i<_nLinks;i++)
    {
      if (_pLinks[i]->GetTravelTime()!=0){continue;} //delayed links read finalized history
      pUp=GetReservoirIndex(_pLinks[i]->GetUpstreamID());
      p  =GetReservoirIndex(_pLinks[i]->GetDownstreamID());
      if (_aDepth[p]<_aDepth[pUp]+1){
        _aDepth[p]=_aDepth[pUp]+1;
        upperswap(_maxDepth,_aDepth[p]);
        changed=true;
      }
    }
    iter++;
  } while ((changed) && (_maxDepth<_nReservoirs) && (iter<MAX_CASCADE_ITER));

  ExitGracefullyIf((_maxDepth>=_nReservoirs) || (iter>=MAX_CASCADE_ITER),
    "CCascadeTopology::InitializeRoutingNetwork: zero-delay cycle in routing links: circular reference!",BAD_DATA);

  if (noisy){cout <<"      "<<iter<<" routing order iteration(s) completed"<<endl;}

  int pp=0;
  _aOrderedResInd=new int [_nReservoirs];
  for (d=0;d<=_maxDepth;d++)
  {
    if (noisy){cout<<"      depth["<<d<<"]:";}
    for (p=0;p<_nReservoirs;p++)
    {
      if (_aDepth[p]==d)
      {
        ExitGracefullyIf(pp>=_nReservoirs,"InitializeRoutingNetwork: fatal error",RUNTIME_ERR);
        _aOrderedResInd[pp]=p; pp++;
        if (noisy){cout<<" "<<_pReservoirs[p]->GetName();}
      }
    }
    if (noisy){cout<<endl;}
  }
}
