/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------*/
#include "Reservoir.h"

//////////////////////////////////////////////////////////////////
/// \brief Base Constructor for reservoir called by all other constructors
/// \param name [in] reservoir name
/// \param ID [in] unique reservoir ID
/// \param capacity [in] maximum storage [m3]
/// \param max_release [in] maximum release rate [m3/s]
//
void CReservoir::BaseConstructor(const string name,const long ID,const double capacity,const double max_release)
{
  _name=name;
  _ID  =ID;

  _max_capacity     =capacity;
  _max_release      =max_release;
  _flood_limit_stage=ALMOST_INF;
  for (int i=0;i<NUM_RES_ZONES-1;i++){_aZoneBounds[i]=0.0;}
  _zones_set=false;

  _Np     =0;
  _aStage =NULL;
  _aVolume=NULL;

  _initial_storage=0.0;

  _storage     =0.0;
  _storage_last=0.0;
  _stage       =0.0;
  _zone        =ZONE_DEAD;
  _Qout        =0.0;

  _aQoutHist =NULL;
  _nHist     =0;
  _nCompleted=0;
}

//////////////////////////////////////////////////////////////////
/// \brief Constructor for reservoir with tabular stage-storage curve
/// \param a_ht [in] array of stages [m] [size: nPoints]
/// \param a_V [in] array of storage volumes [m3] [size: nPoints]
/// \param nPoints [in] number of points on curve (>=2)
/// \note curve monotonicity is checked in CheckConfiguration()
//
CReservoir::CReservoir(const string name, const long ID,
                       const double capacity, const double max_release,
                       const double *a_ht, const double *a_V, const int nPoints)
{
  BaseConstructor(name,ID,capacity,max_release);

  ExitGracefullyIf(nPoints<2,
    ("CReservoir constructor: stage-storage curve must have at least two points [bad reservoir: "+_name+"]").c_str(),BAD_DATA);
  _Np     =nPoints;
  _aStage =new double [_Np];
  _aVolume=new double [_Np];
  for (int i=0;i<_Np;i++){
    _aStage [i]=a_ht[i];
    _aVolume[i]=a_V [i];
  }
}

//////////////////////////////////////////////////////////////////
/// \brief Constructor for prismatic reservoir (constant surface area)
/// \param bottom_elev [in] stage at zero storage [m]
/// \param area [in] surface area [m2]
//
CReservoir::CReservoir(const string name, const long ID,
                       const double capacity, const double max_release,
                       const double bottom_elev, const double area)
{
  BaseConstructor(name,ID,capacity,max_release);

  ExitGracefullyIf(area<=0.0,
    ("CReservoir constructor: prismatic reservoir area must be positive [bad reservoir: "+_name+"]").c_str(),BAD_DATA);
  _Np     =2;
  _aStage =new double [_Np];
  _aVolume=new double [_Np];
  _aStage [0]=bottom_elev;
  _aVolume[0]=0.0;
  _aStage [1]=bottom_elev+max(capacity,1.0)/area;
  _aVolume[1]=max(capacity,1.0);
}

//////////////////////////////////////////////////////////////////
/// \brief Destructor
//
CReservoir::~CReservoir()
{
  delete [] _aStage;    _aStage   =NULL;
  delete [] _aVolume;   _aVolume  =NULL;
  delete [] _aQoutHist; _aQoutHist=NULL;
}

/*****************************************************************
   Accessors
*****************************************************************/
string   CReservoir::GetName             () const { return _name; }
long     CReservoir::GetID               () const { return _ID; }
double   CReservoir::GetMaxCapacity      () const { return _max_capacity; }
double   CReservoir::GetMaxReleaseRate   () const { return _max_release; }
double   CReservoir::GetInitialStorage   () const { return _initial_storage; }
double   CReservoir::GetStorage          () const { return _storage; }
double   CReservoir::GetOldStorage       () const { return _storage_last; }
double   CReservoir::GetStage            () const { return _stage; }
res_zone CReservoir::GetCurrentZone      () const { return _zone; }
double   CReservoir::GetOutflowRate      () const { return _Qout; }
int      CReservoir::GetNumCompletedSteps() const { return _nCompleted; }

//////////////////////////////////////////////////////////////////
/// \brief returns flood limit stage [m] (stage at capacity if never specified)
//
double CReservoir::GetFloodLimitStage() const
{
  if (_flood_limit_stage==ALMOST_INF){return GetStageFromStorage(_max_capacity);}
  return _flood_limit_stage;
}
//////////////////////////////////////////////////////////////////
/// \brief returns zone boundary i (lower edge of zone i+1)
/// \details if boundaries were never specified, the whole range up to capacity is NORMAL
//
double CReservoir::GetZoneBoundary(const int i) const
{
  ExitGracefullyIf((i<0) || (i>=NUM_RES_ZONES-1),"CReservoir::GetZoneBoundary: bad index",RUNTIME_ERR);
  if (!_zones_set){
    if      (i==0){return GetStageFromStorage(0.0);}
    else if (i==1){return GetStageFromStorage(_max_capacity);}
    else          {return ALMOST_INF;}
  }
  return _aZoneBounds[i];
}
//////////////////////////////////////////////////////////////////
/// \brief returns lower boundary stage of zone [m]
/// \note dead zone has no lower boundary; returns stage at empty reservoir
//
double CReservoir::GetZoneBottom(const res_zone zone) const
{
  if (zone==ZONE_DEAD){return GetStageFromStorage(0.0);}
  return GetZoneBoundary((int)(zone)-1);
}
//////////////////////////////////////////////////////////////////
/// \brief returns upper boundary stage of zone [m]
/// \note surcharge zone is open-ended; returns stage at full capacity
//
double CReservoir::GetZoneTop(const res_zone zone) const
{
  if (zone==ZONE_SURCHARGE){return GetStageFromStorage(_max_capacity);}
  return GetZoneBoundary((int)(zone));
}

//////////////////////////////////////////////////////////////////
/// \brief returns actual release recorded during completed time step n [m3/s]
/// \param n [in] time step index (0<=n<number of completed steps)
//
double CReservoir::GetOutflowHistory(const int n) const
{
  if ((n<0) || (n>=_nCompleted)){
    string warn="CReservoir::GetOutflowHistory: outflow requested for step "+to_string(n)+
                " which has not been completed [reservoir "+_name+"]";
    ExitGracefully(warn.c_str(),RUNTIME_ERR);
  }
  return _aQoutHist[n];
}

//////////////////////////////////////////////////////////////////
/// \brief interpolates stage from stage-storage curve
/// \param V [in] storage [m3]
/// \returns stage [m]
//
double CReservoir::GetStageFromStorage(const double &V) const
{
  return InterpolateCurve(V,_aVolume,_aStage,_Np,true);
}
//////////////////////////////////////////////////////////////////
/// \brief interpolates storage from stage-storage curve
/// \param ht [in] stage [m]
/// \returns storage [m3]
//
double CReservoir::GetStorageFromStage(const double &ht) const
{
  return InterpolateCurve(ht,_aStage,_aVolume,_Np,true);
}
//////////////////////////////////////////////////////////////////
/// \brief returns operating zone corresponding to stage
/// \details boundaries are inclusive on the lower edge; the surcharge zone is open-ended upward
/// \param ht [in] stage [m]
//
res_zone CReservoir::GetZone(const double &ht) const
{
  int z=0;
  for (int i=0;i<NUM_RES_ZONES-1;i++){
    if (ht>=GetZoneBoundary(i)){z=i+1;}
  }
  return (res_zone)(z);
}

/*****************************************************************
   Manipulators
*****************************************************************/
//////////////////////////////////////////////////////////////////
/// \brief sets operating zone boundaries; also sets flood limit stage to flood_limit
/// \param dead_top [in] top of dead pool [m]
/// \param flood_limit [in] flood limit stage (bottom of flood control pool) [m]
/// \param surcharge [in] design flood stage (bottom of surcharge pool) [m]
//
void CReservoir::SetZoneBoundaries(const double dead_top, const double flood_limit, const double surcharge)
{
  _aZoneBounds[0]=dead_top;
  _aZoneBounds[1]=flood_limit;
  _aZoneBounds[2]=surcharge;
  _zones_set=true;
  _flood_limit_stage=flood_limit;
}
void CReservoir::SetFloodLimitStage(const double &ht){_flood_limit_stage=ht;}
void CReservoir::SetInitialStorage (const double &V ){_initial_storage=V;}
void CReservoir::SetInitialStage   (const double &ht){_initial_storage=GetStorageFromStage(ht);}

//////////////////////////////////////////////////////////////////
/// \brief checks static reservoir parameters; exits with a description of the offending quantity
/// \remark called prior to any state initialization
//
void CReservoir::CheckConfiguration() const
{
  string bad=" [bad reservoir: "+_name+" "+to_string(_ID)+"]";

  ExitGracefullyIf(_max_capacity<=0.0,
    ("CReservoir: maximum capacity must be positive"+bad).c_str(),BAD_DATA);
  ExitGracefullyIf(_max_release<0.0,
    ("CReservoir: maximum release rate cannot be negative"+bad).c_str(),BAD_DATA);
  ExitGracefullyIf(!IsMonotonicIncreasing(_aStage,_Np),
    ("CReservoir: stage-storage curve stages must be strictly increasing"+bad).c_str(),BAD_DATA);
  ExitGracefullyIf(!IsMonotonicIncreasing(_aVolume,_Np),
    ("CReservoir: stage-storage relationship must be monotonically increasing for all stages"+bad).c_str(),BAD_DATA);
  if (_zones_set){
    ExitGracefullyIf(!IsMonotonicIncreasing(_aZoneBounds,NUM_RES_ZONES-1),
      ("CReservoir: operating zone boundaries must be strictly ordered (dead < flood limit < surcharge)"+bad).c_str(),BAD_DATA);
  }
  ExitGracefullyIf((_initial_storage<0.0) || (_initial_storage>_max_capacity),
    ("CReservoir: initial storage must be between zero and maximum capacity"+bad).c_str(),BAD_DATA);
}

//////////////////////////////////////////////////////////////////
/// \brief initializes state variables and allocates outflow history
/// \param Options [in] global options (num_steps sets history size)
//
void CReservoir::Initialize(const optStruct &Options)
{
  delete [] _aQoutHist;
  _nHist    =max(Options.num_steps,1);
  _aQoutHist=new double [_nHist];
  for (int n=0;n<_nHist;n++){_aQoutHist[n]=0.0;}
  _nCompleted=0;

  _storage     =_initial_storage;
  _storage_last=_initial_storage;
  _Qout        =0.0;
  UpdateDerivedState();
}

//////////////////////////////////////////////////////////////////
/// \brief recalculates cached stage and zone from current storage
//
void CReservoir::UpdateDerivedState()
{
  _stage=GetStageFromStorage(_storage);
  _zone =GetZone(_stage);
}

//////////////////////////////////////////////////////////////////
/// \brief applies mass balance over time step n, committing new storage and actual release
/// \details new storage S'=S+(Qin-Q)*dt.
///  If S'>capacity, the excess is spilled (release increased by excess/dt).
///  If S'<0, the release is capped at S/dt+Qin so storage cannot go negative.
///  The actual (adjusted) release is recorded in the outflow history and returned.
///
/// \param Qin [in] total inflow over time step [m3/s]
/// \param Qrequested [in] requested release [m3/s]
/// \param tstep [in] time step [s]
/// \param n [in] time step index; must equal the number of completed steps
/// \param flags [out] bitwise step_diag flags raised during this step
/// \returns actual release [m3/s]
//
double CReservoir::ApplyMassBalance(const double &Qin,
                                    const double &Qrequested,
                                    const double &tstep,
                                    const int     n,
                                          int    &flags)
{
  if ((n!=_nCompleted) || (n>=_nHist)){
    string warn="CReservoir::ApplyMassBalance: time steps must be applied sequentially within horizon [reservoir "+_name+"]";
    ExitGracefully(warn.c_str(),RUNTIME_ERR);
  }

  double Q    =max(Qrequested,0.0);
  double Vnew =_storage+(Qin-Q)*tstep;
  res_zone old_zone=_zone;

  flags=DIAG_NONE;
  if (Vnew>_max_capacity)
  {
    Q   +=(Vnew-_max_capacity)/tstep; //forced spill
    Vnew =_max_capacity;
    flags|=DIAG_FORCED_SPILL;
  }
  else if (Vnew<0.0)
  {
    Q    =max(_storage/tstep+Qin,0.0); //release cannot draw reservoir below empty
    Vnew =0.0;
    flags|=DIAG_RELEASE_CAPPED;
  }

  //commit state - all or nothing
  _storage_last   =_storage;
  _storage        =Vnew;
  _Qout           =Q;
  _aQoutHist[n]   =Q;
  _nCompleted++;
  UpdateDerivedState();

  if (abs((int)(_zone)-(int)(old_zone))>1){flags|=DIAG_ZONE_JUMP;}
  if (_stage>GetFloodLimitStage()+REAL_SMALL){flags|=DIAG_FLOOD_LIMIT_EXCEEDED;}

  return Q;
}
