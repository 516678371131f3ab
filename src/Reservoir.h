/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------
  Reservoir.h
  ------------------------------------------------------------------
  defines reservoir with stage-storage relationship, operating
  zones, and mass-balance-constrained release
  ----------------------------------------------------------------*/
#ifndef RESERVOIR_H
#define RESERVOIR_H

#include "CascadeInclude.h"

/*****************************************************************
   Class CReservoir
------------------------------------------------------------------
   Data Abstraction for reservoir
******************************************************************/
class CReservoir
{
private:/*-------------------------------------------------------*/
  string       _name;                ///< reservoir name
  long         _ID;                  ///< unique reservoir ID
  double       _max_capacity;        ///< maximum reservoir storage [m3]
  double       _max_release;         ///< maximum instantaneous release rate [m3/s]
  double       _flood_limit_stage;   ///< flood limit stage [m]
  double       _aZoneBounds[NUM_RES_ZONES-1]; ///< lower boundary stage of NORMAL, FLOOD_CONTROL, SURCHARGE zones [m]
  bool         _zones_set;           ///< true if zone boundaries have been specified

  //stage-storage curve:
  int          _Np;                  ///< number of points on stage-storage curve
  double      *_aStage;              ///< stage elevation [m] [size: _Np]
  double      *_aVolume;             ///< storage volume [m3] [size: _Np]

  double       _initial_storage;     ///< storage at start of simulation [m3]

  //state variables :
  double       _storage;             ///< current storage [m3]
  double       _storage_last;        ///< storage at beginning of current time step [m3]
  double       _stage;               ///< current stage [m] (derived from storage)
  res_zone     _zone;                ///< current operating zone (derived from stage)
  double       _Qout;                ///< actual release over last completed time step [m3/s]

  //history:
  double      *_aQoutHist;           ///< actual release recorded for each completed step [m3/s] [size: _nHist]
  int          _nHist;               ///< size of history array (simulation horizon)
  int          _nCompleted;          ///< number of completed time steps

  void       BaseConstructor(const string name,const long ID,const double capacity,const double max_release);
  void       UpdateDerivedState();

  CReservoir(const CReservoir &res);   //suppresses default copy constructor
  CReservoir &operator=(const CReservoir &res);

public:/*-------------------------------------------------------*/
  //Constructors:
  CReservoir(const string name, const long ID,
             const double capacity, const double max_release,
             const double *a_ht, const double *a_V, const int nPoints);
  CReservoir(const string name, const long ID,               //prismatic constructor
             const double capacity, const double max_release,
             const double bottom_elev, const double area);
  ~CReservoir();

  //Accessors
  string    GetName              () const;
  long      GetID                () const;
  double    GetMaxCapacity       () const; //[m3]
  double    GetMaxReleaseRate    () const; //[m3/s]
  double    GetFloodLimitStage   () const; //[m]
  double    GetZoneBoundary      (const int i) const; //[m]
  double    GetZoneBottom        (const res_zone zone) const; //[m]
  double    GetZoneTop           (const res_zone zone) const; //[m]
  double    GetInitialStorage    () const; //[m3]
  double    GetStorage           () const; //[m3]
  double    GetOldStorage        () const; //[m3]
  double    GetStage             () const; //[m]
  res_zone  GetCurrentZone       () const;
  double    GetOutflowRate       () const; //[m3/s]
  double    GetOutflowHistory    (const int n) const; //[m3/s]
  int       GetNumCompletedSteps () const;

  double    GetStageFromStorage  (const double &V ) const; //[m]
  double    GetStorageFromStage  (const double &ht) const; //[m3]
  res_zone  GetZone              (const double &ht) const;

  //Manipulators
  void      SetZoneBoundaries    (const double dead_top, const double flood_limit, const double surcharge);
  void      SetFloodLimitStage   (const double &ht);
  void      SetInitialStorage    (const double &V);
  void      SetInitialStage      (const double &ht);

  void      CheckConfiguration   () const;
  void      Initialize           (const optStruct &Options);

  double    ApplyMassBalance     (const double &Qin,
                                  const double &Qrequested,
                                  const double &tstep,
                                  const int     n,
                                        int    &flags);
};
#endif
