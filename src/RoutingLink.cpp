/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------*/
#include "RoutingLink.h"

//////////////////////////////////////////////////////////////////
/// \brief routing link constructor
/// \param up_ID [in] upstream reservoir ID
/// \param down_ID [in] downstream reservoir ID
/// \param travel_time [in] travel time [time steps]; validated in CCascadeTopology::Initialize
/// \param Qlat [in] constant lateral inflow [m3/s]
//
CRoutingLink::CRoutingLink(const long up_ID, const long down_ID, const int travel_time, const double Qlat)
{
  _up_ID      =up_ID;
  _down_ID    =down_ID;
  _travel_time=travel_time;
  _Qlateral   =Qlat;
  _fraction   =1.0;
  _Qwarmup    =0.0;
  _pUpstream  =NULL;
}
CRoutingLink::~CRoutingLink(){}

long   CRoutingLink::GetUpstreamID   () const {return _up_ID;}
long   CRoutingLink::GetDownstreamID () const {return _down_ID;}
int    CRoutingLink::GetTravelTime   () const {return _travel_time;}
double CRoutingLink::GetLateralInflow() const {return _Qlateral;}
double CRoutingLink::GetFraction     () const {return _fraction;}
double CRoutingLink::GetWarmupFlow   () const {return _Qwarmup;}

void   CRoutingLink::SetFraction (const double &frac){_fraction=frac;}
void   CRoutingLink::SetWarmupFlow(const double &Q   ){_Qwarmup =Q;}
void   CRoutingLink::SetUpstreamReservoir(const CReservoir *pRes){_pUpstream=pRes;}

//////////////////////////////////////////////////////////////////
/// \brief returns flow delivered to downstream reservoir during time step n [m3/s]
/// \details fraction*Qup(n-travel_time) + Qlat; warm-up flow substituted for Qup when n-travel_time<0
/// \param n [in] current time step index
//
double CRoutingLink::GetContribution(const int n) const
{
  ExitGracefullyIf(_pUpstream==NULL,"CRoutingLink::GetContribution: link not connected to upstream reservoir",RUNTIME_ERR);

  double Qup;
  int nlag=n-_travel_time;
  if (nlag<0){Qup=_Qwarmup;}
  else       {Qup=_pUpstream->GetOutflowHistory(nlag);}

  return _fraction*Qup+_Qlateral;
}
