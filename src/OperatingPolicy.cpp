/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------*/
#include "OperatingPolicy.h"

//////////////////////////////////////////////////////////////////
/// \brief policy constructor; all zones use their default rule and pre-release is off
//
COperatingPolicy::COperatingPolicy()
{
  _pre_release_on    =false;
  _pre_release_off   =false;
  _pre_release_factor=DEFAULT_PRERELEASE_FACTOR;
  _pre_release_gain  =DEFAULT_PRERELEASE_GAIN;
}
COperatingPolicy::~COperatingPolicy(){}

//////////////////////////////////////////////////////////////////
/// \brief sets release rule for zone
/// \param zone [in] operating zone
/// \param type [in] rule kind
/// \param v1 [in] first rule parameter
/// \param v2 [in] second rule parameter
//
void COperatingPolicy::SetZoneRule(const res_zone zone, const release_rule type, const double v1, const double v2)
{
  ZoneRule rule;
  rule.type  =type;
  rule.value1=v1;
  rule.value2=v2;
  rule.is_set=true;
  SetZoneRule(zone,rule);
}
void COperatingPolicy::SetZoneRule(const res_zone zone, const ZoneRule &rule)
{
  ExitGracefullyIf(((int)(zone)<0) || ((int)(zone)>=NUM_RES_ZONES),"COperatingPolicy::SetZoneRule: bad zone",RUNTIME_ERR);
  _aRules[(int)(zone)]=rule;
  _aRules[(int)(zone)].is_set=true;
}
//////////////////////////////////////////////////////////////////
/// \brief enables forecast-triggered pre-release
/// \param factor [in] trigger ratio (forecast peak / current inflow)
/// \param gain [in] pre-release as multiple of current inflow
//
void COperatingPolicy::SetPreRelease(const double factor, const double gain)
{
  _pre_release_on    =true;
  _pre_release_off   =false;
  _pre_release_factor=factor;
  _pre_release_gain  =gain;
}
//////////////////////////////////////////////////////////////////
/// \brief switches pre-release off, including the default enabled for reservoirs with a forecast
//
void COperatingPolicy::DisablePreRelease()
{
  _pre_release_on =false;
  _pre_release_off=true;
}

bool   COperatingPolicy::UsesPreRelease     () const {return _pre_release_on;}
bool   COperatingPolicy::IsPreReleaseDisabled() const {return _pre_release_off;}
double COperatingPolicy::GetPreReleaseFactor() const {return _pre_release_factor;}
double COperatingPolicy::GetPreReleaseGain  () const {return _pre_release_gain;}

//////////////////////////////////////////////////////////////////
/// \brief returns rule applied in zone, substituting zone default if not set
/// \details DEAD: constant 0; NORMAL: pass inflow; FLOOD_CONTROL and SURCHARGE: maximum release
//
ZoneRule COperatingPolicy::GetZoneRule(const res_zone zone) const
{
  if (_aRules[(int)(zone)].is_set){return _aRules[(int)(zone)];}

  ZoneRule rule;
  switch(zone)
  {
  case(ZONE_DEAD):          {rule.type=RULE_CONSTANT;    rule.value1=0.0;break;}
  case(ZONE_NORMAL):        {rule.type=RULE_PASS_INFLOW; rule.value1=1.0;break;}
  case(ZONE_FLOOD_CONTROL): {rule.type=RULE_MAX_RELEASE; break;}
  case(ZONE_SURCHARGE):     {rule.type=RULE_MAX_RELEASE; break;}
  }
  return rule;
}

//////////////////////////////////////////////////////////////////
/// \brief checks rule parameters; exits on invalid values
/// \param resname [in] name of reservoir to which policy is attached (for error messages)
//
void COperatingPolicy::CheckConfiguration(const string &resname) const
{
  string bad=" [bad policy for reservoir: "+resname+"]";
  if (_pre_release_on){
    ExitGracefullyIf(_pre_release_factor<=0.0,
      ("COperatingPolicy: pre-release trigger factor must be positive"+bad).c_str(),BAD_DATA);
    ExitGracefullyIf(_pre_release_gain<0.0,
      ("COperatingPolicy: pre-release gain cannot be negative"+bad).c_str(),BAD_DATA);
  }
  for (int z=0;z<NUM_RES_ZONES;z++)
  {
    ZoneRule rule=GetZoneRule((res_zone)(z));
    string zbad=" in zone "+ZoneToString((res_zone)(z))+bad;
    if (rule.type==RULE_PASS_INFLOW){
      ExitGracefullyIf(rule.value1<0.0,("COperatingPolicy: pass-inflow factor cannot be negative"+zbad).c_str(),BAD_DATA);
    }
    else if (rule.type==RULE_CONSTANT){
      ExitGracefullyIf(rule.value1<0.0,("COperatingPolicy: release value cannot be negative"+zbad).c_str(),BAD_DATA);
    }
    else if (rule.type==RULE_INFLOW_CAPPED){
      ExitGracefullyIf((rule.value1<0.0) && (rule.value1!=DOESNT_EXIST),("COperatingPolicy: release value cannot be negative"+zbad).c_str(),BAD_DATA);
    }
    else if (rule.type==RULE_STAGE_INTERP){
      ExitGracefullyIf((rule.value1<0.0) || (rule.value2<rule.value1),
        ("COperatingPolicy: stage interpolation rule requires 0<=Qmin<=Qmax"+zbad).c_str(),BAD_DATA);
    }
  }
}

//////////////////////////////////////////////////////////////////
/// \brief evaluates a single zone rule
/// \returns unclamped release [m3/s]
//
double COperatingPolicy::ApplyRule(const ZoneRule &rule, const CReservoir *pRes, const double &Qin, const res_zone zone) const
{
  switch(rule.type)
  {
  case(RULE_NONE):          {return 0.0;}
  case(RULE_PASS_INFLOW):   {return rule.value1*Qin;}
  case(RULE_CONSTANT):      {return rule.value1;}
  case(RULE_MAX_RELEASE):   {return pRes->GetMaxReleaseRate();}
  case(RULE_INFLOW_CAPPED):
  {
    double cap=rule.value1;
    if (cap==DOESNT_EXIST){cap=pRes->GetMaxReleaseRate();}
    return min(cap,Qin);
  }
  case(RULE_STAGE_INTERP):
  {
    if (zone==ZONE_SURCHARGE){return rule.value2;}
    double hbot=pRes->GetZoneBottom(zone);
    double htop=pRes->GetZoneTop(zone);
    if (htop-hbot<REAL_SMALL){return rule.value2;}
    double w=(pRes->GetStage()-hbot)/(htop-hbot);
    w=max(min(w,1.0),0.0);
    return rule.value1+w*(rule.value2-rule.value1);
  }
  }
  return 0.0;
}

//////////////////////////////////////////////////////////////////
/// \brief returns requested release for reservoir during time step n
/// \details if pre-release is enabled and a forecast is supplied with max(forecast)>factor*Qin,
///  the requested release is gain*Qin; otherwise the rule for the current zone applies.
///  Result is clamped to [0,max release]; storage limits are enforced by CReservoir::ApplyMassBalance.
///
/// \param pRes [in] reservoir (state at start of step)
/// \param Qin [in] total inflow during step [m3/s]
/// \param aForecast [in] forecast inflow sequence, or NULL if unavailable
/// \param nForecast [in] length of forecast sequence
/// \param n [in] time step index
//
release_decision COperatingPolicy::Decide(const CReservoir *pRes,
                                          const double     &Qin,
                                          const double     *aForecast,
                                          const int         nForecast,
                                          const int         n) const
{
  release_decision dec;
  dec.zone       =pRes->GetZone(pRes->GetStage());
  dec.pre_release=false;

  if ((_pre_release_on) && (aForecast!=NULL) && (nForecast>0))
  {
    double Qfmax=-ALMOST_INF;
    for (int i=0;i<nForecast;i++){upperswap(Qfmax,aForecast[i]);}
    if (Qfmax>Qin*_pre_release_factor){
      dec.pre_release=true;
    }
  }

  if (dec.pre_release){dec.Q=Qin*_pre_release_gain;}
  else                {dec.Q=ApplyRule(GetZoneRule(dec.zone),pRes,Qin,dec.zone);}

  dec.Q=max(min(dec.Q,pRes->GetMaxReleaseRate()),0.0);
  return dec;
}
