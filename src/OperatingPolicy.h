/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------
  OperatingPolicy.h
  ------------------------------------------------------------------
  defines zone-based release rule table with optional
  forecast-triggered pre-release override
  ----------------------------------------------------------------*/
#ifndef OPERATING_POLICY_H
#define OPERATING_POLICY_H

#include "CascadeInclude.h"
#include "Reservoir.h"

/*****************************************************************
 ZoneRule: release rule applied while reservoir is in a given zone
*****************************************************************/
struct ZoneRule
{
  release_rule type;   ///< rule kind
  double       value1; ///< factor (PASS_INFLOW), value (CONSTANT, INFLOW_CAPPED; DOESNT_EXIST caps at max release) or Qmin (STAGE_INTERP)
  double       value2; ///< Qmax (STAGE_INTERP); unused otherwise
  bool         is_set; ///< false if zone default applies
  ZoneRule() {type=RULE_NONE; value1=value2=0.0; is_set=false;}
};
//example :ZoneRule NORMAL RULE_CONSTANT 5.0
//example :ZoneRule FLOOD_CONTROL RULE_STAGE_INTERP 50 400

/*****************************************************************
 release_decision: result of a single policy evaluation
*****************************************************************/
struct release_decision
{
  double   Q;            ///< requested release [m3/s], within [0,max release]
  res_zone zone;         ///< zone used in decision
  bool     pre_release;  ///< true if forecast-triggered pre-release overrode zone rule
};

/*****************************************************************
   Class COperatingPolicy
------------------------------------------------------------------
   Data Abstraction for reservoir operating policy. A zone-indexed
   rule table; if forecast pre-release is enabled and a forecast is
   available with max(forecast) > factor*Qin, the release
   gain*Qin overrides the table.
   Decide() is a pure function of its arguments.
******************************************************************/
class COperatingPolicy
{
private:/*-------------------------------------------------------*/
  ZoneRule  _aRules[NUM_RES_ZONES];  ///< rule applied in each zone

  bool      _pre_release_on;         ///< true if forecast pre-release override is enabled
  bool      _pre_release_off;        ///< true if pre-release was explicitly switched off (never enabled by default)
  double    _pre_release_factor;     ///< trigger ratio of forecast peak to current inflow [-]
  double    _pre_release_gain;       ///< pre-release as multiple of current inflow [-]

  double    ApplyRule(const ZoneRule &rule, const CReservoir *pRes, const double &Qin, const res_zone zone) const;

public:/*-------------------------------------------------------*/
  COperatingPolicy();
  ~COperatingPolicy();

  void      SetZoneRule     (const res_zone zone, const release_rule type, const double v1, const double v2);
  void      SetZoneRule     (const res_zone zone, const ZoneRule &rule);
  void      SetPreRelease   (const double factor, const double gain);
  void      DisablePreRelease();

  ZoneRule  GetZoneRule     (const res_zone zone) const;
  bool      UsesPreRelease  () const;
  bool      IsPreReleaseDisabled() const;
  double    GetPreReleaseFactor() const;
  double    GetPreReleaseGain  () const;

  void      CheckConfiguration(const string &resname) const;

  release_decision Decide(const CReservoir *pRes,
                          const double     &Qin,
                          const double     *aForecast,
                          const int         nForecast,
                          const int         n) const;
};
#endif
