/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------
  ParseInput.cpp
  ------------------------------------------------------------------
  parsing of the primary .csc input file
  ----------------------------------------------------------------*/
#include "CascadeInclude.h"
#include "CascadeMain.h"
#include "CascadeTopology.h"
#include "ParseLib.h"
#include "StandardOutput.h"

bool        ParseMainInputFile   (CCascadeTopology *&pTopo, optStruct &Options);
CReservoir *ReservoirParse       (CParser *p, string name, long ID, COperatingPolicy *&pPolicy, const optStruct &Options);
void        ImproperFormatWarning(string command, CParser *p, bool noisy);

///////////////////////////////////////////////////////////////////
/// \brief forecast request stored until all time series have been read
//
struct forecast_request
{
  bool   from_rainfall; ///< true for :ForecastFromRainfall, false for :ForecastFromInflow
  long   res_ID;        ///< reservoir ID
  int    lead;          ///< lead time [steps]
  double bias;          ///< multiplicative bias (inflow forecasts)
  double coef;          ///< runoff coefficient (rainfall forecasts)
  double area;          ///< catchment area [km2] (rainfall forecasts)
  double timeout;       ///< wall-clock timeout [s] (<=0: default)
  int    line;          ///< input line (for messages)
};

//////////////////////////////////////////////////////////////////
/// \brief This method is the primary Cascade input routine that parses input files, called by main
///
/// \details Input is provided in a single [runname].csc file which may redirect to
///   secondary files using :RedirectToFile
///
/// \param *&pTopo [out] new cascade topology (not yet initialized)
/// \param &Options [in/out] Global simulation options information
/// \return Boolean variable indicating success of parsing
//
bool ParseInputFiles(CCascadeTopology *&pTopo, optStruct &Options)
{
  if (!ParseMainInputFile(pTopo,Options)){
    if (Options.csc_filename.compare("nomodel.csc")==0){
      ExitGracefully("A model input file name must be supplied as an argument to the Cascade executable.",BAD_DATA);return false;
    }
    ExitGracefully("Cannot find or read .csc file",BAD_DATA);return false;
  }

  if (!Options.silent){
    cout <<"...model input successfully parsed"<<endl;
    cout <<endl;
  }
  return true;
}

///////////////////////////////////////////////////////////////////
/// \brief This local method (called by ParseInputFiles) reads the .csc file and generates
/// a new cascade topology with all reservoirs, links, series and forecasts
///
/// \remark forecast commands are resolved after the file is read, so that they
///  may precede the time series they refer to
///
/// \param *&pTopo [out] new cascade topology
/// \param &Options [in/out] Global simulation options information
/// \return Boolean value indicating success of parsing
//
bool ParseMainInputFile(CCascadeTopology *&pTopo, optStruct &Options)
{
  ifstream          INPUT;
  ifstream          INPUT2;           //For Secondary input
  CParser          *pMainParser=NULL; //for storage of main parser while reading secondary files

  bool              runname_overridden(false);
  bool              rundir_overridden(false);
  vector<forecast_request> forecasts;

  int               code;            //Parsing vars
  bool              ended(false);
  int               Len,line(0);
  char             *s[MAXINPUTITEMS];

  pTopo=NULL;

  if (Options.noisy){
    cout <<"======================================================"<<endl;
    cout <<"Parsing Input File "<<Options.csc_filename<<"..."<<endl;
    cout <<"======================================================"<<endl;
  }

  INPUT.open(Options.csc_filename.c_str());
  if (INPUT.fail()){cout << "Cannot find file "<<Options.csc_filename <<endl; return false;}

  CParser *p=new CParser(INPUT,Options.csc_filename,line);

  if (Options.run_name  !=""){runname_overridden=true;}
  if (Options.output_dir!=""){rundir_overridden =true;}

  pTopo=new CCascadeTopology();

  //===============================================================================================
  // Sift through file, processing each command
  //===============================================================================================
  bool end_of_file=p->Tokenize(s,Len);
  while (!end_of_file)
  {
    if (ended){break;}
    if (Options.noisy){ cout << "reading line " << p->GetLineNumber() << ": ";}

    /*assign code for switch statement
      ------------------------------------------------------------------
      <0           : ignored/special
      0   thru 100 : Options
      100 thru 200 : Reservoirs & network
      200 thru 300 : Time series & forecasts
      ------------------------------------------------------------------
    */

    code=0;
    //---------------------SPECIAL -----------------------------
    if       (Len==0)                                     {code=-1; }
    else if  (!strcmp(s[0],"*"                          )){code=-2; }//comment
    else if  (!strcmp(s[0],"%"                          )){code=-2; }//comment
    else if  (s[0][0]=='#')                               {code=-2; }//comment
    else if  (!strcmp(s[0],":End"                       )){code=-3; }//premature end of file
    else if  (!strcmp(s[0],":RedirectToFile"            )){code=-4; }//redirect to secondary file
    //--------------------MODEL OPTIONS ------------------------
    else if  (!strcmp(s[0],":RunName"                   )){code=1;  }
    else if  (!strcmp(s[0],":OutputDirectory"           )){code=2;  }
    else if  (!strcmp(s[0],":TimeStep"                  )){code=3;  }
    else if  (!strcmp(s[0],":NumSteps"                  )){code=4;  }
    else if  (!strcmp(s[0],":Duration"                  )){code=4;  }
    else if  (!strcmp(s[0],":SilentMode"                )){code=5;  }
    else if  (!strcmp(s[0],":NoisyMode"                 )){code=6;  }
    else if  (!strcmp(s[0],":WriteNetCDFFormat"         )){code=7;  }
    else if  (!strcmp(s[0],":SuppressOutput"            )){code=8;  }
    else if  (!strcmp(s[0],":ForecastTimeout"           )){code=9;  }
    else if  (!strcmp(s[0],":MassBalanceTolerance"      )){code=10; }
    //--------------------RESERVOIRS & NETWORK -----------------
    else if  (!strcmp(s[0],":Reservoir"                 )){code=100;}
    else if  (!strcmp(s[0],":RoutingLinks"              )){code=101;}
    //--------------------TIME SERIES & FORECASTS --------------
    else if  (!strcmp(s[0],":InflowSeries"              )){code=200;}
    else if  (!strcmp(s[0],":RainfallSeries"            )){code=201;}
    else if  (!strcmp(s[0],":ForecastFromInflow"        )){code=202;}
    else if  (!strcmp(s[0],":ForecastFromRainfall"      )){code=203;}

    switch(code)
    {
    case(-1):  //----------------------------------------------
    {/*Blank Line*/
      if (Options.noisy) {cout <<""<<endl;}break;
    }
    case(-2):  //----------------------------------------------
    {/*Comment # */
      if (Options.noisy) {cout <<"*"<<endl;} break;
    }
    case(-3):  //----------------------------------------------
    {/*:End*/
      if (Options.noisy) {cout <<"EOF"<<endl;} ended=true; break;
    }
    case(-4):  //----------------------------------------------
    {/*:RedirectToFile*/
      string filename="";
      for (int i=1;i<Len;i++){ filename+=s[i]; if (i<Len-1){ filename+=' '; } }
      if (Options.noisy) { cout <<"Redirect to file: "<<filename<<endl; }

      filename=CorrectForRelativePath(filename,Options.csc_filename);

      INPUT2.open(filename.c_str());
      if (INPUT2.fail()){
        string warn=":RedirectToFile: Cannot find file "+filename;
        ExitGracefully(warn.c_str(),BAD_DATA);
      }
      else{
        if (pMainParser!=NULL){
          ExitGracefully("ParseMainInputFile::nested :RedirectToFile commands (in already redirected files) are not allowed.",BAD_DATA);
        }
        pMainParser=p;    //save pointer to primary parser
        p=new CParser(INPUT2,filename,line);//open new parser
      }
      break;
    }
    case(1):  //----------------------------------------------
    {/*:RunName [run name]*/
      if (Options.noisy){cout <<"Run name"<<endl;}
      if (Len<2){ImproperFormatWarning(":RunName",p,Options.noisy); break;}
      if (!runname_overridden){Options.run_name=s[1];}
      else {
        WriteWarning("ParseMainInputFile: run name specified in .csc file ignored; run name from command line used instead",Options.noisy);
      }
      break;
    }
    case(2):  //----------------------------------------------
    {/*:OutputDirectory [directory]*/
      if (Options.noisy){cout <<"Output directory"<<endl;}
      if (Len<2){ImproperFormatWarning(":OutputDirectory",p,Options.noisy); break;}
      if (!rundir_overridden){
        Options.output_dir="";
        for (int i=1;i<Len;i++){ Options.output_dir+=s[i]; if (i<Len-1){ Options.output_dir+=' '; } }
        if (Options.output_dir.back()!='/'){Options.output_dir+="/";}
        PrepareOutputdirectory(Options);

        ofstream WARNINGS((Options.output_dir+"Cascade_errors.txt").c_str());
        WARNINGS.close();
      }
      else {
        WriteWarning("ParseMainInputFile: output directory specified in .csc file ignored; directory from command line used instead",Options.noisy);
      }
      break;
    }
    case(3):  //----------------------------------------------
    {/*:TimeStep [seconds]*/
      if (Options.noisy){cout <<"Time step"<<endl;}
      if (Len<2){ImproperFormatWarning(":TimeStep",p,Options.noisy); break;}
      Options.timestep=s_to_d(s[1]);
      break;
    }
    case(4):  //----------------------------------------------
    {/*:NumSteps [number of time steps]*/
      if (Options.noisy){cout <<"Number of time steps"<<endl;}
      if (Len<2){ImproperFormatWarning(":NumSteps",p,Options.noisy); break;}
      Options.num_steps=s_to_i(s[1]);
      break;
    }
    case(5):  //----------------------------------------------
    {/*:SilentMode*/
      if (Options.noisy){cout <<"Silent mode"<<endl;}
      Options.silent=true;
      Options.noisy =false;
      break;
    }
    case(6):  //----------------------------------------------
    {/*:NoisyMode*/
      Options.noisy =true;
      Options.silent=false;
      if (Options.noisy){cout <<"Noisy mode"<<endl;}
      break;
    }
    case(7):  //----------------------------------------------
    {/*:WriteNetCDFFormat*/
      if (Options.noisy){cout <<"NetCDF output"<<endl;}
      Options.write_netcdf=true;
      break;
    }
    case(8):  //----------------------------------------------
    {/*:SuppressOutput*/
      if (Options.noisy){cout <<"Suppress output"<<endl;}
      Options.write_reservoir_ts=false;
      Options.write_metrics     =false;
      Options.write_netcdf      =false;
      break;
    }
    case(9):  //----------------------------------------------
    {/*:ForecastTimeout [seconds]*/
      if (Options.noisy){cout <<"Forecast timeout"<<endl;}
      if (Len<2){ImproperFormatWarning(":ForecastTimeout",p,Options.noisy); break;}
      Options.forecast_timeout=s_to_d(s[1]);
      ExitGracefullyIf(Options.forecast_timeout<=0.0,
        "ParseMainInputFile: :ForecastTimeout must be positive",BAD_DATA_WARN);
      break;
    }
    case(10):  //----------------------------------------------
    {/*:MassBalanceTolerance [relative tolerance]*/
      if (Options.noisy){cout <<"Mass balance tolerance"<<endl;}
      if (Len<2){ImproperFormatWarning(":MassBalanceTolerance",p,Options.noisy); break;}
      Options.MB_tolerance=s_to_d(s[1]);
      ExitGracefullyIf(Options.MB_tolerance<=0.0,
        "ParseMainInputFile: :MassBalanceTolerance must be positive",BAD_DATA_WARN);
      break;
    }
    case(100):  //----------------------------------------------
    {/*:Reservoir [name] [ID]
        ...
       :EndReservoir*/
      if (Options.noisy){cout <<":Reservoir"<<endl;}
      if (Len<3){
        ImproperFormatWarning(":Reservoir",p,Options.noisy);
        ExitGracefully("ParseMainInputFile: :Reservoir command requires a name and an integer ID",BAD_DATA);
        break;
      }
      if (!StringIsLong(s[2])){
        string warn="ParseMainInputFile: reservoir ID must be an integer (:Reservoir "+string(s[1])+" "+string(s[2])+")";
        ExitGracefully(warn.c_str(),BAD_DATA);
      }
      long              ID=s_to_l(s[2]);
      COperatingPolicy *pPolicy=NULL;
      CReservoir       *pRes=ReservoirParse(p,s[1],ID,pPolicy,Options);
      pTopo->AddReservoir(pRes);
      pTopo->SetPolicy   (ID,pPolicy);
      break;
    }
    case(101):  //----------------------------------------------
    {/*:RoutingLinks
         [upstream ID] [downstream ID] [travel time (steps)] [lateral inflow (m3/s)] {fraction} {warm-up flow (m3/s)}
         ...
       :EndRoutingLinks*/
      if (Options.noisy){cout <<":RoutingLinks"<<endl;}
      while (!p->Tokenize(s,Len))
      {
        if (Options.noisy){cout<<"  ";}
        if      (IsComment(s[0],Len)){if (Options.noisy){cout<<"#"<<endl;}}
        else if (!strcmp(s[0],":EndRoutingLinks")){if (Options.noisy){cout<<":EndRoutingLinks"<<endl;} break;}
        else
        {
          if ((Len<4) || (Len>6)){
            ImproperFormatWarning(":RoutingLinks",p,Options.noisy);
            ExitGracefully("ParseMainInputFile: :RoutingLinks rows require upstream ID, downstream ID, travel time and lateral inflow",BAD_DATA);
            break;
          }
          for (int i=0;i<Len;i++){
            if (!is_numeric(s[i])){
              string warn="ParseMainInputFile: non-numeric entry "+string(s[i])+" in :RoutingLinks (line "+to_string(p->GetLineNumber())+")";
              ExitGracefully(warn.c_str(),BAD_DATA);
            }
          }
          if (!StringIsLong(s[2])){
            string warn="ParseMainInputFile: routing link travel time must be an integer number of time steps (line "+to_string(p->GetLineNumber())+")";
            ExitGracefully(warn.c_str(),BAD_DATA);
          }
          CRoutingLink *pLink=new CRoutingLink(s_to_l(s[0]),s_to_l(s[1]),s_to_i(s[2]),s_to_d(s[3]));
          if (Len>=5){pLink->SetFraction  (s_to_d(s[4]));}
          if (Len>=6){pLink->SetWarmupFlow(s_to_d(s[5]));}
          pTopo->AddRoutingLink(pLink);
          if (Options.noisy){cout<<s[0]<<" -> "<<s[1]<<endl;}
        }
      }
      break;
    }
    case(200):  //----------------------------------------------
    {/*:InflowSeries [reservoir ID]
         [N]
         [v1] [v2] ... [vN]
       :EndInflowSeries*/
      if (Options.noisy){cout <<":InflowSeries"<<endl;}
      if (Len<2){
        ImproperFormatWarning(":InflowSeries",p,Options.noisy);
        ExitGracefully("ParseMainInputFile: :InflowSeries requires a reservoir ID",BAD_DATA);
        break;
      }
      long ID=s_to_l(s[1]);
      pTopo->AddInflowSeries(CTimeSeries::Parse(p,"Inflow_"+to_string(ID),ID,Options));
      break;
    }
    case(201):  //----------------------------------------------
    {/*:RainfallSeries [reservoir ID]
         [N]
         [P1] [P2] ... [PN]  (mm per time step)
       :EndRainfallSeries*/
      if (Options.noisy){cout <<":RainfallSeries"<<endl;}
      if (Len<2){
        ImproperFormatWarning(":RainfallSeries",p,Options.noisy);
        ExitGracefully("ParseMainInputFile: :RainfallSeries requires a reservoir ID",BAD_DATA);
        break;
      }
      long ID=s_to_l(s[1]);
      pTopo->AddForcingSeries(CTimeSeries::Parse(p,"Rainfall_"+to_string(ID),ID,Options));
      break;
    }
    case(202):  //----------------------------------------------
    {/*:ForecastFromInflow [reservoir ID] [lead time (steps)] {bias} {timeout (s)}*/
      if (Options.noisy){cout <<":ForecastFromInflow"<<endl;}
      if ((Len<3) || (Len>5)){
        ImproperFormatWarning(":ForecastFromInflow",p,Options.noisy);
        ExitGracefully("ParseMainInputFile: :ForecastFromInflow requires a reservoir ID and lead time",BAD_DATA);
        break;
      }
      forecast_request fs;
      fs.from_rainfall=false;
      fs.res_ID =s_to_l(s[1]);
      fs.lead   =s_to_i(s[2]);
      fs.bias   =1.0;
      fs.coef   =0.0;
      fs.area   =0.0;
      fs.timeout=0.0;
      fs.line   =p->GetLineNumber();
      if (Len>=4){fs.bias   =s_to_d(s[3]);}
      if (Len>=5){fs.timeout=s_to_d(s[4]);}
      forecasts.push_back(fs);
      break;
    }
    case(203):  //----------------------------------------------
    {/*:ForecastFromRainfall [reservoir ID] [lead time (steps)] [runoff coeff] [area (km2)] {timeout (s)}*/
      if (Options.noisy){cout <<":ForecastFromRainfall"<<endl;}
      if ((Len<5) || (Len>6)){
        ImproperFormatWarning(":ForecastFromRainfall",p,Options.noisy);
        ExitGracefully("ParseMainInputFile: :ForecastFromRainfall requires a reservoir ID, lead time, runoff coefficient and area",BAD_DATA);
        break;
      }
      forecast_request fs;
      fs.from_rainfall=true;
      fs.res_ID =s_to_l(s[1]);
      fs.lead   =s_to_i(s[2]);
      fs.bias   =1.0;
      fs.coef   =s_to_d(s[3]);
      fs.area   =s_to_d(s[4]);
      fs.timeout=0.0;
      fs.line   =p->GetLineNumber();
      if (Len>=6){fs.timeout=s_to_d(s[5]);}
      forecasts.push_back(fs);
      break;
    }
    default://----------------------------------------------
    {
      char firstChar=*(s[0]);
      if (firstChar==':')
      {
        if     (!strcmp(s[0],":FileType"))    {if (Options.noisy){cout<<"Filetype"<<endl;    }}//do nothing
        else if(!strcmp(s[0],":Application")) {if (Options.noisy){cout<<"Application"<<endl; }}//do nothing
        else if(!strcmp(s[0],":Version"))     {if (Options.noisy){cout<<"Version"<<endl;     }}//do nothing
        else if(!strcmp(s[0],":WrittenBy"))   {if (Options.noisy){cout<<"WrittenBy"<<endl;   }}//do nothing
        else if(!strcmp(s[0],":CreationDate")){if (Options.noisy){cout<<"CreationDate"<<endl;}}//do nothing
        else
        {
          string warn="IGNORING unrecognized command: "+string(s[0])+" in .csc file";
          WriteWarning(warn,Options.noisy);
        }
      }
      else
      {
        string errString="Unrecognized command in .csc file:\n   "+string(s[0]);
        ExitGracefully(errString.c_str(),BAD_DATA_WARN);
      }
      break;
    }
    }//switch

    end_of_file=p->Tokenize(s,Len);

    //return after file redirect, if in secondary file
    if ((end_of_file) && (pMainParser!=NULL))
    {
      INPUT2.clear();
      INPUT2.close();
      delete p;
      p=pMainParser;
      pMainParser=NULL;
      end_of_file=p->Tokenize(s,Len);
    }
  } //end while (!end_of_file)

  if (pMainParser!=NULL){ //:End found within redirected file
    INPUT2.close();
    delete p;
    p=pMainParser;
  }
  INPUT.close();
  delete p; p=NULL;

  //===============================================================================================
  // Resolve forecasts now that all time series are known
  //===============================================================================================
  for (size_t i=0;i<forecasts.size();i++)
  {
    const forecast_request &fs=forecasts[i];
    CForecastModelABC *pModel=NULL;
    if (!fs.from_rainfall){
      const CTimeSeries *pTS=pTopo->FindInflowSeries(fs.res_ID);
      if (pTS==NULL){
        string warn="ParseMainInputFile: :ForecastFromInflow (line "+to_string(fs.line)+") refers to reservoir "+to_string(fs.res_ID)+" which has no :InflowSeries";
        ExitGracefully(warn.c_str(),BAD_DATA);
      }
      pModel=new CSeriesForecast(pTS,fs.bias);
    }
    else{
      const CTimeSeries *pTS=pTopo->GetForcingSeries(fs.res_ID);
      if (pTS==NULL){
        string warn="ParseMainInputFile: :ForecastFromRainfall (line "+to_string(fs.line)+") refers to reservoir "+to_string(fs.res_ID)+" which has no :RainfallSeries";
        ExitGracefully(warn.c_str(),BAD_DATA);
      }
      pModel=new CRainfallRunoffForecast(pTS,fs.coef,fs.area);
    }
    pTopo->AddForecastAdapter(new CForecastAdapter(fs.res_ID,pModel,fs.lead,fs.timeout));
  }

  //===============================================================================================
  // Check input quality
  //===============================================================================================
  ExitGracefullyIf(Options.timestep<=0,
                   "ParseMainInputFile::Must have a positive time step",BAD_DATA);
  ExitGracefullyIf(Options.num_steps<=0,
                   "ParseMainInputFile::Number of time steps must be positive. Is :NumSteps missing?",BAD_DATA);
  ExitGracefullyIf(pTopo->GetNumReservoirs()==0,
                   "ParseMainInputFile::No reservoirs specified in .csc file",BAD_DATA);

  return true;
}

//////////////////////////////////////////////////////////////////
/// \brief parses the :Reservoir command
/// \note the first line (:Reservoir [name] [ID]) has already been read in
/// \param p [in] parser
/// \param name [in] name of reservoir
/// \param ID [in] reservoir identifier
/// \param pPolicy [out] operating policy built from :ZoneRule and :PreRelease commands
/// \param Options [in] global options structure
/// \return new reservoir
//
CReservoir *ReservoirParse(CParser *p, string name, long ID, COperatingPolicy *&pPolicy, const optStruct &Options)
{
  /*Example:

  :Reservoir UpperDam 1
    :Capacity 5.0e7
    :MaxRelease 400
    :StageStorageCurve
      3 # number of points
      100.0 0.0     # h [m], V [m3]
      110.0 2.0e7
      120.0 6.0e7
    :EndStageStorageCurve
    :ZoneBoundaries 102.0 112.0 118.0
    :InitialStage 108.0
    :ZoneRule NORMAL STAGE_INTERP 20 120
    :ZoneRule FLOOD_CONTROL MAX_RELEASE
    :PreRelease 1.5 1.2
  :EndReservoir

  # prismatic alternative
    :PrismaticCurve [bottom elevation (m)] [surface area (m2)]
  */
  char   *s[MAXINPUTITEMS];
  int     Len;

  double  capacity   (DOESNT_EXIST);
  double  max_release(DOESNT_EXIST);
  double *aStage(NULL),*aVolume(NULL);
  int     NV(0);
  bool    prismatic(false);
  double  bottom(0.0),area(0.0);
  double  zone_bounds[3];
  bool    zones_set(false);
  double  flood_limit(DOESNT_EXIST);
  double  init_storage(0.0),init_stage(0.0);
  int     init_type(0); //0: none, 1: storage, 2: stage
  bool    ended(false);

  pPolicy=new COperatingPolicy();

  while (!p->Tokenize(s,Len))
  {
    if (Options.noisy) { cout << "-->reading line " << p->GetLineNumber() << ": "; }
    if     (Len==0)              { if (Options.noisy){ cout << "#" << endl; } }//Do nothing
    else if(IsComment(s[0],Len)) { if (Options.noisy){ cout << "#" << endl; } }
    else if(!strcmp(s[0],":Capacity"))
    {
      if (Options.noisy){ cout << ":Capacity" << endl; }
      if (Len<2){ImproperFormatWarning(":Capacity",p,Options.noisy); continue;}
      capacity=s_to_d(s[1]);
    }
    else if(!strcmp(s[0],":MaxRelease"))
    {
      if (Options.noisy){ cout << ":MaxRelease" << endl; }
      if (Len<2){ImproperFormatWarning(":MaxRelease",p,Options.noisy); continue;}
      max_release=s_to_d(s[1]);
    }
    else if(!strcmp(s[0],":StageStorageCurve"))
    {
      if (Options.noisy){ cout << ":StageStorageCurve" << endl; }
      if ((aStage!=NULL) || (prismatic)){
        ExitGracefully(("ReservoirParse: more than one storage curve given for reservoir "+name).c_str(),BAD_DATA);
      }
      if (Len>=2){ //:StageStorageCurve [N]
        if (!StringIsLong(s[1])){
          ExitGracefully(("ReservoirParse: bad number of points in :StageStorageCurve for reservoir "+name).c_str(),BAD_DATA);
        }
        NV=s_to_i(s[1]);
      }
      else if (p->Parse_int(NV)!=PARSE_GOOD){ //count on next line
        ExitGracefully(("ReservoirParse: bad number of points in :StageStorageCurve for reservoir "+name).c_str(),BAD_DATA);
      }
      ExitGracefullyIf(NV<2,
        ("ReservoirParse: :StageStorageCurve requires at least two points (reservoir "+name+")").c_str(),BAD_DATA);
      aStage =new double [NV];
      aVolume=new double [NV];
      for (int i=0;i<NV;i++){
        if (p->Parse_dbl(aStage[i],aVolume[i])!=PARSE_GOOD){
          string warn="ReservoirParse: improper :StageStorageCurve row (line "+to_string(p->GetLineNumber())+" of "+p->GetFilename()+")";
          ExitGracefully(warn.c_str(),BAD_DATA);
        }
      }
      p->Tokenize(s,Len); //:EndStageStorageCurve
      if ((Len<1) || (strcmp(s[0],":EndStageStorageCurve"))){
        ExitGracefully(("ReservoirParse: :StageStorageCurve has more points than specified or is missing :EndStageStorageCurve (reservoir "+name+")").c_str(),BAD_DATA);
      }
    }
    else if(!strcmp(s[0],":PrismaticCurve"))
    {
      if (Options.noisy){ cout << ":PrismaticCurve" << endl; }
      if (Len<3){ImproperFormatWarning(":PrismaticCurve",p,Options.noisy); continue;}
      if (aStage!=NULL){
        ExitGracefully(("ReservoirParse: more than one storage curve given for reservoir "+name).c_str(),BAD_DATA);
      }
      prismatic=true;
      bottom   =s_to_d(s[1]);
      area     =s_to_d(s[2]);
    }
    else if(!strcmp(s[0],":ZoneBoundaries"))
    {
      if (Options.noisy){ cout << ":ZoneBoundaries" << endl; }
      if (Len<4){ImproperFormatWarning(":ZoneBoundaries",p,Options.noisy); continue;}
      zone_bounds[0]=s_to_d(s[1]);
      zone_bounds[1]=s_to_d(s[2]);
      zone_bounds[2]=s_to_d(s[3]);
      zones_set=true;
    }
    else if(!strcmp(s[0],":FloodLimitStage"))
    {
      if (Options.noisy){ cout << ":FloodLimitStage" << endl; }
      if (Len<2){ImproperFormatWarning(":FloodLimitStage",p,Options.noisy); continue;}
      flood_limit=s_to_d(s[1]);
    }
    else if(!strcmp(s[0],":InitialStorage"))
    {
      if (Options.noisy){ cout << ":InitialStorage" << endl; }
      if (Len<2){ImproperFormatWarning(":InitialStorage",p,Options.noisy); continue;}
      init_storage=s_to_d(s[1]);
      init_type=1;
    }
    else if(!strcmp(s[0],":InitialStage"))
    {
      if (Options.noisy){ cout << ":InitialStage" << endl; }
      if (Len<2){ImproperFormatWarning(":InitialStage",p,Options.noisy); continue;}
      init_stage=s_to_d(s[1]);
      init_type=2;
    }
    else if(!strcmp(s[0],":ZoneRule"))
    {/*:ZoneRule [zone] [rule] {value1} {value2}*/
      if (Options.noisy){ cout << ":ZoneRule" << endl; }
      if ((Len<3) || (Len>5)){ImproperFormatWarning(":ZoneRule",p,Options.noisy); continue;}
      res_zone     zone=StringToZone       (s[1]);
      release_rule rule=StringToReleaseRule(s[2]);
      double v1(0.0),v2(0.0);
      if      (rule==RULE_PASS_INFLOW){v1=1.0;}
      else if (rule==RULE_INFLOW_CAPPED){v1=DOESNT_EXIST;} //capped at maximum release unless given
      else if (rule==RULE_STAGE_INTERP){
        ExitGracefullyIf(Len<5,
          ("ReservoirParse: STAGE_INTERP zone rule requires minimum and maximum release (reservoir "+name+")").c_str(),BAD_DATA);
      }
      if (Len>=4){v1=s_to_d(s[3]);}
      if (Len>=5){v2=s_to_d(s[4]);}
      pPolicy->SetZoneRule(zone,rule,v1,v2);
      if (Options.noisy){ cout << "   "<<ZoneToString(zone)<<": "<<ReleaseRuleToString(rule) << endl; }
    }
    else if(!strcmp(s[0],":PreRelease"))
    {/*:PreRelease {factor} {gain} or :PreRelease OFF*/
      if (Options.noisy){ cout << ":PreRelease" << endl; }
      if ((Len>=2) && (!strcmp(s[1],"OFF"))){pPolicy->DisablePreRelease(); continue;}
      double factor(DEFAULT_PRERELEASE_FACTOR),gain(DEFAULT_PRERELEASE_GAIN);
      if (Len>=2){factor=s_to_d(s[1]);}
      if (Len>=3){gain  =s_to_d(s[2]);}
      pPolicy->SetPreRelease(factor,gain);
    }
    else if(!strcmp(s[0],":EndReservoir"))
    {
      if (Options.noisy){ cout << ":EndReservoir" << endl; }
      ended=true;
      break;
    }
    else
    {
      string warn="IGNORING unrecognized command: "+string(s[0])+" in :Reservoir block (line "+to_string(p->GetLineNumber())+")";
      WriteWarning(warn,Options.noisy);
    }
  }
  ExitGracefullyIf(!ended,
    ("ReservoirParse: missing :EndReservoir for reservoir "+name).c_str(),BAD_DATA);
  ExitGracefullyIf(capacity==DOESNT_EXIST,
    ("ReservoirParse: :Capacity must be specified for reservoir "+name).c_str(),BAD_DATA);
  ExitGracefullyIf(max_release==DOESNT_EXIST,
    ("ReservoirParse: :MaxRelease must be specified for reservoir "+name).c_str(),BAD_DATA);

  CReservoir *pRes=NULL;
  if (aStage!=NULL){
    pRes=new CReservoir(name,ID,capacity,max_release,aStage,aVolume,NV);
  }
  else if (prismatic){
    pRes=new CReservoir(name,ID,capacity,max_release,bottom,area);
  }
  else{
    ExitGracefully(("ReservoirParse: no :StageStorageCurve or :PrismaticCurve given for reservoir "+name).c_str(),BAD_DATA);
    return NULL;
  }
  delete [] aStage;
  delete [] aVolume;

  if (zones_set)                {pRes->SetZoneBoundaries(zone_bounds[0],zone_bounds[1],zone_bounds[2]);}
  if (flood_limit!=DOESNT_EXIST){pRes->SetFloodLimitStage(flood_limit);}
  if      (init_type==1)        {pRes->SetInitialStorage(init_storage);}
  else if (init_type==2)        {pRes->SetInitialStage  (init_stage);}

  return pRes;
}

///////////////////////////////////////////////////////////////////
/// \brief writes warning for improper line length
//
void ImproperFormatWarning(string command, CParser *p, bool noisy)
{
  string warn;
  warn=command+" command: improper line length at line "+to_string(p->GetLineNumber());
  WriteWarning(warn,noisy);
}

/////////////////////////////////////////////////////////////////
/// \brief Checks if errors have been written to Cascade_errors.txt, if so, exits gracefully
/// \note called prior to simulation initialization, after parsing everything
///
/// \param quiet [in] true if warnings should not be announced to screen
/// \param Options [in] global options structure
//
void CheckForErrorWarnings(bool quiet, const optStruct &Options)
{
  int      Len;
  char    *s[MAXINPUTITEMS];
  bool     errors_found(false);
  bool     warnings_found(false);

  ifstream WARNINGS;
  WARNINGS.open((Options.output_dir+"Cascade_errors.txt").c_str());
  if (WARNINGS.fail()){WARNINGS.close();return;}

  CParser *p=new CParser(WARNINGS,Options.output_dir+"Cascade_errors.txt",0);

  while (!(p->Tokenize(s,Len)))
  {
    if (Len>0){
      if (!strcmp(s[0],"ERROR"  )){ errors_found  =true; }
      if (!strcmp(s[0],"WARNING")){ warnings_found=true; }
    }
  }
  WARNINGS.close();
  delete p;
  if ((warnings_found) && (!quiet) && (!Options.silent)){
    cout<<"*******************************************************"<<endl<<endl;
    cout<<"WARNING: Warnings have been issued while parsing data. "<<endl;
    cout<<"         See Cascade_errors.txt for details            "<<endl<<endl;
    cout<<"*******************************************************"<<endl<<endl;
  }

  if (errors_found){
    ExitGracefully("Errors found in input data. See Cascade_errors.txt for details",BAD_DATA);
  }
}
