/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------
  GracefulEnds.cpp
  ------------------------------------------------------------------
  program termination with error reporting
  ----------------------------------------------------------------*/
#include "CascadeInclude.h"

/////////////////////////////////////////////////////////////////
/// \brief Finalizes program gracefully, explaining reason for finalizing
/// \remark Called from within ExitGracefully()
///
/// \param statement [in] String to print to user upon exit
/// \param code [in] Code to determine why the system is exiting
//
static void FinalizeGracefully(const char *statement, exitcode code)
{
  string typeline;
  switch (code){
    case(SIMULATION_DONE): {typeline="============================================================";break;}
    case(RUNTIME_ERR):     {typeline="Error Type: Runtime Error";       break;}
    case(BAD_DATA):        {typeline="Error Type: Bad input data";      break;}
    case(BAD_DATA_WARN):   {typeline="Error Type: Bad input data";      break;}
    case(OUT_OF_MEMORY):   {typeline="Error Type: Out of memory";       break;}
    case(FILE_OPEN_ERR):   {typeline="Error Type: File opening error";  break;}
    case(STUB):            {typeline="Error Type: Stub function called";break;}
    default:               {typeline="Error Type: Unknown";             break;}
  }

  if (code != CASCADE_OPEN_ERR) { //avoids recursion problems
    ofstream WARNINGS;
    WARNINGS.open((g_output_directory+"Cascade_errors.txt").c_str(),ios::app);
    if (WARNINGS.fail()) {
      WARNINGS.close();
      string message="Unable to open errors file ("+g_output_directory+"Cascade_errors.txt)";
      ExitGracefully(message.c_str(),CASCADE_OPEN_ERR);
    }
    if (code!=SIMULATION_DONE) {WARNINGS<<"ERROR    : "<< statement << endl;
                                cerr    <<"ERROR    : "<< statement << endl;}
    else                       {WARNINGS<<"SIMULATION COMPLETE :)"<<endl;}
    WARNINGS.close();
  }
  if (code==BAD_DATA_WARN){return;}//just write these errors to a file

  cout <<endl<<endl;
  cout <<"============== Exiting Gracefully =========================="<<endl;
  cout <<"Exiting Gracefully: "<<statement                             <<endl;
  cout << typeline                                                     <<endl;
  cout <<"============================================================"<<endl;
}

/////////////////////////////////////////////////////////////////
/// \brief Exits gracefully from program, explaining reason for exit
/// \remark BAD_DATA_WARN is logged and execution continues; CheckForErrorWarnings() terminates later
///
/// \param statement [in] String to print to user upon exit
/// \param code [in] Code to determine why the system is exiting
//
void ExitGracefully(const char *statement, exitcode code)
{
  FinalizeGracefully(statement, code);
  if (code!=BAD_DATA_WARN){exit((int)(code));}
}
