/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------*/
#ifndef CASCADE_MAIN
#define CASCADE_MAIN

#include "CascadeInclude.h"
#include "CascadeTopology.h"

//Defined in ParseInput.cpp
bool ParseInputFiles           (CCascadeTopology *&pTopo, optStruct &Options);
void CheckForErrorWarnings     (bool quiet, const optStruct &Options);

//Local functions defined below main() in CascadeMain.cpp
void ProcessExecutableArguments(int argc, char* argv[], optStruct &Options);

#endif
