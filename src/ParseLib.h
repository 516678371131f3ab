/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------
  ParseLib.h
  ------------------------------------------------------------------
  line tokenizer for colon-command input files
  ----------------------------------------------------------------*/
#ifndef PARSELIB_H
#define PARSELIB_H

#include "CascadeInclude.h"

const bool parserdebug=false; ///< echoes every line read when true

/*****************************************************************
   Class CParser
------------------------------------------------------------------
   reads an input stream one line at a time, splitting each line
   into words delimited by spaces, tabs and commas. Content after
   '#' is ignored.
******************************************************************/
class CParser
{
private:/*-------------------------------------------------------*/
  ifstream *_INPUT;     ///< input stream (not owned)
  string    _filename;  ///< name of file being parsed (for messages)
  int       _lineno;    ///< current line number

public:/*-------------------------------------------------------*/
  CParser(ifstream &FILE, string filename, const int i);

  int         GetLineNumber () const;
  string      GetFilename   () const;

  bool        Tokenize      (char **out, int &numwords);
  void        ImproperFormat(char **s);

  parse_error Parse_dbl     (double &v1, double &v2);
  parse_error Parse_int     (int &v1);
};
#endif
