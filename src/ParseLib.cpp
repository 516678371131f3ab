/*----------------------------------------------------------------
  Cascade Reservoir Operation Library Source Code
  Copyright (c) 2025-2026 the Cascade Development Team
  ----------------------------------------------------------------*/
#include "ParseLib.h"

/*----------------------------------------------------------------
  Constructor
  -----------------------------------------------------------------------*/
CParser::CParser(ifstream &FILE, string filename, const int i)
{
  _filename=filename;
  _INPUT =&FILE;
  _lineno=i;
}
/*----------------------------------------------------------------
  Basic Member Functions
  -----------------------------------------------------------------------*/
int    CParser::GetLineNumber () const      {return _lineno;}
//-----------------------------------------------------------------------
string CParser::GetFilename   () const      {return _filename;}
/*----------------------------------------------------------------
  Tokenize
  ----------------------------------------------------------------
  tokenizes a sentence delimited by  spaces, tabs, commas & return characters

  parameters:
  out is the array of strings in the line
  numwords is the number of strings in the line
  returns true if file has ended
  -------------------------------------------------------------------------*/
bool CParser::Tokenize(char **out, int &numwords)
{
  static char wholeline     [MAXCHARINLINE];
  static char *tempwordarray[MAXINPUTITEMS];
  char *p;
  int ct(0),w;
  const char *delimiters=" \t,\r\n";

  numwords=0;
  (*wholeline)=0;
  if (_INPUT->eof()){return true;}
  _INPUT->getline(wholeline,MAXCHARINLINE);            //get entire line as 1 string
  if (_INPUT->fail()){
    return true; //handles blank line peeked at end of file
  }

  _lineno++;
  if ((parserdebug) && ((*wholeline)!=0)){cout <<wholeline<<endl;}

  if ((*wholeline) == 0) {
    return false;
  }

  p=strtok(wholeline, delimiters);
  while (p){                                         //sift through words, place in temparray, count line length
    if (p[0]=='#'){break;}                           //ignore all content after '#'
    if (ct>=MAXINPUTITEMS){
      string warn="Tokenize:: exceeded maximum number of items in single line "+to_string(_lineno)+" in file "+_filename;
      ExitGracefully(warn.c_str(),BAD_DATA);
      return true;
    }
    tempwordarray[ct]=p;
    p=strtok(NULL, delimiters);
    ct++;
  }
  for (w=0; w<ct; w++){                              //copy temp array of words into out[]
    out[w]=tempwordarray[w];
  }
  numwords=ct;
  return false;
}
/*----------------------------------------------------------------*/
void   CParser::ImproperFormat(char **s)
{
  cout <<"line "<< _lineno << " in file "<<_filename<< " is wrong length"<<endl;
  cout <<"line "<< _lineno << ": "<<s[0]<<endl;
}
/*----------------------------------------------------------------
  Parse_dbl
  ----------------------------------------------------------------
  Parses a single line from an input file expected to have 2 DOUBLE
  input parameters
  ----------------------------------------------------------------*/
parse_error CParser::Parse_dbl(double &v1, double &v2)
{
  int      Len;
  char    *s[MAXINPUTITEMS];

  if (Tokenize(s,Len))                     {return PARSE_EOF;   }

  if      (Len==2) {v1=s_to_d(s[0]);
                    v2=s_to_d(s[1]);        return PARSE_GOOD;}
  else             {ImproperFormat(s);      return PARSE_BAD; }
}
//------------------------------------------------------------------------------
parse_error CParser::Parse_int(int &v1)
{
  int      Len;
  char    *s[MAXINPUTITEMS];

  if (Tokenize(s,Len))                     {return PARSE_EOF;   }

  if   (Len==1){v1=s_to_i(s[0]);            return PARSE_GOOD;}
  else         {ImproperFormat(s);          return PARSE_BAD; }
}
