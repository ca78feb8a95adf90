// -*- mode: c++; -*-
// Copyright 2001-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#ifndef PDFDRAW_PDFDRAW_GLOBALPARAMS_HH
#define PDFDRAW_PDFDRAW_GLOBALPARAMS_HH

#include <defs.hh>

#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pdfdraw {

//------------------------------------------------------------------------
// GlobalParams
//------------------------------------------------------------------------

//
// Settings read from a pdfdrawrc file:
//
//   fontScaleMetrics <float>
//   fontScaleSize    <float>
//   fontFile         <font name> <path>
//   printCommands    yes|no
//   errQuiet         yes|no
//   formDepthLimit   <int>
//   include          <path>
//
class GlobalParams
{
public:
    // Defaults, no file is read.
    GlobalParams() = default;

    // Reads the first of: <cfgFileName>, ~/.pdfdrawrc, and the system
    // pdfdrawrc which can be opened.
    explicit GlobalParams(const char *cfgFileName);

    // Applies the process-wide settings (errQuiet) to the error channel;
    // reading a configuration alone changes nothing outside the object.
    void install() const;

    void parseFile(const std::string &fileName, std::istream &);
    void parseLine(const std::string &buf, const std::string &fileName, int line);

    //----- accessors

    double getFontScaleMetrics() const { return fontScaleMetrics; }
    double getFontScaleSize() const { return fontScaleSize; }

    std::optional< std::string > findFontFile(const std::string &fontName) const;

    bool getPrintCommands() const { return printCommands; }
    bool getErrQuiet() const { return errQuiet; }

    int getFormDepthLimit() const { return formDepthLimit; }

    //----- functions to set parameters

    void setFontScaleMetrics(double x) { fontScaleMetrics = x; }
    void setFontScaleSize(double x) { fontScaleSize = x; }

    void addFontFile(const std::string &fontName, const std::string &path);

    void setPrintCommands(bool x) { printCommands = x; }
    void setErrQuiet(bool x) { errQuiet = x; }

    void setFormDepthLimit(int x) { formDepthLimit = x; }

private:
    using tokens_type = std::vector< std::string >;

    void parseInclude(const tokens_type &, const std::string &, int);
    void parseFontFile(const tokens_type &, const std::string &, int);

    void parseYesNo(const char *, bool &, const tokens_type &,
                    const std::string &, int);
    void parseInteger(const char *, int &, const tokens_type &,
                      const std::string &, int);
    void parseFloat(const char *, double &, const tokens_type &,
                    const std::string &, int);

private:
    // scale applied to the font used for text measurement
    double fontScaleMetrics = 1.;

    // scale applied to the font sent to the rasterizer
    double fontScaleSize = 1.;

    // font name -> font file
    std::map< std::string, std::string > fontFiles;

    // trace operators as they execute
    bool printCommands = false;

    // suppress error messages
    bool errQuiet = false;

    // max nesting of form XObjects
    int formDepthLimit = PDFDRAW_FORM_DEPTH_LIMIT;

    // include nesting
    int depth = 0;
};

} // namespace pdfdraw

#endif // PDFDRAW_PDFDRAW_GLOBALPARAMS_HH
