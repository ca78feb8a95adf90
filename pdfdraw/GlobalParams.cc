// -*- mode: c++; -*-
// Copyright 2001-2003 Glyph & Cog, LLC
// Copyright 2020- Thinkoid, LLC

#include <defs.hh>

#include <cstdlib>
#include <fstream>

#include <utils/path.hh>
#include <utils/string.hh>

#include <pdfdraw/Error.hh>
#include <pdfdraw/GlobalParams.hh>

namespace pdfdraw {
namespace {

// An include cycle ends here.
const int max_include_depth = 16;

bool is_integer(const std::string &s)
{
    size_t i = (!s.empty() && s[0] == '-') ? 1 : 0;

    if (i == s.size())
        return false;

    for (; i < s.size(); ++i)
        if (s[i] < '0' || s[i] > '9')
            return false;

    return true;
}

bool is_float(const std::string &s)
{
    size_t i = (!s.empty() && s[0] == '-') ? 1 : 0;

    if (i == s.size())
        return false;

    for (; i < s.size(); ++i)
        if (!((s[i] >= '0' && s[i] <= '9') || s[i] == '.'))
            return false;

    return true;
}

} // anonymous

GlobalParams::GlobalParams(const char *cfgFileName)
{
    std::vector< fs::path > candidates;

    if (cfgFileName && cfgFileName[0])
        candidates.emplace_back(expand_path(cfgFileName));

    candidates.emplace_back(home_path() / PDFDRAW_USER_RC);
    candidates.emplace_back(PDFDRAW_SYSTEM_RC);

    for (auto &path : candidates) {
        std::ifstream f(path);

        if (f) {
            parseFile(path.string(), f);
            break;
        }
    }
}

void GlobalParams::install() const
{
    setErrorQuiet(errQuiet);
}

void GlobalParams::parseFile(const std::string &fileName, std::istream &f)
{
    int line = 1;

    for (std::string buf; std::getline(f, buf); ++line)
        parseLine(buf, fileName, line);
}

void GlobalParams::parseLine(
    const std::string &buf, const std::string &fileName, int line)
{
    const auto tokens = tokenize(buf);

    if (tokens.empty() || tokens[0][0] == '#')
        return;

    const auto &cmd = tokens[0];

    if (cmd == "include") {
        parseInclude(tokens, fileName, line);
    } else if (cmd == "fontFile") {
        parseFontFile(tokens, fileName, line);
    } else if (cmd == "fontScaleMetrics") {
        parseFloat("fontScaleMetrics", fontScaleMetrics, tokens, fileName, line);
    } else if (cmd == "fontScaleSize") {
        parseFloat("fontScaleSize", fontScaleSize, tokens, fileName, line);
    } else if (cmd == "printCommands") {
        parseYesNo("printCommands", printCommands, tokens, fileName, line);
    } else if (cmd == "errQuiet") {
        parseYesNo("errQuiet", errQuiet, tokens, fileName, line);
    } else if (cmd == "formDepthLimit") {
        parseInteger("formDepthLimit", formDepthLimit, tokens, fileName, line);
    } else {
        error(errConfig, -1, "Unknown config file command '{0:s}' ({1:s}:{2:d})",
              cmd, fileName, line);
    }
}

void GlobalParams::parseInclude(
    const tokens_type &tokens, const std::string &fileName, int line)
{
    if (tokens.size() != 2) {
        error(errConfig, -1, "Bad 'include' config file command ({0:s}:{1:d})",
              fileName, line);
        return;
    }

    if (depth >= max_include_depth) {
        error(errConfig, -1, "Config file includes nested too deep ({0:s}:{1:d})",
              fileName, line);
        return;
    }

    const auto path = expand_path(tokens[1]);
    std::ifstream f(path);

    if (!f) {
        error(errConfig, -1,
              "Couldn't find included config file: '{0:s}' ({1:s}:{2:d})",
              tokens[1], fileName, line);
        return;
    }

    ++depth;
    parseFile(path.string(), f);
    --depth;
}

void GlobalParams::parseFontFile(
    const tokens_type &tokens, const std::string &fileName, int line)
{
    if (tokens.size() != 3) {
        error(errConfig, -1, "Bad 'fontFile' config file command ({0:s}:{1:d})",
              fileName, line);
        return;
    }

    addFontFile(tokens[1], expand_path(tokens[2]).string());
}

void GlobalParams::parseYesNo(const char *cmdName, bool &flag,
                              const tokens_type &tokens,
                              const std::string &fileName, int line)
{
    if (tokens.size() == 2 && tokens[1] == "yes") {
        flag = true;
    } else if (tokens.size() == 2 && tokens[1] == "no") {
        flag = false;
    } else {
        error(errConfig, -1, "Bad '{0:s}' config file command ({1:s}:{2:d})",
              cmdName, fileName, line);
    }
}

void GlobalParams::parseInteger(const char *cmdName, int &val,
                                const tokens_type &tokens,
                                const std::string &fileName, int line)
{
    if (tokens.size() != 2 || !is_integer(tokens[1])) {
        error(errConfig, -1, "Bad '{0:s}' config file command ({1:s}:{2:d})",
              cmdName, fileName, line);
        return;
    }

    val = atoi(tokens[1].c_str());
}

void GlobalParams::parseFloat(const char *cmdName, double &val,
                              const tokens_type &tokens,
                              const std::string &fileName, int line)
{
    if (tokens.size() != 2 || !is_float(tokens[1])) {
        error(errConfig, -1, "Bad '{0:s}' config file command ({1:s}:{2:d})",
              cmdName, fileName, line);
        return;
    }

    val = atof(tokens[1].c_str());
}

void GlobalParams::addFontFile(const std::string &fontName, const std::string &path)
{
    fontFiles[fontName] = path;
}

std::optional< std::string >
GlobalParams::findFontFile(const std::string &fontName) const
{
    auto iter = fontFiles.find(fontName);

    if (iter == fontFiles.end())
        return { };

    return iter->second;
}

} // namespace pdfdraw
