// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef PDFDRAW_CONFIG_HH
#define PDFDRAW_CONFIG_HH

// Autoconf-like macros
#define PACKAGE "pdfdraw"
#define PACKAGE_NAME "pdfdraw"
#define PACKAGE_STRING "pdfdraw 0.4.0"
#define PACKAGE_TARNAME "pdfdraw"
#define PACKAGE_URL ""
#define PACKAGE_VERSION "0.4.0"
#define VERSION "0.4.0"

//------------------------------------------------------------------------
// config file (pdfdrawrc) paths
//------------------------------------------------------------------------

// user config file name, relative to the user's home directory
#define PDFDRAW_USER_RC ".pdfdrawrc"

// system config file name
#ifndef PDFDRAW_SYSTEM_RC
#define PDFDRAW_SYSTEM_RC "/etc/pdfdrawrc"
#endif

//------------------------------------------------------------------------
// interpreter limits
//------------------------------------------------------------------------

// Max errors (undefined operator, wrong number of args) allowed before
// giving up on a content stream.
#define PDFDRAW_CONTENT_STREAM_ERROR_LIMIT 500

// Default max nesting of form XObjects
#define PDFDRAW_FORM_DEPTH_LIMIT 20

#endif // PDFDRAW_CONFIG_HH
