//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// library initialization from configuration

// log {
//   level Warning	# Debug, Info, Warning, Error, Fatal, or 0..4
//   path tz.log	# "&2" (default) is stderr
//   tzOffset +01:00	# timestamp offset
// }
// zone America/New_York	# default zone
// zones {		# aliases
//   NYC America/New_York
//   ET "EST5EDT,M3.2.0,M11.1.0"
// }
// formats {		# named strftime formats
//   stamp "%Y%m%d-%H%M%S %Z"
// }

#ifndef TzInit_HH
#define TzInit_HH

#ifndef TzLib_HH
#include <tzlib/TzLib.hh>
#endif

class TzCf;

namespace Tz {

// throws TzCfError, TzTimeError
TzExtern void init(const TzCf *cf);

} // Tz

#endif /* TzInit_HH */
