// tzlib version

// tzlib uses semantic versioning 2.0, see https://semver.org
// - major.minor.patch

#ifndef VERSION_H
#define VERSION_H

#include <stdint.h>

#define TZ_VULONG(major, minor, patch) (((major)<<24) | ((minor)<<16) | (patch))

#define TZ_VERSION TZ_VULONG(1,0,0)	// <-- manually maintained
#define TZ_VERNAME "1.0.0"		// <-- ''

#define TZ_VMAJOR(n) (uint64_t(n)>>24)
#define TZ_VMINOR(n) ((uint64_t(n)>>16) & 0xff)
#define TZ_VPATCH(n) (uint64_t(n) & 0xffff)

#endif /* VERSION_H */
