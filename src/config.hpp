#pragma once

/*compile-time defaults, override with -DFNAV_...*/

#ifndef FNAV_DEFAULT_PAGE_SIZE
#define FNAV_DEFAULT_PAGE_SIZE 30
#endif

#ifndef FNAV_MAX_SEARCH_RESULTS
#define FNAV_MAX_SEARCH_RESULTS 1000
#endif

#ifndef FNAV_READ_CHUNK_SIZE
#define FNAV_READ_CHUNK_SIZE (64 * 1024)
#endif

#define FNAV_NAME "file-navigator"
#define FNAV_VERSION "1.0.0"
