#ifndef _TREEFS_TRACELOG_
#define _TREEFS_TRACELOG_

#include <plog/Log.h>

namespace tracelog
{
    int init();

} // namespace tracelog

#endif
