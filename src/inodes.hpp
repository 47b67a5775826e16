#ifndef _TREEFS_INODES_
#define _TREEFS_INODES_

#include <sys/types.h>

namespace treefs::inodes
{
    // Entry ids handed out by next() start after this.
    constexpr ino_t ROOT_INO = 1;

    ino_t next();

} // namespace treefs::inodes

#endif
