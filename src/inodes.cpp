#include <sys/types.h>
#include <atomic>
#include "inodes.hpp"

namespace treefs::inodes
{
    std::atomic<ino_t> next_ino{ROOT_INO + 1};

    ino_t next()
    {
        return next_ino++;
    }
} // namespace treefs::inodes
