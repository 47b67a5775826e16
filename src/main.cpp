#include "treefs.hpp"

int main(int argc, char **argv)
{
    if (treefs::init(argc, argv) == -1)
        return 1;

    return 0;
}
