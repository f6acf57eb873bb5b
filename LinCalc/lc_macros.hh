#ifndef LINCALC_MACROS_HH
#define LINCALC_MACROS_HH
#include <iostream>

#define LINCALC_STATUS(_msg)                                            \
    std::cout << "STATUS: " << _msg << std::endl;

#define LINCALC_ERROR(_msg)                                             \
    std::cerr << "ERROR: " << __FILE__ << ":" << __LINE__ << std::endl  \
        << "" << _msg << std::endl;

#endif
