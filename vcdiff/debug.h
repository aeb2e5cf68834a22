#pragma once

#ifdef DEBUG
#include <iostream>
#define VCD_TRACE(expr) (std::cerr << "[vcdelta] " << expr << '\n')
#else
#define VCD_TRACE(expr) ((void)0)
#endif
