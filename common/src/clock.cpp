#include <dg_clock.h>

dg::steady_clock::duration dg::steady_clock::m_time_shift;
