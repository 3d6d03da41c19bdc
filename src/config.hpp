#pragma once

/*compile-time defaults; runtime values come from the rc file*/

#ifndef VINPUT_RC_NAME
#define VINPUT_RC_NAME ".vinputrc"
#endif

/*counts saturate here so "99999999999j" cannot overflow*/
#ifndef VINPUT_MAX_COUNT
#define VINPUT_MAX_COUNT 9999
#endif
