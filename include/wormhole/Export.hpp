#pragma once

#if defined(_WIN32)
#  if defined(WORMHOLE_BUILD_SHARED)
#    if defined(wormhole_receive_EXPORTS)
#      define WORMHOLE_API __declspec(dllexport)
#    else
#      define WORMHOLE_API __declspec(dllimport)
#    endif
#  else
#    define WORMHOLE_API
#  endif
#else
#  if defined(WORMHOLE_BUILD_SHARED)
#    define WORMHOLE_API __attribute__((visibility("default")))
#  else
#    define WORMHOLE_API
#  endif
#endif
