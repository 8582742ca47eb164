#pragma once

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif

#ifndef NOMINMAX
#define NOMINMAX
#endif

// Winsock must come before windows.h.
#include <winsock2.h>
#include <ws2tcpip.h>
#include <windows.h>
