#pragma once

#include "TvTypes.h"

#include <string>

// Native ms.remote.control code for a standard key, or nullptr when unmapped.
const char* GetSamsungKeyCode(StandardRemoteKey key);

// Maps a keyboard character to a Samsung key code: letters (either case),
// digits and space. Returns false for anything else.
bool CharToSamsungKey(char character, std::string& keyCode);
