#pragma once

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN // Exclude rarely-used stuff from Windows headers
// Windows Header Files:
#include <windows.h>
#include <sddl.h>
#endif

// std c++ lib
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "sidcore/Error.h"
#include "sidcore/ISecurityApi.h"
#include "sidcore/SID.h"
#include "sidcore/log.h"
#include "sidcore/strings.h"
