#pragma once

// std c++ lib
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "sidcore/Error.h"
#include "sidcore/ISecurityApi.h"
#include "sidcore/SecurityIdentifier.h"
#include "sidcore/log.h"
#include "sidcore/strings.h"
