#pragma once

#include <liblumen/Utils/Assertions.h>
#include <liblumen/Utils/EnumHelpers.h>
#include <liblumen/Utils/ScopeExit.h>
