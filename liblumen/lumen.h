#pragma once

#include <liblumen/Graphics.h>
#include <liblumen/Platform.h>
#include <liblumen/Utils.h>
