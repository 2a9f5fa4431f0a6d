#pragma once

#include <liblumen/Platform/ILogSink.h>
#include <liblumen/Platform/Log.h>
#include <liblumen/Platform/LogLevel.h>
#include <liblumen/Platform/LogMessage.h>
#include <liblumen/Platform/LogSink.h>
#include <liblumen/Platform/Logger.h>
