// Logging utilities
// Author: Max Schwarz <max.schwarz@online.de>

#include "log.h"

bool log_debug = false;
const char* log_name = "runbox";
