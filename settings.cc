/* kmem -- A microkernel memory manager and process table simulator
 *
 *    settings.cc - Global run-time settings
 *
 * Copyright (C) 2024  Leiden University, The Netherlands.
 */

#include "settings.h"

bool LogMemoryAccesses = false;
bool LogPageTableUpdates = false;
bool LogProcessSwitches = false;
bool LogBootProgress = false;
bool LogTLBStatistics = false;

size_t TLBEntries = 64;
