/* kmem -- A microkernel memory manager and process table simulator
 *
 *    settings.h - Global run-time settings
 *
 * Copyright (C) 2024  Leiden University, The Netherlands.
 */

#ifndef __KMEM_SETTINGS_H__
#define __KMEM_SETTINGS_H__

#include <cstdint>
#include <cstddef>

/* Logging switches, set from the command line. */
extern bool LogMemoryAccesses;
extern bool LogPageTableUpdates;
extern bool LogProcessSwitches;
extern bool LogBootProgress;
extern bool LogTLBStatistics;

/* Number of entries in the TLB of a newly constructed MMU. */
extern size_t TLBEntries;

/* Circuit breaker for the amount of host memory backing "physical" memory. */
const static uint64_t PhysMemLimit = 2ULL * 1024 * 1024 * 1024;

#endif /* __KMEM_SETTINGS_H__ */
