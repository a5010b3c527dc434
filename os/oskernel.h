/* kmem -- A microkernel memory manager and process table simulator
 *
 *    oskernel.h - Kernel entry points backed by the memory manager and
 *                 the process table
 *
 * Copyright (C) 2024  Leiden University, The Netherlands.
 */

#ifndef __KMEM_OSKERNEL_H__
#define __KMEM_OSKERNEL_H__

#include "kerneltypes.h"
#include "os/bootargs.h"
#include "os/memorymanager.h"
#include "os/processtable.h"

#include <ostream>
#include <vector>

class OSKernel
{
  protected:
    MMU &mmu;

    /* Storage behind the ownership table */
    std::vector<PID> pageTracker;

    MemoryManager memoryManager;
    SystemServices systemServices;

    bool booted;

  public:
    explicit OSKernel(MMU &mmu);
    ~OSKernel();

    /* Take over from the loader. The kernel mapping must be active. */
    void boot(const uint32_t *args, const InitialProcess *initialProcesses);

    /* Memory system calls, acting on the current process. A null `virt`
     * picks a free address; a null `phys` reserves pages that are backed
     * on first touch.
     */
    Error mapMemory(uint32_t phys, uint32_t virt, uint32_t size,
                    MemoryFlags flags, MemoryRange &range);
    Error unmapMemory(const MemoryRange &range);
    Error increaseHeap(uint32_t delta, MemoryRange &heap);
    Error updateMemoryFlags(const MemoryRange &range, MemoryFlags flags);
    Error handlePageFault(uint32_t addr);

    /* Process system calls */
    Error createProcess(uint32_t entrypoint, uint32_t stack, PID &pid);
    Error terminateProcess(PID pid, PID &parent);
    Error switchTo(PID pid, ProcessState previousState);
    Error deliverInterrupt(PID pid, uint32_t handler, uint32_t irqNo, uint32_t arg);

    PID   currentPid(void);

    MemoryManager &getMemoryManager(void)
    {
      return memoryManager;
    }

    SystemServices &getSystemServices(void)
    {
      return systemServices;
    }

    void  printState(std::ostream &os);

    /* Disallow objects from being copied, since it has reference members. */
    OSKernel(const OSKernel &kernel) = delete;
    void operator=(const OSKernel &kernel) = delete;
};

#endif /* __KMEM_OSKERNEL_H__ */
