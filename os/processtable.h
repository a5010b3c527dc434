/* kmem -- A microkernel memory manager and process table simulator
 *
 *    processtable.h - Process table and context switching
 *
 * Copyright (C) 2024  Leiden University, The Netherlands.
 */

#ifndef __KMEM_PROCESSTABLE_H__
#define __KMEM_PROCESSTABLE_H__

#include "kerneltypes.h"
#include "sv32.h"
#include "os/bootargs.h"
#include "os/memorymanager.h"

#include <ostream>
#include <vector>

struct ProcessState
{
  enum Kind
  {
    Free,
    Setup,
    Ready,
    Running,
    Sleeping
  };

  Kind kind;

  /* Only meaningful in the Setup state */
  uint32_t entrypoint;
  uint32_t stack;
  uint32_t stackSize;

  ProcessState(Kind kind = Free)
    : kind(kind), entrypoint(0), stack(0), stackSize(0)
  { }

  static ProcessState setup(uint32_t entrypoint, uint32_t stack,
                            uint32_t stackSize);

  bool operator==(const ProcessState &other) const;
  bool operator!=(const ProcessState &other) const
  {
    return !(*this == other);
  }
};

std::ostream &operator<<(std::ostream &os, const ProcessState &state);

struct Process
{
  /* Address space of this process; unallocated while the slot is free */
  Sv32::MemoryMapping mapping;

  ProcessState state;

  /* PID of the parent, 0 for the kernel */
  PID ppid;

  AddressSpaceLayout layout;

  Process();

  bool runnable(void) const;
};

class SystemServices
{
  friend class SystemServicesHandle;

  protected:
    MMU &mmu;
    MemoryManager &memoryManager;

    /* Slot i holds PID i + 1 */
    std::vector<Process> processes;

    /* Context of a process interrupted by a callback, restored when that
     * process is resumed.
     */
    Sv32::ProcessContext savedContext;
    PID savedContextPid;

    unsigned int handles;

    void firstRun(Process &process);

  public:
    SystemServices(MMU &mmu, MemoryManager &memoryManager);

    /* Set up one process per boot image and claim the pages of their
     * address spaces.
     */
    void init(const InitialProcess *base, const KernelArguments &args);

    Error getProcess(PID pid, const Process *&process) const;
    Error getProcessMut(PID pid, Process *&process);

    /* PID of the active address space, checked against the table. */
    PID currentPid(void) const;
    Process &currentProcess(void);

    Error resumePid(PID pid, ProcessState previousState);
    Error makeCallbackTo(PID pid, uint32_t pc, uint32_t irqNo, uint32_t arg);

    Error createProcess(uint32_t entrypoint, uint32_t stack, PID &pid);
    Error terminateProcess(PID pid, PID &parent);

    bool runnable(PID pid) const;

    const Sv32::ProcessContext &getSavedContext(void) const
    {
      return savedContext;
    }

    PID getSavedContextPid(void) const
    {
      return savedContext.valid() ? savedContextPid : 0;
    }

    /* Disallow objects from being copied, since it has reference members. */
    SystemServices(const SystemServices &services) = delete;
    void operator=(const SystemServices &services) = delete;
};

class SystemServicesHandle
{
  protected:
    SystemServices &services;

  public:
    explicit SystemServicesHandle(SystemServices &services);
    ~SystemServicesHandle();

    SystemServices *operator->() { return &services; }
    SystemServices &operator*() { return services; }

    SystemServicesHandle(const SystemServicesHandle &handle) = delete;
    void operator=(const SystemServicesHandle &handle) = delete;
};

#endif /* __KMEM_PROCESSTABLE_H__ */
