/* kmem -- A microkernel memory manager and process table simulator
 *
 *    oskernel.cc - Kernel entry points backed by the memory manager and
 *                  the process table
 *
 * Copyright (C) 2024  Leiden University, The Netherlands.
 */

#include "oskernel.h"
#include "panic.h"
#include "settings.h"
using namespace Sv32;

#include <iostream>

OSKernel::OSKernel(MMU &mmu)
  : mmu(mmu), pageTracker(), memoryManager(mmu),
    systemServices(mmu, memoryManager), booted(false)
{
}

OSKernel::~OSKernel()
{
  /* The fault handler refers to this object */
  mmu.initialize(PageFaultFunction());
}

void
OSKernel::boot(const uint32_t *args, const InitialProcess *initialProcesses)
{
  if (booted)
    kernelPanic("kernel booted twice");

  KernelArguments arguments(args);
  pageTracker.assign(MemoryManager::trackerEntries(arguments), 0);

  {
    MemoryManagerHandle mm(memoryManager);
    mm->init(pageTracker.data(), arguments);
  }

  {
    SystemServicesHandle ss(systemServices);
    ss->init(initialProcesses, arguments);
  }

  mmu.initialize([this](uint32_t addr, bool)
    {
      return handlePageFault(addr) == Error::Ok;
    });

  booted = true;

  if (LogBootProgress)
    {
      MemoryManagerHandle mm(memoryManager);
      std::cerr << "BOOT: " << mm->ramUsedBy(KernelPID)
                << " pages owned by the kernel, " << mm->getFreePages()
                << " pages free." << std::endl;
    }
}

Error
OSKernel::mapMemory(uint32_t phys, uint32_t virt, uint32_t size,
                    MemoryFlags flags, MemoryRange &range)
{
  SystemServicesHandle ss(systemServices);
  MemoryManagerHandle mm(memoryManager);

  uint32_t addr = 0;
  Error error = mm->findVirtualAddress(ss->currentProcess().layout, virt,
                                       size, MemoryType::Default, addr);
  if (error != Error::Ok)
    return error;

  /* Only the kernel may touch the window, the process page and the
   * shared kernel superpage.
   */
  if (ss->currentPid() != KernelPID && uint64_t(addr) + size > UserAreaEnd)
    return Error::BadAddress;

  if (phys != 0)
    {
      error = mm->mapRange(phys, addr, size, flags, range);
      if (error != Error::Ok)
        return error;

      /* RAM may still hold a previous owner's data; devices are left alone */
      if (mm->isMainMemory(phys))
        for (uint32_t offset = 0; offset < size; offset += pageSize)
          if (zeroMappedPage(mmu, addr + offset) != Error::Ok)
            kernelPanic("map_memory: page ", std::hex, std::showbase,
                        addr + offset, " vanished while clearing it");
      return Error::Ok;
    }

  error = mm->reserveRange(addr, size, flags);
  if (error != Error::Ok)
    return error;

  range = MemoryRange(addr, size);
  return Error::Ok;
}

Error
OSKernel::unmapMemory(const MemoryRange &range)
{
  if ((range.addr & (pageSize - 1)) || (range.size & (pageSize - 1)))
    return Error::BadAlignment;

  MemoryManagerHandle mm(memoryManager);
  for (uint32_t offset = 0; offset < range.size; offset += pageSize)
    {
      Error error = mm->unmapPage(range.addr + offset);
      if (error != Error::Ok)
        return error;
    }

  return Error::Ok;
}

Error
OSKernel::increaseHeap(uint32_t delta, MemoryRange &heap)
{
  SystemServicesHandle ss(systemServices);
  MemoryManagerHandle mm(memoryManager);
  AddressSpaceLayout &layout = ss->currentProcess().layout;

  if (delta & (pageSize - 1))
    return Error::BadAlignment;

  if (delta != 0)
    {
      uint32_t addr = 0;
      Error error = mm->findVirtualAddress(layout, 0, delta, MemoryType::Heap, addr);
      if (error != Error::Ok)
        return error;

      error = mm->reserveRange(addr, delta, MemoryFlagR | MemoryFlagW);
      if (error != Error::Ok)
        return error;

      layout.heapSize += delta;
    }

  heap = MemoryRange(layout.heapBase, layout.heapSize);
  return Error::Ok;
}

Error
OSKernel::updateMemoryFlags(const MemoryRange &range, MemoryFlags flags)
{
  MemoryManagerHandle mm(memoryManager);
  return mm->updateMemoryFlags(range, flags);
}

Error
OSKernel::handlePageFault(uint32_t addr)
{
  MemoryManagerHandle mm(memoryManager);
  Error error = mm->ensurePageExists(addr);

  if (error != Error::Ok && LogPageTableUpdates)
    std::cerr << "PT: unable to resolve fault at " << std::hex
              << std::showbase << addr << std::dec << ": " << error
              << std::endl;

  return error;
}

Error
OSKernel::createProcess(uint32_t entrypoint, uint32_t stack, PID &pid)
{
  SystemServicesHandle ss(systemServices);
  return ss->createProcess(entrypoint, stack, pid);
}

Error
OSKernel::terminateProcess(PID pid, PID &parent)
{
  SystemServicesHandle ss(systemServices);
  return ss->terminateProcess(pid, parent);
}

Error
OSKernel::switchTo(PID pid, ProcessState previousState)
{
  SystemServicesHandle ss(systemServices);
  return ss->resumePid(pid, previousState);
}

Error
OSKernel::deliverInterrupt(PID pid, uint32_t handler, uint32_t irqNo, uint32_t arg)
{
  SystemServicesHandle ss(systemServices);
  return ss->makeCallbackTo(pid, handler, irqNo, arg);
}

PID
OSKernel::currentPid(void)
{
  SystemServicesHandle ss(systemServices);
  return ss->currentPid();
}

void
OSKernel::printState(std::ostream &os)
{
  SystemServicesHandle ss(systemServices);
  for (PID pid = 1; pid <= MaxProcessCount; ++pid)
    {
      const Process *process = nullptr;
      if (ss->getProcess(pid, process) != Error::Ok)
        continue;
      os << "PID " << int(pid) << " (parent " << int(process->ppid) << "): "
         << process->state << " " << process->mapping << std::endl;
    }

  MemoryMapping::current(mmu).printMap(mmu, os);

  MemoryManagerHandle mm(memoryManager);
  mm->printOwnership(os);
}
