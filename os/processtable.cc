/* kmem -- A microkernel memory manager and process table simulator
 *
 *    processtable.cc - Process table and context switching
 *
 * Copyright (C) 2024  Leiden University, The Netherlands.
 */

#include "processtable.h"
#include "panic.h"
#include "settings.h"
using namespace Sv32;

#include <iostream>

ProcessState
ProcessState::setup(uint32_t entrypoint, uint32_t stack, uint32_t stackSize)
{
  ProcessState state(Setup);
  state.entrypoint = entrypoint;
  state.stack = stack;
  state.stackSize = stackSize;
  return state;
}

bool
ProcessState::operator==(const ProcessState &other) const
{
  if (kind != other.kind)
    return false;
  if (kind != Setup)
    return true;
  return entrypoint == other.entrypoint && stack == other.stack
      && stackSize == other.stackSize;
}

std::ostream &
operator<<(std::ostream &os, const ProcessState &state)
{
  switch (state.kind)
    {
      case ProcessState::Free:
        return os << "Free";
      case ProcessState::Setup:
        {
          std::ios_base::fmtflags flags(os.flags());
          os << "Setup(" << std::hex << std::showbase << state.entrypoint
             << ", " << state.stack << ", " << state.stackSize << ")";
          os.flags(flags);
          return os;
        }
      case ProcessState::Ready:
        return os << "Ready";
      case ProcessState::Running:
        return os << "Running";
      case ProcessState::Sleeping:
        return os << "Sleeping";
    }

  return os << "Unknown";
}

Process::Process()
  : mapping(), state(), ppid(0), layout()
{
}

bool
Process::runnable(void) const
{
  return state.kind == ProcessState::Ready
      || state.kind == ProcessState::Running
      || state.kind == ProcessState::Sleeping;
}

/*
 * SystemServices
 */

SystemServices::SystemServices(MMU &mmu, MemoryManager &memoryManager)
  : mmu(mmu), memoryManager(memoryManager), processes(MaxProcessCount),
    savedContext(), savedContextPid(0), handles(0)
{
}

void
SystemServices::init(const InitialProcess *base, const KernelArguments &args)
{
  const size_t count = args.countInitialProcesses();
  if (count > MaxProcessCount)
    kernelPanic("boot arguments describe ", count, " processes, at most ",
                MaxProcessCount, " are supported");

  for (size_t i = 0; i < count; ++i)
    {
      const InitialProcess &init = base[i];
      const MemoryMapping mapping(init.satp);
      const PID pid = mapping.getPid();

      if (pid == 0 || pid > MaxProcessCount)
        kernelPanic("initial process ", i, " has invalid PID ", int(pid));
      if (i == 0 && pid != KernelPID)
        kernelPanic("first initial process is PID ", int(pid),
                    " instead of the kernel");

      Process &process = processes[pid - 1];
      if (process.state.kind != ProcessState::Free)
        kernelPanic("initial PID ", int(pid), " appears twice");

      process.mapping = mapping;
      process.ppid = pid == KernelPID ? 0 : KernelPID;
      process.state = ProcessState::setup(init.entrypoint, init.sp,
                                          DefaultStackSize);
      process.layout = AddressSpaceLayout();

      if (LogBootProgress)
        std::cerr << "BOOT: PID " << int(pid) << " " << mapping << " "
                  << process.state << std::endl;
    }

  /* The loader built these address spaces; record who owns their pages. */
  const MemoryMapping previous = MemoryMapping::current(mmu);
  {
    MemoryManagerHandle mm(memoryManager);
    for (size_t i = 0; i < count; ++i)
      {
        const MemoryMapping mapping(base[i].satp);
        mapping.activate(mmu);
        mm->claimMappingPages(mapping.getPid());
      }
  }

  if (previous.isAllocated())
    previous.activate(mmu);
  else
    processes[KernelPID - 1].mapping.activate(mmu);
}

Error
SystemServices::getProcess(PID pid, const Process *&process) const
{
  if (pid == 0 || pid > MaxProcessCount)
    return Error::ProcessNotFound;

  const Process &candidate = processes[pid - 1];
  if (candidate.mapping.getPid() != pid)
    {
      if (LogProcessSwitches)
        std::cerr << "PROC: PID " << int(pid) << " not found, slot holds "
                  << candidate.mapping << std::endl;
      return Error::ProcessNotFound;
    }

  process = &candidate;
  return Error::Ok;
}

Error
SystemServices::getProcessMut(PID pid, Process *&process)
{
  const Process *found = nullptr;
  Error error = getProcess(pid, found);
  if (error != Error::Ok)
    return error;

  process = &processes[pid - 1];
  return Error::Ok;
}

PID
SystemServices::currentPid(void) const
{
  const MemoryMapping active = MemoryMapping::current(mmu);
  const PID pid = active.getPid();

  if (pid == 0 || pid > MaxProcessCount)
    kernelPanic("no process owns the active mapping ", active);

  if (processes[pid - 1].mapping != active)
    kernelPanic("current process memory map doesn't match: PID ", int(pid),
                " has ", processes[pid - 1].mapping, ", hardware has ", active);

  return pid;
}

Process &
SystemServices::currentProcess(void)
{
  return processes[currentPid() - 1];
}

void
SystemServices::firstRun(Process &process)
{
  const ProcessState &state = process.state;
  const uint32_t initSp = state.stack & ~(pageSize - 1);

  if (initSp < state.stackSize + pageSize)
    kernelPanic("stack of PID ", int(process.mapping.getPid()),
                " at ", std::hex, std::showbase, state.stack,
                " does not fit below its top");

  ProcessContext context;
  context.init(state.entrypoint, state.stack);
  context.store(mmu);

  /* Reserve, without backing, the stack and the page holding sp */
  MemoryManagerHandle mm(memoryManager);
  Error error = mm->reserveRange(initSp - state.stackSize - pageSize,
                                 state.stackSize + 2 * pageSize,
                                 MemoryFlagR | MemoryFlagW);
  if (error != Error::Ok)
    kernelPanic("couldn't reserve stack of PID ", int(process.mapping.getPid()),
                ": ", error);
}

Error
SystemServices::resumePid(PID pid, ProcessState previousState)
{
  const PID previous = currentPid();

  Process *target = nullptr;
  Error error = getProcessMut(pid, target);
  if (error != Error::Ok)
    return error;

  if (pid != previous)
    {
      if (target->state.kind == ProcessState::Free)
        return Error::ProcessNotFound;
      if (target->state.kind == ProcessState::Running)
        kernelPanic("PID ", int(pid), " was already running");

      target->mapping.activate(mmu);
    }

  if (target->state.kind == ProcessState::Setup)
    firstRun(*target);

  target->state = ProcessState::Running;
  if (pid != previous)
    processes[previous - 1].state = previousState;

  if (savedContext.valid() && savedContextPid == pid)
    {
      savedContext.store(mmu);
      savedContext.invalidate();
      savedContextPid = 0;
    }

  if (LogProcessSwitches)
    std::cerr << "PROC: PID " << int(previous) << " -> PID " << int(pid)
              << " (previous now " << previousState << ")" << std::endl;

  return Error::Ok;
}

Error
SystemServices::makeCallbackTo(PID pid, uint32_t pc, uint32_t irqNo, uint32_t arg)
{
  if (pid == 0 || pid > MaxProcessCount)
    return Error::ProcessNotFound;

  Process &target = processes[pid - 1];
  if (target.state.kind == ProcessState::Free)
    kernelPanic("callback to PID ", int(pid), ": process was not allocated");
  if (target.state.kind == ProcessState::Setup)
    kernelPanic("callback to PID ", int(pid), ": process hasn't been set up yet");
  if (target.mapping.getPid() != pid)
    return Error::ProcessNotFound;

  const PID current = currentPid();
  Process &running = processes[current - 1];
  if (running.state.kind != ProcessState::Running)
    kernelPanic("callback to PID ", int(pid), ": current process ",
                int(current), " was not running");

  if (savedContext.valid())
    kernelPanic("callback to PID ", int(pid),
                ": a saved context is still waiting to be resumed");

  running.state = ProcessState::Ready;
  target.state = ProcessState::Running;
  target.mapping.activate(mmu);

  ProcessContext context = ProcessContext::load(mmu);
  savedContext = context;
  savedContextPid = pid;
  context.invoke(pc, context.getStack(), ReturnFromISR, { irqNo, arg });
  context.store(mmu);

  if (LogProcessSwitches)
    std::cerr << "PROC: callback into PID " << int(pid) << " at "
              << std::hex << std::showbase << pc << std::dec
              << " for IRQ " << irqNo << std::endl;

  return Error::Ok;
}

Error
SystemServices::createProcess(uint32_t entrypoint, uint32_t stack, PID &pid)
{
  size_t slot = 0;
  while (slot < processes.size() && processes[slot].state.kind != ProcessState::Free)
    slot++;
  /* A full table reports ProcessNotFound, as there is no slot to find;
   * OutOfMemory is kept for running out of pages.
   */
  if (slot == processes.size())
    return Error::ProcessNotFound;

  const PID newPid = static_cast<PID>(slot + 1);
  const PID parent = currentPid();

  MemoryMapping mapping;
  {
    MemoryManagerHandle mm(memoryManager);
    Error error = mapping.allocate(*mm, processes[parent - 1].layout, newPid);
    if (error != Error::Ok)
      return error;
  }

  Process &process = processes[slot];
  process.mapping = mapping;
  process.ppid = parent;
  process.state = ProcessState::setup(entrypoint, stack, DefaultStackSize);
  process.layout = AddressSpaceLayout();

  if (LogProcessSwitches)
    std::cerr << "PROC: PID " << int(parent) << " created PID " << int(newPid)
              << " " << mapping << std::endl;

  pid = newPid;
  return Error::Ok;
}

Error
SystemServices::terminateProcess(PID pid, PID &parent)
{
  if (pid == KernelPID)
    kernelPanic("attempted to terminate the kernel");

  Process *process = nullptr;
  Error error = getProcessMut(pid, process);
  if (error != Error::Ok)
    return error;

  parent = process->ppid;

  /* Never tear down the address space we are running in */
  if (pid == currentPid())
    {
      error = resumePid(parent, ProcessState::Free);
      if (error != Error::Ok)
        {
          parent = KernelPID;
          error = resumePid(KernelPID, ProcessState::Free);
        }
      if (error != Error::Ok)
        kernelPanic("PID ", int(pid), " has nowhere to return to: ", error);
    }

  {
    MemoryManagerHandle mm(memoryManager);
    mm->releaseAllMemoryForProcess(pid);
  }

  if (savedContextPid == pid)
    {
      savedContext.invalidate();
      savedContextPid = 0;
    }

  for (auto &other : processes)
    if (other.ppid == pid)
      other.ppid = parent;

  process->mapping = MemoryMapping();
  process->state = ProcessState::Free;
  process->ppid = 0;
  process->layout = AddressSpaceLayout();

  if (LogProcessSwitches)
    std::cerr << "PROC: PID " << int(pid) << " terminated, parent "
              << int(parent) << std::endl;

  return Error::Ok;
}

bool
SystemServices::runnable(PID pid) const
{
  const Process *process = nullptr;
  if (getProcess(pid, process) != Error::Ok)
    return false;

  return process->runnable();
}

/*
 * SystemServicesHandle
 */

SystemServicesHandle::SystemServicesHandle(SystemServices &services)
  : services(services)
{
  if (services.handles != 0)
    kernelPanic("Multiple users of SystemServicesHandle!");
  services.handles++;
}

SystemServicesHandle::~SystemServicesHandle()
{
  services.handles--;
}
