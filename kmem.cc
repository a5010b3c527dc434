/* kmem -- A microkernel memory manager and process table simulator
 *
 *    kmem.cc - Boots a simulated machine and runs a short workload
 *              against the kernel
 *
 * Copyright (C) 2024  Leiden University, The Netherlands.
 */

#include "settings.h"
#include "panic.h"
#include "sv32.h"
#include "loader/bootimage.h"
#include "os/oskernel.h"
using namespace Sv32;

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <unistd.h>

const static uint32_t RamStart = 0x40000000;
const static uint32_t UserEntrypoint = 0x10000000;
const static uint32_t UserStackTop = 0x80000000;

static void
showHelp(const char *progName)
{
  std::cerr << progName << " [-m ramMiB] [-p processes] [-t tlbEntries]"
            << std::endl << "    [-x start:size] [-v] [-s]" << std::endl;
  std::cerr << R"HERE(
Options:
  -m      Size of RAM in MiB, default 16.
  -p      Number of user processes the loader sets up, default 2.
  -t      Number of TLB entries, default 64.
  -x      Add a device region at start:size (hexadecimal).
  -v      Log boot progress, page table updates and process switches.
          Specify twice to also log every memory access.
  -s      Print TLB statistics on exit.
)HERE";
}

static bool
parseRegion(const std::string &arg, uint32_t &start, uint32_t &size)
{
  const size_t colon = arg.find(':');
  if (colon == std::string::npos)
    return false;

  try
    {
      start = std::stoul(arg.substr(0, colon), nullptr, 16);
      size = std::stoul(arg.substr(colon + 1), nullptr, 16);
    }
  catch (std::exception &)
    {
      return false;
    }

  return true;
}

static void
check(Error error, const char *what)
{
  if (error != Error::Ok)
    {
      std::ostringstream message;
      message << what << " failed: " << error;
      throw std::runtime_error(message.str());
    }
}

/* Let every user process touch its stack, grow its heap and map some
 * memory, then exercise process creation, upcalls and termination.
 */
static void
runWorkload(OSKernel &kernel, MMU &mmu, size_t userProcesses,
            uint32_t deviceStart, uint32_t deviceSize)
{
  for (size_t i = 0; i < userProcesses; ++i)
    {
      const PID pid = PID(KernelPID + 1 + i);
      check(kernel.switchTo(pid, ProcessState::Ready), "switch");

      mmu.store(UserStackTop - sizeof(uint32_t), pid, true);

      MemoryRange heap;
      check(kernel.increaseHeap(4 * pageSize, heap), "increase heap");
      for (uint32_t offset = 0; offset < heap.size; offset += pageSize)
        mmu.store(heap.addr + offset, offset, true);

      MemoryRange buffer;
      check(kernel.mapMemory(0, 0, 2 * pageSize, MemoryFlagR | MemoryFlagW,
                             buffer), "map memory");
      mmu.store(buffer.addr, 0xdeadbeef, true);
      check(kernel.updateMemoryFlags(buffer, MemoryFlagR), "update flags");

      if (deviceSize != 0 && i == 0)
        {
          MemoryRange device;
          check(kernel.mapMemory(deviceStart, 0, pageSize,
                                 MemoryFlagR | MemoryFlagW, device),
                "map device");
          mmu.store(device.addr, 1, true);
        }

      check(kernel.switchTo(KernelPID, ProcessState::Ready), "switch");
    }

  if (userProcesses > 0)
    {
      const PID target = PID(KernelPID + 1);
      check(kernel.deliverInterrupt(target, UserEntrypoint, 5, 0), "upcall");
      check(kernel.switchTo(KernelPID, ProcessState::Ready), "switch");
    }

  PID child = 0;
  check(kernel.createProcess(UserEntrypoint, UserStackTop, child), "create");
  check(kernel.switchTo(child, ProcessState::Ready), "switch");
  mmu.store(UserStackTop - sizeof(uint32_t), child, true);

  PID parent = 0;
  check(kernel.terminateProcess(child, parent), "terminate");
}

int
main(int argc, char **argv)
{
  const char *progName = argv[0];
  uint32_t ramMiB = 16;
  size_t userProcesses = 2;
  uint32_t deviceStart = 0, deviceSize = 0;
  int verbosity = 0;

  int ch;
  while ((ch = getopt(argc, argv, "m:p:t:x:vsh")) != -1)
    {
      switch (ch)
        {
          case 'm':
            ramMiB = std::stoul(optarg);
            break;

          case 'p':
            userProcesses = std::stoul(optarg);
            break;

          case 't':
            TLBEntries = std::stoul(optarg);
            break;

          case 'x':
            if (!parseRegion(optarg, deviceStart, deviceSize))
              {
                std::cerr << "Error: malformed region " << optarg << std::endl;
                return 1;
              }
            break;

          case 'v':
            verbosity++;
            break;

          case 's':
            LogTLBStatistics = true;
            break;

          case 'h':
          default:
            showHelp(progName);
            return ch == 'h' ? 0 : 1;
        }
    }

  if (ramMiB == 0 || uint64_t(ramMiB) << 20 > PhysMemLimit)
    {
      std::cerr << "Error: RAM size must be between 1 and "
                << (PhysMemLimit >> 20) << " MiB" << std::endl;
      return 1;
    }

  if (userProcesses + 2 > MaxProcessCount)
    {
      std::cerr << "Error: at most " << MaxProcessCount - 2
                << " user processes can be loaded" << std::endl;
      return 1;
    }

  if (verbosity > 0)
    {
      LogBootProgress = true;
      LogPageTableUpdates = true;
      LogProcessSwitches = true;
    }
  if (verbosity > 1)
    LogMemoryAccesses = true;

  try
    {
      PhysicalMemory memory;
      Sv32MMU mmu(memory);

      BootImage image(memory, RamStart, ramMiB << 20);
      if (deviceSize != 0)
        image.addExtraRegion(deviceStart, deviceSize, makeTag("mmio"));

      image.addProcess(KernelEntrypoint, KernelStackTop, 4);
      for (size_t i = 0; i < userProcesses; ++i)
        image.addProcess(UserEntrypoint, UserStackTop, 2);
      image.build();
      image.activateKernel(mmu);

      OSKernel kernel(mmu);
      kernel.boot(image.getArguments(), image.getInitialProcesses());

      runWorkload(kernel, mmu, userProcesses, deviceStart, deviceSize);

      kernel.printState(std::cout);
    }
  catch (KernelPanic &panic)
    {
      /* The message was printed when the panic was raised */
      return 2;
    }
  catch (std::exception &e)
    {
      std::cerr << "Error: " << e.what() << std::endl;
      return 1;
    }

  return 0;
}
