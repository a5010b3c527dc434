/* kmem -- A microkernel memory manager and process table simulator
 *
 *    tests/fixture.h - A booted machine shared by the kernel tests
 *
 * Copyright (C) 2024  Leiden University, The Netherlands.
 */

#ifndef __KMEM_TESTS_FIXTURE_H__
#define __KMEM_TESTS_FIXTURE_H__

#include "sv32.h"
#include "panic.h"
#include "loader/bootimage.h"
#include "os/oskernel.h"

const static uint32_t TestRamStart = 0x40000000;
const static uint32_t TestRamSize = 16 * 1024 * 1024;
const static uint32_t TestDeviceStart = 0xe0000000;
const static uint32_t TestDeviceSize = 16 * Sv32::pageSize;

const static uint32_t UserEntrypoint = 0x10000000;
const static uint32_t UserStack = 0x20010000;

/* RAM, an MMU and a kernel booted from a loader-built image with the
 * kernel and `userProcesses` user processes.
 */
struct MachineFixture
{
  PhysicalMemory memory;
  Sv32::Sv32MMU mmu;
  BootImage image;
  OSKernel kernel;

  explicit MachineFixture(size_t userProcesses, bool withDevice = false)
    : memory(), mmu(memory), image(memory, TestRamStart, TestRamSize),
      kernel(mmu)
  {
    if (withDevice)
      image.addExtraRegion(TestDeviceStart, TestDeviceSize, makeTag("mmio"));

    image.addProcess(KernelEntrypoint, KernelStackTop, 4);
    for (size_t i = 0; i < userProcesses; ++i)
      image.addProcess(UserEntrypoint, UserStack, 2);

    image.build();
    image.activateKernel(mmu);
    kernel.boot(image.getArguments(), image.getInitialProcesses());
  }

  MemoryManager &mm(void)
  {
    return kernel.getMemoryManager();
  }

  SystemServices &ss(void)
  {
    return kernel.getSystemServices();
  }

  PID owner(uint32_t phys)
  {
    PID pid = 0;
    BOOST_REQUIRE( mm().pageOwner(phys, pid) == Error::Ok );
    return pid;
  }

  /* Physical page behind `virt` in the active mapping, 0 if none. */
  uint32_t physOf(uint32_t virt)
  {
    uint32_t phys = 0;
    if (Sv32::virtToPhys(mmu, virt, phys) != Error::Ok)
      return 0;
    return phys;
  }
};

struct BootedFixture : public MachineFixture
{
  BootedFixture() : MachineFixture(1) {}
};

struct TwoUserFixture : public MachineFixture
{
  TwoUserFixture() : MachineFixture(2) {}
};

struct DeviceFixture : public MachineFixture
{
  DeviceFixture() : MachineFixture(1, true) {}
};

#endif /* __KMEM_TESTS_FIXTURE_H__ */
