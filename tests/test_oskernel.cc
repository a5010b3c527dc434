/* kmem -- A microkernel memory manager and process table simulator
 *
 *    tests/test_oskernel.cc - tests of the kernel entry points on a
 *                             booted machine
 *
 * Copyright (C) 2024  Leiden University, The Netherlands.
 */

#define BOOST_TEST_MODULE OSKernel
#include <boost/test/unit_test.hpp>

#include "fixture.h"
using namespace Sv32;

#include <sstream>

BOOST_AUTO_TEST_SUITE(oskernel_test)

/* Kernel fixture with PID 2 already dispatched */
struct UserRunningFixture : public MachineFixture
{
  UserRunningFixture() : MachineFixture(1, true)
  {
    BOOST_REQUIRE( kernel.switchTo(2, ProcessState::Ready) == Error::Ok );
  }
};

BOOST_FIXTURE_TEST_CASE( boot_twice_panics, BootedFixture )
{
  BOOST_CHECK_EQUAL( kernel.currentPid(), KernelPID );
  BOOST_CHECK_THROW( kernel.boot(image.getArguments(), image.getInitialProcesses()),
                     KernelPanic );
}

BOOST_FIXTURE_TEST_CASE( map_physical_memory, UserRunningFixture )
{
  const uint32_t phys = TestRamStart + 0x100000;
  MemoryRange range;

  BOOST_REQUIRE( kernel.mapMemory(phys, 0, 2 * pageSize,
                                  MemoryFlagR | MemoryFlagW, range) == Error::Ok );
  BOOST_CHECK_EQUAL( range.addr, DefaultBase );
  BOOST_CHECK_EQUAL( range.size, 2 * pageSize );
  BOOST_CHECK_EQUAL( owner(phys), 2 );

  mmu.store(range.addr + pageSize, 0x55, true);
  BOOST_CHECK_EQUAL( memory.read32(phys + pageSize), 0x55u );

  /* A page owned by someone else cannot be mapped */
  const MemoryMapping kernelMapping(image.getInitialProcesses()[0].satp);
  BOOST_CHECK( kernel.mapMemory(kernelMapping.getRootTable(), 0, pageSize,
                                MemoryFlagR, range) == Error::MemoryInUse );
}

BOOST_FIXTURE_TEST_CASE( map_device_memory, UserRunningFixture )
{
  MemoryRange range;
  BOOST_REQUIRE( kernel.mapMemory(TestDeviceStart, 0x30000000, pageSize,
                                  MemoryFlagR | MemoryFlagW, range) == Error::Ok );
  BOOST_CHECK_EQUAL( range.addr, 0x30000000u );
  BOOST_CHECK_EQUAL( owner(TestDeviceStart), 2 );

  mmu.store(0x30000000, 1, true);
  BOOST_CHECK_EQUAL( memory.read32(TestDeviceStart), 1u );
}

/* Test RAM handed out by map_memory never carries old contents */
BOOST_FIXTURE_TEST_CASE( map_physical_memory_is_cleared, UserRunningFixture )
{
  const uint32_t phys = TestRamStart + 0x100000;
  memory.write32(phys + 8, 0xdeadbeef);
  memory.write32(phys + pageSize + 4, 0xdeadbeef);

  MemoryRange range;
  BOOST_REQUIRE( kernel.mapMemory(phys, 0, 2 * pageSize, MemoryFlagR,
                                  range) == Error::Ok );
  BOOST_CHECK_EQUAL( mmu.load(range.addr + 8, true), 0u );
  BOOST_CHECK_EQUAL( mmu.load(range.addr + pageSize + 4, true), 0u );
  BOOST_CHECK_EQUAL( memory.read32(phys + 8), 0u );

  /* Clearing does not leave the pages writable */
  BOOST_CHECK_THROW( mmu.store(range.addr, 1, true), PageFault );

  /* Device memory keeps its contents */
  memory.write32(TestDeviceStart + 4, 0x1234);
  BOOST_REQUIRE( kernel.mapMemory(TestDeviceStart, 0, pageSize,
                                  MemoryFlagR | MemoryFlagW, range) == Error::Ok );
  BOOST_CHECK_EQUAL( mmu.load(range.addr + 4, true), 0x1234u );
}

/* Test only the kernel may map above the user area */
BOOST_FIXTURE_TEST_CASE( map_memory_kernel_area, UserRunningFixture )
{
  const uint32_t phys = TestRamStart + 0x100000;
  MemoryRange range;

  BOOST_CHECK( kernel.mapMemory(phys, PageTableOffset + 5 * pageSize, pageSize,
                                MemoryFlagR | MemoryFlagW, range) == Error::BadAddress );
  BOOST_CHECK( kernel.mapMemory(phys, UserAreaEnd - pageSize, 2 * pageSize,
                                MemoryFlagR | MemoryFlagW, range) == Error::BadAddress );
  BOOST_CHECK( kernel.mapMemory(0, KernelVpn1 << 22, pageSize,
                                MemoryFlagR, range) == Error::BadAddress );
  BOOST_CHECK_EQUAL( owner(phys), 0 );

  /* The window slot stays free for the leaf table it belongs to */
  BOOST_CHECK( kernel.mapMemory(0, 0x01400000, pageSize,
                                MemoryFlagR | MemoryFlagW, range) == Error::Ok );
  BOOST_CHECK_NO_THROW( mmu.store(0x01400000, 7, true) );

  BOOST_REQUIRE( kernel.switchTo(KernelPID, ProcessState::Ready) == Error::Ok );
  BOOST_CHECK( kernel.mapMemory(0, UserAreaEnd, pageSize,
                                MemoryFlagR | MemoryFlagW, range) == Error::Ok );
}

/* Test anonymous memory is backed lazily and owned by the caller */
BOOST_FIXTURE_TEST_CASE( map_anonymous_memory, UserRunningFixture )
{
  MemoryRange range;
  BOOST_REQUIRE( kernel.mapMemory(0, 0, 4 * pageSize,
                                  MemoryFlagR | MemoryFlagW, range) == Error::Ok );
  BOOST_CHECK_EQUAL( range.size, 4 * pageSize );

  const size_t pages = mm().ramUsedBy(2);
  mmu.store(range.addr + 2 * pageSize, 3, true);
  BOOST_CHECK_EQUAL( mm().ramUsedBy(2), pages + 1 );
  BOOST_CHECK_EQUAL( mmu.load(range.addr + 2 * pageSize, true), 3u );

  /* The next request does not overlap the reservation */
  MemoryRange second;
  BOOST_REQUIRE( kernel.mapMemory(0, 0, pageSize, MemoryFlagR, second) == Error::Ok );
  BOOST_CHECK( second.addr >= range.addr + range.size );

  /* A read-only page is still cleared when it is first touched */
  BOOST_CHECK_EQUAL( mmu.load(second.addr, true), 0u );
  BOOST_CHECK_THROW( mmu.store(second.addr, 1, true), PageFault );

  BOOST_CHECK( kernel.mapMemory(0, 0, 100, MemoryFlagR, range) == Error::BadAlignment );
}

BOOST_FIXTURE_TEST_CASE( unmap_memory, UserRunningFixture )
{
  MemoryRange range;
  BOOST_REQUIRE( kernel.mapMemory(0, 0, 2 * pageSize,
                                  MemoryFlagR | MemoryFlagW, range) == Error::Ok );
  mmu.store(range.addr, 1, true);
  const size_t pages = mm().ramUsedBy(2);

  BOOST_CHECK( kernel.unmapMemory(MemoryRange(range.addr + 4, pageSize)) == Error::BadAlignment );
  BOOST_CHECK( kernel.unmapMemory(range) == Error::Ok );
  BOOST_CHECK_EQUAL( mm().ramUsedBy(2), pages - 1 );
  BOOST_CHECK( addressAvailable(mmu, range.addr) );
  BOOST_CHECK_THROW( mmu.load(range.addr, true), PageFault );

  BOOST_CHECK( kernel.unmapMemory(range) == Error::BadAddress );
}

BOOST_FIXTURE_TEST_CASE( increase_heap, UserRunningFixture )
{
  MemoryRange heap;
  BOOST_REQUIRE( kernel.increaseHeap(0, heap) == Error::Ok );
  BOOST_CHECK_EQUAL( heap.addr, DefaultHeapBase );
  BOOST_CHECK_EQUAL( heap.size, 0u );

  BOOST_REQUIRE( kernel.increaseHeap(2 * pageSize, heap) == Error::Ok );
  BOOST_CHECK_EQUAL( heap.size, 2 * pageSize );
  BOOST_REQUIRE( kernel.increaseHeap(pageSize, heap) == Error::Ok );
  BOOST_CHECK_EQUAL( heap.addr, DefaultHeapBase );
  BOOST_CHECK_EQUAL( heap.size, 3 * pageSize );

  mmu.store(DefaultHeapBase + 2 * pageSize, 8, true);
  BOOST_CHECK_EQUAL( mmu.load(DefaultHeapBase + 2 * pageSize, true), 8u );

  BOOST_CHECK( kernel.increaseHeap(100, heap) == Error::BadAlignment );
  BOOST_CHECK( kernel.increaseHeap(DefaultHeapMax, heap) == Error::OutOfMemory );
  BOOST_CHECK_EQUAL( ss().currentProcess().layout.heapSize, 3 * pageSize );
}

BOOST_FIXTURE_TEST_CASE( update_memory_flags, UserRunningFixture )
{
  const uint32_t phys = TestRamStart + 0x100000;
  MemoryRange range;
  BOOST_REQUIRE( kernel.mapMemory(phys, 0, pageSize, MemoryFlagR | MemoryFlagW,
                                  range) == Error::Ok );

  BOOST_CHECK( kernel.updateMemoryFlags(range, MemoryFlagR | MemoryFlagX) == Error::MemoryInUse );
  BOOST_CHECK( kernel.updateMemoryFlags(range, MemoryFlagR) == Error::Ok );
  BOOST_CHECK_NO_THROW( mmu.load(range.addr, true) );
  BOOST_CHECK_THROW( mmu.store(range.addr, 1, true), PageFault );
}

BOOST_FIXTURE_TEST_CASE( handle_page_fault, UserRunningFixture )
{
  /* The stack was reserved on first dispatch */
  BOOST_CHECK( kernel.handlePageFault(UserStack - 16) == Error::Ok );
  BOOST_CHECK( physOf(UserStack - pageSize) != 0 );

  BOOST_CHECK( kernel.handlePageFault(0x50000000) == Error::BadAddress );
  BOOST_CHECK( kernel.handlePageFault(UserAreaEnd + 0x1000) == Error::OutOfMemory );
}

/* Test a fault taken while the memory manager is checked out is fatal */
BOOST_FIXTURE_TEST_CASE( fault_while_memory_manager_busy, UserRunningFixture )
{
  MemoryManagerHandle handle(mm());
  BOOST_CHECK_THROW( mmu.store(UserStack - 16, 1, true), KernelPanic );
}

BOOST_FIXTURE_TEST_CASE( process_lifecycle, UserRunningFixture )
{
  PID child = 0, parent = 0;
  BOOST_REQUIRE( kernel.createProcess(UserEntrypoint, UserStack, child) == Error::Ok );
  BOOST_CHECK_EQUAL( child, 3 );
  BOOST_CHECK_EQUAL( ss().currentPid(), 2 );

  BOOST_REQUIRE( kernel.switchTo(child, ProcessState::Sleeping) == Error::Ok );
  BOOST_CHECK_EQUAL( kernel.currentPid(), child );
  mmu.store(UserStack - sizeof(uint32_t), 1, true);

  BOOST_REQUIRE( kernel.terminateProcess(child, parent) == Error::Ok );
  BOOST_CHECK_EQUAL( parent, 2 );
  BOOST_CHECK_EQUAL( kernel.currentPid(), 2 );
  BOOST_CHECK_EQUAL( mm().ramUsedBy(child), 0u );
  BOOST_CHECK( kernel.switchTo(child, ProcessState::Ready) == Error::ProcessNotFound );
}

BOOST_FIXTURE_TEST_CASE( deliver_interrupt, UserRunningFixture )
{
  BOOST_REQUIRE( kernel.switchTo(KernelPID, ProcessState::Ready) == Error::Ok );
  BOOST_REQUIRE( kernel.deliverInterrupt(2, UserEntrypoint + 0x40, 3, 9) == Error::Ok );
  BOOST_CHECK_EQUAL( kernel.currentPid(), 2 );

  const ProcessContext frame = ProcessContext::load(mmu);
  BOOST_CHECK_EQUAL( frame.sepc, UserEntrypoint + 0x40 );
  BOOST_CHECK_EQUAL( frame.getArgument(0), 3u );
  BOOST_CHECK_EQUAL( frame.getArgument(1), 9u );
}

BOOST_FIXTURE_TEST_CASE( print_state, UserRunningFixture )
{
  std::ostringstream os;
  kernel.printState(os);

  BOOST_CHECK( os.str().find("PID 1 (parent 0): Ready") != std::string::npos );
  BOOST_CHECK( os.str().find("PID 2 (parent 1): Running") != std::string::npos );
  BOOST_CHECK( os.str().find("Memory map for") != std::string::npos );
  BOOST_CHECK( os.str().find("10000000 -> ") != std::string::npos );
  BOOST_CHECK( os.str().find("Ownership of") != std::string::npos );
}

BOOST_AUTO_TEST_SUITE_END()
