/* kmem -- A microkernel memory manager and process table simulator
 *
 *    tests/test_processtable.cc - unit tests for the process table and
 *                                 context switching
 *
 * Copyright (C) 2024  Leiden University, The Netherlands.
 */

#define BOOST_TEST_MODULE ProcessTable
#include <boost/test/unit_test.hpp>

#include "fixture.h"
using namespace Sv32;

#include <sstream>

/* Pages of a user process after boot, see test_memorymanager.cc */
const static size_t UserBootPages = 7;

BOOST_AUTO_TEST_SUITE(processtable_test)

static const Process &
lookup(SystemServices &ss, PID pid)
{
  const Process *process = nullptr;
  BOOST_REQUIRE( ss.getProcess(pid, process) == Error::Ok );
  return *process;
}

BOOST_AUTO_TEST_CASE( process_state )
{
  const ProcessState setup = ProcessState::setup(0x10000000, 0x20010000, DefaultStackSize);
  BOOST_CHECK( setup == ProcessState::setup(0x10000000, 0x20010000, DefaultStackSize) );
  BOOST_CHECK( setup != ProcessState::setup(0x10000000, 0x20020000, DefaultStackSize) );
  BOOST_CHECK( setup != ProcessState::Running );
  BOOST_CHECK( ProcessState() == ProcessState::Free );

  std::ostringstream os;
  os << setup << " " << ProcessState(ProcessState::Sleeping);
  BOOST_CHECK_EQUAL( os.str(), "Setup(0x10000000, 0x20010000, 0x20000) Sleeping" );
}

/* Test boot creates one Setup process per image */
BOOST_FIXTURE_TEST_CASE( init_from_boot_image, BootedFixture )
{
  const Process &kernelProcess = lookup(ss(), KernelPID);
  BOOST_CHECK( kernelProcess.state == ProcessState::setup(KernelEntrypoint, KernelStackTop,
                                                          DefaultStackSize) );
  BOOST_CHECK_EQUAL( kernelProcess.ppid, 0 );
  BOOST_CHECK( kernelProcess.mapping.isKernel() );

  const Process &user = lookup(ss(), 2);
  BOOST_CHECK( user.state == ProcessState::setup(UserEntrypoint, UserStack,
                                                 DefaultStackSize) );
  BOOST_CHECK_EQUAL( user.ppid, KernelPID );
  BOOST_CHECK_EQUAL( user.mapping.getPid(), 2 );
  BOOST_CHECK_EQUAL( user.layout.heapBase, DefaultHeapBase );
  BOOST_CHECK( !user.runnable() );

  const Process *missing = nullptr;
  BOOST_CHECK( ss().getProcess(3, missing) == Error::ProcessNotFound );
  BOOST_CHECK( ss().getProcess(0, missing) == Error::ProcessNotFound );
  BOOST_CHECK( ss().getProcess(255, missing) == Error::ProcessNotFound );

  BOOST_CHECK_EQUAL( ss().currentPid(), KernelPID );
}

BOOST_FIXTURE_TEST_CASE( init_rejects_bad_images, BootedFixture )
{
  const InitialProcess *boot = image.getInitialProcesses();
  KernelArguments args(image.getArguments());

  const InitialProcess duplicate[2] = { boot[0], boot[0] };
  SystemServices first(mmu, mm());
  BOOST_CHECK_THROW( first.init(duplicate, args), KernelPanic );

  const InitialProcess swapped[2] = { boot[1], boot[0] };
  SystemServices second(mmu, mm());
  BOOST_CHECK_THROW( second.init(swapped, args), KernelPanic );

  const InitialProcess invalid[2] = { boot[0], InitialProcess{ 0, 0, 0 } };
  SystemServices third(mmu, mm());
  BOOST_CHECK_THROW( third.init(invalid, args), KernelPanic );
}

/* Test the active mapping must agree with the table */
BOOST_FIXTURE_TEST_CASE( current_pid_consistency, BootedFixture )
{
  const MemoryMapping kernelMapping = MemoryMapping::current(mmu);

  mmu.setSatp(MemoryMapping::make(2, kernelMapping.getRootTable()).raw());
  BOOST_CHECK_THROW( ss().currentPid(), KernelPanic );

  mmu.setSatp(MemoryMapping::make(9, kernelMapping.getRootTable()).raw());
  BOOST_CHECK_THROW( ss().currentPid(), KernelPanic );

  kernelMapping.activate(mmu);
  BOOST_CHECK_EQUAL( ss().currentPid(), KernelPID );
  BOOST_CHECK_EQUAL( ss().currentProcess().mapping, kernelMapping );
}

/* Test the first dispatch of a process sets up its context and stack */
BOOST_FIXTURE_TEST_CASE( resume_first_run, BootedFixture )
{
  BOOST_REQUIRE( ss().resumePid(2, ProcessState::Ready) == Error::Ok );

  BOOST_CHECK( lookup(ss(), 2).state == ProcessState::Running );
  BOOST_CHECK( lookup(ss(), KernelPID).state == ProcessState::Ready );
  BOOST_CHECK_EQUAL( MemoryMapping::current(mmu), lookup(ss(), 2).mapping );
  BOOST_CHECK_EQUAL( ss().currentPid(), 2 );

  const ProcessContext context = ProcessContext::load(mmu);
  BOOST_CHECK_EQUAL( context.sepc, UserEntrypoint );
  BOOST_CHECK_EQUAL( context.getStack(), UserStack );

  /* The stack is reserved but not backed */
  uint32_t phys = 0;
  const uint32_t stackBottom = UserStack - DefaultStackSize - pageSize;
  BOOST_CHECK( virtToPhys(mmu, stackBottom, phys) == Error::MemoryInUse );
  BOOST_CHECK( virtToPhys(mmu, UserStack - pageSize, phys) == Error::MemoryInUse );
  BOOST_CHECK( virtToPhys(mmu, UserStack, phys) == Error::MemoryInUse );
  BOOST_CHECK( virtToPhys(mmu, stackBottom - pageSize, phys) == Error::BadAddress );

  /* Only two new leaf tables, one on each side of 0x20000000 */
  BOOST_CHECK_EQUAL( mm().ramUsedBy(2), UserBootPages + 2 );

  mmu.store(UserStack - sizeof(uint32_t), 1, true);
  BOOST_CHECK_EQUAL( mm().ramUsedBy(2), UserBootPages + 3 );
}

BOOST_FIXTURE_TEST_CASE( resume_errors, BootedFixture )
{
  BOOST_CHECK( ss().resumePid(3, ProcessState::Ready) == Error::ProcessNotFound );
  BOOST_CHECK( ss().resumePid(0, ProcessState::Ready) == Error::ProcessNotFound );

  /* Resuming the current process keeps the mapping */
  BOOST_REQUIRE( ss().resumePid(2, ProcessState::Ready) == Error::Ok );
  const MemoryMapping before = MemoryMapping::current(mmu);
  BOOST_CHECK( ss().resumePid(2, ProcessState::Sleeping) == Error::Ok );
  BOOST_CHECK_EQUAL( MemoryMapping::current(mmu), before );
  BOOST_CHECK( lookup(ss(), 2).state == ProcessState::Running );
  BOOST_CHECK( lookup(ss(), KernelPID).state == ProcessState::Ready );
}

BOOST_FIXTURE_TEST_CASE( switch_between_processes, TwoUserFixture )
{
  BOOST_REQUIRE( ss().resumePid(2, ProcessState::Ready) == Error::Ok );
  BOOST_REQUIRE( ss().resumePid(3, ProcessState::Sleeping) == Error::Ok );
  BOOST_CHECK( lookup(ss(), 2).state == ProcessState::Sleeping );
  BOOST_CHECK( lookup(ss(), 3).state == ProcessState::Running );

  /* Each process keeps its own context page */
  ProcessContext context = ProcessContext::load(mmu);
  context.registers[5] = 3;
  context.store(mmu);

  BOOST_REQUIRE( ss().resumePid(2, ProcessState::Ready) == Error::Ok );
  BOOST_CHECK_EQUAL( ProcessContext::load(mmu).registers[5], 0u );
  BOOST_REQUIRE( ss().resumePid(3, ProcessState::Ready) == Error::Ok );
  BOOST_CHECK_EQUAL( ProcessContext::load(mmu).registers[5], 3u );

  BOOST_CHECK( ss().runnable(2) );
  BOOST_CHECK( !ss().runnable(4) );
}

/* Test an upcall runs in the target and the interrupted context comes
 * back once the target is resumed.
 */
BOOST_FIXTURE_TEST_CASE( callback_delivery, BootedFixture )
{
  BOOST_REQUIRE( ss().resumePid(2, ProcessState::Ready) == Error::Ok );
  BOOST_REQUIRE( ss().resumePid(KernelPID, ProcessState::Ready) == Error::Ok );
  BOOST_CHECK( lookup(ss(), KernelPID).state == ProcessState::Running );

  const uint32_t handler = UserEntrypoint + 0x100;
  BOOST_REQUIRE( ss().makeCallbackTo(2, handler, 7, 0x1234) == Error::Ok );

  BOOST_CHECK_EQUAL( ss().currentPid(), 2 );
  BOOST_CHECK( lookup(ss(), 2).state == ProcessState::Running );
  BOOST_CHECK( lookup(ss(), KernelPID).state == ProcessState::Ready );

  const ProcessContext frame = ProcessContext::load(mmu);
  BOOST_CHECK_EQUAL( frame.sepc, handler );
  BOOST_CHECK_EQUAL( frame.getReturnAddress(), ReturnFromISR );
  BOOST_CHECK_EQUAL( frame.getArgument(0), 7u );
  BOOST_CHECK_EQUAL( frame.getArgument(1), 0x1234u );
  BOOST_CHECK_EQUAL( frame.getStack(), UserStack );

  BOOST_CHECK( ss().getSavedContext().valid() );
  BOOST_CHECK_EQUAL( ss().getSavedContextPid(), 2 );
  BOOST_CHECK_EQUAL( ss().getSavedContext().sepc, UserEntrypoint );

  /* Only one context can be saved at a time */
  BOOST_CHECK_THROW( ss().makeCallbackTo(KernelPID, KernelEntrypoint, 1, 0),
                     KernelPanic );

  /* Switching elsewhere leaves the saved context alone */
  BOOST_REQUIRE( ss().resumePid(KernelPID, ProcessState::Ready) == Error::Ok );
  BOOST_CHECK( ss().getSavedContext().valid() );

  BOOST_REQUIRE( ss().resumePid(2, ProcessState::Ready) == Error::Ok );
  BOOST_CHECK( !ss().getSavedContext().valid() );
  BOOST_CHECK_EQUAL( ProcessContext::load(mmu).sepc, UserEntrypoint );
}

BOOST_FIXTURE_TEST_CASE( callback_errors, BootedFixture )
{
  BOOST_CHECK( ss().makeCallbackTo(0, UserEntrypoint, 1, 0) == Error::ProcessNotFound );
  BOOST_CHECK_THROW( ss().makeCallbackTo(2, UserEntrypoint, 1, 0), KernelPanic );
  BOOST_CHECK_THROW( ss().makeCallbackTo(3, UserEntrypoint, 1, 0), KernelPanic );

  BOOST_REQUIRE( ss().resumePid(2, ProcessState::Ready) == Error::Ok );
  BOOST_REQUIRE( ss().resumePid(KernelPID, ProcessState::Ready) == Error::Ok );

  /* The interrupted process must have been running */
  Process *kernelProcess = nullptr;
  BOOST_REQUIRE( ss().getProcessMut(KernelPID, kernelProcess) == Error::Ok );
  kernelProcess->state = ProcessState::Sleeping;
  BOOST_CHECK_THROW( ss().makeCallbackTo(2, UserEntrypoint, 1, 0), KernelPanic );
}

BOOST_FIXTURE_TEST_CASE( create_process, BootedFixture )
{
  PID pid = 0;
  BOOST_REQUIRE( ss().createProcess(UserEntrypoint, UserStack, pid) == Error::Ok );
  BOOST_CHECK_EQUAL( pid, 3 );

  const Process &process = lookup(ss(), pid);
  BOOST_CHECK_EQUAL( process.ppid, KernelPID );
  BOOST_CHECK( process.state == ProcessState::setup(UserEntrypoint, UserStack,
                                                    DefaultStackSize) );
  BOOST_CHECK_EQUAL( mm().ramUsedBy(pid), 4u );
  BOOST_CHECK_EQUAL( ss().currentPid(), KernelPID );

  BOOST_REQUIRE( ss().resumePid(pid, ProcessState::Ready) == Error::Ok );
  mmu.store(UserStack - sizeof(uint32_t), 0xabcd, true);
  BOOST_CHECK_EQUAL( mmu.load(UserStack - sizeof(uint32_t), true), 0xabcdu );
  BOOST_CHECK_EQUAL( mm().ramUsedBy(pid), 4u + 2 + 1 );
}

/* Test the table fills up and slots are recycled */
BOOST_FIXTURE_TEST_CASE( process_table_full, BootedFixture )
{
  PID pid = 0;
  for (size_t i = 2; i < MaxProcessCount; ++i)
    BOOST_REQUIRE( ss().createProcess(UserEntrypoint, UserStack, pid) == Error::Ok );
  BOOST_CHECK_EQUAL( pid, MaxProcessCount );
  BOOST_CHECK( ss().createProcess(UserEntrypoint, UserStack, pid) == Error::ProcessNotFound );

  PID parent = 0;
  BOOST_REQUIRE( ss().terminateProcess(100, parent) == Error::Ok );
  BOOST_REQUIRE( ss().createProcess(UserEntrypoint, UserStack, pid) == Error::Ok );
  BOOST_CHECK_EQUAL( pid, 100 );
}

BOOST_FIXTURE_TEST_CASE( terminate_process, BootedFixture )
{
  PID child = 0, grandchild = 0, parent = 0;
  BOOST_REQUIRE( ss().createProcess(UserEntrypoint, UserStack, child) == Error::Ok );
  BOOST_REQUIRE( ss().resumePid(child, ProcessState::Ready) == Error::Ok );
  BOOST_REQUIRE( ss().createProcess(UserEntrypoint, UserStack, grandchild) == Error::Ok );
  BOOST_CHECK_EQUAL( lookup(ss(), grandchild).ppid, child );

  /* Terminating the running process returns to its parent */
  BOOST_REQUIRE( ss().terminateProcess(child, parent) == Error::Ok );
  BOOST_CHECK_EQUAL( parent, KernelPID );
  BOOST_CHECK_EQUAL( ss().currentPid(), KernelPID );
  BOOST_CHECK( lookup(ss(), KernelPID).state == ProcessState::Running );
  BOOST_CHECK_EQUAL( mm().ramUsedBy(child), 0u );

  const Process *gone = nullptr;
  BOOST_CHECK( ss().getProcess(child, gone) == Error::ProcessNotFound );
  BOOST_CHECK_EQUAL( lookup(ss(), grandchild).ppid, KernelPID );

  /* A process that is not running is simply torn down */
  BOOST_REQUIRE( ss().terminateProcess(grandchild, parent) == Error::Ok );
  BOOST_CHECK_EQUAL( mm().ramUsedBy(grandchild), 0u );
  BOOST_CHECK( ss().terminateProcess(grandchild, parent) == Error::ProcessNotFound );

  BOOST_CHECK_THROW( ss().terminateProcess(KernelPID, parent), KernelPanic );
}

BOOST_FIXTURE_TEST_CASE( handle_checkout, BootedFixture )
{
  SystemServicesHandle handle(ss());
  BOOST_CHECK_EQUAL( handle->currentPid(), KernelPID );
  BOOST_CHECK_THROW( SystemServicesHandle second(ss()), KernelPanic );
}

BOOST_AUTO_TEST_SUITE_END()
