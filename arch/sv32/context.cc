/* kmem -- A microkernel memory manager and process table simulator
 *
 *    sv32/context.cc - Sv32 execution context
 *
 * Copyright (C) 2024  Leiden University, The Netherlands.
 */

#include "sv32.h"
#include "panic.h"
using namespace Sv32;

#include <algorithm>

/* Register numbers, offset by one since x0 is not stored */
const static unsigned int RegRA = 1 - 1;
const static unsigned int RegSP = 2 - 1;
const static unsigned int RegA0 = 10 - 1;
const static unsigned int ArgumentRegisters = 8;

/* Words in a stored context: the registers followed by sepc */
const static unsigned int ContextWords = 32;

ProcessContext::ProcessContext()
  : sepc(0)
{
  std::fill_n(registers, 31, 0);
}

void
ProcessContext::init(uint32_t entrypoint, uint32_t stack)
{
  std::fill_n(registers, 31, 0);
  registers[RegSP] = stack;
  sepc = entrypoint;
}

uint32_t
ProcessContext::getStack(void) const
{
  return registers[RegSP];
}

uint32_t
ProcessContext::getReturnAddress(void) const
{
  return registers[RegRA];
}

uint32_t
ProcessContext::getArgument(unsigned int index) const
{
  if (index >= ArgumentRegisters)
    kernelPanic("context: argument register a", index, " does not exist");

  return registers[RegA0 + index];
}

void
ProcessContext::invoke(uint32_t pc, uint32_t stack, uint32_t returnAddress,
                       const std::vector<uint32_t> &args)
{
  if (args.size() > ArgumentRegisters)
    kernelPanic("context: ", args.size(), " arguments do not fit in registers");

  sepc = pc;
  registers[RegSP] = stack;
  registers[RegRA] = returnAddress;
  for (unsigned int i = 0; i < ArgumentRegisters; ++i)
    registers[RegA0 + i] = i < args.size() ? args[i] : 0;
}

ProcessContext
ProcessContext::load(MMU &mmu)
{
  ProcessContext context;
  for (unsigned int i = 0; i < ContextWords - 1; ++i)
    context.registers[i] = mmu.load(ThreadContextArea + i * sizeof(uint32_t));
  context.sepc = mmu.load(ThreadContextArea + (ContextWords - 1) * sizeof(uint32_t));
  return context;
}

void
ProcessContext::store(MMU &mmu) const
{
  for (unsigned int i = 0; i < ContextWords - 1; ++i)
    mmu.store(ThreadContextArea + i * sizeof(uint32_t), registers[i]);
  mmu.store(ThreadContextArea + (ContextWords - 1) * sizeof(uint32_t), sepc);
}
