/* kmem -- A microkernel memory manager and process table simulator
 *
 *    kerneltypes.h - Types shared by all kernel components
 *
 * Copyright (C) 2024  Leiden University, The Netherlands.
 */

#ifndef __KMEM_KERNELTYPES_H__
#define __KMEM_KERNELTYPES_H__

#include <cstdint>
#include <ostream>

/* Process identifier. PID 0 is never handed out, PID 1 is the kernel. */
using PID = uint8_t;

const static PID KernelPID = 1;

/* Recoverable errors, returned to the caller of an operation. Invariant
 * violations are not reported this way, see panic.h.
 */
enum class Error
{
  Ok = 0,
  OutOfMemory,
  BadAddress,
  BadAlignment,
  MemoryInUse,
  ProcessNotFound
};

const char *errorName(const Error error);
std::ostream &operator<<(std::ostream &os, const Error error);

/* Permissions requested by a caller of map/reserve. These are translated
 * to architecture specific entry bits by the architecture layer.
 */
using MemoryFlags = uint32_t;

const static MemoryFlags MemoryFlagR = 0x1;
const static MemoryFlags MemoryFlagW = 0x2;
const static MemoryFlags MemoryFlagX = 0x4;

/* Region of the address space that a virtual address is picked from. */
enum class MemoryType
{
  Default,
  Messages,
  Heap
};

/* A virtual range handed back to a caller. */
struct MemoryRange
{
  uint32_t addr;
  uint32_t size;

  MemoryRange() : addr(0), size(0) {}
  MemoryRange(uint32_t addr, uint32_t size) : addr(addr), size(size) {}
};

std::ostream &operator<<(std::ostream &os, const MemoryRange &range);

#endif /* __KMEM_KERNELTYPES_H__ */
