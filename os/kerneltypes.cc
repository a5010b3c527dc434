/* kmem -- A microkernel memory manager and process table simulator
 *
 *    kerneltypes.cc - Error names and panics
 *
 * Copyright (C) 2024  Leiden University, The Netherlands.
 */

#include "kerneltypes.h"
#include "panic.h"

#include <iostream>

const char *
errorName(const Error error)
{
  switch (error)
    {
      case Error::Ok:
        return "Ok";
      case Error::OutOfMemory:
        return "OutOfMemory";
      case Error::BadAddress:
        return "BadAddress";
      case Error::BadAlignment:
        return "BadAlignment";
      case Error::MemoryInUse:
        return "MemoryInUse";
      case Error::ProcessNotFound:
        return "ProcessNotFound";
    }

  return "Unknown";
}

std::ostream &
operator<<(std::ostream &os, const Error error)
{
  return os << errorName(error);
}

std::ostream &
operator<<(std::ostream &os, const MemoryRange &range)
{
  std::ios_base::fmtflags flags(os.flags());
  os << std::hex << std::showbase << "[" << range.addr << ", "
     << (uint64_t(range.addr) + range.size) << ")";
  os.flags(flags);
  return os;
}

KernelPanic::KernelPanic(const std::string &message)
  : std::runtime_error(message)
{
}

void
raisePanic(const std::string &message)
{
  std::cerr << "PANIC: " << message << std::endl;
  throw KernelPanic(message);
}
