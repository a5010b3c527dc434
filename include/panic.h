/* kmem -- A microkernel memory manager and process table simulator
 *
 *    panic.h - Fatal kernel errors
 *
 * Copyright (C) 2024  Leiden University, The Netherlands.
 */

#ifndef __KMEM_PANIC_H__
#define __KMEM_PANIC_H__

#include <stdexcept>
#include <string>
#include <sstream>

/* Raised when a kernel invariant does not hold. There is no recovering
 * from this: the simulated core halts.
 */
class KernelPanic : public std::runtime_error
{
  public:
    explicit KernelPanic(const std::string &message);
};

[[noreturn]] void raisePanic(const std::string &message);

template <typename... Args>
[[noreturn]] void
kernelPanic(Args &&... args)
{
  std::ostringstream message;
  (message << ... << args);
  raisePanic(message.str());
}

#endif /* __KMEM_PANIC_H__ */
