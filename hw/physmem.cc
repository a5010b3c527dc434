/* kmem -- A microkernel memory manager and process table simulator
 *
 *    physmem.cc - Simulated physical memory
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#include "physmem.h"
#include "settings.h"

#include <iostream>
#include <sstream>
#include <stdexcept>

#include <errno.h>
#include <string.h>
#include <sys/mman.h>  /* mmap() */


PhysicalMemory::PhysicalMemory()
  : regions(), bytesBacked(0)
{
}

PhysicalMemory::~PhysicalMemory()
{
  for (auto &region : regions)
    munmap(region.backing, region.size);
}

void
PhysicalMemory::addRegion(uint32_t start, uint32_t size, uint32_t tag)
{
  if (size == 0 || (start & 0xfff) != 0 || (size & 0xfff) != 0)
    throw std::runtime_error("physical region must be page-aligned and non-empty");

  if (uint64_t(start) + size > (1ULL << 32))
    throw std::runtime_error("physical region exceeds the 32-bit address space");

  for (const auto &region : regions)
    if (uint64_t(start) < uint64_t(region.start) + region.size &&
        uint64_t(region.start) < uint64_t(start) + size)
      throw std::runtime_error("physical region overlaps an existing region");

  /* Circuit breaker: avoid too large memory allocations to avoid the user
   * of this program getting into trouble. We limit at 2 GiB.
   */
  if (bytesBacked + size > PhysMemLimit)
    throw std::runtime_error("automatic protection: attempted to allocate more than 2 GiB of memory.");

  void *backing = mmap(nullptr, size, PROT_READ | PROT_WRITE,
                       MAP_ANONYMOUS | MAP_PRIVATE, -1, 0);
  if (backing == MAP_FAILED)
    throw std::runtime_error("mmap for physical memory failed: "
                             + std::string(strerror(errno)));

  regions.push_back({ start, size, tag, static_cast<uint8_t *>(backing) });
  bytesBacked += size;

  if (LogBootProgress)
    std::cerr << "BOOT: physical region @ "
              << std::hex << std::showbase << start
              << " size " << size << " bytes" << std::dec << std::endl;
}

const PhysRegion &
PhysicalMemory::findRegion(uint32_t addr, size_t len) const
{
  for (const auto &region : regions)
    if (region.contains(addr, len))
      return region;

  std::ostringstream message;
  message << "bus error: no memory at physical address "
          << std::hex << std::showbase << addr;
  throw std::runtime_error(message.str());
}

bool
PhysicalMemory::contains(uint32_t addr) const
{
  for (const auto &region : regions)
    if (region.contains(addr))
      return true;

  return false;
}

uint32_t
PhysicalMemory::read32(uint32_t addr) const
{
  if (addr & 0x3)
    throw std::runtime_error("bus error: misaligned word read");

  const PhysRegion &region = findRegion(addr, sizeof(uint32_t));
  uint32_t value;
  memcpy(&value, region.backing + (addr - region.start), sizeof(value));
  return value;
}

void
PhysicalMemory::write32(uint32_t addr, uint32_t value)
{
  if (addr & 0x3)
    throw std::runtime_error("bus error: misaligned word write");

  const PhysRegion &region = findRegion(addr, sizeof(uint32_t));
  memcpy(region.backing + (addr - region.start), &value, sizeof(value));
}

void
PhysicalMemory::zero(uint32_t addr, size_t size)
{
  const PhysRegion &region = findRegion(addr, size);
  memset(region.backing + (addr - region.start), 0, size);
}
