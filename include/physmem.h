/* kmem -- A microkernel memory manager and process table simulator
 *
 *    physmem.h - Simulated physical memory
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#ifndef __KMEM_PHYSMEM_H__
#define __KMEM_PHYSMEM_H__

#include <cstdint>
#include <cstddef>
#include <vector>

/* A contiguous range of the physical address space, backed by host
 * memory obtained with mmap().
 */
struct PhysRegion
{
  uint32_t start;
  uint32_t size;
  uint32_t tag;
  uint8_t *backing;

  bool contains(uint32_t addr, size_t len = 1) const
  {
    return addr >= start &&
        uint64_t(addr) + len <= uint64_t(start) + size;
  }
};

class PhysicalMemory
{
  protected:
    std::vector<PhysRegion> regions;
    uint64_t bytesBacked;

    const PhysRegion &findRegion(uint32_t addr, size_t len) const;

  public:
    PhysicalMemory();
    ~PhysicalMemory();

    void      addRegion(uint32_t start, uint32_t size, uint32_t tag);
    bool      contains(uint32_t addr) const;

    uint32_t  read32(uint32_t addr) const;
    void      write32(uint32_t addr, uint32_t value);
    void      zero(uint32_t addr, size_t size);

    const std::vector<PhysRegion> &getRegions(void) const
    {
      return regions;
    }

    /* Disallow objects from being copied, since it has a pointer member. */
    PhysicalMemory(const PhysicalMemory &memory) = delete;
    void operator=(const PhysicalMemory &memory) = delete;
};

#endif /* __KMEM_PHYSMEM_H__ */
