/* kmem -- A microkernel memory manager and process table simulator
 *
 *    memorymanager.h - Physical page ownership and address space mapping
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#ifndef __KMEM_MEMORYMANAGER_H__
#define __KMEM_MEMORYMANAGER_H__

#include "kerneltypes.h"
#include "sv32.h"
#include "os/bootargs.h"

#include <ostream>
#include <vector>

/* Where new mappings of a process are placed. */
struct AddressSpaceLayout
{
  uint32_t defaultBase;
  uint32_t defaultLast;
  uint32_t messageBase;
  uint32_t messageLast;
  uint32_t heapBase;
  uint32_t heapSize;
  uint32_t heapMax;

  AddressSpaceLayout();
};

class MemoryManager
{
  friend class MemoryManagerHandle;

  protected:
    MMU &mmu;

    /* Ownership table: one owner per page of RAM, followed by one per
     * page of each extra region in declaration order. 0 means free.
     */
    PID *owners;
    size_t nOwners;

    uint32_t ramStart;
    uint32_t ramSize;
    uint32_t ramName;
    std::vector<MemoryRangeExtra> extraRegions;

    /* Allocation cursor, in RAM pages */
    size_t lastRamPage;

    bool initialized;
    unsigned int handles;

    enum class ClaimAction
    {
      Claim,
      Release,
      Move
    };

    Error ownerSlot(uint32_t addr, size_t &index) const;
    Error claimReleaseMove(uint32_t addr, PID pid, ClaimAction action, PID from);

    size_t ramPages(void) const
    {
      return ramSize / Sv32::pageSize;
    }

  public:
    explicit MemoryManager(MMU &mmu);

    /* Number of ownership slots `init` needs for these arguments. */
    static size_t trackerEntries(const KernelArguments &args);

    void init(PID *base, const KernelArguments &args);

    Error allocPage(PID pid, uint32_t &phys);

    Error claimPage(uint32_t addr, PID pid);
    Error releasePage(uint32_t addr, PID pid);
    /* Transfer a page from `from` to `pid`. */
    Error movePage(uint32_t addr, PID pid, PID from);
    Error pageOwner(uint32_t addr, PID &owner) const;

    bool isMainMemory(uint32_t addr) const;

    /* These act on the address space of the current process. */
    Error mapRange(uint32_t phys, uint32_t virt, uint32_t size,
                   MemoryFlags flags, MemoryRange &range);
    Error reserveRange(uint32_t virt, uint32_t size, MemoryFlags flags);
    Error unmapPage(uint32_t virt);
    Error ensurePageExists(uint32_t addr);
    Error updateMemoryFlags(const MemoryRange &range, MemoryFlags flags);

    Error mapZeroedPage(AddressSpaceLayout &layout, PID pid, bool isUser,
                        uint32_t &virt);
    Error findVirtualAddress(AddressSpaceLayout &layout, uint32_t virt,
                             uint32_t size, MemoryType kind, uint32_t &result);

    /* Claim every page the active mapping references for `pid`. Used at
     * boot for the address spaces the loader built.
     */
    void claimMappingPages(PID pid);

    void releaseAllMemoryForProcess(PID pid);
    size_t ramUsedBy(PID pid) const;
    size_t getFreePages(void) const;
    size_t getTotalPages(void) const
    {
      return ramPages();
    }

    void printOwnership(std::ostream &os) const;

    MMU &getMMU(void)
    {
      return mmu;
    }

    /* Disallow objects from being copied, since it has a pointer member. */
    MemoryManager(const MemoryManager &manager) = delete;
    void operator=(const MemoryManager &manager) = delete;
};

/* Exclusive access to the memory manager. Checking out a second handle
 * while one is live is a kernel bug.
 */
class MemoryManagerHandle
{
  protected:
    MemoryManager &manager;

  public:
    explicit MemoryManagerHandle(MemoryManager &manager);
    ~MemoryManagerHandle();

    MemoryManager *operator->() { return &manager; }
    MemoryManager &operator*() { return manager; }

    MemoryManagerHandle(const MemoryManagerHandle &handle) = delete;
    void operator=(const MemoryManagerHandle &handle) = delete;
};

#endif /* __KMEM_MEMORYMANAGER_H__ */
