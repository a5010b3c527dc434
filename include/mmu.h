/* kmem -- A microkernel memory manager and process table simulator
 *
 *    mmu.h - Memory Management Unit component
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#ifndef __KMEM_MMU_H__
#define __KMEM_MMU_H__

#include "physmem.h"

#include <functional>
#include <list>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <unordered_map>
#include <vector>


enum class MemAccessType
{
  Load,
  Store,
  Modify,
  Instr
};

struct MemAccess
{
  uint32_t addr;
  MemAccessType type;
  bool user;
};

std::ostream &operator<<(std::ostream &os, const MemAccess &access);

/* Called on a translation fault. Returns true when the fault was
 * resolved and the access should be retried.
 */
using PageFaultFunction = std::function<bool(uint32_t addr, bool isWrite)>;

/* Raised when an access cannot be translated and the page fault handler
 * could not resolve it.
 */
class PageFault : public std::runtime_error
{
  protected:
    uint32_t addr;

  public:
    PageFault(const std::string &message, uint32_t addr);

    uint32_t getAddress(void) const
    {
      return addr;
    }
};

class MMU;

struct TLBEntry
{
  uint32_t vPage;
  uint32_t pPage;
  uint32_t flags;
  uint32_t asid;
  bool global;
  bool valid;

  TLBEntry() : vPage(0), pPage(0), flags(0), asid(0), global(false), valid(false) {}
  TLBEntry(uint32_t vp, uint32_t pp, uint32_t fl, uint32_t as, bool gl)
    : vPage(vp), pPage(pp), flags(fl), asid(as), global(gl), valid(true) {}
};

class TLB
{
  protected:
    /* Number of entries in TLB */
    const size_t nEntries;

    /* Reference to MMU; to be filled by initializer list in constructor */
    const MMU &mmu;

    std::vector<TLBEntry> entries;
    std::list<size_t> lruOrder;
    std::unordered_map<size_t, std::list<size_t>::iterator> lruMap;

    /* TLB statistics */
    int nLookups;
    int nHits;
    int nEvictions;
    int nFlush;
    int nFlushEvictions;

    void touch(size_t index);

  public:
    TLB(const size_t nEntries, const MMU &mmu);
    ~TLB();

    /* Looks up the physical page and entry flags cached for a virtual
     * page number in the given address space.
     */
    bool lookup(const uint32_t vPage, const uint32_t asid,
                uint32_t &pPage, uint32_t &flags);

    void add(const uint32_t vPage, const uint32_t asid,
             const uint32_t pPage, const uint32_t flags, bool global);

    /* Invalidate all entries, as sfence.vma without arguments does. */
    void flush(void);

    /* Clear the entire state of the TLB, statistics included. */
    void clear(void);

    size_t getValidEntries(void) const;

    void getStatistics(int &nLookups, int &nHits, int &nEvictions,
                       int &nFlush, int &nFlushEvictions) const;
};

class MMU
{
  protected:
    PhysicalMemory &memory;
    uint32_t satp;
    PageFaultFunction pageFaultHandler;
    std::unique_ptr<TLB> tlb;

    bool getTranslation(const MemAccess &access, uint32_t &pAddr);

  public:
    explicit MMU(PhysicalMemory &memory);
    virtual ~MMU();

    void initialize(PageFaultFunction pageFaultHandler);

    void setSatp(const uint32_t satp);
    uint32_t getSatp(void) const
    {
      return satp;
    }

    /* Drop all cached translations. Must follow every page table update
     * before the new entry can be relied upon.
     */
    void flush(void);

    /* Translates an access, running the page fault handler on a miss.
     * Returns the physical address.
     */
    uint32_t processMemAccess(const MemAccess &access);

    /* Word accesses through the active mapping. */
    uint32_t load(const uint32_t vAddr, bool user = false);
    void store(const uint32_t vAddr, const uint32_t value, bool user = false);

    PhysicalMemory &getMemory(void)
    {
      return memory;
    }

    uint32_t makePhysicalAddr(const MemAccess &access, const uint32_t pPage);

    void setTLB(std::unique_ptr<TLB> tlb);

    /* This method is used to acquire statistics from the TLB implementation */
    void getTLBStatistics(int &nLookups, int &nHits,
                          int &nEvictions,
                          int &nFlush, int &nFlushEvictions) const;

    /* These methods should return the architecture's page size / bits. */
    virtual uint8_t getPageBits(void) const = 0;
    virtual uint32_t getPageSize(void) const = 0;
    virtual uint8_t getAddressSpaceBits(void) const = 0;

    /* Address space identifier encoded in the current satp value. */
    virtual uint32_t getASID(void) const = 0;

    /* An implementation of the "performTranslation" method should translate
     * the given virtual page *number* to a physical page number, and
     * return the flags of the leaf entry it used.
     */
    virtual bool performTranslation(const uint32_t vPage,
                                    uint32_t &pPage,
                                    uint32_t &flags,
                                    bool isWrite) = 0;

    virtual bool checkPermissions(const MemAccess &access,
                                  const uint32_t flags) const = 0;

    virtual bool isGlobal(const uint32_t flags) const = 0;

    /* Disallow objects from being copied, since it has a pointer member. */
    MMU(const MMU &mmu) = delete;
    void operator=(const MMU &mmu) = delete;
};


#endif /* __KMEM_MMU_H__ */
