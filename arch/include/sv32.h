/* kmem -- A microkernel memory manager and process table simulator
 *
 *    sv32.h - Sv32 two-level page table implementation with 4 KiB pages
 *
 * Copyright (C) 2024  Leiden University, The Netherlands.
 */

#ifndef __ARCH_SV32__
#define __ARCH_SV32__

#include "mmu.h"
#include "kerneltypes.h"

#include <functional>
#include <ostream>
#include <vector>

class MemoryManager;
struct AddressSpaceLayout;

namespace Sv32 {

/* Sv32 addressing specification:
 * - 32-bit virtual addresses
 * - 4 KiB page size (12-bit page offset)
 * - Address breakdown: 10 bits + 10 bits + 12 bits = 32 bits
 * - Both levels: 1024 entries of 4 bytes, so every table is one page
 */
const static uint32_t addressSpaceBits = 32;
const static uint32_t pageBits = 12; /* 4 KiB / page */
const static uint32_t pageSize = 1UL << pageBits;
const static uint32_t entriesPerTable = pageSize / sizeof(uint32_t);

/* Extract page table indices from virtual address */
#define SV32_VPN1(vaddr) (((vaddr) >> 22) & 0x3ff)
#define SV32_VPN0(vaddr) (((vaddr) >> 12) & 0x3ff)

/* Entry layout: physical page number in bits 10..31, flags below. */
#define SV32_ENTRY_PPN(entry) ((entry) >> 10)
#define SV32_ENTRY_ADDR(entry) (((entry) >> 10) << 12)
#define SV32_MAKE_ENTRY(phys, flags) ((((phys) >> 12) << 10) | (flags))

const static uint32_t FLG_VALID = 0x001;
const static uint32_t FLG_R = 0x002;
const static uint32_t FLG_W = 0x004;
const static uint32_t FLG_X = 0x008;
const static uint32_t FLG_U = 0x010;
const static uint32_t FLG_GLOBAL = 0x020;
const static uint32_t FLG_A = 0x040;
const static uint32_t FLG_D = 0x080;
/* Software bits. Page lending and swap are not modelled, so kmem never
 * sets these itself; an entry carrying S is refused when backing pages.
 */
const static uint32_t FLG_S = 0x100; /* software: page is shared or lent */
const static uint32_t FLG_P = 0x200; /* software: page is swapped out */
const static uint32_t FLG_MASK = 0x3ff;

/* satp: mode in bit 31, ASID in bits 22..30, root PPN in bits 0..21 */
const static uint32_t SatpModeSv32 = 0x80000000;
const static uint32_t SatpAsidShift = 22;
const static uint32_t SatpAsidMask = 0x1ff;
const static uint32_t SatpPpnMask = 0x3fffff;

/* Virtual memory layout, identical in every address space. */
const static uint32_t DefaultHeapBase = 0x20000000;
const static uint32_t DefaultMessageBase = 0x40000000;
const static uint32_t DefaultBase = 0x60000000;
const static uint32_t DefaultAreaSize = 0x10000000;
const static uint32_t MessageAreaSize = 0x00400000;
const static uint32_t UserAreaEnd = 0xff000000;
const static uint32_t PageTableOffset = 0xff400000;
const static uint32_t PageTableRootOffset = 0xff800000;
const static uint32_t ThreadContextArea = 0xff801000;
const static uint32_t ReturnFromISR = 0xff802000;
const static uint32_t ExceptionStackTop = 0xffff0000;

const static uint32_t DefaultStackSize = 131072;
const static uint32_t DefaultHeapMax = 524288;
const static uint32_t MaxProcessCount = 254;

/* Superpages with a fixed purpose */
const static uint32_t WindowVpn1 = SV32_VPN1(PageTableOffset);
const static uint32_t ProcessVpn1 = SV32_VPN1(PageTableRootOffset);
const static uint32_t KernelVpn1 = 1023;

/* One page table word. A zero entry is unmapped, a non-zero entry
 * without the valid bit is reserved: it carries the permissions a page
 * will get once it is backed.
 */
class PageTableEntry
{
  protected:
    uint32_t value;

  public:
    PageTableEntry() : value(0) {}
    explicit PageTableEntry(uint32_t value) : value(value) {}

    static PageTableEntry make(uint32_t phys, uint32_t flags)
    {
      return PageTableEntry(SV32_MAKE_ENTRY(phys, flags));
    }

    uint32_t raw(void) const { return value; }
    uint32_t flags(void) const { return value & FLG_MASK; }
    uint32_t physAddr(void) const { return SV32_ENTRY_ADDR(value); }
    bool valid(void) const { return value & FLG_VALID; }
    bool reserved(void) const { return value != 0 && !valid(); }
    bool isLeaf(void) const { return value & (FLG_R | FLG_W | FLG_X); }
};

std::ostream &operator<<(std::ostream &os, const PageTableEntry &entry);

/* Root and leaf tables share a format: one page of entries. */
struct PageTable
{
  PageTableEntry entries[entriesPerTable];
};

using RootPageTable = PageTable;
using LeafPageTable = PageTable;

static_assert(sizeof(PageTable) == pageSize, "a page table must fill one page");

/*
 * MMU hardware part (arch/sv32/mmu.cc)
 */

class Sv32MMU : public MMU
{
  public:
    explicit Sv32MMU(PhysicalMemory &memory);
    virtual ~Sv32MMU();

    virtual uint8_t getPageBits(void) const override
    {
      return pageBits;
    }

    virtual uint32_t getPageSize(void) const override
    {
      return pageSize;
    }

    virtual uint8_t getAddressSpaceBits(void) const override
    {
      return addressSpaceBits;
    }

    virtual uint32_t getASID(void) const override
    {
      return (satp >> SatpAsidShift) & SatpAsidMask;
    }

    virtual bool performTranslation(const uint32_t vPage,
                                    uint32_t &pPage,
                                    uint32_t &flags,
                                    bool isWrite) override;

    virtual bool checkPermissions(const MemAccess &access,
                                  const uint32_t flags) const override;

    virtual bool isGlobal(const uint32_t flags) const override
    {
      return flags & FLG_GLOBAL;
    }
};

/*
 * Address space handle (arch/sv32/mem.cc)
 */

class MemoryMapping
{
  protected:
    uint32_t satp;

  public:
    MemoryMapping() : satp(0) {}
    explicit MemoryMapping(uint32_t satp) : satp(satp) {}

    /* The mapping currently loaded into the MMU. */
    static MemoryMapping current(const MMU &mmu);

    static MemoryMapping make(PID pid, uint32_t rootPhys);

    uint32_t raw(void) const { return satp; }
    void fromRaw(uint32_t value) { satp = value; }

    PID getPid(void) const;
    uint32_t getRootTable(void) const;

    bool isAllocated(void) const { return satp != 0; }
    bool isKernel(void) const { return getPid() == KernelPID; }

    /* Load this mapping into the MMU. The kernel superpage, the page
     * table window and the context page sit at the same addresses in
     * every mapping, so the caller keeps running across the switch.
     */
    void activate(MMU &mmu) const;

    /* Build a new address space for `pid`, using the active mapping to
     * reach the new tables.
     */
    Error allocate(MemoryManager &mm, AddressSpaceLayout &layout, PID pid);

    /* Prepare a leaf entry for `addr` without backing it. This mapping
     * must be the active one.
     */
    Error reserveAddress(MemoryManager &mm, uint32_t addr, MemoryFlags flags);

    void printMap(MMU &mmu, std::ostream &os) const;

    bool operator==(const MemoryMapping &other) const
    {
      return satp == other.satp;
    }

    bool operator!=(const MemoryMapping &other) const
    {
      return satp != other.satp;
    }
};

std::ostream &operator<<(std::ostream &os, const MemoryMapping &mapping);

/*
 * Page table manipulation through the self-mapped window. All of these
 * act on the active mapping.
 */

uint32_t translateFlags(MemoryFlags flags);
MemoryFlags untranslateFlags(uint32_t flags);

Error mapPageInner(MemoryManager &mm, PID pid, uint32_t phys,
                   uint32_t virt, MemoryFlags flags);
Error unmapPageInner(MMU &mmu, uint32_t virt, uint32_t &phys);

Error virtToPhys(MMU &mmu, uint32_t virt, uint32_t &phys);
Error pagetableEntry(MMU &mmu, uint32_t virt, uint32_t &entryAddr);
Error pagetableEntryValue(MMU &mmu, uint32_t virt, PageTableEntry &entry);
Error setPagetableEntry(MMU &mmu, uint32_t virt, uint32_t raw);
bool  addressAvailable(MMU &mmu, uint32_t virt);

/* Clear a mapped page through the MMU. Pages without W are made writable
 * for the duration.
 */
Error zeroMappedPage(MMU &mmu, uint32_t virt);
/* Unhook and free the leaf table of superpage `vpn1` when it no longer
 * holds any entry.
 */
Error releaseLeafTable(MemoryManager &mm, PID pid, uint32_t vpn1);

Error ensurePageExistsInner(MemoryManager &mm, uint32_t address, uint32_t &phys);
Error handPageToUser(MMU &mmu, uint32_t virt);
Error pageFlags(MMU &mmu, uint32_t virt, MemoryFlags &flags);
Error updatePageFlags(MMU &mmu, uint32_t virt, MemoryFlags flags);

using MappingVisitor = std::function<void(uint32_t virt, PageTableEntry entry)>;

/* Visit every valid leaf entry of the active mapping. Superpage 1023 is
 * only visited when `includeKernel` is set.
 */
void walkMapping(MMU &mmu, bool includeKernel, const MappingVisitor &visitor);

/*
 * Execution context (arch/sv32/context.cc)
 */

struct ProcessContext
{
  /* x1 .. x31; x0 is hardwired to zero */
  uint32_t registers[31];
  uint32_t sepc;

  ProcessContext();

  /* A context with a zero program counter holds no thread. */
  bool valid(void) const
  {
    return sepc != 0;
  }

  void invalidate(void)
  {
    sepc = 0;
  }

  void init(uint32_t entrypoint, uint32_t stack);

  uint32_t getStack(void) const;
  uint32_t getReturnAddress(void) const;
  uint32_t getArgument(unsigned int index) const;

  /* Set up a call to `pc` on `stack` that returns to `returnAddress`. */
  void invoke(uint32_t pc, uint32_t stack, uint32_t returnAddress,
              const std::vector<uint32_t> &args);

  /* The context of the active process lives in its context page. */
  static ProcessContext load(MMU &mmu);
  void store(MMU &mmu) const;
};

} /* namespace Sv32 */

#endif /* __ARCH_SV32__ */
