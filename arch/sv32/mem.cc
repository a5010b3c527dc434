/* kmem -- A microkernel memory manager and process table simulator
 *
 *    sv32/mem.cc - Sv32 two-level page table implementation
 *                  OS driver part.
 *
 * Copyright (C) 2024  Leiden University, The Netherlands.
 */

#include "sv32.h"
#include "os/memorymanager.h"
#include "panic.h"
#include "settings.h"
using namespace Sv32;

#include <iostream>
#include <iomanip>

/*
 * Page tables are reached through their own mapping: the root table is
 * mapped at PageTableRootOffset and the leaf table for superpage N is
 * mapped at PageTableOffset + N * pageSize.
 */

static inline uint32_t
rootEntryAddr(const uint32_t vpn1)
{
  return PageTableRootOffset + vpn1 * sizeof(uint32_t);
}

static inline uint32_t
leafTableAddr(const uint32_t vpn1)
{
  return PageTableOffset + vpn1 * pageSize;
}

static inline uint32_t
leafEntryAddr(const uint32_t vpn1, const uint32_t vpn0)
{
  return leafTableAddr(vpn1) + vpn0 * sizeof(uint32_t);
}

static void
zeroPage(MMU &mmu, const uint32_t virt)
{
  for (uint32_t offset = 0; offset < pageSize; offset += sizeof(uint32_t))
    mmu.store(virt + offset, 0);
}

/* Make sure the leaf table covering superpage `vpn1` exists, allocating
 * it for `pid` and mapping it into the window when it does not.
 */
static Error
ensureLeafTable(MemoryManager &mm, const PID pid, const uint32_t vpn1)
{
  MMU &mmu = mm.getMMU();

  if (PageTableEntry(mmu.load(rootEntryAddr(vpn1))).valid())
    return Error::Ok;

  if (vpn1 == WindowVpn1)
    kernelPanic("page table window of PID ", int(pid), " is not mapped");

  uint32_t leafPhys = 0;
  Error error = mm.allocPage(pid, leafPhys);
  if (error != Error::Ok)
    return error;

  mmu.store(rootEntryAddr(vpn1), SV32_MAKE_ENTRY(leafPhys, FLG_VALID));
  mmu.flush();

  /* The window's own leaf table always exists, so this recursion stops
   * after one level.
   */
  error = mapPageInner(mm, pid, leafPhys, leafTableAddr(vpn1),
                       MemoryFlagR | MemoryFlagW);
  if (error != Error::Ok)
    {
      mmu.store(rootEntryAddr(vpn1), 0);
      mmu.flush();
      if (mm.releasePage(leafPhys, pid) != Error::Ok)
        kernelPanic("unable to release leaf table ", std::hex, std::showbase,
                    leafPhys, " after a failed mapping");
      return error;
    }

  zeroPage(mmu, leafTableAddr(vpn1));

  if (LogPageTableUpdates)
    std::cerr << "PT: PID " << int(pid) << " new leaf table for superpage "
              << vpn1 << " @ " << std::hex << std::showbase << leafPhys
              << std::dec << std::endl;

  return Error::Ok;
}

namespace Sv32 {

std::ostream &
operator<<(std::ostream &os, const PageTableEntry &entry)
{
  static const char names[] = "VRWXUGADSP";

  std::ios_base::fmtflags flags(os.flags());
  os << std::hex << std::showbase << entry.physAddr() << " (";
  for (int bit = 0; bit < 10; ++bit)
    os << ((entry.raw() & (1U << bit)) ? names[bit] : '-');
  os << ")";
  os.flags(flags);
  return os;
}

uint32_t
translateFlags(MemoryFlags flags)
{
  uint32_t result = 0;
  if (flags & MemoryFlagR)
    result |= FLG_R;
  if (flags & MemoryFlagW)
    result |= FLG_W;
  if (flags & MemoryFlagX)
    result |= FLG_X;
  return result;
}

MemoryFlags
untranslateFlags(uint32_t flags)
{
  MemoryFlags result = 0;
  if (flags & FLG_R)
    result |= MemoryFlagR;
  if (flags & FLG_W)
    result |= MemoryFlagW;
  if (flags & FLG_X)
    result |= MemoryFlagX;
  return result;
}

Error
mapPageInner(MemoryManager &mm, PID pid, uint32_t phys,
             uint32_t virt, MemoryFlags flags)
{
  MMU &mmu = mm.getMMU();
  const uint32_t vpn1 = SV32_VPN1(virt);
  const uint32_t vpn0 = SV32_VPN0(virt);

  if ((virt & (pageSize - 1)) || (phys & (pageSize - 1)))
    kernelPanic("map_page_inner: PID ", int(pid), " unaligned mapping of ",
                std::hex, std::showbase, phys, " to ", virt);

  if (phys == 0)
    kernelPanic("map_page_inner: PID ", int(pid),
                " attempted to map physical page 0 at ",
                std::hex, std::showbase, virt);

  uint32_t mmuFlags = translateFlags(flags) | FLG_VALID | FLG_D | FLG_A;
  if (pid != KernelPID && virt < UserAreaEnd)
    mmuFlags |= FLG_U;
  if (vpn1 == KernelVpn1)
    mmuFlags |= FLG_GLOBAL;

  Error error = ensureLeafTable(mm, pid, vpn1);
  if (error != Error::Ok)
    return error;

  const uint32_t entryAddr = leafEntryAddr(vpn1, vpn0);
  PageTableEntry entry(mmu.load(entryAddr));
  if (entry.valid() && entry.physAddr() != phys)
    kernelPanic("map_page_inner: PID ", int(pid), " remapping ",
                std::hex, std::showbase, virt, " from ", entry.physAddr(),
                " to ", phys);

  mmu.store(entryAddr, SV32_MAKE_ENTRY(phys, mmuFlags));
  mmu.flush();

  if (LogPageTableUpdates)
    std::cerr << "PT: PID " << int(pid) << " mapped "
              << std::hex << std::showbase << virt << " -> "
              << PageTableEntry(SV32_MAKE_ENTRY(phys, mmuFlags))
              << std::dec << std::endl;

  return Error::Ok;
}

Error
unmapPageInner(MMU &mmu, uint32_t virt, uint32_t &phys)
{
  uint32_t entryAddr = 0;
  Error error = pagetableEntry(mmu, virt, entryAddr);
  if (error != Error::Ok)
    return error;

  PageTableEntry entry(mmu.load(entryAddr));
  if (entry.raw() == 0)
    return Error::BadAddress;

  phys = entry.physAddr();
  mmu.store(entryAddr, 0);
  mmu.flush();

  if (LogPageTableUpdates)
    std::cerr << "PT: unmapped " << std::hex << std::showbase << virt
              << " (was " << entry << ")" << std::dec << std::endl;

  return Error::Ok;
}

Error
pagetableEntry(MMU &mmu, uint32_t virt, uint32_t &entryAddr)
{
  const uint32_t vpn1 = SV32_VPN1(virt);

  if (!PageTableEntry(mmu.load(rootEntryAddr(vpn1))).valid())
    return Error::BadAddress;

  entryAddr = leafEntryAddr(vpn1, SV32_VPN0(virt));
  return Error::Ok;
}

Error
pagetableEntryValue(MMU &mmu, uint32_t virt, PageTableEntry &entry)
{
  uint32_t entryAddr = 0;
  Error error = pagetableEntry(mmu, virt, entryAddr);
  if (error != Error::Ok)
    return error;

  entry = PageTableEntry(mmu.load(entryAddr));
  return Error::Ok;
}

Error
virtToPhys(MMU &mmu, uint32_t virt, uint32_t &phys)
{
  PageTableEntry entry;
  Error error = pagetableEntryValue(mmu, virt, entry);
  if (error != Error::Ok)
    return error;

  if (entry.reserved())
    return Error::MemoryInUse;
  if (!entry.valid())
    return Error::BadAddress;

  phys = entry.physAddr();
  return Error::Ok;
}

Error
setPagetableEntry(MMU &mmu, uint32_t virt, uint32_t raw)
{
  uint32_t entryAddr = 0;
  Error error = pagetableEntry(mmu, virt, entryAddr);
  if (error != Error::Ok)
    return error;

  mmu.store(entryAddr, raw);
  mmu.flush();
  return Error::Ok;
}

Error
zeroMappedPage(MMU &mmu, uint32_t virt)
{
  uint32_t entryAddr = 0;
  Error error = pagetableEntry(mmu, virt & ~(pageSize - 1), entryAddr);
  if (error != Error::Ok)
    return error;

  const PageTableEntry entry(mmu.load(entryAddr));
  if (!entry.valid())
    return Error::BadAddress;

  const bool writable = entry.raw() & FLG_W;
  if (!writable)
    {
      mmu.store(entryAddr, entry.raw() | FLG_R | FLG_W);
      mmu.flush();
    }

  zeroPage(mmu, virt & ~(pageSize - 1));

  if (!writable)
    {
      mmu.store(entryAddr, entry.raw());
      mmu.flush();
    }
  return Error::Ok;
}

Error
releaseLeafTable(MemoryManager &mm, PID pid, uint32_t vpn1)
{
  MMU &mmu = mm.getMMU();

  if (vpn1 == WindowVpn1 || vpn1 == ProcessVpn1 || vpn1 == KernelVpn1)
    kernelPanic("release_leaf_table: PID ", int(pid),
                " attempted to release fixed superpage ", vpn1);

  if (!PageTableEntry(mmu.load(rootEntryAddr(vpn1))).valid())
    return Error::BadAddress;

  for (uint32_t vpn0 = 0; vpn0 < entriesPerTable; ++vpn0)
    if (mmu.load(leafEntryAddr(vpn1, vpn0)) != 0)
      return Error::MemoryInUse;

  uint32_t leafPhys = 0;
  Error error = unmapPageInner(mmu, leafTableAddr(vpn1), leafPhys);
  if (error != Error::Ok)
    return error;

  mmu.store(rootEntryAddr(vpn1), 0);
  mmu.flush();

  if (LogPageTableUpdates)
    std::cerr << "PT: PID " << int(pid) << " released leaf table for superpage "
              << vpn1 << " @ " << std::hex << std::showbase << leafPhys
              << std::dec << std::endl;

  return mm.releasePage(leafPhys, pid);
}

bool
addressAvailable(MMU &mmu, uint32_t virt)
{
  uint32_t phys;
  return virtToPhys(mmu, virt, phys) == Error::BadAddress;
}

Error
ensurePageExistsInner(MemoryManager &mm, uint32_t address, uint32_t &phys)
{
  MMU &mmu = mm.getMMU();
  const MemoryMapping mapping = MemoryMapping::current(mmu);
  const PID pid = mapping.getPid();

  if (!mapping.isKernel() && address >= UserAreaEnd)
    return Error::OutOfMemory;

  const uint32_t virt = address & ~(pageSize - 1);
  uint32_t entryAddr = 0;
  Error error = pagetableEntry(mmu, virt, entryAddr);
  if (error != Error::Ok)
    return error;

  PageTableEntry entry(mmu.load(entryAddr));
  if (entry.valid())
    {
      phys = entry.physAddr();
      return Error::Ok;
    }

  /* Only a reserved, unshared entry can be backed on demand */
  const uint32_t flags = entry.flags();
  if (flags == 0 || (flags & FLG_S))
    return Error::BadAddress;

  uint32_t newPage = 0;
  error = mm.allocPage(pid, newPage);
  if (error != Error::Ok)
    return error;

  /* Map it kernel-only first so nothing else sees it before it is clean */
  mmu.store(entryAddr, SV32_MAKE_ENTRY(newPage, flags | FLG_VALID | FLG_D | FLG_A));
  mmu.flush();
  error = zeroMappedPage(mmu, virt);
  if (error != Error::Ok)
    kernelPanic("ensure_page_exists: PID ", int(pid), " lost page ",
                std::hex, std::showbase, virt, " while clearing it");

  if (pid != KernelPID && virt < UserAreaEnd)
    {
      mmu.store(entryAddr, mmu.load(entryAddr) | FLG_U);
      mmu.flush();
    }

  if (LogPageTableUpdates)
    std::cerr << "PT: PID " << int(pid) << " backed reserved page "
              << std::hex << std::showbase << virt << " with " << newPage
              << std::dec << std::endl;

  phys = newPage;
  return Error::Ok;
}

Error
handPageToUser(MMU &mmu, uint32_t virt)
{
  uint32_t entryAddr = 0;
  Error error = pagetableEntry(mmu, virt, entryAddr);
  if (error != Error::Ok)
    return error;

  PageTableEntry entry(mmu.load(entryAddr));
  if (!entry.valid())
    return Error::BadAddress;

  mmu.store(entryAddr, entry.raw() | FLG_U);
  mmu.flush();
  return Error::Ok;
}

Error
pageFlags(MMU &mmu, uint32_t virt, MemoryFlags &flags)
{
  PageTableEntry entry;
  Error error = pagetableEntryValue(mmu, virt, entry);
  if (error != Error::Ok)
    return error;

  if (!entry.valid())
    return Error::BadAddress;

  flags = untranslateFlags(entry.flags());
  return Error::Ok;
}

Error
updatePageFlags(MMU &mmu, uint32_t virt, MemoryFlags flags)
{
  uint32_t entryAddr = 0;
  Error error = pagetableEntry(mmu, virt, entryAddr);
  if (error != Error::Ok)
    return error;

  PageTableEntry entry(mmu.load(entryAddr));
  if (!entry.valid())
    return Error::BadAddress;

  const uint32_t updated = (entry.raw() & ~(FLG_R | FLG_W | FLG_X))
      | translateFlags(flags);
  mmu.store(entryAddr, updated);
  mmu.flush();
  return Error::Ok;
}

void
walkMapping(MMU &mmu, bool includeKernel, const MappingVisitor &visitor)
{
  for (uint32_t vpn1 = 0; vpn1 < entriesPerTable; ++vpn1)
    {
      if (vpn1 == KernelVpn1 && !includeKernel)
        continue;

      if (!PageTableEntry(mmu.load(rootEntryAddr(vpn1))).valid())
        continue;

      for (uint32_t vpn0 = 0; vpn0 < entriesPerTable; ++vpn0)
        {
          PageTableEntry entry(mmu.load(leafEntryAddr(vpn1, vpn0)));
          if (entry.valid())
            visitor((vpn1 << 22) | (vpn0 << pageBits), entry);
        }
    }
}

/*
 * MemoryMapping
 */

MemoryMapping
MemoryMapping::current(const MMU &mmu)
{
  return MemoryMapping(mmu.getSatp());
}

MemoryMapping
MemoryMapping::make(PID pid, uint32_t rootPhys)
{
  return MemoryMapping(SatpModeSv32
                       | (uint32_t(pid) << SatpAsidShift)
                       | ((rootPhys >> pageBits) & SatpPpnMask));
}

PID
MemoryMapping::getPid(void) const
{
  return static_cast<PID>((satp >> SatpAsidShift) & SatpAsidMask);
}

uint32_t
MemoryMapping::getRootTable(void) const
{
  return (satp & SatpPpnMask) << pageBits;
}

void
MemoryMapping::activate(MMU &mmu) const
{
  mmu.flush();
  mmu.setSatp(satp);
  mmu.flush();

  if (LogProcessSwitches)
    std::cerr << "PROC: activated mapping " << *this << std::endl;
}

Error
MemoryMapping::allocate(MemoryManager &mm, AddressSpaceLayout &layout, PID pid)
{
  if (satp != 0)
    return Error::MemoryInUse;

  MMU &mmu = mm.getMMU();
  const PID currentPid = MemoryMapping::current(mmu).getPid();

  /* Root table, window leaf table, process leaf table and context page,
   * reached through temporary mappings in the current address space.
   */
  uint32_t virt[4] = { 0, 0, 0, 0 };
  uint32_t phys[4] = { 0, 0, 0, 0 };
  for (int i = 0; i < 4; ++i)
    {
      Error error = mm.mapZeroedPage(layout, currentPid, false, virt[i]);
      if (error == Error::Ok)
        error = virtToPhys(mmu, virt[i], phys[i]);

      if (error != Error::Ok)
        {
          for (int j = 0; j < i; ++j)
            if (mm.unmapPage(virt[j]) != Error::Ok)
              kernelPanic("unable to undo temporary mapping ",
                          std::hex, std::showbase, virt[j]);
          return error;
        }
    }

  const uint32_t rootVirt = virt[0], pagesVirt = virt[1], processVirt = virt[2];
  const uint32_t rootPhys = phys[0], pagesPhys = phys[1],
      processPhys = phys[2], contextPhys = phys[3];
  const uint32_t tableFlags = FLG_VALID | FLG_R | FLG_W | FLG_D | FLG_A;

  /* The kernel superpage is shared with the current address space */
  mmu.store(rootVirt + KernelVpn1 * sizeof(uint32_t),
            mmu.load(rootEntryAddr(KernelVpn1)));
  mmu.store(rootVirt + ProcessVpn1 * sizeof(uint32_t),
            SV32_MAKE_ENTRY(processPhys, FLG_VALID));
  mmu.store(rootVirt + WindowVpn1 * sizeof(uint32_t),
            SV32_MAKE_ENTRY(pagesPhys, FLG_VALID));

  mmu.store(processVirt + SV32_VPN0(PageTableRootOffset) * sizeof(uint32_t),
            SV32_MAKE_ENTRY(rootPhys, tableFlags));
  mmu.store(processVirt + SV32_VPN0(ThreadContextArea) * sizeof(uint32_t),
            SV32_MAKE_ENTRY(contextPhys, tableFlags));

  mmu.store(pagesVirt + ProcessVpn1 * sizeof(uint32_t),
            SV32_MAKE_ENTRY(processPhys, tableFlags));
  mmu.store(pagesVirt + WindowVpn1 * sizeof(uint32_t),
            SV32_MAKE_ENTRY(pagesPhys, tableFlags));

  for (int i = 0; i < 4; ++i)
    {
      if (mm.movePage(phys[i], pid, currentPid) != Error::Ok)
        kernelPanic("unable to hand page ", std::hex, std::showbase, phys[i],
                    std::dec, " from PID ", int(currentPid), " to PID ", int(pid));

      uint32_t unmapped = 0;
      if (unmapPageInner(mmu, virt[i], unmapped) != Error::Ok)
        kernelPanic("unable to remove temporary mapping ",
                    std::hex, std::showbase, virt[i]);
    }

  satp = MemoryMapping::make(pid, rootPhys).raw();

  if (LogProcessSwitches)
    std::cerr << "PROC: allocated address space " << *this << std::endl;

  return Error::Ok;
}

Error
MemoryMapping::reserveAddress(MemoryManager &mm, uint32_t addr, MemoryFlags flags)
{
  MMU &mmu = mm.getMMU();

  if (MemoryMapping::current(mmu) != *this)
    kernelPanic("reserve_address: mapping ", *this, " is not active");

  if (addr & (pageSize - 1))
    return Error::BadAlignment;

  const uint32_t vpn1 = SV32_VPN1(addr);
  Error error = ensureLeafTable(mm, getPid(), vpn1);
  if (error != Error::Ok)
    return error;

  const uint32_t entryAddr = leafEntryAddr(vpn1, SV32_VPN0(addr));
  if (PageTableEntry(mmu.load(entryAddr)).valid())
    return Error::Ok;

  mmu.store(entryAddr, translateFlags(flags));
  mmu.flush();
  return Error::Ok;
}

void
MemoryMapping::printMap(MMU &mmu, std::ostream &os) const
{
  if (MemoryMapping::current(mmu) != *this)
    kernelPanic("print_map: mapping ", *this, " is not active");

  os << "Memory map for " << *this << ":" << std::endl;
  walkMapping(mmu, isKernel(), [&os](uint32_t virt, PageTableEntry entry)
    {
      std::ios_base::fmtflags flags(os.flags());
      os << "    " << std::hex << std::setw(8) << std::setfill('0') << virt
         << " -> " << entry << std::endl;
      os.flags(flags);
    });
}

std::ostream &
operator<<(std::ostream &os, const MemoryMapping &mapping)
{
  std::ios_base::fmtflags flags(os.flags());
  os << "(satp: " << std::hex << std::showbase << mapping.raw()
     << ", mode: " << (mapping.raw() >> 31)
     << ", ASID: " << std::dec << ((mapping.raw() >> SatpAsidShift) & SatpAsidMask)
     << ", PPN: " << std::hex << std::showbase << mapping.getRootTable() << ")";
  os.flags(flags);
  return os;
}

} /* namespace Sv32 */
