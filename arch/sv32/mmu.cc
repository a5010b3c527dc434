/* kmem -- A microkernel memory manager and process table simulator
 *
 *    sv32/mmu.cc - Sv32 two-level page table implementation
 *                  Hardware MMU part.
 *
 * Copyright (C) 2024  Leiden University, The Netherlands.
 */

#include "sv32.h"
#include "settings.h"
using namespace Sv32;

#include <stdexcept>
#include <memory>

/*
 * MMU part. The MMU performs a two-level page table walk in physical
 * memory and attempts the translation from a virtual to a physical address.
 */

Sv32MMU::Sv32MMU(PhysicalMemory &memory)
  : MMU(memory)
{
  setTLB(std::make_unique<TLB>(TLBEntries, *this));
}

Sv32MMU::~Sv32MMU()
{
}

bool
Sv32MMU::performTranslation(const uint32_t vPage,
                            uint32_t &pPage,
                            uint32_t &flags,
                            bool isWrite)
{
  if (!(satp & SatpModeSv32))
    throw std::runtime_error("MMU: address translation is disabled in satp");

  const uint32_t root = (satp & SatpPpnMask) << pageBits;
  const uint32_t vAddr = vPage << pageBits;

  /* Root -> leaf table */
  const uint32_t rootEntryAddr = root + SV32_VPN1(vAddr) * sizeof(uint32_t);
  PageTableEntry rootEntry(memory.read32(rootEntryAddr));
  if (!rootEntry.valid())
    return false;

  uint32_t entryAddr;
  PageTableEntry entry;
  if (rootEntry.isLeaf())
    {
      /* A 4 MiB superpage must have a zero low page number */
      if (SV32_ENTRY_PPN(rootEntry.raw()) & 0x3ff)
        return false;

      entryAddr = rootEntryAddr;
      entry = rootEntry;
      pPage = SV32_ENTRY_PPN(rootEntry.raw()) | SV32_VPN0(vAddr);
    }
  else
    {
      entryAddr = rootEntry.physAddr() + SV32_VPN0(vAddr) * sizeof(uint32_t);
      entry = PageTableEntry(memory.read32(entryAddr));

      /* Leaf -> final page; a pointer at the last level is malformed */
      if (!entry.valid() || !entry.isLeaf())
        return false;

      pPage = SV32_ENTRY_PPN(entry.raw());
    }

  /* Write-only pages are reserved encodings */
  if ((entry.flags() & (FLG_R | FLG_W)) == FLG_W)
    return false;

  /* Set the accessed bit, and the dirty bit if this is a write access */
  uint32_t updated = entry.raw() | FLG_A;
  if (isWrite)
    updated |= FLG_D;
  if (updated != entry.raw())
    memory.write32(entryAddr, updated);

  flags = updated & FLG_MASK;
  return true;
}

bool
Sv32MMU::checkPermissions(const MemAccess &access, const uint32_t flags) const
{
  /* Supervisor accesses to user pages are permitted (SUM is set). */
  if (access.user && !(flags & FLG_U))
    return false;

  switch (access.type)
    {
      case MemAccessType::Load:
        return flags & FLG_R;
      case MemAccessType::Store:
        return flags & FLG_W;
      case MemAccessType::Modify:
        return (flags & FLG_R) && (flags & FLG_W);
      case MemAccessType::Instr:
        return flags & FLG_X;
    }

  return false;
}
