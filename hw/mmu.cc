/* kmem -- A microkernel memory manager and process table simulator
 *
 *    mmu.cc - Memory Management Unit component
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#include "mmu.h"
#include "settings.h"

#include <iostream>
#include <sstream>

std::ostream &
operator<<(std::ostream &os, const MemAccess &access)
{
  static const char *names[] = { "load", "store", "modify", "instr" };

  std::ios_base::fmtflags flags(os.flags());
  os << names[static_cast<int>(access.type)] << " @ "
     << std::hex << std::showbase << access.addr
     << (access.user ? " (user)" : " (supervisor)");
  os.flags(flags);
  return os;
}

PageFault::PageFault(const std::string &message, uint32_t addr)
  : std::runtime_error(message), addr(addr)
{
}

/*
 * TLB
 */

TLB::TLB(const size_t nEntries, const MMU &mmu)
  : nEntries(nEntries), mmu(mmu), entries(nEntries), lruOrder(), lruMap(),
    nLookups(0), nHits(0), nEvictions(0), nFlush(0), nFlushEvictions(0)
{
}

TLB::~TLB()
{
}

void
TLB::touch(size_t index)
{
  auto it = lruMap.find(index);
  if (it != lruMap.end())
    lruOrder.erase(it->second);

  lruOrder.push_front(index);
  lruMap[index] = lruOrder.begin();
}

bool
TLB::lookup(const uint32_t vPage, const uint32_t asid,
            uint32_t &pPage, uint32_t &flags)
{
  nLookups++;

  for (size_t i = 0; i < nEntries; ++i)
    {
      const TLBEntry &entry = entries[i];
      if (entry.valid && entry.vPage == vPage &&
          (entry.global || entry.asid == asid))
        {
          pPage = entry.pPage;
          flags = entry.flags;
          nHits++;
          touch(i);
          return true;
        }
    }

  return false;
}

void
TLB::add(const uint32_t vPage, const uint32_t asid,
         const uint32_t pPage, const uint32_t flags, bool global)
{
  if (nEntries == 0)
    return;

  size_t replaceIndex = 0;
  bool foundEmpty = false;

  /* First try to find an empty slot */
  for (size_t i = 0; i < nEntries; ++i)
    {
      if (!entries[i].valid)
        {
          replaceIndex = i;
          foundEmpty = true;
          break;
        }
    }

  /* If no empty slot, use LRU replacement */
  if (!foundEmpty)
    {
      if (!lruOrder.empty())
        {
          replaceIndex = lruOrder.back();
          lruOrder.pop_back();
          lruMap.erase(replaceIndex);
        }
      nEvictions++;
    }

  entries[replaceIndex] = TLBEntry(vPage, pPage, flags, asid, global);
  touch(replaceIndex);
}

void
TLB::flush(void)
{
  nFlush++;
  nFlushEvictions += getValidEntries();

  for (auto &entry : entries)
    entry.valid = false;

  lruOrder.clear();
  lruMap.clear();
}

void
TLB::clear(void)
{
  flush();
  nLookups = 0;
  nHits = 0;
  nEvictions = 0;
  nFlush = 0;
  nFlushEvictions = 0;
}

size_t
TLB::getValidEntries(void) const
{
  size_t validCount = 0;
  for (const auto &entry : entries)
    if (entry.valid)
      validCount++;

  return validCount;
}

void
TLB::getStatistics(int &nLookups, int &nHits, int &nEvictions,
                   int &nFlush, int &nFlushEvictions) const
{
  nLookups = this->nLookups;
  nHits = this->nHits;
  nEvictions = this->nEvictions;
  nFlush = this->nFlush;
  nFlushEvictions = this->nFlushEvictions;
}

/*
 * MMU
 */

MMU::MMU(PhysicalMemory &memory)
  : memory(memory), satp(0x0), pageFaultHandler(), tlb(nullptr)
{
}

MMU::~MMU()
{
  if (!LogTLBStatistics)
    return;

  int nLookups{}, nHits{}, nEvictions{}, nFlush{}, nFlushEvictions{};
  getTLBStatistics(nLookups, nHits, nEvictions, nFlush, nFlushEvictions);

  std::cerr << std::dec << std::endl
            << "TLB Statistics (since last reset):" << std::endl
            << "# lookups: " << nLookups << std::endl
            << "# hits: " << nHits
            << " (" << (nLookups ? ((float)nHits/nLookups)*100. : 0.) << "%)" << std::endl
            << "# line evictions: " << nEvictions << std::endl
            << "# flushes: " << nFlush << std::endl
            << "# line evictions due to flush: " << nFlushEvictions << std::endl;
}

void
MMU::initialize(PageFaultFunction _pageFaultHandler)
{
  pageFaultHandler = _pageFaultHandler;
}

void
MMU::setSatp(const uint32_t _satp)
{
  satp = _satp;
}

void
MMU::flush(void)
{
  if (tlb)
    tlb->flush();
}

uint32_t
MMU::processMemAccess(const MemAccess &access)
{
  if (satp == 0x0)
    throw std::runtime_error("MMU: satp is not set, cannot continue.");

  if (LogMemoryAccesses)
    std::cerr << "MMU: memory access: " << access << std::endl;

  bool isWrite = (access.type == MemAccessType::Store ||
                  access.type == MemAccessType::Modify);

  uint32_t pAddr = 0x0;
  if (not getTranslation(access, pAddr))
    {
      /* A handler that reports success must have fixed the entry; a
       * second miss on the same access is not retried.
       */
      if (not pageFaultHandler || not pageFaultHandler(access.addr, isWrite)
          || not getTranslation(access, pAddr))
        {
          std::ostringstream message;
          message << "MMU: unresolved page fault on " << access;
          throw PageFault(message.str(), access.addr);
        }
    }

  if (LogMemoryAccesses)
    std::cerr << "MMU: translated virtual "
        << std::hex << std::showbase << access.addr
        << " to physical " << pAddr << std::dec << std::endl;

  return pAddr;
}

uint32_t
MMU::load(const uint32_t vAddr, bool user)
{
  return memory.read32(processMemAccess({ vAddr, MemAccessType::Load, user }));
}

void
MMU::store(const uint32_t vAddr, const uint32_t value, bool user)
{
  memory.write32(processMemAccess({ vAddr, MemAccessType::Store, user }), value);
}

uint32_t
MMU::makePhysicalAddr(const MemAccess &access, const uint32_t pPage)
{
  uint32_t pAddr = pPage << getPageBits();
  pAddr |= access.addr & (getPageSize() - 1);

  return pAddr;
}

bool
MMU::getTranslation(const MemAccess &access, uint32_t &pAddr)
{
  const uint32_t vPage = access.addr >> getPageBits();
  uint32_t pPage = 0;
  uint32_t flags = 0;
  bool isWrite = (access.type == MemAccessType::Store ||
                  access.type == MemAccessType::Modify);

  /* Check TLB first if available */
  if (tlb && tlb->lookup(vPage, getASID(), pPage, flags))
    {
      if (not checkPermissions(access, flags))
        return false;

      pAddr = makePhysicalAddr(access, pPage);
      return true;
    }

  /* TLB miss - perform page table walk */
  if (performTranslation(vPage, pPage, flags, isWrite) &&
      checkPermissions(access, flags))
    {
      if (tlb)
        tlb->add(vPage, getASID(), pPage, flags, isGlobal(flags));

      pAddr = makePhysicalAddr(access, pPage);
      return true;
    }

  return false;
}

void
MMU::setTLB(std::unique_ptr<TLB> tlb_ptr)
{
  tlb = std::move(tlb_ptr);
}

void
MMU::getTLBStatistics(int &nLookups, int &nHits, int &nEvictions,
                      int &nFlush, int &nFlushEvictions) const
{
  if (tlb)
    {
      tlb->getStatistics(nLookups, nHits, nEvictions, nFlush, nFlushEvictions);
    }
  else
    {
      nLookups = 0;
      nHits = 0;
      nEvictions = 0;
      nFlush = 0;
      nFlushEvictions = 0;
    }
}
