/* kmem -- A microkernel memory manager and process table simulator
 *
 *    memorymanager.cc - Physical page ownership and address space mapping
 *
 * Copyright (C) 2017-2024  Leiden University, The Netherlands.
 */

#include "memorymanager.h"
#include "panic.h"
#include "settings.h"
using namespace Sv32;

#include <algorithm>
#include <iostream>
#include <map>


AddressSpaceLayout::AddressSpaceLayout()
  : defaultBase(DefaultBase), defaultLast(DefaultBase),
    messageBase(DefaultMessageBase), messageLast(DefaultMessageBase),
    heapBase(DefaultHeapBase), heapSize(0), heapMax(DefaultHeapMax)
{
}

MemoryManager::MemoryManager(MMU &mmu)
  : mmu(mmu), owners(nullptr), nOwners(0),
    ramStart(0), ramSize(0), ramName(0), extraRegions(),
    lastRamPage(0), initialized(false), handles(0)
{
}

size_t
MemoryManager::trackerEntries(const KernelArguments &args)
{
  size_t entries = 0;
  for (const auto &tag : args)
    {
      if (tag.name == TagXArg && tag.size >= XArgWords)
        entries += tag.data[3] / pageSize;
      else if (tag.name == TagMREx)
        for (size_t i = 0; i + MemoryRangeExtraWords <= tag.size;
             i += MemoryRangeExtraWords)
          entries += tag.data[i + 1] / pageSize;
    }

  return entries;
}

void
MemoryManager::init(PID *base, const KernelArguments &args)
{
  if (initialized || !extraRegions.empty())
    kernelPanic("MemoryManager::init called twice");

  auto it = args.begin();
  if (it == args.end() || it->name != TagXArg)
    kernelPanic("MemoryManager::init: first boot argument tag is not XArg");

  if (it->size < XArgWords)
    kernelPanic("MemoryManager::init: XArg tag is too short");

  if (it->data[1] != BootArgumentsVersion)
    kernelPanic("MemoryManager::init: unsupported boot argument version ",
                it->data[1]);

  ramStart = it->data[2];
  ramSize = it->data[3];
  ramName = it->data[4];

  if ((ramStart & (pageSize - 1)) || (ramSize & (pageSize - 1)))
    kernelPanic("MemoryManager::init: RAM at ", std::hex, std::showbase,
                ramStart, " size ", ramSize, " is not page-aligned");

  bool seenExtraRegions = false;
  for (++it; it != args.end(); ++it)
    {
      if (it->name != TagMREx)
        continue;

      if (seenExtraRegions)
        kernelPanic("MemoryManager::init: MREx tag appears twice");
      seenExtraRegions = true;

      if (it->size % MemoryRangeExtraWords)
        kernelPanic("MemoryManager::init: MREx payload of ", it->size,
                    " words is not a whole number of records");

      for (size_t i = 0; i < it->size; i += MemoryRangeExtraWords)
        {
          MemoryRangeExtra region{ it->data[i], it->data[i + 1],
                                   it->data[i + 2], it->data[i + 3] };
          if ((region.start & (pageSize - 1)) || (region.size & (pageSize - 1)))
            kernelPanic("MemoryManager::init: extra region at ", std::hex,
                        std::showbase, region.start, " is not page-aligned");
          extraRegions.push_back(region);
        }
    }

  nOwners = ramPages();
  for (const auto &region : extraRegions)
    nOwners += region.size / pageSize;

  owners = base;
  std::fill_n(owners, nOwners, 0);
  lastRamPage = 0;
  initialized = true;

  if (LogBootProgress)
    std::cerr << "BOOT: RAM @ " << std::hex << std::showbase << ramStart
              << " size " << ramSize << " bytes, " << std::dec
              << extraRegions.size() << " extra regions, "
              << nOwners << " pages tracked." << std::endl;
}

Error
MemoryManager::ownerSlot(uint32_t addr, size_t &index) const
{
  if (addr & (pageSize - 1))
    return Error::BadAlignment;

  if (isMainMemory(addr))
    {
      index = (addr - ramStart) / pageSize;
      return Error::Ok;
    }

  /* Extra regions follow RAM in the table, in declaration order */
  size_t offset = ramPages();
  for (const auto &region : extraRegions)
    {
      if (addr >= region.start &&
          uint64_t(addr) < uint64_t(region.start) + region.size)
        {
          index = offset + (addr - region.start) / pageSize;
          return Error::Ok;
        }
      offset += region.size / pageSize;
    }

  return Error::BadAddress;
}

Error
MemoryManager::claimReleaseMove(uint32_t addr, PID pid, ClaimAction action,
                                PID from)
{
  size_t index = 0;
  Error error = ownerSlot(addr, index);
  if (error != Error::Ok)
    return error;

  PID &owner = owners[index];
  switch (action)
    {
      case ClaimAction::Claim:
        if (owner != 0 && owner != pid)
          return Error::MemoryInUse;
        owner = pid;
        break;

      case ClaimAction::Release:
        if (owner != 0 && owner != pid)
          return Error::MemoryInUse;
        owner = 0;
        break;

      case ClaimAction::Move:
        if (owner != from && owner != pid)
          return Error::MemoryInUse;
        owner = pid;
        break;
    }

  return Error::Ok;
}

Error
MemoryManager::claimPage(uint32_t addr, PID pid)
{
  return claimReleaseMove(addr, pid, ClaimAction::Claim, 0);
}

Error
MemoryManager::releasePage(uint32_t addr, PID pid)
{
  return claimReleaseMove(addr, pid, ClaimAction::Release, 0);
}

Error
MemoryManager::movePage(uint32_t addr, PID pid, PID from)
{
  return claimReleaseMove(addr, pid, ClaimAction::Move, from);
}

Error
MemoryManager::pageOwner(uint32_t addr, PID &owner) const
{
  size_t index = 0;
  Error error = ownerSlot(addr, index);
  if (error != Error::Ok)
    return error;

  owner = owners[index];
  return Error::Ok;
}

bool
MemoryManager::isMainMemory(uint32_t addr) const
{
  return addr >= ramStart && uint64_t(addr) < uint64_t(ramStart) + ramSize;
}

Error
MemoryManager::allocPage(PID pid, uint32_t &phys)
{
  const size_t end = ramPages();
  const size_t start = std::min(lastRamPage, end);

  /* Search from the cursor to the end, then wrap around */
  for (size_t pass = 0; pass < 2; ++pass)
    {
      const size_t from = pass == 0 ? start : 0;
      const size_t to = pass == 0 ? end : start;

      for (size_t index = from; index < to; ++index)
        {
          if (owners[index] != 0)
            continue;

          owners[index] = pid;
          lastRamPage = index + 1;
          phys = ramStart + index * pageSize;

          if (LogPageTableUpdates)
            std::cerr << "MM: PID " << int(pid) << " allocated page "
                      << std::hex << std::showbase << phys << std::dec
                      << std::endl;
          return Error::Ok;
        }
    }

  return Error::OutOfMemory;
}

Error
MemoryManager::mapRange(uint32_t phys, uint32_t virt, uint32_t size,
                        MemoryFlags flags, MemoryRange &range)
{
  if (phys == 0 || virt == 0 || size == 0)
    return Error::BadAddress;

  if ((phys & (pageSize - 1)) || (virt & (pageSize - 1))
      || (size & (pageSize - 1)))
    return Error::BadAlignment;

  if (uint64_t(phys) + size > (1ULL << 32) || uint64_t(virt) + size > (1ULL << 32))
    return Error::BadAddress;

  const PID pid = MemoryMapping::current(mmu).getPid();
  const uint32_t nPages = size / pageSize;

  /* Refuse to replace an existing mapping of a different page */
  for (uint32_t i = 0; i < nPages; ++i)
    {
      uint32_t existing = 0;
      if (virtToPhys(mmu, virt + i * pageSize, existing) == Error::Ok
          && existing != phys + i * pageSize)
        return Error::MemoryInUse;
    }

  /* Claim every page first, remembering which ones were free before */
  std::vector<uint32_t> claimed;
  for (uint32_t i = 0; i < nPages; ++i)
    {
      const uint32_t page = phys + i * pageSize;
      PID owner = 0;
      Error error = pageOwner(page, owner);
      if (error == Error::Ok)
        error = claimPage(page, pid);

      if (error != Error::Ok)
        {
          for (uint32_t addr : claimed)
            if (releasePage(addr, pid) != Error::Ok)
              kernelPanic("map_range: unable to release ", std::hex,
                          std::showbase, addr, " during rollback");
          return error;
        }

      if (owner == 0)
        claimed.push_back(page);
    }

  /* Entries as they were before, and superpages that had no leaf table */
  std::vector<uint32_t> previous(nPages, 0);
  std::vector<uint32_t> newLeaves;
  for (uint32_t i = 0; i < nPages; ++i)
    {
      PageTableEntry entry;
      if (pagetableEntryValue(mmu, virt + i * pageSize, entry) == Error::Ok)
        previous[i] = entry.raw();
      else if (std::find(newLeaves.begin(), newLeaves.end(),
                         SV32_VPN1(virt + i * pageSize)) == newLeaves.end())
        newLeaves.push_back(SV32_VPN1(virt + i * pageSize));
    }

  for (uint32_t i = 0; i < nPages; ++i)
    {
      Error error = mapPageInner(*this, pid, phys + i * pageSize,
                                 virt + i * pageSize, flags);
      if (error != Error::Ok)
        {
          for (uint32_t j = 0; j < i; ++j)
            if (setPagetableEntry(mmu, virt + j * pageSize, previous[j]) != Error::Ok)
              kernelPanic("map_range: unable to restore ", std::hex,
                          std::showbase, virt + j * pageSize,
                          " during rollback");
          for (uint32_t vpn1 : newLeaves)
            {
              Error released = releaseLeafTable(*this, pid, vpn1);
              if (released != Error::Ok && released != Error::BadAddress)
                kernelPanic("map_range: unable to release leaf table ", vpn1,
                            " during rollback: ", released);
            }
          for (uint32_t addr : claimed)
            if (releasePage(addr, pid) != Error::Ok)
              kernelPanic("map_range: unable to release ", std::hex,
                          std::showbase, addr, " during rollback");
          return error;
        }
    }

  range = MemoryRange(virt, size);
  return Error::Ok;
}

Error
MemoryManager::reserveRange(uint32_t virt, uint32_t size, MemoryFlags flags)
{
  if ((virt & (pageSize - 1)) || (size & (pageSize - 1)))
    return Error::BadAlignment;

  if (virt == 0 || size == 0 || uint64_t(virt) + size > (1ULL << 32))
    return Error::BadAddress;

  MemoryMapping mapping = MemoryMapping::current(mmu);

  /* Pages that were empty before this call, undone on failure */
  std::vector<uint32_t> reserved;
  for (uint32_t offset = 0; offset < size; offset += pageSize)
    {
      const uint32_t page = virt + offset;
      PageTableEntry before;
      const bool wasEmpty = pagetableEntryValue(mmu, page, before) != Error::Ok
          || before.raw() == 0;

      Error error = mapping.reserveAddress(*this, page, flags);
      if (error != Error::Ok)
        {
          for (uint32_t addr : reserved)
            {
              uint32_t unmapped = 0;
              if (unmapPageInner(mmu, addr, unmapped) != Error::Ok)
                kernelPanic("reserve_range: unable to undo reservation of ",
                            std::hex, std::showbase, addr);
            }
          return error;
        }

      if (wasEmpty)
        reserved.push_back(page);
    }

  return Error::Ok;
}

Error
MemoryManager::unmapPage(uint32_t virt)
{
  if (virt & (pageSize - 1))
    return Error::BadAlignment;

  const PID pid = MemoryMapping::current(mmu).getPid();

  uint32_t phys = 0;
  Error error = virtToPhys(mmu, virt, phys);
  if (error == Error::Ok)
    {
      error = releasePage(phys, pid);
      if (error != Error::Ok)
        return error;
    }
  else if (error != Error::MemoryInUse)
    {
      /* Neither mapped nor reserved */
      return error;
    }

  uint32_t unmapped = 0;
  return unmapPageInner(mmu, virt, unmapped);
}

Error
MemoryManager::ensurePageExists(uint32_t addr)
{
  uint32_t phys = 0;
  return ensurePageExistsInner(*this, addr, phys);
}

Error
MemoryManager::updateMemoryFlags(const MemoryRange &range, MemoryFlags flags)
{
  if ((range.addr & (pageSize - 1)) || (range.size & (pageSize - 1)))
    return Error::BadAlignment;

  /* Permissions may only be taken away, and only from mapped pages */
  for (uint32_t offset = 0; offset < range.size; offset += pageSize)
    {
      MemoryFlags existing = 0;
      if (pageFlags(mmu, range.addr + offset, existing) != Error::Ok)
        return Error::MemoryInUse;
      if (~existing & flags)
        return Error::MemoryInUse;
    }

  for (uint32_t offset = 0; offset < range.size; offset += pageSize)
    {
      Error error = updatePageFlags(mmu, range.addr + offset, flags);
      if (error != Error::Ok)
        return error;
    }

  return Error::Ok;
}

Error
MemoryManager::mapZeroedPage(AddressSpaceLayout &layout, PID pid, bool isUser,
                             uint32_t &virt)
{
  uint32_t phys = 0;
  Error error = allocPage(pid, phys);
  if (error != Error::Ok)
    return error;

  uint32_t addr = 0;
  error = findVirtualAddress(layout, 0, pageSize, MemoryType::Default, addr);
  if (error == Error::Ok)
    error = mapPageInner(*this, pid, phys, addr, MemoryFlagR | MemoryFlagW);

  if (error != Error::Ok)
    {
      if (releasePage(phys, pid) != Error::Ok)
        kernelPanic("map_zeroed_page: unable to release ", std::hex,
                    std::showbase, phys);
      return error;
    }

  for (uint32_t offset = 0; offset < pageSize; offset += sizeof(uint32_t))
    mmu.store(addr + offset, 0);

  if (isUser && handPageToUser(mmu, addr) != Error::Ok)
    kernelPanic("map_zeroed_page: page at ", std::hex, std::showbase, addr,
                " vanished");

  virt = addr;
  return Error::Ok;
}

Error
MemoryManager::findVirtualAddress(AddressSpaceLayout &layout, uint32_t virt,
                                  uint32_t size, MemoryType kind,
                                  uint32_t &result)
{
  /* A caller-supplied address is used as is */
  if (virt != 0)
    {
      result = virt;
      return Error::Ok;
    }

  if (size == 0 || (size & (pageSize - 1)))
    return Error::BadAlignment;

  uint32_t start, end, *last;
  switch (kind)
    {
      case MemoryType::Heap:
        if (uint64_t(layout.heapSize) + size > layout.heapMax)
          return Error::OutOfMemory;
        result = layout.heapBase + layout.heapSize;
        return Error::Ok;

      case MemoryType::Messages:
        start = layout.messageBase;
        end = layout.messageBase + MessageAreaSize;
        last = &layout.messageLast;
        break;

      case MemoryType::Default:
      default:
        start = layout.defaultBase;
        end = layout.defaultBase + DefaultAreaSize;
        last = &layout.defaultLast;
        break;
    }

  if (size > end - start)
    return Error::BadAddress;

  auto rangeFree = [this, size](uint32_t candidate)
    {
      for (uint32_t offset = 0; offset < size; offset += pageSize)
        if (!addressAvailable(mmu, candidate + offset))
          return false;
      return true;
    };

  /* Search from the last hit to the end, then from the start */
  const uint32_t initial = std::max(start, std::min(*last, end - size));
  for (uint32_t candidate = initial; candidate <= end - size; candidate += pageSize)
    if (rangeFree(candidate))
      {
        *last = candidate;
        result = candidate;
        return Error::Ok;
      }

  for (uint32_t candidate = start; candidate < initial; candidate += pageSize)
    if (rangeFree(candidate))
      {
        *last = candidate;
        result = candidate;
        return Error::Ok;
      }

  return Error::BadAddress;
}

void
MemoryManager::claimMappingPages(PID pid)
{
  walkMapping(mmu, pid == KernelPID, [this, pid](uint32_t virt, PageTableEntry entry)
    {
      Error error = claimPage(entry.physAddr(), pid);
      if (error != Error::Ok)
        {
          PID owner = 0;
          if (pageOwner(entry.physAddr(), owner) != Error::Ok)
            owner = 0;
          kernelPanic("boot mapping of PID ", int(pid), " at ", std::hex,
                      std::showbase, virt, " references ", entry.physAddr(),
                      std::dec, " (", error, ", owner ", int(owner), ")");
        }
    });
}

void
MemoryManager::releaseAllMemoryForProcess(PID pid)
{
  if (pid == 0)
    kernelPanic("release_all_memory_for_process: PID 0 owns nothing");

  size_t released = 0;
  for (size_t i = 0; i < nOwners; ++i)
    if (owners[i] == pid)
      {
        owners[i] = 0;
        released++;
      }

  if (LogPageTableUpdates)
    std::cerr << "MM: released " << released << " pages of PID "
              << int(pid) << std::endl;
}

size_t
MemoryManager::ramUsedBy(PID pid) const
{
  return std::count(owners, owners + ramPages(), pid);
}

size_t
MemoryManager::getFreePages(void) const
{
  return std::count(owners, owners + ramPages(), PID(0));
}

void
MemoryManager::printOwnership(std::ostream &os) const
{
  std::map<PID, size_t> pages;
  for (size_t i = 0; i < nOwners; ++i)
    if (owners[i] != 0)
      pages[owners[i]]++;

  os << "Ownership of " << nOwners << " tracked pages:" << std::endl;
  for (const auto &[pid, count] : pages)
    os << "    PID " << std::dec << int(pid) << ": " << count << " pages ("
       << (count * pageSize / 1024) << " KiB)" << std::endl;
  os << "    free RAM: " << getFreePages() << " pages" << std::endl;
}

/*
 * MemoryManagerHandle
 */

MemoryManagerHandle::MemoryManagerHandle(MemoryManager &manager)
  : manager(manager)
{
  if (manager.handles != 0)
    kernelPanic("Multiple users of MemoryManagerHandle!");
  manager.handles++;
}

MemoryManagerHandle::~MemoryManagerHandle()
{
  manager.handles--;
}
