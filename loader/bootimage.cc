/* kmem -- A microkernel memory manager and process table simulator
 *
 *    bootimage.cc - Builds the address spaces and boot arguments the
 *                   kernel starts from
 *
 * Copyright (C) 2024  Leiden University, The Netherlands.
 */

#include "bootimage.h"
#include "sv32.h"
#include "settings.h"
using namespace Sv32;

#include <iostream>
#include <sstream>
#include <stdexcept>

static const uint32_t tableFlags = FLG_VALID | FLG_R | FLG_W | FLG_D | FLG_A;

BootImage::BootImage(PhysicalMemory &memory, uint32_t ramStart,
                     uint32_t ramSize, uint32_t ramName)
  : memory(memory), ramStart(ramStart), ramSize(ramSize), ramName(ramName),
    extraRegions(), images(), nextFree(0), kernelLeaf(0), arguments(),
    initialProcesses(), built(false)
{
  if ((ramStart & (pageSize - 1)) || (ramSize & (pageSize - 1)) || ramSize == 0)
    throw std::runtime_error("loader: RAM must be a non-empty page-aligned range");
}

void
BootImage::addExtraRegion(uint32_t start, uint32_t size, uint32_t tag)
{
  if (built)
    throw std::runtime_error("loader: image already built");

  extraRegions.push_back(MemoryRangeExtra{ start, size, tag, 0 });
}

void
BootImage::addProcess(uint32_t entrypoint, uint32_t stack, uint32_t codePages)
{
  if (built)
    throw std::runtime_error("loader: image already built");

  if (images.size() >= MaxProcessCount)
    throw std::runtime_error("loader: too many processes");

  const uint64_t codeEnd = uint64_t(entrypoint & ~(pageSize - 1))
      + uint64_t(codePages) * pageSize;
  if (entrypoint == 0 || stack == 0)
    throw std::runtime_error("loader: process needs an entry point and a stack");

  /* User images must stay clear of the kernel-reserved top of memory */
  if (!images.empty() && (codeEnd > UserAreaEnd || stack > UserAreaEnd))
    throw std::runtime_error("loader: user image reaches into the kernel area");

  images.push_back(ProcessImage{ entrypoint, stack, codePages });
}

uint32_t
BootImage::allocPage(void)
{
  if (nextFree - ramStart < pageSize)
    throw std::runtime_error("loader: out of RAM while building boot image");

  nextFree -= pageSize;
  memory.zero(nextFree, pageSize);
  return nextFree;
}

void
BootImage::writeEntry(uint32_t table, uint32_t index, uint32_t entry)
{
  memory.write32(table + index * sizeof(uint32_t), entry);
}

uint32_t
BootImage::readEntry(uint32_t table, uint32_t index) const
{
  return memory.read32(table + index * sizeof(uint32_t));
}

uint32_t
BootImage::leafFor(uint32_t root, uint32_t window, uint32_t vpn1)
{
  const PageTableEntry entry(readEntry(root, vpn1));
  if (entry.valid())
    return entry.physAddr();

  const uint32_t leaf = allocPage();
  writeEntry(root, vpn1, SV32_MAKE_ENTRY(leaf, FLG_VALID));
  writeEntry(window, vpn1, SV32_MAKE_ENTRY(leaf, tableFlags));
  return leaf;
}

void
BootImage::mapPage(uint32_t root, uint32_t window, uint32_t virt,
                   uint32_t phys, uint32_t flags)
{
  const uint32_t leaf = leafFor(root, window, SV32_VPN1(virt));
  if (PageTableEntry(readEntry(leaf, SV32_VPN0(virt))).valid())
    {
      std::ostringstream message;
      message << "loader: " << std::hex << std::showbase << virt
              << " is mapped twice";
      throw std::runtime_error(message.str());
    }

  writeEntry(leaf, SV32_VPN0(virt), SV32_MAKE_ENTRY(phys, flags));
}

InitialProcess
BootImage::buildProcess(uint32_t pid, const ProcessImage &image)
{
  const uint32_t root = allocPage();
  const uint32_t window = allocPage();
  const uint32_t processLeaf = allocPage();
  const uint32_t context = allocPage();

  /* Page table window and per-process pages */
  writeEntry(root, WindowVpn1, SV32_MAKE_ENTRY(window, FLG_VALID));
  writeEntry(root, ProcessVpn1, SV32_MAKE_ENTRY(processLeaf, FLG_VALID));
  writeEntry(window, WindowVpn1, SV32_MAKE_ENTRY(window, tableFlags));
  writeEntry(window, ProcessVpn1, SV32_MAKE_ENTRY(processLeaf, tableFlags));
  writeEntry(processLeaf, SV32_VPN0(PageTableRootOffset),
             SV32_MAKE_ENTRY(root, tableFlags));
  writeEntry(processLeaf, SV32_VPN0(ThreadContextArea),
             SV32_MAKE_ENTRY(context, tableFlags));

  /* The kernel leaf table is shared by every address space, but only
   * the kernel can reach it through its window.
   */
  if (pid == KernelPID)
    {
      kernelLeaf = allocPage();
      writeEntry(window, KernelVpn1, SV32_MAKE_ENTRY(kernelLeaf, tableFlags));

      const uint32_t exceptionStack = allocPage();
      writeEntry(kernelLeaf, SV32_VPN0(ExceptionStackTop - pageSize),
                 SV32_MAKE_ENTRY(exceptionStack, tableFlags | FLG_GLOBAL));
    }
  writeEntry(root, KernelVpn1, SV32_MAKE_ENTRY(kernelLeaf, FLG_VALID));

  const uint32_t codeBase = image.entrypoint & ~(pageSize - 1);
  for (uint32_t i = 0; i < image.codePages; ++i)
    {
      const uint32_t virt = codeBase + i * pageSize;
      uint32_t flags = FLG_VALID | FLG_R | FLG_X | FLG_A | FLG_D;
      if (pid != KernelPID)
        flags |= FLG_U;
      if (SV32_VPN1(virt) == KernelVpn1)
        flags |= FLG_GLOBAL;

      mapPage(root, window, virt, allocPage(), flags);
    }

  const MemoryMapping mapping = MemoryMapping::make(pid, root);
  if (LogBootProgress)
    std::cerr << "BOOT: loader built PID " << pid << " " << mapping
              << std::endl;

  return InitialProcess{ mapping.raw(), image.entrypoint, image.stack };
}

void
BootImage::appendTag(uint32_t name, const std::vector<uint32_t> &payload)
{
  arguments.push_back(name);
  arguments.push_back(checksumWords(payload.data(), payload.size())
                      | (uint32_t(payload.size()) << 16));
  arguments.insert(arguments.end(), payload.begin(), payload.end());
}

void
BootImage::build(void)
{
  if (built)
    throw std::runtime_error("loader: image already built");
  if (images.empty())
    throw std::runtime_error("loader: no kernel image");

  memory.addRegion(ramStart, ramSize, ramName);
  for (const auto &region : extraRegions)
    memory.addRegion(region.start, region.size, region.tag);

  nextFree = ramStart + ramSize;
  for (size_t i = 0; i < images.size(); ++i)
    initialProcesses.push_back(buildProcess(i + 1, images[i]));

  /* The total length is only known once every tag is in place */
  appendTag(TagXArg, { 0, BootArgumentsVersion, ramStart, ramSize, ramName });

  if (!extraRegions.empty())
    {
      std::vector<uint32_t> payload;
      for (const auto &region : extraRegions)
        payload.insert(payload.end(), { region.start, region.size,
                                        region.tag, region.padding });
      appendTag(TagMREx, payload);
    }

  for (size_t i = 1; i < images.size(); ++i)
    appendTag(TagIniE, { images[i].entrypoint, images[i].stack,
                         images[i].codePages });

  arguments[2] = uint32_t(arguments.size());
  arguments[1] = checksumWords(&arguments[2], XArgWords)
      | (uint32_t(XArgWords) << 16);

  built = true;
}

const uint32_t *
BootImage::getArguments(void) const
{
  if (!built)
    throw std::runtime_error("loader: image not built");
  return arguments.data();
}

const InitialProcess *
BootImage::getInitialProcesses(void) const
{
  if (!built)
    throw std::runtime_error("loader: image not built");
  return initialProcesses.data();
}

uint32_t
BootImage::getLoaderPages(void) const
{
  if (!built)
    return 0;
  return (ramStart + ramSize - nextFree) / pageSize;
}

void
BootImage::activateKernel(MMU &mmu) const
{
  if (!built)
    throw std::runtime_error("loader: image not built");
  MemoryMapping(initialProcesses[0].satp).activate(mmu);
}
