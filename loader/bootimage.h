/* kmem -- A microkernel memory manager and process table simulator
 *
 *    bootimage.h - Builds the address spaces and boot arguments the
 *                  kernel starts from
 *
 * Copyright (C) 2024  Leiden University, The Netherlands.
 */

#ifndef __KMEM_BOOTIMAGE_H__
#define __KMEM_BOOTIMAGE_H__

#include "physmem.h"
#include "mmu.h"
#include "os/bootargs.h"

#include <vector>

const static uint32_t RamTag = makeTag("sram");

/* Where the loader places the kernel image by default */
const static uint32_t KernelEntrypoint = 0xffd00000;
const static uint32_t KernelStackTop = 0xfff00000;

struct ProcessImage
{
  uint32_t entrypoint;
  uint32_t stack;
  /* Pages of code mapped from the entry point onwards */
  uint32_t codePages;
};

class BootImage
{
  protected:
    PhysicalMemory &memory;

    uint32_t ramStart;
    uint32_t ramSize;
    uint32_t ramName;
    std::vector<MemoryRangeExtra> extraRegions;

    /* The first image is the kernel */
    std::vector<ProcessImage> images;

    /* Pages are handed out downwards from the top of RAM */
    uint32_t nextFree;
    uint32_t kernelLeaf;

    std::vector<uint32_t> arguments;
    std::vector<InitialProcess> initialProcesses;
    bool built;

    uint32_t allocPage(void);
    void     writeEntry(uint32_t table, uint32_t index, uint32_t entry);
    uint32_t readEntry(uint32_t table, uint32_t index) const;
    uint32_t leafFor(uint32_t root, uint32_t window, uint32_t vpn1);
    void     mapPage(uint32_t root, uint32_t window, uint32_t virt,
                     uint32_t phys, uint32_t flags);

    InitialProcess buildProcess(uint32_t pid, const ProcessImage &image);
    void     appendTag(uint32_t name, const std::vector<uint32_t> &payload);

  public:
    BootImage(PhysicalMemory &memory, uint32_t ramStart, uint32_t ramSize,
              uint32_t ramName = RamTag);

    void addExtraRegion(uint32_t start, uint32_t size, uint32_t tag);

    /* The first call describes the kernel, later calls user processes. */
    void addProcess(uint32_t entrypoint, uint32_t stack, uint32_t codePages);

    void build(void);

    const uint32_t *getArguments(void) const;
    const InitialProcess *getInitialProcesses(void) const;

    size_t getProcessCount(void) const
    {
      return images.size();
    }

    /* Pages of RAM the loader used for page tables and images. */
    uint32_t getLoaderPages(void) const;

    /* Switch the MMU to the kernel address space the loader built. */
    void activateKernel(MMU &mmu) const;
};

#endif /* __KMEM_BOOTIMAGE_H__ */
