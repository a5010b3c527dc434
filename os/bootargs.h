/* kmem -- A microkernel memory manager and process table simulator
 *
 *    bootargs.h - Boot argument stream handed over by the loader
 *
 * Copyright (C) 2024  Leiden University, The Netherlands.
 */

#ifndef __KMEM_BOOTARGS_H__
#define __KMEM_BOOTARGS_H__

#include <cstdint>
#include <cstddef>
#include <iterator>

#include <boost/crc.hpp>

/* CRC16/X-25 protects the payload of each tag */
using BootArgumentCRC = boost::crc_optimal<16, 0x1021, 0xFFFF, 0xFFFF, true, true>;

/* Tag names are four ASCII characters stored little-endian */
constexpr uint32_t
makeTag(const char name[5])
{
  return uint32_t(uint8_t(name[0])) | (uint32_t(uint8_t(name[1])) << 8)
      | (uint32_t(uint8_t(name[2])) << 16) | (uint32_t(uint8_t(name[3])) << 24);
}

const static uint32_t TagXArg = makeTag("XArg");
const static uint32_t TagMREx = makeTag("MREx");
const static uint32_t TagIniE = makeTag("IniE");
const static uint32_t TagIniF = makeTag("IniF");

const static uint32_t BootArgumentsVersion = 1;

/* Payload of XArg, in words */
const static size_t XArgWords = 5;

/* One record of the MREx payload */
struct MemoryRangeExtra
{
  uint32_t start;
  uint32_t size;
  uint32_t tag;
  uint32_t padding;
};

const static size_t MemoryRangeExtraWords = sizeof(MemoryRangeExtra) / sizeof(uint32_t);

/* Initial state of a process placed in memory by the loader */
struct InitialProcess
{
  uint32_t satp;
  uint32_t entrypoint;
  uint32_t sp;
};

struct KernelArgument
{
  uint32_t name;
  const uint32_t *data;
  size_t size; /* in words */
};

uint32_t checksumWords(const uint32_t *data, size_t words);

class KernelArguments
{
  protected:
    const uint32_t *base;
    size_t words;

  public:
    /* The stream length is read from the XArg tag that starts it. */
    explicit KernelArguments(const uint32_t *base);

    class Iterator
    {
      protected:
        const uint32_t *base;
        size_t words;
        size_t offset;
        KernelArgument current;

        void decode(void);

      public:
        using iterator_category = std::input_iterator_tag;
        using value_type = KernelArgument;
        using difference_type = std::ptrdiff_t;
        using pointer = const KernelArgument *;
        using reference = const KernelArgument &;

        Iterator(const uint32_t *base, size_t words, size_t offset);

        reference operator*() const { return current; }
        pointer operator->() const { return &current; }
        Iterator &operator++();

        bool operator==(const Iterator &other) const
        {
          return base == other.base && offset == other.offset;
        }

        bool operator!=(const Iterator &other) const
        {
          return !(*this == other);
        }
    };

    Iterator begin(void) const;
    Iterator end(void) const;

    size_t getWords(void) const
    {
      return words;
    }

    /* Number of process images described, the kernel included. */
    size_t countInitialProcesses(void) const;
};

#endif /* __KMEM_BOOTARGS_H__ */
