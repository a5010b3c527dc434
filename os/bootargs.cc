/* kmem -- A microkernel memory manager and process table simulator
 *
 *    bootargs.cc - Boot argument stream handed over by the loader
 *
 * Copyright (C) 2024  Leiden University, The Netherlands.
 */

#include "bootargs.h"
#include "panic.h"

uint32_t
checksumWords(const uint32_t *data, size_t words)
{
  BootArgumentCRC crc;
  for (size_t i = 0; i < words; ++i)
    {
      const uint8_t bytes[4] = {
        uint8_t(data[i]), uint8_t(data[i] >> 8),
        uint8_t(data[i] >> 16), uint8_t(data[i] >> 24)
      };
      crc.process_bytes(bytes, sizeof(bytes));
    }
  return crc.checksum();
}

KernelArguments::KernelArguments(const uint32_t *base)
  : base(base), words(0)
{
  if (base == nullptr)
    kernelPanic("boot arguments: no argument stream");

  if (base[0] != TagXArg)
    kernelPanic("boot arguments: stream does not start with XArg");

  if ((base[1] >> 16) < 1)
    kernelPanic("boot arguments: XArg tag carries no length");

  words = base[2];
  if (words < 2 + XArgWords)
    kernelPanic("boot arguments: stream length of ", words, " words is too short");
}

KernelArguments::Iterator
KernelArguments::begin(void) const
{
  return Iterator(base, words, 0);
}

KernelArguments::Iterator
KernelArguments::end(void) const
{
  return Iterator(base, words, words);
}

size_t
KernelArguments::countInitialProcesses(void) const
{
  size_t count = 1;
  for (const auto &tag : *this)
    if (tag.name == TagIniE || tag.name == TagIniF)
      count++;

  return count;
}

KernelArguments::Iterator::Iterator(const uint32_t *base, size_t words,
                                    size_t offset)
  : base(base), words(words), offset(offset), current{ 0, nullptr, 0 }
{
  decode();
}

void
KernelArguments::Iterator::decode(void)
{
  if (offset >= words)
    {
      offset = words;
      current = { 0, nullptr, 0 };
      return;
    }

  if (offset + 2 > words)
    kernelPanic("boot arguments: truncated tag header at word ", offset);

  const uint32_t name = base[offset];
  const uint32_t header = base[offset + 1];
  const size_t size = header >> 16;

  if (offset + 2 + size > words)
    kernelPanic("boot arguments: tag at word ", offset, " runs past the end");

  const uint32_t *data = base + offset + 2;
  if (checksumWords(data, size) != (header & 0xffff))
    kernelPanic("boot arguments: checksum mismatch in tag at word ", offset);

  current = { name, data, size };
}

KernelArguments::Iterator &
KernelArguments::Iterator::operator++()
{
  offset += 2 + current.size;
  decode();
  return *this;
}
