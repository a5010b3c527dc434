/* kmem -- A microkernel memory manager and process table simulator
 *
 *    tests/test_bootargs.cc - unit tests for the boot argument stream
 *
 * Copyright (C) 2024  Leiden University, The Netherlands.
 */

#define BOOST_TEST_MODULE BootArguments
#include <boost/test/unit_test.hpp>

#include "os/bootargs.h"
#include "panic.h"

#include <vector>

/* Builds an argument stream tag by tag */
struct StreamBuilder
{
  std::vector<uint32_t> words;

  void append(uint32_t name, const std::vector<uint32_t> &payload)
  {
    words.push_back(name);
    words.push_back(checksumWords(payload.data(), payload.size())
                    | (uint32_t(payload.size()) << 16));
    words.insert(words.end(), payload.begin(), payload.end());
  }

  /* Patch the stream length into XArg once all tags are present */
  const uint32_t *finish(void)
  {
    words[2] = uint32_t(words.size());
    words[1] = checksumWords(&words[2], XArgWords) | (uint32_t(XArgWords) << 16);
    return words.data();
  }
};

BOOST_AUTO_TEST_SUITE(bootargs_test)

/* Test the checksum against known CRC-16/X-25 values */
BOOST_AUTO_TEST_CASE( checksum_known_values )
{
  BOOST_CHECK_EQUAL( checksumWords(nullptr, 0), 0u );

  /* "12345678" as two little-endian words */
  const uint32_t ascii[2] = { 0x34333231, 0x38373635 };
  BOOST_CHECK_EQUAL( checksumWords(ascii, 2), 0x086au );

  const uint32_t counting[2] = { 1, 2 };
  BOOST_CHECK_EQUAL( checksumWords(counting, 2), 0x3bbau );
}

BOOST_AUTO_TEST_CASE( tag_names )
{
  BOOST_CHECK_EQUAL( TagXArg, 0x67724158u );
  BOOST_CHECK_EQUAL( makeTag("sram"), 0x6d617273u );
}

/* Test iterating over a well-formed stream */
BOOST_AUTO_TEST_CASE( iterate_tags )
{
  StreamBuilder builder;
  builder.append(TagXArg, { 0, BootArgumentsVersion, 0x40000000, 0x1000000,
                            makeTag("sram") });
  builder.append(TagMREx, { 0xe0000000, 0x10000, makeTag("mmio"), 0 });
  builder.append(TagIniE, { 0x10000000, 0x20010000, 2 });
  builder.append(TagIniF, { 0x10000000 });

  KernelArguments args(builder.finish());
  BOOST_CHECK_EQUAL( args.getWords(), builder.words.size() );

  std::vector<uint32_t> names;
  for (const auto &tag : args)
    names.push_back(tag.name);

  const std::vector<uint32_t> expected = { TagXArg, TagMREx, TagIniE, TagIniF };
  BOOST_CHECK_EQUAL_COLLECTIONS( names.begin(), names.end(),
                                 expected.begin(), expected.end() );

  auto it = args.begin();
  BOOST_CHECK_EQUAL( it->size, XArgWords );
  BOOST_CHECK_EQUAL( it->data[2], 0x40000000u );
  ++it;
  BOOST_CHECK_EQUAL( it->size, MemoryRangeExtraWords );
  BOOST_CHECK_EQUAL( it->data[2], makeTag("mmio") );
}

/* Test the kernel is counted along with every IniE and IniF image */
BOOST_AUTO_TEST_CASE( count_initial_processes )
{
  StreamBuilder builder;
  builder.append(TagXArg, { 0, BootArgumentsVersion, 0x40000000, 0x1000000,
                            makeTag("sram") });
  BOOST_CHECK_EQUAL( KernelArguments(builder.finish()).countInitialProcesses(), 1u );

  builder.append(TagIniE, { 1 });
  builder.append(TagIniE, { 2 });
  builder.append(TagIniF, { 3 });
  builder.append(TagMREx, { 0xe0000000, 0x10000, makeTag("mmio"), 0 });
  BOOST_CHECK_EQUAL( KernelArguments(builder.finish()).countInitialProcesses(), 4u );
}

BOOST_AUTO_TEST_CASE( missing_stream_panics )
{
  BOOST_CHECK_THROW( KernelArguments(nullptr), KernelPanic );
}

/* Test a stream must start with XArg */
BOOST_AUTO_TEST_CASE( wrong_first_tag_panics )
{
  StreamBuilder builder;
  builder.append(TagXArg, { 0, BootArgumentsVersion, 0x40000000, 0x1000000,
                            makeTag("sram") });
  builder.finish();
  builder.words[0] = TagMREx;

  BOOST_CHECK_THROW( KernelArguments args(builder.words.data()), KernelPanic );
}

/* Test a corrupted payload is detected while iterating */
BOOST_AUTO_TEST_CASE( checksum_mismatch_panics )
{
  StreamBuilder builder;
  builder.append(TagXArg, { 0, BootArgumentsVersion, 0x40000000, 0x1000000,
                            makeTag("sram") });
  builder.append(TagIniE, { 0x10000000, 0x20010000, 2 });
  builder.finish();
  builder.words[builder.words.size() - 1] ^= 1;

  KernelArguments args(builder.words.data());
  BOOST_CHECK_THROW( args.countInitialProcesses(), KernelPanic );
}

/* Test a tag claiming more words than the stream holds */
BOOST_AUTO_TEST_CASE( overrunning_tag_panics )
{
  StreamBuilder builder;
  builder.append(TagXArg, { 0, BootArgumentsVersion, 0x40000000, 0x1000000,
                            makeTag("sram") });
  builder.append(TagIniE, { 0x10000000, 0x20010000, 2 });
  builder.finish();

  const size_t header = builder.words.size() - 4;
  builder.words[header] = (builder.words[header] & 0xffff) | (40 << 16);

  KernelArguments args(builder.words.data());
  BOOST_CHECK_THROW( args.countInitialProcesses(), KernelPanic );
}

BOOST_AUTO_TEST_CASE( short_stream_panics )
{
  StreamBuilder builder;
  builder.append(TagXArg, { 0, BootArgumentsVersion, 0x40000000, 0x1000000,
                            makeTag("sram") });
  builder.finish();
  builder.words[2] = 3;

  BOOST_CHECK_THROW( KernelArguments args(builder.words.data()), KernelPanic );
}

BOOST_AUTO_TEST_SUITE_END()
