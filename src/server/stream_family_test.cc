// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "server/stream_family.h"

#include <absl/strings/str_cat.h>
#include <glog/logging.h>

#include <thread>

#include "facade/facade_test.h"
#include "server/test_utils.h"

using namespace testing;
using namespace std;

namespace doppel {

const auto kMatchNil = ArgType(RespExpr::NIL);
const auto kMatchNilArray = ArgType(RespExpr::NIL_ARRAY);

class StreamFamilyTest : public BaseFamilyTest {
 protected:
};

TEST_F(StreamFamilyTest, Add) {
  auto resp = Run({"xadd", "key", "*", "field", "value"});
  ASSERT_THAT(resp, ArgType(RespExpr::STRING));
  EXPECT_EQ(resp, "1000-0");

  resp = Run({"xadd", "key", "*", "f2", "v2"});
  EXPECT_EQ(resp, "1000-1");

  EXPECT_THAT(Run({"xlen", "key"}), IntArg(2));
  EXPECT_EQ(Run({"type", "key"}), "stream");

  resp = Run({"xrange", "key", "-", "+"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre("1000-0", RespElementsAre("field", "value")),
                                    RespElementsAre("1000-1", RespElementsAre("f2", "v2"))));

  resp = Run({"xadd", "key", "badid", "f1", "val1"});
  EXPECT_THAT(resp, ErrArg("Invalid stream ID"));

  resp = Run({"xadd", "key", "+", "f1", "val1"});
  EXPECT_THAT(resp, ErrArg("Invalid stream ID"));
}

TEST_F(StreamFamilyTest, AddAutoId) {
  AdvanceTime(500);
  EXPECT_EQ(Run({"xadd", "key", "*", "f", "v"}), "1500-0");

  EXPECT_EQ(Run({"xadd", "key", "2000-5", "f", "v"}), "2000-5");

  // The clock is behind the last ID.
  EXPECT_EQ(Run({"xadd", "key", "*", "f", "v"}), "2000-6");

  EXPECT_EQ(Run({"xadd", "key", "2000-*", "f", "v"}), "2000-7");
  EXPECT_EQ(Run({"xadd", "key", "3000-*", "f", "v"}), "3000-0");
  EXPECT_THAT(Run({"xadd", "key", "2500-*", "f", "v"}), ErrArg("equal or smaller than"));

  AdvanceTime(5000);
  EXPECT_EQ(Run({"xadd", "key", "*", "f", "v"}), "6500-0");
}

TEST_F(StreamFamilyTest, AddExplicitId) {
  EXPECT_EQ(Run({"xadd", "key", "5", "f1", "v1", "f2", "v2"}), "5-0");
  EXPECT_THAT(Run({"xrange", "key", "5-0", "5-0"}),
              RespElementsAre(RespElementsAre("5-0", RespElementsAre("f1", "v1", "f2", "v2"))));

  EXPECT_EQ(Run({"xadd", "key", "5-1", "f", "v"}), "5-1");
  EXPECT_THAT(Run({"xadd", "key", "5-1", "f", "v"}), ErrArg("equal or smaller than"));
  EXPECT_THAT(Run({"xadd", "key", "4-9", "f", "v"}), ErrArg("equal or smaller than"));
  EXPECT_THAT(Run({"xlen", "key"}), IntArg(2));

  EXPECT_THAT(Run({"xadd", "zero", "0-0", "f", "v"}), ErrArg("must be greater than 0-0"));
  EXPECT_EQ(Run({"type", "zero"}), "none");
}

TEST_F(StreamFamilyTest, AddInvalidArgs) {
  EXPECT_THAT(Run({"xadd", "key", "*", "f"}), ErrArg("wrong number of arguments for 'xadd'"));
  EXPECT_THAT(Run({"xadd", "key", "*", "f", "v", "f2"}),
              ErrArg("wrong number of arguments for XADD"));
  EXPECT_THAT(Run({"xadd", "key", "maxlen", "1", "*", "f"}),
              ErrArg("wrong number of arguments for XADD"));
  EXPECT_THAT(Run({"xadd", "key", "maxlen", "-1", "*", "f", "v"}),
              ErrArg("The MAXLEN argument must be >= 0."));
  EXPECT_THAT(Run({"xadd", "key", "maxlen", "abc", "*", "f", "v"}),
              ErrArg("value is not an integer or out of range"));
  EXPECT_THAT(Run({"exists", "key"}), IntArg(0));
}

TEST_F(StreamFamilyTest, AddMaxLen) {
  for (int i = 1; i <= 5; ++i) {
    string id = absl::StrCat(i, "-0");
    Run({"xadd", "key", id, "f", "v"});
  }

  EXPECT_EQ(Run({"xadd", "key", "maxlen", "3", "6-0", "f", "v"}), "6-0");
  EXPECT_THAT(Run({"xlen", "key"}), IntArg(3));

  auto resp = Run({"xrange", "key", "-", "+"});
  ASSERT_THAT(resp, ArrLen(3));
  EXPECT_THAT(resp.GetVec()[0], RespElementsAre("4-0", _));
  EXPECT_THAT(resp.GetVec()[2], RespElementsAre("6-0", _));

  EXPECT_EQ(Run({"xadd", "key", "MAXLEN", "~", "2", "7-0", "f", "v"}), "7-0");
  EXPECT_THAT(Run({"xlen", "key"}), IntArg(2));
  EXPECT_EQ(Run({"xadd", "key", "maxlen", "=", "1", "8-0", "f", "v"}), "8-0");
  EXPECT_THAT(Run({"xlen", "key"}), IntArg(1));

  // A failed append does not trim.
  EXPECT_THAT(Run({"xadd", "key", "maxlen", "0", "1-0", "f", "v"}),
              ErrArg("equal or smaller than"));
  EXPECT_THAT(Run({"xlen", "key"}), IntArg(1));

  // Zero length keeps the key.
  EXPECT_EQ(Run({"xadd", "key", "maxlen", "0", "9-0", "f", "v"}), "9-0");
  EXPECT_THAT(Run({"xlen", "key"}), IntArg(0));
  EXPECT_EQ(Run({"type", "key"}), "stream");

  // IDs are never reused even after the stream was emptied.
  EXPECT_THAT(Run({"xadd", "key", "9-0", "f", "v"}), ErrArg("equal or smaller than"));
  EXPECT_EQ(Run({"xadd", "key", "9-*", "f", "v"}), "9-1");
}

TEST_F(StreamFamilyTest, NoMkStream) {
  EXPECT_THAT(Run({"xadd", "noexist", "nomkstream", "*", "field", "value"}), kMatchNil);
  EXPECT_EQ(Run({"type", "noexist"}), "none");

  Run({"xadd", "key", "*", "f", "v"});
  EXPECT_EQ(Run({"xadd", "key", "NOMKSTREAM", "maxlen", "1", "*", "f", "v"}), "1000-1");
  EXPECT_THAT(Run({"xlen", "key"}), IntArg(1));
}

TEST_F(StreamFamilyTest, WrongType) {
  AddStringKey("str", "value");

  EXPECT_THAT(Run({"xadd", "str", "*", "f", "v"}), ErrArg("WRONGTYPE"));
  EXPECT_THAT(Run({"xlen", "str"}), ErrArg("WRONGTYPE"));
  EXPECT_THAT(Run({"xrange", "str", "-", "+"}), ErrArg("WRONGTYPE"));
  EXPECT_THAT(Run({"xrevrange", "str", "+", "-"}), ErrArg("WRONGTYPE"));
  EXPECT_THAT(Run({"xdel", "str", "1-0"}), ErrArg("WRONGTYPE"));
  EXPECT_THAT(Run({"xgroup", "create", "str", "g", "0", "mkstream"}), ErrArg("WRONGTYPE"));
  EXPECT_THAT(Run({"xinfo", "stream", "str"}), ErrArg("WRONGTYPE"));
  EXPECT_THAT(Run({"xread", "streams", "str", "0"}), ErrArg("WRONGTYPE"));
  EXPECT_THAT(Run({"xreadgroup", "group", "g", "c", "streams", "str", ">"}),
              ErrArg("WRONGTYPE"));
  EXPECT_THAT(Run({"xpending", "str", "g"}), ErrArg("WRONGTYPE"));
  EXPECT_THAT(Run({"xack", "str", "g", "1-0"}), ErrArg("WRONGTYPE"));

  EXPECT_EQ(Run({"type", "str"}), "string");
}

TEST_F(StreamFamilyTest, Range) {
  Run({"xadd", "key", "1-*", "f1", "v1"});
  Run({"xadd", "key", "1-*", "f2", "v2"});
  auto resp = Run({"xrange", "key", "-", "+"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre("1-0", RespElementsAre("f1", "v1")),
                                    RespElementsAre("1-1", RespElementsAre("f2", "v2"))));

  resp = Run({"xrevrange", "key", "+", "-"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre("1-1", RespElementsAre("f2", "v2")),
                                    RespElementsAre("1-0", RespElementsAre("f1", "v1"))));

  resp = Run({"xrange", "key", "-", "+", "count", "1"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre("1-0", _)));

  resp = Run({"xrevrange", "key", "+", "-", "COUNT", "1"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre("1-1", _)));

  // Non-positive count does not limit the scan.
  EXPECT_THAT(Run({"xrange", "key", "-", "+", "count", "0"}), ArrLen(2));
  EXPECT_THAT(Run({"xrange", "key", "-", "+", "count", "-1"}), ArrLen(2));

  EXPECT_THAT(Run({"xrange", "null", "-", "+"}), ArrLen(0));
  EXPECT_THAT(Run({"xrange", "key", "2", "+"}), ArrLen(0));
  EXPECT_THAT(Run({"xrange", "key", "1-1", "1-0"}), ArrLen(0));
}

TEST_F(StreamFamilyTest, LargeCount) {
  Run({"xadd", "key", "1-*", "f1", "v1"});
  Run({"xadd", "key", "1-*", "f2", "v2"});
  Run({"xadd", "key", "1-*", "f3", "v3"});

  // Counts beyond 32 bits are not truncated.
  EXPECT_THAT(Run({"xrange", "key", "-", "+", "count", "4294967297"}), ArrLen(3));
  EXPECT_THAT(Run({"xrevrange", "key", "+", "-", "count", "4294967297"}), ArrLen(3));

  auto resp = Run({"xread", "count", "4294967296", "streams", "key", "0"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre("key", ArrLen(3))));

  resp = Run({"xread", "count", "4294967297", "streams", "key", "1-0"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre("key", ArrLen(2))));

  Run({"xgroup", "create", "key", "group", "0"});
  resp = Run({"xreadgroup", "group", "group", "alice", "count", "4294967297", "streams", "key",
              ">"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre("key", ArrLen(3))));
}

TEST_F(StreamFamilyTest, RangeBoundsAutocomplete) {
  Run({"xadd", "mystream", "1609459200000-0", "0", "0"});
  Run({"xadd", "mystream", "1609459200001-0", "1", "1"});
  Run({"xadd", "mystream", "1609459200001-1", "2", "2"});
  Run({"xadd", "mystream", "1609459200002-0", "3", "3"});

  auto resp = Run({"xrange", "mystream", "1609459200000", "1609459200001"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre("1609459200000-0", RespElementsAre("0", "0")),
                                    RespElementsAre("1609459200001-0", RespElementsAre("1", "1")),
                                    RespElementsAre("1609459200001-1", RespElementsAre("2", "2"))));

  resp = Run({"xrange", "mystream", "1609459200001", "+"});
  EXPECT_THAT(resp, ArrLen(3));

  resp = Run({"xrevrange", "mystream", "1609459200001", "1609459200000"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre("1609459200001-1", RespElementsAre("2", "2")),
                                    RespElementsAre("1609459200001-0", RespElementsAre("1", "1")),
                                    RespElementsAre("1609459200000-0", RespElementsAre("0", "0"))));
}

TEST_F(StreamFamilyTest, RangeInvalidArgs) {
  Run({"xadd", "key", "1-0", "f", "v"});

  EXPECT_THAT(Run({"xrange", "key", "-"}), ErrArg("wrong number of arguments for 'xrange'"));
  EXPECT_THAT(Run({"xrange", "key", "-", "+", "count"}), ErrArg("syntax error"));
  EXPECT_THAT(Run({"xrange", "key", "-", "+", "limit", "1"}), ErrArg("syntax error"));
  EXPECT_THAT(Run({"xrange", "key", "-", "+", "count", "1", "x"}), ErrArg("syntax error"));
  EXPECT_THAT(Run({"xrange", "key", "-", "+", "count", "x"}), ErrArg("not an integer"));
  EXPECT_THAT(Run({"xrange", "key", "bad", "+"}), ErrArg("Invalid stream ID"));
  EXPECT_THAT(Run({"xrevrange", "key", "+", "1-x"}), ErrArg("Invalid stream ID"));
}

TEST_F(StreamFamilyTest, Delete) {
  Run({"xadd", "key", "1-0", "f", "v"});
  Run({"xadd", "key", "2-0", "f", "v"});
  Run({"xadd", "key", "3-0", "f", "v"});

  EXPECT_THAT(Run({"xdel", "key", "1-0", "3", "7-0"}), IntArg(2));
  EXPECT_THAT(Run({"xlen", "key"}), IntArg(1));
  EXPECT_THAT(Run({"xrange", "key", "-", "+"}), RespElementsAre(RespElementsAre("2-0", _)));
  EXPECT_THAT(Run({"xdel", "key", "1-0"}), IntArg(0));

  // The top ID survives the deletion.
  EXPECT_THAT(Run({"xadd", "key", "3-0", "f", "v"}), ErrArg("equal or smaller than"));

  EXPECT_THAT(Run({"xdel", "missing", "1-0"}), IntArg(0));
  EXPECT_THAT(Run({"xdel", "key", "bad"}), ErrArg("Invalid stream ID"));
  EXPECT_THAT(Run({"xdel", "key"}), ErrArg("wrong number of arguments"));
}

TEST_F(StreamFamilyTest, KeyVersion) {
  EXPECT_EQ(0u, KeyVersion("key"));

  Run({"xadd", "key", "1-1", "f", "v"});
  uint64_t v1 = KeyVersion("key");
  EXPECT_GT(v1, 0u);

  // Reads and failed writes do not mutate the key.
  Run({"xrange", "key", "-", "+"});
  Run({"xadd", "key", "1-0", "f", "v"});
  Run({"xdel", "key", "5-0"});
  EXPECT_EQ(v1, KeyVersion("key"));

  Run({"xadd", "key", "2-0", "f", "v"});
  uint64_t v2 = KeyVersion("key");
  EXPECT_GT(v2, v1);

  Run({"xdel", "key", "1-1"});
  uint64_t v3 = KeyVersion("key");
  EXPECT_GT(v3, v2);

  // Other keys keep their version.
  Run({"xadd", "other", "1-1", "f", "v"});
  EXPECT_EQ(v3, KeyVersion("key"));

  Run({"del", "key"});
  EXPECT_EQ(0u, KeyVersion("key"));

  Run({"xadd", "key", "1-1", "f", "v"});
  EXPECT_GT(KeyVersion("key"), v3);

  Run({"flushdb"});
  EXPECT_EQ(0u, KeyVersion("key"));
  EXPECT_EQ(0u, KeyVersion("other"));
}

TEST_F(StreamFamilyTest, GroupCreate) {
  Run({"xadd", "key", "1-*", "f1", "v1"});
  EXPECT_EQ(Run({"xgroup", "create", "key", "grname", "1"}), "OK");
  EXPECT_THAT(Run({"xgroup", "create", "key", "grname", "1"}), ErrArg("BUSYGROUP"));
  EXPECT_THAT(Run({"xgroup", "create", "test", "test", "0"}),
              ErrArg("requires the key to exist"));
  EXPECT_THAT(Run({"xgroup", "create", "key", "g2", "bad"}), ErrArg("Invalid stream ID"));
  EXPECT_THAT(Run({"xgroup", "create", "key", "g2", "0", "foo"}), ErrArg("syntax error"));

  EXPECT_EQ(Run({"xgroup", "create", "test", "test", "0", "MKSTREAM"}), "OK");
  EXPECT_EQ(Run({"type", "test"}), "stream");
  EXPECT_THAT(Run({"xlen", "test"}), IntArg(0));
}

TEST_F(StreamFamilyTest, GroupUnsupported) {
  Run({"xgroup", "create", "key", "g", "0", "mkstream"});

  EXPECT_THAT(Run({"xgroup", "destroy", "key", "g"}),
              ErrArg("'XGROUP destroy key g' not supported"));
  EXPECT_THAT(Run({"xgroup", "help"}), ErrArg("'XGROUP help' not supported"));
  EXPECT_THAT(Run({"xgroup"}), ErrArg("wrong number of arguments for 'xgroup'"));
}

TEST_F(StreamFamilyTest, GroupCreateAtLastId) {
  Run({"xadd", "key", "1-0", "f", "v"});
  Run({"xadd", "key", "2-0", "f", "v"});
  Run({"xdel", "key", "2-0"});

  // "$" is the greatest ID ever added, not the greatest present.
  EXPECT_EQ(Run({"xgroup", "create", "key", "g", "$"}), "OK");
  EXPECT_THAT(Run({"xreadgroup", "group", "g", "alice", "streams", "key", ">"}), kMatchNilArray);

  Run({"xadd", "key", "3-0", "f", "v"});
  auto resp = Run({"xreadgroup", "group", "g", "alice", "streams", "key", ">"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre("key", RespElementsAre(RespElementsAre(
                                                               "3-0", RespElementsAre("f", "v"))))));
}

TEST_F(StreamFamilyTest, XInfoStream) {
  Run({"xadd", "key", "*", "f", "v"});
  Run({"xadd", "key", "*", "f", "v"});

  EXPECT_THAT(Run({"xinfo", "stream", "key"}), RespElementsAre("length", IntArg(2)));
  EXPECT_THAT(Run({"xinfo", "stream", "missing"}), ErrArg("no such key"));
  EXPECT_THAT(Run({"xinfo", "stream"}), ErrArg("wrong number of arguments for 'xinfo'"));
  EXPECT_THAT(Run({"xinfo", "groups", "key"}), ErrArg("'XINFO groups key' not supported"));
  EXPECT_THAT(Run({"xinfo", "HELP"}), ErrArg("'XINFO HELP' not supported"));
  EXPECT_THAT(Run({"xinfo", "foo"}), ErrArg("syntax error, try 'XINFO HELP'"));
}

TEST_F(StreamFamilyTest, XRead) {
  Run({"xadd", "foo", "1-*", "k1", "v1"});
  Run({"xadd", "foo", "1-*", "k2", "v2"});
  Run({"xadd", "foo", "1-*", "k3", "v3"});
  Run({"xadd", "bar", "1-*", "k4", "v4"});

  // Receive all records from both streams.
  auto resp = Run({"xread", "streams", "foo", "bar", "0", "0"});
  ASSERT_THAT(resp, ArrLen(2));
  EXPECT_THAT(resp.GetVec()[0], RespElementsAre("foo", ArrLen(3)));
  EXPECT_THAT(resp.GetVec()[1], RespElementsAre("bar", ArrLen(1)));

  // Order of the keys follows the request.
  resp = Run({"xread", "streams", "bar", "foo", "0", "0"});
  ASSERT_THAT(resp, ArrLen(2));
  EXPECT_THAT(resp.GetVec()[0], RespElementsAre("bar", ArrLen(1)));

  // Read a limited number of records from the first stream.
  resp = Run({"xread", "count", "2", "streams", "foo", "0"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre(
                        "foo", RespElementsAre(RespElementsAre("1-0", RespElementsAre("k1", "v1")),
                                               RespElementsAre("1-1", RespElementsAre("k2", "v2"))))));

  // Read only the entries after the given ID.
  resp = Run({"xread", "streams", "foo", "1-1"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre(
                        "foo", RespElementsAre(RespElementsAre("1-2", RespElementsAre("k3", "v3"))))));

  // A stream with nothing new is left out.
  resp = Run({"xread", "streams", "foo", "bar", "1-2", "0"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre("bar", ArrLen(1))));

  EXPECT_THAT(Run({"xread", "streams", "foo", "1-2"}), kMatchNilArray);
  EXPECT_THAT(Run({"xread", "streams", "missing", "0"}), kMatchNilArray);
  EXPECT_THAT(Run({"xread", "streams", "foo", "$"}), kMatchNilArray);
}

TEST_F(StreamFamilyTest, XReadInvalidArgs) {
  // Invalid COUNT value.
  auto resp = Run({"xread", "count", "invalid", "streams", "s1", "s2", "0", "0"});
  EXPECT_THAT(resp, ErrArg("not an integer or out of range"));

  resp = Run({"xread", "streams", "s1", "s2", "0"});
  EXPECT_THAT(resp, ErrArg("Unbalanced XREAD list of streams"));

  resp = Run({"xread", "streams", "s1", "0", "count"});
  EXPECT_THAT(resp, ErrArg("Unbalanced XREAD list of streams"));

  // Missing COUNT value.
  resp = Run({"xread", "block", "10", "count"});
  EXPECT_THAT(resp, ErrArg("wrong number of arguments for 'xread' command"));

  // Invalid BLOCK value.
  resp = Run({"xread", "block", "invalid", "streams", "s1", "s2", "0", "0"});
  EXPECT_THAT(resp, ErrArg("not an integer or out of range"));

  resp = Run({"xread", "block", "-1", "streams", "s1", "0"});
  EXPECT_THAT(resp, ErrArg("timeout is negative"));

  // Missing STREAMS.
  resp = Run({"xread", "count", "5", "block", "1"});
  EXPECT_THAT(resp, ErrArg("wrong number of arguments for 'xread' command"));

  resp = Run({"xread", "noack", "streams", "s1", "0"});
  EXPECT_THAT(resp, ErrArg("incorrect argument noack"));

  resp = Run({"xread", "streams", "s1", ">"});
  EXPECT_THAT(resp, ErrArg("Invalid stream ID"));
}

TEST_F(StreamFamilyTest, XReadGroup) {
  Run({"xadd", "foo", "1-*", "k1", "v1"});
  Run({"xadd", "foo", "1-*", "k2", "v2"});
  Run({"xadd", "foo", "1-*", "k3", "v3"});
  Run({"xadd", "bar", "1-*", "k4", "v4"});

  Run({"xgroup", "create", "foo", "group", "0"});
  Run({"xgroup", "create", "bar", "group", "0"});

  auto resp = Run({"xreadgroup", "group", "group", "alice", "count", "2", "streams", "foo", ">"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre(
                        "foo", RespElementsAre(RespElementsAre("1-0", RespElementsAre("k1", "v1")),
                                               RespElementsAre("1-1", RespElementsAre("k2", "v2"))))));

  // The cursor moved past the delivered entries.
  resp = Run({"xreadgroup", "group", "group", "bob", "streams", "foo", "bar", ">", ">"});
  ASSERT_THAT(resp, ArrLen(2));
  EXPECT_THAT(resp.GetVec()[0], RespElementsAre("foo", RespElementsAre(RespElementsAre("1-2", _))));
  EXPECT_THAT(resp.GetVec()[1], RespElementsAre("bar", ArrLen(1)));

  EXPECT_THAT(Run({"xreadgroup", "group", "group", "alice", "streams", "foo", ">"}),
              kMatchNilArray);

  resp = Run({"xpending", "foo", "group"});
  EXPECT_THAT(resp, RespElementsAre(IntArg(3), "1-0", "1-2",
                                    RespElementsAre(RespElementsAre("alice", "2"),
                                                    RespElementsAre("bob", "1"))));
}

TEST_F(StreamFamilyTest, XReadGroupNoAck) {
  Run({"xadd", "foo", "1-0", "k1", "v1"});
  Run({"xadd", "foo", "2-0", "k2", "v2"});
  Run({"xgroup", "create", "foo", "group", "0"});

  auto resp = Run({"xreadgroup", "group", "group", "alice", "NOACK", "streams", "foo", ">"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre("foo", ArrLen(2))));

  resp = Run({"xpending", "foo", "group"});
  EXPECT_THAT(resp, RespElementsAre(IntArg(0), kMatchNil, kMatchNil, kMatchNilArray));

  // Nothing is pending, so there is no history either.
  resp = Run({"xreadgroup", "group", "group", "alice", "streams", "foo", "0"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre("foo", ArrLen(0))));
}

TEST_F(StreamFamilyTest, XReadGroupHistory) {
  Run({"xadd", "foo", "1-0", "k1", "v1"});
  Run({"xadd", "foo", "2-0", "k2", "v2"});
  Run({"xadd", "foo", "3-0", "k3", "v3"});
  Run({"xgroup", "create", "foo", "group", "0"});

  Run({"xreadgroup", "group", "group", "alice", "count", "2", "streams", "foo", ">"});
  Run({"xreadgroup", "group", "group", "bob", "streams", "foo", ">"});

  auto resp = Run({"xreadgroup", "group", "group", "alice", "streams", "foo", "0"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre(
                        "foo", RespElementsAre(RespElementsAre("1-0", RespElementsAre("k1", "v1")),
                                               RespElementsAre("2-0", RespElementsAre("k2", "v2"))))));

  resp = Run({"xreadgroup", "group", "group", "alice", "count", "1", "streams", "foo", "1-0"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre("foo", RespElementsAre(RespElementsAre("2-0", _)))));

  resp = Run({"xreadgroup", "group", "group", "bob", "streams", "foo", "0"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre("foo", RespElementsAre(RespElementsAre("3-0", _)))));

  // An unknown consumer has an empty history, which is still reported.
  resp = Run({"xreadgroup", "group", "group", "carol", "streams", "foo", "0"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre("foo", ArrLen(0))));

  // Replay does not count as a delivery.
  resp = Run({"xpending", "foo", "group", "-", "+", "10", "alice"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre("1-0", "alice", IntArg(0), IntArg(1)),
                                    RespElementsAre("2-0", "alice", IntArg(0), IntArg(1))));

  // Deleted entries stay pending but are not replayed.
  Run({"xdel", "foo", "1-0"});
  resp = Run({"xreadgroup", "group", "group", "alice", "streams", "foo", "0"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre("foo", RespElementsAre(RespElementsAre("2-0", _)))));
  EXPECT_THAT(Run({"xpending", "foo", "group"}), RespElementsAre(IntArg(3), "1-0", "3-0", _));
}

TEST_F(StreamFamilyTest, XReadGroupInvalidArgs) {
  Run({"xgroup", "create", "foo", "group", "0", "mkstream"});
  // Invalid COUNT value.
  auto resp =
      Run({"xreadgroup", "group", "group", "alice", "count", "invalid", "streams", "foo", "0"});
  EXPECT_THAT(resp, ErrArg("not an integer or out of range"));

  // Invalid "stream" instead of GROUP.
  resp = Run({"xreadgroup", "stream", "group", "alice", "count", "1", "streams", "foo", "0"});
  EXPECT_THAT(resp, ErrArg("syntax error"));

  // Missing streams.
  resp = Run({"xreadgroup", "group", "group", "alice", "streams"});
  EXPECT_THAT(resp, ErrArg("wrong number of arguments for 'xreadgroup' command"));

  resp = Run({"xreadgroup", "group", "group", "alice", "count", "1", "noack"});
  EXPECT_THAT(resp, ErrArg("wrong number of arguments for 'xreadgroup' command"));

  // Missing block value.
  resp = Run({"xreadgroup", "group", "group", "alice", "block", "streams", "foo", "0"});
  EXPECT_THAT(resp, ErrArg("not an integer or out of range"));

  resp = Run({"xreadgroup", "group", "group", "alice", "block", "-5", "streams", "foo", ">"});
  EXPECT_THAT(resp, ErrArg("timeout is negative"));

  // Unbalanced list of streams.
  resp = Run({"xreadgroup", "group", "group", "alice", "streams", "s1", "s2", "s3", "0", "0"});
  EXPECT_THAT(resp, ErrArg("Unbalanced XREAD list of streams"));

  resp = Run({"xreadgroup", "group", "group", "alice", "limit", "streams", "foo", ">"});
  EXPECT_THAT(resp, ErrArg("incorrect argument limit"));

  resp = Run({"xreadgroup", "group", "group", "alice", "streams", "foo", "$"});
  EXPECT_THAT(resp, ErrArg("Invalid stream ID"));
}

TEST_F(StreamFamilyTest, XReadGroupNoGroup) {
  Run({"xgroup", "create", "foo", "group", "0", "mkstream"});
  Run({"xadd", "foo", "1-0", "k", "v"});
  Run({"xadd", "bar", "1-0", "k", "v"});

  auto resp = Run({"xreadgroup", "group", "nogroup", "alice", "streams", "foo", ">"});
  EXPECT_THAT(resp, ErrArg("NOGROUP No such key 'foo' or consumer group 'nogroup' in XREADGROUP "
                           "with GROUP option"));

  resp = Run({"xreadgroup", "group", "group", "alice", "streams", "missing", ">"});
  EXPECT_THAT(resp, ErrArg("NOGROUP No such key 'missing' or consumer group 'group'"));

  // A missing group on one stream fails the whole read without delivering from the others.
  resp = Run({"xreadgroup", "group", "group", "alice", "streams", "foo", "bar", ">", ">"});
  EXPECT_THAT(resp, ErrArg("NOGROUP No such key 'bar' or consumer group 'group'"));
  EXPECT_THAT(Run({"xpending", "foo", "group"}), RespElementsAre(IntArg(0), _, _, _));

  resp = Run({"xreadgroup", "group", "group", "alice", "streams", "foo", ">"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre("foo", ArrLen(1))));
}

TEST_F(StreamFamilyTest, XAck) {
  Run({"xadd", "foo", "1-0", "k0", "v0"});
  Run({"xadd", "foo", "1-1", "k1", "v1"});
  Run({"xadd", "foo", "1-2", "k2", "v2"});
  Run({"xgroup", "create", "foo", "cgroup", "0"});
  Run({"xreadgroup", "group", "cgroup", "alice", "count", "2", "streams", "foo", ">"});
  Run({"xreadgroup", "group", "cgroup", "bob", "streams", "foo", ">"});

  // Acknowledges the rows of any consumer.
  EXPECT_THAT(Run({"xack", "foo", "cgroup", "1-0", "1-2", "5-0"}), IntArg(2));
  EXPECT_THAT(Run({"xack", "foo", "cgroup", "1-0", "1-2"}), IntArg(0));

  auto resp = Run({"xpending", "foo", "cgroup"});
  EXPECT_THAT(resp, RespElementsAre(IntArg(1), "1-1", "1-1",
                                    RespElementsAre(RespElementsAre("alice", "1"))));

  EXPECT_THAT(Run({"xack", "foo", "nogroup", "1-1"}), IntArg(0));
  EXPECT_THAT(Run({"xack", "missing", "cgroup", "1-1"}), IntArg(0));
  EXPECT_THAT(Run({"xack", "foo", "cgroup", "bad"}), ErrArg("Invalid stream ID"));
  EXPECT_THAT(Run({"xack", "foo", "cgroup"}), ErrArg("wrong number of arguments"));
}

TEST_F(StreamFamilyTest, XPending) {
  Run({"xadd", "foo", "1-0", "k1", "v1"});
  Run({"xadd", "foo", "1-1", "k2", "v2"});
  Run({"xadd", "foo", "1-2", "k3", "v3"});
  Run({"xgroup", "create", "foo", "group", "0"});
  Run({"xreadgroup", "group", "group", "alice", "count", "2", "streams", "foo", ">"});
  AdvanceTime(100);
  Run({"xreadgroup", "group", "group", "bob", "streams", "foo", ">"});
  AdvanceTime(50);

  auto resp = Run({"xpending", "foo", "group", "-", "+", "10"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre("1-0", "alice", IntArg(150), IntArg(1)),
                                    RespElementsAre("1-1", "alice", IntArg(150), IntArg(1)),
                                    RespElementsAre("1-2", "bob", IntArg(50), IntArg(1))));

  resp = Run({"xpending", "foo", "group", "-", "+", "10", "bob"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre("1-2", "bob", IntArg(50), IntArg(1))));

  resp = Run({"xpending", "foo", "group", "1-1", "+", "1"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre("1-1", "alice", _, _)));

  resp = Run({"xpending", "foo", "group", "-", "1", "10"});
  EXPECT_THAT(resp, ArrLen(3));

  resp = Run({"xpending", "foo", "group", "IDLE", "100", "-", "+", "10"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre("1-0", "alice", _, _),
                                    RespElementsAre("1-1", "alice", _, _)));

  EXPECT_THAT(Run({"xpending", "foo", "group", "-", "+", "0"}), ArrLen(0));
  EXPECT_THAT(Run({"xpending", "foo", "group", "-", "+", "-1"}), kMatchNilArray);
  EXPECT_THAT(Run({"xpending", "foo", "group", "-", "+", "10", "carol"}), ArrLen(0));
}

TEST_F(StreamFamilyTest, XPendingPhantomEntries) {
  Run({"xadd", "foo", "1-0", "k1", "v1"});
  Run({"xadd", "foo", "2-0", "k2", "v2"});
  Run({"xgroup", "create", "foo", "group", "0"});
  Run({"xreadgroup", "group", "group", "alice", "streams", "foo", ">"});

  EXPECT_THAT(Run({"xdel", "foo", "1-0"}), IntArg(1));

  // The deleted entry remains pending and can be acknowledged.
  auto resp = Run({"xpending", "foo", "group", "-", "+", "10"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre("1-0", "alice", _, _),
                                    RespElementsAre("2-0", "alice", _, _)));
  EXPECT_THAT(Run({"xrange", "foo", "-", "+"}), ArrLen(1));
  EXPECT_THAT(Run({"xack", "foo", "group", "1-0"}), IntArg(1));
}

TEST_F(StreamFamilyTest, XPendingEmpty) {
  Run({"xgroup", "create", "foo", "group", "0", "mkstream"});

  auto resp = Run({"xpending", "foo", "group"});
  EXPECT_THAT(resp, RespElementsAre(IntArg(0), kMatchNil, kMatchNil, kMatchNilArray));

  EXPECT_THAT(Run({"xpending", "foo", "group", "-", "+", "10"}), kMatchNilArray);
}

TEST_F(StreamFamilyTest, XPendingInvalidArgs) {
  Run({"xgroup", "create", "foo", "group", "0", "mkstream"});

  EXPECT_THAT(Run({"xpending", "foo"}), ErrArg("wrong number of arguments"));
  EXPECT_THAT(Run({"xpending", "foo", "group", "-"}), ErrArg("syntax error"));
  EXPECT_THAT(Run({"xpending", "foo", "group", "-", "+"}), ErrArg("syntax error"));
  EXPECT_THAT(Run({"xpending", "foo", "group", "-", "+", "10", "alice", "x"}),
              ErrArg("syntax error"));
  EXPECT_THAT(Run({"xpending", "foo", "group", "bad", "+", "10"}), ErrArg("Invalid stream ID"));
  EXPECT_THAT(Run({"xpending", "foo", "group", "-", "+", "x"}), ErrArg("not an integer"));
  EXPECT_THAT(Run({"xpending", "foo", "group", "IDLE", "x", "-", "+", "10"}),
              ErrArg("not an integer"));
  EXPECT_THAT(Run({"xpending", "foo", "group", "IDLE", "10"}), ErrArg("syntax error"));

  EXPECT_THAT(Run({"xpending", "foo", "nogroup"}),
              ErrArg("NOGROUP No such key 'foo' or consumer group 'nogroup'"));
  EXPECT_THAT(Run({"xpending", "missing", "group"}),
              ErrArg("NOGROUP No such key 'missing' or consumer group 'group'"));
}

TEST_F(StreamFamilyTest, SelectDb) {
  Run({"xadd", "foo", "1-0", "k", "v"});
  EXPECT_EQ(Run({"select", "1"}), "OK");
  EXPECT_THAT(Run({"xlen", "foo"}), IntArg(0));
  EXPECT_THAT(Run({"xread", "streams", "foo", "0"}), kMatchNilArray);

  Run({"select", "0"});
  EXPECT_THAT(Run({"xlen", "foo"}), IntArg(1));
}

TEST_F(StreamFamilyTest, XReadBlockTimeout) {
  Run({"xadd", "foo", "1-0", "k", "v"});

  auto start = chrono::steady_clock::now();
  auto resp = Run({"xread", "block", "100", "streams", "foo", "$"});
  auto elapsed = chrono::steady_clock::now() - start;

  EXPECT_THAT(resp, kMatchNilArray);
  EXPECT_GE(elapsed, 100ms);
  EXPECT_EQ(NumWatched(), 0u);

  // Data that is already there is returned without waiting.
  resp = Run({"xread", "block", "100", "streams", "foo", "0"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre("foo", ArrLen(1))));
}

TEST_F(StreamFamilyTest, XReadBlock) {
  Run({"xadd", "foo", "1-*", "k1", "v1"});

  // Run XREAD BLOCK from 2 connections.
  RespExpr resp0, resp1;
  thread th0([&] { resp0 = Run("conn0", {"xread", "block", "0", "streams", "foo", "$"}); });
  thread th1(
      [&] { resp1 = Run("conn1", {"xread", "block", "0", "streams", "foo", "bar", "$", "$"}); });

  ASSERT_TRUE(WaitUntilCondition([&] { return NumWaiters("foo") == 2; }, 1000ms));
  auto start = chrono::steady_clock::now();
  Run("writer", {"xadd", "foo", "1-*", "k5", "v5"});

  th0.join();
  th1.join();

  // Both reads were woken up by the append without waiting for a timeout.
  EXPECT_LT(chrono::steady_clock::now() - start, 1s);
  EXPECT_THAT(resp0, RespElementsAre(RespElementsAre(
                         "foo", RespElementsAre(RespElementsAre("1-1", RespElementsAre("k5", "v5"))))));
  EXPECT_THAT(resp1, RespElementsAre(RespElementsAre("foo", ArrLen(1))));
  EXPECT_EQ(NumWatched(), 0u);
}

TEST_F(StreamFamilyTest, XReadBlockIgnoresOtherKeys) {
  RespExpr resp;
  thread th([&] { resp = Run("conn0", {"xread", "block", "0", "streams", "foo", "$"}); });

  ASSERT_TRUE(WaitUntilCondition([&] { return NumWaiters("foo") == 1; }, 1000ms));
  Run("writer", {"xadd", "bar", "1-0", "k", "v"});
  EXPECT_EQ(NumWaiters("foo"), 1u);

  Run("writer", {"xadd", "foo", "1-0", "k", "v"});
  th.join();
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre("foo", ArrLen(1))));
}

TEST_F(StreamFamilyTest, XReadGroupBlock) {
  Run({"xgroup", "create", "foo", "group", "0", "MKSTREAM"});
  Run({"xgroup", "create", "bar", "group", "0", "MKSTREAM"});

  // Timeout
  auto resp = Run(
      {"xreadgroup", "group", "group", "alice", "block", "1", "streams", "foo", "bar", ">", ">"});
  EXPECT_THAT(resp, kMatchNilArray);

  // Run XREADGROUP BLOCK from 2 connections.
  RespExpr resp0, resp1;
  thread th0([&] {
    resp0 = Run("conn0", {"xreadgroup", "group", "group", "alice", "block", "0", "streams", "foo",
                          "bar", ">", ">"});
  });
  thread th1([&] {
    resp1 = Run("conn1", {"xreadgroup", "group", "group", "bob", "block", "0", "streams", "foo",
                          "bar", ">", ">"});
  });
  ASSERT_TRUE(WaitUntilCondition([&] { return NumWaiters("foo") == 2; }, 1000ms));

  // Only one of the readers gets the entry, the other one keeps waiting.
  Run("writer", {"xadd", "foo", "1-*", "k5", "v5"});
  ASSERT_TRUE(WaitUntilCondition([&] { return NumWaiters("foo") == 1; }, 1000ms));

  Run("writer", {"xadd", "bar", "1-*", "k6", "v6"});

  th0.join();
  th1.join();

  if (resp0.GetVec()[0].GetVec()[0] == "foo") {
    EXPECT_THAT(resp0, RespElementsAre(RespElementsAre("foo", ArrLen(1))));
    EXPECT_THAT(resp1, RespElementsAre(RespElementsAre("bar", ArrLen(1))));
  } else {
    EXPECT_THAT(resp1, RespElementsAre(RespElementsAre("foo", ArrLen(1))));
    EXPECT_THAT(resp0, RespElementsAre(RespElementsAre("bar", ArrLen(1))));
  }

  resp = Run({"xpending", "foo", "group"});
  EXPECT_THAT(resp, RespElementsAre(IntArg(1), "1-0", "1-0", ArrLen(1)));
}

TEST_F(StreamFamilyTest, XReadGroupBlockWithHistory) {
  Run({"xadd", "foo", "1-0", "k1", "v1"});
  Run({"xgroup", "create", "foo", "group", "$"});

  // Replaying the history never blocks.
  auto start = chrono::steady_clock::now();
  auto resp =
      Run({"xreadgroup", "group", "group", "alice", "block", "1000", "streams", "foo", "0"});
  EXPECT_THAT(resp, RespElementsAre(RespElementsAre("foo", ArrLen(0))));
  EXPECT_LT(chrono::steady_clock::now() - start, 1s);
}

TEST_F(StreamFamilyTest, XReadGroupBlockKeyDeleted) {
  Run({"xgroup", "create", "foo", "group", "0", "MKSTREAM"});

  RespExpr resp;
  thread th([&] {
    resp = Run("conn0",
               {"xreadgroup", "group", "group", "alice", "block", "0", "streams", "foo", ">"});
  });
  ASSERT_TRUE(WaitUntilCondition([&] { return NumWaiters("foo") == 1; }, 1000ms));

  Run("writer", {"del", "foo"});
  th.join();

  EXPECT_THAT(resp, ErrArg("NOGROUP No such key 'foo' or consumer group 'group'"));
}

TEST_F(StreamFamilyTest, XReadBlockCancelled) {
  string raw_reply = "unset";
  thread th([&] { raw_reply = RunRaw("conn0", {"xread", "block", "0", "streams", "foo", "$"}); });

  ASSERT_TRUE(WaitUntilCondition([&] { return NumWaiters("foo") == 1; }, 1000ms));
  CancelBlocking("conn0");
  th.join();

  // A cancelled read sends nothing and leaves no state behind.
  EXPECT_EQ(raw_reply, "");
  EXPECT_EQ(NumWatched(), 0u);
  EXPECT_THAT(Run({"exists", "foo"}), IntArg(0));
}

TEST_F(StreamFamilyTest, BlockedReadSeesVirtualTime) {
  Run({"xgroup", "create", "foo", "group", "0", "MKSTREAM"});

  RespExpr resp;
  thread th([&] {
    resp = Run("conn0",
               {"xreadgroup", "group", "group", "alice", "block", "0", "streams", "foo", ">"});
  });
  ASSERT_TRUE(WaitUntilCondition([&] { return NumWaiters("foo") == 1; }, 1000ms));

  AdvanceTime(250);
  Run("writer", {"xadd", "foo", "*", "k", "v"});
  th.join();

  EXPECT_THAT(resp, RespElementsAre(RespElementsAre(
                        "foo", RespElementsAre(RespElementsAre("1250-0", _)))));

  AdvanceTime(40);
  EXPECT_THAT(Run({"xpending", "foo", "group", "-", "+", "1"}),
              RespElementsAre(RespElementsAre("1250-0", "alice", IntArg(40), IntArg(1))));
}

}  // namespace doppel
