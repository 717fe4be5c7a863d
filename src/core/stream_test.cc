// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "core/stream.h"

#include <gmock/gmock.h>
#include <glog/logging.h>
#include <gtest/gtest.h>

#include "core/consumer_group.h"

namespace doppel {

using namespace std;
using namespace testing;

class StreamTest : public testing::Test {
 protected:
  StreamID AddAt(uint64_t now_ms, string_view field = "f", string_view value = "v") {
    ParsedStreamID wildcard;
    StreamID res;
    EXPECT_EQ(Stream::AddStatus::OK,
              stream_.Add(wildcard, FieldValues{{string(field), string(value)}}, now_ms, &res));
    return res;
  }

  Stream::AddStatus AddExplicit(string_view id) {
    ParsedStreamID parsed;
    CHECK(ParseStreamID(id, true, 0, &parsed));
    StreamID res;
    return stream_.Add(parsed, FieldValues{{"f", "v"}}, 0, &res);
  }

  static vector<StreamID> Ids(const StreamEntries& entries) {
    vector<StreamID> res;
    for (const auto& e : entries)
      res.push_back(e.id);
    return res;
  }

  Stream stream_;
};

TEST_F(StreamTest, WildcardIds) {
  EXPECT_EQ(AddAt(100), (StreamID{100, 0}));
  EXPECT_EQ(AddAt(100), (StreamID{100, 1}));
  EXPECT_EQ(AddAt(101), (StreamID{101, 0}));

  // The clock going backwards never produces smaller IDs.
  EXPECT_EQ(AddAt(50), (StreamID{101, 1}));
  EXPECT_EQ(stream_.length(), 4u);
  EXPECT_EQ(stream_.last_id(), (StreamID{101, 1}));
  EXPECT_EQ(stream_.first_id(), (StreamID{100, 0}));
}

TEST_F(StreamTest, ExplicitIds) {
  EXPECT_EQ(Stream::AddStatus::ID_ZERO, AddExplicit("0-0"));
  EXPECT_EQ(Stream::AddStatus::OK, AddExplicit("0-1"));
  EXPECT_EQ(Stream::AddStatus::OK, AddExplicit("5-5"));
  EXPECT_EQ(Stream::AddStatus::ID_TOO_SMALL, AddExplicit("5-5"));
  EXPECT_EQ(Stream::AddStatus::ID_TOO_SMALL, AddExplicit("4"));
  EXPECT_EQ(Stream::AddStatus::OK, AddExplicit("5-6"));
  EXPECT_EQ(stream_.length(), 3u);

  EXPECT_EQ(Stream::AddStatus::OK, AddExplicit("5-*"));
  EXPECT_EQ(stream_.last_id(), (StreamID{5, 7}));
  EXPECT_EQ(Stream::AddStatus::OK, AddExplicit("9-*"));
  EXPECT_EQ(stream_.last_id(), (StreamID{9, 0}));
  EXPECT_EQ(Stream::AddStatus::ID_TOO_SMALL, AddExplicit("8-*"));
}

TEST_F(StreamTest, FailedAddKeepsStream) {
  AddAt(10);
  StreamID untouched{1, 1};
  ParsedStreamID parsed;
  parsed.id_given = parsed.has_seq = true;
  parsed.val = StreamID{3, 0};
  EXPECT_EQ(Stream::AddStatus::ID_TOO_SMALL, stream_.Add(parsed, {}, 0, &untouched));
  EXPECT_EQ(untouched, (StreamID{1, 1}));
  EXPECT_EQ(stream_.length(), 1u);
  EXPECT_EQ(stream_.last_id(), (StreamID{10, 0}));
}

TEST_F(StreamTest, IdsAreNotReused) {
  AddAt(10);
  StreamID last = AddAt(10);
  EXPECT_EQ(1u, stream_.Delete({last}));
  EXPECT_EQ(stream_.last_id(), last);

  EXPECT_EQ(Stream::AddStatus::ID_TOO_SMALL, AddExplicit("10-1"));
  EXPECT_EQ(AddAt(10), (StreamID{10, 2}));
}

TEST_F(StreamTest, Trim) {
  for (uint64_t i = 1; i <= 5; ++i)
    AddAt(i);

  EXPECT_EQ(0u, stream_.Trim(10));
  EXPECT_EQ(2u, stream_.Trim(3));
  EXPECT_THAT(Ids(stream_.Range(StreamID::Min(), StreamID::Max(), 0, false)),
              ElementsAre(StreamID{3, 0}, StreamID{4, 0}, StreamID{5, 0}));

  EXPECT_EQ(3u, stream_.Trim(0));
  EXPECT_EQ(stream_.length(), 0u);
  EXPECT_EQ(stream_.last_id(), (StreamID{5, 0}));
}

TEST_F(StreamTest, Delete) {
  StreamID a = AddAt(1), b = AddAt(2), c = AddAt(3);

  EXPECT_EQ(2u, stream_.Delete({a, StreamID{100, 0}, c}));
  EXPECT_EQ(0u, stream_.Delete({a}));
  EXPECT_EQ(stream_.length(), 1u);
  EXPECT_EQ(stream_.Find(a), nullptr);
  ASSERT_NE(stream_.Find(b), nullptr);
}

TEST_F(StreamTest, Range) {
  for (uint64_t i = 1; i <= 5; ++i)
    AddAt(i, "k", to_string(i));

  StreamEntries all = stream_.Range(StreamID::Min(), StreamID::Max(), 0, false);
  ASSERT_EQ(all.size(), 5u);
  EXPECT_EQ(all[0].values, (FieldValues{{"k", "1"}}));

  StreamEntries rev = stream_.Range(StreamID::Max(), StreamID::Min(), 0, true);
  ASSERT_EQ(rev.size(), 5u);
  for (size_t i = 0; i < 5; ++i)
    EXPECT_EQ(rev[i].id, all[4 - i].id);

  EXPECT_THAT(Ids(stream_.Range({2, 0}, {4, UINT64_MAX}, 0, false)),
              ElementsAre(StreamID{2, 0}, StreamID{3, 0}, StreamID{4, 0}));
  EXPECT_THAT(Ids(stream_.Range({2, 0}, {4, 0}, 2, false)),
              ElementsAre(StreamID{2, 0}, StreamID{3, 0}));
  EXPECT_THAT(Ids(stream_.Range({4, UINT64_MAX}, {2, 0}, 2, true)),
              ElementsAre(StreamID{4, 0}, StreamID{3, 0}));

  EXPECT_TRUE(stream_.Range({4, 0}, {2, 0}, 0, false).empty());
  EXPECT_TRUE(stream_.Range({2, 0}, {4, 0}, 0, true).empty());
}

TEST_F(StreamTest, After) {
  for (uint64_t i = 1; i <= 3; ++i)
    AddAt(i);

  EXPECT_THAT(Ids(stream_.After({1, 0}, 0)), ElementsAre(StreamID{2, 0}, StreamID{3, 0}));
  EXPECT_THAT(Ids(stream_.After(StreamID::Min(), 1)), ElementsAre(StreamID{1, 0}));
  EXPECT_TRUE(stream_.After({3, 0}, 0).empty());
  EXPECT_TRUE(stream_.After(StreamID::Max(), 0).empty());
}

TEST_F(StreamTest, Groups) {
  ConsumerGroup* cg = stream_.CreateGroup("grp", StreamID{5, 0});
  ASSERT_NE(cg, nullptr);
  EXPECT_EQ(cg->last_delivered_id(), (StreamID{5, 0}));

  EXPECT_EQ(stream_.CreateGroup("grp", StreamID{}), nullptr);
  EXPECT_EQ(stream_.FindGroup("grp"), cg);
  EXPECT_EQ(stream_.FindGroup("other"), nullptr);
  EXPECT_EQ(stream_.group_count(), 1u);
}

}  // namespace doppel
