/**
 * klog - Media Set Tests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <gtest/gtest.h>

#include "store/MediaSet.hpp"
#include "store/StoreErrors.hpp"

using klog::FormatError;
using klog::MediaItem;
using klog::MediaSet;
using klog::PendingMedia;

namespace {

MediaSet makeSet(std::initializer_list<const char*> names) {
    MediaSet set;
    for (const char* name : names) {
        set.add(MediaItem{name, std::nullopt});
    }
    return set;
}

} // anonymous namespace

TEST(MediaItemTest, ParsesFilenameOnly) {
    MediaItem item = MediaItem::parse("photo.jpg");
    EXPECT_EQ(item.filename, "photo.jpg");
    EXPECT_FALSE(item.options.has_value());
    EXPECT_EQ(item.toString(), "photo.jpg");
}

TEST(MediaItemTest, ParsesFilenameWithOptions) {
    MediaItem item = MediaItem::parse("photo.jpg, 300");
    EXPECT_EQ(item.filename, "photo.jpg");
    ASSERT_TRUE(item.options.has_value());
    EXPECT_EQ(*item.options, "300");
    EXPECT_EQ(item.toString(), "photo.jpg, 300");
}

TEST(MediaItemTest, CommaWithoutSpaceBelongsToFilename) {
    MediaItem item = MediaItem::parse("a,b.jpg");
    EXPECT_EQ(item.filename, "a,b.jpg");
    EXPECT_FALSE(item.options.has_value());
}

TEST(MediaItemTest, RejectsTooManyParts) {
    EXPECT_THROW(MediaItem::parse("a.jpg, 300, left"), FormatError);
    EXPECT_THROW(MediaItem::parse(", 300"), FormatError);
    EXPECT_THROW(MediaItem::parse(""), FormatError);
}

TEST(MediaItemTest, RejectsNamesLeavingTheMediaDirectory) {
    EXPECT_THROW(MediaItem::parse("/etc/passwd"), FormatError);
    EXPECT_THROW(MediaItem::parse("/tmp/victim.txt, 300"), FormatError);
    EXPECT_THROW(MediaItem::parse("../other/0/a.jpg"), FormatError);
    EXPECT_THROW(MediaItem::parse("sub/../../a.jpg"), FormatError);

    // Sub-paths inside the media directory are kept
    EXPECT_EQ(MediaItem::parse("scans/page1.png").filename, "scans/page1.png");
    EXPECT_EQ(MediaItem::parse("..hidden.jpg").filename, "..hidden.jpg");
}

TEST(MediaSetTest, KeepsInsertionOrderAndUniqueNames) {
    MediaSet set;
    EXPECT_TRUE(set.add({"b.jpg", std::nullopt}));
    EXPECT_TRUE(set.add({"a.jpg", std::string("200")}));
    EXPECT_FALSE(set.add({"b.jpg", std::string("100")}));

    ASSERT_EQ(set.size(), 2u);
    EXPECT_EQ(set.filenames(), (std::vector<std::string>{"b.jpg", "a.jpg"}));
    EXPECT_TRUE(set.contains("a.jpg"));
    EXPECT_FALSE(set.contains("c.jpg"));
}

TEST(MediaSetTest, RemovesByPosition) {
    MediaSet set = makeSet({"a.jpg", "b.jpg", "c.jpg"});

    auto removed = set.removeAt(1);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->filename, "b.jpg");
    EXPECT_EQ(set.filenames(), (std::vector<std::string>{"a.jpg", "c.jpg"}));

    EXPECT_FALSE(set.removeAt(2).has_value());
    EXPECT_EQ(set.size(), 2u);
}

TEST(MediaSetTest, DiffReportsAddedAndRemovedNames) {
    MediaSet before = makeSet({"a.jpg", "b.jpg", "c.jpg"});
    MediaSet after = makeSet({"c.jpg", "d.jpg", "a.jpg"});

    auto diff = MediaSet::diff(before, after);
    EXPECT_EQ(diff.added, (std::vector<std::string>{"d.jpg"}));
    EXPECT_EQ(diff.removed, (std::vector<std::string>{"b.jpg"}));
}

TEST(MediaSetTest, DiffIgnoresOptionsAndOrder) {
    MediaSet before;
    before.add({"a.jpg", std::string("100")});
    before.add({"b.jpg", std::nullopt});

    MediaSet after;
    after.add({"b.jpg", std::string("400")});
    after.add({"a.jpg", std::nullopt});

    EXPECT_TRUE(MediaSet::diff(before, after).empty());
    EXPECT_NE(before, after);
}

TEST(PendingMediaTest, DeleteCancelsWrite) {
    PendingMedia pending;
    pending.queueWrite("a.jpg", "bytes");
    ASSERT_TRUE(pending.hasWrite("a.jpg"));

    pending.queueDelete("a.jpg");
    EXPECT_FALSE(pending.hasWrite("a.jpg"));
    EXPECT_FALSE(pending.pendingBytes("a.jpg").has_value());
    EXPECT_EQ(pending.deletes().count("a.jpg"), 1u);
}

TEST(PendingMediaTest, WriteCancelsDelete) {
    PendingMedia pending;
    pending.queueDelete("a.jpg");
    pending.queueWrite("a.jpg", "new bytes");

    EXPECT_TRUE(pending.deletes().empty());
    ASSERT_TRUE(pending.pendingBytes("a.jpg").has_value());
    EXPECT_EQ(*pending.pendingBytes("a.jpg"), "new bytes");

    pending.clear();
    EXPECT_TRUE(pending.empty());
}
