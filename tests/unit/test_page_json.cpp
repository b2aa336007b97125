#include "page_json.hpp"
#include "pager_exceptions.hpp"
#include <gtest/gtest.h>

using namespace logpager;
using nlohmann::json;

TEST(PageOffsetTest, FactoriesFoldEndsIntoBoundary) {
  EXPECT_TRUE(PageOffset().isBoundary());
  EXPECT_TRUE(PageOffset::top(0).isBoundary());
  EXPECT_EQ(PageOffset::top(96), PageOffset::at(96));
  EXPECT_TRUE(PageOffset::bottom(800, 800).isBoundary());
  EXPECT_TRUE(PageOffset::bottom(900, 800).isBoundary());
  EXPECT_EQ(PageOffset::bottom(64, 800).value(), 64);
  EXPECT_EQ(PageOffset::boundary().valueOr(-1), -1);
}

TEST(PageJsonTest, BoundarySerializesAsNull) {
  PageData page;
  page.id = "app.txt";
  page.count = 3;
  page.bottom = PageOffset::at(96);
  page.lines = {"a", "b", "c"};

  const json j = page;
  EXPECT_TRUE(j["top"].is_null());
  EXPECT_EQ(j["bottom"], 96);
  EXPECT_EQ(j["id"], "app.txt");
  EXPECT_EQ(j["count"], 3);
  EXPECT_EQ(j["lines"].size(), 3u);
}

TEST(PageJsonTest, ZeroIsAnExactOffset) {
  const auto page =
      json::parse(R"({"id":"a.txt","count":5,"top":0,"bottom":160})")
          .get<PageData>();
  EXPECT_EQ(page.id, "a.txt");
  EXPECT_EQ(page.count, 5);
  EXPECT_EQ(page.top, PageOffset::at(0));
  EXPECT_EQ(page.bottom, PageOffset::at(160));
  EXPECT_TRUE(page.lines.empty());
}

TEST(PageJsonTest, OffsetsSurviveSerialization) {
  for (const auto &offset : {PageOffset::boundary(), PageOffset::at(0),
                             PageOffset::at(1), PageOffset::at(4096)}) {
    const json j = offset;
    EXPECT_EQ(j.get<PageOffset>(), offset) << j.dump();
  }
}

TEST(PageJsonTest, MissingOffsetsAreBoundary) {
  const auto page = json::parse(R"({"id":"a.txt","count":5})").get<PageData>();
  EXPECT_TRUE(page.top.isBoundary());
  EXPECT_TRUE(page.bottom.isBoundary());
}

TEST(PageJsonTest, RejectsNegativeOrNonIntegerOffsets) {
  EXPECT_THROW(json::parse(R"({"top":-4})").get<PageData>(),
               ValidationException);
  EXPECT_THROW(json::parse(R"({"top":"12"})").get<PageData>(),
               ValidationException);
}

TEST(PageJsonTest, FileEntrySerializes) {
  const json j = FileEntry{"app.txt", 800};
  EXPECT_EQ(j, json::parse(R"({"name":"app.txt","length":800})"));
}

TEST(ParseOffsetTest, QueryForms) {
  EXPECT_TRUE(parseOffset("", "top").isBoundary());
  EXPECT_TRUE(parseOffset("null", "top").isBoundary());
  EXPECT_EQ(parseOffset("0", "bottom"), PageOffset::at(0));
  EXPECT_EQ(parseOffset("4096", "top"), PageOffset::at(4096));
}

TEST(ParseOffsetTest, RejectsGarbage) {
  for (const std::string text : {"-1", "12x", "abc", " 5"}) {
    try {
      parseOffset(text, "bottom");
      FAIL() << "Expected ValidationException for " << text;
    } catch (const ValidationException &e) {
      EXPECT_EQ(e.getField(), "bottom");
      EXPECT_EQ(e.getValue(), text);
    }
  }
}

TEST(PageControlsTest, DisabledAtBoundaries) {
  PageData page;
  page.bottom = PageOffset::at(96);
  EXPECT_EQ(pageControls(page),
            json::parse(
                R"({"first":false,"prev":false,"next":true,"last":true})"));

  page.top = PageOffset::at(32);
  page.bottom = PageOffset::boundary();
  EXPECT_EQ(pageControls(page),
            json::parse(
                R"({"first":true,"prev":true,"next":false,"last":false})"));
}
