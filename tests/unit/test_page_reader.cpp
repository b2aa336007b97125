#include "page_json.hpp"
#include "page_reader.hpp"
#include "pager_exceptions.hpp"
#include "test_support.hpp"
#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

using namespace logpager;

namespace {

constexpr int kLines = 25;
constexpr std::int64_t L = 32; // "%04d lorem ipsum dolor sit amet\n"

} // namespace

class PageReaderTest : public ::testing::Test {
protected:
  void SetUp() override {
    lines_ = test::loremLines(kLines);
    dir_.write("lorem.txt", test::joinLines(lines_));

    PagerConfig config;
    config.rootPath = dir_.path().string();
    config.bufferSize = 128;
    reader_ = std::make_unique<PageReader>(config);
  }

  PageData request(int count) const {
    PageData page;
    page.id = "lorem.txt";
    page.count = count;
    return page;
  }

  test::TempDirectory dir_;
  std::vector<std::string> lines_;
  std::unique_ptr<PageReader> reader_;
};

TEST_F(PageReaderTest, FirstPage) {
  auto page = request(3);
  reader_->readFirst(page);

  EXPECT_TRUE(page.top.isBoundary());
  EXPECT_EQ(page.bottom, PageOffset::at(3 * L));
  EXPECT_EQ(page.lines, test::slice(lines_, 1, 3));
}

TEST_F(PageReaderTest, LastPage) {
  auto page = request(3);
  reader_->readLast(page);

  EXPECT_EQ(page.top, PageOffset::at((kLines - 3) * L));
  EXPECT_TRUE(page.bottom.isBoundary());
  EXPECT_EQ(page.lines, test::slice(lines_, 23, 25));
}

TEST_F(PageReaderTest, NextAfterFirst) {
  auto page = request(10);
  reader_->readFirst(page);
  page.count = 3;
  reader_->readNext(page);

  EXPECT_EQ(page.top, PageOffset::at(10 * L));
  EXPECT_EQ(page.bottom, PageOffset::at(13 * L));
  EXPECT_EQ(page.lines, test::slice(lines_, 11, 13));
}

TEST_F(PageReaderTest, ForwardContiguity) {
  for (int k = 1; k < kLines; k += 4) {
    for (int m = 1; m <= 6; ++m) {
      auto page = request(k);
      reader_->readFirst(page);
      const auto firstBottom = page.bottom;

      page.count = m;
      reader_->readNext(page);

      const int last = std::min(k + m, kLines);
      EXPECT_EQ(page.top, firstBottom) << "k=" << k << " m=" << m;
      EXPECT_EQ(page.lines, test::slice(lines_, k + 1, last))
          << "k=" << k << " m=" << m;
    }
  }
}

TEST_F(PageReaderTest, BackwardContiguity) {
  for (int k = 1; k < kLines; k += 4) {
    for (int m = 1; m <= 6; ++m) {
      auto page = request(k);
      reader_->readLast(page);
      const auto lastTop = page.top;

      page.count = m;
      reader_->readPrev(page);

      const int first = std::max(kLines - k - m + 1, 1);
      EXPECT_EQ(page.bottom, lastTop) << "k=" << k << " m=" << m;
      EXPECT_EQ(page.lines, test::slice(lines_, first, kLines - k))
          << "k=" << k << " m=" << m;
    }
  }
}

TEST_F(PageReaderTest, PagesReachingTheOppositeEndReportBoundary) {
  auto page = request(kLines);
  reader_->readFirst(page);
  EXPECT_TRUE(page.top.isBoundary());
  EXPECT_TRUE(page.bottom.isBoundary());
  EXPECT_EQ(page.lines, lines_);

  page = request(kLines + 5);
  reader_->readLast(page);
  EXPECT_TRUE(page.top.isBoundary());
  EXPECT_TRUE(page.bottom.isBoundary());
  EXPECT_EQ(page.lines, lines_);

  page = request(5);
  reader_->readLast(page);
  while (!page.top.isBoundary()) {
    reader_->readPrev(page);
  }
  EXPECT_EQ(page.lines, test::slice(lines_, 1, 5));
}

TEST_F(PageReaderTest, WalkingForwardVisitsEveryLineOnce) {
  auto page = request(4);
  reader_->readFirst(page);
  std::vector<std::string> seen = page.lines;
  while (!page.bottom.isBoundary()) {
    reader_->readNext(page);
    seen.insert(seen.end(), page.lines.begin(), page.lines.end());
  }
  EXPECT_EQ(seen, lines_);
}

TEST_F(PageReaderTest, RepeatedRequestIsIdempotent) {
  auto page = request(4);
  reader_->readFirst(page);
  reader_->readNext(page);

  PageData again = page;
  auto once = again;
  reader_->readNext(once);
  auto twice = again;
  reader_->readNext(twice);

  EXPECT_EQ(once.lines, twice.lines);
  EXPECT_EQ(once.top, twice.top);
  EXPECT_EQ(once.bottom, twice.bottom);
}

TEST_F(PageReaderTest, LineTerminatorsDoNotChangeLines) {
  dir_.write("crlf.txt", test::joinLines(lines_, "\r\n"));
  dir_.write("cr.txt", test::joinLines(lines_, "\r"));

  for (const std::string id : {"lorem.txt", "crlf.txt", "cr.txt"}) {
    PageData page;
    page.id = id;
    page.count = 7;
    reader_->readLast(page);
    reader_->readPrev(page);
    EXPECT_EQ(page.lines, test::slice(lines_, 12, 18)) << id;

    page.count = 3;
    reader_->readFirst(page);
    reader_->readNext(page);
    EXPECT_EQ(page.lines, test::slice(lines_, 4, 6)) << id;
  }
}

TEST_F(PageReaderTest, EncodedFilesGiveSameLines) {
  std::u16string text16;
  std::u32string text32;
  for (const auto &line : lines_) {
    text16 += std::u16string(line.begin(), line.end()) + u"\n";
    text32 += std::u32string(line.begin(), line.end()) + U"\n";
  }
  dir_.write("le16.txt", std::string("\xFF\xFE", 2) + test::toUtf16(text16, false));
  dir_.write("be16.txt", std::string("\xFE\xFF", 2) + test::toUtf16(text16, true));
  dir_.write("le32.txt",
             std::string("\xFF\xFE\0\0", 4) + test::toUtf32(text32, false));

  for (const std::string id : {"le16.txt", "be16.txt", "le32.txt"}) {
    PageData page;
    page.id = id;
    page.count = 3;
    reader_->readLast(page);
    EXPECT_EQ(page.lines, test::slice(lines_, 23, 25)) << id;
    reader_->readPrev(page);
    EXPECT_EQ(page.lines, test::slice(lines_, 20, 22)) << id;

    reader_->readFirst(page);
    EXPECT_EQ(page.lines, test::slice(lines_, 1, 3)) << id;
    reader_->readNext(page);
    EXPECT_EQ(page.lines, test::slice(lines_, 4, 6)) << id;
  }
}

TEST_F(PageReaderTest, NextWithBackwardFlagMatchesPrev) {
  auto page = request(5);
  reader_->readLast(page);
  auto viaPrev = page;
  reader_->readPrev(viaPrev);
  reader_->readNext(page, true);

  EXPECT_EQ(page.lines, viaPrev.lines);
  EXPECT_EQ(page.top, viaPrev.top);
  EXPECT_EQ(page.bottom, viaPrev.bottom);
}

TEST_F(PageReaderTest, EmptyFileGivesEmptyBoundaryPage) {
  dir_.write("empty.txt", "");
  PageData page;
  page.id = "empty.txt";
  page.count = 5;

  reader_->readFirst(page);
  EXPECT_TRUE(page.lines.empty());
  EXPECT_TRUE(page.top.isBoundary());
  EXPECT_TRUE(page.bottom.isBoundary());

  reader_->readLast(page);
  EXPECT_TRUE(page.lines.empty());
}

TEST_F(PageReaderTest, UnknownIdThrowsNotFound) {
  PageData page;
  page.id = "missing.txt";
  page.count = 3;
  try {
    reader_->readFirst(page);
    FAIL() << "Expected NotFoundException";
  } catch (const NotFoundException &e) {
    EXPECT_EQ(e.getResourceId(), "missing.txt");
    EXPECT_EQ(e.getCode(), ErrorCode::FILE_NOT_FOUND);
  }
}

TEST_F(PageReaderTest, NegativeCountIsRejected) {
  auto page = request(-1);
  EXPECT_THROW(reader_->readFirst(page), ValidationException);
}

TEST_F(PageReaderTest, ListFilesReportsLengths) {
  const auto files = reader_->listFiles();
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(files[0].name, "lorem.txt");
  EXPECT_EQ(files[0].length, kLines * L);
}

TEST_F(PageReaderTest, AsyncFormsMatchBlockingForms) {
  boost::asio::io_context ioc;

  auto expectedFirst = request(4);
  reader_->readFirst(expectedFirst);
  auto expectedNext = expectedFirst;
  reader_->readNext(expectedNext);
  auto expectedLast = request(4);
  reader_->readLast(expectedLast);
  auto expectedPrev = expectedLast;
  reader_->readPrev(expectedPrev);

  std::vector<PageData> results(4);
  std::vector<std::exception_ptr> errors(4);
  auto capture = [&](std::size_t slot) {
    return [&, slot](std::exception_ptr e, PageData page) {
      errors[slot] = e;
      results[slot] = std::move(page);
    };
  };

  reader_->readFirstAsync(ioc.get_executor(), request(4), capture(0));
  reader_->readNextAsync(ioc.get_executor(), expectedFirst, capture(1));
  reader_->readLastAsync(ioc.get_executor(), request(4), capture(2));
  reader_->readPrevAsync(ioc.get_executor(), expectedLast, capture(3));
  ioc.run();

  for (const auto &error : errors) {
    EXPECT_FALSE(error);
  }
  EXPECT_EQ(results[0].lines, expectedFirst.lines);
  EXPECT_EQ(results[0].bottom, expectedFirst.bottom);
  EXPECT_EQ(results[1].lines, expectedNext.lines);
  EXPECT_EQ(results[1].top, expectedNext.top);
  EXPECT_EQ(results[2].lines, expectedLast.lines);
  EXPECT_EQ(results[2].top, expectedLast.top);
  EXPECT_EQ(results[3].lines, expectedPrev.lines);
  EXPECT_EQ(results[3].bottom, expectedPrev.bottom);
}

TEST_F(PageReaderTest, AsyncFailureReachesHandler) {
  boost::asio::io_context ioc;
  PageData page;
  page.id = "missing.txt";
  page.count = 1;

  std::exception_ptr error;
  reader_->readFirstAsync(ioc.get_executor(), page,
                          [&](std::exception_ptr e, PageData) { error = e; });
  ioc.run();

  ASSERT_TRUE(error);
  EXPECT_THROW(std::rethrow_exception(error), NotFoundException);
}

TEST_F(PageReaderTest, PrevFromFirstPageEndsAtOffsetZero) {
  auto page = request(1);
  reader_->readFirst(page);
  reader_->readPrev(page);

  EXPECT_TRUE(page.top.isBoundary());
  EXPECT_EQ(page.bottom, PageOffset::at(0));
  EXPECT_TRUE(page.lines.empty());

  reader_->readNext(page);
  EXPECT_EQ(page.lines, test::slice(lines_, 1, 1));
}

TEST_F(PageReaderTest, JsonRoundTripKeepsNavigation) {
  const PageOrder orders[] = {PageOrder::Natural, PageOrder::MostRecentFirst};

  std::vector<PageData> responses;
  for (const auto order : orders) {
    for (const int count : {0, 1, 3}) {
      auto first = request(count);
      reader_->navigate(first, PageMove::First, order);
      auto last = request(count);
      reader_->navigate(last, PageMove::Last, order);

      auto beforeFirst = first;
      reader_->navigate(beforeFirst, PageMove::Prev, order);
      auto afterFirst = first;
      reader_->navigate(afterFirst, PageMove::Next, order);
      auto afterLast = last;
      reader_->navigate(afterLast, PageMove::Next, order);

      responses.insert(responses.end(),
                       {first, last, beforeFirst, afterFirst, afterLast});
    }
  }

  for (const auto &response : responses) {
    const nlohmann::json wire = response;
    for (const auto order : orders) {
      for (const auto move : {PageMove::Next, PageMove::Prev}) {
        PageData direct = response;
        reader_->navigate(direct, move, order);
        PageData parsed = wire.get<PageData>();
        reader_->navigate(parsed, move, order);

        EXPECT_EQ(parsed.lines, direct.lines)
            << wire.dump() << " " << pageMoveName(move);
        EXPECT_EQ(parsed.top, direct.top) << wire.dump();
        EXPECT_EQ(parsed.bottom, direct.bottom) << wire.dump();
      }
    }
  }
}

TEST(PageMoveTest, OppositeMovesPairUp) {
  EXPECT_EQ(oppositeMove(PageMove::First), PageMove::Last);
  EXPECT_EQ(oppositeMove(PageMove::Last), PageMove::First);
  EXPECT_EQ(oppositeMove(PageMove::Next), PageMove::Prev);
  EXPECT_EQ(oppositeMove(PageMove::Prev), PageMove::Next);
  EXPECT_STREQ(pageMoveName(PageMove::Prev), "prev");
}
