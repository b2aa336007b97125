#include "file_repository.hpp"
#include "pager_exceptions.hpp"
#include "test_support.hpp"
#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

using namespace logpager;

class FileRepositoryTest : public ::testing::Test {
protected:
  void SetUp() override {
    lines_ = test::loremLines(25);
    dir_.write("app.txt", test::joinLines(lines_));
    dir_.write("empty.txt", "");
    dir_.write("notes.md", "ignored\n");
    std::filesystem::create_directory(dir_.path() / "nested.txt");
  }

  test::TempDirectory dir_;
  std::vector<std::string> lines_;
};

TEST_F(FileRepositoryTest, ListsOnlyMatchingRegularFilesSortedByName) {
  FileRepository repository(dir_.path());
  const auto files = repository.listFiles();

  ASSERT_EQ(files.size(), 2u);
  EXPECT_EQ(files[0].name, "app.txt");
  EXPECT_EQ(files[0].length, 25 * 32);
  EXPECT_EQ(files[1].name, "empty.txt");
  EXPECT_EQ(files[1].length, 0);
}

TEST_F(FileRepositoryTest, ExtensionFilterIsConfigurable) {
  FileRepository repository(dir_.path(), ".md");
  const auto files = repository.listFiles();
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(files[0].name, "notes.md");
}

TEST_F(FileRepositoryTest, MissingRootThrowsSystemException) {
  FileRepository repository(dir_.path() / "missing");
  try {
    repository.listFiles();
    FAIL() << "Expected SystemException";
  } catch (const SystemException &e) {
    EXPECT_EQ(e.getCode(), ErrorCode::FILE_ERROR);
    EXPECT_EQ(e.getComponent(), "FileRepository");
  }
}

TEST_F(FileRepositoryTest, ResolvePathMatchesExactBasename) {
  FileRepository repository(dir_.path());

  auto path = repository.resolvePath("app.txt");
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(*path, dir_.path() / "app.txt");

  EXPECT_FALSE(repository.resolvePath("app").has_value());
  EXPECT_FALSE(repository.resolvePath("APP.TXT").has_value());
  EXPECT_FALSE(repository.resolvePath("notes.md").has_value());
  EXPECT_FALSE(repository.resolvePath("").has_value());
  EXPECT_FALSE(repository.resolvePath("../app.txt").has_value());
  EXPECT_FALSE(repository.resolvePath("nested.txt").has_value());
}

TEST_F(FileRepositoryTest, ForwardReadMovesBottom) {
  FileRepository repository(dir_.path());
  PageContext context;
  context.path = (dir_.path() / "app.txt").string();
  context.count = 3;
  context.bottom = 32;

  repository.readLines(context);

  EXPECT_EQ(context.lines, test::slice(lines_, 2, 4));
  EXPECT_EQ(context.top, 32);
  EXPECT_EQ(context.bottom, 4 * 32);
}

TEST_F(FileRepositoryTest, BackwardReadReturnsLinesInFileOrder) {
  FileRepository repository(dir_.path());
  PageContext context;
  context.path = (dir_.path() / "app.txt").string();
  context.count = 4;
  context.backward = true;
  context.top = 10 * 32;

  repository.readLines(context);

  EXPECT_EQ(context.lines, test::slice(lines_, 7, 10));
  EXPECT_EQ(context.top, 6 * 32);
  EXPECT_EQ(context.bottom, 10 * 32);
}

TEST_F(FileRepositoryTest, ReadStopsAtEitherEnd) {
  FileRepository repository(dir_.path());
  PageContext context;
  context.path = (dir_.path() / "app.txt").string();
  context.count = 10;
  context.backward = true;
  context.top = 2 * 32;

  repository.readLines(context);
  EXPECT_EQ(context.lines, test::slice(lines_, 1, 2));
  EXPECT_EQ(context.top, 0);

  context.backward = false;
  context.bottom = 23 * 32;
  repository.readLines(context);
  EXPECT_EQ(context.lines, test::slice(lines_, 24, 25));
  EXPECT_EQ(context.bottom, 25 * 32);
}

TEST_F(FileRepositoryTest, ZeroCountReadsNothing) {
  FileRepository repository(dir_.path());
  PageContext context;
  context.path = (dir_.path() / "app.txt").string();
  context.count = 0;
  context.bottom = 64;

  repository.readLines(context);
  EXPECT_TRUE(context.lines.empty());
  EXPECT_EQ(context.top, 64);
  EXPECT_EQ(context.bottom, 64);
}

TEST_F(FileRepositoryTest, NegativeCountIsRejected) {
  FileRepository repository(dir_.path());
  PageContext context;
  context.path = (dir_.path() / "app.txt").string();
  context.count = -1;
  EXPECT_THROW(repository.readLines(context), ValidationException);
}

TEST_F(FileRepositoryTest, FileLengthOfMissingFileThrows) {
  EXPECT_EQ(FileRepository::fileLength(dir_.path() / "app.txt"), 25 * 32);
  EXPECT_THROW(FileRepository::fileLength(dir_.path() / "gone.txt"),
               SystemException);
}

TEST_F(FileRepositoryTest, ListFilesAsyncDeliversListing) {
  FileRepository repository(dir_.path());
  boost::asio::io_context ioc;

  std::vector<FileEntry> result;
  std::exception_ptr error;
  repository.listFilesAsync(ioc.get_executor(),
                            [&](std::exception_ptr e,
                                std::vector<FileEntry> files) {
                              error = e;
                              result = std::move(files);
                            });
  ioc.run();

  EXPECT_FALSE(error);
  ASSERT_EQ(result.size(), 2u);
  EXPECT_EQ(result[0].name, "app.txt");
}

TEST_F(FileRepositoryTest, ListFilesAsyncDeliversFailure) {
  FileRepository repository(dir_.path() / "missing");
  boost::asio::io_context ioc;

  std::exception_ptr error;
  repository.listFilesAsync(
      ioc.get_executor(),
      [&](std::exception_ptr e, std::vector<FileEntry>) { error = e; });
  ioc.run();

  ASSERT_TRUE(error);
  EXPECT_THROW(std::rethrow_exception(error), SystemException);
}
