#pragma once

#include "page_reader.hpp"

namespace logpager {

/**
 * LogPageReader - Most-recent-first view of a log file.
 *
 * First returns the newest lines (newest at index 0) and Next walks toward
 * older ones. top/bottom are the natural offsets with their roles exchanged,
 * so a Boundary top means nothing newer exists.
 */
class LogPageReader {
public:
  explicit LogPageReader(PagerConfig config = {});
  explicit LogPageReader(PageReader reader);

  PageData &readFirst(PageData &page) const;
  PageData &readLast(PageData &page) const;
  PageData &readNext(PageData &page, bool backward = false) const;
  PageData &readPrev(PageData &page) const;

  std::vector<FileEntry> listFiles() const { return reader_.listFiles(); }

  void readFirstAsync(const boost::asio::any_io_executor &executor,
                      PageData page, PageHandler handler) const;
  void readLastAsync(const boost::asio::any_io_executor &executor,
                     PageData page, PageHandler handler) const;
  void readNextAsync(const boost::asio::any_io_executor &executor,
                     PageData page, PageHandler handler,
                     bool backward = false) const;
  void readPrevAsync(const boost::asio::any_io_executor &executor,
                     PageData page, PageHandler handler) const;
  void listFilesAsync(const boost::asio::any_io_executor &executor,
                      FileListHandler handler) const {
    reader_.listFilesAsync(executor, std::move(handler));
  }

private:
  PageReader reader_;
};

} // namespace logpager
