#pragma once

#include "config_manager.hpp"
#include "file_repository.hpp"
#include "page_models.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <exception>
#include <functional>
#include <vector>

namespace logpager {

using PageHandler = std::function<void(std::exception_ptr, PageData)>;

/**
 * PageReader - Stateless First/Last/Next/Prev navigation over the files of
 * one root directory.
 *
 * Every call resolves page.id, opens the file, reads at most page.count lines
 * and closes it again. Calls are chained purely through page.top and
 * page.bottom; nothing is remembered between them, so one reader may serve
 * any number of threads.
 *
 * The *Async forms run the same work on the given executor and hand the
 * result (or the exception) to the handler.
 */
class PageReader {
public:
  explicit PageReader(PagerConfig config = {});

  PageData &readFirst(PageData &page) const;
  PageData &readLast(PageData &page) const;
  PageData &readNext(PageData &page, bool backward = false) const;
  PageData &readPrev(PageData &page) const;

  std::vector<FileEntry> listFiles() const;

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
                      FileListHandler handler) const;

  /**
   * One navigation step. MostRecentFirst mirrors the file: the physically
   * last line comes first, top and bottom trade places, and each move runs
   * as its opposite over the natural order.
   */
  PageData &navigate(PageData &page, PageMove move, PageOrder order) const;
  void navigateAsync(const boost::asio::any_io_executor &executor,
                     PageData page, PageMove move, PageOrder order,
                     PageHandler handler) const;

  const PagerConfig &config() const { return config_; }
  const FileRepository &repository() const { return repository_; }

private:
  PagerConfig config_;
  FileRepository repository_;

  void readNatural(PageData &page, PageMove move) const;
};

PageMove oppositeMove(PageMove move);
const char *pageMoveName(PageMove move);

} // namespace logpager
