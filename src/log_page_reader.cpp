#include "log_page_reader.hpp"

namespace logpager {

LogPageReader::LogPageReader(PagerConfig config)
    : reader_(std::move(config)) {}

LogPageReader::LogPageReader(PageReader reader) : reader_(std::move(reader)) {}

PageData &LogPageReader::readFirst(PageData &page) const {
  return reader_.navigate(page, PageMove::First, PageOrder::MostRecentFirst);
}

PageData &LogPageReader::readLast(PageData &page) const {
  return reader_.navigate(page, PageMove::Last, PageOrder::MostRecentFirst);
}

PageData &LogPageReader::readNext(PageData &page, bool backward) const {
  return reader_.navigate(page, backward ? PageMove::Prev : PageMove::Next,
                          PageOrder::MostRecentFirst);
}

PageData &LogPageReader::readPrev(PageData &page) const {
  return readNext(page, true);
}

void LogPageReader::readFirstAsync(const boost::asio::any_io_executor &executor,
                                   PageData page, PageHandler handler) const {
  reader_.navigateAsync(executor, std::move(page), PageMove::First,
                        PageOrder::MostRecentFirst, std::move(handler));
}

void LogPageReader::readLastAsync(const boost::asio::any_io_executor &executor,
                                  PageData page, PageHandler handler) const {
  reader_.navigateAsync(executor, std::move(page), PageMove::Last,
                        PageOrder::MostRecentFirst, std::move(handler));
}

void LogPageReader::readNextAsync(const boost::asio::any_io_executor &executor,
                                  PageData page, PageHandler handler,
                                  bool backward) const {
  reader_.navigateAsync(executor, std::move(page),
                        backward ? PageMove::Prev : PageMove::Next,
                        PageOrder::MostRecentFirst, std::move(handler));
}

void LogPageReader::readPrevAsync(const boost::asio::any_io_executor &executor,
                                  PageData page, PageHandler handler) const {
  readNextAsync(executor, std::move(page), std::move(handler), true);
}

} // namespace logpager
