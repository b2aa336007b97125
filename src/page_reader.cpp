#include "page_reader.hpp"
#include "logger.hpp"
#include "pager_exceptions.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>
#include <utility>

namespace logpager {

PageMove oppositeMove(PageMove move) {
  switch (move) {
  case PageMove::First:
    return PageMove::Last;
  case PageMove::Last:
    return PageMove::First;
  case PageMove::Next:
    return PageMove::Prev;
  case PageMove::Prev:
    return PageMove::Next;
  }
  return move;
}

const char *pageMoveName(PageMove move) {
  switch (move) {
  case PageMove::First:
    return "first";
  case PageMove::Last:
    return "last";
  case PageMove::Next:
    return "next";
  case PageMove::Prev:
    return "prev";
  }
  return "unknown";
}

PageReader::PageReader(PagerConfig config)
    : config_(std::move(config)),
      repository_(config_.rootPath, config_.extension,
                  config_.readerOptions()) {}

PageData &PageReader::readFirst(PageData &page) const {
  return navigate(page, PageMove::First, PageOrder::Natural);
}

PageData &PageReader::readLast(PageData &page) const {
  return navigate(page, PageMove::Last, PageOrder::Natural);
}

PageData &PageReader::readNext(PageData &page, bool backward) const {
  return navigate(page, backward ? PageMove::Prev : PageMove::Next,
                  PageOrder::Natural);
}

PageData &PageReader::readPrev(PageData &page) const {
  return readNext(page, true);
}

std::vector<FileEntry> PageReader::listFiles() const {
  return repository_.listFiles();
}

PageData &PageReader::navigate(PageData &page, PageMove move,
                               PageOrder order) const {
  if (order == PageOrder::Natural) {
    readNatural(page, move);
    return page;
  }

  // Work on a copy so a failed read leaves the caller's page untouched
  PageData mirrored = page;
  std::swap(mirrored.top, mirrored.bottom);
  readNatural(mirrored, oppositeMove(move));
  std::swap(mirrored.top, mirrored.bottom);
  std::reverse(mirrored.lines.begin(), mirrored.lines.end());
  page = std::move(mirrored);
  return page;
}

void PageReader::readNatural(PageData &page, PageMove move) const {
  if (page.count < 0) {
    throw ValidationException(ErrorCode::INVALID_RANGE,
                              "Line count must not be negative", "count",
                              std::to_string(page.count));
  }

  const auto path = repository_.resolvePath(page.id);
  if (!path) {
    PAGER_LOG_WARN("No file named '{}' under {}", page.id, config_.rootPath);
    throw NotFoundException(page.id, {{"root", config_.rootPath}});
  }

  const std::int64_t length = FileRepository::fileLength(*path);

  PageContext context;
  context.path = path->string();
  context.count = page.count;

  switch (move) {
  case PageMove::First:
    context.backward = false;
    context.bottom = 0;
    break;
  case PageMove::Last:
    context.backward = true;
    context.top = length;
    break;
  case PageMove::Next:
    context.backward = false;
    context.top = page.top.valueOr(0);
    context.bottom = page.bottom.isBoundary()
                         ? length
                         : std::min(page.bottom.value(), length);
    break;
  case PageMove::Prev:
    context.backward = true;
    context.top =
        page.top.isBoundary() ? 0 : std::min(page.top.value(), length);
    context.bottom = page.bottom.valueOr(length);
    break;
  }

  PAGER_LOG_DEBUG("{} {} count={} top={} bottom={}", pageMoveName(move),
                  page.id, page.count, context.top, context.bottom);

  repository_.readLines(context);

  page.top = PageOffset::top(context.top);
  page.bottom = PageOffset::bottom(context.bottom, length);
  page.lines = std::move(context.lines);
}

void PageReader::navigateAsync(const boost::asio::any_io_executor &executor,
                               PageData page, PageMove move, PageOrder order,
                               PageHandler handler) const {
  boost::asio::post(executor, [reader = *this, page = std::move(page), move,
                               order, handler = std::move(handler)]() mutable {
    std::exception_ptr error;
    try {
      reader.navigate(page, move, order);
    } catch (const PagerException &e) {
      PAGER_LOG_ERROR("Async {} failed: {}", pageMoveName(move),
                      e.toLogString());
      error = std::current_exception();
    } catch (const std::exception &e) {
      PAGER_LOG_ERROR("Async {} failed: {}", pageMoveName(move), e.what());
      error = std::current_exception();
    }
    handler(error, std::move(page));
  });
}

void PageReader::readFirstAsync(const boost::asio::any_io_executor &executor,
                                PageData page, PageHandler handler) const {
  navigateAsync(executor, std::move(page), PageMove::First, PageOrder::Natural,
                std::move(handler));
}

void PageReader::readLastAsync(const boost::asio::any_io_executor &executor,
                               PageData page, PageHandler handler) const {
  navigateAsync(executor, std::move(page), PageMove::Last, PageOrder::Natural,
                std::move(handler));
}

void PageReader::readNextAsync(const boost::asio::any_io_executor &executor,
                               PageData page, PageHandler handler,
                               bool backward) const {
  navigateAsync(executor, std::move(page),
                backward ? PageMove::Prev : PageMove::Next, PageOrder::Natural,
                std::move(handler));
}

void PageReader::readPrevAsync(const boost::asio::any_io_executor &executor,
                               PageData page, PageHandler handler) const {
  readNextAsync(executor, std::move(page), std::move(handler), true);
}

void PageReader::listFilesAsync(const boost::asio::any_io_executor &executor,
                                FileListHandler handler) const {
  repository_.listFilesAsync(executor, std::move(handler));
}

} // namespace logpager
