#pragma once

#include "line_reader.hpp"
#include "page_models.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <exception>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace logpager {

using FileListHandler =
    std::function<void(std::exception_ptr, std::vector<FileEntry>)>;

/**
 * FileRepository - A folder of text files viewed as a data source.
 *
 * Holds no open handles between calls; every readLines() opens the file,
 * reads, and closes it again.
 */
class FileRepository {
public:
  explicit FileRepository(std::filesystem::path rootPath,
                          std::string extension = ".txt",
                          LineReaderOptions readerOptions = {});

  // Regular files in the root whose name ends with the extension, by name
  std::vector<FileEntry> listFiles() const;
  void listFilesAsync(const boost::asio::any_io_executor &executor,
                      FileListHandler handler) const;

  // Exact basename match; ids carrying a path never match
  std::optional<std::filesystem::path> resolvePath(const std::string &id) const;

  static std::int64_t fileLength(const std::filesystem::path &path);

  /**
   * Reads up to context.count lines.
   *
   * Backward reads start at context.top, set context.bottom to the start
   * position and context.top to the offset of the first returned line; the
   * lines come back in file order. Forward reads start at context.bottom and
   * move it past the last returned line.
   */
  void readLines(PageContext &context) const;

  const std::filesystem::path &rootPath() const { return rootPath_; }
  const std::string &extension() const { return extension_; }

private:
  std::filesystem::path rootPath_;
  std::string extension_;
  LineReaderOptions readerOptions_;
};

} // namespace logpager
