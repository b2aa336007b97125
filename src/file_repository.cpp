#include "file_repository.hpp"
#include "forward_line_reader.hpp"
#include "logger.hpp"
#include "pager_exceptions.hpp"
#include "reverse_line_reader.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>

namespace logpager {

namespace {

bool hasExtension(const std::string &name, const std::string &extension) {
  return name.size() >= extension.size() &&
         name.compare(name.size() - extension.size(), extension.size(),
                      extension) == 0;
}

} // namespace

FileRepository::FileRepository(std::filesystem::path rootPath,
                               std::string extension,
                               LineReaderOptions readerOptions)
    : rootPath_(std::move(rootPath)), extension_(std::move(extension)),
      readerOptions_(readerOptions) {}

std::vector<FileEntry> FileRepository::listFiles() const {
  std::error_code ec;
  std::filesystem::directory_iterator it(rootPath_, ec);
  if (ec) {
    REPO_LOG_ERROR("Cannot list directory {}: {}", rootPath_.string(),
                   ec.message());
    throw SystemException(ErrorCode::FILE_ERROR,
                          "Cannot list directory: " + rootPath_.string(),
                          "FileRepository",
                          {{"path", rootPath_.string()},
                           {"reason", ec.message()}});
  }

  std::vector<FileEntry> files;
  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    const auto &entry = *it;
    std::error_code entryEc;
    if (!entry.is_regular_file(entryEc)) {
      continue;
    }
    std::string name = entry.path().filename().string();
    if (!hasExtension(name, extension_)) {
      continue;
    }
    const auto size = entry.file_size(entryEc);
    files.push_back(
        {std::move(name), entryEc ? 0 : static_cast<std::int64_t>(size)});
  }
  if (ec) {
    throw SystemException(ErrorCode::FILE_ERROR,
                          "Directory listing interrupted: " +
                              rootPath_.string(),
                          "FileRepository", {{"reason", ec.message()}});
  }

  std::sort(files.begin(), files.end(),
            [](const FileEntry &a, const FileEntry &b) {
              return a.name < b.name;
            });

  REPO_LOG_DEBUG("Listed {} files in {}", files.size(), rootPath_.string());
  return files;
}

void FileRepository::listFilesAsync(
    const boost::asio::any_io_executor &executor,
    FileListHandler handler) const {
  boost::asio::post(executor, [repository = *this,
                               handler = std::move(handler)]() {
    std::vector<FileEntry> files;
    std::exception_ptr error;
    try {
      files = repository.listFiles();
    } catch (const std::exception &) {
      error = std::current_exception();
    }
    handler(error, std::move(files));
  });
}

std::optional<std::filesystem::path>
FileRepository::resolvePath(const std::string &id) const {
  if (id.empty() || id.find('/') != std::string::npos ||
      id.find('\\') != std::string::npos) {
    return std::nullopt;
  }

  for (const auto &file : listFiles()) {
    if (file.name == id) {
      return rootPath_ / file.name;
    }
  }
  return std::nullopt;
}

std::int64_t FileRepository::fileLength(const std::filesystem::path &path) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    throw SystemException(ErrorCode::FILE_ERROR,
                          "Cannot read size of " + path.string(),
                          "FileRepository",
                          {{"path", path.string()}, {"reason", ec.message()}});
  }
  return static_cast<std::int64_t>(size);
}

void FileRepository::readLines(PageContext &context) const {
  if (context.count < 0) {
    throw ValidationException(ErrorCode::INVALID_RANGE,
                              "Line count must not be negative", "count",
                              std::to_string(context.count));
  }
  context.lines.clear();

  if (context.backward) {
    ReverseLineReader reader(context.path, readerOptions_);
    context.bottom = reader.seek(context.top, SeekOrigin::Begin);
    while (static_cast<int>(context.lines.size()) < context.count &&
           !reader.endOfStream()) {
      if (auto line = reader.readLine()) {
        context.lines.push_back(std::move(*line));
      }
    }
    context.top = reader.position();
    std::reverse(context.lines.begin(), context.lines.end());
  } else {
    ForwardLineReader reader(context.path, readerOptions_);
    context.top = reader.seek(context.bottom, SeekOrigin::Begin);
    while (static_cast<int>(context.lines.size()) < context.count &&
           !reader.endOfStream()) {
      if (auto line = reader.readLine()) {
        context.lines.push_back(std::move(*line));
      }
    }
    context.bottom = reader.position();
  }

  REPO_LOG_DEBUG("Read {} lines {} from {} [{}, {})", context.lines.size(),
                 context.backward ? "backward" : "forward", context.path,
                 context.top, context.bottom);
}

} // namespace logpager
