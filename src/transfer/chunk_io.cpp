#include "transfer/chunk_io.hpp"
#include "transfer/transfer_error.hpp"
#include <boost/log/trivial.hpp>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace jsxfer {
namespace transfer {

//==============================================
// CHUNK SOURCE
//==============================================

ChunkSource::ChunkSource(const std::filesystem::path& path, std::size_t chunk_size)
  : path_(path)
  , chunk_size_(chunk_size) {

  if (chunk_size_ == 0) {
    throw std::invalid_argument("Chunk source: chunk size must be > 0");
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path_, ec)) {
    BOOST_LOG_TRIVIAL(error) << "Chunk source: Not a regular file: " << path_.string();
    throw TransferError(TransferErrorCode::FILE_OPEN_FAILED,
                        "Error opening \"" + path_.string() + "\": no such regular file");
  }

  file_.open(path_, std::ios::binary);
  if (!file_) {
    BOOST_LOG_TRIVIAL(error) << "Chunk source: Failed to open file: " << path_.string();
    throw TransferError(TransferErrorCode::FILE_OPEN_FAILED,
                        "Error opening \"" + path_.string() + "\"");
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunk source: Opened " << path_.string()
                           << " with chunk size " << chunk_size_;
}

bool ChunkSource::next(std::vector<char>& chunk) {
  chunk.resize(chunk_size_);
  file_.read(chunk.data(), static_cast<std::streamsize>(chunk_size_));
  const auto count = file_.gcount();

  if (file_.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Chunk source: Read error on " << path_.string();
    throw TransferError(TransferErrorCode::FILE_READ_FAILED, "Error reading \"" + path_.string() + "\"");
  }

  chunk.resize(static_cast<std::size_t>(count));
  if (count <= 0) {
    return false;
  }

  bytes_read_ += static_cast<std::uint64_t>(count);
  return true;
}

//==============================================
// CHUNK SINK
//==============================================

ChunkSink::ChunkSink(const std::filesystem::path& path) : path_(path) {
  // "x" fails with EEXIST if anything, even a dangling symlink, already sits at the path
  errno = 0;
  file_.reset(std::fopen(path_.c_str(), "wbx"));
  if (!file_) {
    if (errno == EEXIST) {
      BOOST_LOG_TRIVIAL(error) << "Chunk sink: Destination already exists: " << path_.string();
      throw TransferError(TransferErrorCode::DESTINATION_EXISTS, path_.string());
    }
    BOOST_LOG_TRIVIAL(error) << "Chunk sink: Failed to create file: " << path_.string() << ": "
                             << std::strerror(errno);
    throw TransferError(TransferErrorCode::FILE_OPEN_FAILED,
                        "Error creating file \"" + path_.string() + "\"");
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunk sink: Created " << path_.string();
}

void ChunkSink::write(const char* data, std::size_t size) {
  if (size == 0) {
    return;
  }
  if (!file_ || std::fwrite(data, 1, size, file_.get()) != size) {
    BOOST_LOG_TRIVIAL(error) << "Chunk sink: Write error on " << path_.string();
    throw TransferError(TransferErrorCode::FILE_WRITE_FAILED, "Error writing \"" + path_.string() + "\"");
  }
  bytes_written_ += size;
}

void ChunkSink::close() {
  if (!file_) {
    return;
  }

  const bool flushed = std::fflush(file_.get()) == 0;
  const bool closed = std::fclose(file_.release()) == 0;
  if (!flushed || !closed) {
    throw TransferError(TransferErrorCode::FILE_WRITE_FAILED, "Error closing \"" + path_.string() + "\"");
  }
  BOOST_LOG_TRIVIAL(debug) << "Chunk sink: Closed " << path_.string() << " after " << bytes_written_ << " bytes";
}

} // namespace transfer
} // namespace jsxfer
