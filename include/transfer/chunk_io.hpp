#ifndef JSXFER_TRANSFER_CHUNK_IO_HPP
#define JSXFER_TRANSFER_CHUNK_IO_HPP

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

namespace jsxfer {
namespace transfer {

// 64 KiB keeps messages well under the broker's payload limit
constexpr std::size_t DEFAULT_CHUNK_SIZE = 64 * 1024;

class ChunkSource {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws TransferError(FILE_OPEN_FAILED) for missing, unreadable or non-regular files
  explicit ChunkSource(const std::filesystem::path& path, std::size_t chunk_size = DEFAULT_CHUNK_SIZE);

  ChunkSource(const ChunkSource&) = delete;
  ChunkSource& operator=(const ChunkSource&) = delete;


  // ---- READING ----
  // Fills chunk with up to chunk_size bytes; false once the file is exhausted
  bool next(std::vector<char>& chunk);


  // ---- GETTERS ----
  std::size_t chunk_size() const { return chunk_size_; }
  std::uint64_t bytes_read() const { return bytes_read_; }
  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
  std::size_t chunk_size_;
  std::ifstream file_;
  std::uint64_t bytes_read_{0};
};

class ChunkSink {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Creates the file exclusively; throws TransferError(DESTINATION_EXISTS) if the path is taken
  explicit ChunkSink(const std::filesystem::path& path);

  ChunkSink(const ChunkSink&) = delete;
  ChunkSink& operator=(const ChunkSink&) = delete;


  // ---- WRITING ----
  void write(const char* data, std::size_t size);
  void write(const std::vector<char>& chunk) { write(chunk.data(), chunk.size()); }
  // Flushes and closes; throws TransferError(FILE_WRITE_FAILED) on failure
  void close();


  // ---- GETTERS ----
  std::uint64_t bytes_written() const { return bytes_written_; }
  const std::filesystem::path& path() const { return path_; }

private:
  struct FileCloser {
    void operator()(std::FILE* file) const { std::fclose(file); }
  };

  std::filesystem::path path_;
  std::unique_ptr<std::FILE, FileCloser> file_;
  std::uint64_t bytes_written_{0};
};

} // namespace transfer
} // namespace jsxfer

#endif // JSXFER_TRANSFER_CHUNK_IO_HPP
