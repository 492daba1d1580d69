#pragma once

#include "types.hpp"
#include "visibility.hpp"
#include <cstdio>
#include <optional>
#include <vector>

namespace gribscan {

/**
 * @brief An abstract interface for reading GRIB data.
 */
struct GRIBSCAN_PUBLIC IReadable {
  virtual ~IReadable() = default;

  /**
   * @brief Returns the size of the data source in bytes.
   */
  virtual uint64_t size() const = 0;
  /**
   * @brief This method is called by the scanner when it needs to read a portion
   * of the data source.
   *
   * @param output A pointer to a pointer to the buffer to write to. This method
   *   is expected to either maintain an internal buffer, read data into it, and
   *   update this pointer to point at the internal buffer, or update this
   *   pointer to point directly at the source data if possible. The pointer and
   *   data must remain valid and unmodified until the next call to read().
   * @param offset The offset in bytes from the beginning of the data to read.
   * @param size The number of bytes to read.
   * @return uint64_t Number of bytes actually read. This may be less than the
   *   requested size if the end of the data is reached. If the read fails, this
   *   method should return 0.
   */
  virtual uint64_t read(std::byte** output, uint64_t offset, uint64_t size) = 0;
};

/**
 * @brief IReadable implementation wrapping a FILE* pointer created by fopen()
 * and a read buffer. The FILE* is not closed by this class.
 */
class GRIBSCAN_PUBLIC FileReader final : public IReadable {
public:
  FileReader(std::FILE* file);

  uint64_t size() const override;
  uint64_t read(std::byte** output, uint64_t offset, uint64_t size) override;

private:
  std::FILE* file_;
  std::vector<std::byte> buffer_;
  uint64_t size_;
  uint64_t position_;
};

/**
 * @brief IReadable implementation over a caller-owned memory buffer. No copy
 * is made; the buffer must outlive the reader.
 */
class GRIBSCAN_PUBLIC BufferReader final : public IReadable {
public:
  BufferReader(const std::byte* data, uint64_t size);
  explicit BufferReader(const ByteArray& data);

  uint64_t size() const override;
  uint64_t read(std::byte** output, uint64_t offset, uint64_t size) override;

private:
  const std::byte* data_;
  uint64_t size_;
};

/**
 * @brief Finds the byte ranges of GRIB edition 1 and 2 messages in a data
 * source without decoding them.
 *
 * The scanner searches forward one byte at a time for the `GRIB` marker, so
 * leading garbage and padding between messages are skipped. It only delimits
 * messages: the interior bytes of a message are never validated. Scanning stops
 * at end of data, or early if a marker is followed by a length field that
 * cannot be read, in which case `status()` reports why.
 */
struct GRIBSCAN_PUBLIC MessageScanner {
  MessageScanner(IReadable& dataSource, ByteOffset startOffset = 0);

  /**
   * @brief Rewinds the scanner to `startOffset`, clearing any error status.
   */
  void reset(ByteOffset startOffset = 0);

  /**
   * @brief Returns the next message range, or std::nullopt once the data
   * source is exhausted or a framing error occurred.
   */
  std::optional<MessageRange> next();

  const Status& status() const;

  ByteOffset offset() const;

  /**
   * @brief Number of bytes skipped while searching for the marker of the range
   * most recently returned by `next()`.
   */
  uint64_t skippedBytes() const;

  /**
   * @brief Computes the total length of the message whose marker is at
   * `offset`, applying the edition 1 large-message correction and the
   * edition 2 64-bit length. The caller must already have checked the marker.
   */
  static Status ReadMessageLength(IReadable& dataSource, ByteOffset offset, uint64_t* length);

private:
  IReadable* dataSource_;
  ByteOffset offset_;
  Status status_;
  uint64_t skipped_ = 0;
};

/**
 * @brief Runs a MessageScanner over `dataSource` to completion. Messages found
 * before a framing error are returned; the error itself is passed to
 * `onProblem`.
 */
GRIBSCAN_PUBLIC std::vector<MessageRange> ScanMessages(
  IReadable& dataSource, const ProblemCallback& onProblem = [](const Status&) {});

/**
 * @brief Returns true if `data` starts with the GRIB marker.
 */
GRIBSCAN_PUBLIC bool IsGribMagic(const std::byte* data, uint64_t size);

}  // namespace gribscan

#ifdef GRIBSCAN_IMPLEMENTATION
#  include "scanner.inl"
#endif
