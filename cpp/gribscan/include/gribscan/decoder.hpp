#pragma once

#include "types.hpp"
#include "visibility.hpp"
#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gribscan {

/**
 * @brief One message decoded by an IDecoder. Destroying the object releases
 * every decoder resource it holds.
 */
struct GRIBSCAN_PUBLIC IDecodedMessage {
  virtual ~IDecodedMessage() = default;

  /**
   * @brief Reads a scalar key in its native type (integer, floating point or
   * string).
   *
   * @return Status StatusCode::KeyNotFound if the key does not apply to this
   *   message.
   */
  virtual Status getScalar(std::string_view name, Value* output) const = 0;

  /**
   * @brief Reads an array key as doubles. `values` returns the decoded grid.
   *
   * @return Status StatusCode::KeyNotFound if the key does not apply to this
   *   message.
   */
  virtual Status getArray(std::string_view name, std::vector<double>* output) const = 0;
};

/**
 * @brief An abstract interface to a GRIB decoding library.
 */
struct GRIBSCAN_PUBLIC IDecoder {
  virtual ~IDecoder() = default;

  /**
   * @brief Decodes the message at or after the current position of `file`,
   * leaving the position just past it.
   *
   * @param output Set to the decoded message, or to nullptr if no further
   *   message could be found before end of file.
   */
  virtual Status decodeNext(std::FILE* file, std::unique_ptr<IDecodedMessage>* output) = 0;
};

#ifndef GRIBSCAN_NO_ECCODES
/**
 * @brief IDecoder implementation backed by ECMWF's ecCodes library
 * (https://confluence.ecmwf.int/display/ECC).
 */
class GRIBSCAN_PUBLIC EccodesDecoder final : public IDecoder {
public:
  Status decodeNext(std::FILE* file, std::unique_ptr<IDecodedMessage>* output) override;
};
#endif

/**
 * @brief Returns the decoder used when ReaderOptions does not name one, or
 * nullptr if the library was built without any decoder backend.
 */
GRIBSCAN_PUBLIC std::shared_ptr<IDecoder> DefaultDecoder();

/**
 * @brief Owns one decoded message together with the file and offset it was
 * decoded from. The decoder resource is released exactly once, when the handle
 * is destroyed.
 */
class GRIBSCAN_PUBLIC DecoderHandle final {
public:
  DecoderHandle(std::unique_ptr<IDecodedMessage> message, std::string path, ByteOffset offset);

  DecoderHandle(const DecoderHandle&) = delete;
  DecoderHandle& operator=(const DecoderHandle&) = delete;
  DecoderHandle(DecoderHandle&&) = default;
  DecoderHandle& operator=(DecoderHandle&&) = default;

  /**
   * @brief Looks up `name`. Keys the decoder does not know for this message
   * produce an empty `output` and a success status. `values`,
   * `distinctLatitudes` and `distinctLongitudes` are returned as arrays.
   */
  Status get(std::string_view name, std::optional<Value>* output) const;

  Status getLong(std::string_view name, std::optional<int64_t>* output) const;
  /**
   * @brief Reads a numeric key as a double. Integer values are converted.
   */
  Status getDouble(std::string_view name, std::optional<double>* output) const;
  /**
   * @brief Reads any scalar key rendered as a string.
   */
  Status getString(std::string_view name, std::optional<std::string>* output) const;

  /**
   * @brief The decoded grid. A message without a `values` key yields an empty
   * vector.
   */
  Status values(std::vector<double>* output) const;

  const std::string& path() const;
  ByteOffset offset() const;

  static bool IsArrayKey(std::string_view name);

private:
  std::unique_ptr<IDecodedMessage> message_;
  std::string path_;
  ByteOffset offset_;
};

/**
 * @brief Owns an open GRIB file and decodes messages from it, either
 * sequentially or at explicit offsets.
 *
 * Seeking and sequential decoding share one file position, so a cursor must
 * not be used by more than one thread at a time, and a sequential traversal
 * is disturbed by any `atOffset()` call on the same cursor.
 */
class GRIBSCAN_PUBLIC MessageCursor final {
public:
  MessageCursor(std::shared_ptr<IDecoder> decoder);
  ~MessageCursor();

  MessageCursor(const MessageCursor&) = delete;
  MessageCursor& operator=(const MessageCursor&) = delete;
  MessageCursor(MessageCursor&&) = delete;
  MessageCursor& operator=(MessageCursor&&) = delete;

  Status open(const std::string& path);
  void close();
  bool isOpen() const;

  /**
   * @brief Seeks to `offset` and decodes the message found there.
   *
   * @return Status StatusCode::DecodeFailed if no message can be decoded at
   *   that position.
   */
  Status atOffset(ByteOffset offset, std::optional<DecoderHandle>* output);

  /**
   * @brief Decodes the message at the current position and advances past it.
   * `output` is left empty at end of file.
   */
  Status next(std::optional<DecoderHandle>* output);

  /**
   * @brief The current file position, i.e. where `next()` starts decoding.
   */
  ByteOffset offset() const;

  const std::string& path() const;

  /**
   * @brief Number of messages decoded by this cursor since it was created.
   */
  uint64_t decodeCount() const;

private:
  std::shared_ptr<IDecoder> decoder_;
  std::FILE* file_ = nullptr;
  std::string path_;
  uint64_t decodeCount_ = 0;
};

}  // namespace gribscan

#ifdef GRIBSCAN_IMPLEMENTATION
#  include "decoder.inl"
#endif
