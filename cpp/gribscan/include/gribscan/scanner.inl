#include "internal.hpp"
#include <algorithm>
#include <cassert>

namespace gribscan {

// FileReader //////////////////////////////////////////////////////////////////

FileReader::FileReader(std::FILE* file)
    : file_(file)
    , size_(0)
    , position_(0) {
  assert(file_);

  // Determine the size of the file
  std::fseek(file_, 0, SEEK_END);
  size_ = std::ftell(file_);
  std::fseek(file_, 0, SEEK_SET);
}

uint64_t FileReader::size() const {
  return size_;
}

uint64_t FileReader::read(std::byte** output, uint64_t offset, uint64_t size) {
  if (offset >= size_) {
    return 0;
  }

  if (offset != position_) {
    std::fseek(file_, (long)(offset), SEEK_SET);
    position_ = offset;
  }

  if (size > buffer_.size()) {
    buffer_.resize(size);
  }

  const uint64_t bytesRead = uint64_t(std::fread(buffer_.data(), 1, size, file_));
  *output = buffer_.data();

  position_ += bytesRead;
  return bytesRead;
}

// BufferReader ////////////////////////////////////////////////////////////////

BufferReader::BufferReader(const std::byte* data, uint64_t size)
    : data_(data)
    , size_(size) {}

BufferReader::BufferReader(const ByteArray& data)
    : data_(data.data())
    , size_(data.size()) {}

uint64_t BufferReader::read(std::byte** output, uint64_t offset, uint64_t size) {
  if (!data_ || offset >= size_) {
    return 0;
  }

  const auto available = size_ - offset;
  *output = const_cast<std::byte*>(data_) + offset;
  return std::min(size, available);
}

uint64_t BufferReader::size() const {
  return size_;
}

// MessageScanner //////////////////////////////////////////////////////////////

namespace {

Status ReadUint24(IReadable& dataSource, ByteOffset offset, uint32_t* output) {
  std::byte* data = nullptr;
  if (dataSource.read(&data, offset, 3) != 3) {
    const auto msg = internal::StrCat("cannot read 3-byte length at offset ", offset);
    return Status{StatusCode::TruncatedMessage, msg};
  }
  *output = internal::ParseUint24(data);
  return StatusCode::Success;
}

}  // namespace

MessageScanner::MessageScanner(IReadable& dataSource, ByteOffset startOffset)
    : dataSource_(&dataSource)
    , offset_(startOffset)
    , status_(StatusCode::Success) {}

void MessageScanner::reset(ByteOffset startOffset) {
  offset_ = startOffset;
  status_ = StatusCode::Success;
  skipped_ = 0;
}

std::optional<MessageRange> MessageScanner::next() {
  if (!dataSource_ || !status_.ok()) {
    return std::nullopt;
  }

  const uint64_t size = dataSource_->size();
  const ByteOffset searchStart = offset_;
  while (offset_ < size && size - offset_ >= internal::MagicLength) {
    std::byte* data = nullptr;
    if (dataSource_->read(&data, offset_, internal::MagicLength) != internal::MagicLength) {
      status_ = Status{StatusCode::ReadFailed,
                       internal::StrCat("failed to read marker at offset ", offset_)};
      return std::nullopt;
    }
    if (!internal::IsMagic(data)) {
      ++offset_;
      continue;
    }

    uint64_t length = 0;
    status_ = ReadMessageLength(*dataSource_, offset_, &length);
    if (!status_.ok()) {
      offset_ = EndOffset;
      return std::nullopt;
    }

    const MessageRange range{offset_, length};
    skipped_ = offset_ - searchStart;
    offset_ = length > EndOffset - offset_ ? EndOffset : offset_ + length;
    return range;
  }
  return std::nullopt;
}

const Status& MessageScanner::status() const {
  return status_;
}

ByteOffset MessageScanner::offset() const {
  return offset_;
}

uint64_t MessageScanner::skippedBytes() const {
  return skipped_;
}

Status MessageScanner::ReadMessageLength(IReadable& dataSource, ByteOffset offset,
                                         uint64_t* length) {
  std::byte* data = nullptr;
  if (dataSource.read(&data, offset, internal::IndicatorLength) != internal::IndicatorLength) {
    const auto msg = internal::StrCat("message at offset ", offset,
                                      " is too short to hold an indicator section");
    return Status{StatusCode::TruncatedMessage, msg};
  }
  const uint32_t totalLength = internal::ParseUint24(data + internal::MagicLength);
  const uint8_t edition = uint8_t(data[internal::MagicLength + 3]);
  uint64_t result = totalLength;

  if (edition == 1 && (totalLength & internal::Edition1LengthFlag)) {
    // Messages larger than 2^23 bytes store the length divided by 120 and flag
    // it with the top bit. The true length is recovered from the length of the
    // binary data section, which has to be located by walking sections 1-3.
    ByteOffset pos = offset + internal::IndicatorLength;
    uint32_t section1Length = 0;
    if (auto status = ReadUint24(dataSource, pos, &section1Length); !status.ok()) {
      return status;
    }
    // Octet 8 of section 1 flags the presence of sections 2 and 3
    if (dataSource.read(&data, pos + 7, 1) != 1) {
      const auto msg = internal::StrCat("cannot read section 1 flags of message at offset ", offset);
      return Status{StatusCode::TruncatedMessage, msg};
    }
    const uint8_t flags = uint8_t(data[0]);
    pos += section1Length;

    if (flags & internal::Section2PresentFlag) {
      uint32_t section2Length = 0;
      if (auto status = ReadUint24(dataSource, pos, &section2Length); !status.ok()) {
        return status;
      }
      pos += section2Length;
    }
    if (flags & internal::Section3PresentFlag) {
      uint32_t section3Length = 0;
      if (auto status = ReadUint24(dataSource, pos, &section3Length); !status.ok()) {
        return status;
      }
      pos += section3Length;
    }

    uint32_t section4Length = 0;
    if (auto status = ReadUint24(dataSource, pos, &section4Length); !status.ok()) {
      return status;
    }
    if (section4Length < internal::Edition1LengthScale) {
      const uint64_t scaled =
        uint64_t(totalLength & internal::Edition1LengthMask) * internal::Edition1LengthScale;
      if (scaled + 4 <= section4Length) {
        const auto msg = internal::StrCat("message at offset ", offset,
                                          " has an invalid scaled length ", totalLength);
        return Status{StatusCode::InvalidMessage, msg};
      }
      result = scaled - section4Length + 4;
    }
  } else if (edition == 2) {
    if (dataSource.read(&data, offset + internal::IndicatorLength, internal::Edition2LengthSize) !=
        internal::Edition2LengthSize) {
      const auto msg =
        internal::StrCat("cannot read edition 2 length of message at offset ", offset);
      return Status{StatusCode::TruncatedMessage, msg};
    }
    result = internal::ParseUint64(data);
  }

  if (result == 0) {
    const auto msg = internal::StrCat("message at offset ", offset, " (edition ",
                                      internal::ToHex(edition), ") has zero length");
    return Status{StatusCode::InvalidMessage, msg};
  }
  *length = result;
  return StatusCode::Success;
}

std::vector<MessageRange> ScanMessages(IReadable& dataSource, const ProblemCallback& onProblem) {
  std::vector<MessageRange> ranges;
  MessageScanner scanner{dataSource};
  while (auto range = scanner.next()) {
    ranges.push_back(*range);
  }
  if (!scanner.status().ok()) {
    onProblem(scanner.status());
  }
  return ranges;
}

bool IsGribMagic(const std::byte* data, uint64_t size) {
  return data && size >= internal::MagicLength && internal::IsMagic(data);
}

}  // namespace gribscan
