#include "internal.hpp"
#include <cmath>
#include <cstdio>
#ifndef GRIBSCAN_NO_ECCODES
#  include <eccodes.h>
#endif

namespace gribscan {

#ifndef GRIBSCAN_NO_ECCODES
// EccodesDecoder //////////////////////////////////////////////////////////////

namespace {

Status EccodesStatus(int err, std::string_view what, std::string_view name) {
  if (err == CODES_NOT_FOUND) {
    return Status{StatusCode::KeyNotFound, internal::StrCat("key \"", name, "\" not found")};
  }
  return Status{StatusCode::DecodeFailed, internal::StrCat(what, " \"", name,
                                                           "\" failed: ", codes_get_error_message(err))};
}

class EccodesMessage final : public IDecodedMessage {
public:
  explicit EccodesMessage(codes_handle* handle)
      : handle_(handle) {}

  ~EccodesMessage() override {
    codes_handle_delete(handle_);
  }

  EccodesMessage(const EccodesMessage&) = delete;
  EccodesMessage& operator=(const EccodesMessage&) = delete;

  Status getScalar(std::string_view name, Value* output) const override {
    const std::string key{name};
    int type = CODES_TYPE_UNDEFINED;
    if (int err = codes_get_native_type(handle_, key.c_str(), &type); err != CODES_SUCCESS) {
      return EccodesStatus(err, "codes_get_native_type", name);
    }

    if (type == CODES_TYPE_LONG) {
      long value = 0;
      if (int err = codes_get_long(handle_, key.c_str(), &value); err != CODES_SUCCESS) {
        return EccodesStatus(err, "codes_get_long", name);
      }
      *output = int64_t(value);
      return StatusCode::Success;
    }
    if (type == CODES_TYPE_DOUBLE) {
      double value = 0;
      if (int err = codes_get_double(handle_, key.c_str(), &value); err != CODES_SUCCESS) {
        return EccodesStatus(err, "codes_get_double", name);
      }
      *output = value;
      return StatusCode::Success;
    }

    size_t length = 0;
    if (int err = codes_get_length(handle_, key.c_str(), &length); err != CODES_SUCCESS) {
      return EccodesStatus(err, "codes_get_length", name);
    }
    std::string value(length + 1, '\0');
    if (int err = codes_get_string(handle_, key.c_str(), value.data(), &length);
        err != CODES_SUCCESS) {
      return EccodesStatus(err, "codes_get_string", name);
    }
    // length includes the terminating NUL
    value.resize(length > 0 ? length - 1 : 0);
    *output = std::move(value);
    return StatusCode::Success;
  }

  Status getArray(std::string_view name, std::vector<double>* output) const override {
    const std::string key{name};
    size_t size = 0;
    if (int err = codes_get_size(handle_, key.c_str(), &size); err != CODES_SUCCESS) {
      return EccodesStatus(err, "codes_get_size", name);
    }
    output->resize(size);
    if (int err = codes_get_double_array(handle_, key.c_str(), output->data(), &size);
        err != CODES_SUCCESS) {
      output->clear();
      return EccodesStatus(err, "codes_get_double_array", name);
    }
    output->resize(size);
    return StatusCode::Success;
  }

private:
  codes_handle* handle_;
};

}  // namespace

Status EccodesDecoder::decodeNext(std::FILE* file, std::unique_ptr<IDecodedMessage>* output) {
  int err = CODES_SUCCESS;
  codes_handle* handle = codes_handle_new_from_file(nullptr, file, PRODUCT_GRIB, &err);
  if (!handle) {
    output->reset();
    if (err != CODES_SUCCESS) {
      return Status{StatusCode::DecodeFailed,
                    internal::StrCat("codes_handle_new_from_file failed: ",
                                     codes_get_error_message(err))};
    }
    return StatusCode::Success;
  }
  *output = std::make_unique<EccodesMessage>(handle);
  return StatusCode::Success;
}
#endif

std::shared_ptr<IDecoder> DefaultDecoder() {
#ifndef GRIBSCAN_NO_ECCODES
  return std::make_shared<EccodesDecoder>();
#else
  return nullptr;
#endif
}

// DecoderHandle ///////////////////////////////////////////////////////////////

DecoderHandle::DecoderHandle(std::unique_ptr<IDecodedMessage> message, std::string path,
                             ByteOffset offset)
    : message_(std::move(message))
    , path_(std::move(path))
    , offset_(offset) {}

bool DecoderHandle::IsArrayKey(std::string_view name) {
  return name == "values" || name == "distinctLatitudes" || name == "distinctLongitudes";
}

Status DecoderHandle::get(std::string_view name, std::optional<Value>* output) const {
  if (!message_) {
    return StatusCode::NotOpen;
  }

  Status status;
  Value value;
  if (IsArrayKey(name)) {
    std::vector<double> array;
    status = message_->getArray(name, &array);
    value = std::move(array);
  } else {
    status = message_->getScalar(name, &value);
  }

  if (status.code == StatusCode::KeyNotFound) {
    *output = std::nullopt;
    return StatusCode::Success;
  }
  if (!status.ok()) {
    return status;
  }
  *output = std::move(value);
  return StatusCode::Success;
}

Status DecoderHandle::getLong(std::string_view name, std::optional<int64_t>* output) const {
  std::optional<Value> value;
  if (auto status = get(name, &value); !status.ok()) {
    return status;
  }
  if (!value) {
    *output = std::nullopt;
  } else if (const auto* l = std::get_if<int64_t>(&*value)) {
    *output = *l;
  } else if (const auto* d = std::get_if<double>(&*value)) {
    // [-2^63, 2^63) is the range that converts without overflow
    if (!std::isfinite(*d) || *d < -9223372036854775808.0 || *d >= 9223372036854775808.0) {
      return Status{StatusCode::InvalidValueType,
                    internal::StrCat("key \"", name, "\" does not fit an integer: ",
                                     ToString(*value))};
    }
    *output = int64_t(*d);
  } else {
    return Status{StatusCode::InvalidValueType,
                  internal::StrCat("key \"", name, "\" is not numeric: ", ToString(*value))};
  }
  return StatusCode::Success;
}

Status DecoderHandle::getDouble(std::string_view name, std::optional<double>* output) const {
  std::optional<Value> value;
  if (auto status = get(name, &value); !status.ok()) {
    return status;
  }
  if (!value) {
    *output = std::nullopt;
  } else if (const auto* d = std::get_if<double>(&*value)) {
    *output = *d;
  } else if (const auto* l = std::get_if<int64_t>(&*value)) {
    *output = double(*l);
  } else {
    return Status{StatusCode::InvalidValueType,
                  internal::StrCat("key \"", name, "\" is not numeric: ", ToString(*value))};
  }
  return StatusCode::Success;
}

Status DecoderHandle::getString(std::string_view name, std::optional<std::string>* output) const {
  std::optional<Value> value;
  if (auto status = get(name, &value); !status.ok()) {
    return status;
  }
  if (value) {
    *output = ToString(*value);
  } else {
    *output = std::nullopt;
  }
  return StatusCode::Success;
}

Status DecoderHandle::values(std::vector<double>* output) const {
  std::optional<Value> value;
  if (auto status = get("values", &value); !status.ok()) {
    return status;
  }
  auto* array = value ? std::get_if<std::vector<double>>(&*value) : nullptr;
  if (array) {
    *output = std::move(*array);
  } else {
    output->clear();
  }
  return StatusCode::Success;
}

const std::string& DecoderHandle::path() const {
  return path_;
}

ByteOffset DecoderHandle::offset() const {
  return offset_;
}

// MessageCursor ///////////////////////////////////////////////////////////////

MessageCursor::MessageCursor(std::shared_ptr<IDecoder> decoder)
    : decoder_(std::move(decoder)) {}

MessageCursor::~MessageCursor() {
  close();
}

Status MessageCursor::open(const std::string& path) {
  close();
  if (!decoder_) {
    return StatusCode::NoDecoder;
  }
  file_ = std::fopen(path.c_str(), "rb");
  if (!file_) {
    return Status{StatusCode::OpenFailed, internal::StrCat("failed to open \"", path, "\"")};
  }
  path_ = path;
  return StatusCode::Success;
}

void MessageCursor::close() {
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
}

bool MessageCursor::isOpen() const {
  return file_ != nullptr;
}

Status MessageCursor::atOffset(ByteOffset offset, std::optional<DecoderHandle>* output) {
  if (!file_) {
    return StatusCode::NotOpen;
  }
  if (std::fseek(file_, (long)(offset), SEEK_SET) != 0) {
    return Status{StatusCode::ReadFailed,
                  internal::StrCat("cannot seek \"", path_, "\" to offset ", offset)};
  }
  if (auto status = next(output); !status.ok()) {
    return status;
  }
  if (!output->has_value()) {
    return Status{StatusCode::DecodeFailed,
                  internal::StrCat("no message in \"", path_, "\" at offset ", offset)};
  }
  return StatusCode::Success;
}

Status MessageCursor::next(std::optional<DecoderHandle>* output) {
  if (!file_) {
    return StatusCode::NotOpen;
  }
  const ByteOffset start = offset();
  std::unique_ptr<IDecodedMessage> message;
  ++decodeCount_;
  if (auto status = decoder_->decodeNext(file_, &message); !status.ok()) {
    *output = std::nullopt;
    return status;
  }
  if (!message) {
    *output = std::nullopt;
    return StatusCode::Success;
  }
  output->emplace(std::move(message), path_, start);
  return StatusCode::Success;
}

ByteOffset MessageCursor::offset() const {
  if (!file_) {
    return 0;
  }
  const long position = std::ftell(file_);
  return position < 0 ? 0 : ByteOffset(position);
}

const std::string& MessageCursor::path() const {
  return path_;
}

uint64_t MessageCursor::decodeCount() const {
  return decodeCount_;
}

}  // namespace gribscan
