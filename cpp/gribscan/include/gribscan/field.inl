#include "internal.hpp"

namespace gribscan {

Field::Field(DecoderHandle handle)
    : state_(std::move(handle)) {}

Field::Field(MessageCursor& cursor, ByteOffset offset)
    : state_(Pending{&cursor, offset}) {}

bool Field::materialized() const {
  return std::holds_alternative<DecoderHandle>(state_);
}

Status Field::handle(const DecoderHandle** output) {
  if (auto* handle = std::get_if<DecoderHandle>(&state_)) {
    *output = handle;
    return StatusCode::Success;
  }
  const auto* pending = std::get_if<Pending>(&state_);
  if (!pending) {
    return StatusCode::NotOpen;
  }

  std::optional<DecoderHandle> decoded;
  if (auto status = pending->cursor->atOffset(pending->offset, &decoded); !status.ok()) {
    return status;
  }
  *output = &state_.emplace<DecoderHandle>(std::move(*decoded));
  return StatusCode::Success;
}

std::optional<ByteOffset> Field::offset() const {
  if (const auto* handle = std::get_if<DecoderHandle>(&state_)) {
    return handle->offset();
  }
  if (const auto* pending = std::get_if<Pending>(&state_)) {
    return pending->offset;
  }
  return std::nullopt;
}

std::string Field::path() const {
  if (const auto* handle = std::get_if<DecoderHandle>(&state_)) {
    return handle->path();
  }
  if (const auto* pending = std::get_if<Pending>(&state_)) {
    return pending->cursor->path();
  }
  return {};
}

Status Field::get(std::string_view name, std::optional<Value>* output) {
  const DecoderHandle* h = nullptr;
  if (auto status = handle(&h); !status.ok()) {
    return status;
  }
  // paramId is what the decoder knows; "param" is the name users tend to ask for
  return h->get(name == "param" ? "paramId" : name, output);
}

Status Field::values(std::vector<double>* output) {
  const DecoderHandle* h = nullptr;
  if (auto status = handle(&h); !status.ok()) {
    return status;
  }
  return h->values(output);
}

Status Field::shape(Shape* output) {
  const DecoderHandle* h = nullptr;
  if (auto status = handle(&h); !status.ok()) {
    return status;
  }
  std::optional<int64_t> nj, ni;
  if (auto status = h->getLong("Nj", &nj); !status.ok()) {
    return status;
  }
  if (auto status = h->getLong("Ni", &ni); !status.ok()) {
    return status;
  }
  output->rows = MissingIsNull(nj);
  output->cols = MissingIsNull(ni);
  return StatusCode::Success;
}

Status Field::toArray(Array* output, bool normalise) {
  (void)normalise;
  Shape gridShape;
  if (auto status = shape(&gridShape); !status.ok()) {
    return status;
  }
  Array result;
  if (auto status = values(&result.values); !status.ok()) {
    return status;
  }
  if (gridShape.known() && !result.values.empty()) {
    const int64_t rows = *gridShape.rows;
    const int64_t cols = *gridShape.cols;
    if (rows < 0 || cols < 0 || uint64_t(rows) * uint64_t(cols) != result.values.size()) {
      const auto msg = internal::StrCat("cannot view ", result.values.size(), " values as ", rows,
                                        "x", cols);
      return Status{StatusCode::ShapeMismatch, msg};
    }
    result.shape = std::make_pair(rows, cols);
  }
  *output = std::move(result);
  return StatusCode::Success;
}

Status Field::gridDefinition(GridDefinition* output) {
  const DecoderHandle* h = nullptr;
  if (auto status = handle(&h); !status.ok()) {
    return status;
  }
  GridDefinition grid;
  for (const auto& [key, value] : {
         std::make_pair("latitudeOfFirstGridPointInDegrees", &grid.north),
         std::make_pair("latitudeOfLastGridPointInDegrees", &grid.south),
         std::make_pair("longitudeOfFirstGridPointInDegrees", &grid.west),
         std::make_pair("longitudeOfLastGridPointInDegrees", &grid.east),
         std::make_pair("jDirectionIncrementInDegrees", &grid.southNorthIncrement),
         std::make_pair("iDirectionIncrementInDegrees", &grid.westEastIncrement),
       }) {
    if (auto status = h->getDouble(key, value); !status.ok()) {
      return status;
    }
  }
  *output = grid;
  return StatusCode::Success;
}

Status Field::requireDouble(std::string_view name, double* output) {
  const DecoderHandle* h = nullptr;
  if (auto status = handle(&h); !status.ok()) {
    return status;
  }
  std::optional<double> value;
  if (auto status = h->getDouble(name, &value); !status.ok()) {
    return status;
  }
  if (!value) {
    return Status{StatusCode::MissingKey, internal::StrCat("message has no \"", name, "\"")};
  }
  *output = *value;
  return StatusCode::Success;
}

Status Field::requireLong(std::string_view name, int64_t* output) {
  const DecoderHandle* h = nullptr;
  if (auto status = handle(&h); !status.ok()) {
    return status;
  }
  std::optional<int64_t> value;
  if (auto status = h->getLong(name, &value); !status.ok()) {
    return status;
  }
  if (!value) {
    return Status{StatusCode::MissingKey, internal::StrCat("message has no \"", name, "\"")};
  }
  *output = *value;
  return StatusCode::Success;
}

Status Field::datetime(DateTime* output) {
  int64_t date = 0;
  int64_t time = 0;
  if (auto status = requireLong("date", &date); !status.ok()) {
    return status;
  }
  if (auto status = requireLong("time", &time); !status.ok()) {
    return status;
  }
  *output = DateTime::FromGrib(date, time);
  return StatusCode::Success;
}

Status Field::validDatetime(DateTime* output) {
  DateTime reference;
  if (auto status = datetime(&reference); !status.ok()) {
    return status;
  }
  int64_t step = 0;
  if (auto status = requireLong("endStep", &step); !status.ok()) {
    return status;
  }
  *output = reference.addHours(step);
  return StatusCode::Success;
}

Status Field::boundingBox(BoundingBox* output) {
  BoundingBox box;
  for (const auto& [key, value] : {
         std::make_pair("latitudeOfFirstGridPointInDegrees", &box.north),
         std::make_pair("latitudeOfLastGridPointInDegrees", &box.south),
         std::make_pair("longitudeOfFirstGridPointInDegrees", &box.west),
         std::make_pair("longitudeOfLastGridPointInDegrees", &box.east),
       }) {
    if (auto status = requireDouble(key, value); !status.ok()) {
      return status;
    }
  }
  *output = box;
  return StatusCode::Success;
}

Status Field::metadata(FieldMetadata* output) {
  FieldMetadata result;
  if (auto status = gridDefinition(&result.grid); !status.ok()) {
    return status;
  }
  if (auto status = shape(&result.shape); !status.ok()) {
    return status;
  }
  const DecoderHandle* h = nullptr;
  if (auto status = handle(&h); !status.ok()) {
    return status;
  }
  for (const auto& [key, value] : {
         std::make_pair("shortName", &result.shortName),
         std::make_pair("units", &result.units),
         std::make_pair("paramId", &result.paramId),
       }) {
    if (auto status = h->getString(key, value); !status.ok()) {
      return status;
    }
  }
  *output = std::move(result);
  return StatusCode::Success;
}

Status Field::describe(std::string* output) {
  const DecoderHandle* h = nullptr;
  if (auto status = handle(&h); !status.ok()) {
    return status;
  }
  std::string result = "GribField(";
  bool first = true;
  for (const char* key : {"shortName", "levelist", "date", "time", "step", "number"}) {
    std::optional<std::string> value;
    if (auto status = h->getString(key, &value); !status.ok()) {
      return status;
    }
    result += first ? "" : ",";
    result += value.value_or("None");
    first = false;
  }
  *output = result + ")";
  return StatusCode::Success;
}

}  // namespace gribscan
