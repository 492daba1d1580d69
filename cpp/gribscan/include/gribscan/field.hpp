#pragma once

#include "decoder.hpp"
#include "types.hpp"
#include "visibility.hpp"
#include <optional>
#include <string>
#include <variant>

namespace gribscan {

/**
 * @brief One GRIB message, decoded on demand.
 *
 * A Field is either built around an already decoded DecoderHandle, or around a
 * cursor and an offset. In the second case nothing is decoded until the first
 * accessor is called; the handle is then kept for the lifetime of the Field,
 * so later accessors never seek again. The cursor must outlive the Field.
 *
 * Accessors never modify the underlying message.
 */
class GRIBSCAN_PUBLIC Field final {
public:
  Field() = default;
  explicit Field(DecoderHandle handle);
  Field(MessageCursor& cursor, ByteOffset offset);

  Field(const Field&) = delete;
  Field& operator=(const Field&) = delete;
  Field(Field&&) = default;
  Field& operator=(Field&&) = default;

  /**
   * @brief True once a DecoderHandle is held.
   */
  bool materialized() const;

  /**
   * @brief Decodes the message if that has not happened yet and returns its
   * handle.
   *
   * @return Status StatusCode::NotOpen for a default-constructed Field, or the
   *   cursor's error if the message cannot be decoded.
   */
  Status handle(const DecoderHandle** output);

  /**
   * @brief Byte offset of the message in its file. Empty for a
   * default-constructed Field.
   */
  std::optional<ByteOffset> offset() const;

  /**
   * @brief Path of the file holding the message.
   */
  std::string path() const;

  /**
   * @brief Looks up any decoder key. `param` is an alias for `paramId`.
   */
  Status get(std::string_view name, std::optional<Value>* output);

  /**
   * @brief The decoded grid, empty when the message carries none.
   */
  Status values(std::vector<double>* output);

  /**
   * @brief `(Nj, Ni)`. A dimension reported as MissingLong, or not provided
   * at all, is left empty.
   */
  Status shape(Shape* output);

  /**
   * @brief The values viewed in the field's shape. If either dimension is
   * unknown, or the message carries no grid, the values are returned flat and
   * `output->shape` is left empty.
   * Values are never rescaled; `normalise` is accepted for interface parity
   * with array conversions and has no effect.
   */
  Status toArray(Array* output, bool normalise = false);

  Status gridDefinition(GridDefinition* output);

  /**
   * @brief The reference time from the `date` (YYYYMMDD) and `time` (HHMM)
   * keys.
   *
   * @return Status StatusCode::MissingKey if either key is not provided.
   */
  Status datetime(DateTime* output);

  /**
   * @brief The reference time plus `endStep` hours.
   */
  Status validDatetime(DateTime* output);

  /**
   * @brief The extent spanned by the first and last grid points.
   *
   * @return Status StatusCode::MissingKey if a corner is not provided.
   */
  Status boundingBox(BoundingBox* output);

  Status metadata(FieldMetadata* output);

  /**
   * @brief A one-line summary such as `GribField(2t,None,20200513,1200,0,None)`.
   */
  Status describe(std::string* output);

private:
  struct Pending {
    MessageCursor* cursor;
    ByteOffset offset;
  };

  std::variant<std::monostate, Pending, DecoderHandle> state_;

  Status requireDouble(std::string_view name, double* output);
  Status requireLong(std::string_view name, int64_t* output);
};

}  // namespace gribscan

#ifdef GRIBSCAN_IMPLEMENTATION
#  include "field.inl"
#endif
