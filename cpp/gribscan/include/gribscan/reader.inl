#include "internal.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <set>

namespace gribscan {

Status ReaderOptions::validate() const {
  if (!decoder) {
    return Status(StatusCode::NoDecoder, "no decoder configured and no default decoder built in");
  }
  return Status();
}

// GribReader //////////////////////////////////////////////////////////////////

GribReader::~GribReader() {
  close();
}

Status GribReader::open(const std::string& path, ReaderOptions options) {
  close();

  if (!options.decoder) {
    options.decoder = DefaultDecoder();
  }
  if (!options.onProblem) {
    options.onProblem = [](const Status&) {};
  }
  if (auto status = options.validate(); !status.ok()) {
    return status;
  }

  std::optional<CacheLocator> locator;
  if (options.useCache) {
    locator.emplace(options.cacheDirectory);
  }

  GribIndex index;
  const IndexCache cache{locator.value_or(CacheLocator{}), options.useCache, options.onProblem};
  if (auto status = cache.buildOrLoad(path, &index); !status.ok()) {
    return status;
  }

  path_ = path;
  decoder_ = options.decoder;
  options_ = std::move(options);
  locator_ = std::move(locator);
  index_ = std::move(index);
  open_ = true;
  return StatusCode::Success;
}

void GribReader::close() {
  cursor_.reset();
  statistics_ = std::nullopt;
  index_ = GribIndex{};
  locator_ = std::nullopt;
  decoder_.reset();
  path_.clear();
  open_ = false;
}

bool GribReader::isOpen() const {
  return open_;
}

const std::string& GribReader::path() const {
  return path_;
}

const GribIndex& GribReader::index() const {
  return index_;
}

size_t GribReader::size() const {
  return index_.size();
}

Status GribReader::openCursor_(MessageCursor** output) {
  if (!open_) {
    return StatusCode::NotOpen;
  }
  if (!cursor_) {
    auto cursor = std::make_unique<MessageCursor>(decoder_);
    if (auto status = cursor->open(path_); !status.ok()) {
      return status;
    }
    cursor_ = std::move(cursor);
  }
  *output = cursor_.get();
  return StatusCode::Success;
}

Status GribReader::field(size_t n, Field* output) {
  if (!open_) {
    return StatusCode::NotOpen;
  }
  if (n >= index_.size()) {
    const auto msg = internal::StrCat("message ", n, " requested from \"", path_, "\" which has ",
                                      index_.size(), " messages");
    return Status{StatusCode::OutOfRange, msg};
  }
  MessageCursor* cursor = nullptr;
  if (auto status = openCursor_(&cursor); !status.ok()) {
    return status;
  }
  *output = Field{*cursor, index_.offsets[n]};
  return StatusCode::Success;
}

Status GribReader::first(Field* output) {
  return field(0, output);
}

FieldView GribReader::fields() const {
  return FieldView{*this};
}

FieldView::Iterator GribReader::begin() const {
  return fields().begin();
}

FieldView::Iterator GribReader::end() const {
  return fields().end();
}

Status GribReader::forEachField_(const std::function<Status(Field&)>& visit) const {
  if (!open_) {
    return StatusCode::NotOpen;
  }
  Status failure;
  FieldView view{*this, [&failure](const Status& problem) {
                   if (failure.ok()) {
                     failure = problem;
                   }
                 }};
  for (auto& field : view) {
    if (auto status = visit(field); !status.ok()) {
      return status;
    }
  }
  return failure;
}

Status GribReader::statistics(Statistics* output) {
  if (!open_) {
    return StatusCode::NotOpen;
  }
  if (statistics_) {
    *output = *statistics_;
    return StatusCode::Success;
  }

  std::string sidecar;
  if (locator_) {
    if (auto status = locator_->sidecarPath(StatisticsNamespace, path_, ".json", &sidecar);
        !status.ok()) {
      if (status.code != StatusCode::OpenFailed) {
        options_.onProblem(status);
      }
      sidecar.clear();
    }
  }

  if (!sidecar.empty()) {
    std::error_code ec;
    if (std::filesystem::exists(sidecar, ec)) {
      Statistics cached;
      const auto status = LoadStatistics(sidecar, &cached);
      if (status.ok()) {
        statistics_ = cached;
        *output = cached;
        return status;
      }
      options_.onProblem(status);
    }
  }

  Statistics result;
  if (auto status = computeStatistics_(&result); !status.ok()) {
    return status;
  }
  statistics_ = result;

  if (!sidecar.empty()) {
    if (auto status = SaveStatistics(sidecar, result); !status.ok()) {
      options_.onProblem(status);
    }
  }
  *output = result;
  return StatusCode::Success;
}

Status GribReader::computeStatistics_(Statistics* output) const {
  std::vector<double> sum;
  std::vector<double> sumSq;
  std::vector<double> minimum;
  std::vector<double> maximum;
  uint64_t count = 0;
  std::vector<double> values;

  const auto iterated = forEachField_([&](Field& field) -> Status {
    if (auto status = field.values(&values); !status.ok()) {
      return status;
    }
    if (values.empty()) {
      const auto msg =
        internal::StrCat("message ", count, " of \"", path_, "\" carries no values");
      return Status{StatusCode::MissingValues, msg};
    }
    if (count == 0) {
      sum = values;
      minimum = values;
      maximum = values;
      sumSq.resize(values.size());
      std::transform(values.begin(), values.end(), sumSq.begin(), [](double v) {
        return v * v;
      });
    } else {
      if (values.size() != sum.size()) {
        const auto msg =
          internal::StrCat("message ", count, " of \"", path_, "\" has ", values.size(),
                           " values, expected ", sum.size());
        return Status{StatusCode::ShapeMismatch, msg};
      }
      for (size_t i = 0; i < values.size(); ++i) {
        const double v = values[i];
        sum[i] += v;
        sumSq[i] += v * v;
        minimum[i] = std::min(minimum[i], v);
        maximum[i] = std::max(maximum[i], v);
      }
    }
    ++count;
    return StatusCode::Success;
  });
  if (!iterated.ok()) {
    return iterated;
  }

  if (count == 0) {
    return Status{StatusCode::NoMessages, internal::StrCat("\"", path_, "\" has no messages")};
  }
  const auto nans = std::count_if(sum.begin(), sum.end(), [](double v) {
    return std::isnan(v);
  });
  if (nans != 0) {
    const auto msg = internal::StrCat("statistics with missing values not yet implemented (",
                                      nans, " missing cells in \"", path_, "\")");
    return Status{StatusCode::MissingValues, msg};
  }

  const auto mean = [](const std::vector<double>& v) {
    double total = 0;
    for (double x : v) {
      total += x;
    }
    return total / double(v.size());
  };

  Statistics result;
  result.minimum = *std::min_element(minimum.begin(), minimum.end());
  result.maximum = *std::max_element(maximum.begin(), maximum.end());
  result.average = mean(sum) / double(count);
  // Clamp rounding noise so that constant inputs give 0 rather than NaN
  const double variance = mean(sumSq) / double(count) - result.average * result.average;
  result.stdev = std::sqrt(std::max(variance, 0.0));
  result.count = count;
  *output = result;
  return StatusCode::Success;
}

Status GribReader::datetimes(std::vector<DateTime>* output) const {
  std::set<DateTime> unique;
  const auto iterated = forEachField_([&unique](Field& field) -> Status {
    DateTime valid;
    if (auto status = field.validDatetime(&valid); !status.ok()) {
      return status;
    }
    unique.insert(valid);
    return StatusCode::Success;
  });
  if (!iterated.ok()) {
    return iterated;
  }
  output->assign(unique.begin(), unique.end());
  return StatusCode::Success;
}

Status GribReader::datetime(DateTime* output) const {
  std::vector<DateTime> all;
  if (auto status = datetimes(&all); !status.ok()) {
    return status;
  }
  if (all.empty()) {
    return Status{StatusCode::NoMessages, internal::StrCat("\"", path_, "\" has no messages")};
  }
  if (all.size() != 1) {
    const auto msg = internal::StrCat("\"", path_, "\" has ", all.size(),
                                      " different valid datetimes");
    return Status{StatusCode::NotUnique, msg};
  }
  *output = all.front();
  return StatusCode::Success;
}

Status GribReader::boundingBox(BoundingBox* output) const {
  std::optional<BoundingBox> merged;
  const auto iterated = forEachField_([&merged](Field& field) -> Status {
    BoundingBox box;
    if (auto status = field.boundingBox(&box); !status.ok()) {
      return status;
    }
    merged = merged ? BoundingBox::Merge(*merged, box) : box;
    return StatusCode::Success;
  });
  if (!iterated.ok()) {
    return iterated;
  }
  if (!merged) {
    return Status{StatusCode::NoMessages, internal::StrCat("\"", path_, "\" has no messages")};
  }
  *output = *merged;
  return StatusCode::Success;
}

// FieldView ///////////////////////////////////////////////////////////////////

FieldView::FieldView(const GribReader& reader)
    : FieldView(reader, reader.options_.onProblem) {}

FieldView::FieldView(const GribReader& reader, const ProblemCallback& onProblem)
    : path_(reader.path_)
    , decoder_(reader.decoder_)
    , onProblem_(onProblem) {}

FieldView::Iterator FieldView::begin() {
  if (path_.empty() || !decoder_) {
    return end();
  }
  return FieldView::Iterator{path_, decoder_, onProblem_};
}

FieldView::Iterator FieldView::end() {
  return FieldView::Iterator();
}

// FieldView::Iterator /////////////////////////////////////////////////////////

FieldView::Iterator::Iterator(const std::string& path, std::shared_ptr<IDecoder> decoder,
                              const ProblemCallback& onProblem)
    : impl_(std::make_unique<Impl>(path, std::move(decoder), onProblem)) {
  if (!impl_->has_value()) {
    impl_ = nullptr;
  }
}

FieldView::Iterator::Impl::Impl(const std::string& path, std::shared_ptr<IDecoder> decoder,
                                const ProblemCallback& onProblem)
    : cursor_(std::move(decoder))
    , onProblem_(onProblem) {
  if (auto status = cursor_.open(path); !status.ok()) {
    onProblem_(status);
    return;
  }
  increment();
}

void FieldView::Iterator::Impl::increment() {
  hasValue_ = false;
  current_ = Field{};

  std::optional<DecoderHandle> handle;
  if (auto status = cursor_.next(&handle); !status.ok()) {
    onProblem_(status);
    return;
  }
  if (!handle) {
    return;
  }
  current_ = Field{std::move(*handle)};
  hasValue_ = true;
}

FieldView::Iterator::reference FieldView::Iterator::Impl::dereference() {
  return current_;
}

bool FieldView::Iterator::Impl::has_value() const {
  return hasValue_;
}

FieldView::Iterator::reference FieldView::Iterator::operator*() const {
  return impl_->dereference();
}

FieldView::Iterator::pointer FieldView::Iterator::operator->() const {
  return &impl_->dereference();
}

FieldView::Iterator& FieldView::Iterator::operator++() {
  impl_->increment();
  if (!impl_->has_value()) {
    impl_ = nullptr;
  }
  return *this;
}

void FieldView::Iterator::operator++(int) {
  ++*this;
}

bool operator==(const FieldView::Iterator& a, const FieldView::Iterator& b) {
  return a.impl_ == b.impl_;
}

bool operator!=(const FieldView::Iterator& a, const FieldView::Iterator& b) {
  return !(a == b);
}

// FieldSet ////////////////////////////////////////////////////////////////////

FieldSet::FieldSet(std::vector<GribReader*> readers)
    : readers_(std::move(readers)) {}

size_t FieldSet::size() const {
  size_t total = 0;
  for (const auto* reader : readers_) {
    total += reader->size();
  }
  return total;
}

Status FieldSet::field(size_t n, Field* output) {
  size_t local = n;
  for (auto* reader : readers_) {
    if (local < reader->size()) {
      return reader->field(local, output);
    }
    local -= reader->size();
  }
  const auto msg = internal::StrCat("message ", n, " requested from a field set of ", size(),
                                    " messages");
  return Status{StatusCode::OutOfRange, msg};
}

}  // namespace gribscan
