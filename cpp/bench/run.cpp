#define GRIBSCAN_IMPLEMENTATION
#include <gribscan/gribscan.hpp>

#include <benchmark/benchmark.h>

#include <cstdio>
#include <filesystem>
#include <fstream>

constexpr char BenchmarkFile[] = "benchmark.grib";
constexpr char BenchmarkCacheDir[] = "benchmark-cache";

static void PutBytes(gribscan::ByteArray& out, std::string_view bytes) {
  for (char c : bytes) {
    out.push_back(std::byte(c));
  }
}

static void PutEndMarker(gribscan::ByteArray& out) {
  for (uint8_t c : gribscan::EndMarker) {
    out.push_back(std::byte(c));
  }
}

static void PutUint24(gribscan::ByteArray& out, uint32_t value) {
  out.push_back(std::byte((value >> 16) & 0xff));
  out.push_back(std::byte((value >> 8) & 0xff));
  out.push_back(std::byte(value & 0xff));
}

// Appends `count` edition 2 messages of `length` bytes, separated by a few
// bytes of padding so the scanner also exercises its resync path
static void AppendEdition2(gribscan::ByteArray& out, size_t count, uint64_t length) {
  for (size_t i = 0; i < count; ++i) {
    const size_t start = out.size();
    PutBytes(out, "GRIB");
    out.push_back(std::byte(0));
    out.push_back(std::byte(0));
    out.push_back(std::byte(0));
    out.push_back(std::byte(2));
    for (int shift = 56; shift >= 0; shift -= 8) {
      out.push_back(std::byte((length >> shift) & 0xff));
    }
    out.resize(start + length - 4);
    PutEndMarker(out);
    PutBytes(out, std::string_view("\0\0\0", 3));
  }
}

// Appends `count` edition 1 messages whose length field is stored divided by
// 120, forcing the section walk for every message
static void AppendEdition1Scaled(gribscan::ByteArray& out, size_t count) {
  constexpr uint32_t ScaledLength = 10;
  constexpr uint32_t Section4Length = 60;
  const uint64_t length = uint64_t(ScaledLength) * 120 - Section4Length + 4;
  for (size_t i = 0; i < count; ++i) {
    const size_t start = out.size();
    PutBytes(out, "GRIB");
    PutUint24(out, 0x800000 | ScaledLength);
    out.push_back(std::byte(1));
    PutUint24(out, 28);
    out.resize(start + 8 + 28);
    PutUint24(out, Section4Length);
    out.resize(start + length - 4);
    PutEndMarker(out);
  }
}

static void WriteFile(const std::string& path, const gribscan::ByteArray& bytes) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(reinterpret_cast<const char*>(bytes.data()), std::streamsize(bytes.size()));
}

static void BM_ScanBufferEdition2(benchmark::State& state) {
  gribscan::ByteArray bytes;
  AppendEdition2(bytes, size_t(state.range(0)), uint64_t(state.range(1)));

  for (auto _ : state) {
    gribscan::BufferReader reader{bytes};
    auto ranges = gribscan::ScanMessages(reader);
    benchmark::DoNotOptimize(ranges.data());
  }
  state.SetBytesProcessed(int64_t(state.iterations()) * int64_t(bytes.size()));
}

static void BM_ScanBufferEdition1Scaled(benchmark::State& state) {
  gribscan::ByteArray bytes;
  AppendEdition1Scaled(bytes, size_t(state.range(0)));

  for (auto _ : state) {
    gribscan::BufferReader reader{bytes};
    auto ranges = gribscan::ScanMessages(reader);
    benchmark::DoNotOptimize(ranges.data());
  }
  state.SetBytesProcessed(int64_t(state.iterations()) * int64_t(bytes.size()));
}

static void BM_ScanFile(benchmark::State& state) {
  gribscan::ByteArray bytes;
  AppendEdition2(bytes, size_t(state.range(0)), 4096);
  WriteFile(BenchmarkFile, bytes);

  for (auto _ : state) {
    std::FILE* file = std::fopen(BenchmarkFile, "rb");
    if (!file) {
      state.SkipWithError("failed to open benchmark file");
      break;
    }
    gribscan::FileReader reader{file};
    auto ranges = gribscan::ScanMessages(reader);
    benchmark::DoNotOptimize(ranges.data());
    std::fclose(file);
  }

  std::remove(BenchmarkFile);
}

static void BM_IndexCache(benchmark::State& state) {
  const bool useCache = state.range(1) != 0;
  gribscan::ByteArray bytes;
  AppendEdition2(bytes, size_t(state.range(0)), 4096);
  WriteFile(BenchmarkFile, bytes);

  // With the cache enabled, every iteration after the first loads the sidecar
  const gribscan::IndexCache cache{gribscan::CacheLocator{BenchmarkCacheDir}, useCache};
  for (auto _ : state) {
    gribscan::GribIndex index;
    if (const auto status = cache.buildOrLoad(BenchmarkFile, &index); !status.ok()) {
      state.SkipWithError(status.message.c_str());
      break;
    }
    benchmark::DoNotOptimize(index.offsets.data());
  }

  std::remove(BenchmarkFile);
  std::error_code ec;
  std::filesystem::remove_all(BenchmarkCacheDir, ec);
}

int main(int argc, char* argv[]) {
  benchmark::RegisterBenchmark("BM_ScanBufferEdition2", BM_ScanBufferEdition2)
    ->Args({100, 64})
    ->Args({100, 65536})
    ->Args({10000, 64})
    ->Args({10000, 4096});
  benchmark::RegisterBenchmark("BM_ScanBufferEdition1Scaled", BM_ScanBufferEdition1Scaled)
    ->Arg(100)
    ->Arg(10000);
  benchmark::RegisterBenchmark("BM_ScanFile", BM_ScanFile)->Arg(100)->Arg(1000)->Arg(10000);
  benchmark::RegisterBenchmark("BM_IndexCache", BM_IndexCache)
    ->Args({1000, 0})
    ->Args({1000, 1})
    ->Args({10000, 0})
    ->Args({10000, 1});
  benchmark::Initialize(&argc, argv);
  benchmark::RunSpecifiedBenchmarks();

  return 0;
}
