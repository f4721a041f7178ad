#ifndef CASCADE_SNAPSHOT_CATEGORY_ADAPTER_HPP
#define CASCADE_SNAPSHOT_CATEGORY_ADAPTER_HPP
/**
 * @file CategoryAdapter.hpp
 * @brief Pull interface for one hardware category.
 *
 * An adapter returns its category payload, or nullopt when the pull failed.
 * It may also throw; the composer treats both the same way.
 */

#include "src/snapshot/inc/Snapshot.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cascade {
namespace snapshot {

/* ----------------------------- CategoryAdapter ----------------------------- */

template <typename Payload> class CategoryAdapter {
public:
  using PayloadType = Payload;

  virtual ~CategoryAdapter() = default;

  /// Short name for log lines.
  [[nodiscard]] virtual const char* name() const noexcept = 0;

  /// Pull the current payload; nullopt on failure.
  [[nodiscard]] virtual std::optional<Payload> collect() = 0;
};

/**
 * @brief Adapter backed by a callable.
 *
 * Used for tests and for wiring sources that are plain functions.
 */
template <typename Payload> class FunctionAdapter final : public CategoryAdapter<Payload> {
public:
  using Fn = std::function<std::optional<Payload>()>;

  FunctionAdapter(std::string name, Fn fn) : name_(std::move(name)), fn_(std::move(fn)) {}

  [[nodiscard]] const char* name() const noexcept override { return name_.c_str(); }
  [[nodiscard]] std::optional<Payload> collect() override { return fn_(); }

private:
  std::string name_;
  Fn fn_;
};

/* ----------------------------- AdapterSet ----------------------------- */

using CpuAdapter = CategoryAdapter<CpuData>;
using GpuAdapter = CategoryAdapter<std::vector<GpuData>>;
using MemoryAdapter = CategoryAdapter<MemoryData>;
using DiskAdapter = CategoryAdapter<std::vector<DiskData>>;
using NetworkAdapter = CategoryAdapter<std::vector<NetworkData>>;

/**
 * @brief One optional adapter per category.
 *
 * A null adapter is treated like a disabled category.
 */
struct AdapterSet {
  std::unique_ptr<CpuAdapter> cpu{};
  std::unique_ptr<GpuAdapter> gpu{};
  std::unique_ptr<MemoryAdapter> memory{};
  std::unique_ptr<DiskAdapter> disk{};
  std::unique_ptr<NetworkAdapter> network{};
};

} // namespace snapshot
} // namespace cascade

#endif // CASCADE_SNAPSHOT_CATEGORY_ADAPTER_HPP
