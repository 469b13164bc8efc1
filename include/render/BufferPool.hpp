#pragma once

#include "render/ScreenBuffer.hpp"
#include <cstddef>
#include <memory>
#include <vector>

namespace tessera::render {

struct PoolConfig {
  int rows{24};
  int cols{80};
  std::size_t initial_size{5};
  std::size_t max_size{50};
};

// Recycles buffers of one fixed size. Ownership moves out on acquire() and
// back on release(); a pool never holds more than max_size buffers.
class BufferPool {
public:
  explicit BufferPool(const PoolConfig& config);
  BufferPool(const BufferPool&) = delete;
  BufferPool& operator=(const BufferPool&) = delete;

  // Always returns a cleared buffer.
  [[nodiscard]] std::unique_ptr<ScreenBuffer> acquire();
  // Buffers of another size, or beyond capacity, are dropped.
  void release(std::unique_ptr<ScreenBuffer> buf);

  [[nodiscard]] std::size_t size() const noexcept { return free_.size(); }
  [[nodiscard]] const PoolConfig& config() const noexcept { return config_; }
  [[nodiscard]] bool matches(int rows, int cols) const noexcept {
    return config_.rows == rows && config_.cols == cols;
  }
  void clear() noexcept { free_.clear(); }

private:
  PoolConfig config_;
  std::vector<std::unique_ptr<ScreenBuffer>> free_;
};

// Hands out the pool for the current dimensions, rebuilding it whenever the
// dimensions change. Pools are shared, so callers keep the pool (and their
// acquired buffers) valid across a rebuild or reset.
class PoolRegistry {
public:
  explicit PoolRegistry(std::size_t initial_size = 5, std::size_t max_size = 50)
      : initial_size_(initial_size), max_size_(max_size) {}

  [[nodiscard]] std::shared_ptr<BufferPool> pool_for(int rows, int cols);
  // A custom pool is used while its dimensions match the request.
  void set_pool(std::shared_ptr<BufferPool> pool);
  void reset();
  void set_limits(std::size_t initial_size, std::size_t max_size);

private:
  std::size_t initial_size_;
  std::size_t max_size_;
  std::shared_ptr<BufferPool> pool_;
};

// Process-wide registry used when no explicit one is supplied.
PoolRegistry& global_pool_registry();
[[nodiscard]] std::shared_ptr<BufferPool> global_buffer_pool(int rows = 24, int cols = 80);
void set_global_buffer_pool(std::shared_ptr<BufferPool> pool);
void reset_global_buffer_pool();

} // namespace tessera::render
