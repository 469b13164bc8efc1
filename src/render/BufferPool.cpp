#include "render/BufferPool.hpp"
#include <algorithm>

namespace tessera::render {

BufferPool::BufferPool(const PoolConfig& config) : config_(config) {
  const auto n = std::min(config_.initial_size, config_.max_size);
  free_.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    free_.push_back(std::make_unique<ScreenBuffer>(config_.rows, config_.cols));
  }
}

std::unique_ptr<ScreenBuffer> BufferPool::acquire() {
  if (!free_.empty()) {
    auto buf = std::move(free_.back());
    free_.pop_back();
    buf->clear();
    return buf;
  }
  return std::make_unique<ScreenBuffer>(config_.rows, config_.cols);
}

void BufferPool::release(std::unique_ptr<ScreenBuffer> buf) {
  if (!buf) return;
  if (!matches(buf->rows(), buf->cols())) return;
  if (free_.size() >= config_.max_size) return;
  buf->clear();
  free_.push_back(std::move(buf));
}

std::shared_ptr<BufferPool> PoolRegistry::pool_for(int rows, int cols) {
  if (pool_ && pool_->matches(rows, cols)) return pool_;
  pool_ = std::make_shared<BufferPool>(PoolConfig{rows, cols, initial_size_, max_size_});
  return pool_;
}

void PoolRegistry::set_pool(std::shared_ptr<BufferPool> pool) { pool_ = std::move(pool); }

void PoolRegistry::reset() { pool_.reset(); }

void PoolRegistry::set_limits(std::size_t initial_size, std::size_t max_size) {
  initial_size_ = initial_size;
  max_size_ = max_size;
}

PoolRegistry& global_pool_registry() {
  static PoolRegistry registry;
  return registry;
}

std::shared_ptr<BufferPool> global_buffer_pool(int rows, int cols) {
  return global_pool_registry().pool_for(rows, cols);
}

void set_global_buffer_pool(std::shared_ptr<BufferPool> pool) {
  global_pool_registry().set_pool(std::move(pool));
}

void reset_global_buffer_pool() { global_pool_registry().reset(); }

} // namespace tessera::render
