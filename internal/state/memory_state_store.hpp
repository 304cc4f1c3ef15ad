#pragma once

#include <cstddef>

#include "internal/state/state_store.hpp"

namespace mvtracker::state {

class MemoryStateStore final : public StateStore {
 public:
  MemoryStateStore() = default;
  explicit MemoryStateStore(StateMap initial) : committed_(std::move(initial)) {
  }

  StateMap Load() override {
    return committed_;
  }

  void Save(const StateMap& state) override {
    committed_ = state;
    ++save_count_;
  }

  const StateMap& committed() const {
    return committed_;
  }

  std::size_t save_count() const {
    return save_count_;
  }

 private:
  StateMap    committed_;
  std::size_t save_count_ = 0;
};

} // namespace mvtracker::state
