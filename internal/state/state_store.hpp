#pragma once

#include "internal/state/group_state.hpp"

namespace mvtracker::state {

/*
  Durable group state, loaded wholesale and saved wholesale.

  - Load() on a missing backing store returns an empty map
  - Save() replaces the previous contents; a concurrent reader sees either
    the old or the new mapping, never a mix
  - single writer per backing store

  Backend failures throw util::StateError.
*/
class StateStore {
 public:
  virtual ~StateStore() = default;

  virtual StateMap Load() = 0;

  virtual void Save(const StateMap& state) = 0;
};

} // namespace mvtracker::state
