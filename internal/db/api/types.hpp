#pragma once

#include <optional>

#include "graphingest/v1.hpp"

namespace graphingest::db {

// Optional narrowing for ListTasksByDataset; unset fields match everything.
struct TaskFilter {
  std::optional<graphingest::v1::FileKind>   kind;
  std::optional<graphingest::v1::TaskStatus> status;
};

} // namespace graphingest::db
