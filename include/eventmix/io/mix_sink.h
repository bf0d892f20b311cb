#pragma once

#include <cstdint>

#include "eventmix/core/mix_row.h"

namespace eventmix::io {

// Append-only destination for mixed rows. Row order carries no meaning.
class MixSink {
 public:
  virtual ~MixSink() = default;

  virtual void Append(const core::MixRow& row) = 0;
  virtual int64_t NumRows() const = 0;
};

}  // namespace eventmix::io
