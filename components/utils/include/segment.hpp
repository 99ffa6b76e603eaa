#pragma once
#include "esp_err.h"

namespace utils {

// Half-open pixel range [start, end) of one strip. Immutable once created;
// several animations may share (and overlap) segments.
class StripSegment {
  public:
    // Single pixel [0, 1).
    StripSegment() = default;

    // ESP_ERR_INVALID_ARG when start < 0 or end <= start; `out` is left untouched.
    static esp_err_t create(int start, int end, StripSegment &out);

    int start() const { return start_; }
    int end() const { return end_; }
    int length() const { return end_ - start_; }
    bool contains(int index) const { return index >= start_ && index < end_; }

    bool operator==(const StripSegment &o) const { return start_ == o.start_ && end_ == o.end_; }
    bool operator!=(const StripSegment &o) const { return !(*this == o); }

  private:
    StripSegment(int start, int end) : start_(start), end_(end) {}

    int start_ = 0;
    int end_ = 1;
};

} // namespace utils
