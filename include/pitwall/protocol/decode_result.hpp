#pragma once

#include <optional>
#include <utility>

namespace pitwall::protocol {

/// Why a decode attempt produced no value.
enum class DecodeError {
    None,
    TooShort,        // buffer ends before the requested header or record
    InvalidCarIndex, // car index outside the per-car array
    FieldOutOfRange, // a normalised float field lies outside its wire range
};

[[nodiscard]] constexpr const char *decode_error_name(DecodeError error) {
    switch (error) {
    case DecodeError::None:
        return "None";
    case DecodeError::TooShort:
        return "TooShort";
    case DecodeError::InvalidCarIndex:
        return "InvalidCarIndex";
    case DecodeError::FieldOutOfRange:
        return "FieldOutOfRange";
    }
    return "Unknown";
}

/// Value-or-error returned by every decode entry point.
/// Decoding never throws; callers branch on the result.
template <typename T> class DecodeResult {
  public:
    static DecodeResult ok(T value) { return DecodeResult(std::move(value)); }
    static DecodeResult fail(DecodeError error) { return DecodeResult(error); }

    [[nodiscard]] bool has_value() const { return value_.has_value(); }
    explicit operator bool() const { return value_.has_value(); }

    [[nodiscard]] DecodeError error() const { return error_; }

    [[nodiscard]] const T &value() const & { return value_.value(); }
    [[nodiscard]] T &&value() && { return std::move(value_).value(); }

    const T &operator*() const & { return *value_; }
    const T *operator->() const { return &*value_; }

  private:
    explicit DecodeResult(T value) : value_(std::move(value)) {}
    explicit DecodeResult(DecodeError error) : error_(error) {}

    std::optional<T> value_;
    DecodeError error_ = DecodeError::None;
};

} // namespace pitwall::protocol
