#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace cmsketch {

enum class errc : std::uint8_t {
  invalid_dimension = 1,
  invalid_parameter = 2,
  dimension_mismatch = 3,
  invalid_format = 4,
  table_length_mismatch = 5,
  io_error = 6,
  invalid_argument = 7,
};

// Forward declaration for ADL before usage in constructors.
auto make_error_code(errc err) noexcept -> std::error_code;

namespace detail {
class cmsketch_category_impl final : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "cmsketch";
  }
  [[nodiscard]] auto message(int code_value) const -> std::string override {
    switch (static_cast<errc>(code_value)) {
    case errc::invalid_dimension:
      return "width and depth must be positive integers";
    case errc::invalid_parameter:
      return "epsilon and delta must be between 0 and 1 (exclusive)";
    case errc::dimension_mismatch:
      return "cannot merge sketches with different dimensions";
    case errc::invalid_format:
      return "invalid data format for sketch reconstruction";
    case errc::table_length_mismatch:
      return "table length mismatch";
    case errc::io_error:
      return "I/O error";
    case errc::invalid_argument:
      return "invalid argument";
    default:
      return "unknown error";
    }
  }
};

inline auto category_singleton() -> const cmsketch_category_impl& {
  static const cmsketch_category_impl cat{};
  return cat;
}
} // namespace detail

inline auto error_category() noexcept -> const std::error_category& {
  return detail::category_singleton();
}

struct error {
  std::error_code code;
  std::string context;

  error() = default;
  /* implicit */ error(std::error_code err_code) noexcept : code(err_code) {}
  /* implicit */ error(errc err) noexcept : code(make_error_code(err)) {}
  error(std::error_code err_code, std::string_view ctx) : code(err_code), context(ctx) {}
  error(errc err, std::string_view ctx) : code(make_error_code(err)), context(ctx) {}

  explicit operator bool() const noexcept {
    return static_cast<bool>(code);
  }
  [[nodiscard]] auto category() const noexcept -> const char* {
    return code.category().name();
  }
  [[nodiscard]] auto message() const -> std::string {
    return context.empty() ? code.message() : (std::string(code.message()) + ": " + context);
  }
  // Outer layers prepend where they were when the error passed through.
  void append_context(std::string_view outer) {
    if (context.empty()) {
      context = std::string(outer);
    } else {
      context = std::string(outer) + ": " + context;
    }
  }

  friend auto operator==(const error& lhs, const error& rhs) noexcept -> bool {
    return lhs.code == rhs.code && lhs.context == rhs.context;
  }
};

inline auto make_error(errc err, std::string_view ctx = {}) -> error {
  return error{make_error_code(err), ctx};
}

} // namespace cmsketch

// Integrate with <system_error>
namespace std {
template <> struct is_error_code_enum<cmsketch::errc> : true_type {};
} // namespace std

namespace cmsketch {
inline auto make_error_code(errc err) noexcept -> std::error_code {
  return {static_cast<int>(err), error_category()};
}
} // namespace cmsketch
