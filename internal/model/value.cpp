#include "internal/model/value.hpp"

#include <sstream>
#include <type_traits>

namespace valuegraph::model {

std::string DebugString(const Value& value) {
  std::ostringstream out;
  out << ToString(TypeOf(value));

  std::visit(
      [&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return;
        } else if constexpr (std::is_same_v<T, bool>) {
          out << ':' << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, std::string>) {
          out << ":\"" << v << '"';
        } else if constexpr (std::is_same_v<T, std::uint8_t> || std::is_same_v<T, std::int8_t>) {
          // keep 8-bit integers from printing as characters
          out << ':' << static_cast<int>(v);
        } else {
          out << ':' << v;
        }
      },
      value);

  return out.str();
}

} // namespace valuegraph::model
