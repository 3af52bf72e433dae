/** \file document.cpp
 *  \brief Document value construction, lookup and rendering.
 */

#include "verdict/document.hpp"

#include <charconv>
#include <type_traits>

namespace verdict {

namespace {
  auto kind_of(const scalar& s) -> value::kind {
    return std::visit([](const auto& x) -> value::kind {
      using T = std::decay_t<decltype(x)>;
      if constexpr (std::is_same_v<T, bool>) return value::kind::boolean;
      else if constexpr (std::is_same_v<T, std::int64_t>) return value::kind::integer;
      else if constexpr (std::is_same_v<T, double>) return value::kind::real;
      else if constexpr (std::is_same_v<T, std::string>) return value::kind::string;
      else return value::kind::null;
    }, s);
  }

  void append_quoted(std::string& out, std::string_view s) {
    out.push_back('"');
    for (char c : s) {
      if (c == '"' || c == '\\') out.push_back('\\');
      out.push_back(c);
    }
    out.push_back('"');
  }

  void render(std::string& out, const value& v) {
    switch (v.type()) {
      case value::kind::list: {
        out.push_back('[');
        for (std::size_t i = 0; i < v.items().size(); ++i) {
          if (i) out.push_back(' ');
          render(out, v.items()[i]);
        }
        out.push_back(']');
        return;
      }
      case value::kind::object: {
        out.push_back('{');
        for (std::size_t i = 0; i < v.items().size(); ++i) {
          if (i) out += ", ";
          out += v.keys()[i];
          out.push_back(' ');
          render(out, v.items()[i]);
        }
        out.push_back('}');
        return;
      }
      default:
        out += to_string(v.as_scalar());
        return;
    }
  }
}

value::value(scalar s) : kind_(kind_of(s)), scalar_(std::move(s)) {}

auto value::list(std::vector<value> items) -> value {
  value v;
  v.kind_ = kind::list;
  v.items_ = std::move(items);
  return v;
}

auto value::object(std::vector<std::pair<std::string, value>> fields) -> value {
  value v;
  v.kind_ = kind::object;
  v.keys_.reserve(fields.size());
  v.items_.reserve(fields.size());
  for (auto& [k, f] : fields) {
    bool replaced = false;
    for (std::size_t i = 0; i < v.keys_.size(); ++i) {
      if (v.keys_[i] == k) { v.items_[i] = std::move(f); replaced = true; break; }
    }
    if (!replaced) {
      v.keys_.push_back(std::move(k));
      v.items_.push_back(std::move(f));
    }
  }
  return v;
}

auto value::find(std::string_view key) const noexcept -> const value* {
  if (kind_ != kind::object) return nullptr;
  for (std::size_t i = 0; i < keys_.size(); ++i) {
    if (keys_[i] == key) {
      return items_[i].is_null() ? nullptr : &items_[i];
    }
  }
  return nullptr;
}

auto value::at(std::span<const std::string> segments) const noexcept -> const value* {
  const value* cur = this;
  for (const auto& seg : segments) {
    cur = cur->find(seg);
    if (!cur) return nullptr;
  }
  return cur;
}

auto to_string(const scalar& s) -> std::string {
  return std::visit([](const auto& x) -> std::string {
    using T = std::decay_t<decltype(x)>;
    if constexpr (std::is_same_v<T, bool>) {
      return x ? "true" : "false";
    } else if constexpr (std::is_same_v<T, std::int64_t>) {
      return std::to_string(x);
    } else if constexpr (std::is_same_v<T, double>) {
      // Shortest form that reads back to the same double.
      char buf[32];
      const auto res = std::to_chars(buf, buf + sizeof(buf), x);
      return std::string(buf, res.ptr);
    } else if constexpr (std::is_same_v<T, std::string>) {
      std::string out;
      append_quoted(out, x);
      return out;
    } else {
      return "nil";
    }
  }, s);
}

auto to_string(const value& v) -> std::string {
  std::string out;
  render(out, v);
  return out;
}

} // namespace verdict
