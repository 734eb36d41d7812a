#include "cmsketch/snapshot.hpp"
#include "cmsketch/error.hpp"
#include <fstream>
#include <iterator>

#include "nlohmann/json.hpp"

using cmsketch::errc;
using cmsketch::make_error;
using cmsketch::result;

namespace cmsketch::snapshot {

auto to_string(const sketch& s, int indent) -> std::string {
  return s.serialize().dump(indent);
}

auto from_string(std::string_view text, const diagnostic_sink& sink) -> result<sketch> {
  const nlohmann::json j = nlohmann::json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) {
    return result<sketch>::from_error(make_error(errc::invalid_format, "not valid JSON"));
  }
  return sketch::deserialize(j, sink);
}

auto save_file(const sketch& s, const std::string& path) -> result<void> {
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (!out.is_open()) {
    return result<void>::from_error(make_error(errc::io_error, "cannot open " + path));
  }
  out << to_string(s) << '\n';
  out.flush();
  if (!out) {
    return result<void>::from_error(make_error(errc::io_error, "write failed: " + path));
  }
  return {};
}

auto load_file(const std::string& path, const diagnostic_sink& sink) -> result<sketch> {
  std::ifstream in(path, std::ios::in);
  if (!in.is_open()) {
    return result<sketch>::from_error(make_error(errc::io_error, "cannot open " + path));
  }
  const std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  if (in.bad()) {
    return result<sketch>::from_error(make_error(errc::io_error, "read failed: " + path));
  }
  auto r = from_string(text, sink);
  if (!r) {
    r.error().append_context(path);
  }
  return r;
}

} // namespace cmsketch::snapshot
