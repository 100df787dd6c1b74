#include "core/loader.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <filesystem>
#include <format>
#include <fstream>
#include <initializer_list>
#include <map>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr double EXCEL_UNIX_EPOCH = 25569;  // 1970-01-01 as an Excel serial

// Numeric timestamps outside this span overflow int64 once normalized.
constexpr double MIN_EPOCH_INPUT = -9e15;
constexpr double MAX_EPOCH_INPUT = 9e21;

inline std::string trim(const std::string& s) {
  auto first = s.find_first_not_of(" \t\r\n\"");
  if (first == std::string::npos)
    return {};
  auto last = s.find_last_not_of(" \t\r\n\"");
  return s.substr(first, last - first + 1);
}

inline std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

// Commas inside double quotes stay in the field; "" is a literal quote.
std::vector<std::string> split(const std::string& line) {
  std::vector<std::string> fields;
  std::string field;
  bool quoted = false;
  for (size_t i = 0; i < line.size(); i++) {
    char ch = line[i];
    if (ch == '"') {
      if (quoted && i + 1 < line.size() && line[i + 1] == '"') {
        field += '"';
        i++;
      } else {
        quoted = !quoted;
      }
    } else if (ch == ',' && !quoted) {
      fields.push_back(trim(field));
      field.clear();
    } else {
      field += ch;
    }
  }
  if (!field.empty() || (!line.empty() && line.back() != ','))
    fields.push_back(trim(field));
  return fields;
}

std::optional<double> to_double(const std::string& s) {
  if (s.empty())
    return std::nullopt;
  double v = 0.0;
  auto begin = s.data() + (s.front() == '+' ? 1 : 0);
  auto end = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(begin, end, v);
  if (ec != std::errc{} || ptr != end)
    return std::nullopt;
  return v;
}

inline double to_double_or_nan(const std::string& s) {
  return to_double(s).value_or(NAN);
}

// Column positions of a headered file, -1 where absent.
struct Columns {
  int ts = -1, open = -1, high = -1, low = -1, close = -1, volume = -1;
  int mvrvz = -1;

  bool complete() const {
    return ts >= 0 && open >= 0 && high >= 0 && low >= 0 && close >= 0;
  }
};

// First alias present in the header wins, in alias order.
int find_column(const std::map<std::string, int>& header,
                std::initializer_list<const char*> aliases) {
  for (auto alias : aliases)
    if (auto it = header.find(alias); it != header.end())
      return it->second;
  return -1;
}

Columns map_header(const std::vector<std::string>& fields) {
  std::map<std::string, int> header;
  for (int i = 0; i < static_cast<int>(fields.size()); i++)
    header.try_emplace(lower(fields[i]), i);

  return {
      .ts = find_column(header, {"date", "time", "timestamp", "open time",
                                 "opentime", "ts"}),
      .open = find_column(header, {"open", "o"}),
      .high = find_column(header, {"high", "h"}),
      .low = find_column(header, {"low", "l"}),
      .close = find_column(header, {"close", "c"}),
      .volume = find_column(header, {"volume", "vol", "v", "volume(usdt)",
                                     "volume (usdt)"}),
      .mvrvz = find_column(header, {"mvrvz"}),
  };
}

Columns binance_columns() {
  return {.ts = 0, .open = 1, .high = 2, .low = 3, .close = 4, .volume = 5};
}

inline const std::string& field_at(const std::vector<std::string>& fields,
                                   int col) {
  static const std::string empty;
  return col >= 0 && col < static_cast<int>(fields.size()) ? fields[col]
                                                          : empty;
}

std::optional<Candle> parse_row(const std::vector<std::string>& fields,
                                const Columns& cols) {
  auto ts = parse_epoch_ms(field_at(fields, cols.ts));
  if (!ts)
    return std::nullopt;

  Candle c{
      .ts = *ts,
      .open = to_double_or_nan(field_at(fields, cols.open)),
      .high = to_double_or_nan(field_at(fields, cols.high)),
      .low = to_double_or_nan(field_at(fields, cols.low)),
      .close = to_double_or_nan(field_at(fields, cols.close)),
      .volume = to_double_or_nan(field_at(fields, cols.volume)),
  };
  if (!std::isfinite(c.open) || !std::isfinite(c.high) ||
      !std::isfinite(c.low) || !std::isfinite(c.close))
    return std::nullopt;

  if (!std::isfinite(c.volume))
    c.volume = 0.0;
  if (cols.mvrvz >= 0)
    c.mvrvz = to_double_or_nan(field_at(fields, cols.mvrvz));
  return c;
}

std::optional<int64_t> parse_iso(std::string s) {
  if (!s.empty() && (s.back() == 'Z' || s.back() == 'z'))
    s.pop_back();

  constexpr std::array formats{
      "%Y-%m-%dT%H:%M:%S", "%Y-%m-%d %H:%M:%S", "%Y-%m-%dT%H:%M",
      "%Y-%m-%d %H:%M",    "%Y-%m-%d",
  };

  for (auto fmt : formats) {
    std::istringstream ss{s};
    SysTimePoint tp;
    ss >> std::chrono::parse(fmt, tp);
    if (ss.fail())
      continue;
    if (ss.peek() != std::char_traits<char>::eof())
      continue;
    return tp.time_since_epoch().count();
  }
  return std::nullopt;
}

}  // namespace

int64_t normalize_epoch_ms(double v) {
  if (v > 60 && v < 60000) {
    auto ms = (v - EXCEL_UNIX_EPOCH) * MS_PER_DAY;
    if (ms > 0)
      return static_cast<int64_t>(ms);
  }

  if (v < 1e11)
    return static_cast<int64_t>(v * 1000);
  if (v < 1e13)
    return static_cast<int64_t>(v);
  if (v < 1e16)
    return static_cast<int64_t>(std::floor(v / 1e3));
  return static_cast<int64_t>(std::floor(v / 1e6));
}

std::optional<int64_t> parse_epoch_ms(const std::string& s) {
  auto t = trim(s);
  if (t.empty())
    return std::nullopt;

  if (auto v = to_double(t)) {
    if (!std::isfinite(*v) || *v <= MIN_EPOCH_INPUT || *v >= MAX_EPOCH_INPUT)
      return std::nullopt;
    return normalize_epoch_ms(*v);
  }
  return parse_iso(t);
}

Candles read_csv(const std::string& path) {
  if (!fs::exists(path))
    throw std::runtime_error(std::format("[loader] {} not found", path));

  std::ifstream f{path};
  if (!f)
    throw std::runtime_error(std::format("[loader] cannot open {}", path));

  std::string line;
  if (!std::getline(f, line))
    throw std::runtime_error(std::format("[loader] {} is empty", path));

  auto first = split(line);
  bool binance = first.size() >= 6 && to_double(first[0]).has_value();

  Columns cols = binance ? binance_columns() : map_header(first);
  if (!binance && !cols.complete())
    throw std::runtime_error(
        std::format("[loader] {}: header lacks time or OHLC columns", path));

  Candles candles;
  size_t skipped = 0;

  auto take = [&](const std::string& row) {
    if (trim(row).empty())
      return;
    if (auto c = parse_row(split(row), cols)) {
      candles.push_back(*c);
    } else {
      skipped++;
      spdlog::debug("[loader] skipped row '{}'", row);
    }
  };

  if (binance)
    take(line);
  while (std::getline(f, line))
    take(line);

  if (skipped > 0)
    spdlog::warn("[loader] {}: skipped {} malformed rows", path, skipped);

  // last row wins on duplicate timestamps
  std::stable_sort(candles.begin(), candles.end(),
                   [](auto& a, auto& b) { return a.ts < b.ts; });
  Candles unique;
  unique.reserve(candles.size());
  for (auto& c : candles) {
    if (!unique.empty() && unique.back().ts == c.ts)
      unique.back() = c;
    else
      unique.push_back(c);
  }

  if (unique.empty())
    throw std::runtime_error(std::format("[loader] {} has no rows", path));

  spdlog::info("[loader] {}: {} rows {} .. {}", path, unique.size(),
               datetime_to_string(unique.front().ts),
               datetime_to_string(unique.back().ts));
  return unique;
}
