#include "core/report.h"

#include <spdlog/spdlog.h>
#include <glaze/glaze.hpp>

#include <format>
#include <map>
#include <optional>
#include <stdexcept>

using opt_double = std::optional<double>;

struct ReportBar {
  int64_t ts;
  std::string time;
  double open, high, low, close, volume;
  std::map<std::string, opt_double> extras;
};

struct ReportRow {
  int64_t ts;
  double confidence;
  bool absolute;
  opt_double vsa_score;
  std::vector<std::string> vsa;
};

struct ReportBuy {
  int64_t ts;
  std::string time;
  double confidence;
  bool absolute;
  std::map<std::string, double> parts;
};

struct Report {
  size_t rows;
  size_t days;
  size_t start, end;
  std::vector<ReportBuy> buys;
  std::vector<int64_t> buy_lines;
  std::vector<ReportBar> bars_4h;
  std::vector<ReportRow> confidence;
};

namespace {

inline opt_double nullable(double v) {
  return valid(v) ? opt_double{v} : std::nullopt;
}

std::map<std::string, double> named(const std::optional<Contributions>& parts) {
  std::map<std::string, double> out;
  if (parts)
    for (auto& [c, v] : *parts)
      out.emplace(to_str(c), v);
  return out;
}

ReportRow report_row(const Analysis& a, size_t i) {
  ReportRow row{
      .ts = a.candles[i].ts,
      .confidence = a.confidence[i].value,
      .absolute = a.confidence[i].absolute(),
      .vsa_score = nullable(a.vsa.score[i]),
      .vsa = {},
  };
  for (auto p : vsa_patterns)
    if (a.vsa.pattern(p)[i])
      row.vsa.emplace_back(to_str(p));
  return row;
}

Report build_report(const Analysis& a) {
  Report r{
      .rows = a.candles.size(),
      .days = a.daily.candles.size(),
      .start = a.range.first,
      .end = a.range.second,
      .buys = {},
      .buy_lines = a.buy_lines,
      .bars_4h = {},
      .confidence = {},
  };

  for (auto& b : a.buys)
    r.buys.push_back({b.ts, datetime_to_string(b.ts), b.confidence,
                      !b.parts.has_value(), named(b.parts)});

  for (auto& bar : a.display_4h) {
    auto& c = bar.candle;
    ReportBar out{c.ts,    datetime_to_string(c.ts), c.open, c.high, c.low,
                  c.close, c.volume,                 {}};
    for (auto& [key, v] : bar.extras)
      out.extras.emplace(key, nullable(v));
    r.bars_4h.push_back(std::move(out));
  }

  for (size_t i = a.range.first; i < a.range.second; i++)
    r.confidence.push_back(report_row(a, i));

  return r;
}

}  // namespace

void write_report(const Analysis& a, const std::string& path) {
  auto report = build_report(a);

  constexpr auto opts = glz::opts{
      .skip_null_members = false,
      .prettify = true,
  };
  std::string buffer;
  auto ec = glz::write_file_json<opts>(report, path, buffer);
  if (ec)
    throw std::runtime_error(std::format("[report] error writing {}", path));

  spdlog::info("[report] wrote {} ({} buys, {} bars)", path, report.buys.size(),
               report.bars_4h.size());
}

std::string buy_table(const Analysis& a) {
  if (a.buys.empty())
    return "No buys\n";

  std::string out;
  for (auto& b : a.buys) {
    out += std::format("{}  {:6.2f}  ", datetime_to_string(b.ts), b.confidence);

    if (!b.parts) {
      out += "Absolute\n";
      continue;
    }

    std::string parts;
    for (auto c : components) {
      auto it = b.parts->find(c);
      if (it == b.parts->end() || it->second <= 0)
        continue;
      if (!parts.empty())
        parts += ", ";
      parts += std::format("{}: {:.2f}", to_str(c), it->second);
    }
    out += parts + "\n";
  }
  return out;
}
