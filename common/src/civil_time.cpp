#include "civil_time.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>

// Howard Hinnant's days_from_civil / civil_from_days.
long long daysFromCivil(int y, unsigned m, unsigned d) {
  y -= m <= 2;
  const long long era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<long long>(doe) - 719468;
}

void civilFromDays(long long z, int& y, unsigned& m, unsigned& d) {
  z += 719468;
  const long long era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const long long yy = static_cast<long long>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  d = doy - (153 * mp + 2) / 5 + 1;
  m = mp < 10 ? mp + 3 : mp - 9;
  y = static_cast<int>(yy + (m <= 2));
}

static bool isLeap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

static unsigned daysInMonth(int y, unsigned m) {
  static const unsigned k[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return (m == 2 && isLeap(y)) ? 29 : k[m - 1];
}

static bool readDigits(const std::string& s, size_t pos, size_t n, int& out) {
  if (pos + n > s.size()) return false;
  int v = 0;
  for (size_t i = pos; i < pos + n; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    v = v * 10 + (s[i] - '0');
  }
  out = v;
  return true;
}

std::optional<long long> parseIsoDate(const std::string& text) {
  size_t b = 0, e = text.size();
  while (b < e && std::isspace(static_cast<unsigned char>(text[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(text[e - 1]))) --e;
  const std::string s = text.substr(b, e - b);

  int y = 0, m = 0, d = 0;
  if (!readDigits(s, 0, 4, y) || s.size() < 10 || s[4] != '-' || s[7] != '-' ||
      !readDigits(s, 5, 2, m) || !readDigits(s, 8, 2, d)) {
    return std::nullopt;
  }
  if (s.size() > 10 && s[10] != 'T' && s[10] != ' ') return std::nullopt;
  if (m < 1 || m > 12 || d < 1 || static_cast<unsigned>(d) > daysInMonth(y, m)) return std::nullopt;
  return daysFromCivil(y, static_cast<unsigned>(m), static_cast<unsigned>(d));
}

std::string formatIsoDate(long long day) {
  int y; unsigned m, d;
  civilFromDays(day, y, m, d);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", y, m, d);
  return buf;
}

long long todayLocalDay() {
  std::time_t t = std::time(nullptr);
  std::tm tm{};
  localtime_r(&t, &tm);
  return daysFromCivil(tm.tm_year + 1900, static_cast<unsigned>(tm.tm_mon + 1),
                       static_cast<unsigned>(tm.tm_mday));
}

std::optional<std::chrono::system_clock::time_point> parseIsoTimestamp(const std::string& text) {
  auto day = parseIsoDate(text);
  if (!day || text.size() < 19 || text[10] != 'T') return std::nullopt;

  int hh = 0, mm = 0, ss = 0;
  if (!readDigits(text, 11, 2, hh) || text[13] != ':' || !readDigits(text, 14, 2, mm) ||
      text[16] != ':' || !readDigits(text, 17, 2, ss)) {
    return std::nullopt;
  }
  if (hh > 23 || mm > 59 || ss > 60) return std::nullopt;

  size_t pos = 19;
  long long micros = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (digits < 6) { micros = micros * 10 + (text[pos] - '0'); ++digits; }
      ++pos;
    }
    if (digits == 0) return std::nullopt;
    for (; digits < 6; ++digits) micros *= 10;
  }

  const std::string zone = text.substr(pos);
  long long offset_s = 0;
  if (zone.empty() || zone == "Z") {
    offset_s = 0;
  } else if (zone.size() == 6 && (zone[0] == '+' || zone[0] == '-') && zone[3] == ':') {
    int oh = 0, om = 0;
    if (!readDigits(zone, 1, 2, oh) || !readDigits(zone, 4, 2, om)) return std::nullopt;
    offset_s = (oh * 3600LL + om * 60LL) * (zone[0] == '-' ? -1 : 1);
  } else {
    return std::nullopt;
  }

  const long long secs = *day * 86400LL + hh * 3600LL + mm * 60LL + ss - offset_s;
  // system_clock ticks cover only a few centuries around the epoch
  const long long limit = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::duration::max()).count() - 1;
  if (secs > limit || secs < -limit) return std::nullopt;
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::seconds(secs) + std::chrono::microseconds(micros)));
}

std::string formatIsoTimestamp(std::chrono::system_clock::time_point tp) {
  using namespace std::chrono;
  const long long us = duration_cast<microseconds>(tp.time_since_epoch()).count();
  long long secs = us / 1000000;
  long long frac = us % 1000000;
  if (frac < 0) { frac += 1000000; --secs; }
  long long day = secs / 86400;
  long long rem = secs % 86400;
  if (rem < 0) { rem += 86400; --day; }

  char buf[48];
  std::snprintf(buf, sizeof(buf), "%sT%02lld:%02lld:%02lld.%06lld+00:00",
                formatIsoDate(day).c_str(), rem / 3600, (rem % 3600) / 60, rem % 60, frac);
  return buf;
}
