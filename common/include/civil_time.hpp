#pragma once
#include <chrono>
#include <optional>
#include <string>

// Calendar helpers on a proleptic Gregorian day count (days since 1970-01-01).

long long daysFromCivil(int y, unsigned m, unsigned d);
void civilFromDays(long long z, int& y, unsigned& m, unsigned& d);

// Accepts "YYYY-MM-DD", optionally followed by a time part ("T..." or " ...").
// Returns nullopt for anything that is not a valid calendar date.
std::optional<long long> parseIsoDate(const std::string& text);
std::string formatIsoDate(long long day);

// Local calendar date of the current wall clock.
long long todayLocalDay();

// UTC timestamps as written by the refresh gate:
// "YYYY-MM-DDTHH:MM:SS[.ffffff][Z|+00:00]".
std::optional<std::chrono::system_clock::time_point> parseIsoTimestamp(const std::string& text);
std::string formatIsoTimestamp(std::chrono::system_clock::time_point tp);
