/**
 * @file TimeTools.cpp
 * @brief Implementation of TimeTools.
 */

#include "domain/TimeTools.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace odsmanager::domain {

namespace {

constexpr double kSecondsPerDay = 24.0 * 3600.0;

std::tm ToUtcTm(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    return tm;
}

std::time_t FromUtcTm(std::tm* tm) {
#if defined(_WIN32)
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

std::string Trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c){ return std::tolower(c); });
    return text;
}

bool ReadDigits(const std::string& s, std::size_t& pos, std::size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int value = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const unsigned char c = static_cast<unsigned char>(s[pos + i]);
        if (!std::isdigit(c)) return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    pos += count;
    return true;
}

bool Expect(const std::string& s, std::size_t& pos, char c) {
    if (pos < s.size() && s[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}

// "+10m", "2h", "-1d", "30" (minutes)
std::optional<double> ParseOffsetSeconds(const std::string& text) {
    std::string offset = Trim(text);
    if (offset.empty()) return std::nullopt;
    double multiplier = 60.0;
    switch (offset.back()) {
        case 'd': multiplier = kSecondsPerDay; offset.pop_back(); break;
        case 'h': multiplier = 3600.0; offset.pop_back(); break;
        case 'm': multiplier = 60.0; offset.pop_back(); break;
        case 's': multiplier = 1.0; offset.pop_back(); break;
        default: break;
    }
    try {
        std::size_t used = 0;
        const double value = std::stod(offset, &used);
        if (used != offset.size()) return std::nullopt;
        return value * multiplier;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<Instant> ParseIso(const std::string& text) {
    std::size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!ReadDigits(text, pos, 4, year) || !Expect(text, pos, '-') ||
        !ReadDigits(text, pos, 2, month) || !Expect(text, pos, '-') ||
        !ReadDigits(text, pos, 2, day)) {
        return std::nullopt;
    }

    long long micros = 0;
    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
        ++pos;
        if (!ReadDigits(text, pos, 2, hour) || !Expect(text, pos, ':') || !ReadDigits(text, pos, 2, minute)) {
            return std::nullopt;
        }
        if (Expect(text, pos, ':')) {
            if (!ReadDigits(text, pos, 2, second)) return std::nullopt;
            if (Expect(text, pos, '.')) {
                long long scale = 100000;
                bool any = false;
                while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                    micros += (text[pos] - '0') * scale;
                    scale /= 10;
                    ++pos;
                    any = true;
                }
                if (!any) return std::nullopt;
            }
        }
    }

    int offsetSeconds = 0;
    if (pos < text.size()) {
        if (text[pos] == 'Z') {
            ++pos;
        } else if (text[pos] == '+' || text[pos] == '-') {
            const int sign = text[pos] == '-' ? -1 : 1;
            ++pos;
            int offH = 0, offM = 0;
            if (!ReadDigits(text, pos, 2, offH)) return std::nullopt;
            Expect(text, pos, ':');
            if (!ReadDigits(text, pos, 2, offM)) return std::nullopt;
            offsetSeconds = sign * (offH * 3600 + offM * 60);
        }
    }
    if (pos != text.size()) return std::nullopt;

    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    const std::time_t tt = FromUtcTm(&tm);
    if (tm.tm_mday != day) return std::nullopt; // e.g. Feb 30 normalized into March

    return std::chrono::system_clock::from_time_t(tt)
        + std::chrono::microseconds(micros)
        - std::chrono::seconds(offsetSeconds);
}

} // namespace

std::optional<Instant> TimeTools::InterpretDate(const std::string& input) {
    return InterpretDate(input, std::chrono::system_clock::now());
}

std::optional<Instant> TimeTools::InterpretDate(const std::string& input, Instant now) {
    const std::string text = Trim(input);
    if (text.empty()) return std::nullopt;

    const auto slash = text.find('/');
    if (slash != std::string::npos) {
        auto base = InterpretDate(text.substr(0, slash), now);
        auto offset = ParseOffsetSeconds(text.substr(slash + 1));
        if (!base || !offset) return std::nullopt;
        return AddSeconds(*base, *offset);
    }

    const std::string lowered = ToLower(text);
    if (lowered == "now" || lowered == "today" || lowered == "current") return now;
    if (lowered == "yesterday") return AddSeconds(now, -kSecondsPerDay);
    if (lowered == "tomorrow") return AddSeconds(now, kSecondsPerDay);

    if (text.size() == 4) return ParseIso(text + "-01-01");
    if (text.size() == 7) return ParseIso(text + "-01");
    return ParseIso(text);
}

std::string TimeTools::FormatIso(Instant t) {
    const auto secs = std::chrono::floor<std::chrono::seconds>(t.time_since_epoch());
    const std::tm tm = ToUtcTm(static_cast<std::time_t>(secs.count()));
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return buf;
}

std::string TimeTools::FormatIsoMicros(Instant t) {
    const auto secs = std::chrono::floor<std::chrono::seconds>(t.time_since_epoch());
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(t.time_since_epoch() - secs);
    char frac[8];
    std::snprintf(frac, sizeof(frac), ".%06lld", static_cast<long long>(micros.count()));
    return FormatIso(t) + frac;
}

Instant TimeTools::AddSeconds(Instant t, double seconds) {
    const auto delta = std::chrono::duration_cast<Instant::duration>(std::chrono::duration<double>(seconds));
    return t + delta;
}

double TimeTools::SecondsBetween(Instant a, Instant b) {
    return std::chrono::duration<double>(b - a).count();
}

std::vector<TimeWindow> TimeTools::GenerateObservationTimes(Instant start, const std::vector<double>& durationsSec) {
    std::vector<TimeWindow> windows;
    windows.reserve(durationsSec.size());
    Instant current = start;
    for (double duration : durationsSec) {
        windows.push_back({current, AddSeconds(current, duration)});
        current = AddSeconds(current, duration + 1.0);
    }
    return windows;
}

} // namespace odsmanager::domain
