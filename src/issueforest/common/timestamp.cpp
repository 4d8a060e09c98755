/**
 * @file timestamp.cpp
 */
#include "issueforest/common/timestamp.hpp"

#include <cctype>
#include <cstdio>

namespace issueforest
{

namespace
{

// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) noexcept
{
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) noexcept
{
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0);
}

bool is_leap_year(int64_t y) noexcept
{
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(int64_t y, unsigned m) noexcept
{
    static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap_year(y))
    {
        return 29;
    }
    return kDays[m - 1];
}

/// Cursor over the timestamp text; every reader returns false on mismatch.
class Scanner
{
public:
    explicit Scanner(const std::string& text, size_t begin, size_t end)
        : m_text(text)
        , m_pos(begin)
        , m_end(end)
    {
    }

    bool digits(size_t count, unsigned& out)
    {
        if (m_end - m_pos < count)
        {
            return false;
        }
        unsigned value = 0;
        for (size_t i = 0; i < count; ++i)
        {
            char c = m_text[m_pos + i];
            if (!std::isdigit(static_cast<unsigned char>(c)))
            {
                return false;
            }
            value = value * 10 + static_cast<unsigned>(c - '0');
        }
        m_pos += count;
        out = value;
        return true;
    }

    bool literal(char expected)
    {
        if (m_pos >= m_end || m_text[m_pos] != expected)
        {
            return false;
        }
        ++m_pos;
        return true;
    }

    bool peek(char expected) const
    {
        return m_pos < m_end && m_text[m_pos] == expected;
    }

    bool at_end() const
    {
        return m_pos == m_end;
    }

    char next()
    {
        return m_pos < m_end ? m_text[m_pos++] : '\0';
    }

    /// Reads one or more fraction digits, returned as microseconds (truncated).
    bool fraction(int64_t& micros)
    {
        size_t count = 0;
        int64_t value = 0;
        while (m_pos < m_end && std::isdigit(static_cast<unsigned char>(m_text[m_pos])))
        {
            if (count < 6)
            {
                value = value * 10 + (m_text[m_pos] - '0');
            }
            ++count;
            ++m_pos;
        }
        if (count == 0)
        {
            return false;
        }
        for (size_t i = count; i < 6; ++i)
        {
            value *= 10;
        }
        micros = value;
        return true;
    }

private:
    const std::string& m_text;
    size_t m_pos;
    size_t m_end;
};

} // namespace

std::optional<Timestamp> parse_rfc3339(const std::string& text)
{
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
    {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
    {
        --end;
    }

    Scanner scan(text, begin, end);
    unsigned year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!scan.digits(4, year) || !scan.literal('-') || !scan.digits(2, month) ||
        !scan.literal('-') || !scan.digits(2, day) || !scan.literal('T') ||
        !scan.digits(2, hour) || !scan.literal(':') || !scan.digits(2, minute) ||
        !scan.literal(':') || !scan.digits(2, second))
    {
        return std::nullopt;
    }

    int64_t micros = 0;
    if (scan.literal('.') && !scan.fraction(micros))
    {
        return std::nullopt;
    }

    int64_t offset_seconds = 0;
    if (!scan.literal('Z'))
    {
        char sign = scan.next();
        if (sign != '+' && sign != '-')
        {
            return std::nullopt;
        }
        unsigned off_hour = 0, off_minute = 0;
        if (!scan.digits(2, off_hour) || !scan.literal(':') || !scan.digits(2, off_minute))
        {
            return std::nullopt;
        }
        if (off_hour > 23 || off_minute > 59)
        {
            return std::nullopt;
        }
        offset_seconds = static_cast<int64_t>(off_hour) * 3600 + off_minute * 60;
        if (sign == '-')
        {
            offset_seconds = -offset_seconds;
        }
    }
    if (!scan.at_end())
    {
        return std::nullopt;
    }

    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) ||
        hour > 23 || minute > 59 || second > 59)
    {
        return std::nullopt;
    }

    const int64_t days = days_from_civil(year, month, day);
    const int64_t seconds = days * 86400 + static_cast<int64_t>(hour) * 3600 +
                            static_cast<int64_t>(minute) * 60 + second - offset_seconds;
    return Timestamp{std::chrono::microseconds{seconds * 1000000 + micros}};
}

Timestamp pick_timestamp(std::initializer_list<const std::string*> candidates)
{
    for (const std::string* candidate : candidates)
    {
        if (candidate == nullptr)
        {
            continue;
        }
        if (auto ts = parse_rfc3339(*candidate))
        {
            return *ts;
        }
    }
    return distant_future();
}

Timestamp distant_future() noexcept
{
    const int64_t seconds = days_from_civil(9999, 1, 1) * 86400;
    return Timestamp{std::chrono::microseconds{seconds * 1000000}};
}

std::string format_rfc3339(Timestamp ts)
{
    const int64_t total_micros = ts.time_since_epoch().count();
    int64_t seconds = total_micros / 1000000;
    int64_t micros = total_micros % 1000000;
    if (micros < 0)
    {
        micros += 1000000;
        --seconds;
    }
    int64_t days = seconds / 86400;
    int64_t rem = seconds % 86400;
    if (rem < 0)
    {
        rem += 86400;
        --days;
    }

    int64_t year = 0;
    unsigned month = 0, day = 0;
    civil_from_days(days, year, month, day);

    char buf[48];
    if (micros != 0)
    {
        std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02lld:%02lld:%02lld.%06lldZ",
                      static_cast<long long>(year), month, day,
                      static_cast<long long>(rem / 3600), static_cast<long long>((rem % 3600) / 60),
                      static_cast<long long>(rem % 60), static_cast<long long>(micros));
    }
    else
    {
        std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02lld:%02lld:%02lldZ",
                      static_cast<long long>(year), month, day,
                      static_cast<long long>(rem / 3600), static_cast<long long>((rem % 3600) / 60),
                      static_cast<long long>(rem % 60));
    }
    return buf;
}

} // namespace issueforest
