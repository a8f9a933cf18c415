/**
 * @file date_utils.cpp
 * @brief Implementation of calendar helpers
 */

#include "data/date_utils.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace stockbt
{
    namespace dates
    {

        namespace
        {

            struct CivilDate
            {
                int year;
                int month;
                int day;
            };

            bool is_leap(int year)
            {
                return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
            }

            int days_in_month(int year, int month)
            {
                static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
                if (month == 2 && is_leap(year))
                    return 29;
                return DAYS[month - 1];
            }

            bool all_digits(const std::string &s, size_t pos, size_t len)
            {
                for (size_t i = pos; i < pos + len; ++i)
                {
                    if (!std::isdigit(static_cast<unsigned char>(s[i])))
                        return false;
                }
                return true;
            }

            bool parse(const std::string &date, CivilDate &out)
            {
                if (date.size() != 10 || date[4] != '-' || date[7] != '-')
                    return false;
                if (!all_digits(date, 0, 4) || !all_digits(date, 5, 2) || !all_digits(date, 8, 2))
                    return false;

                out.year = std::stoi(date.substr(0, 4));
                out.month = std::stoi(date.substr(5, 2));
                out.day = std::stoi(date.substr(8, 2));

                if (out.month < 1 || out.month > 12)
                    return false;
                if (out.day < 1 || out.day > days_in_month(out.year, out.month))
                    return false;
                return true;
            }

            // Howard Hinnant's days_from_civil / civil_from_days
            long long days_from_civil(int y, int m, int d)
            {
                y -= m <= 2 ? 1 : 0;
                const long long era = (y >= 0 ? y : y - 399) / 400;
                const unsigned yoe = static_cast<unsigned>(y - era * 400);
                const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
                const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
                return era * 146097 + static_cast<long long>(doe) - 719468;
            }

            CivilDate civil_from_days(long long z)
            {
                z += 719468;
                const long long era = (z >= 0 ? z : z - 146096) / 146097;
                const unsigned doe = static_cast<unsigned>(z - era * 146097);
                const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
                const long long y = static_cast<long long>(yoe) + era * 400;
                const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
                const unsigned mp = (5 * doy + 2) / 153;
                const unsigned d = doy - (153 * mp + 2) / 5 + 1;
                const unsigned m = mp < 10 ? mp + 3 : mp - 9;
                return CivilDate{static_cast<int>(y + (m <= 2 ? 1 : 0)), static_cast<int>(m), static_cast<int>(d)};
            }

        } // anonymous namespace

        bool is_valid_date(const std::string &date)
        {
            CivilDate c{};
            return parse(date, c);
        }

        std::string normalize(const std::string &date)
        {
            if (date.size() == 8 && all_digits(date, 0, 8))
            {
                std::string iso = date.substr(0, 4) + "-" + date.substr(4, 2) + "-" + date.substr(6, 2);
                if (is_valid_date(iso))
                    return iso;
            }
            else if (is_valid_date(date))
            {
                return date;
            }
            throw std::invalid_argument("Expected date as YYYY-MM-DD or YYYYMMDD, got: '" + date + "'");
        }

        long long days_since_epoch(const std::string &date)
        {
            CivilDate c{};
            if (!parse(date, c))
            {
                throw std::invalid_argument("Invalid date (expected YYYY-MM-DD): '" + date + "'");
            }
            return days_from_civil(c.year, c.month, c.day);
        }

        std::string from_days_since_epoch(long long days)
        {
            CivilDate c = civil_from_days(days);
            char buffer[16];
            std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", c.year, c.month, c.day);
            return std::string(buffer);
        }

        std::string add_days(const std::string &date, int days_offset)
        {
            return from_days_since_epoch(days_since_epoch(date) + days_offset);
        }

        long long days_between(const std::string &from, const std::string &to)
        {
            return days_since_epoch(to) - days_since_epoch(from);
        }

        int day_of_week(const std::string &date)
        {
            // 1970-01-01 was a Thursday
            long long d = days_since_epoch(date);
            long long w = (d + 3) % 7;
            if (w < 0)
                w += 7;
            return static_cast<int>(w);
        }

    } // namespace dates
} // namespace stockbt
