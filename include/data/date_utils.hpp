/**
 * @file date_utils.hpp
 * @brief Calendar helpers for ISO (YYYY-MM-DD) date strings.
 *
 * All arithmetic is done on a proleptic Gregorian day count, so results do
 * not depend on the local time zone or daylight saving rules.
 */

#ifndef STOCKBT_DATA_DATE_UTILS_HPP
#define STOCKBT_DATA_DATE_UTILS_HPP

#include <string>

namespace stockbt
{
    namespace dates
    {

        /**
         * @brief Check that a string is a valid YYYY-MM-DD calendar date.
         */
        bool is_valid_date(const std::string &date);

        /**
         * @brief Normalize a date to YYYY-MM-DD.
         * @param date Date as YYYY-MM-DD or YYYYMMDD.
         * @throws std::invalid_argument if the date cannot be parsed.
         */
        std::string normalize(const std::string &date);

        /**
         * @brief Days since 1970-01-01 for a YYYY-MM-DD date.
         * @throws std::invalid_argument if the date is malformed.
         */
        long long days_since_epoch(const std::string &date);

        /**
         * @brief Inverse of days_since_epoch().
         */
        std::string from_days_since_epoch(long long days);

        /**
         * @brief Shift a date by a (possibly negative) number of calendar days.
         */
        std::string add_days(const std::string &date, int days_offset);

        /**
         * @brief Calendar days from @p from to @p to (negative if to < from).
         */
        long long days_between(const std::string &from, const std::string &to);

        /**
         * @brief Day of week, 0 = Monday ... 6 = Sunday.
         */
        int day_of_week(const std::string &date);

    } // namespace dates
} // namespace stockbt

#endif // STOCKBT_DATA_DATE_UTILS_HPP
