#include "mdquery/predicate/date_value.hpp"

#include <ctime>

#include "mdquery/predicate/predicate.hpp"

namespace mdquery {

namespace {

std::tm to_utc_tm(TimePoint tp) {
  std::time_t t = Clock::to_time_t(tp);
  std::tm tm_struct = {};
  gmtime_r(&t, &tm_struct);
  return tm_struct;
}

TimePoint from_utc_tm(std::tm tm_struct) {
  return Clock::from_time_t(timegm(&tm_struct));
}

bool is_leap_year(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 1 && is_leap_year(year)) return 29;
  return kDays[month];
}

// Adds calendar months, clamping the day (Mar 31 - 1 month = Feb 29/28).
TimePoint add_months(TimePoint tp, int months) {
  auto sub_second = tp - Clock::from_time_t(Clock::to_time_t(tp));
  std::tm tm_struct = to_utc_tm(tp);
  int total = tm_struct.tm_year * 12 + tm_struct.tm_mon + months;
  int year = total / 12;
  int month = total % 12;
  if (month < 0) {
    month += 12;
    year -= 1;
  }
  tm_struct.tm_year = year;
  tm_struct.tm_mon = month;
  int max_day = days_in_month(year + 1900, month);
  if (tm_struct.tm_mday > max_day) tm_struct.tm_mday = max_day;
  return from_utc_tm(tm_struct) + sub_second;
}

}  // namespace

DateValue DateValue::within(int amount, DateUnit unit) {
  if (amount < 0) {
    throw PredicateError("within() requires a non-negative amount");
  }
  DateValue value(Kind::Within, unit);
  value.amount_ = amount;
  return value;
}

TimePoint start_of(DateUnit unit, TimePoint tp) {
  std::tm tm_struct = to_utc_tm(tp);
  switch (unit) {
    case DateUnit::Second:
      break;
    case DateUnit::Minute:
      tm_struct.tm_sec = 0;
      break;
    case DateUnit::Hour:
      tm_struct.tm_sec = 0;
      tm_struct.tm_min = 0;
      break;
    case DateUnit::Day:
      tm_struct.tm_sec = 0;
      tm_struct.tm_min = 0;
      tm_struct.tm_hour = 0;
      break;
    case DateUnit::Week: {
      tm_struct.tm_sec = 0;
      tm_struct.tm_min = 0;
      tm_struct.tm_hour = 0;
      int days_since_monday = (tm_struct.tm_wday + 6) % 7;
      return from_utc_tm(tm_struct) - std::chrono::hours(24 * days_since_monday);
    }
    case DateUnit::Month:
      tm_struct.tm_sec = 0;
      tm_struct.tm_min = 0;
      tm_struct.tm_hour = 0;
      tm_struct.tm_mday = 1;
      break;
    case DateUnit::Year:
      tm_struct.tm_sec = 0;
      tm_struct.tm_min = 0;
      tm_struct.tm_hour = 0;
      tm_struct.tm_mday = 1;
      tm_struct.tm_mon = 0;
      break;
  }
  return from_utc_tm(tm_struct);
}

TimePoint add_units(TimePoint tp, DateUnit unit, int amount) {
  switch (unit) {
    case DateUnit::Second:
      return tp + std::chrono::seconds(amount);
    case DateUnit::Minute:
      return tp + std::chrono::minutes(amount);
    case DateUnit::Hour:
      return tp + std::chrono::hours(amount);
    case DateUnit::Day:
      return tp + std::chrono::hours(24) * amount;
    case DateUnit::Week:
      return tp + std::chrono::hours(24 * 7) * amount;
    case DateUnit::Month:
      return add_months(tp, amount);
    case DateUnit::Year:
      return add_months(tp, 12 * amount);
  }
  return tp;
}

DateRange DateValue::resolve(TimePoint now) const {
  switch (kind_) {
    case Kind::This: {
      TimePoint low = start_of(unit_, now);
      return DateRange{low, add_units(low, unit_, 1), false};
    }
    case Kind::Last: {
      TimePoint high = start_of(unit_, now);
      return DateRange{add_units(high, unit_, -1), high, false};
    }
    case Kind::Same: {
      TimePoint low = start_of(unit_, reference_);
      return DateRange{low, add_units(low, unit_, 1), false};
    }
    case Kind::Within:
      return DateRange{add_units(now, unit_, -amount_), now, true};
  }
  return DateRange{now, now, true};
}

}  // namespace mdquery
