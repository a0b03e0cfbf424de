#pragma once

#include "mdquery/types/attribute_value.hpp"

namespace mdquery {

enum class DateUnit { Second, Minute, Hour, Day, Week, Month, Year };

// Concrete instant range. Buckets are half-open; within(n, unit) includes
// its upper bound.
struct DateRange {
  TimePoint low;
  TimePoint high;
  bool upper_inclusive = false;
};

/**
 * @class DateValue
 * @brief Symbolic date bucket ("today", "last week", "within 3 days").
 *
 * Resolution happens against an explicit "now" in the UTC calendar; weeks
 * start on Monday.
 */
class DateValue {
 public:
  static DateValue now() { return DateValue(Kind::This, DateUnit::Second); }
  static DateValue this_minute() { return DateValue(Kind::This, DateUnit::Minute); }
  static DateValue last_minute() { return DateValue(Kind::Last, DateUnit::Minute); }
  static DateValue this_hour() { return DateValue(Kind::This, DateUnit::Hour); }
  static DateValue last_hour() { return DateValue(Kind::Last, DateUnit::Hour); }
  static DateValue today() { return DateValue(Kind::This, DateUnit::Day); }
  static DateValue yesterday() { return DateValue(Kind::Last, DateUnit::Day); }
  static DateValue this_week() { return DateValue(Kind::This, DateUnit::Week); }
  static DateValue last_week() { return DateValue(Kind::Last, DateUnit::Week); }
  static DateValue this_month() { return DateValue(Kind::This, DateUnit::Month); }
  static DateValue last_month() { return DateValue(Kind::Last, DateUnit::Month); }
  static DateValue this_year() { return DateValue(Kind::This, DateUnit::Year); }
  static DateValue last_year() { return DateValue(Kind::Last, DateUnit::Year); }

  static DateValue same_hour(TimePoint date) { return DateValue(DateUnit::Hour, date); }
  static DateValue same_day(TimePoint date) { return DateValue(DateUnit::Day, date); }
  static DateValue same_week(TimePoint date) { return DateValue(DateUnit::Week, date); }
  static DateValue same_month(TimePoint date) { return DateValue(DateUnit::Month, date); }
  static DateValue same_year(TimePoint date) { return DateValue(DateUnit::Year, date); }

  // [now - amount * unit, now]
  static DateValue within(int amount, DateUnit unit);

  DateRange resolve(TimePoint now) const;

 private:
  enum class Kind { This, Last, Same, Within };

  DateValue(Kind kind, DateUnit unit) : kind_(kind), unit_(unit) {}
  DateValue(DateUnit unit, TimePoint reference)
      : kind_(Kind::Same), unit_(unit), reference_(reference) {}

  Kind kind_;
  DateUnit unit_;
  int amount_ = 1;
  TimePoint reference_{};
};

// Calendar helpers (UTC).
TimePoint start_of(DateUnit unit, TimePoint tp);
TimePoint add_units(TimePoint tp, DateUnit unit, int amount);

}  // namespace mdquery
