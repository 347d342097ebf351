#include "granularity.hpp"
#include <cstdio>
#include <stdexcept>

namespace finsight {

std::string to_string(Granularity granularity) {
    switch (granularity) {
        case Granularity::Week: return "week";
        case Granularity::Month: return "month";
        case Granularity::Quarter: return "quarter";
        case Granularity::Year: return "year";
        case Granularity::AllTime: return "allTime";
    }
    return "unknown";
}

Granularity granularity_from_string(const std::string& text) {
    if (text == "week") return Granularity::Week;
    if (text == "month") return Granularity::Month;
    if (text == "quarter") return Granularity::Quarter;
    if (text == "year") return Granularity::Year;
    if (text == "allTime" || text == "all_time" || text == "all") return Granularity::AllTime;
    throw std::invalid_argument("Unknown granularity: " + text);
}

const std::vector<Granularity>& all_granularities() {
    static const std::vector<Granularity> values = {
        Granularity::Week, Granularity::Month, Granularity::Quarter,
        Granularity::Year, Granularity::AllTime
    };
    return values;
}

DateWindow granularity_window(Granularity granularity,
                              std::optional<Timestamp> first_transaction_date,
                              Timestamp now) {
    Timestamp end = start_of_day(add_days(now, 1));

    switch (granularity) {
        case Granularity::Week:
            return DateWindow{add_weeks(start_of_week(now), -52), end};
        case Granularity::Month: {
            Timestamp earliest = first_transaction_date.value_or(add_months(now, -12));
            return DateWindow{start_of_month(earliest), end};
        }
        case Granularity::Quarter: {
            Timestamp earliest = first_transaction_date.value_or(add_months(now, -12));
            return DateWindow{start_of_quarter(earliest), end};
        }
        case Granularity::Year: {
            Timestamp earliest = first_transaction_date.value_or(add_years(now, -3));
            return DateWindow{start_of_year(earliest), end};
        }
        case Granularity::AllTime:
            return DateWindow{first_transaction_date.value_or(now), end};
    }
    return DateWindow{end, end};
}

std::string period_key(Granularity granularity, Timestamp date) {
    char buffer[16];
    CivilDate c = to_civil(date);

    switch (granularity) {
        case Granularity::Week: {
            IsoWeek w = iso_week(date);
            std::snprintf(buffer, sizeof(buffer), "%04d-W%02u", w.year, w.week);
            return buffer;
        }
        case Granularity::Month:
            std::snprintf(buffer, sizeof(buffer), "%04d-%02u", c.year, c.month);
            return buffer;
        case Granularity::Quarter:
            std::snprintf(buffer, sizeof(buffer), "%04d-Q%u", c.year, (c.month - 1) / 3 + 1);
            return buffer;
        case Granularity::Year:
            std::snprintf(buffer, sizeof(buffer), "%04d", c.year);
            return buffer;
        case Granularity::AllTime:
            return "all";
    }
    return "";
}

Timestamp period_start(Granularity granularity, Timestamp date) {
    switch (granularity) {
        case Granularity::Week: return start_of_week(date);
        case Granularity::Month: return start_of_month(date);
        case Granularity::Quarter: return start_of_quarter(date);
        case Granularity::Year: return start_of_year(date);
        case Granularity::AllTime: return date;
    }
    return date;
}

Timestamp advance_period(Granularity granularity, Timestamp t) {
    switch (granularity) {
        case Granularity::Week: return add_weeks(t, 1);
        case Granularity::Month: return add_months(t, 1);
        case Granularity::Quarter: return add_months(t, 3);
        case Granularity::Year: return add_years(t, 1);
        case Granularity::AllTime: return t;
    }
    return t;
}

Timestamp period_start_for_key(Granularity granularity, const std::string& key) {
    int year = 0;
    unsigned part = 0;

    switch (granularity) {
        case Granularity::Week:
            if (std::sscanf(key.c_str(), "%d-W%u", &year, &part) == 2 && part >= 1 && part <= 53) {
                return iso_week_start(year, part);
            }
            break;
        case Granularity::Month:
            if (std::sscanf(key.c_str(), "%d-%u", &year, &part) == 2 && part >= 1 && part <= 12) {
                return make_date(year, part, 1);
            }
            break;
        case Granularity::Quarter:
            if (std::sscanf(key.c_str(), "%d-Q%u", &year, &part) == 2 && part >= 1 && part <= 4) {
                return make_date(year, (part - 1) * 3 + 1, 1);
            }
            break;
        case Granularity::Year:
            if (std::sscanf(key.c_str(), "%d", &year) == 1) {
                return make_date(year, 1, 1);
            }
            break;
        case Granularity::AllTime:
            throw std::invalid_argument("The all-time bucket has no calendar start");
    }
    throw std::invalid_argument("Malformed " + to_string(granularity) + " key: " + key);
}

std::string period_label(Granularity granularity, Timestamp period_start, Timestamp now) {
    CivilDate c = to_civil(period_start);
    char buffer[32];

    switch (granularity) {
        case Granularity::Week: {
            int week_year = iso_week(period_start).year;
            int current_year = iso_week(now).year;
            if (week_year == current_year) {
                std::snprintf(buffer, sizeof(buffer), "%u %s", c.day, month_abbreviation(c.month));
            } else {
                std::snprintf(buffer, sizeof(buffer), "%u %s'%02d", c.day, month_abbreviation(c.month),
                              ((week_year % 100) + 100) % 100);
            }
            return buffer;
        }
        case Granularity::Month:
            std::snprintf(buffer, sizeof(buffer), "%s %04d", month_abbreviation(c.month), c.year);
            return buffer;
        case Granularity::Quarter:
            std::snprintf(buffer, sizeof(buffer), "Q%u %04d", (c.month - 1) / 3 + 1, c.year);
            return buffer;
        case Granularity::Year:
            std::snprintf(buffer, sizeof(buffer), "%04d", c.year);
            return buffer;
        case Granularity::AllTime:
            return "All time";
    }
    return "";
}

std::string current_period_key(Granularity granularity, Timestamp reference) {
    return period_key(granularity, reference);
}

std::string previous_period_key(Granularity granularity, Timestamp reference) {
    switch (granularity) {
        case Granularity::Week: return period_key(granularity, add_weeks(reference, -1));
        case Granularity::Month: return period_key(granularity, add_months(reference, -1));
        case Granularity::Quarter: return period_key(granularity, add_months(reference, -3));
        case Granularity::Year: return period_key(granularity, add_years(reference, -1));
        case Granularity::AllTime: return period_key(granularity, reference);
    }
    return "";
}

std::string comparison_period_name(Granularity granularity) {
    switch (granularity) {
        case Granularity::Week: return "vs prev. week";
        case Granularity::Month: return "vs prev. month";
        case Granularity::Quarter: return "vs prev. quarter";
        case Granularity::Year: return "vs prev. year";
        case Granularity::AllTime: return "";
    }
    return "";
}

std::string period_over_period_title(Granularity granularity) {
    switch (granularity) {
        case Granularity::Week: return "Weekly Spending Change";
        case Granularity::Quarter: return "Quarterly Spending Change";
        case Granularity::Year: return "Yearly Spending Change";
        case Granularity::Month:
        case Granularity::AllTime: return "Monthly Spending Change";
    }
    return "";
}

std::string best_period_title(Granularity granularity) {
    switch (granularity) {
        case Granularity::Week: return "Best Week";
        case Granularity::Month: return "Best Month";
        case Granularity::Quarter: return "Best Quarter";
        case Granularity::Year: return "Best Year";
        case Granularity::AllTime: return "Best Period";
    }
    return "";
}

std::string worst_period_title(Granularity granularity) {
    switch (granularity) {
        case Granularity::Week: return "Worst Week";
        case Granularity::Month: return "Worst Month";
        case Granularity::Quarter: return "Worst Quarter";
        case Granularity::Year: return "Worst Year";
        case Granularity::AllTime: return "Worst Period";
    }
    return "";
}

std::string total_recurring_title(Granularity granularity) {
    switch (granularity) {
        case Granularity::Week: return "Weekly Recurring";
        case Granularity::Quarter: return "Quarterly Recurring";
        case Granularity::Year: return "Yearly Recurring";
        case Granularity::Month:
        case Granularity::AllTime: return "Monthly Recurring";
    }
    return "";
}

std::string period_unit(Granularity granularity) {
    switch (granularity) {
        case Granularity::Week: return "per week";
        case Granularity::Quarter: return "per quarter";
        case Granularity::Year: return "per year";
        case Granularity::Month:
        case Granularity::AllTime: return "per month";
    }
    return "";
}

double monthly_to_period_multiplier(Granularity granularity) {
    switch (granularity) {
        case Granularity::Week: return 7.0 / 30.0;
        case Granularity::Quarter: return 3.0;
        case Granularity::Year: return 12.0;
        case Granularity::Month:
        case Granularity::AllTime: return 1.0;
    }
    return 1.0;
}

} // namespace finsight
