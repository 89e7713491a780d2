#include "DateUtils.h"
#include <cctype>
#include <iomanip>
#include <sstream>
#include <tuple>

static const char* const kMonthNames[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                          "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

static bool allDigits(const std::string& s) {
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return !s.empty();
}

static int monthFromName(const std::string& name) {
    for (int i = 0; i < 12; ++i) {
        if (name == kMonthNames[i]) return i + 1;
    }
    return 0;
}

bool operator==(const Date& lhs, const Date& rhs) {
    return std::tie(lhs.year, lhs.month, lhs.day) == std::tie(rhs.year, rhs.month, rhs.day);
}

bool operator!=(const Date& lhs, const Date& rhs) { return !(lhs == rhs); }

bool operator<(const Date& lhs, const Date& rhs) {
    return std::tie(lhs.year, lhs.month, lhs.day) < std::tie(rhs.year, rhs.month, rhs.day);
}

bool operator<=(const Date& lhs, const Date& rhs) { return !(rhs < lhs); }
bool operator>(const Date& lhs, const Date& rhs) { return rhs < lhs; }
bool operator>=(const Date& lhs, const Date& rhs) { return !(lhs < rhs); }

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

int daysInMonth(int month, int year) {
    static const int days[] = {0, 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) return 29;
    if (month < 1 || month > 12) return 0;
    return days[month];
}

bool parseDate(const std::string& text, Date& date) {
    if (text.size() != 11 || text[2] != '-' || text[6] != '-') return false;

    std::string dayText = text.substr(0, 2);
    std::string yearText = text.substr(7, 4);
    if (!allDigits(dayText) || !allDigits(yearText)) return false;

    int month = monthFromName(text.substr(3, 3));
    if (month == 0) return false;

    int year = std::stoi(yearText);
    int day = std::stoi(dayText);
    if (year < 1) return false;
    if (day < 1 || day > daysInMonth(month, year)) return false;

    date.year = year;
    date.month = month;
    date.day = day;
    return true;
}

std::string formatDate(const Date& date) {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << date.day << "-";
    if (date.month >= 1 && date.month <= 12) {
        oss << kMonthNames[date.month - 1];
    } else {
        oss << "???";
    }
    oss << "-" << std::setw(4) << date.year;
    return oss.str();
}

std::string formatIsoDate(const Date& date) {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << date.year << "-"
        << std::setw(2) << date.month << "-"
        << std::setw(2) << date.day;
    return oss.str();
}

bool parseIsoDate(const std::string& text, Date& date) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return false;
    std::string yearText = text.substr(0, 4);
    std::string monthText = text.substr(5, 2);
    std::string dayText = text.substr(8, 2);
    if (!allDigits(yearText) || !allDigits(monthText) || !allDigits(dayText)) return false;

    int year = std::stoi(yearText);
    int month = std::stoi(monthText);
    int day = std::stoi(dayText);
    if (year < 1) return false;
    if (month < 1 || month > 12) return false;
    if (day < 1 || day > daysInMonth(month, year)) return false;

    date.year = year;
    date.month = month;
    date.day = day;
    return true;
}

bool isValidDate(const std::string& text) {
    Date date;
    return parseDate(text, date);
}
