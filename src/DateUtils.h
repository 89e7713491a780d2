#ifndef DATEUTILS_H
#define DATEUTILS_H

#include <string>

struct Date {
    int year = 0;
    int month = 0;
    int day = 0;
};

bool operator==(const Date& lhs, const Date& rhs);
bool operator!=(const Date& lhs, const Date& rhs);
bool operator<(const Date& lhs, const Date& rhs);
bool operator<=(const Date& lhs, const Date& rhs);
bool operator>(const Date& lhs, const Date& rhs);
bool operator>=(const Date& lhs, const Date& rhs);

bool isLeapYear(int year);
int daysInMonth(int month, int year);

// Parses "dd-MMM-yyyy", e.g. "10-Nov-2014".
bool parseDate(const std::string& text, Date& date);
std::string formatDate(const Date& date);
std::string formatIsoDate(const Date& date);
bool parseIsoDate(const std::string& text, Date& date);
bool isValidDate(const std::string& text);

#endif // DATEUTILS_H
