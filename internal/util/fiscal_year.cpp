#include "fiscal_year.hpp"

namespace fraudit::util {

using std::chrono::day;
using std::chrono::month;
using std::chrono::year;

int StateFiscalYear(const Date& d) {
  const int y = static_cast<int>(d.year());
  return static_cast<unsigned>(d.month()) >= 9 ? y + 1 : y;
}

int FederalFiscalYear(const Date& d) {
  const int y = static_cast<int>(d.year());
  return static_cast<unsigned>(d.month()) >= 10 ? y + 1 : y;
}

Date StateFiscalYearStart(int fy) {
  return Date{year{fy - 1}, month{9}, day{1}};
}

Date StateFiscalYearEnd(int fy) {
  return Date{year{fy}, month{8}, day{31}};
}

Date FederalFiscalYearStart(int fy) {
  return Date{year{fy - 1}, month{10}, day{1}};
}

Date FederalFiscalYearEnd(int fy) {
  return Date{year{fy}, month{9}, day{30}};
}

} // namespace fraudit::util
