#pragma once

#include "internal/util/time.hpp"

namespace fraudit::util {

/*
  Fiscal year conventions.

  Texas state FY N: Sep 1 (N-1) through Aug 31 (N).
  Federal FY N:     Oct 1 (N-1) through Sep 30 (N).
*/

int StateFiscalYear(const Date& d);
int FederalFiscalYear(const Date& d);

Date StateFiscalYearStart(int fy);
Date StateFiscalYearEnd(int fy);
Date FederalFiscalYearStart(int fy);
Date FederalFiscalYearEnd(int fy);

} // namespace fraudit::util
