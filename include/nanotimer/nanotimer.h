#ifndef NANOTIMER_H
#define NANOTIMER_H

#include "nanotimer/clock.h"
#include "nanotimer/config.h"
#include "nanotimer/constants.h"
#include "nanotimer/error.h"
#include "nanotimer/report.h"
#include "nanotimer/timer.h"
#include "nanotimer/timers.h"

#endif // NANOTIMER_H
