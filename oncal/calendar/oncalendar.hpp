/*
 * oncalendar.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-3-14

Description: Umbrella header for the calendar module

**************************************************/

#ifndef ONCAL_CALENDAR_ONCALENDAR_HPP
#define ONCAL_CALENDAR_ONCALENDAR_HPP

#include "oncal/calendar/backward_iterator.hpp"
#include "oncal/calendar/expression.hpp"
#include "oncal/calendar/field_parser.hpp"
#include "oncal/calendar/timestamp.hpp"

#endif  // ONCAL_CALENDAR_ONCALENDAR_HPP
