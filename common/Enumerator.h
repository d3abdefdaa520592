/*
 * Isikukood
 *
 * Copyright (C) 2026 The isikukood authors
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA
 *
 */

#pragma once

#include "Codec.h"

#include <QtCore/QList>
#include <QtCore/QStringList>

namespace IK
{

/**
 * Constraints for enumerate(). A freshly constructed filter holds the
 * defaults: both genders, days 1-31, months 1-12, the current year and
 * order numbers 0-999.
 */
struct EnumFilter
{
	EnumFilter();
	explicit EnumFilter( int currentYear );

	QList<Gender> genders;
	QList<int> days;
	QList<int> months;
	QList<int> years;
	QList<int> orderNumbers;
};

/**
 * Every valid code matching the filter, genders outermost, then years,
 * months, days and order numbers in the order given. Repeated list entries
 * count once and day/month combinations that are not calendar dates are
 * skipped.
 *
 * @throws ValidationError on out of range filter values
 * @throws InvariantViolation if the generated codes fail re-validation
 */
QStringList enumerate( const EnumFilter &filter );

QList<int> range( int first, int last );

}
