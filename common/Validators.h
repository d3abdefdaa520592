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
 * Assertions on personal codes and their parts. Every check throws
 * ValidationError describing the field, the offending value and the
 * accepted range.
 */
namespace Validators
{

/**
 * No duplicates and every element passes validCode().
 */
void constructorList( const QStringList &codes );
void correctChecksum( const QString &code );

/**
 * Arguments of enumerate(): gender tags m/f, days 1-31, months 1-12 and
 * years 1800-2199. Order numbers are checked with orderNumberRange().
 */
void enumArguments( const QStringList &genders, const QList<int> &days,
	const QList<int> &months, const QList<int> &years );

/**
 * @param date ISO 8601 date (YYYY-MM-DD)
 */
QDate existingDate( const QString &date );
QDate existingDate( int year, int month, int day );
void firstDigit( const QString &code );
Gender gender( const QString &tag );

/**
 * Same checks as validCode() without throwing.
 */
bool isValid( const QString &code );
void numeric( const QString &value );
void orderNumberRange( int orderNumber );

/**
 * Numeric, 11 digits, first digit 1-8, correct checksum, existing birthdate
 * with a year in 1800-2199.
 */
void validCode( const QString &code );
void yearRange( int year );

}

}
