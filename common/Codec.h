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

#include <QtCore/QChar>
#include <QtCore/QDate>
#include <QtCore/QString>

namespace IK
{

enum Gender
{
	Male,
	Female
};

/**
 * Returns 'm' or 'f', '?' for a value outside the enum.
 */
QChar genderTag( Gender gender );

/**
 * Check digit of the first 10 digits of a 10 or 11 digit code.
 *
 * Weights 1..9,1 are tried first; when that sum mod 11 is 10 the weights
 * 3..9,1,2,3 are used, and a second 10 yields 0.
 *
 * @throws ValidationError if the code is not numeric or not 10/11 digits long.
 */
int calculateChecksum( const QString &code );

/**
 * @throws ValidationError if the first digit is not 1-8 or the encoded date does not exist.
 */
QDate birthdateFromCode( const QString &code );
Gender genderFromCode( const QString &code );

/**
 * First digit of a code for the given birth year and gender,
 * 1/2 for 1800-1899 up to 7/8 for 2100-2199.
 */
QChar genderMarker( int year, Gender gender );
QChar genderMarker( int year, const QString &genderTag );

/**
 * Replaces or appends the 11th digit with the computed checksum.
 *
 * @param code 10 or 11 characters, the first 10 numeric.
 */
QString insertChecksum( const QString &code );

/**
 * Builds a complete code, checksum included. The date must already be
 * validated, the order number is checked here.
 */
QString makeCode( Gender gender, const QDate &birthdate, int orderNumber );

int orderNumberFromCode( const QString &code );

}
