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

#include <QtCore/QString>

#include <stdexcept>

namespace IK
{

class Exception: public std::runtime_error
{
public:
	enum ExceptionCode
	{
		General = 0,
		NotNumeric,
		InvalidLength,
		InvalidFirstDigit,
		InvalidChecksum,
		InvalidDate,
		YearOutOfRange,
		InvalidGender,
		OrderNumberOutOfRange,
		DayOutOfRange,
		MonthOutOfRange,
		DuplicateCode
	};

	Exception( const char *file, int line, const QString &msg, ExceptionCode code = General );

	ExceptionCode code() const;
	QString field() const;
	QString file() const;
	int line() const;
	QString message() const;
	void setField( const QString &field, const QString &value );
	QString value() const;

private:
	QString m_file, m_msg, m_field, m_value;
	int m_line;
	ExceptionCode m_code;
};

/**
 * Caller supplied input violates a constraint of the personal code format.
 */
class ValidationError: public Exception
{
public:
	ValidationError( const char *file, int line, ExceptionCode code,
		const QString &field, const QString &value, const QString &msg );
};

/**
 * Generated codes failed the re-validation done before they are handed out.
 * Always a defect in the codec or enumerator, never bad input.
 */
class InvariantViolation: public Exception
{
public:
	InvariantViolation( const char *file, int line, const Exception &cause );
};

}

#define IK_VALIDATION_ERROR( errorCode, field, value, msg ) \
	IK::ValidationError( __FILE__, __LINE__, IK::Exception::errorCode, field, value, msg )
