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

#include "Exception.h"

using namespace IK;

static const char BUG_MSG[] =
	"Internal error, generated codes failed validation. Please report this: ";

Exception::Exception( const char *file, int line, const QString &msg, ExceptionCode code )
:	std::runtime_error( msg.toStdString() )
,	m_file( QString::fromLocal8Bit( file ) )
,	m_msg( msg )
,	m_line( line )
,	m_code( code )
{}

Exception::ExceptionCode Exception::code() const { return m_code; }
QString Exception::field() const { return m_field; }
QString Exception::file() const { return m_file; }
int Exception::line() const { return m_line; }
QString Exception::message() const { return m_msg; }
QString Exception::value() const { return m_value; }

void Exception::setField( const QString &field, const QString &value )
{
	m_field = field;
	m_value = value;
}



ValidationError::ValidationError( const char *file, int line, ExceptionCode code,
		const QString &field, const QString &value, const QString &msg )
:	Exception( file, line, msg, code )
{
	setField( field, value );
}



InvariantViolation::InvariantViolation( const char *file, int line, const Exception &cause )
:	Exception( file, line, QString( BUG_MSG ) + cause.message(), cause.code() )
{
	setField( cause.field(), cause.value() );
}
