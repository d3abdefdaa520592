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

#include "Validators.h"

#include "Exception.h"

#include <QtCore/QRegularExpression>
#include <QtCore/QSet>

namespace IK
{

namespace Validators
{

void constructorList( const QStringList &codes )
{
	QSet<QString> seen;
	seen.reserve( codes.size() );
	for( const QString &code: codes )
	{
		if( seen.contains( code ) )
			throw IK_VALIDATION_ERROR( DuplicateCode, "codes", code,
				QString( "Code %1 occurs more than once" ).arg( code ) );
		seen.insert( code );
	}

	for( const QString &code: codes )
		validCode( code );
}

void correctChecksum( const QString &code )
{
	if( code.size() != 11 )
		throw IK_VALIDATION_ERROR( InvalidLength, "code", code,
			QString( "Given code (%1) is %2 digits, expected 11" ).arg( code ).arg( code.size() ) );

	int expected = calculateChecksum( code );
	if( code.at( 10 ).digitValue() != expected )
		throw IK_VALIDATION_ERROR( InvalidChecksum, "code", code,
			QString( "Invalid checksum for %1 - expected %2" ).arg( code ).arg( expected ) );
}

void enumArguments( const QStringList &genders, const QList<int> &days,
	const QList<int> &months, const QList<int> &years )
{
	Q_FOREACH( const QString &g, genders )
	{
		if( g != "m" && g != "f" )
			throw IK_VALIDATION_ERROR( InvalidGender, "genders", g,
				QString( "Genders must contain 'm', 'f', or both. Got [%1] instead." )
					.arg( genders.join( ", " ) ) );
	}

	Q_FOREACH( int d, days )
	{
		if( d < 1 || d > 31 )
			throw IK_VALIDATION_ERROR( DayOutOfRange, "days", QString::number( d ),
				QString( "Days must only contain values between 1 and 31 (incl.), found unexpected value %1" ).arg( d ) );
	}

	Q_FOREACH( int m, months )
	{
		if( m < 1 || m > 12 )
			throw IK_VALIDATION_ERROR( MonthOutOfRange, "months", QString::number( m ),
				QString( "Months must only contain values between 1 and 12 (incl.), found unexpected value %1" ).arg( m ) );
	}

	Q_FOREACH( int y, years )
		yearRange( y );
}

QDate existingDate( const QString &date )
{
	QRegularExpression iso( "^(\\d{4})-(\\d{2})-(\\d{2})$" );
	QRegularExpressionMatch match = iso.match( date );
	if( !match.hasMatch() )
		throw IK_VALIDATION_ERROR( InvalidDate, "date", date,
			QString( "Date %1 is invalid, expected YYYY-MM-DD" ).arg( date ) );

	return existingDate( match.captured( 1 ).toInt(),
		match.captured( 2 ).toInt(), match.captured( 3 ).toInt() );
}

QDate existingDate( int year, int month, int day )
{
	QDate date( year, month, day );
	if( !date.isValid() )
	{
		QString iso = QString( "%1-%2-%3" )
			.arg( year, 4, 10, QChar( '0' ) )
			.arg( month, 2, 10, QChar( '0' ) )
			.arg( day, 2, 10, QChar( '0' ) );
		throw IK_VALIDATION_ERROR( InvalidDate, "date", iso,
			QString( "Date %1 is invalid" ).arg( iso ) );
	}
	return date;
}

void firstDigit( const QString &code )
{
	int digit = code.isEmpty() ? -1 : code.at( 0 ).digitValue();
	if( digit < 1 || digit > 8 )
		throw IK_VALIDATION_ERROR( InvalidFirstDigit, "code", code,
			QString( "Given code (%1) begins with %2, expected a value between 1 and 8 (incl.)" )
				.arg( code ).arg( code.left( 1 ) ) );
}

Gender gender( const QString &tag )
{
	if( tag == "m" )
		return Male;
	if( tag == "f" )
		return Female;
	throw IK_VALIDATION_ERROR( InvalidGender, "gender", tag,
		QString( "Expected gender to be either m or f - got %1 instead." ).arg( tag ) );
}

bool isValid( const QString &code )
{
	try
	{
		validCode( code );
		return true;
	}
	catch( const ValidationError & )
	{
		return false;
	}
}

void numeric( const QString &value )
{
	bool ok = !value.isEmpty();
	for( QString::const_iterator i = value.constBegin(); ok && i != value.constEnd(); ++i )
		ok = i->unicode() >= '0' && i->unicode() <= '9';
	if( !ok )
		throw IK_VALIDATION_ERROR( NotNumeric, "code", value,
			QString( "Given argument (%1) is not numeric" ).arg( value ) );
}

void orderNumberRange( int orderNumber )
{
	if( orderNumber < 0 || orderNumber > 999 )
		throw IK_VALIDATION_ERROR( OrderNumberOutOfRange, "orderNumber", QString::number( orderNumber ),
			QString( "Order number was %1, expected a value between 0 and 999 (incl.)" ).arg( orderNumber ) );
}

void validCode( const QString &code )
{
	numeric( code );
	firstDigit( code );
	if( code.size() != 11 )
		throw IK_VALIDATION_ERROR( InvalidLength, "code", code,
			QString( "Given code (%1) is %2 digits, expected 11" ).arg( code ).arg( code.size() ) );
	correctChecksum( code );
	yearRange( birthdateFromCode( code ).year() );
}

void yearRange( int year )
{
	if( year < 1800 || year > 2199 )
		throw IK_VALIDATION_ERROR( YearOutOfRange, "year", QString::number( year ),
			QString( "Expected year to be between 1800 and 2199 (incl.) - got %1 instead." ).arg( year ) );
}

}

}
