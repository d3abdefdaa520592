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

#include "Codec.h"

#include "Exception.h"
#include "Validators.h"

namespace IK
{

QChar genderTag( Gender gender )
{
	switch( gender )
	{
	case Male: return QChar( 'm' );
	case Female: return QChar( 'f' );
	default: return QChar( '?' );
	}
}

int calculateChecksum( const QString &code )
{
	Validators::numeric( code );
	if( code.size() != 10 && code.size() != 11 )
		throw IK_VALIDATION_ERROR( InvalidLength, "code", code,
			QString( "Given code (%1) is %2 digits, expected 10 or 11" ).arg( code ).arg( code.size() ) );

	int sum1 = 0, sum2 = 0, pos1 = 1, pos2 = 3;
	for( int i = 0; i < 10; ++i )
	{
		int digit = code.at( i ).digitValue();
		sum1 += digit * pos1;
		sum2 += digit * pos2;
		pos1 = pos1 == 9 ? 1 : pos1 + 1;
		pos2 = pos2 == 9 ? 1 : pos2 + 1;
	}

	int result;
	if( (result = sum1 % 11) >= 10 &&
		(result = sum2 % 11) >= 10 )
		result = 0;
	return result;
}

QDate birthdateFromCode( const QString &code )
{
	Validators::firstDigit( code );
	if( code.size() < 7 )
		throw IK_VALIDATION_ERROR( InvalidLength, "code", code,
			QString( "Given code (%1) is too short to contain a birthdate" ).arg( code ) );
	Validators::numeric( code.mid( 1, 6 ) );

	int year = 0;
	switch( code.at( 0 ).digitValue() )
	{
	case 1: case 2: year = 1800; break;
	case 3: case 4: year = 1900; break;
	case 5: case 6: year = 2000; break;
	case 7: case 8: year = 2100; break;
	}

	return Validators::existingDate(
		code.mid( 1, 2 ).toInt() + year,
		code.mid( 3, 2 ).toInt(),
		code.mid( 5, 2 ).toInt() );
}

Gender genderFromCode( const QString &code )
{
	Validators::firstDigit( code );
	return code.at( 0 ).digitValue() % 2 == 0 ? Female : Male;
}

QChar genderMarker( int year, Gender gender )
{
	Validators::yearRange( year );
	if( gender != Male && gender != Female )
		throw IK_VALIDATION_ERROR( InvalidGender, "gender", QString::number( int(gender) ),
			QString( "Expected gender to be either m or f - got %1 instead." ).arg( int(gender) ) );

	int century = (year - 1800) / 100;
	return QChar( '1' + century * 2 + (gender == Female ? 1 : 0) );
}

QChar genderMarker( int year, const QString &genderTag )
{
	return genderMarker( year, Validators::gender( genderTag ) );
}

QString insertChecksum( const QString &code )
{
	if( code.size() != 10 && code.size() != 11 )
		throw IK_VALIDATION_ERROR( InvalidLength, "code", code,
			QString( "Given code (%1) is %2 digits, expected 10 or 11" ).arg( code ).arg( code.size() ) );

	QString body = code.left( 10 );
	return body + QString::number( calculateChecksum( body ) );
}

QString makeCode( Gender gender, const QDate &birthdate, int orderNumber )
{
	Validators::orderNumberRange( orderNumber );
	QString body = QString( "%1%2%3%4%5" )
		.arg( genderMarker( birthdate.year(), gender ) )
		.arg( birthdate.year() % 100, 2, 10, QChar( '0' ) )
		.arg( birthdate.month(), 2, 10, QChar( '0' ) )
		.arg( birthdate.day(), 2, 10, QChar( '0' ) )
		.arg( orderNumber, 3, 10, QChar( '0' ) );
	return body + QString::number( calculateChecksum( body ) );
}

int orderNumberFromCode( const QString &code )
{
	if( code.size() < 10 )
		throw IK_VALIDATION_ERROR( InvalidLength, "code", code,
			QString( "Given code (%1) is too short to contain an order number" ).arg( code ) );
	QString digits = code.mid( 7, 3 );
	Validators::numeric( digits );
	return digits.toInt();
}

}
