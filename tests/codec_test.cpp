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

#include "test_fixtures.h"

#include <common/Codec.h>
#include <common/Exception.h>
#include <common/Validators.h>

using namespace IK;

TEST_CASE( "orderNumberFromCode", "[codec]" )
{
	CHECK( orderNumberFromCode( "50001010006" ) == 0 );
	CHECK( orderNumberFromCode( "50001010104" ) == 10 );
	CHECK( orderNumberFromCode( "50001011003" ) == 100 );
	CHECK( orderNumberFromCode( "50001019993" ) == 999 );
	CHECK_THROWS_AS( orderNumberFromCode( "500010100" ), ValidationError );
	CHECK_THROWS_AS( orderNumberFromCode( "5000101x006" ), ValidationError );
}

TEST_CASE( "genderFromCode", "[codec]" )
{
	CHECK( genderFromCode( "50001010006" ) == Male );
	CHECK( genderFromCode( "60001010007" ) == Female );
	CHECK( genderFromCode( "1" ) == Male );
	CHECK( genderFromCode( "8" ) == Female );
	CHECK_THROWS_AS( genderFromCode( "90001010006" ), ValidationError );
	CHECK_THROWS_AS( genderFromCode( "" ), ValidationError );
}

TEST_CASE( "genderMarker", "[codec]" )
{
	CHECK( genderMarker( 1800, Male ) == QChar( '1' ) );
	CHECK( genderMarker( 1800, Female ) == QChar( '2' ) );
	CHECK( genderMarker( 1900, Male ) == QChar( '3' ) );
	CHECK( genderMarker( 1900, Female ) == QChar( '4' ) );
	CHECK( genderMarker( 1999, Male ) == QChar( '3' ) );
	CHECK( genderMarker( 2000, Male ) == QChar( '5' ) );
	CHECK( genderMarker( 2000, Female ) == QChar( '6' ) );
	CHECK( genderMarker( 2100, Male ) == QChar( '7' ) );
	CHECK( genderMarker( 2199, Female ) == QChar( '8' ) );
	CHECK( genderMarker( 2000, "m" ) == QChar( '5' ) );
	CHECK( genderMarker( 1950, "f" ) == QChar( '4' ) );

	CHECK_THROWS_AS( genderMarker( 1799, Male ), ValidationError );
	CHECK_THROWS_AS( genderMarker( 2200, Female ), ValidationError );
	CHECK_THROWS_AS( genderMarker( 2000, "x" ), ValidationError );
	CHECK_THROWS_AS( genderMarker( 2000, "M" ), ValidationError );
}

TEST_CASE( "genderMarker parity and century follow the year", "[codec]" )
{
	for( int year = 1800; year <= 2199; year += 7 )
	{
		int male = genderMarker( year, Male ).digitValue();
		int female = genderMarker( year, Female ).digitValue();
		CHECK( male % 2 == 1 );
		CHECK( female % 2 == 0 );
		CHECK( (male + 1) / 2 == year / 100 - 17 );
		CHECK( female / 2 == year / 100 - 17 );
	}
}

TEST_CASE( "birthdateFromCode", "[codec]" )
{
	CHECK( birthdateFromCode( "10001010002" ) == QDate( 1800, 1, 1 ) );
	CHECK( birthdateFromCode( "30001010004" ) == QDate( 1900, 1, 1 ) );
	CHECK( birthdateFromCode( "50001010006" ) == QDate( 2000, 1, 1 ) );
	CHECK( birthdateFromCode( "70001010008" ) == QDate( 2100, 1, 1 ) );
	CHECK( birthdateFromCode( "37602280003" ).toString( Qt::ISODate ) == "1976-02-28" );

	CHECK_THROWS_AS( birthdateFromCode( "50102290000" ), ValidationError );
	CHECK_THROWS_AS( birthdateFromCode( "50013010006" ), ValidationError );
	CHECK_THROWS_AS( birthdateFromCode( "00001010006" ), ValidationError );
	CHECK_THROWS_AS( birthdateFromCode( "50001" ), ValidationError );
}

TEST_CASE( "calculateChecksum", "[codec]" )
{
	CHECK( calculateChecksum( "5000101000" ) == 6 );
	CHECK( calculateChecksum( "6000101000" ) == 7 );
	CHECK( calculateChecksum( "3800108571" ) == 8 );

	SECTION( "second weight pass is used when the first gives 10" )
	{
		CHECK( calculateChecksum( "3000101018" ) == 7 );
	}

	SECTION( "checksum is 0 when both passes give 10" )
	{
		CHECK( calculateChecksum( "3000101006" ) == 0 );
	}

	SECTION( "only the first 10 digits count" )
	{
		CHECK( calculateChecksum( "50001010000" ) == 6 );
		CHECK( calculateChecksum( "50001010009" ) == 6 );
	}

	SECTION( "invalid input" )
	{
		CHECK_THROWS_AS( calculateChecksum( "500010100" ), ValidationError );
		CHECK_THROWS_AS( calculateChecksum( "500010100000" ), ValidationError );
		CHECK_THROWS_AS( calculateChecksum( "5000101x00" ), ValidationError );
	}
}

TEST_CASE( "insertChecksum", "[codec]" )
{
	CHECK( insertChecksum( "5000101000x" ) == "50001010006" );
	CHECK( insertChecksum( "5000101000" ) == "50001010006" );
	CHECK( insertChecksum( "50001010009" ) == "50001010006" );
	CHECK( insertChecksum( "30001010187" ) == "30001010187" );

	CHECK_THROWS_AS( insertChecksum( "500010100" ), ValidationError );
	CHECK_THROWS_AS( insertChecksum( "500010100000" ), ValidationError );
	CHECK_THROWS_AS( insertChecksum( "50001010x0x" ), ValidationError );

	const char *codes[] = { "5000101000", "39912319999", "4850615123", "12345678901" };
	for( const char *c: codes )
		CHECK( insertChecksum( insertChecksum( c ) ) == insertChecksum( c ) );
}

TEST_CASE( "valid codes survive replacing the check digit", "[codec]" )
{
	for( int n = 0; n < 1000; n += 37 )
	{
		QString code = makeCode( Female, QDate( 1985, 6, 15 ), n );
		REQUIRE( Validators::isValid( code ) );
		CHECK( insertChecksum( code.left( 10 ) + "0" ) == code );
	}
}

TEST_CASE( "makeCode", "[codec]" )
{
	CHECK( makeCode( Male, QDate( 2000, 1, 1 ), 0 ) == "50001010006" );
	CHECK( makeCode( Male, QDate( 2000, 1, 1 ), 111 ) == "50001011112" );
	CHECK( makeCode( Female, QDate( 2000, 2, 29 ), 5 ) == "60002290058" );
	CHECK( makeCode( Male, QDate( 1900, 1, 1 ), 101 ) == "30001011012" );
	CHECK_THROWS_AS( makeCode( Male, QDate( 2000, 1, 1 ), 1000 ), ValidationError );
	CHECK_THROWS_AS( makeCode( Male, QDate( 2200, 1, 1 ), 0 ), ValidationError );
}

TEST_CASE( "genderTag", "[codec]" )
{
	CHECK( genderTag( Male ) == QChar( 'm' ) );
	CHECK( genderTag( Female ) == QChar( 'f' ) );
}
