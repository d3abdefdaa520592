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

#include <common/Enumerator.h>
#include <common/Exception.h>
#include <common/Isikukood.h>

using namespace IK;

TEST_CASE( "Isikukood from gender and birthdate", "[isikukood]" )
{
	Isikukood ik( "m", "2000-01-01" );
	CHECK( ik.gender() == Male );
	CHECK( ik.birthdate() == QDate( 2000, 1, 1 ) );
	CHECK( ik.genderMarker() == QChar( '5' ) );

	CHECK( Isikukood( "F", "2000-01-01" ).gender() == Female );

	Isikukood typed( Female, QDate( 1899, 12, 31 ) );
	CHECK( typed.genderMarker() == QChar( '2' ) );

	CHECK_THROWS_AS( Isikukood( "m", "2999-01-01" ), ValidationError );
	CHECK_THROWS_AS( Isikukood( "m", "1799-12-31" ), ValidationError );
	CHECK_THROWS_AS( Isikukood( "x", "2000-01-01" ), ValidationError );
	CHECK_THROWS_AS( Isikukood( "f", "2001-02-29" ), ValidationError );
	CHECK_THROWS_AS( Isikukood( Male, QDate() ), ValidationError );
	CHECK_THROWS_AS( Isikukood( Male, QDate( 2200, 1, 1 ) ), ValidationError );
}

TEST_CASE( "Isikukood from an existing code", "[isikukood]" )
{
	Isikukood ik = Isikukood::fromCode( "60002290058" );
	CHECK( ik.gender() == Female );
	CHECK( ik.birthdate() == QDate( 2000, 2, 29 ) );

	CHECK_THROWS_AS( Isikukood::fromCode( "50001010000" ), ValidationError );
	CHECK_THROWS_AS( Isikukood::fromCode( "38001085710" ), ValidationError );
	CHECK_THROWS_AS( Isikukood::fromCode( "" ), ValidationError );
}

TEST_CASE( "construct with a single order number", "[isikukood]" )
{
	Isikukood ik( "m", "2000-01-01" );
	CHECK( ik.construct( 0 ) == "50001010006" );
	CHECK( ik.construct( 10 ) == "50001010104" );
	CHECK( ik.construct( 100 ) == "50001011003" );
	CHECK( ik.construct( 111 ) == "50001011112" );
	CHECK( ik.construct( 999 ) == "50001019993" );

	CHECK_THROWS_AS( ik.construct( -1 ), ValidationError );
	CHECK_THROWS_AS( ik.construct( 1000 ), ValidationError );
}

TEST_CASE( "construct with a list of order numbers", "[isikukood]" )
{
	Isikukood ik( "m", "2000-01-01" );
	CHECK( ik.construct( QList<int>() ).isEmpty() );
	CHECK( ik.construct( QList<int>() << 0 ) == QStringList( "50001010006" ) );
	CHECK( ik.construct( QList<int>() << 0 << 1 << 2 << 3 ) ==
		(QStringList() << "50001010006" << "50001010017" << "50001010028" << "50001010039") );
	CHECK( ik.construct( QList<int>() << 333 << 111 << 222 ) ==
		(QStringList() << "50001013335" << "50001011112" << "50001012229") );

	CHECK_THROWS_AS( ik.construct( QList<int>() << 0 << 1000 ), ValidationError );
	CHECK_THROWS_AS( ik.construct( QList<int>() << 5 << 5 ), ValidationError );
}

TEST_CASE( "construct everything matches enumerate", "[isikukood]" )
{
	Isikukood ik = Isikukood::fromCode( "50001010006" );
	QStringList all = ik.construct();
	REQUIRE( all.size() == 1000 );
	CHECK( all.contains( "50001010006" ) );
	CHECK( all.last() == "50001019993" );

	EnumFilter filter( 2000 );
	filter.genders = QList<Gender>() << Male;
	filter.days = QList<int>() << 1;
	filter.months = QList<int>() << 1;
	CHECK( all == enumerate( filter ) );
}

TEST_CASE( "InvariantViolation is distinct from ValidationError", "[isikukood]" )
{
	ValidationError cause( __FILE__, __LINE__, Exception::DuplicateCode, "codes", "50001010006", "duplicate" );
	InvariantViolation bug( __FILE__, __LINE__, cause );

	CHECK( bug.code() == Exception::DuplicateCode );
	CHECK( bug.value() == "50001010006" );
	CHECK( bug.message().startsWith( "Internal error" ) );
	CHECK( bug.message().endsWith( "duplicate" ) );
	CHECK( QString( bug.what() ) == bug.message() );

	try
	{
		throw bug;
	}
	catch( const ValidationError & )
	{
		FAIL( "caught as ValidationError" );
	}
	catch( const Exception &e )
	{
		CHECK( e.code() == Exception::DuplicateCode );
	}
}
