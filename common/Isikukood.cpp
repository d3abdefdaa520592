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

#include "Isikukood.h"

#include "Enumerator.h"
#include "Exception.h"
#include "Validators.h"

using namespace IK;

Isikukood::Isikukood( Gender gender, const QDate &birthdate )
:	m_gender( gender )
,	m_birthdate( birthdate )
{
	if( !birthdate.isValid() )
		throw IK_VALIDATION_ERROR( InvalidDate, "birthdate", birthdate.toString( Qt::ISODate ),
			QString( "Date %1 is invalid" ).arg( birthdate.toString( Qt::ISODate ) ) );
	Validators::yearRange( birthdate.year() );
	Validators::gender( QString( genderTag( gender ) ) );
}

Isikukood::Isikukood( const QString &gender, const QString &birthdate )
:	m_gender( Validators::gender( gender.toLower() ) )
,	m_birthdate( Validators::existingDate( birthdate ) )
{
	Validators::yearRange( m_birthdate.year() );
}

Isikukood Isikukood::fromCode( const QString &code )
{
	Validators::validCode( code );
	return Isikukood( genderFromCode( code ), birthdateFromCode( code ) );
}

QDate Isikukood::birthdate() const { return m_birthdate; }
Gender Isikukood::gender() const { return m_gender; }
QChar Isikukood::genderMarker() const { return IK::genderMarker( m_birthdate.year(), m_gender ); }

QStringList Isikukood::construct() const
{
	EnumFilter filter( m_birthdate.year() );
	filter.genders = QList<Gender>() << m_gender;
	filter.days = QList<int>() << m_birthdate.day();
	filter.months = QList<int>() << m_birthdate.month();
	return enumerate( filter );
}

QString Isikukood::construct( int orderNumber ) const
{
	Validators::orderNumberRange( orderNumber );
	return verified( QStringList() << makeCode( m_gender, m_birthdate, orderNumber ) ).first();
}

QStringList Isikukood::construct( const QList<int> &orderNumbers ) const
{
	for( int i = 0; i < orderNumbers.size(); ++i )
	{
		Validators::orderNumberRange( orderNumbers.at( i ) );
		if( orderNumbers.indexOf( orderNumbers.at( i ) ) != i )
			throw IK_VALIDATION_ERROR( DuplicateCode, "orderNumbers", QString::number( orderNumbers.at( i ) ),
				QString( "Order number %1 occurs more than once" ).arg( orderNumbers.at( i ) ) );
	}

	QStringList codes;
	Q_FOREACH( int n, orderNumbers )
		codes << makeCode( m_gender, m_birthdate, n );
	return verified( codes );
}

QStringList Isikukood::verified( const QStringList &codes ) const
{
	try
	{
		Validators::constructorList( codes );
	}
	catch( const ValidationError &e )
	{
		throw InvariantViolation( __FILE__, __LINE__, e );
	}
	return codes;
}
