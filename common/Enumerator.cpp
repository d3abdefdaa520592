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

#include "Enumerator.h"

#include "Exception.h"
#include "Validators.h"

#include <QtCore/QDebug>

namespace IK
{

template<class T>
static QList<T> unique( const QList<T> &list )
{
	QList<T> result;
	for( const T &item: list )
	{
		if( !result.contains( item ) )
			result << item;
	}
	return result;
}

EnumFilter::EnumFilter()
:	genders( QList<Gender>() << Male << Female )
,	days( range( 1, 31 ) )
,	months( range( 1, 12 ) )
,	years( QList<int>() << QDate::currentDate().year() )
,	orderNumbers( range( 0, 999 ) )
{}

EnumFilter::EnumFilter( int currentYear )
:	genders( QList<Gender>() << Male << Female )
,	days( range( 1, 31 ) )
,	months( range( 1, 12 ) )
,	years( QList<int>() << currentYear )
,	orderNumbers( range( 0, 999 ) )
{}

QStringList enumerate( const EnumFilter &filter )
{
	QList<Gender> genders = unique( filter.genders );
	QList<int> days = unique( filter.days );
	QList<int> months = unique( filter.months );
	QList<int> years = unique( filter.years );
	QList<int> orderNumbers = unique( filter.orderNumbers );

	QStringList tags;
	for( Gender g: genders )
		tags << QString( genderTag( g ) );
	Validators::enumArguments( tags, days, months, years );
	for( int n: orderNumbers )
		Validators::orderNumberRange( n );

	QStringList codes;
	int skipped = 0;
	for( Gender g: genders )
	{
		for( int year: years )
		{
			for( int month: months )
			{
				for( int day: days )
				{
					if( !QDate::isValid( year, month, day ) )
					{
						++skipped;
						continue;
					}
					QDate date( year, month, day );
					for( int n: orderNumbers )
						codes << makeCode( g, date, n );
				}
			}
		}
	}
	qDebug() << "Enumerated" << codes.size() << "codes," << skipped << "dates skipped";

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

QList<int> range( int first, int last )
{
	QList<int> result;
	for( int i = first; i <= last; ++i )
		result << i;
	return result;
}

}
