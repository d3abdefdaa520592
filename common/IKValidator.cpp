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

#include "IKValidator.h"

#include "Validators.h"

#include <QtCore/QRegularExpression>

using namespace IK;

IKValidator::IKValidator( QObject *parent )
:	QValidator( parent )
{}

bool IKValidator::isValid( const QString &ik )
{ return Validators::isValid( ik ); }

QValidator::State IKValidator::validate( QString &input, int & ) const
{
	if( input.size() > 11 || !QRegularExpression( "^[0-9]{0,11}$" ).match( input ).hasMatch() )
		return Invalid;
	else if( input.size() == 11 )
		return isValid( input ) ? Acceptable : Invalid;
	else
		return Intermediate;
}
