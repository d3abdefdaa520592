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

#include "Codec.h"

#include <QtCore/QList>
#include <QtCore/QStringList>

namespace IK
{

class Isikukood
{
public:
	Isikukood( Gender gender, const QDate &birthdate );
	Isikukood( const QString &gender, const QString &birthdate );

	static Isikukood fromCode( const QString &code );

	QDate birthdate() const;
	Gender gender() const;
	QChar genderMarker() const;

	/**
	 * All 1000 codes for this gender and birthdate, order numbers 000-999.
	 */
	QStringList construct() const;
	QString construct( int orderNumber ) const;
	QStringList construct( const QList<int> &orderNumbers ) const;

private:
	QStringList verified( const QStringList &codes ) const;

	Gender m_gender;
	QDate m_birthdate;
};

}
