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

#include <QtGui/QValidator>

namespace IK
{

/**
 * Input validator for personal code fields. Digits are accepted while the
 * code is being typed, a complete code only when it is valid.
 */
class IKValidator: public QValidator
{
	Q_OBJECT
public:
	explicit IKValidator( QObject *parent = 0 );

	static bool isValid( const QString &ik );
	State validate( QString &input, int &pos ) const;
};

}
