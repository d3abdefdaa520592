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

#include <QtCore/QCoreApplication>

class QIODevice;
class ApplicationPrivate;
class Application: public QCoreApplication
{
	Q_OBJECT

public:
	enum ExitCode
	{
		Success = 0,
		ValidationFailed = 1,
		UsageError = 2
	};

	explicit Application( int &argc, char **argv );
	~Application();

	int run();
	void setOutputDevice( QIODevice *device );

private:
	int checksum( const QStringList &codes );
	int construct();
	int enumerate();
	int info( const QStringList &codes );
	int runCommand();
	int validate( const QStringList &codes );
	int usage( const QString &msg );

	ApplicationPrivate *d;
};
