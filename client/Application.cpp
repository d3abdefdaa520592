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

#include "Application.h"

#include "version.h"

#include <common/Enumerator.h>
#include <common/Exception.h>
#include <common/Isikukood.h>
#include <common/Settings.h>
#include <common/Validators.h>

#include <QtCore/QCommandLineParser>
#include <QtCore/QDebug>
#include <QtCore/QLoggingCategory>
#include <QtCore/QTextStream>

class ApplicationPrivate
{
public:
	ApplicationPrivate()
	:	out( stdout )
	,	gender( "gender", Application::tr( "Comma separated genders (m, f)." ), "list" )
	,	day( "day", Application::tr( "Days of month, e.g. 1-5,10." ), "list" )
	,	month( "month", Application::tr( "Months, e.g. 1,2,12." ), "list" )
	,	year( "year", Application::tr( "Years of birth, e.g. 1990-1999." ), "list" )
	,	order( "order", Application::tr( "Order numbers, e.g. 0-9." ), "list" )
	,	birthdate( "birthdate", Application::tr( "Birthdate as YYYY-MM-DD." ), "date" )
	,	verbose( "verbose", Application::tr( "Print debug messages." ) )
	{}

	bool list( const QCommandLineOption &option, QList<int> &result,
		int min, int max, IK::Exception::ExceptionCode code ) const;

	QCommandLineParser parser;
	QTextStream out;
	QCommandLineOption gender, day, month, year, order, birthdate, verbose;
};

/**
 * Parses "1-5,10" style lists of non-negative integers. Returns false on
 * malformed input, throws ValidationError for values outside [min, max].
 */
static bool parseList( const QString &value, QList<int> &result, const QString &field,
	int min, int max, IK::Exception::ExceptionCode code )
{
	result.clear();
	Q_FOREACH( const QString &item, value.split( ",", QString::SkipEmptyParts ) )
	{
		QStringList bounds = item.trimmed().split( "-" );
		if( bounds.size() > 2 )
			return false;
		bool ok1 = false, ok2 = true;
		int first = bounds.value( 0 ).toInt( &ok1 );
		int last = bounds.size() == 2 ? bounds.value( 1 ).toInt( &ok2 ) : first;
		if( !ok1 || !ok2 || first > last )
			return false;
		if( first < min || last > max )
			throw IK::ValidationError( __FILE__, __LINE__, code, field, item.trimmed(),
				QString( "--%1 must only contain values between %2 and %3 (incl.), found %4" )
					.arg( field ).arg( min ).arg( max ).arg( item.trimmed() ) );
		for( int i = first; i <= last; ++i )
			result << i;
	}
	return !result.isEmpty();
}

bool ApplicationPrivate::list( const QCommandLineOption &option, QList<int> &result,
	int min, int max, IK::Exception::ExceptionCode code ) const
{
	return !parser.isSet( option ) ||
		parseList( parser.value( option ), result, option.names().first(), min, max, code );
}



Application::Application( int &argc, char **argv )
:	QCoreApplication( argc, argv )
,	d( new ApplicationPrivate )
{
	setApplicationName( APP );
	setApplicationVersion( QString( "%1.%2.%3.%4" )
		.arg( MAJOR_VER ).arg( MINOR_VER ).arg( RELEASE_VER ).arg( BUILD_VER ) );
	setOrganizationDomain( DOMAINURL );
	setOrganizationName( ORG );

	d->parser.setApplicationDescription( tr( "Validate, decode and generate Estonian personal codes." ) );
	d->parser.addHelpOption();
	d->parser.addVersionOption();
	d->parser.addPositionalArgument( "command", tr( "validate, info, checksum, enum or construct" ) );
	d->parser.addPositionalArgument( "codes", tr( "Personal codes for validate, info and checksum." ), "[codes...]" );
	d->parser.addOptions( QList<QCommandLineOption>()
		<< d->gender << d->day << d->month << d->year << d->order << d->birthdate << d->verbose );
}

Application::~Application() { delete d; }

int Application::checksum( const QStringList &codes )
{
	if( codes.isEmpty() )
		return usage( tr( "No codes given" ) );
	Q_FOREACH( const QString &code, codes )
		d->out << IK::insertChecksum( code ) << '\n';
	return Success;
}

int Application::construct()
{
	if( !d->parser.isSet( d->gender ) || !d->parser.isSet( d->birthdate ) )
		return usage( tr( "construct requires --gender and --birthdate" ) );

	IK::Isikukood ik( d->parser.value( d->gender ), d->parser.value( d->birthdate ) );
	QStringList codes;
	if( d->parser.isSet( d->order ) )
	{
		QList<int> orderNumbers;
		if( !d->list( d->order, orderNumbers, 0, 999, IK::Exception::OrderNumberOutOfRange ) )
			return usage( tr( "Invalid order number list: %1" ).arg( d->parser.value( d->order ) ) );
		if( orderNumbers.size() == 1 )
			codes << ik.construct( orderNumbers.first() );
		else
			codes = ik.construct( orderNumbers );
	}
	else
		codes = ik.construct();

	Q_FOREACH( const QString &code, codes )
		d->out << code << '\n';
	return Success;
}

int Application::enumerate()
{
	IK::Settings s;
	IK::EnumFilter filter( s.value( "Enum/Year", QDate::currentDate().year() ).toInt() );

	QStringList genders = d->parser.isSet( d->gender ) ?
		d->parser.value( d->gender ).split( ",", QString::SkipEmptyParts ) :
		s.value( "Enum/Genders" ).toStringList();
	if( !genders.isEmpty() )
	{
		filter.genders.clear();
		Q_FOREACH( const QString &tag, genders )
			filter.genders << IK::Validators::gender( tag.trimmed().toLower() );
	}

	const QCommandLineOption *invalid = 0;
	if( !d->list( d->day, filter.days, 1, 31, IK::Exception::DayOutOfRange ) )
		invalid = &d->day;
	else if( !d->list( d->month, filter.months, 1, 12, IK::Exception::MonthOutOfRange ) )
		invalid = &d->month;
	else if( !d->list( d->year, filter.years, 1800, 2199, IK::Exception::YearOutOfRange ) )
		invalid = &d->year;
	else if( !d->list( d->order, filter.orderNumbers, 0, 999, IK::Exception::OrderNumberOutOfRange ) )
		invalid = &d->order;
	if( invalid )
		return usage( tr( "Invalid list for --%1: %2" )
			.arg( invalid->names().first(), d->parser.value( *invalid ) ) );

	Q_FOREACH( const QString &code, IK::enumerate( filter ) )
		d->out << code << '\n';
	return Success;
}

int Application::info( const QStringList &codes )
{
	if( codes.isEmpty() )
		return usage( tr( "No codes given" ) );
	Q_FOREACH( const QString &code, codes )
	{
		IK::Isikukood ik = IK::Isikukood::fromCode( code );
		d->out << code << " " << IK::genderTag( ik.gender() )
			<< " " << ik.birthdate().toString( Qt::ISODate )
			<< " " << QString( "%1" ).arg( IK::orderNumberFromCode( code ), 3, 10, QChar( '0' ) ) << '\n';
	}
	return Success;
}

int Application::run()
{
	int result = runCommand();
	d->out.flush();
	return result;
}

int Application::runCommand()
{
	if( !d->parser.parse( arguments() ) )
		return usage( d->parser.errorText() );
	if( d->parser.isSet( "help" ) )
		d->parser.showHelp( Success );
	if( d->parser.isSet( "version" ) )
		d->parser.showVersion();
	if( !d->parser.isSet( d->verbose ) )
		QLoggingCategory::setFilterRules( "default.debug=false" );

	QStringList args = d->parser.positionalArguments();
	if( args.isEmpty() )
		return usage( tr( "No command given" ) );
	QString command = args.takeFirst();

	try
	{
		if( command == "validate" ) return validate( args );
		if( command == "info" ) return info( args );
		if( command == "checksum" ) return checksum( args );
		if( command == "enum" ) return enumerate();
		if( command == "construct" ) return construct();
	}
	catch( const IK::InvariantViolation &e )
	{
		qCritical( "%s", qPrintable( e.message() ) );
		return ValidationFailed;
	}
	catch( const IK::Exception &e )
	{
		qWarning( "%s", qPrintable( e.message() ) );
		return ValidationFailed;
	}
	return usage( tr( "Unknown command: %1" ).arg( command ) );
}

void Application::setOutputDevice( QIODevice *device )
{
	d->out.flush();
	d->out.setDevice( device );
}

int Application::usage( const QString &msg )
{
	qWarning( "%s", qPrintable( msg ) );
	QTextStream( stderr ) << d->parser.helpText();
	return UsageError;
}

int Application::validate( const QStringList &codes )
{
	if( codes.isEmpty() )
		return usage( tr( "No codes given" ) );

	int result = Success;
	Q_FOREACH( const QString &code, codes )
	{
		try
		{
			IK::Validators::validCode( code );
			d->out << code << ": valid" << '\n';
		}
		catch( const IK::ValidationError &e )
		{
			d->out << code << ": " << e.message() << '\n';
			result = ValidationFailed;
		}
	}
	return result;
}
