#pragma once

#include <QSqlDatabase>
#include <QSqlError>
#include "../Exception.hpp"





/** Brings the schema of the webtexter DB to the version this program uses.
The schema version is kept in the DB's Version table; each version step is applied in its own transaction,
so a failed upgrade leaves the DB at the last complete version. */
namespace DatabaseUpgrade
{

/** Thrown when an SQL command of the upgrade fails. */
class SqlError:
	public RuntimeError
{
	using Super = RuntimeError;

public:
	/** Creates a new instance describing the failed command, logs the description into aLogger. */
	SqlError(Logger & aLogger, const QSqlError & aSqlError, const QString & aSqlCommand);
};


/** Thrown when the DB has been written by a newer version of the program, with a schema unknown to this one. */
class NewerVersionError:
	public RuntimeError
{
public:
	using RuntimeError::RuntimeError;
};


/** Upgrades the open DB to currentVersion().
Throws a NewerVersionError if the DB is already past currentVersion(), a SqlError if any step fails. */
void upgrade(QSqlDatabase & aDB, Logger & aLogger);

/** Returns the schema version that this program uses. */
int currentVersion();

/** Returns the schema version stored in the DB, 0 for an empty DB. */
int storedVersion(QSqlDatabase & aDB);

}  // namespace DatabaseUpgrade
