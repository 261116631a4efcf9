#pragma once

#include <QString>
#include "../Carriers/CarrierKind.hpp"
#include "../Sms/AliasTable.hpp"





/** The settings loaded from the configuration file.
The values not present in the file have their defaults, the mHasXYZ flags tell whether the value was present. */
struct Configuration
{
	static const int DEFAULT_CONCURRENCY = 1;
	static const int DEFAULT_TIMEOUT_SEC = 30;


	QString mUsername;
	QString mPassword;

	bool mHasCarrier = false;
	CarrierKind mCarrier = crMeteor;

	/** False if the file contains the "nosplit" keyword. */
	bool mIsSplitAllowed = true;

	int mConcurrency = DEFAULT_CONCURRENCY;
	int mTimeoutSec = DEFAULT_TIMEOUT_SEC;

	AliasTable mAliases;
};





/** Loads and updates the configuration file.
The file is line-oriented, each line consisting of a keyword and its values, separated by whitespace:
	username <value>
	password <value>
	carrier <name>
	nosplit
	concurrency <1-4>
	timeout <seconds>
	alias <name> <number|alias> [<number|alias> ...]
Empty lines and lines starting with '#' are ignored. An alias may reference the aliases defined on the lines above,
their numbers are expanded in place. */
namespace ConfigFile
{

/** Thrown when the configuration file cannot be read or contains an invalid line. */
class ConfigError:
	public RuntimeError
{
	using Super = RuntimeError;


public:

	/** Creates a new error for the specified file and line (1-based, 0 if not related to a line). */
	ConfigError(const QString & aFileName, int aLineNumber, const QString & aMessage);

	const QString & fileName() const { return mFileName; }
	int lineNumber() const { return mLineNumber; }


protected:

	QString mFileName;
	int mLineNumber;
};


/** Loads the configuration from the specified file.
Throws a ConfigError if the file cannot be read or any of its lines is invalid. */
Configuration load(const QString & aFileName);

/** Parses the configuration from the file contents; aFileName is only used for the error messages.
Throws a ConfigError if any of the lines is invalid. */
Configuration parse(const QString & aContents, const QString & aFileName);

/** Returns true if the name can be used for a new alias saved by appendAlias() (letters only). */
bool isValidNewAliasName(const QString & aName);

/** Appends a new alias line to the end of the configuration file.
Throws a RuntimeError if the file cannot be written. */
void appendAlias(const QString & aFileName, const QString & aName, const QString & aNumber);

}  // namespace ConfigFile
