#include "ConfigFile.hpp"
#include <QFile>
#include <QRegularExpression>





const int Configuration::DEFAULT_CONCURRENCY;
const int Configuration::DEFAULT_TIMEOUT_SEC;





////////////////////////////////////////////////////////////////////////////////
// ConfigFile::ConfigError:

ConfigFile::ConfigError::ConfigError(const QString & aFileName, int aLineNumber, const QString & aMessage):
	Super((aLineNumber > 0) ? "%1:%2: %3" : "%1: %3", aFileName, aLineNumber, aMessage),
	mFileName(aFileName),
	mLineNumber(aLineNumber)
{
}





////////////////////////////////////////////////////////////////////////////////
// Local helpers:

/** Parses the values of an "alias" line and adds the alias into aConfig.
Throws a ConfigError on failure. */
static void parseAlias(Configuration & aConfig, const QString & aValues, const QString & aFileName, int aLineNumber)
{
	static const QRegularExpression reAlias("^([\\w.-]+)\\s+(.+)$");
	static const QRegularExpression reNumber("^\\+?\\d+$");
	static const QRegularExpression reWord("^\\w+$");
	static const QRegularExpression reRemovedChars("[.-]");
	static const QRegularExpression reWhitespace("\\s+");

	auto match = reAlias.match(aValues);
	if (!match.hasMatch())
	{
		throw ConfigFile::ConfigError(aFileName, aLineNumber, "Malformed alias, expected \"alias <name> <number|alias>...\"");
	}
	auto name = match.captured(1);
	if (aConfig.mAliases.contains(name))
	{
		throw ConfigFile::ConfigError(aFileName, aLineNumber, QString("Alias %1 is already defined").arg(name));
	}

	QStringList numbers;
	auto contacts = match.captured(2).remove(reRemovedChars).split(reWhitespace, QString::SkipEmptyParts);
	for (const auto & contact: contacts)
	{
		if (reNumber.match(contact).hasMatch())
		{
			numbers.append(contact);
			continue;
		}
		if (!reWord.match(contact).hasMatch())
		{
			throw ConfigFile::ConfigError(aFileName, aLineNumber,
				QString("Alias %1: \"%2\" is neither a number nor an alias name").arg(name, contact)
			);
		}
		auto referenced = aConfig.mAliases.lookup(contact);
		if (referenced == nullptr)
		{
			throw ConfigFile::ConfigError(aFileName, aLineNumber,
				QString("Alias %1 references %2, which is not defined above").arg(name, contact)
			);
		}
		numbers.append(*referenced);
	}
	if (numbers.isEmpty())
	{
		throw ConfigFile::ConfigError(aFileName, aLineNumber, QString("Alias %1 has no numbers").arg(name));
	}
	aConfig.mAliases.addAlias(name, numbers);
}





/** Parses the value as an integer within the specified range.
Throws a ConfigError on failure. */
static int parseInt(const QString & aKeyword, const QString & aValue, int aMin, int aMax, const QString & aFileName, int aLineNumber)
{
	bool isOK = false;
	auto res = aValue.toInt(&isOK);
	if (!isOK || (res < aMin) || (res > aMax))
	{
		throw ConfigFile::ConfigError(aFileName, aLineNumber,
			QString("Invalid %1 value \"%2\", expected a number %3 .. %4").arg(aKeyword, aValue).arg(aMin).arg(aMax)
		);
	}
	return res;
}





////////////////////////////////////////////////////////////////////////////////
// ConfigFile:

Configuration ConfigFile::load(const QString & aFileName)
{
	QFile f(aFileName);
	if (!f.open(QIODevice::ReadOnly | QIODevice::Text))
	{
		throw ConfigError(aFileName, 0, QString("Cannot open the file: %1").arg(f.errorString()));
	}
	return parse(QString::fromUtf8(f.readAll()), aFileName);
}





Configuration ConfigFile::parse(const QString & aContents, const QString & aFileName)
{
	static const QRegularExpression reKeyword("^(\\S+)\\s*(.*)$");
	Configuration res;
	const auto lines = aContents.split('\n');
	int lineNumber = 0;
	for (const auto & rawLine: lines)
	{
		lineNumber += 1;
		auto line = rawLine.trimmed();
		if (line.isEmpty() || line.startsWith('#'))
		{
			continue;
		}
		auto match = reKeyword.match(line);
		auto keyword = match.captured(1);
		auto values = match.captured(2).trimmed();
		if (keyword == "nosplit")
		{
			if (!values.isEmpty())
			{
				throw ConfigError(aFileName, lineNumber, "The nosplit keyword takes no value");
			}
			res.mIsSplitAllowed = false;
			continue;
		}
		if (keyword == "alias")
		{
			parseAlias(res, values, aFileName, lineNumber);
			continue;
		}

		// All the other keywords need a value:
		if (values.isEmpty())
		{
			throw ConfigError(aFileName, lineNumber, QString("Missing value for %1").arg(keyword));
		}
		if (keyword == "username")
		{
			res.mUsername = values;
		}
		else if (keyword == "password")
		{
			res.mPassword = values;
		}
		else if (keyword == "carrier")
		{
			try
			{
				res.mCarrier = carrierKindFromName(values);
				res.mHasCarrier = true;
			}
			catch (const UnknownCarrierError & exc)
			{
				throw ConfigError(aFileName, lineNumber, exc.message());
			}
		}
		else if (keyword == "concurrency")
		{
			res.mConcurrency = parseInt(keyword, values, 1, 4, aFileName, lineNumber);
		}
		else if (keyword == "timeout")
		{
			res.mTimeoutSec = parseInt(keyword, values, 1, 3600, aFileName, lineNumber);
		}
		else
		{
			throw ConfigError(aFileName, lineNumber, QString("Unknown keyword \"%1\"").arg(keyword));
		}
	}
	return res;
}





bool ConfigFile::isValidNewAliasName(const QString & aName)
{
	if (aName.isEmpty())
	{
		return false;
	}
	for (const auto & ch: aName)
	{
		if (!ch.isLetter())
		{
			return false;
		}
	}
	return true;
}





void ConfigFile::appendAlias(const QString & aFileName, const QString & aName, const QString & aNumber)
{
	QFile f(aFileName);
	if (!f.open(QIODevice::ReadWrite))
	{
		throw RuntimeError("Cannot open the configuration file %1 for writing: %2", aFileName, f.errorString());
	}

	// Make sure the new alias starts on a new line:
	QByteArray line;
	if (f.size() > 0)
	{
		f.seek(f.size() - 1);
		if (f.read(1) != "\n")
		{
			line.append('\n');
		}
	}
	line.append(QString("alias %1 %2\n").arg(aName, aNumber).toUtf8());
	f.seek(f.size());
	if (f.write(line) != line.size())
	{
		throw RuntimeError("Cannot write to the configuration file %1: %2", aFileName, f.errorString());
	}
}
