#pragma once

#include <string>
#include <QString>
#include <QStringList>
#include <QDebug>





/** Allow sending (an Utf-8-encoded) std::string directly to QDebug. */
inline QDebug operator << (QDebug aDebug, const std::string & aStr)
{
	return (aDebug << QString::fromStdString(aStr));
}





/** Provides functions for formatting strings using QString::arg() semantics ("%1", "%2", ...),
but the arguments are stringified using QDebug.
Any number of arguments can be passed.
This enables us to output many custom types (QUrl, QSqlError, enums, ...) very simply. */
namespace StringFormatter
{





/** Simple wrapper over QDebug that requires an output string and sets the underlying QDebug to nospace, noquote. */
class Debug:
	public QDebug
{
	using Super = QDebug;


public:

	Debug(QString * aOutput):
		Super(aOutput)
	{
		nospace();
		noquote();
	}
};





/** Terminates the recursion in stringifyArgs(). */
inline void stringifyArgs(QStringList & aDest)
{
	Q_UNUSED(aDest);
}





/** Appends the QDebug representation of each argument to aDest. */
template <typename FirstT, typename... RestTs>
inline void stringifyArgs(QStringList & aDest, const FirstT & aFirst, const RestTs &... aRest)
{
	QString str;
	Debug(&str) << aFirst;
	aDest.append(str);
	stringifyArgs(aDest, aRest...);
}





/** Replaces the "%N" markers in aFormatString with the respective aArgs.
Unlike chained QString::arg() calls, a replaced value containing "%N" itself is never re-substituted. */
QString substitute(const QString & aFormatString, const QStringList & aArgs);





inline QString format(const QString & aFormatString)
{
	return aFormatString;
}





/** Returns the format string with the "%N" markers replaced by the stringified arguments. */
template <typename... ArgTs>
inline QString format(const QString & aFormatString, const ArgTs &... aArgs)
{
	QStringList args;
	stringifyArgs(args, aArgs...);
	return substitute(aFormatString, args);
}

}  // namespace StringFormatter
