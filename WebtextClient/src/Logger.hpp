#pragma once

#include <QString>
#include <QByteArray>
#include <QMutex>
#include <QFile>
#include "StringFormatter.hpp"





/** A logger that writes its output to a single file.
The log-writing can be called simultaneously from multiple threads.
Note that there's a MultiLogger class / component managing multiple instances of this class.
The logger forces a flush on the log file after every FLUSH_AFTER_N_MESSAGES number of messages written,
and always after a text block dump. */
class Logger
{
	friend class PrefixLogger;  // Needs access to logInternal() and logBlockInternal()

protected:

	/** After writing this many messages, the log file is flushed. */
	static const int FLUSH_AFTER_N_MESSAGES = 4;

	/** Maximum number of bytes of a single text block that are written to the log. */
	static const int MAX_BLOCK_SIZE = 16384;


	/** The file where the log data is actually written. */
	QFile mLogFile;

	/** The mutex protecting mLogFile from multithreaded access. */
	QMutex mMtxLogFile;

	/** Number of log messages to be yet written until a flush is forced on the log file. */
	int mNumMessagesUntilFlush;


	/** Returns the current timestamp as a string, to be prepended to each log line. */
	static QString currentTimestamp();

	/** Writes the specified log data into the output file, pre-pending it with the current timestamp. */
	void logInternal(const QByteArray & aLogData);

	/** Writes the specified log data, followed by the text block indented by a tab on each line,
	into the output file, pre-pending it with the current timestamp.
	Blocks longer than MAX_BLOCK_SIZE are cut off. */
	void logBlockInternal(const QByteArray & aBlock, const QByteArray & aLogData);


public:

	/** Creates an instance that writes to the specified file.
	Throws a std::runtime_error if the file cannot be opened for appending. */
	Logger(const QString & aFileName);

	~Logger();

	/** Writes a formatted string to the log.
	The format string follows QString::arg()'s formatting, aArgs can be anything serializable by QDebug. */
	template <size_t N, typename... T>
	void log(const char (&aFormatString)[N], const T &... aArgs)
	{
		log(QString::fromUtf8(aFormatString, N - 1), aArgs...);
	}

	/** Writes a formatted string to the log.
	The format string follows QString::arg()'s formatting, aArgs can be anything serializable by QDebug. */
	template <typename... T>
	void log(const QString & aFormatString, const T &... aArgs)
	{
		logInternal(StringFormatter::format(aFormatString, aArgs...).toUtf8());
	}

	/** Logs the formatted label, followed by the (multi-line) text block, such as a HTTP response body.
	The format string follows QString::arg()'s formatting, aArgs can be anything serializable by QDebug. */
	template <typename... T>
	void logBlock(const QByteArray & aBlock, const QString & aFormatString, const T &... aArgs)
	{
		logBlockInternal(aBlock, StringFormatter::format(aFormatString, aArgs...).toUtf8());
	}

	/** Flushes the log file.
	Can be called from any thread, is thread-safe also in regard to all the logging functions.
	Called by MultiLogger when flushing all logs. */
	void flush();

	/** Returns the name of the file into which the log is written. */
	QString fileName() const { return mLogFile.fileName(); }
};





/** Relays log messages to a Logger, but every message is prefixed with a constant string, given to the constructor.
Typically, the prefix is something like "meteor: ", which is used when multiple sessions share the same Logger. */
class PrefixLogger
{

	/** The Logger where the messages are output. */
	Logger & mLogger;

	/** The prefix to use for log messages. */
	const QByteArray mPrefix;


public:

	/** Creates a new instance that binds to the specified Logger instance and uses the specified prefix for messages. */
	PrefixLogger(Logger & aLogger, const QString & aPrefix):
		mLogger(aLogger),
		mPrefix(aPrefix.toUtf8())
	{
	}

	/** Writes a formatted string to the log.
	The format string follows QString::arg()'s formatting, aArgs can be anything serializable by QDebug. */
	template <size_t N, typename... T>
	void log(const char (&aFormatString)[N], const T &... aArgs)
	{
		log(QString::fromUtf8(aFormatString, N - 1), aArgs...);
	}

	/** Writes a formatted string to the log.
	The format string follows QString::arg()'s formatting, aArgs can be anything serializable by QDebug. */
	template <typename... T>
	void log(const QString & aFormatString, const T &... aArgs)
	{
		mLogger.logInternal(mPrefix + StringFormatter::format(aFormatString, aArgs...).toUtf8());
	}

	/** Logs the formatted label, followed by the (multi-line) text block.
	The format string follows QString::arg()'s formatting, aArgs can be anything serializable by QDebug. */
	template <typename... T>
	void logBlock(const QByteArray & aBlock, const QString & aFormatString, const T &... aArgs)
	{
		mLogger.logBlockInternal(aBlock, mPrefix + StringFormatter::format(aFormatString, aArgs...).toUtf8());
	}

	/** Returns the underlying logger. */
	Logger & logger() { return mLogger; }
};
