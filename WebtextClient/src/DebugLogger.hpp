#pragma once

#include <atomic>
#include <QtGlobal>
#include <QString>





/** Routes the Qt debug output (qDebug(), qInfo(), qWarning(), ...) to the console (stderr),
filtered by the verbosity the user requested on the command line.
Verbosity 0 outputs warnings and worse, 1 adds info messages, 2 and more adds debug messages.
Installed as the Qt message handler upon first use of get(). */
class DebugLogger
{
public:

	/** Returns the singleton instance. */
	static DebugLogger & get();

	/** Sets the verbosity level (number of -v switches). */
	void setVerbosity(int aVerbosity) { mVerbosity = aVerbosity; }

	/** Returns true if a message of the specified type passes the current verbosity filter. */
	bool shouldOutput(QtMsgType aType) const;


protected:

	/** The current verbosity level. */
	std::atomic<int> mVerbosity;


	DebugLogger();

	/** The message handler that is installed into Qt. */
	static void messageHandler(
		QtMsgType aType,
		const QMessageLogContext & aContext,
		const QString & aMessage
	);
};
