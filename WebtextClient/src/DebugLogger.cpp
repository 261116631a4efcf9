#include "DebugLogger.hpp"
#include <cstdio>
#include <QDebug>





/** The previous message handler. */
static QtMessageHandler g_OldHandler;





DebugLogger::DebugLogger():
	mVerbosity(0)
{
	g_OldHandler = qInstallMessageHandler(messageHandler);
}





DebugLogger & DebugLogger::get()
{
	static DebugLogger inst;
	return inst;
}





bool DebugLogger::shouldOutput(QtMsgType aType) const
{
	switch (aType)
	{
		case QtDebugMsg:    return (mVerbosity >= 2);
		case QtInfoMsg:     return (mVerbosity >= 1);
		case QtWarningMsg:  return true;
		case QtCriticalMsg: return true;
		case QtFatalMsg:    return true;
	}
	return true;
}





void DebugLogger::messageHandler(
	QtMsgType aType,
	const QMessageLogContext & aContext,
	const QString & aMessage
)
{
	if (aType == QtFatalMsg)
	{
		// Let Qt handle the fatal message (and abort):
		g_OldHandler(aType, aContext, aMessage);
		return;
	}
	if (!DebugLogger::get().shouldOutput(aType))
	{
		return;
	}
	const char * prefix = "";
	switch (aType)
	{
		case QtDebugMsg:    prefix = "DEBUG: ";    break;
		case QtInfoMsg:     prefix = "INFO: ";     break;
		case QtWarningMsg:  prefix = "WARNING: ";  break;
		case QtCriticalMsg: prefix = "ERROR: ";    break;
		case QtFatalMsg:    prefix = "FATAL: ";    break;
	}
	auto msg = aMessage.toLocal8Bit();
	fprintf(stderr, "%s%s\n", prefix, msg.constData());
	fflush(stderr);
}
