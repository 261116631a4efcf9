#include <csignal>
#include <cstdio>
#include <memory>
#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QFile>
#include <QTextStream>
#include "ComponentCollection.hpp"
#include "DebugLogger.hpp"
#include "InstallConfiguration.hpp"
#include "MultiLogger.hpp"
#include "Carriers/NetworkSessionFactory.hpp"
#include "Config/ConfigFile.hpp"
#include "DB/CookieCache.hpp"
#include "DB/Database.hpp"
#include "Sms/PhoneNumber.hpp"
#include "Sms/SendOrchestrator.hpp"

#ifdef _WIN32
	#include <io.h>
	#define isatty _isatty
	#define STDIN_FILENO 0
#else
	#include <termios.h>
	#include <unistd.h>
#endif





/** The orchestrator currently sending, to be cancelled upon SIGINT. */
static SendOrchestrator * volatile g_Orchestrator = nullptr;

/** Number of SIGINTs received so far. */
static volatile std::sig_atomic_t g_NumInterrupts = 0;





/** The SIGINT handler.
The first SIGINT while sending cancels the sends not yet started; any other SIGINT terminates the program.
The logs are not flushed on termination, QFile is not async-signal-safe. */
static void onInterrupt(int aSignal)
{
	Q_UNUSED(aSignal);
	g_NumInterrupts = g_NumInterrupts + 1;
	auto orchestrator = g_Orchestrator;
	if ((g_NumInterrupts > 1) || (orchestrator == nullptr))
	{
		static const char msg[] = "\nokay, I'm outta here...\n";
		#ifdef _WIN32
			_write(2, msg, sizeof(msg) - 1);
			_exit(1);
		#else
			auto written = write(STDERR_FILENO, msg, sizeof(msg) - 1);
			Q_UNUSED(written);
			_exit(1);
		#endif
	}
	orchestrator->cancel();
}





/** Returns true if the standard input is an interactive terminal. */
static bool isInteractive()
{
	return (isatty(STDIN_FILENO) != 0);
}





/** Returns the stream reading the standard input.
A single instance is shared by all the readers, so that no data read ahead into its buffer gets lost. */
static QTextStream & stdinStream()
{
	static QTextStream in(stdin);
	return in;
}





/** Prints the prompt and returns the (trimmed) line the user entered. */
static QString prompt(const QString & aPrompt)
{
	QTextStream out(stdout);
	out << aPrompt;
	out.flush();
	return stdinStream().readLine().trimmed();
}





/** Prompts for the password without echoing the typed characters. */
static QString promptPassword()
{
	#ifdef _WIN32
		return prompt("Password: ");
	#else
		termios oldAttr;
		bool hasTerminal = (tcgetattr(STDIN_FILENO, &oldAttr) == 0);
		if (hasTerminal)
		{
			auto newAttr = oldAttr;
			newAttr.c_lflag &= static_cast<tcflag_t>(~ECHO);
			tcsetattr(STDIN_FILENO, TCSANOW, &newAttr);
		}
		auto res = prompt("Password: ");
		if (hasTerminal)
		{
			tcsetattr(STDIN_FILENO, TCSANOW, &oldAttr);
			fprintf(stdout, "\n");
		}
		return res;
	#endif
}





/** Reads the message from stdin, until EOF or a line containing a single '.'. */
static QString readMessage()
{
	if (isInteractive())
	{
		fprintf(stdout, "Enter your message:\n");
		fflush(stdout);
	}
	auto & in = stdinStream();
	QStringList lines;
	while (true)
	{
		auto line = in.readLine();
		if (line.isNull() || (line == "."))
		{
			break;
		}
		lines.append(line);
	}
	return lines.join('\n');
}





/** Parses the value of a numeric command line option.
Throws a RuntimeError if the value is not a number within the range. */
static int parseIntOption(const QString & aOptionName, const QString & aValue, int aMin, int aMax)
{
	bool isOK = false;
	auto res = aValue.toInt(&isOK);
	if (!isOK || (res < aMin) || (res > aMax))
	{
		throw RuntimeError("Invalid value for --%1: \"%2\", expected a number %3 .. %4",
			aOptionName, aValue, aMin, aMax
		);
	}
	return res;
}





/** Prints the individual results and the summary to stdout. */
static void printReport(const SendReport & aReport)
{
	QTextStream out(stdout);
	if (aReport.status() == SendReport::stAborted)
	{
		qCritical().noquote() << QString("Send aborted (%1): %2")
			.arg(SendReport::abortReasonName(aReport.mAbortReason), aReport.mAbortMessage);
		return;
	}
	for (const auto & r: aReport.mResults)
	{
		if (r.mIsSuccess)
		{
			out << QString("OK      %1 %2/%3\n").arg(r.mRecipient).arg(r.mChunkIndex).arg(r.mChunkTotal);
		}
		else
		{
			out << QString("FAILED  %1 %2/%3 (%4): %5\n")
				.arg(r.mRecipient).arg(r.mChunkIndex).arg(r.mChunkTotal)
				.arg(SendError::kindName(r.mFailureKind), r.mFailureReason);
		}
	}
	out << QString("Sent %1 of %2 texts, %3.\n")
		.arg(aReport.numSucceeded())
		.arg(aReport.mResults.size())
		.arg(SendReport::statusName(aReport.status()));
	if (aReport.mTextsRemaining >= 0)
	{
		out << QString("%1 texts remaining.\n").arg(aReport.mTextsRemaining);
	}
}





/** Offers the user to save the raw numbers from the request that are not in any alias as new aliases. */
static void offerNewAliases(
	const QString & aConfigFileName,
	const QStringList & aRecipients,
	AliasTable & aAliases,
	Logger & aLogger
)
{
	QStringList offered;
	for (const auto & token: aRecipients)
	{
		auto number = PhoneNumber::canonical(token);
		if (number.isEmpty() || aAliases.contains(token) || aAliases.containsNumber(number) || offered.contains(number))
		{
			continue;
		}
		offered.append(number);
		while (true)
		{
			auto name = prompt(QString("Create alias for %1 with this name: ").arg(number));
			if (name.isEmpty())
			{
				break;
			}
			if (!ConfigFile::isValidNewAliasName(name))
			{
				fprintf(stdout, "%s is an invalid alias name, only letters are allowed\n", name.toLocal8Bit().constData());
				continue;
			}
			if (aAliases.contains(name))
			{
				fprintf(stdout, "alias already exists\n");
				continue;
			}
			try
			{
				ConfigFile::appendAlias(aConfigFileName, name, number);
			}
			catch (const RuntimeError & exc)
			{
				qWarning().noquote() << exc.message();
				return;
			}
			aAliases.addAlias(name, {number});
			aLogger.log("Saved alias %1 for %2", name, number);
			break;
		}
	}
}





int main(int argc, char *argv[])
{
	// Initialize the DebugLogger:
	DebugLogger::get();

	QCoreApplication app(argc, argv);
	QCoreApplication::setApplicationName("Webtexter");
	QCoreApplication::setApplicationVersion("1.0");
	std::signal(SIGINT, onInterrupt);

	// Define the command line:
	QCommandLineParser parser;
	parser.setApplicationDescription("Send webtexts from the command line");
	parser.addHelpOption();
	QCommandLineOption optUsername({"u", "username"}, "Use this username.", "STRING");
	QCommandLineOption optPassword({"p", "password"}, "Use this password (if omitted, will prompt for password).", "STRING");
	QCommandLineOption optConfig({"c", "config"}, "Use this configuration file (defaults to ~/.webtexter.conf).", "FILE");
	QCommandLineOption optSplit({"s", "split-messages"}, "Allow message to be split into multiple texts (overrides config file nosplit).");
	QCommandLineOption optCarrier({"C", "carrier"}, QString("Use this carrier (%1).").arg(allCarrierNames().join(", ")), "NAME");
	QCommandLineOption optMessage({"m", "message"}, "Don't wait for stdin, send this message.", "STRING");
	QCommandLineOption optConcurrency({"j", "concurrency"}, "Send to this many recipients concurrently (1 - 4).", "N");
	QCommandLineOption optTimeout({"t", "timeout"}, "Give up on a request after this many seconds.", "SECONDS");
	QCommandLineOption optVerbose({"v", "verbose"}, "Output more diagnostics; repeat for even more.");
	QCommandLineOption optVersion("version", "Display version information.");
	parser.addOptions({optUsername, optPassword, optConfig, optSplit, optCarrier, optMessage,
		optConcurrency, optTimeout, optVerbose, optVersion});
	parser.addPositionalArgument("recipients", "One or more numbers or aliases from the config file.", "<number|alias|group>...");
	parser.process(app);
	if (parser.isSet(optVersion))
	{
		parser.showVersion();
	}
	DebugLogger::get().setVerbosity(parser.optionNames().count("v") + parser.optionNames().count("verbose"));

	try
	{
		const auto recipients = parser.positionalArguments();
		if (recipients.isEmpty())
		{
			qCritical() << "No recipients given.";
			parser.showHelp(1);
		}

		// Load the configuration file:
		Configuration config;
		QString configFileName;
		if (parser.isSet(optConfig))
		{
			configFileName = parser.value(optConfig);
			config = ConfigFile::load(configFileName);
		}
		else if (QFile::exists(InstallConfiguration::defaultConfigFile()))
		{
			configFileName = InstallConfiguration::defaultConfigFile();
			config = ConfigFile::load(configFileName);
		}

		// Override the config with the command line, prompt for the missing values:
		SendRequest request;
		request.mRecipients = recipients;
		request.mUsername = parser.isSet(optUsername) ? parser.value(optUsername) : config.mUsername;
		if (request.mUsername.isEmpty())
		{
			request.mUsername = prompt("Username: ");
		}
		request.mPassword = parser.isSet(optPassword) ? parser.value(optPassword) : config.mPassword;
		if (request.mPassword.isEmpty())
		{
			request.mPassword = promptPassword();
		}
		if (parser.isSet(optCarrier))
		{
			request.mCarrier = carrierKindFromName(parser.value(optCarrier));
		}
		else if (config.mHasCarrier)
		{
			request.mCarrier = config.mCarrier;
		}
		else
		{
			request.mCarrier = carrierKindFromName(prompt(QString("Carrier [%1]: ").arg(allCarrierNames().join(", "))));
		}
		request.mIsSplitAllowed = config.mIsSplitAllowed || parser.isSet(optSplit);
		auto concurrency = parser.isSet(optConcurrency) ?
			parseIntOption("concurrency", parser.value(optConcurrency), 1, SendOrchestrator::MAX_CONCURRENCY) :
			config.mConcurrency;
		auto timeoutSec = parser.isSet(optTimeout) ?
			parseIntOption("timeout", parser.value(optTimeout), 1, 3600) :
			config.mTimeoutSec;
		request.mBody = parser.isSet(optMessage) ? parser.value(optMessage) : readMessage();
		if (request.mBody.trimmed().isEmpty())
		{
			qCritical() << "The message is empty, nothing to send.";
			return 1;
		}

		// Create and start the components:
		ComponentCollection cc;
		auto instConf    = cc.addNew<InstallConfiguration>();
		auto multiLogger = cc.addNew<MultiLogger>(instConf->logsFolder());
		cc.addNew<Database>();
		cc.addNew<CookieCache>();
		auto & logger = multiLogger->mainLogger();
		cc.start();
		logger.log("Sending via %1 to %2, %3 chars, split %4, concurrency %5, timeout %6 s",
			request.mCarrier, recipients, request.mBody.size(), request.mIsSplitAllowed, concurrency, timeoutSec
		);

		// Send, offering a retry if the login fails:
		NetworkSessionFactory factory(cc, timeoutSec * 1000);
		SendOrchestrator orchestrator(factory, cc.logger("Orchestrator"), concurrency);
		SendReport report;
		while (true)
		{
			fprintf(stdout, "Sending...\n");
			fflush(stdout);
			g_Orchestrator = &orchestrator;
			report = orchestrator.execute(request, config.mAliases);
			g_Orchestrator = nullptr;
			printReport(report);
			if (
				(report.mAbortReason != SendReport::arAuthFailed) ||
				!isInteractive() ||
				orchestrator.isCancelled()
			)
			{
				break;
			}
			auto choice = prompt("Retry send? [Y/n] ").toLower();
			if ((choice != "y") && !choice.isEmpty())
			{
				break;
			}
		}

		// Save the new aliases and the login session:
		if ((report.status() != SendReport::stAborted) && isInteractive() && !configFileName.isEmpty())
		{
			offerNewAliases(configFileName, request.mRecipients, config.mAliases, logger);
		}
		try
		{
			cc.stop();
		}
		catch (const Database::DBQueryError & exc)
		{
			qWarning().noquote() << "Cannot save the login session:" << exc.message();
		}

		logger.log("Done: %1", SendReport::statusName(report.status()));
		return (report.status() == SendReport::stAllSucceeded) ? 0 : 1;
	}
	catch (const std::exception & exc)
	{
		qCritical().noquote() << exc.what();
		return 1;
	}
}
