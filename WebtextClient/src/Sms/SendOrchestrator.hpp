#pragma once

#include <atomic>
#include "../Carriers/CarrierSession.hpp"
#include "AliasTable.hpp"
#include "SendRequest.hpp"





/** The top-level driver of a send request.
Resolves the recipients, logs into the carrier, splits the message and sends each chunk to each number,
collecting the individual results into a SendReport.

The sends to distinct recipients may run concurrently in up to MAX_CONCURRENCY lanes; each lane owns its own
CarrierSession and sends all the chunks of the recipients it takes, in order. Lane 0 uses the primary session
(the one used for the initial login) and runs in the calling thread, the other lanes are separate threads that
log in with a session of their own before taking any work.

A request can be cancelled from any thread (or a signal handler) by cancel(); the sends not yet started
are then recorded as cancelled. */
class SendOrchestrator
{
public:

	/** The maximum number of concurrent lanes. */
	static const int MAX_CONCURRENCY = 4;


	/** Creates a new orchestrator that creates its carrier sessions using aFactory and logs into aLogger.
	Throws a LogicError if aConcurrency is not within 1 .. MAX_CONCURRENCY. */
	SendOrchestrator(CarrierSessionFactory & aFactory, Logger & aLogger, int aConcurrency = 1);

	/** Executes the request.
	An unknown recipient, an empty list of numbers, a failed initial login, no texts remaining or a message
	too long are reported as an aborted SendReport, with no results.
	Otherwise the report contains one result per (number, chunk) pair, ordered by (recipient position, chunk index). */
	SendReport execute(const SendRequest & aRequest, const AliasTable & aAliases);

	/** Requests cancellation of the currently executing request.
	The in-flight requests are let finish, the sends not yet started are recorded as cancelled.
	Is async-signal-safe. */
	void cancel() { mIsCancelled = true; }

	/** Returns true if cancel() has been called. */
	bool isCancelled() const { return mIsCancelled; }


protected:

	class Lane;
	struct Work;


	/** The factory for the carrier sessions. */
	CarrierSessionFactory & mFactory;

	/** The logger for the orchestration events. */
	Logger & mLogger;

	/** The max number of concurrent lanes. */
	int mConcurrency;

	/** Set by cancel(), checked by the lanes before each send. */
	std::atomic<bool> mIsCancelled;


	/** Sends the chunks to the numbers using the already authenticated primary session,
	plus any additional lanes, and returns the results in the (recipient, chunk) order. */
	std::vector<SendResult> sendAll(
		const SendRequest & aRequest,
		const QStringList & aNumbers,
		const MessageChunks & aChunks,
		CarrierSession & aPrimarySession
	);
};
