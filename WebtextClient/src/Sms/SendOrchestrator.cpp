#include "SendOrchestrator.hpp"
#include <algorithm>
#include <QThread>
#include "AliasResolver.hpp"
#include "MessageSplitter.hpp"





////////////////////////////////////////////////////////////////////////////////
// SendOrchestrator::Work:

/** The state shared by all the lanes of a single request. */
struct SendOrchestrator::Work
{
	const SendRequest & mRequest;
	const QStringList & mNumbers;
	const MessageChunks & mChunks;
	const std::atomic<bool> & mIsCancelled;

	/** The index into mNumbers of the next recipient to be taken by a lane. */
	std::atomic<int> mNextRecipient;

	/** The results, pre-sized so that each (recipient, chunk) has its own slot.
	Each slot is written only by the lane that took the recipient. */
	std::vector<SendResult> mResults;

	/** Flags (0 / 1) whether the respective mResults slot has been written. */
	std::vector<char> mIsWritten;


	Work(
		const SendRequest & aRequest,
		const QStringList & aNumbers,
		const MessageChunks & aChunks,
		const std::atomic<bool> & aIsCancelled
	):
		mRequest(aRequest),
		mNumbers(aNumbers),
		mChunks(aChunks),
		mIsCancelled(aIsCancelled),
		mNextRecipient(0),
		mResults(static_cast<size_t>(aNumbers.size()) * aChunks.size()),
		mIsWritten(mResults.size(), 0)
	{
	}


	/** Stores the result for the specified recipient and chunk. */
	void record(int aRecipientIdx, size_t aChunkIdx, SendResult && aResult)
	{
		auto idx = static_cast<size_t>(aRecipientIdx) * mChunks.size() + aChunkIdx;
		mResults[idx] = std::move(aResult);
		mIsWritten[idx] = 1;
	}
};





////////////////////////////////////////////////////////////////////////////////
// SendOrchestrator::Lane:

/** A single worker of a request, sending all chunks to the recipients it takes from the shared Work.
Lane 0 is processed in the calling thread using the primary session, the other lanes run as threads
with their own sessions. */
class SendOrchestrator::Lane:
	public QThread
{
	using Super = QThread;


public:

	/** Creates the lane that uses the (already authenticated) primary session. */
	Lane(int aIndex, CarrierSession & aPrimarySession, Work & aWork, Logger & aLogger):
		mIndex(aIndex),
		mSession(aPrimarySession),
		mNeedsAuthentication(false),
		mWork(aWork),
		mLogger(aLogger, QString("Lane %1: ").arg(aIndex))
	{
	}


	/** Creates the lane that owns its (not yet authenticated) session. */
	Lane(int aIndex, CarrierSessionPtr aOwnSession, Work & aWork, Logger & aLogger):
		mIndex(aIndex),
		mOwnSession(std::move(aOwnSession)),
		mSession(*mOwnSession),
		mNeedsAuthentication(true),
		mWork(aWork),
		mLogger(aLogger, QString("Lane %1: ").arg(aIndex))
	{
	}


	/** Logs in (if needed) and then sends to the recipients until there are none left,
	the request is cancelled or the session is lost. */
	void process()
	{
		try
		{
			processInternal();
		}
		catch (const std::exception & exc)
		{
			// Unexpected failure; this lane's unsent recipients are reported as session-lost
			mLogger.log("The lane failed: %1", exc.what());
			qWarning() << "Lane" << mIndex << "failed:" << exc.what();
		}
	}


protected:

	/** The lane's index, used for logging. */
	int mIndex;

	/** The session owned by this lane, nullptr for lane 0 (which uses the primary session). */
	CarrierSessionPtr mOwnSession;

	/** The session used for sending. */
	CarrierSession & mSession;

	/** If true, mSession needs to log in before taking any work. */
	bool mNeedsAuthentication;

	/** The state shared with the other lanes. */
	Work & mWork;

	PrefixLogger mLogger;


	// QThread override:
	virtual void run() override
	{
		process();
	}


	void processInternal()
	{
		if (mNeedsAuthentication)
		{
			try
			{
				mSession.authenticate(mWork.mRequest.mUsername, mWork.mRequest.mPassword);
			}
			catch (const CarrierSession::AuthError & exc)
			{
				mLogger.log("Cannot log in, not taking any work: %1", exc.message());
				return;
			}
		}

		while (!mWork.mIsCancelled)
		{
			auto recipientIdx = mWork.mNextRecipient.fetch_add(1);
			if (recipientIdx >= mWork.mNumbers.size())
			{
				return;
			}
			if (!sendToRecipient(recipientIdx))
			{
				mLogger.log("The session is lost, not taking any more work");
				return;
			}
		}
		mLogger.log("Cancelled");
	}


	/** Sends all the chunks to the specified recipient.
	Returns false if the session has been lost (and the lane should stop). */
	bool sendToRecipient(int aRecipientIdx)
	{
		const auto & recipient = mWork.mNumbers[aRecipientIdx];
		const auto & chunks = mWork.mChunks;
		QString number;
		try
		{
			number = mSession.normalizeNumber(recipient);
		}
		catch (const SendError & exc)
		{
			mLogger.log("Number %1 rejected: %2", recipient, exc.message());
			for (size_t i = 0; i < chunks.size(); ++i)
			{
				mWork.record(aRecipientIdx, i, SendResult::failure(recipient, chunks[i], exc.kind(), exc.message()));
			}
			return true;
		}

		for (size_t i = 0; i < chunks.size(); ++i)
		{
			if (mWork.mIsCancelled)
			{
				// The rest of the recipient's chunks are left unwritten, to be reported as cancelled
				return true;
			}
			if (!sendChunk(aRecipientIdx, i, number))
			{
				for (size_t j = i; j < chunks.size(); ++j)
				{
					mWork.record(aRecipientIdx, j, SendResult::failure(
						recipient, chunks[j], SendError::skSessionLost,
						"The carrier session expired and the repeated login failed"
					));
				}
				return false;
			}
		}
		return true;
	}


	/** Sends a single chunk, re-authenticating once if the session has expired.
	Records the result and returns true, or returns false without recording anything if the session is lost. */
	bool sendChunk(int aRecipientIdx, size_t aChunkIdx, const QString & aNumber)
	{
		const auto & recipient = mWork.mNumbers[aRecipientIdx];
		const auto & chunk = mWork.mChunks[aChunkIdx];
		for (int attempt = 0; attempt < 2; ++attempt)
		{
			try
			{
				mSession.sendChunk(aNumber, chunk);
				mWork.record(aRecipientIdx, aChunkIdx, SendResult::success(recipient, chunk));
				qInfo().noquote() << QString("Sent %1/%2 to %3").arg(chunk.mIndex).arg(chunk.mTotal).arg(recipient);
				return true;
			}
			catch (const SendError & exc)
			{
				mLogger.log("Sending %1/%2 to %3 failed (%4): %5",
					chunk.mIndex, chunk.mTotal, recipient, SendError::kindName(exc.kind()), exc.message()
				);
				mWork.record(aRecipientIdx, aChunkIdx, SendResult::failure(recipient, chunk, exc.kind(), exc.message()));
				return true;
			}
			catch (const CarrierSession::AuthError & exc)
			{
				mLogger.log("The session has expired while sending to %1: %2", recipient, exc.message());
			}
			if (attempt > 0)
			{
				break;
			}

			// Re-authenticate and retry:
			try
			{
				mSession.authenticate(mWork.mRequest.mUsername, mWork.mRequest.mPassword);
			}
			catch (const CarrierSession::AuthError & exc)
			{
				mLogger.log("Re-authentication failed: %1", exc.message());
				return false;
			}
		}
		return false;
	}
};





////////////////////////////////////////////////////////////////////////////////
// SendOrchestrator:

const int SendOrchestrator::MAX_CONCURRENCY;




SendOrchestrator::SendOrchestrator(CarrierSessionFactory & aFactory, Logger & aLogger, int aConcurrency):
	mFactory(aFactory),
	mLogger(aLogger),
	mConcurrency(aConcurrency),
	mIsCancelled(false)
{
	if ((aConcurrency < 1) || (aConcurrency > MAX_CONCURRENCY))
	{
		throw LogicError("Invalid concurrency %1, must be 1 .. %2", aConcurrency, MAX_CONCURRENCY);
	}
}





SendReport SendOrchestrator::execute(const SendRequest & aRequest, const AliasTable & aAliases)
{
	mLogger.log("Executing a send request via %1 for %2 recipient tokens", aRequest.mCarrier, aRequest.mRecipients.size());

	// Resolve the recipients:
	QStringList numbers;
	try
	{
		numbers = AliasResolver::resolveAll(aRequest.mRecipients, aAliases);
	}
	catch (const UnknownRecipientError & exc)
	{
		mLogger.log("Aborting: %1", exc.message());
		return SendReport::aborted(SendReport::arUnknownRecipient, exc.message());
	}
	if (numbers.isEmpty())
	{
		mLogger.log("Aborting: no recipients");
		return SendReport::aborted(SendReport::arNoRecipients, "No recipients given");
	}
	mLogger.log("Resolved into %1 numbers", numbers.size());

	// Log in:
	auto primary = mFactory.createSession(aRequest.mCarrier, true);
	try
	{
		primary->authenticate(aRequest.mUsername, aRequest.mPassword);
	}
	catch (const CarrierSession::AuthError & exc)
	{
		mLogger.log("Aborting, login failed: %1", exc.message());
		return SendReport::aborted(SendReport::arAuthFailed, exc.message());
	}

	// Check the allowance:
	auto textsRemaining = primary->textsRemaining();
	if (textsRemaining == 0)
	{
		mLogger.log("Aborting: no texts remaining");
		return SendReport::aborted(SendReport::arNoTextsRemaining, "No free webtexts remaining", 0);
	}
	if (textsRemaining == CarrierSession::UNKNOWN_TEXTS_REMAINING)
	{
		mLogger.log("Cannot determine the number of texts remaining, continuing anyway");
	}
	else
	{
		mLogger.log("Texts remaining: %1", textsRemaining);
	}

	// Split the message:
	MessageChunks chunks;
	try
	{
		chunks = MessageSplitter::split(aRequest.mBody, primary->maxMessageLength(), aRequest.mIsSplitAllowed);
	}
	catch (const MessageSplitter::MessageTooLongError & exc)
	{
		mLogger.log("Aborting: %1", exc.message());
		return SendReport::aborted(SendReport::arMessageTooLong, exc.message(), textsRemaining);
	}
	mLogger.log("The message is %1 chars, split into %2 chunks", aRequest.mBody.size(), chunks.size());

	// Send:
	SendReport report;
	report.mResults = sendAll(aRequest, numbers, chunks, *primary);
	auto numOK = report.numSucceeded();
	if (numOK == 0)
	{
		report.mTextsRemaining = textsRemaining;
	}
	else if (mIsCancelled)
	{
		// Don't keep the user waiting for another request after an interrupt:
		report.mTextsRemaining = CarrierSession::UNKNOWN_TEXTS_REMAINING;
	}
	else
	{
		report.mTextsRemaining = primary->textsRemaining();
	}
	mLogger.log("Done: %1 of %2 sends succeeded (%3)",
		numOK, report.mResults.size(), SendReport::statusName(report.status())
	);
	return report;
}





std::vector<SendResult> SendOrchestrator::sendAll(
	const SendRequest & aRequest,
	const QStringList & aNumbers,
	const MessageChunks & aChunks,
	CarrierSession & aPrimarySession
)
{
	Work work(aRequest, aNumbers, aChunks, mIsCancelled);

	// Create the additional lanes, start them as threads:
	auto numLanes = std::min(mConcurrency, aNumbers.size());
	std::vector<std::unique_ptr<Lane>> lanes;
	for (int i = 1; i < numLanes; ++i)
	{
		lanes.push_back(std::make_unique<Lane>(i, mFactory.createSession(aRequest.mCarrier, false), work, mLogger));
	}
	mLogger.log("Sending using %1 lanes", numLanes);
	for (auto & lane: lanes)
	{
		lane->start();
	}

	// Process lane 0 in this thread, then wait for the others:
	Lane(0, aPrimarySession, work, mLogger).process();
	for (auto & lane: lanes)
	{
		lane->wait();
	}

	// Report the pairs that no lane attempted:
	const bool isCancelled = mIsCancelled;
	size_t numUnattempted = 0;
	for (int r = 0; r < aNumbers.size(); ++r)
	{
		for (size_t c = 0; c < aChunks.size(); ++c)
		{
			if (work.mIsWritten[static_cast<size_t>(r) * aChunks.size() + c])
			{
				continue;
			}
			numUnattempted += 1;
			work.record(r, c, isCancelled ?
				SendResult::failure(aNumbers[r], aChunks[c], SendError::skCancelled, "Cancelled by the user") :
				SendResult::failure(aNumbers[r], aChunks[c], SendError::skSessionLost, "No carrier session was available to send")
			);
		}
	}
	if (numUnattempted > 0)
	{
		mLogger.log("%1 sends were not attempted (%2)", numUnattempted, isCancelled ? "cancelled" : "no session");
	}
	return std::move(work.mResults);
}
