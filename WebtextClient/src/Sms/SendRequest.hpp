#pragma once

#include <vector>
#include <QString>
#include <QStringList>
#include "../Carriers/CarrierKind.hpp"
#include "../Carriers/CarrierSession.hpp"





/** A single logical request to send a message, fully resolved by the command line / config layer. */
struct SendRequest
{
	QString mUsername;
	QString mPassword;
	CarrierKind mCarrier;

	/** The raw recipient tokens (numbers, aliases, group names), in the order given by the user. */
	QStringList mRecipients;

	/** The message text. */
	QString mBody;

	/** If true, a message longer than the carrier's limit is split into multiple chunks. */
	bool mIsSplitAllowed;
};





/** The outcome of sending a single chunk to a single number. */
struct SendResult
{
	/** The recipient's number, as resolved from the request tokens. */
	QString mRecipient;

	int mChunkIndex;
	int mChunkTotal;

	bool mIsSuccess;

	/** The kind of the failure. Only valid if mIsSuccess is false. */
	SendError::Kind mFailureKind;

	/** The human-readable failure description. Empty on success. */
	QString mFailureReason;


	/** Returns a result representing a successful send. */
	static SendResult success(const QString & aRecipient, const MessageChunk & aChunk);

	/** Returns a result representing a failed send. */
	static SendResult failure(
		const QString & aRecipient,
		const MessageChunk & aChunk,
		SendError::Kind aKind,
		const QString & aReason
	);
};





/** The outcome of a whole SendRequest: the individual results and their aggregate. */
struct SendReport
{
	/** The aggregate status of the request. */
	enum Status
	{
		stAllSucceeded,
		stPartiallySucceeded,
		stNoneSucceeded,
		stAborted,
	};

	/** The reason why a request was aborted before sending anything. */
	enum AbortReason
	{
		arNone,               ///< Not aborted
		arUnknownRecipient,   ///< A recipient token was neither a number nor an alias
		arAuthFailed,         ///< The initial login failed
		arMessageTooLong,     ///< The message didn't fit the carrier's limit and couldn't be split
		arNoTextsRemaining,   ///< The carrier reported no free webtexts left
		arNoRecipients,       ///< The recipients resolved to no numbers
	};


	/** The individual results, ordered by (recipient position, chunk index). Empty for an aborted request. */
	std::vector<SendResult> mResults;

	/** The reason for aborting, arNone if the request wasn't aborted. */
	AbortReason mAbortReason = arNone;

	/** The description of the abort reason, for the user. */
	QString mAbortMessage;

	/** The carrier's count of remaining free webtexts, as last queried; -1 if unknown. */
	int mTextsRemaining = CarrierSession::UNKNOWN_TEXTS_REMAINING;


	/** Returns the aggregate status, computed from the results. */
	Status status() const;

	/** Returns the number of successful results. */
	size_t numSucceeded() const;

	/** Returns a report for a request aborted for the specified reason. */
	static SendReport aborted(AbortReason aReason, const QString & aMessage, int aTextsRemaining = CarrierSession::UNKNOWN_TEXTS_REMAINING);

	/** Returns the user-facing name of the status. */
	static QString statusName(Status aStatus);

	/** Returns the user-facing name of the abort reason. */
	static QString abortReasonName(AbortReason aReason);
};
