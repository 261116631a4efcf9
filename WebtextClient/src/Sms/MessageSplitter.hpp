#pragma once

#include <vector>
#include <QString>
#include "../Exception.hpp"





/** A single part of a (possibly split) message, that is sent as one webtext. */
struct MessageChunk
{
	/** The 1-based index of this part. */
	int mIndex;

	/** The total number of parts of the message. */
	int mTotal;

	/** The exact slice of the original message.
	Concatenating mText of all the chunks, in order, yields the original message. */
	QString mText;


	/** Returns the text to be actually sent.
	For a single-part message this is the text without its trailing whitespace.
	For a multi-part message this is the text with the surrounding whitespace removed
	and the " (index/total)" part indicator appended. */
	QString renderedText() const;

	/** Returns aText without its trailing whitespace. */
	static QString rightTrimmed(const QString & aText);
};

using MessageChunks = std::vector<MessageChunk>;





/** Splits messages that are longer than the carrier allows into multiple chunks. */
class MessageSplitter
{
public:

	/** Thrown when the message doesn't fit into the carrier's limit and cannot be split. */
	class MessageTooLongError:
		public RuntimeError
	{
		using Super = RuntimeError;

	public:
		MessageTooLongError(int aLength, int aMaxLength, bool aIsSplitAllowed);

		/** The length of the message, in UTF-16 code units. */
		int length() const { return mLength; }

		/** The carrier's maximum message length. */
		int maxLength() const { return mMaxLength; }

	protected:
		int mLength;
		int mMaxLength;
	};


	/** How far back from the length limit a whitespace is searched for, to end the chunk on a word boundary. */
	static const int WHITESPACE_LOOKBACK = 20;


	/** Splits the message body into chunks that each fit into aMaxLength, once rendered (see MessageChunk::renderedText()).
	If the body fits, a single 1/1 chunk with the unchanged body is returned.
	Otherwise, if aIsSplitAllowed is false, or if the limit is too small to hold the part indicator, throws a MessageTooLongError.
	Otherwise returns the least number of chunks that the greedy word-boundary split can produce;
	a chunk ends after the whitespace nearest to the limit (within WHITESPACE_LOOKBACK), or at the limit itself
	(never inside a UTF-16 surrogate pair). */
	static MessageChunks split(const QString & aBody, int aMaxLength, bool aIsSplitAllowed);

	/** Returns the length of the part indicator " (aIndex/aTotal)". */
	static int indicatorLength(int aIndex, int aTotal);


protected:

	/** Partitions the body into slices of at most aCapacity characters, preferring word boundaries. */
	static std::vector<QString> partition(const QString & aBody, int aCapacity);

	/** Returns the end (exclusive) of the slice starting at aStart, at most aCapacity characters long. */
	static int sliceEnd(const QString & aBody, int aStart, int aCapacity);
};
